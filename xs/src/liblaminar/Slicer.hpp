#ifndef laminar_Slicer_hpp_
#define laminar_Slicer_hpp_

#include "liblaminar.h"
#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include <boost/thread.hpp>
#include "ExPolygon.hpp"
#include "Layer.hpp"
#include "PrintConfig.hpp"
#include "SupportMaterial.hpp"
#include "TriangleMesh.hpp"

namespace Laminar {

enum SliceState {
    ssIdle, ssRunning, ssCompleted, ssCancelled, ssFailed,
};

/// Progress callback: (current, total, message). May be invoked from a worker thread.
typedef std::function<void(int, int, const std::string&)> status_callback_t;

/// Turns a mesh into SlicedLayers: cross-sections, walls, infill, skins,
/// brim and support.
class Slicer
{
public:
    /// Called at layer granularity without internal locks held; reports are monotonic.
    /// An exception thrown from it fails the run.
    status_callback_t status_cb;

    /// Number of layer workers, 0 for one per core.
    int threads;

    explicit Slicer(const SliceConfig &config)
        : status_cb(nullptr), threads(0), _config(config),
          _state(ssIdle), _cancel(false), _last_reported(-1), _last_delivered(-1)
        {};

    /// Run the whole pipeline. Never throws: a fatal failure moves the run to
    /// Failed with failure_reason() set and returns no layers. A cancelled run
    /// returns the layers completed before the cancellation, in Z order.
    SlicedLayers slice(const TriangleMesh &mesh);

    /// Ask a running slice() to stop; thread safe.
    void cancel() { this->_cancel = true; };

    SliceState state() const { return SliceState(this->_state.load()); };
    const std::string& failure_reason() const { return this->_failure_reason; };

    /// Layer tops: zmin + first_layer_height, then every layer_height while
    /// z <= zmax (with a 1e-6 tolerance). Empty for a zero-height span.
    static std::vector<coordf_t> z_heights(coordf_t zmin, coordf_t zmax,
        coordf_t first_layer_height, coordf_t layer_height);

    /// Build one layer from its cross-section.
    SlicedLayer process_layer(size_t layer_id, coordf_t z, const ExPolygons &slice, size_t total_layers) const;

private:
    const SliceConfig &_config;
    std::atomic<int> _state;
    std::atomic<bool> _cancel;
    std::string _failure_reason;

    boost::mutex _progress_mutex;
    int _last_reported;
    boost::recursive_mutex _callback_mutex;
    int _last_delivered;

    void _set_status(int current, int total, const std::string &message);
    void _fail(const std::string &reason);
};

}

#endif
