#include "Slicer.hpp"
#include "ClipperUtils.hpp"
#include "Exception.hpp"
#include "Log.hpp"
#include "PerimeterGenerator.hpp"
#include "Fill/Fill.hpp"
#include "Fill/FillRectilinear.hpp"
#include "Geometry.hpp"
#include <algorithm>
#include <memory>
#include <sstream>

namespace Laminar {

std::vector<coordf_t>
Slicer::z_heights(coordf_t zmin, coordf_t zmax, coordf_t first_layer_height, coordf_t layer_height)
{
    std::vector<coordf_t> z;
    if (zmax - zmin <= 0 || first_layer_height <= 0 || layer_height <= 0) return z;

    const coordf_t first = zmin + first_layer_height;
    for (size_t k = 0; ; ++k) {
        const coordf_t top = first + k * layer_height;
        if (top > zmax + 1e-6) break;
        z.push_back(top);
    }
    return z;
}

void
Slicer::_set_status(int current, int total, const std::string &message)
{
    status_callback_t cb;
    {
        boost::lock_guard<boost::mutex> l(this->_progress_mutex);
        if (current < this->_last_reported) return;
        this->_last_reported = current;
        cb = this->status_cb;
    }
    if (cb == nullptr) return;

    // _progress_mutex is released here; delivery order is kept by a separate
    // recursive lock so the callback may call back into the Slicer
    boost::lock_guard<boost::recursive_mutex> l(this->_callback_mutex);
    if (current < this->_last_delivered) return;
    this->_last_delivered = current;
    cb(current, total, message);
}

void
Slicer::_fail(const std::string &reason)
{
    this->_failure_reason = reason;
    this->_state = ssFailed;
    Log::error("Slicer") << "Slicing failed: " << reason << std::endl;
}

// Grow the inner area by pct % of the line width without leaving the island.
static ExPolygons
grow_inner_area(const ExPolygons &inner, const ExPolygon &island, coordf_t pct, coordf_t line_width)
{
    if (pct <= 0) return inner;
    return intersection_ex(
        offset(to_polygons(inner), scale_(line_width * pct / 100.)),
        to_polygons(island));
}

SlicedLayer
Slicer::process_layer(size_t layer_id, coordf_t z, const ExPolygons &slice, size_t total_layers) const
{
    SlicedLayer layer(layer_id, z);
    if (slice.empty()) return layer;

    const SliceConfig &config = this->_config;
    const bool is_solid = int(layer_id) < config.bottom_layers.value
        || int(layer_id) >= int(total_layers) - config.top_layers.value;

    std::unique_ptr<Fill> sparse(Fill::new_from_type(config.infill_pattern.value));
    sparse->layer_id    = layer_id;
    sparse->angle       = Geometry::deg2rad(config.infill_angle.value);
    sparse->density     = config.infill_density.value / 100.;
    sparse->line_width  = config.line_width.value;

    FillSolid solid;
    solid.layer_id      = layer_id;
    solid.angle         = PI/4.;
    solid.density       = 1;
    solid.line_width    = config.line_width.value;

    for (const ExPolygon &island : slice) {
        if (island.area() * SCALING_FACTOR * SCALING_FACTOR < MIN_REGION_AREA) continue;

        ExPolygons inner;
        PerimeterGenerator g(&island, layer_id, config, &layer.perimeters, &inner);
        g.process();

        if (inner.empty()) {
            Log::debug("Slicer") << "Layer " << layer_id << ": no room for infill inside the walls." << std::endl;
            continue;
        }
        if (is_solid) {
            append_to(layer.top_bottom, solid.fill_surface(
                grow_inner_area(inner, island, config.skin_overlap.value, config.line_width.value)));
        } else if (config.infill_density.value > 0) {
            append_to(layer.infill, sparse->fill_surface(
                grow_inner_area(inner, island, config.infill_overlap.value, config.line_width.value)));
        }
    }

    if (layer_id == 0 && config.brim_enabled.value)
        layer.brim = make_brim(slice, config.brim_width.value, config.line_width.value);

    return layer;
}

SlicedLayers
Slicer::slice(const TriangleMesh &input)
{
    SlicedLayers layers;
    this->_cancel = false;
    this->_failure_reason.clear();
    this->_last_reported = -1;
    this->_last_delivered = -1;
    this->_state = ssRunning;

    try {
        if (input.facets_count() == 0)
            throw SlicingException("Mesh has no facets");

        // the cross-sectioner indexes shared vertices, keep the caller's mesh untouched
        TriangleMesh mesh(input);
        const BoundingBoxf3 bb = mesh.bounding_box();
        const std::vector<coordf_t> z = z_heights(bb.min.z, bb.max.z,
            this->_config.first_layer_height.value, this->_config.layer_height.value);
        const size_t total = z.size();

        const int threads = std::max(1, this->threads > 0
            ? this->threads : int(boost::thread::hardware_concurrency()));

        Log::info("Slicer") << "Slicing " << total << " layers with " << threads << " threads." << std::endl;
        {
            std::ostringstream msg;
            msg << "Slicing " << total << " layers...";
            this->_set_status(0, int(total), msg.str());
        }

        std::vector<ExPolygons> slices;
        if (total > 0) {
            try {
                slices = mesh.slice(std::vector<double>(z.begin(), z.end()), threads);
            } catch (std::runtime_error &e) {
                throw SlicingException(std::string("Cross-section failed: ") + e.what());
            }
        }
        slices.resize(total);

        SupportLayers support;
        if (this->_config.support_enabled.value && total > 0) {
            SupportMaterial support_material(&this->_config);
            support_material.detect_overhangs(mesh);
            support = support_material.generate(z, slices);
        }

        layers.resize(total);
        std::vector<char> done(total, 0);
        std::string worker_error;
        boost::mutex error_mutex;

        if (total > 0) {
            parallelize<size_t>(
                0,
                total - 1,
                [&](size_t i) {
                    // cancellation only stops new layers from being handed out
                    if (this->_cancel) return;
                    try {
                        if (i % 5 == 0) {
                            std::ostringstream msg;
                            msg << "Processing layer " << (i + 1) << "/" << total;
                            this->_set_status(int(i), int(total), msg.str());
                        }
                        SlicedLayer layer = this->process_layer(i, z[i], slices[i], total);
                        SupportLayers::const_iterator it = support.find(i);
                        if (it != support.end())
                            layer.support = it->second;
                        layers[i] = std::move(layer);
                        done[i] = 1;
                    } catch (std::exception &e) {
                        boost::lock_guard<boost::mutex> l(error_mutex);
                        if (worker_error.empty()) {
                            std::ostringstream msg;
                            msg << "Layer " << i << ": " << e.what();
                            worker_error = msg.str();
                        }
                        this->_cancel = true;
                    }
                },
                threads
            );
        }
        if (!worker_error.empty())
            throw SlicingException(worker_error);

        // keep the longest run of completed layers
        size_t completed = 0;
        while (completed < total && done[completed]) ++completed;
        layers.resize(completed);

        if (this->_cancel && completed < total) {
            this->_state = ssCancelled;
            Log::info("Slicer") << "Slicing cancelled after " << completed << " of " << total << " layers." << std::endl;
        } else {
            this->_state = ssCompleted;
            Log::info("Slicer") << "Slicing complete: " << completed << " layers." << std::endl;
        }

        std::ostringstream msg;
        msg << "Slicing complete: " << completed << " layers";
        this->_set_status(int(total), int(total), msg.str());
    } catch (SlicingException &e) {
        layers.clear();
        this->_fail(e.what());
    } catch (std::exception &e) {
        // anything else escaping the pipeline, a throwing status callback included
        layers.clear();
        this->_fail(e.what());
    }
    return layers;
}

}
