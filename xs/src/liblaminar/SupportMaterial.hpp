#ifndef laminar_SupportMaterial_hpp_
#define laminar_SupportMaterial_hpp_

#include "liblaminar.h"
#include <map>
#include <vector>
#include "ExPolygon.hpp"
#include "Line.hpp"
#include "PrintConfig.hpp"
#include "TriangleMesh.hpp"

namespace Laminar {

/// Support segments by layer index. Layers without support have no entry.
typedef std::map<size_t, Lines> SupportLayers;

/// Generates support under the overhanging parts of a mesh.
class SupportMaterial
{
public:
    const SliceConfig* config;

    explicit SupportMaterial(const SliceConfig* config) : config(config) {};

    /// A facet overhangs when normal.z < -cos(90 - threshold), threshold in degrees.
    static bool is_overhang(const Pointf3 &normal, double threshold);

    /// Collect the overhanging facets of mesh. Facets resting on the
    /// bottom of the mesh are not overhangs.
    void detect_overhangs(const TriangleMesh &mesh);

    size_t overhangs_count() const { return this->_overhangs.size(); };

    /// Highest Z reached by an overhanging facet, -1 without overhangs.
    coordf_t top_z() const;

    /// Projection of the overhangs lying above z + support_z_distance,
    /// grown by the safety buffer of two line widths.
    ExPolygons footprint(coordf_t z) const;

    /// Projection of every overhang, grown by the safety buffer.
    ExPolygons footprint() const;

    /// Support for every layer height. slices, when not empty, holds the
    /// model cross-section of each layer and keeps support away from it.
    SupportLayers generate(const std::vector<coordf_t> &z, const std::vector<ExPolygons> &slices) const;

    /// Fill one layer: interface_area densely, the rest of area with the support pattern.
    Lines generate_layer(size_t layer_id, const ExPolygons &area, const ExPolygons &interface_area) const;

private:
    struct OverhangFacet {
        Polygon polygon;
        coordf_t max_z;
    };
    // sorted by decreasing max_z
    std::vector<OverhangFacet> _overhangs;

    Lines _fill(size_t layer_id, const ExPolygons &area, bool interface) const;
    // Join consecutive segments when the connection stays inside area.
    Lines _zigzag(const Lines &lines, const ExPolygons &area) const;
};

}

#endif
