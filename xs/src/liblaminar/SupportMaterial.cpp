#include "SupportMaterial.hpp"
#include "ClipperUtils.hpp"
#include "Geometry.hpp"
#include "Log.hpp"
#include "Fill/Fill.hpp"
#include "Fill/FillRectilinear.hpp"
#include <algorithm>
#include <cmath>
#include <memory>

namespace Laminar {

bool
SupportMaterial::is_overhang(const Pointf3 &normal, double threshold)
{
    return normal.z < -cos(Geometry::deg2rad(90.0 - threshold));
}

void
SupportMaterial::detect_overhangs(const TriangleMesh &mesh)
{
    this->_overhangs.clear();
    const stl_file &stl = mesh.stl;
    const float min_z = stl.stats.min.z;
    const double threshold = this->config->support_threshold.value;

    for (int i = 0; i < stl.stats.number_of_facets; ++i) {
        const stl_facet &facet = stl.facet_start[i];

        // normal from the vertices, the stored one may be stale
        const double ux = facet.vertex[1].x - facet.vertex[0].x;
        const double uy = facet.vertex[1].y - facet.vertex[0].y;
        const double uz = facet.vertex[1].z - facet.vertex[0].z;
        const double vx = facet.vertex[2].x - facet.vertex[0].x;
        const double vy = facet.vertex[2].y - facet.vertex[0].y;
        const double vz = facet.vertex[2].z - facet.vertex[0].z;
        Pointf3 normal(uy*vz - uz*vy, uz*vx - ux*vz, ux*vy - uy*vx);
        const double len = std::sqrt(sqr(normal.x) + sqr(normal.y) + sqr(normal.z));
        if (len <= 0) continue;
        normal.scale(1. / len);

        if (!is_overhang(normal, threshold)) continue;

        const float max_z = std::max(facet.vertex[0].z, std::max(facet.vertex[1].z, facet.vertex[2].z));
        if (max_z <= min_z + EPSILON) continue;

        OverhangFacet overhang;
        overhang.polygon.points.resize(3);
        for (int v = 0; v < 3; ++v)
            overhang.polygon.points[v] = Point(scale_(facet.vertex[v].x), scale_(facet.vertex[v].y));
        overhang.polygon.make_counter_clockwise();
        if (std::abs(overhang.polygon.area()) <= 0) continue;
        overhang.max_z = max_z;
        this->_overhangs.push_back(overhang);
    }

    std::sort(this->_overhangs.begin(), this->_overhangs.end(),
        [](const OverhangFacet &a, const OverhangFacet &b) { return a.max_z > b.max_z; });

    Log::debug("Support") << this->_overhangs.size() << " overhanging facets at threshold "
        << threshold << " degrees." << std::endl;
}

coordf_t
SupportMaterial::top_z() const
{
    return this->_overhangs.empty() ? -1 : this->_overhangs.front().max_z;
}

ExPolygons
SupportMaterial::footprint(coordf_t z) const
{
    const coordf_t z_limit = z + this->config->support_z_distance.value + EPSILON;
    Polygons projected;
    for (const OverhangFacet &overhang : this->_overhangs) {
        if (overhang.max_z <= z_limit) break;
        projected.push_back(overhang.polygon);
    }
    if (projected.empty()) return ExPolygons();
    return offset_ex(union_(projected), scale_(2 * this->config->line_width.value));
}

ExPolygons
SupportMaterial::footprint() const
{
    Polygons projected;
    for (const OverhangFacet &overhang : this->_overhangs)
        projected.push_back(overhang.polygon);
    if (projected.empty()) return ExPolygons();
    return offset_ex(union_(projected), scale_(2 * this->config->line_width.value));
}

SupportLayers
SupportMaterial::generate(const std::vector<coordf_t> &z, const std::vector<ExPolygons> &slices) const
{
    SupportLayers support;
    if (this->_overhangs.empty() || z.empty()) return support;

    const coordf_t z_distance  = this->config->support_z_distance.value;
    const coordf_t xy_distance = this->config->support_xy_distance.value;
    const float buffer = scale_(2 * this->config->line_width.value);

    // footprints from the top down; every layer sees all the overhangs above it
    std::vector<ExPolygons> footprints(z.size());
    Polygons projected;
    size_t next = 0;
    for (size_t i = z.size(); i-- > 0; ) {
        bool grown = false;
        while (next < this->_overhangs.size()
            && this->_overhangs[next].max_z > z[i] + z_distance + EPSILON) {
            projected.push_back(this->_overhangs[next].polygon);
            ++next;
            grown = true;
        }
        if (projected.empty()) continue;
        if (grown) {
            projected = union_(projected);
            footprints[i] = offset_ex(projected, buffer);
        } else {
            footprints[i] = footprints[i+1];
        }
    }

    const int interface_layers = this->config->support_interface_enabled.value
        ? this->config->support_interface_layers.value : 0;

    for (size_t i = 0; i < z.size(); ++i) {
        if (footprints[i].empty()) continue;

        ExPolygons area = footprints[i];
        if (i < slices.size() && !slices[i].empty()) {
            const Polygons model = xy_distance > 0
                ? offset(to_polygons(slices[i]), scale_(xy_distance))
                : to_polygons(slices[i]);
            area = diff_ex(to_polygons(area), model);
        }
        if (area.empty()) continue;

        // interface where the overhang is at most interface_layers above
        ExPolygons interface_area;
        if (interface_layers > 0) {
            const size_t above = i + interface_layers;
            if (above >= footprints.size() || footprints[above].empty()) {
                interface_area = area;
            } else {
                interface_area = diff_ex(to_polygons(area), to_polygons(footprints[above]));
            }
        }

        Lines lines = this->generate_layer(i, area, interface_area);
        if (!lines.empty())
            support[i] = std::move(lines);
    }

    Log::debug("Support") << "Support generated for " << support.size() << " of "
        << z.size() << " layers." << std::endl;
    return support;
}

Lines
SupportMaterial::generate_layer(size_t layer_id, const ExPolygons &area, const ExPolygons &interface_area) const
{
    if (interface_area.empty())
        return this->_fill(layer_id, area, false);

    Lines lines = this->_fill(layer_id, interface_area, true);
    const ExPolygons sparse = diff_ex(to_polygons(area), to_polygons(interface_area));
    append_to(lines, this->_fill(layer_id, sparse, false));
    return lines;
}

Lines
SupportMaterial::_fill(size_t layer_id, const ExPolygons &area, bool interface) const
{
    if (area.empty()) return Lines();

    std::unique_ptr<Fill> filler;
    if (interface) {
        filler.reset(new FillSolid());
    } else if (this->config->support_pattern.value == supGrid) {
        filler.reset(new FillGrid());
    } else {
        filler.reset(new FillLines());
    }
    filler->layer_id   = layer_id;
    filler->angle      = 0;
    filler->density    = this->config->support_density.value / 100.;
    filler->line_width = this->config->line_width.value;

    Lines lines = filler->fill_surface(area);
    if (!interface && this->config->support_pattern.value == supZigzag)
        lines = this->_zigzag(lines, area);
    return lines;
}

Lines
SupportMaterial::_zigzag(const Lines &lines, const ExPolygons &area) const
{
    if (lines.size() < 2) return lines;

    // the connectors run along the boundary, so test them against a slightly grown area
    const ExPolygons grown = offset_ex(area, scale_(EPSILON * 10));

    const Lines chained = Geometry::chained_lines(lines, lines.front().a);
    Lines out;
    out.reserve(chained.size() * 2);
    out.push_back(chained.front());
    for (size_t i = 1; i < chained.size(); ++i) {
        const Line connector(chained[i-1].b, chained[i].a);
        if (connector.length() > 0) {
            for (const ExPolygon &expp : grown) {
                if (expp.contains(connector)) {
                    out.push_back(connector);
                    break;
                }
            }
        }
        out.push_back(chained[i]);
    }
    return out;
}

}
