#include "PerimeterGenerator.hpp"
#include "ClipperUtils.hpp"
#include "Log.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace Laminar {

void
PerimeterGenerator::process()
{
    PerimeterLoops new_loops = this->make_loops();
    this->place_seams(&new_loops);
    this->order_loops(&new_loops);
    this->loops->insert(this->loops->end(), new_loops.begin(), new_loops.end());

    ExPolygons inner = this->make_inner_area();
    expolygons_append(*this->inner_area, std::move(inner));
}

PerimeterLoops
PerimeterGenerator::make_loops() const
{
    PerimeterLoops out;
    if (this->wall_count <= 0 || this->line_width <= 0) return out;

    const float delta = -scale_(this->line_width);
    ExPolygons last { *this->slice };
    for (int i = 0; i < this->wall_count; ++i) {
        // each piece left by the previous offset gets its own walls
        for (const ExPolygon &expp : last) {
            out.push_back(PerimeterLoop(expp.contour, true, i));
            for (const Polygon &hole : expp.holes)
                out.push_back(PerimeterLoop(hole, false, i));
        }
        if (i == this->wall_count - 1) break;

        last = offset_ex(last, delta, CLIPPER_OFFSET_SCALE, jtMiter, 3);
        if (last.empty()) {
            Log::debug("Slicer") << "Layer " << this->layer_id << ": island too thin for "
                << this->wall_count << " walls, " << (i + 1) << " made." << std::endl;
            break;
        }
    }
    return out;
}

ExPolygons
PerimeterGenerator::make_inner_area() const
{
    if (this->wall_count <= 0) return ExPolygons { *this->slice };
    return offset_ex(*this->slice, -scale_(this->wall_count * this->line_width),
        CLIPPER_OFFSET_SCALE, jtMiter, 3);
}

Point
PerimeterGenerator::_seam_anchor() const
{
    BoundingBox bb = this->slice->bounding_box();
    return Point(bb.center().x, bb.max.y + scale_(1000.));
}

void
PerimeterGenerator::place_seams(PerimeterLoops* loops) const
{
    // one generator per layer so a layer always gets the same seams
    std::mt19937 rng(static_cast<unsigned int>(this->layer_id));
    const Point anchor = this->_seam_anchor();

    for (PerimeterLoop &loop : *loops) {
        Polygon &polygon = loop.polygon;
        if (polygon.points.size() < 3) continue;

        size_t first = 0;
        switch (this->seam_position) {
        case spBack:
            first = polygon.closest_point_index(anchor);
            break;
        case spRandom: {
            std::uniform_int_distribution<size_t> pick(0, polygon.points.size() - 1);
            first = pick(rng);
            break;
        }
        case spSharpest: {
            // smallest angle measured on the material side
            double best = 2*PI;
            for (size_t i = 0; i < polygon.points.size(); ++i) {
                double angle = polygon.vertex_angle(i);
                if (angle < best - EPSILON) {
                    best  = angle;
                    first = i;
                }
            }
            break;
        }
        }
        polygon.make_first(first);
    }
}

void
PerimeterGenerator::order_loops(PerimeterLoops* loops) const
{
    if (this->outer_before_inner) {
        std::stable_sort(loops->begin(), loops->end(),
            [](const PerimeterLoop &a, const PerimeterLoop &b) { return a.depth < b.depth; });
    } else {
        std::stable_sort(loops->begin(), loops->end(),
            [](const PerimeterLoop &a, const PerimeterLoop &b) { return a.depth > b.depth; });
    }
}

Polygons
make_brim(const ExPolygons &islands, coordf_t brim_width, coordf_t line_width)
{
    Polygons brim;
    if (islands.empty() || line_width <= 0) return brim;

    const int num_loops = std::max(1, int(std::round(brim_width / line_width)));

    // only the outer contours matter, the brim never goes into holes
    Polygons contours;
    for (const ExPolygon &expp : islands)
        contours.push_back(expp.contour);

    for (int i = 0; i < num_loops; ++i) {
        ExPolygons grown = offset_ex(contours, scale_(line_width * (i + 1)),
            CLIPPER_OFFSET_SCALE, jtMiter, 3);
        for (const ExPolygon &expp : grown)
            brim.push_back(expp.contour);
    }
    return brim;
}

}
