#include "../ClipperUtils.hpp"
#include "../Geometry.hpp"

#include "FillHoneycomb.hpp"

namespace Laminar {

void
FillHoneycomb::_fill_surface_single(const ExPolygon &expolygon, coord_t spacing, Lines* lines_out) const
{
    const coordf_t hex_size = spacing;
    const coordf_t col_w    = hex_size * sqrt(3.);
    const coordf_t row_h    = hex_size * 2. * 0.75;
    const coordf_t pad      = hex_size * 2.;
    
    // corners of a cell relative to its center
    Pointfs corners;
    for (int k = 0; k < 6; ++k) {
        const double a = Geometry::deg2rad(60. * k + 30.);
        corners.push_back(Pointf(hex_size * cos(a), hex_size * sin(a)));
    }
    
    const BoundingBox bb = expolygon.contour.bounding_box();
    Lines edges;
    size_t col = 0;
    for (coordf_t x = bb.min.x - pad; x < bb.max.x + pad; x += col_w, ++col) {
        const coordf_t shift = (col % 2 == 1) ? hex_size * 0.5 : 0.;
        for (coordf_t y = bb.min.y - pad; y < bb.max.y + pad; y += row_h) {
            for (size_t k = 0; k < corners.size(); ++k) {
                const Pointf &a = corners[k];
                const Pointf &b = corners[(k+1) % corners.size()];
                edges.push_back(Line(
                    Point(x + a.x, y + shift + a.y),
                    Point(x + b.x, y + shift + b.y)
                ));
            }
        }
    }
    
    append_to(*lines_out, intersection_ln(edges, (Polygons)expolygon));
}

} // namespace Laminar
