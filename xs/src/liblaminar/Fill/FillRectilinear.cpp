#include "../ClipperUtils.hpp"
#include "../ExPolygon.hpp"

#include "FillRectilinear.hpp"

namespace Laminar {

void
FillLines::_fill_single_direction(const ExPolygon &expolygon, double angle,
    coord_t spacing, Lines* out) const
{
    const Lines lines = _bounding_lines(expolygon.contour.bounding_box(), angle, spacing);
    append_to(*out, intersection_ln(lines, (Polygons)expolygon));
}

void
FillLines::_fill_surface_single(const ExPolygon &expolygon, coord_t spacing, Lines* lines_out) const
{
    this->_fill_single_direction(expolygon, this->angle + this->_layer_angle(this->layer_id), spacing, lines_out);
}

void
FillGrid::_fill_surface_single(const ExPolygon &expolygon, coord_t spacing, Lines* lines_out) const
{
    const double base_angle = (this->layer_id % 2) == 0 ? this->angle : -this->angle;
    this->_fill_single_direction(expolygon, base_angle, spacing, lines_out);
    this->_fill_single_direction(expolygon, base_angle + M_PI/2., spacing, lines_out);
}

} // namespace Laminar
