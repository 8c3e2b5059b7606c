#include "../ClipperUtils.hpp"
#include "../PrintConfig.hpp"
#include <algorithm>
#include <cmath>

#include "Fill.hpp"
#include "FillHoneycomb.hpp"
#include "FillRectilinear.hpp"

namespace Laminar {

Fill* Fill::new_from_type(const InfillPattern type)
{
    switch (type) {
    case ipGrid:                return new FillGrid();
    case ipLines:               return new FillLines();
    case ipHoneycomb:           return new FillHoneycomb();
    default: CONFESS("unknown type");
    }
}

Fill* Fill::new_from_type(const std::string &type)
{
    const t_config_enum_values enum_keys_map = ConfigOptionEnum<InfillPattern>::get_enum_values();
    t_config_enum_values::const_iterator it = enum_keys_map.find(type);
    return (it == enum_keys_map.end()) ? nullptr : new_from_type(InfillPattern(it->second));
}

coordf_t Fill::line_spacing(coordf_t density, coordf_t line_width)
{
    density = std::max(1., std::min(density, 100.));
    return line_width / (density / 100.);
}

Lines Fill::fill_surface(const ExPolygon &expolygon) const
{
    Lines lines_out;
    if (this->density <= 0 && !this->can_solid()) return lines_out;
    if (this->line_width <= 0 || expolygon.contour.points.size() < 3 || expolygon.area() <= 0)
        return lines_out;
    
    const coord_t spacing = scale_(this->spacing());
    if (spacing <= 0) return lines_out;
    this->_fill_surface_single(expolygon, spacing, &lines_out);
    return lines_out;
}

Lines Fill::fill_surface(const ExPolygons &expolygons) const
{
    Lines lines_out;
    for (const ExPolygon &expolygon : expolygons)
        append_to(lines_out, this->fill_surface(expolygon));
    return lines_out;
}

Lines Fill::_bounding_lines(const BoundingBox &bb, double angle, coord_t spacing)
{
    Lines lines;
    if (!bb.defined || spacing <= 0) return lines;
    
    const Point center = bb.center();
    const Point size   = bb.size();
    const double half_length = std::hypot(double(size.x), double(size.y)) * 0.6 + spacing;
    
    // direction along the lines and perpendicular to them
    const double dir_x  = cos(angle);
    const double dir_y  = sin(angle);
    const double perp_x = cos(angle + M_PI/2.);
    const double perp_y = sin(angle + M_PI/2.);
    
    const long n = long(ceil(half_length * 2. / spacing)) + 1;
    lines.reserve(2*n + 1);
    for (long i = -n; i <= n; ++i) {
        const double ox = center.x + perp_x * i * spacing;
        const double oy = center.y + perp_y * i * spacing;
        lines.push_back(Line(
            Point(ox - dir_x * half_length, oy - dir_y * half_length),
            Point(ox + dir_x * half_length, oy + dir_y * half_length)
        ));
    }
    return lines;
}

} // namespace Laminar
