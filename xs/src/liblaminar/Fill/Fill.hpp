#ifndef laminar_Fill_hpp_
#define laminar_Fill_hpp_

#include <float.h>
#include <stdint.h>

#include "../liblaminar.h"
#include "../BoundingBox.hpp"
#include "../ExPolygon.hpp"
#include "../Line.hpp"
#include "../PrintConfig.hpp"

namespace Laminar {

// Abstract base class for the infill generators.
class Fill
{
public:
    // Index of the layer; the pattern direction alternates with its parity.
    size_t      layer_id;
    
    // in radians, ccw, 0 = East
    float       angle;
    
    // Fill density, fraction in <0, 1>
    float       density;
    
    // Extrusion width in unscaled coordinates.
    coordf_t    line_width;

public:
    static Fill* new_from_type(const InfillPattern type);
    static Fill* new_from_type(const std::string &type);

    /// Distance between neighbouring lines for a density in percent.
    /// The density is clamped to [1, 100]; 100% gives the line width.
    static coordf_t line_spacing(coordf_t density, coordf_t line_width);

    virtual Fill* clone() const = 0;
    virtual ~Fill() {};
    
    // Can this pattern be used for solid infill?
    virtual bool can_solid() const { return false; };

    // Perform the fill. Returns no segments for an empty region or a zero density.
    Lines fill_surface(const ExPolygon &expolygon) const;

    // Fill every connected component independently.
    Lines fill_surface(const ExPolygons &expolygons) const;
    
    // Line spacing in unscaled coordinates.
    virtual coordf_t spacing() const { return line_spacing(this->density * 100., this->line_width); };

protected:
    Fill() :
        layer_id(0),
        angle(float(M_PI/4.)),
        density(0),
        line_width(0)
        {};
    
    virtual void _fill_surface_single(
        const ExPolygon                 &expolygon,
        coord_t                         spacing,
        Lines*                          lines_out) const = 0;
    
    // Implementations can override the following virtual method:
    virtual float _layer_angle(size_t idx) const {
        return (idx % 2) == 0 ? 0 : (M_PI/2.);
    };

    // A family of parallel lines at the given angle centered on the bounding box.
    // It spans about 1.2 times the box diagonal so any rotation covers the box.
    static Lines _bounding_lines(const BoundingBox &bb, double angle, coord_t spacing);
};

} // namespace Laminar

#endif // laminar_Fill_hpp_
