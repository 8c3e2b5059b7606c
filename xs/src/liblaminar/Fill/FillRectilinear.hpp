#ifndef laminar_FillRectilinear_hpp_
#define laminar_FillRectilinear_hpp_

#include "../liblaminar.h"

#include "Fill.hpp"

namespace Laminar {

// One family of parallel lines, turned by 90 degrees on odd layers.
class FillLines : public Fill
{
public:
    virtual Fill* clone() const { return new FillLines(*this); };
    virtual ~FillLines() {}

protected:
	virtual void _fill_surface_single(
	    const ExPolygon                 &expolygon,
	    coord_t                         spacing,
	    Lines*                          lines_out) const;
	
	void _fill_single_direction(const ExPolygon &expolygon, double angle,
	    coord_t spacing, Lines* out) const;
};

// Two perpendicular families. The base angle is mirrored on odd layers.
class FillGrid : public FillLines
{
public:
    virtual Fill* clone() const { return new FillGrid(*this); };
    virtual ~FillGrid() {}

protected:
	virtual void _fill_surface_single(
	    const ExPolygon                 &expolygon,
	    coord_t                         spacing,
	    Lines*                          lines_out) const;
};

// Top and bottom skins: lines at the extrusion width whatever the density.
class FillSolid : public FillLines
{
public:
    virtual Fill* clone() const { return new FillSolid(*this); };
    virtual ~FillSolid() {}
    virtual bool can_solid() const { return true; };
    virtual coordf_t spacing() const { return this->line_width; };
};

} // namespace Laminar

#endif // laminar_FillRectilinear_hpp_
