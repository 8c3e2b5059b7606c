#ifndef laminar_FillHoneycomb_hpp_
#define laminar_FillHoneycomb_hpp_

#include "../liblaminar.h"

#include "Fill.hpp"

namespace Laminar {

// Hexagonal cells with a side equal to the line spacing. Odd columns are
// shifted vertically by half a side, like bricks. The angle is not used.
class FillHoneycomb : public Fill
{
public:
    virtual Fill* clone() const { return new FillHoneycomb(*this); };
    virtual ~FillHoneycomb() {}

protected:
	virtual void _fill_surface_single(
	    const ExPolygon                 &expolygon,
	    coord_t                         spacing,
	    Lines*                          lines_out) const;
};

} // namespace Laminar

#endif // laminar_FillHoneycomb_hpp_
