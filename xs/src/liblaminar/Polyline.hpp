#ifndef laminar_Polyline_hpp_
#define laminar_Polyline_hpp_

#include "liblaminar.h"
#include "Line.hpp"
#include "MultiPoint.hpp"
#include <string>
#include <vector>

namespace Laminar {

class Polyline;
typedef std::vector<Polyline> Polylines;

/// Open point sequence.
class Polyline : public MultiPoint {
    public:
    Polyline() {};
    explicit Polyline(const Points &_points) : MultiPoint(_points) {};
    operator Polylines() const;
    operator Line() const;
    Point last_point() const;
    Lines lines() const;
};

/// Total length of a set of polylines, in scaled units.
double total_length(const Polylines &polylines);

}

#endif
