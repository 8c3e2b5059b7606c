#ifndef laminar_Line_hpp_
#define laminar_Line_hpp_

#include "liblaminar.h"
#include "Point.hpp"

namespace Laminar {

class Line;
class Polyline;
typedef std::vector<Line> Lines;

/// A straight segment between two scaled points. Infill and support
/// output is made of these.
class Line
{
    public:
    Point a;
    Point b;
    Line() {};
    explicit Line(Point _a, Point _b): a(_a), b(_b) {};
    std::string wkt() const;
    operator Lines() const;
    operator Polyline() const;
    void scale(double factor);
    void translate(double x, double y);
    void rotate(double angle, const Point &center);
    void reverse();
    double length() const;
    Point midpoint() const;
    void point_at(double distance, Point* point) const;
    Point point_at(double distance) const;
    bool coincides_with(const Line &line) const;
    double distance_to(const Point &point) const;
    bool parallel_to(double angle) const;
    bool parallel_to(const Line &line) const;
    double atan2_() const;
    double orientation() const;
    double direction() const;
    Vector vector() const;
    bool intersection(const Line& line, Point* intersection) const;
};

} // namespace Laminar

#endif
