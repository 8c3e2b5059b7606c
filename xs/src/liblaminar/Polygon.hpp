#ifndef laminar_Polygon_hpp_
#define laminar_Polygon_hpp_

#include "liblaminar.h"
#include <vector>
#include <string>
#include "Line.hpp"
#include "MultiPoint.hpp"
#include "Polyline.hpp"

namespace Laminar {

class Polygon;
typedef std::vector<Polygon> Polygons;

/// Closed point sequence; the last point connects back to the first one
/// and is not repeated.
class Polygon : public MultiPoint {
    public:
    operator Polygons() const;
    operator Polyline() const;
    Point& operator[](Points::size_type idx);
    const Point& operator[](Points::size_type idx) const;
    
    Polygon() {};
    explicit Polygon(const Points &points): MultiPoint(points) {};
    static Polygon new_scale(const Pointfs &pts) {
        Points points;
        for (auto pt : pts)
            points.push_back(Point::new_scale(pt.x, pt.y));
        return Polygon(points);
    }
    Point last_point() const;
    virtual Lines lines() const;
    // Split a closed polygon into an open polyline, with the split point duplicated at both ends.
    Polyline split_at_first_point() const;
    Polyline split_at_index(int index) const;
    double area() const;
    bool is_counter_clockwise() const;
    bool is_clockwise() const { return !this->is_counter_clockwise(); }
    bool make_counter_clockwise();
    bool make_clockwise();
    bool is_valid() const;
    // Does an unoriented polygon contain a point?
    // Tested by counting intersections along a horizontal line.
    bool contains(const Point &point) const;
    /// Angle (radians, 0..2*PI) at vertex idx measured on the material side:
    /// the left side of the traversal direction.
    double vertex_angle(size_t idx) const;
    /// Make the vertex at idx the first one without changing the loop.
    void make_first(size_t idx);
    std::string wkt() const;
};

/// Total length of a set of closed polygons, closing edges included.
double total_length(const Polygons &polygons);

}

#endif
