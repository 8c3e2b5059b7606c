#ifndef laminar_Point_hpp_
#define laminar_Point_hpp_

#include "liblaminar.h"
#include <sstream>
#include <string>
#include <vector>
#include <cmath>

namespace Laminar {

class Line;
class Point;
class Pointf;
class Pointf3;
typedef Point Vector;
typedef Pointf Vectorf;
typedef Pointf3 Vectorf3;
typedef std::vector<Point> Points;
typedef std::vector<Point*> PointPtrs;
typedef std::vector<Pointf> Pointfs;
typedef std::vector<Pointf3> Pointf3s;
class Point3;
typedef std::vector<Point3> Point3s;

/// Scaled integer 2D point. Slicing geometry lives in this space so that
/// Clipper can work on it without conversion.
class Point
{
    public:
    coord_t x;
    coord_t y;
    constexpr Point(coord_t _x = 0, coord_t _y = 0): x(_x), y(_y) {};
    constexpr Point(int _x, int _y): x(_x), y(_y) {};
    Point(double x, double y);
    static Point new_scale(coordf_t x, coordf_t y) {
        return Point(scale_(x), scale_(y));
    };
    bool operator==(const Point& rhs) const { return this->x == rhs.x && this->y == rhs.y; };
    bool operator!=(const Point& rhs) const { return ! (*this == rhs); };
    bool operator<(const Point& rhs) const { return this->x < rhs.x || (this->x == rhs.x && this->y < rhs.y); };
    std::string wkt() const;
    void scale(double factor);
    void translate(double x, double y);
    void translate(const Vector &vector);
    void rotate(double angle);
    void rotate(double angle, const Point &center);
    bool coincides_with(const Point &point) const { return this->x == point.x && this->y == point.y; };
    double distance_to(const Point &point) const;
    double distance_to_sq(const Point &point) const {
        double dx = double(point.x - this->x);
        double dy = double(point.y - this->y);
        return dx*dx + dy*dy;
    };
    double distance_to(const Line &line) const;
    double ccw(const Point &p1, const Point &p2) const;
    Point negative() const { return Point(-this->x, -this->y); };
    Vector vector_to(const Point &point) const { return Vector(point.x - this->x, point.y - this->y); };
};

Point operator+(const Point& point1, const Point& point2);
Point operator-(const Point& point1, const Point& point2);
Point operator*(double scalar, const Point& point2);

std::ostream& operator<<(std::ostream &stm, const Point &point);

/// Integer triple, used for facet vertex indices.
class Point3 : public Point
{
    public:
    coord_t z;
    explicit Point3(coord_t _x = 0, coord_t _y = 0, coord_t _z = 0): Point(_x, _y), z(_z) {};
};

/// Unscaled 2D point in millimetres.
class Pointf
{
    public:
    coordf_t x;
    coordf_t y;
    explicit Pointf(coordf_t _x = 0, coordf_t _y = 0): x(_x), y(_y) {};
    static Pointf new_unscale(coord_t x, coord_t y) {
        return Pointf(unscale(x), unscale(y));
    };
    static Pointf new_unscale(const Point &p) {
        return Pointf(unscale(p.x), unscale(p.y));
    };
    bool operator==(const Pointf& rhs) const { return this->x == rhs.x && this->y == rhs.y; };
    void scale(double factor);
    void translate(double x, double y);
    void translate(const Vectorf &vector);
    void rotate(double angle);
    void rotate(double angle, const Pointf &center);
    double distance_to(const Pointf &point) const { return std::hypot(point.x - this->x, point.y - this->y); };
    Pointf negative() const { return Pointf(-this->x, -this->y); };
    Vectorf vector_to(const Pointf &point) const { return Vectorf(point.x - this->x, point.y - this->y); };
};

Pointf operator+(const Pointf& point1, const Pointf& point2);
Pointf operator-(const Pointf& point1, const Pointf& point2);
Pointf operator*(double scalar, const Pointf& point2);

std::ostream& operator<<(std::ostream &stm, const Pointf &pointf);

/// Unscaled 3D point in millimetres.
class Pointf3 : public Pointf
{
    public:
    coordf_t z;
    explicit Pointf3(coordf_t _x = 0, coordf_t _y = 0, coordf_t _z = 0): Pointf(_x, _y), z(_z) {};
    void scale(double factor);
    void translate(const Vectorf3 &vector);
    void translate(double x, double y, double z);
    double distance_to(const Pointf3 &point) const;
    Pointf3 negative() const { return Pointf3(-this->x, -this->y, -this->z); };
    Vectorf3 vector_to(const Pointf3 &point) const { return Vectorf3(point.x - this->x, point.y - this->y, point.z - this->z); };
};

} // namespace Laminar

#endif
