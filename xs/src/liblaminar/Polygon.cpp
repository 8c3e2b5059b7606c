#include <polyclipping/clipper.hpp>
#include "ClipperUtils.hpp"
#include "Polygon.hpp"
#include "Polyline.hpp"

namespace Laminar {

Polygon::operator Polygons() const
{
    Polygons pp;
    pp.push_back(*this);
    return pp;
}

Polygon::operator Polyline() const
{
    return this->split_at_first_point();
}

Point&
Polygon::operator[](Points::size_type idx)
{
    return this->points[idx];
}

const Point&
Polygon::operator[](Points::size_type idx) const
{
    return this->points[idx];
}

Point
Polygon::last_point() const
{
    return this->points.front();  // last point == first point for polygons
}

Lines
Polygon::lines() const
{
    Lines lines;
    if (this->points.size() < 2) return lines;
    lines.reserve(this->points.size());
    for (Points::const_iterator it = this->points.begin(); it != this->points.end()-1; ++it) {
        lines.push_back(Line(*it, *(it + 1)));
    }
    lines.push_back(Line(this->points.back(), this->points.front()));
    return lines;
}

Polyline
Polygon::split_at_index(int index) const
{
    Polyline polyline;
    polyline.points.reserve(this->points.size() + 1);
    for (Points::const_iterator it = this->points.begin() + index; it != this->points.end(); ++it)
        polyline.points.push_back(*it);
    for (Points::const_iterator it = this->points.begin(); it != this->points.begin() + index + 1; ++it)
        polyline.points.push_back(*it);
    return polyline;
}

Polyline
Polygon::split_at_first_point() const
{
    return this->split_at_index(0);
}

double
Polygon::area() const
{
    ClipperLib::Path p = MultiPoint_to_ClipperPath(*this);
    return ClipperLib::Area(p);
}

bool
Polygon::is_counter_clockwise() const
{
    ClipperLib::Path p = MultiPoint_to_ClipperPath(*this);
    return ClipperLib::Orientation(p);
}

bool
Polygon::make_counter_clockwise()
{
    if (!this->is_counter_clockwise()) {
        this->reverse();
        return true;
    }
    return false;
}

bool
Polygon::make_clockwise()
{
    if (this->is_counter_clockwise()) {
        this->reverse();
        return true;
    }
    return false;
}

bool
Polygon::is_valid() const
{
    return this->points.size() >= 3;
}

bool
Polygon::contains(const Point &point) const
{
    // http://www.ecse.rpi.edu/Homepages/wrf/Research/Short_Notes/pnpoly.html
    bool result = false;
    Points::const_iterator i = this->points.begin();
    Points::const_iterator j = this->points.end() - 1;
    for (; i != this->points.end(); j = i++) {
        if ( ((i->y > point.y) != (j->y > point.y))
            && ((double)point.x < (double)(j->x - i->x) * (double)(point.y - i->y) / (double)(j->y - i->y) + (double)i->x) )
            result = !result;
    }
    return result;
}

double
Polygon::vertex_angle(size_t idx) const
{
    const size_t n = this->points.size();
    const Point &prev = this->points[(idx + n - 1) % n];
    const Point &cur  = this->points[idx];
    const Point &next = this->points[(idx + 1) % n];
    double angle = atan2(double(prev.y - cur.y), double(prev.x - cur.x))
                 - atan2(double(next.y - cur.y), double(next.x - cur.x));
    while (angle < 0)     angle += 2*PI;
    while (angle >= 2*PI) angle -= 2*PI;
    return angle;
}

void
Polygon::make_first(size_t idx)
{
    if (idx == 0 || idx >= this->points.size()) return;
    std::rotate(this->points.begin(), this->points.begin() + idx, this->points.end());
}

std::string
Polygon::wkt() const
{
    std::ostringstream wkt;
    wkt << "POLYGON((";
    for (Points::const_iterator p = this->points.begin(); p != this->points.end(); ++p) {
        wkt << p->x << " " << p->y;
        if (p != this->points.end()-1) wkt << ",";
    }
    wkt << "))";
    return wkt.str();
}

double
total_length(const Polygons &polygons)
{
    double len = 0;
    for (const Polygon &p : polygons)
        len += p.length();
    return len;
}

}
