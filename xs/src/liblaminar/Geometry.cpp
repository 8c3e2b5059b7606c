#include "Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace Laminar { namespace Geometry {

void
chained_path(const Points &points, std::vector<Points::size_type> &retval, Point start_near)
{
    std::vector<Points::size_type> remaining;
    remaining.reserve(points.size());
    for (Points::size_type i = 0; i < points.size(); ++i)
        remaining.push_back(i);
    
    retval.reserve(retval.size() + points.size());
    while (!remaining.empty()) {
        size_t best_idx = 0;
        double best = start_near.distance_to_sq(points[remaining.front()]);
        for (size_t i = 1; i < remaining.size(); ++i) {
            double d = start_near.distance_to_sq(points[remaining[i]]);
            if (d < best) {
                best = d;
                best_idx = i;
            }
        }
        start_near = points[remaining[best_idx]];
        retval.push_back(remaining[best_idx]);
        remaining.erase(remaining.begin() + best_idx);
    }
}

void
chained_path(const Points &points, std::vector<Points::size_type> &retval)
{
    if (points.empty()) return;  // can't call front() on empty vector
    chained_path(points, retval, points.front());
}

Lines
chained_lines(const Lines &lines, Point start_near)
{
    Lines retval;
    retval.reserve(lines.size());
    std::vector<bool> used(lines.size(), false);
    for (size_t n = 0; n < lines.size(); ++n) {
        size_t best_idx = 0;
        bool   best_flip = false;
        double best = -1;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (used[i]) continue;
            double da = start_near.distance_to_sq(lines[i].a);
            double db = start_near.distance_to_sq(lines[i].b);
            if (best < 0 || da < best) { best = da; best_idx = i; best_flip = false; }
            if (db < best)             { best = db; best_idx = i; best_flip = true;  }
        }
        used[best_idx] = true;
        Line line = lines[best_idx];
        if (best_flip) line.reverse();
        retval.push_back(line);
        start_near = line.b;
    }
    return retval;
}

bool
directions_parallel(double angle1, double angle2, double max_diff)
{
    double diff = fabs(angle1 - angle2);
    max_diff += EPSILON;
    return diff < max_diff || fabs(diff - PI) < max_diff;
}

double
rad2deg(double angle)
{
    return angle / PI * 180.0;
}

double
deg2rad(double angle)
{
    return PI * angle / 180.0;
}

} }
