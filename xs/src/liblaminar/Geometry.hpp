#ifndef laminar_Geometry_hpp_
#define laminar_Geometry_hpp_

#include "liblaminar.h"
#include "BoundingBox.hpp"
#include "ExPolygon.hpp"
#include "Polygon.hpp"
#include "Polyline.hpp"


namespace Laminar { namespace Geometry {

/// Greedy nearest-neighbour ordering of points, starting near start_near.
void chained_path(const Points &points, std::vector<Points::size_type> &retval, Point start_near);
void chained_path(const Points &points, std::vector<Points::size_type> &retval);
/// Order segments by nearest endpoint, flipping them when the far end is closer.
Lines chained_lines(const Lines &lines, Point start_near);
bool directions_parallel(double angle1, double angle2, double max_diff = 0);
double rad2deg(double angle);
double deg2rad(double angle);


} }

#endif
