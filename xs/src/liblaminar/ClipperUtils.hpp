#ifndef laminar_ClipperUtils_hpp_
#define laminar_ClipperUtils_hpp_

#include "liblaminar.h"
#include <polyclipping/clipper.hpp>
#include "ExPolygon.hpp"
#include "Polygon.hpp"

// import these wherever we're included
using ClipperLib::jtMiter;
using ClipperLib::jtRound;
using ClipperLib::jtSquare;

namespace Laminar {

//-----------------------------------------------------------
// legacy code from Clipper documentation
void AddOuterPolyNodeToExPolygons(ClipperLib::PolyNode& polynode, ExPolygons* expolygons);
ExPolygons PolyTreeToExPolygons(ClipperLib::PolyTree& polytree);
//-----------------------------------------------------------

ClipperLib::Path MultiPoint_to_ClipperPath(const MultiPoint &input);
template <class T>
ClipperLib::Paths MultiPoints_to_ClipperPaths(const T &input);
template <class T>
T ClipperPath_to_MultiPoint(const ClipperLib::Path &input);
template <class T>
T ClipperPaths_to_MultiPoints(const ClipperLib::Paths &input);
ExPolygons ClipperPaths_to_ExPolygons(const ClipperLib::Paths &input);

void scaleClipperPolygons(ClipperLib::Paths &polygons, const double scale);

// offset Polygons
ClipperLib::Paths _offset(const Polygons &polygons, const float delta,
    double scale, ClipperLib::JoinType joinType, double miterLimit);
Polygons offset(const Polygons &polygons, const float delta,
    double scale = CLIPPER_OFFSET_SCALE, ClipperLib::JoinType joinType = ClipperLib::jtMiter, 
    double miterLimit = 3);

// offset Polylines
ClipperLib::Paths _offset(const Polylines &polylines, const float delta,
    double scale, ClipperLib::JoinType joinType, double miterLimit);
Polygons offset(const Polylines &polylines, const float delta,
    double scale = CLIPPER_OFFSET_SCALE, ClipperLib::JoinType joinType = ClipperLib::jtSquare, 
    double miterLimit = 3);

ExPolygons offset_ex(const Polygons &polygons, const float delta,
    double scale = CLIPPER_OFFSET_SCALE, ClipperLib::JoinType joinType = ClipperLib::jtMiter, 
    double miterLimit = 3);
ExPolygons offset_ex(const ExPolygons &expolygons, const float delta,
    double scale = CLIPPER_OFFSET_SCALE, ClipperLib::JoinType joinType = ClipperLib::jtMiter, 
    double miterLimit = 3);
inline ExPolygons offset_ex(const ExPolygon &expolygon, const float delta,
    double scale = CLIPPER_OFFSET_SCALE, ClipperLib::JoinType joinType = ClipperLib::jtMiter, 
    double miterLimit = 3)
{
    return offset_ex(to_polygons(expolygon), delta, scale, joinType, miterLimit);
}

ClipperLib::Paths _offset2(const Polygons &polygons, const float delta1,
    const float delta2, double scale, ClipperLib::JoinType joinType, double miterLimit);
ExPolygons offset2_ex(const Polygons &polygons, const float delta1,
    const float delta2, double scale = CLIPPER_OFFSET_SCALE, ClipperLib::JoinType joinType = ClipperLib::jtMiter, 
    double miterLimit = 3);

template <class T>
T _clipper_do(ClipperLib::ClipType clipType, const Polygons &subject, 
    const Polygons &clip, const ClipperLib::PolyFillType fillType, bool safety_offset_ = false);

ClipperLib::PolyTree _clipper_do(ClipperLib::ClipType clipType, const Polylines &subject, 
    const Polygons &clip, const ClipperLib::PolyFillType fillType, bool safety_offset_ = false);

Polygons _clipper(ClipperLib::ClipType clipType,
    const Polygons &subject, const Polygons &clip, bool safety_offset_ = false);
ExPolygons _clipper_ex(ClipperLib::ClipType clipType,
    const Polygons &subject, const Polygons &clip, bool safety_offset_ = false);
Polylines _clipper_pl(ClipperLib::ClipType clipType,
    const Polylines &subject, const Polygons &clip, bool safety_offset_ = false);
Polylines _clipper_pl(ClipperLib::ClipType clipType,
    const Polygons &subject, const Polygons &clip, bool safety_offset_ = false);
Lines _clipper_ln(ClipperLib::ClipType clipType,
    const Lines &subject, const Polygons &clip, bool safety_offset_ = false);

// diff
inline Polygons
diff(const Polygons &subject, const Polygons &clip, bool safety_offset_ = false)
{
    return _clipper(ClipperLib::ctDifference, subject, clip, safety_offset_);
}

inline ExPolygons
diff_ex(const Polygons &subject, const Polygons &clip, bool safety_offset_ = false)
{
    return _clipper_ex(ClipperLib::ctDifference, subject, clip, safety_offset_);
}

inline Polylines
diff_pl(const Polylines &subject, const Polygons &clip, bool safety_offset_ = false)
{
    return _clipper_pl(ClipperLib::ctDifference, subject, clip, safety_offset_);
}

// intersection
inline Polygons
intersection(const Polygons &subject, const Polygons &clip, bool safety_offset_ = false)
{
    return _clipper(ClipperLib::ctIntersection, subject, clip, safety_offset_);
}

inline ExPolygons
intersection_ex(const Polygons &subject, const Polygons &clip, bool safety_offset_ = false)
{
    return _clipper_ex(ClipperLib::ctIntersection, subject, clip, safety_offset_);
}

inline Lines
intersection_ln(const Lines &subject, const Polygons &clip, bool safety_offset_ = false)
{
    return _clipper_ln(ClipperLib::ctIntersection, subject, clip, safety_offset_);
}

// union
inline Polygons
union_(const Polygons &subject, bool safety_offset_ = false)
{
    return _clipper(ClipperLib::ctUnion, subject, Polygons(), safety_offset_);
}

inline ExPolygons
union_ex(const Polygons &subject, bool safety_offset_ = false)
{
    return _clipper_ex(ClipperLib::ctUnion, subject, Polygons(), safety_offset_);
}

inline ExPolygons
union_ex(const ExPolygons &subject, bool safety_offset_ = false)
{
    return _clipper_ex(ClipperLib::ctUnion, to_polygons(subject), Polygons(), safety_offset_);
}

/// Clip one segment against a region; the result may be split into
/// several disjoint pieces or be empty.
inline Lines
clip_segment(const Line &line, const ExPolygon &region)
{
    return intersection_ln(Lines(1, line), to_polygons(region));
}

Polygons simplify_polygons(const Polygons &subject, bool preserve_collinear = false);

/// Turn arbitrary (possibly self-intersecting, badly wound or overlapping)
/// rings into valid regions. Returns an empty vector when nothing with a
/// positive area is left.
ExPolygons repair_polygons(const Polygons &subject);

void safety_offset(ClipperLib::Paths* paths);

}

#endif
