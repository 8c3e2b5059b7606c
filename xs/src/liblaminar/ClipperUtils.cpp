#include "ClipperUtils.hpp"
#include "Geometry.hpp"

namespace Laminar {

//-----------------------------------------------------------
// legacy code from Clipper documentation
void AddOuterPolyNodeToExPolygons(ClipperLib::PolyNode& polynode, ExPolygons* expolygons)
{  
  size_t cnt = expolygons->size();
  expolygons->resize(cnt + 1);
  (*expolygons)[cnt].contour = ClipperPath_to_MultiPoint<Polygon>(polynode.Contour);
  (*expolygons)[cnt].holes.resize(polynode.ChildCount());
  for (int i = 0; i < polynode.ChildCount(); ++i)
  {
    (*expolygons)[cnt].holes[i] = ClipperPath_to_MultiPoint<Polygon>(polynode.Childs[i]->Contour);
    //Add outer polygons contained by (nested within) holes ...
    for (int j = 0; j < polynode.Childs[i]->ChildCount(); ++j)
      AddOuterPolyNodeToExPolygons(*polynode.Childs[i]->Childs[j], expolygons);
  }
}
 
ExPolygons
PolyTreeToExPolygons(ClipperLib::PolyTree& polytree)
{
    ExPolygons retval;
    for (int i = 0; i < polytree.ChildCount(); ++i)
        AddOuterPolyNodeToExPolygons(*polytree.Childs[i], &retval);
    return retval;
}
//-----------------------------------------------------------

template <class T>
T
ClipperPath_to_MultiPoint(const ClipperLib::Path &input)
{
    T retval;
    retval.points.reserve(input.size());
    for (ClipperLib::Path::const_iterator pit = input.begin(); pit != input.end(); ++pit)
        retval.points.push_back(Point( (coord_t)(*pit).X, (coord_t)(*pit).Y ));
    return retval;
}

template <class T>
T
ClipperPaths_to_MultiPoints(const ClipperLib::Paths &input)
{
    T retval;
    retval.reserve(input.size());
    for (ClipperLib::Paths::const_iterator it = input.begin(); it != input.end(); ++it)
        retval.push_back(ClipperPath_to_MultiPoint<typename T::value_type>(*it));
    return retval;
}

ExPolygons
ClipperPaths_to_ExPolygons(const ClipperLib::Paths &input)
{
    ClipperLib::Clipper clipper;
    clipper.Clear();
    
    // perform union
    clipper.AddPaths(input, ClipperLib::ptSubject, true);
    ClipperLib::PolyTree polytree;
    clipper.Execute(ClipperLib::ctUnion, polytree, ClipperLib::pftEvenOdd, ClipperLib::pftEvenOdd);  // offset results work with both EvenOdd and NonZero
    
    return PolyTreeToExPolygons(polytree);
}

ClipperLib::Path
MultiPoint_to_ClipperPath(const MultiPoint &input)
{
    ClipperLib::Path retval;
    retval.reserve(input.points.size());
    for (Points::const_iterator pit = input.points.begin(); pit != input.points.end(); ++pit)
        retval.push_back(ClipperLib::IntPoint( (*pit).x, (*pit).y ));
    return retval;
}

template <class T>
ClipperLib::Paths
MultiPoints_to_ClipperPaths(const T &input)
{
    ClipperLib::Paths retval;
    retval.reserve(input.size());
    for (typename T::const_iterator it = input.begin(); it != input.end(); ++it)
        retval.push_back(MultiPoint_to_ClipperPath(*it));
    return retval;
}

void
scaleClipperPolygons(ClipperLib::Paths &polygons, const double scale)
{
    for (ClipperLib::Paths::iterator it = polygons.begin(); it != polygons.end(); ++it) {
        for (ClipperLib::Path::iterator pit = (*it).begin(); pit != (*it).end(); ++pit) {
            (*pit).X *= scale;
            (*pit).Y *= scale;
        }
    }
}

/// Shared ClipperOffset driver for closed and open inputs.
static ClipperLib::Paths
_offset_paths(ClipperLib::Paths input, ClipperLib::EndType endType, const float delta,
    double scale, ClipperLib::JoinType joinType, double miterLimit)
{
    scaleClipperPolygons(input, scale);
    
    ClipperLib::ClipperOffset co;
    if (joinType == jtRound) {
        co.ArcTolerance = miterLimit;
    } else {
        co.MiterLimit = miterLimit;
    }
    co.AddPaths(input, joinType, endType);
    ClipperLib::Paths retval;
    co.Execute(retval, (delta*scale));
    
    scaleClipperPolygons(retval, 1/scale);
    return retval;
}

ClipperLib::Paths
_offset(const Polygons &polygons, const float delta,
    double scale, ClipperLib::JoinType joinType, double miterLimit)
{
    return _offset_paths(MultiPoints_to_ClipperPaths(polygons), ClipperLib::etClosedPolygon,
        delta, scale, joinType, miterLimit);
}

ClipperLib::Paths
_offset(const Polylines &polylines, const float delta,
    double scale, ClipperLib::JoinType joinType, double miterLimit)
{
    return _offset_paths(MultiPoints_to_ClipperPaths(polylines), ClipperLib::etOpenButt,
        delta, scale, joinType, miterLimit);
}

Polygons
offset(const Polygons &polygons, const float delta,
    double scale, ClipperLib::JoinType joinType, double miterLimit)
{
    ClipperLib::Paths output = _offset(polygons, delta, scale, joinType, miterLimit);
    return ClipperPaths_to_MultiPoints<Polygons>(output);
}

Polygons
offset(const Polylines &polylines, const float delta,
    double scale, ClipperLib::JoinType joinType, double miterLimit)
{
    ClipperLib::Paths output = _offset(polylines, delta, scale, joinType, miterLimit);
    return ClipperPaths_to_MultiPoints<Polygons>(output);
}

ExPolygons
offset_ex(const Polygons &polygons, const float delta,
    double scale, ClipperLib::JoinType joinType, double miterLimit)
{
    ClipperLib::Paths output = _offset(polygons, delta, scale, joinType, miterLimit);
    return ClipperPaths_to_ExPolygons(output);
}

ExPolygons
offset_ex(const ExPolygons &expolygons, const float delta,
    double scale, ClipperLib::JoinType joinType, double miterLimit)
{
    return offset_ex(to_polygons(expolygons), delta, scale, joinType, miterLimit);
}

ClipperLib::Paths
_offset2(const Polygons &polygons, const float delta1, const float delta2,
    const double scale, const ClipperLib::JoinType joinType, const double miterLimit)
{
    ClipperLib::Paths input = MultiPoints_to_ClipperPaths(polygons);
    scaleClipperPolygons(input, scale);
    
    ClipperLib::ClipperOffset co;
    if (joinType == jtRound) {
        co.ArcTolerance = miterLimit;
    } else {
        co.MiterLimit = miterLimit;
    }
    
    // perform first offset
    ClipperLib::Paths output1;
    co.AddPaths(input, joinType, ClipperLib::etClosedPolygon);
    co.Execute(output1, (delta1*scale));
    
    // perform second offset
    co.Clear();
    co.AddPaths(output1, joinType, ClipperLib::etClosedPolygon);
    ClipperLib::Paths retval;
    co.Execute(retval, (delta2*scale));
    
    scaleClipperPolygons(retval, 1/scale);
    return retval;
}

ExPolygons
offset2_ex(const Polygons &polygons, const float delta1, const float delta2,
    const double scale, const ClipperLib::JoinType joinType, const double miterLimit)
{
    ClipperLib::Paths output = _offset2(polygons, delta1, delta2, scale, joinType, miterLimit);
    return ClipperPaths_to_ExPolygons(output);
}

template <class T>
T
_clipper_do(const ClipperLib::ClipType clipType, const Polygons &subject, 
    const Polygons &clip, const ClipperLib::PolyFillType fillType, const bool safety_offset_)
{
    ClipperLib::Paths input_subject = MultiPoints_to_ClipperPaths(subject);
    ClipperLib::Paths input_clip    = MultiPoints_to_ClipperPaths(clip);
    
    if (safety_offset_) {
        if (clipType == ClipperLib::ctUnion) {
            safety_offset(&input_subject);
        } else {
            safety_offset(&input_clip);
        }
    }
    
    ClipperLib::Clipper clipper;
    clipper.Clear();
    clipper.AddPaths(input_subject, ClipperLib::ptSubject, true);
    clipper.AddPaths(input_clip,    ClipperLib::ptClip,    true);
    
    T retval;
    clipper.Execute(clipType, retval, fillType, fillType);
    return retval;
}

ClipperLib::PolyTree
_clipper_do(const ClipperLib::ClipType clipType, const Polylines &subject, 
    const Polygons &clip, const ClipperLib::PolyFillType fillType,
    const bool safety_offset_)
{
    ClipperLib::Paths input_subject = MultiPoints_to_ClipperPaths(subject);
    ClipperLib::Paths input_clip    = MultiPoints_to_ClipperPaths(clip);
    
    if (safety_offset_) safety_offset(&input_clip);
    
    ClipperLib::Clipper clipper;
    clipper.Clear();
    clipper.AddPaths(input_subject, ClipperLib::ptSubject, false);
    clipper.AddPaths(input_clip,    ClipperLib::ptClip,    true);
    
    ClipperLib::PolyTree retval;
    clipper.Execute(clipType, retval, fillType, fillType);
    return retval;
}

Polygons
_clipper(ClipperLib::ClipType clipType, const Polygons &subject, 
    const Polygons &clip, bool safety_offset_)
{
    ClipperLib::Paths output = _clipper_do<ClipperLib::Paths>(clipType, subject, clip, ClipperLib::pftNonZero, safety_offset_);
    return ClipperPaths_to_MultiPoints<Polygons>(output);
}

ExPolygons
_clipper_ex(ClipperLib::ClipType clipType, const Polygons &subject, 
    const Polygons &clip, bool safety_offset_)
{
    ClipperLib::PolyTree polytree = _clipper_do<ClipperLib::PolyTree>(clipType, subject, clip, ClipperLib::pftNonZero, safety_offset_);
    return PolyTreeToExPolygons(polytree);
}

Polylines
_clipper_pl(ClipperLib::ClipType clipType, const Polylines &subject, 
    const Polygons &clip, bool safety_offset_)
{
    ClipperLib::PolyTree polytree = _clipper_do(clipType, subject, clip, ClipperLib::pftNonZero, safety_offset_);
    
    ClipperLib::Paths output;
    ClipperLib::PolyTreeToPaths(polytree, output);
    return ClipperPaths_to_MultiPoints<Polylines>(output);
}

Polylines
_clipper_pl(ClipperLib::ClipType clipType, const Polygons &subject, 
    const Polygons &clip, bool safety_offset_)
{
    // transform input polygons into polylines
    Polylines polylines;
    polylines.reserve(subject.size());
    for (Polygons::const_iterator polygon = subject.begin(); polygon != subject.end(); ++polygon)
        polylines.push_back(*polygon);  // implicit call to split_at_first_point()
    
    Polylines retval = _clipper_pl(clipType, polylines, clip, safety_offset_);
    
    /* If the split_at_first_point() call above happens to split the polygon inside the clipping area
       we would get two consecutive polylines instead of a single one, so we go through them in order
       to recombine continuous polylines. */
    for (size_t i = 0; i < retval.size(); ++i) {
        for (size_t j = i+1; j < retval.size(); ++j) {
            if (retval[i].points.back().coincides_with(retval[j].points.front())) {
                retval[i].points.insert(retval[i].points.end(), retval[j].points.begin()+1, retval[j].points.end());
                retval.erase(retval.begin() + j);
                --j;
            } else if (retval[i].points.front().coincides_with(retval[j].points.back())) {
                retval[i].points.insert(retval[i].points.begin(), retval[j].points.begin(), retval[j].points.end()-1);
                retval.erase(retval.begin() + j);
                --j;
            } else if (retval[i].points.front().coincides_with(retval[j].points.front())) {
                // Clipper does not preserve orientation of polylines
                retval[j].reverse();
                retval[i].points.insert(retval[i].points.begin(), retval[j].points.begin(), retval[j].points.end()-1);
                retval.erase(retval.begin() + j);
                --j;
            } else if (retval[i].points.back().coincides_with(retval[j].points.back())) {
                retval[j].reverse();
                retval[i].points.insert(retval[i].points.end(), retval[j].points.begin()+1, retval[j].points.end());
                retval.erase(retval.begin() + j);
                --j;
            }
        }
    }
    return retval;
}

Lines
_clipper_ln(ClipperLib::ClipType clipType, const Lines &subject, const Polygons &clip,
    bool safety_offset_)
{
    // convert Lines to Polylines
    Polylines polylines;
    polylines.reserve(subject.size());
    for (Lines::const_iterator line = subject.begin(); line != subject.end(); ++line)
        polylines.push_back(*line);
    
    polylines = _clipper_pl(clipType, polylines, clip, safety_offset_);
    
    // A two-point subject can only come back as two-point pieces; anything
    // else is a degenerate artifact and is dropped.
    Lines retval;
    retval.reserve(polylines.size());
    for (Polylines::const_iterator polyline = polylines.begin(); polyline != polylines.end(); ++polyline) {
        if (polyline->points.size() != 2) continue;
        if (polyline->points.front().coincides_with(polyline->points.back())) continue;
        retval.push_back(Line(polyline->points.front(), polyline->points.back()));
    }
    return retval;
}

Polygons
simplify_polygons(const Polygons &subject, bool preserve_collinear)
{
    ClipperLib::Paths input_subject = MultiPoints_to_ClipperPaths(subject);
    
    ClipperLib::Paths output;
    if (preserve_collinear) {
        ClipperLib::Clipper c;
        c.PreserveCollinear(true);
        c.StrictlySimple(true);
        c.AddPaths(input_subject, ClipperLib::ptSubject, true);
        c.Execute(ClipperLib::ctUnion, output, ClipperLib::pftNonZero, ClipperLib::pftNonZero);
    } else {
        ClipperLib::SimplifyPolygons(input_subject, output, ClipperLib::pftNonZero);
    }
    
    return ClipperPaths_to_MultiPoints<Polygons>(output);
}

ExPolygons
repair_polygons(const Polygons &subject)
{
    // Orientation is unreliable on broken input, so every ring is treated
    // as an outline and nesting is recovered from the even-odd rule.
    Polygons rings;
    rings.reserve(subject.size());
    for (Polygons::const_iterator p = subject.begin(); p != subject.end(); ++p) {
        Polygon ring = *p;
        ring.remove_duplicate_points();
        if (ring.points.size() >= 2 && ring.points.front().coincides_with(ring.points.back()))
            ring.points.pop_back();
        if (ring.is_valid()) rings.push_back(ring);
    }
    if (rings.empty()) return ExPolygons();
    
    ClipperLib::Paths input = MultiPoints_to_ClipperPaths(rings);
    ClipperLib::Clipper c;
    c.StrictlySimple(true);
    c.AddPaths(input, ClipperLib::ptSubject, true);
    ClipperLib::PolyTree polytree;
    c.Execute(ClipperLib::ctUnion, polytree, ClipperLib::pftEvenOdd, ClipperLib::pftEvenOdd);
    
    ExPolygons retval;
    for (ExPolygon &expolygon : PolyTreeToExPolygons(polytree)) {
        if (std::abs(expolygon.area()) > MIN_REGION_AREA / (SCALING_FACTOR * SCALING_FACTOR))
            retval.push_back(std::move(expolygon));
    }
    return retval;
}

void safety_offset(ClipperLib::Paths* paths)
{
    scaleClipperPolygons(*paths, CLIPPER_OFFSET_SCALE);
    
    // perform offset (delta = scale 1e-05)
    ClipperLib::ClipperOffset co;
    co.MiterLimit = 2;
    co.AddPaths(*paths, ClipperLib::jtMiter, ClipperLib::etClosedPolygon);
    co.Execute(*paths, 10.0 * CLIPPER_OFFSET_SCALE);
    
    scaleClipperPolygons(*paths, 1.0/CLIPPER_OFFSET_SCALE);
}

}
