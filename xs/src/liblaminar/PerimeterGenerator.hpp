#ifndef laminar_PerimeterGenerator_hpp_
#define laminar_PerimeterGenerator_hpp_

#include "liblaminar.h"
#include <vector>
#include "ExPolygon.hpp"
#include "Layer.hpp"
#include "Polygon.hpp"
#include "PrintConfig.hpp"

namespace Laminar {

/// Builds the wall loops of one island and the area left inside them.
class PerimeterGenerator {
public:
    // Inputs:
    const ExPolygon* slice;
    size_t layer_id;
    int wall_count;
    coordf_t line_width;
    SeamPosition seam_position;
    bool outer_before_inner;
    // Outputs:
    PerimeterLoops* loops;
    ExPolygons* inner_area;

    PerimeterGenerator(
        // Input:
        const ExPolygon*    slice,
        size_t              layer_id,
        const SliceConfig&  config,
        // Output:
        // Wall loops in print order, seams placed
        PerimeterLoops*     loops,
        // Area available for infill
        ExPolygons*         inner_area)
        : slice(slice), layer_id(layer_id), wall_count(config.wall_count.value),
          line_width(config.line_width.value), seam_position(config.seam_position.value),
          outer_before_inner(config.outer_before_inner.value),
          loops(loops), inner_area(inner_area)
        {};

    void process();

    /// Walls only; loops are returned in generation order (outermost first)
    /// with their points as produced by the offset.
    PerimeterLoops make_loops() const;

    /// Offset of the whole island by the total wall thickness, in one step.
    ExPolygons make_inner_area() const;

    /// Rotate each loop so it starts at its seam vertex.
    void place_seams(PerimeterLoops* loops) const;

    /// Sort loops into print order. Holes and contours of the same depth keep
    /// their relative order.
    void order_loops(PerimeterLoops* loops) const;

private:
    // Point the "back" seams are pulled towards.
    Point _seam_anchor() const;
};

/// Brim loops around the first layer: loops = max(1, round(brim_width / line_width)),
/// loop k being the outline of all islands grown by k * line_width.
/// Returned innermost first.
Polygons make_brim(const ExPolygons &islands, coordf_t brim_width, coordf_t line_width);

}

#endif
