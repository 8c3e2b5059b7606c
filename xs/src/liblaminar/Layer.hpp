#ifndef laminar_Layer_hpp_
#define laminar_Layer_hpp_

#include "liblaminar.h"
#include "Line.hpp"
#include "Polygon.hpp"

namespace Laminar {

// One closed wall loop.
class PerimeterLoop {
public:
    // Polygon of this loop, starting at its seam.
    Polygon polygon;
    // Is it a contour or a hole?
    // Contours are CCW oriented, holes are CW oriented.
    bool is_contour;
    // Depth in the wall stack. The external perimeter has depth = 0.
    unsigned short depth;

    PerimeterLoop(const Polygon &_polygon, bool _is_contour, unsigned short _depth)
        : polygon(_polygon), is_contour(_is_contour), depth(_depth)
        {};
    bool is_external() const { return this->depth == 0; }
};

typedef std::vector<PerimeterLoop> PerimeterLoops;

/// Toolpaths of one layer. Built once by the Slicer and read by the
/// G-code emitter and the estimators.
class SlicedLayer {
public:
    // Top of the layer in unscaled coordinates.
    coordf_t z;
    size_t id;
    // Wall loops in print order.
    PerimeterLoops perimeters;
    Lines infill;
    Lines top_bottom;
    Lines support;
    // Brim loops, innermost first. First layer only.
    Polygons brim;

    SlicedLayer() : z(0), id(0) {};
    SlicedLayer(size_t _id, coordf_t _z) : z(_z), id(_id) {};

    bool empty() const {
        return this->perimeters.empty() && this->infill.empty() && this->top_bottom.empty()
            && this->support.empty() && this->brim.empty();
    };

    // Path lengths in millimetres, closing edges of loops included.
    double perimeters_length() const;
    double infill_length() const;
    double top_bottom_length() const;
    double support_length() const;
    double brim_length() const;
    double total_length() const;
};

typedef std::vector<SlicedLayer> SlicedLayers;

/// Sum of unscaled segment lengths.
double total_length(const Lines &lines);

}

#endif
