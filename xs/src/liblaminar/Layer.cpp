#include "Layer.hpp"

namespace Laminar {

double
total_length(const Lines &lines)
{
    double len = 0;
    for (const Line &line : lines)
        len += line.length();
    return unscale(len);
}

double
SlicedLayer::perimeters_length() const
{
    double len = 0;
    for (const PerimeterLoop &loop : this->perimeters)
        len += loop.polygon.length();
    return unscale(len);
}

double
SlicedLayer::infill_length() const
{
    return Laminar::total_length(this->infill);
}

double
SlicedLayer::top_bottom_length() const
{
    return Laminar::total_length(this->top_bottom);
}

double
SlicedLayer::support_length() const
{
    return Laminar::total_length(this->support);
}

double
SlicedLayer::brim_length() const
{
    return unscale(Laminar::total_length(this->brim));
}

double
SlicedLayer::total_length() const
{
    return this->perimeters_length() + this->infill_length() + this->top_bottom_length()
        + this->support_length() + this->brim_length();
}

}
