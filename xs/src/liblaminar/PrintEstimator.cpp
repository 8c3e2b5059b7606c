#include "PrintEstimator.hpp"
#include <cmath>
#include <cstdio>

namespace Laminar {

static double
extruded_volume(const SlicedLayers &layers, const SliceConfig &config)
{
    double volume = 0;
    for (const SlicedLayer &layer : layers) {
        const double height = layer.id == 0 ? config.first_layer_height.value : config.layer_height.value;
        volume += layer.total_length() * config.line_width.value * height;
    }
    return volume;
}

double
estimate_print_time(const SlicedLayers &layers, const SliceConfig &config)
{
    double time = HEATUP_TIME;
    for (const SlicedLayer &layer : layers) {
        if (layer.id == 0) {
            time += layer.total_length() / config.first_layer_speed.value;
            continue;
        }
        time += layer.perimeters_length() / config.print_speed.value;
        time += (layer.infill_length() + layer.top_bottom_length() + layer.support_length())
            / config.infill_speed.value;
        time += layer.brim_length() / config.first_layer_speed.value;
    }
    return time;
}

double
estimate_filament(const SlicedLayers &layers, const SliceConfig &config)
{
    return extruded_volume(layers, config) * PLA_DENSITY;
}

double
estimate_filament_length(const SlicedLayers &layers, const SliceConfig &config)
{
    const double radius = config.filament_diameter.value / 2;
    return extruded_volume(layers, config) / (PI * radius * radius);
}

PrintEstimate
estimate(const SlicedLayers &layers, const SliceConfig &config)
{
    PrintEstimate est;
    est.seconds     = estimate_print_time(layers, config);
    est.grams       = estimate_filament(layers, config);
    est.filament_mm = estimate_filament_length(layers, config);
    return est;
}

std::string
format_duration(double seconds)
{
    const long total = seconds > 0 ? long(std::round(seconds)) : 0;
    const long h = total / 3600;
    const long m = (total % 3600) / 60;
    const long s = total % 60;

    char buf[64];
    if (h > 0) {
        sprintf(buf, "%ldh %02ldm %02lds", h, m, s);
    } else if (m > 0) {
        sprintf(buf, "%ldm %02lds", m, s);
    } else {
        sprintf(buf, "%lds", s);
    }
    return buf;
}

}
