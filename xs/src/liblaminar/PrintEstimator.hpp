#ifndef laminar_PrintEstimator_hpp_
#define laminar_PrintEstimator_hpp_

#include "liblaminar.h"
#include "Layer.hpp"
#include "PrintConfig.hpp"
#include <string>

namespace Laminar {

struct PrintEstimate {
    double seconds {0};
    double grams {0};
    double filament_mm {0};
};

/// Heat-up allowance plus path length over feature speed, layer by layer.
/// Travel and acceleration are not modelled.
double estimate_print_time(const SlicedLayers &layers, const SliceConfig &config);

/// Mass of the extruded material in grams at PLA density.
double estimate_filament(const SlicedLayers &layers, const SliceConfig &config);

/// Length of filament in mm fed for the extruded volume.
double estimate_filament_length(const SlicedLayers &layers, const SliceConfig &config);

PrintEstimate estimate(const SlicedLayers &layers, const SliceConfig &config);

/// "1h 02m 03s", "4m 05s" or "7s".
std::string format_duration(double seconds);

}

#endif
