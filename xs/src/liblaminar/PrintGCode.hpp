#ifndef laminar_PrintGCode_hpp
#define laminar_PrintGCode_hpp

#include "liblaminar.h"
#include "GCodeWriter.hpp"
#include "Layer.hpp"
#include "PrintConfig.hpp"

#include <iostream>
#include <map>
#include <string>

namespace Laminar {

/// Kind of extrusion; selects the feed rate and the ;TYPE: marker.
enum ExtrusionRole {
    erPerimeter,
    erExternalPerimeter,
    erInternalInfill,
    erSolidInfill,
    erBridgeInfill,
    erSkirt,
    erSupportMaterial,
};

/// Totals of one export.
struct GCodeStats {
    double filament_used_mm {0};
    double extruded_volume {0};
    size_t moves {0};
    size_t layers {0};
};

/// Turns SlicedLayers into a G-code program.
class PrintGCode {
public:
    PrintGCode(const SlicedLayers &layers, const SliceConfig &config, const PrinterConfig &printer, std::ostream &_fh);

    /// Write the whole program: start template, heating, layers, end template.
    /// Throws EmissionException for an empty template or an unknown placeholder.
    void output();

    /// Write one layer. Layers must be passed in order.
    void process_layer(size_t idx, const SlicedLayer &layer);

    const GCodeStats& stats() const { return this->_stats; };

    /// Feed rate of a role in mm/s before the max_speed cap and any layer slowdown.
    double role_speed(ExtrusionRole role, size_t layer_id) const;

    /// Nominal printing time of a layer in seconds, travel excluded.
    double layer_time(const SlicedLayer &layer) const;

    /// Values of the placeholders known to the printer templates.
    std::map<std::string, std::string> template_vars() const;

    /// Replace every {name} in tmpl. Throws EmissionException for an unknown
    /// name or an unterminated brace.
    static std::string apply_template(const std::string &tmpl, const std::map<std::string, std::string> &vars);

private:
    const SlicedLayers &_layers;
    const SliceConfig &config;
    const PrinterConfig &printer;
    std::ostream &fh;

    GCodeWriter _writer;
    GCodeStats _stats;

    /// Min layer time slowdown of the current layer, 1 = none.
    double _speed_factor {1};
    /// Thickness of the current layer.
    double _layer_height {0};
    ExtrusionRole _last_role {erPerimeter};
    bool _role_written {false};

    void _print_first_layer_temperature(bool wait);
    std::string _set_role(ExtrusionRole role);
    std::string _travel_to(const Point &point);
    std::string _extrude_loop(const Polygon &loop, ExtrusionRole role, size_t layer_id);
    std::string _extrude_lines(const Lines &lines, ExtrusionRole role, size_t layer_id);
    std::string _extrude_perimeters(const SlicedLayer &layer);
    /// Vase mode: the outer contour climbs from the current Z to the layer's Z.
    std::string _spiral_layer(const SlicedLayer &layer);
    double _feedrate(ExtrusionRole role, size_t layer_id) const;
};

/// Export to a string.
std::string export_gcode(const SlicedLayers &layers, const SliceConfig &config,
    const PrinterConfig &printer, GCodeStats* stats = nullptr);

} // namespace Laminar

#endif // laminar_PrintGCode_hpp
