#include "PrintGCode.hpp"
#include "Exception.hpp"
#include "Geometry.hpp"
#include "Log.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace Laminar {

PrintGCode::PrintGCode(const SlicedLayers &layers, const SliceConfig &config,
    const PrinterConfig &printer, std::ostream &_fh)
    : _layers(layers), config(config), printer(printer), fh(_fh),
      _writer(&config, &printer)
{ }

std::map<std::string, std::string>
PrintGCode::template_vars() const
{
    std::map<std::string, std::string> vars;
    vars["print_temp"]          = std::to_string(this->config.print_temp.value);
    vars["first_layer_temp"]    = std::to_string(this->config.print_temp_first_layer.value);
    vars["bed_temp"]            = std::to_string(this->config.bed_temp.value);
    vars["nozzle_diameter"]     = to_string_nozero(this->printer.nozzle_diameter.value, 3);
    vars["filament_diameter"]   = to_string_nozero(this->config.filament_diameter.value, 3);
    vars["layer_height"]        = to_string_nozero(this->config.layer_height.value, 3);
    return vars;
}

std::string
PrintGCode::apply_template(const std::string &tmpl, const std::map<std::string, std::string> &vars)
{
    std::string out;
    size_t pos = 0;
    while (true) {
        const size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        const size_t close = tmpl.find('}', open);
        if (close == std::string::npos)
            throw EmissionException("Unterminated placeholder in printer template");

        const std::string name = tmpl.substr(open + 1, close - open - 1);
        std::map<std::string, std::string>::const_iterator it = vars.find(name);
        if (it == vars.end())
            throw EmissionException("Unknown placeholder {" + name + "} in printer template");

        out.append(tmpl, pos, open - pos);
        out.append(it->second);
        pos = close + 1;
    }
    return out;
}

double
PrintGCode::role_speed(ExtrusionRole role, size_t layer_id) const
{
    if (layer_id == 0) return this->config.first_layer_speed.value;
    switch (role) {
    case erExternalPerimeter:   return this->config.outer_perimeter_speed.value;
    case erPerimeter:           return this->config.print_speed.value;
    case erSolidInfill:         return this->config.top_bottom_speed.value;
    case erBridgeInfill:        return this->config.bridge_speed.value;
    case erInternalInfill:      return this->config.infill_speed.value;
    case erSupportMaterial:     return this->config.infill_speed.value;
    case erSkirt:               return this->config.first_layer_speed.value;
    }
    return this->config.print_speed.value;
}

double
PrintGCode::_feedrate(ExtrusionRole role, size_t layer_id) const
{
    return this->_writer.feedrate(this->role_speed(role, layer_id) * this->_speed_factor);
}

double
PrintGCode::layer_time(const SlicedLayer &layer) const
{
    double time = 0;
    if (this->config.spiralize_mode.value && layer.id > 0 && int(layer.id) >= this->config.bottom_layers.value) {
        for (const PerimeterLoop &loop : layer.perimeters) {
            if (loop.is_external() && loop.is_contour) {
                time += unscale(loop.polygon.length()) / this->role_speed(erExternalPerimeter, layer.id);
                break;
            }
        }
        return time;
    }
    for (const PerimeterLoop &loop : layer.perimeters)
        time += unscale(loop.polygon.length())
            / this->role_speed(loop.is_external() ? erExternalPerimeter : erPerimeter, layer.id);
    time += layer.infill_length()     / this->role_speed(erInternalInfill, layer.id);
    time += layer.top_bottom_length() / this->role_speed(erSolidInfill, layer.id);
    time += layer.support_length()    / this->role_speed(erSupportMaterial, layer.id);
    time += layer.brim_length()       / this->role_speed(erSkirt, layer.id);
    return time;
}

void
PrintGCode::_print_first_layer_temperature(bool wait)
{
    fh << this->_writer.set_bed_temperature(this->config.bed_temp.value, wait);
    fh << this->_writer.set_temperature(this->config.print_temp_first_layer.value, wait);
}

std::string
PrintGCode::_set_role(ExtrusionRole role)
{
    if (this->_role_written && role == this->_last_role) return "";
    this->_role_written = true;
    this->_last_role = role;

    switch (role) {
    case erExternalPerimeter:   return ";TYPE:WALL-OUTER\n";
    case erPerimeter:           return ";TYPE:WALL-INNER\n";
    case erSolidInfill:         return ";TYPE:SKIN\n";
    case erBridgeInfill:        return ";TYPE:BRIDGE\n";
    case erInternalInfill:      return ";TYPE:FILL\n";
    case erSupportMaterial:     return ";TYPE:SUPPORT\n";
    case erSkirt:               return ";TYPE:BRIM\n";
    }
    return "";
}

std::string
PrintGCode::_travel_to(const Point &point)
{
    const Pointf target = Pointf::new_unscale(point);
    const Pointf3 pos = this->_writer.get_position();
    const double distance = target.distance_to(Pointf(pos.x, pos.y));
    if (distance < EPSILON) return "";

    std::string gcode;
    const bool retract = this->config.retraction_enabled.value
        && distance > this->config.retraction_min_distance.value;
    if (retract) {
        gcode += this->_writer.retract();
        gcode += this->_writer.lift();
    }
    gcode += this->_writer.travel_to_xy(target);
    if (retract) {
        gcode += this->_writer.unlift();
        gcode += this->_writer.unretract();
    }
    return gcode;
}

std::string
PrintGCode::_extrude_loop(const Polygon &loop, ExtrusionRole role, size_t layer_id)
{
    if (loop.points.size() < 2) return "";

    std::string gcode = this->_set_role(role);
    gcode += this->_travel_to(loop.points.front());

    const double e_per_mm = this->_writer.extruder.e_per_mm(this->config.line_width.value * this->_layer_height);
    const double F = this->_feedrate(role, layer_id);
    for (const Line &line : loop.lines())
        gcode += this->_writer.extrude_to_xy(Pointf::new_unscale(line.b), e_per_mm * unscale(line.length()), F);
    return gcode;
}

std::string
PrintGCode::_extrude_lines(const Lines &lines, ExtrusionRole role, size_t layer_id)
{
    if (lines.empty()) return "";

    std::string gcode = this->_set_role(role);
    const Pointf3 pos = this->_writer.get_position();
    const Lines chained = Geometry::chained_lines(lines, Point::new_scale(pos.x, pos.y));

    const double e_per_mm = this->_writer.extruder.e_per_mm(this->config.line_width.value * this->_layer_height);
    const double F = this->_feedrate(role, layer_id);
    for (const Line &line : chained) {
        gcode += this->_travel_to(line.a);
        gcode += this->_writer.extrude_to_xy(Pointf::new_unscale(line.b), e_per_mm * unscale(line.length()), F);
    }
    return gcode;
}

std::string
PrintGCode::_extrude_perimeters(const SlicedLayer &layer)
{
    std::string gcode;
    for (const PerimeterLoop &loop : layer.perimeters)
        gcode += this->_extrude_loop(loop.polygon,
            loop.is_external() ? erExternalPerimeter : erPerimeter, layer.id);
    return gcode;
}

std::string
PrintGCode::_spiral_layer(const SlicedLayer &layer)
{
    // the largest outer contour is the vase wall
    const PerimeterLoop* outer = nullptr;
    for (const PerimeterLoop &loop : layer.perimeters) {
        if (!loop.is_external() || !loop.is_contour) continue;
        if (outer == nullptr || std::abs(loop.polygon.area()) > std::abs(outer->polygon.area()))
            outer = &loop;
    }
    if (outer == nullptr || outer->polygon.points.size() < 3) return "";

    const Pointf3 pos = this->_writer.get_position();
    Polygon polygon = outer->polygon;
    polygon.make_first(polygon.closest_point_index(Point::new_scale(pos.x, pos.y)));

    std::string gcode = this->_set_role(erExternalPerimeter);
    // only the first spiral layer needs to get to the wall
    {
        const Pointf start = Pointf::new_unscale(polygon.points.front());
        if (start.distance_to(Pointf(pos.x, pos.y)) > this->config.line_width.value * 2)
            gcode += this->_travel_to(polygon.points.front());
    }

    const double z_start = this->_writer.get_position().z;
    const double rise = layer.z - z_start;
    const double total = polygon.length();
    const double e_per_mm = this->_writer.extruder.e_per_mm(this->config.line_width.value * this->_layer_height);
    const double F = this->_feedrate(erExternalPerimeter, layer.id);

    double done = 0;
    for (const Line &line : polygon.lines()) {
        done += line.length();
        const Pointf p = Pointf::new_unscale(line.b);
        gcode += this->_writer.extrude_to_xyz(Pointf3(p.x, p.y, z_start + rise * done / total),
            e_per_mm * unscale(line.length()), F);
    }
    return gcode;
}

void
PrintGCode::process_layer(size_t idx, const SlicedLayer &layer)
{
    const SliceConfig &config = this->config;
    std::string gcode;

    gcode += ";LAYER:" + std::to_string(idx) + "\n";
    this->_role_written = false;

    if (idx == 1)
        gcode += this->_writer.set_temperature(config.print_temp.value, false);

    gcode += this->_writer.set_fan((unsigned int)std::round(int(idx) < config.fan_kick_in_layer.value
        ? config.fan_first_layer.value : config.fan_speed.value));
    gcode += this->_writer.reset_e();

    this->_layer_height = idx == 0 ? config.first_layer_height.value : config.layer_height.value;

    this->_speed_factor = 1;
    const double time = this->layer_time(layer);
    if (config.min_layer_time.value > 0 && time > 0 && time < config.min_layer_time.value) {
        this->_speed_factor = time / config.min_layer_time.value;
        Log::debug("GCode") << "Layer " << idx << " takes " << time << "s, slowing down to "
            << (this->_speed_factor * 100) << "%." << std::endl;
    }

    // the first layer always goes down flat, whatever bottom_layers says
    const bool spiral = config.spiralize_mode.value && idx > 0 && int(idx) >= config.bottom_layers.value;
    if (spiral) {
        gcode += this->_spiral_layer(layer);
    } else {
        gcode += this->_writer.travel_to_z(layer.z);

        gcode += this->_extrude_lines(layer.support, erSupportMaterial, idx);
        for (const Polygon &loop : layer.brim)
            gcode += this->_extrude_loop(loop, erSkirt, idx);

        if (config.sparse_before_walls.value)
            gcode += this->_extrude_lines(layer.infill, erInternalInfill, idx);
        gcode += this->_extrude_perimeters(layer);
        if (!config.sparse_before_walls.value)
            gcode += this->_extrude_lines(layer.infill, erInternalInfill, idx);

        // skins resting on support interface are bridges
        const bool over_support = idx > 0 && idx - 1 < this->_layers.size()
            && !this->_layers[idx - 1].support.empty()
            && int(idx) >= config.bottom_layers.value;
        gcode += this->_extrude_lines(layer.top_bottom, over_support ? erBridgeInfill : erSolidInfill, idx);
    }

    fh << gcode;
    ++this->_stats.layers;
}

void
PrintGCode::output()
{
    const std::map<std::string, std::string> vars = this->template_vars();

    // check both templates before anything is written
    if (this->printer.start_gcode.value.find_first_not_of(" \t\r\n") == std::string::npos)
        throw EmissionException("Printer start template is empty");
    if (this->printer.end_gcode.value.find_first_not_of(" \t\r\n") == std::string::npos)
        throw EmissionException("Printer end template is empty");
    std::string start = apply_template(this->printer.start_gcode.value, vars);
    std::string end   = apply_template(this->printer.end_gcode.value, vars);
    if (start.back() != '\n') start += "\n";
    if (end.back() != '\n') end += "\n";

    fh << "; generated by Laminar " << LAMINAR_VERSION << "\n";
    fh << "; printer: " << this->printer.printer_name.value << "\n\n";

    fh << this->_writer.preamble();
    fh << start;
    this->_print_first_layer_temperature(true);
    fh << this->_writer.reset_e(true);

    for (size_t idx = 0; idx < this->_layers.size(); ++idx)
        this->process_layer(idx, this->_layers[idx]);

    fh << this->_writer.retract();
    fh << this->_writer.set_fan(0);
    fh << end;

    this->_stats.filament_used_mm = this->_writer.extruder.used_filament();
    this->_stats.extruded_volume  = this->_writer.extruder.extruded_volume();
    this->_stats.moves            = this->_writer.moves();

    fh << "\n";
    fh << "; filament used = " << to_string_nozero(this->_stats.filament_used_mm, 1) << "mm ("
       << to_string_nozero(this->_stats.extruded_volume / 1000, 1) << "cm3)\n";

    Log::info("GCode") << "Exported " << this->_stats.layers << " layers, "
        << this->_stats.moves << " moves." << std::endl;
}

std::string
export_gcode(const SlicedLayers &layers, const SliceConfig &config,
    const PrinterConfig &printer, GCodeStats* stats)
{
    std::ostringstream gcode;
    PrintGCode print_gcode(layers, config, printer, gcode);
    print_gcode.output();
    if (stats != nullptr)
        *stats = print_gcode.stats();
    return gcode.str();
}

}
