#ifndef laminar_PrintConfig_hpp_
#define laminar_PrintConfig_hpp_

#include "ConfigBase.hpp"

#define OPT_PTR(KEY) if (opt_key == #KEY) return &this->KEY

namespace Laminar {

enum InfillPattern {
    ipGrid, ipLines, ipHoneycomb,
};

enum SeamPosition {
    spBack, spRandom, spSharpest,
};

enum SupportPattern {
    supLines, supGrid, supZigzag,
};

template<> inline t_config_enum_values ConfigOptionEnum<InfillPattern>::get_enum_values() {
    t_config_enum_values keys_map;
    keys_map["grid"]        = ipGrid;
    keys_map["lines"]       = ipLines;
    keys_map["honeycomb"]   = ipHoneycomb;
    return keys_map;
}

template<> inline t_config_enum_values ConfigOptionEnum<SeamPosition>::get_enum_values() {
    t_config_enum_values keys_map;
    keys_map["back"]        = spBack;
    keys_map["random"]      = spRandom;
    keys_map["sharpest"]    = spSharpest;
    return keys_map;
}

template<> inline t_config_enum_values ConfigOptionEnum<SupportPattern>::get_enum_values() {
    t_config_enum_values keys_map;
    keys_map["lines"]       = supLines;
    keys_map["grid"]        = supGrid;
    keys_map["zigzag"]      = supZigzag;
    return keys_map;
}

/// Definitions of every slice and printer setting.
class PrintConfigDef : public ConfigDef
{
    public:
    PrintConfigDef();
};

extern const PrintConfigDef print_config_def;

/// Options of the command line tool that are not slice settings.
class CLIConfigDef : public ConfigDef
{
    public:
    CLIConfigDef();
};

extern const CLIConfigDef cli_config_def;

/// Settings of one slicing run. Read-only for the whole pipeline once validated.
class SliceConfig : public virtual StaticConfig
{
    public:
    ConfigOptionFloat                   layer_height;
    ConfigOptionFloat                   first_layer_height;
    ConfigOptionFloat                   line_width;
    ConfigOptionPercent                 line_width_pct;
    ConfigOptionFloat                   nozzle_diameter;
    ConfigOptionFloat                   filament_diameter;
    ConfigOptionInt                     wall_count;
    ConfigOptionBool                    outer_before_inner;
    ConfigOptionEnum<SeamPosition>      seam_position;
    ConfigOptionPercent                 infill_density;
    ConfigOptionEnum<InfillPattern>     infill_pattern;
    ConfigOptionFloat                   infill_angle;
    ConfigOptionPercent                 infill_overlap;
    ConfigOptionBool                    sparse_before_walls;
    ConfigOptionInt                     top_layers;
    ConfigOptionInt                     bottom_layers;
    ConfigOptionPercent                 skin_overlap;
    ConfigOptionBool                    brim_enabled;
    ConfigOptionFloat                   brim_width;
    ConfigOptionBool                    retraction_enabled;
    ConfigOptionFloat                   retraction_distance;
    ConfigOptionFloat                   retraction_speed;
    ConfigOptionFloat                   retraction_z_hop;
    ConfigOptionFloat                   retraction_min_distance;
    ConfigOptionFloat                   retraction_extra_prime;
    ConfigOptionFloat                   print_speed;
    ConfigOptionFloat                   outer_perimeter_speed;
    ConfigOptionFloat                   top_bottom_speed;
    ConfigOptionFloat                   infill_speed;
    ConfigOptionFloat                   bridge_speed;
    ConfigOptionFloat                   first_layer_speed;
    ConfigOptionFloat                   travel_speed;
    ConfigOptionInt                     print_temp;
    ConfigOptionInt                     print_temp_first_layer;
    ConfigOptionInt                     bed_temp;
    ConfigOptionPercent                 fan_speed;
    ConfigOptionPercent                 fan_first_layer;
    ConfigOptionInt                     fan_kick_in_layer;
    ConfigOptionFloat                   min_layer_time;
    ConfigOptionBool                    spiralize_mode;
    ConfigOptionBool                    support_enabled;
    ConfigOptionFloat                   support_threshold;
    ConfigOptionPercent                 support_density;
    ConfigOptionEnum<SupportPattern>    support_pattern;
    ConfigOptionBool                    support_interface_enabled;
    ConfigOptionInt                     support_interface_layers;
    ConfigOptionFloat                   support_z_distance;
    ConfigOptionFloat                   support_xy_distance;

    SliceConfig(bool initialize = true) : ConfigBase(&print_config_def) {
        if (initialize)
            this->set_defaults();
    }

    virtual ConfigOption* optptr(const t_config_option_key &opt_key, bool create = false) {
        OPT_PTR(layer_height);
        OPT_PTR(first_layer_height);
        OPT_PTR(line_width);
        OPT_PTR(line_width_pct);
        OPT_PTR(nozzle_diameter);
        OPT_PTR(filament_diameter);
        OPT_PTR(wall_count);
        OPT_PTR(outer_before_inner);
        OPT_PTR(seam_position);
        OPT_PTR(infill_density);
        OPT_PTR(infill_pattern);
        OPT_PTR(infill_angle);
        OPT_PTR(infill_overlap);
        OPT_PTR(sparse_before_walls);
        OPT_PTR(top_layers);
        OPT_PTR(bottom_layers);
        OPT_PTR(skin_overlap);
        OPT_PTR(brim_enabled);
        OPT_PTR(brim_width);
        OPT_PTR(retraction_enabled);
        OPT_PTR(retraction_distance);
        OPT_PTR(retraction_speed);
        OPT_PTR(retraction_z_hop);
        OPT_PTR(retraction_min_distance);
        OPT_PTR(retraction_extra_prime);
        OPT_PTR(print_speed);
        OPT_PTR(outer_perimeter_speed);
        OPT_PTR(top_bottom_speed);
        OPT_PTR(infill_speed);
        OPT_PTR(bridge_speed);
        OPT_PTR(first_layer_speed);
        OPT_PTR(travel_speed);
        OPT_PTR(print_temp);
        OPT_PTR(print_temp_first_layer);
        OPT_PTR(bed_temp);
        OPT_PTR(fan_speed);
        OPT_PTR(fan_first_layer);
        OPT_PTR(fan_kick_in_layer);
        OPT_PTR(min_layer_time);
        OPT_PTR(spiralize_mode);
        OPT_PTR(support_enabled);
        OPT_PTR(support_threshold);
        OPT_PTR(support_density);
        OPT_PTR(support_pattern);
        OPT_PTR(support_interface_enabled);
        OPT_PTR(support_interface_layers);
        OPT_PTR(support_z_distance);
        OPT_PTR(support_xy_distance);

        return NULL;
    };

    /// Absolute line width derived from the nozzle diameter and line_width_pct.
    double line_width_from_pct() const {
        return this->line_width_pct.get_abs_value(this->nozzle_diameter.value);
    };
};

/// Machine description consumed by the G-code emitter.
class PrinterConfig : public virtual StaticConfig
{
    public:
    ConfigOptionString                  printer_name;
    ConfigOptionFloat                   bed_size_x;
    ConfigOptionFloat                   bed_size_y;
    ConfigOptionFloat                   bed_size_z;
    ConfigOptionInt                     bed_temp_max;
    ConfigOptionFloat                   nozzle_diameter;
    ConfigOptionFloat                   filament_diameter;
    ConfigOptionFloat                   max_speed;
    ConfigOptionFloat                   default_speed;
    ConfigOptionFloat                   default_layer_height;
    ConfigOptionFloat                   retraction_distance;
    ConfigOptionFloat                   retraction_speed;
    ConfigOptionString                  start_gcode;
    ConfigOptionString                  end_gcode;

    PrinterConfig(bool initialize = true) : ConfigBase(&print_config_def) {
        if (initialize)
            this->set_defaults();
    }

    virtual ConfigOption* optptr(const t_config_option_key &opt_key, bool create = false) {
        OPT_PTR(printer_name);
        OPT_PTR(bed_size_x);
        OPT_PTR(bed_size_y);
        OPT_PTR(bed_size_z);
        OPT_PTR(bed_temp_max);
        OPT_PTR(nozzle_diameter);
        OPT_PTR(filament_diameter);
        OPT_PTR(max_speed);
        OPT_PTR(default_speed);
        OPT_PTR(default_layer_height);
        OPT_PTR(retraction_distance);
        OPT_PTR(retraction_speed);
        OPT_PTR(start_gcode);
        OPT_PTR(end_gcode);

        return NULL;
    };
};

/// Material overrides applied on top of a SliceConfig.
struct MaterialPreset
{
    std::string name;
    int         print_temp;
    int         bed_temp;
    double      fan_speed;
    double      retraction_distance;

    /// Overwrite exactly the four material fields of config.
    void apply_to(SliceConfig &config) const;

    /// Look up a built-in preset by (case-insensitive) name.
    /// Throws UnknownOptionException for an unknown material.
    static MaterialPreset builtin(const std::string &name);
};

}

#endif
