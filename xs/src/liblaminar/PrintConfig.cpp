#include "PrintConfig.hpp"
#include <boost/algorithm/string/case_conv.hpp>

namespace Laminar {

PrintConfigDef::PrintConfigDef()
{
    ConfigOptionDef* def;

    def = this->add("layer_height", coFloat);
    def->label = "Layer height";
    def->category = "Layers and Perimeters";
    def->tooltip = "Height of every layer above the first one.";
    def->sidetext = "mm";
    def->cli = "layer-height=f";
    def->min = 0.05;
    def->max = 0.5;
    def->default_value = new ConfigOptionFloat(0.2);

    def = this->add("first_layer_height", coFloat);
    def->label = "First layer height";
    def->category = "Layers and Perimeters";
    def->tooltip = "Height of the first layer, measured from the lowest point of the mesh.";
    def->sidetext = "mm";
    def->cli = "first-layer-height=f";
    def->min = 0.1;
    def->max = 0.8;
    def->default_value = new ConfigOptionFloat(0.3);

    def = this->add("line_width", coFloat);
    def->label = "Line width";
    def->category = "Extrusion Width";
    def->tooltip = "Width of every extruded line.";
    def->sidetext = "mm";
    def->cli = "line-width=f";
    def->min = 0.05;
    def->max = 5;
    def->default_value = new ConfigOptionFloat(0.4);

    def = this->add("line_width_pct", coPercent);
    def->label = "Line width (relative)";
    def->category = "Extrusion Width";
    def->tooltip = "Line width as a percentage of the nozzle diameter. The command line tool derives line_width from it when it is supplied.";
    def->sidetext = "%";
    def->cli = "line-width-pct=s";
    def->min = 80;
    def->max = 150;
    def->default_value = new ConfigOptionPercent(100);

    def = this->add("nozzle_diameter", coFloat);
    def->label = "Nozzle diameter";
    def->category = "Extruder";
    def->tooltip = "Diameter of the extruder nozzle.";
    def->sidetext = "mm";
    def->cli = "nozzle-diameter=f";
    def->min = 0.1;
    def->max = 2;
    def->default_value = new ConfigOptionFloat(0.4);

    def = this->add("filament_diameter", coFloat);
    def->label = "Filament diameter";
    def->category = "Filament";
    def->tooltip = "Diameter of the filament fed to the extruder.";
    def->sidetext = "mm";
    def->cli = "filament-diameter=f";
    def->min = 1;
    def->max = 3;
    def->default_value = new ConfigOptionFloat(1.75);

    def = this->add("wall_count", coInt);
    def->label = "Perimeters";
    def->category = "Layers and Perimeters";
    def->tooltip = "Number of wall loops generated around every region.";
    def->cli = "wall-count=i";
    def->min = 0;
    def->max = 10;
    def->default_value = new ConfigOptionInt(3);

    def = this->add("outer_before_inner", coBool);
    def->label = "Outer walls first";
    def->category = "Layers and Perimeters";
    def->tooltip = "Print the external wall before the inner ones.";
    def->cli = "outer-before-inner!";
    def->default_value = new ConfigOptionBool(false);

    def = this->add("seam_position", coEnum);
    def->label = "Seam position";
    def->category = "Layers and Perimeters";
    def->tooltip = "Where each wall loop starts.";
    def->cli = "seam-position=s";
    def->enum_keys_map = ConfigOptionEnum<SeamPosition>::get_enum_values();
    def->enum_values.push_back("back");
    def->enum_values.push_back("random");
    def->enum_values.push_back("sharpest");
    def->default_value = new ConfigOptionEnum<SeamPosition>(spBack);

    def = this->add("infill_density", coPercent);
    def->label = "Fill density";
    def->category = "Infill";
    def->tooltip = "Density of the sparse infill.";
    def->sidetext = "%";
    def->cli = "infill-density=s";
    def->min = 0;
    def->max = 100;
    def->default_value = new ConfigOptionPercent(20);

    def = this->add("infill_pattern", coEnum);
    def->label = "Fill pattern";
    def->category = "Infill";
    def->tooltip = "Pattern of the sparse infill.";
    def->cli = "infill-pattern=s";
    def->enum_keys_map = ConfigOptionEnum<InfillPattern>::get_enum_values();
    def->enum_values.push_back("grid");
    def->enum_values.push_back("lines");
    def->enum_values.push_back("honeycomb");
    def->default_value = new ConfigOptionEnum<InfillPattern>(ipGrid);

    def = this->add("infill_angle", coFloat);
    def->label = "Fill angle";
    def->category = "Infill";
    def->tooltip = "Base angle of the infill lines.";
    def->sidetext = "°";
    def->cli = "infill-angle=f";
    def->min = 0;
    def->max = 360;
    def->default_value = new ConfigOptionFloat(45);

    def = this->add("infill_overlap", coPercent);
    def->label = "Infill/perimeters overlap";
    def->category = "Infill";
    def->tooltip = "Overlap of the sparse infill with the innermost wall, in percent of the line width.";
    def->sidetext = "%";
    def->cli = "infill-overlap=s";
    def->min = 0;
    def->max = 50;
    def->default_value = new ConfigOptionPercent(10);

    def = this->add("sparse_before_walls", coBool);
    def->label = "Infill before perimeters";
    def->category = "Infill";
    def->tooltip = "Print the sparse infill of a layer before its walls.";
    def->cli = "sparse-before-walls!";
    def->default_value = new ConfigOptionBool(false);

    def = this->add("top_layers", coInt);
    def->label = "Top solid layers";
    def->category = "Layers and Perimeters";
    def->tooltip = "Number of solid layers at the top of the print.";
    def->cli = "top-layers=i";
    def->min = 0;
    def->max = 20;
    def->default_value = new ConfigOptionInt(4);

    def = this->add("bottom_layers", coInt);
    def->label = "Bottom solid layers";
    def->category = "Layers and Perimeters";
    def->tooltip = "Number of solid layers at the bottom of the print.";
    def->cli = "bottom-layers=i";
    def->min = 0;
    def->max = 20;
    def->default_value = new ConfigOptionInt(4);

    def = this->add("skin_overlap", coPercent);
    def->label = "Skin overlap";
    def->category = "Infill";
    def->tooltip = "Overlap of the solid fill with the innermost wall, in percent of the line width.";
    def->sidetext = "%";
    def->cli = "skin-overlap=s";
    def->min = 0;
    def->max = 50;
    def->default_value = new ConfigOptionPercent(5);

    def = this->add("brim_enabled", coBool);
    def->label = "Brim";
    def->category = "Skirt and brim";
    def->tooltip = "Print a brim around the first layer.";
    def->cli = "brim-enabled!";
    def->default_value = new ConfigOptionBool(false);

    def = this->add("brim_width", coFloat);
    def->label = "Brim width";
    def->category = "Skirt and brim";
    def->tooltip = "Width of the brim around the first layer.";
    def->sidetext = "mm";
    def->cli = "brim-width=f";
    def->min = 1;
    def->max = 30;
    def->default_value = new ConfigOptionFloat(8);

    def = this->add("retraction_enabled", coBool);
    def->label = "Retraction";
    def->category = "Retraction";
    def->tooltip = "Retract the filament on long travel moves.";
    def->cli = "retraction-enabled!";
    def->default_value = new ConfigOptionBool(true);

    def = this->add("retraction_distance", coFloat);
    def->label = "Retraction length";
    def->category = "Retraction";
    def->tooltip = "Length of filament pulled back before a travel move.";
    def->sidetext = "mm";
    def->cli = "retraction-distance=f";
    def->min = 0;
    def->max = 15;
    def->default_value = new ConfigOptionFloat(5);

    def = this->add("retraction_speed", coFloat);
    def->label = "Retraction speed";
    def->category = "Retraction";
    def->tooltip = "Speed of retraction and priming moves.";
    def->sidetext = "mm/s";
    def->cli = "retraction-speed=f";
    def->min = 1;
    def->max = 200;
    def->default_value = new ConfigOptionFloat(45);

    def = this->add("retraction_z_hop", coFloat);
    def->label = "Lift Z";
    def->category = "Retraction";
    def->tooltip = "Lift the nozzle by this amount while travelling retracted.";
    def->sidetext = "mm";
    def->cli = "retraction-z-hop=f";
    def->min = 0;
    def->max = 10;
    def->default_value = new ConfigOptionFloat(0);

    def = this->add("retraction_min_distance", coFloat);
    def->label = "Minimum travel after retraction";
    def->category = "Retraction";
    def->tooltip = "Travel moves shorter than this do not retract.";
    def->sidetext = "mm";
    def->cli = "retraction-min-distance=f";
    def->min = 0;
    def->max = 50;
    def->default_value = new ConfigOptionFloat(1.5);

    def = this->add("retraction_extra_prime", coFloat);
    def->label = "Extra length on restart";
    def->category = "Retraction";
    def->tooltip = "Filament pushed on top of the retracted length when priming again.";
    def->sidetext = "mm";
    def->cli = "retraction-extra-prime=f";
    def->min = 0;
    def->max = 5;
    def->default_value = new ConfigOptionFloat(0);

    def = this->add("print_speed", coFloat);
    def->label = "Perimeters";
    def->category = "Speed";
    def->tooltip = "Speed of inner walls.";
    def->sidetext = "mm/s";
    def->cli = "print-speed=f";
    def->min = 10;
    def->max = 300;
    def->default_value = new ConfigOptionFloat(60);

    def = this->add("outer_perimeter_speed", coFloat);
    def->label = "External perimeters";
    def->category = "Speed";
    def->tooltip = "Speed of the outermost wall.";
    def->sidetext = "mm/s";
    def->cli = "outer-perimeter-speed=f";
    def->min = 5;
    def->max = 300;
    def->default_value = new ConfigOptionFloat(40);

    def = this->add("top_bottom_speed", coFloat);
    def->label = "Solid infill";
    def->category = "Speed";
    def->tooltip = "Speed of top and bottom solid fill.";
    def->sidetext = "mm/s";
    def->cli = "top-bottom-speed=f";
    def->min = 5;
    def->max = 300;
    def->default_value = new ConfigOptionFloat(40);

    def = this->add("infill_speed", coFloat);
    def->label = "Infill";
    def->category = "Speed";
    def->tooltip = "Speed of sparse infill and support.";
    def->sidetext = "mm/s";
    def->cli = "infill-speed=f";
    def->min = 10;
    def->max = 500;
    def->default_value = new ConfigOptionFloat(80);

    def = this->add("bridge_speed", coFloat);
    def->label = "Bridges";
    def->category = "Speed";
    def->tooltip = "Speed of bridges.";
    def->sidetext = "mm/s";
    def->cli = "bridge-speed=f";
    def->min = 5;
    def->max = 300;
    def->default_value = new ConfigOptionFloat(25);

    def = this->add("first_layer_speed", coFloat);
    def->label = "First layer speed";
    def->category = "Speed";
    def->tooltip = "Speed of every extrusion on the first layer.";
    def->sidetext = "mm/s";
    def->cli = "first-layer-speed=f";
    def->min = 5;
    def->max = 100;
    def->default_value = new ConfigOptionFloat(25);

    def = this->add("travel_speed", coFloat);
    def->label = "Travel";
    def->category = "Speed";
    def->tooltip = "Speed of non extruding moves.";
    def->sidetext = "mm/s";
    def->cli = "travel-speed=f";
    def->min = 50;
    def->max = 500;
    def->default_value = new ConfigOptionFloat(200);

    def = this->add("print_temp", coInt);
    def->label = "Temperature";
    def->category = "Filament";
    def->tooltip = "Nozzle temperature after the first layer.";
    def->sidetext = "°C";
    def->cli = "print-temp=i";
    def->min = 150;
    def->max = 300;
    def->default_value = new ConfigOptionInt(210);

    def = this->add("print_temp_first_layer", coInt);
    def->label = "First layer temperature";
    def->category = "Filament";
    def->tooltip = "Nozzle temperature of the first layer.";
    def->sidetext = "°C";
    def->cli = "print-temp-first-layer=i";
    def->min = 150;
    def->max = 300;
    def->default_value = new ConfigOptionInt(215);

    def = this->add("bed_temp", coInt);
    def->label = "Bed temperature";
    def->category = "Filament";
    def->tooltip = "Bed temperature for the whole print.";
    def->sidetext = "°C";
    def->cli = "bed-temp=i";
    def->min = 0;
    def->max = 150;
    def->default_value = new ConfigOptionInt(60);

    def = this->add("fan_speed", coPercent);
    def->label = "Fan speed";
    def->category = "Cooling";
    def->tooltip = "Fan speed from fan_kick_in_layer upwards.";
    def->sidetext = "%";
    def->cli = "fan-speed=s";
    def->min = 0;
    def->max = 100;
    def->default_value = new ConfigOptionPercent(100);

    def = this->add("fan_first_layer", coPercent);
    def->label = "First layers fan speed";
    def->category = "Cooling";
    def->tooltip = "Fan speed below fan_kick_in_layer.";
    def->sidetext = "%";
    def->cli = "fan-first-layer=s";
    def->min = 0;
    def->max = 100;
    def->default_value = new ConfigOptionPercent(0);

    def = this->add("fan_kick_in_layer", coInt);
    def->label = "Fan kick-in layer";
    def->category = "Cooling";
    def->tooltip = "First layer index using fan_speed.";
    def->cli = "fan-kick-in-layer=i";
    def->min = 0;
    def->max = 100;
    def->default_value = new ConfigOptionInt(2);

    def = this->add("min_layer_time", coFloat);
    def->label = "Minimum layer time";
    def->category = "Cooling";
    def->tooltip = "Layers faster than this are slowed down uniformly.";
    def->sidetext = "s";
    def->cli = "min-layer-time=f";
    def->min = 0;
    def->max = 120;
    def->default_value = new ConfigOptionFloat(5);

    def = this->add("spiralize_mode", coBool);
    def->label = "Spiral vase";
    def->category = "Layers and Perimeters";
    def->tooltip = "Print the outer wall as one continuous helix above the solid bottom layers.";
    def->cli = "spiralize-mode!";
    def->default_value = new ConfigOptionBool(false);

    def = this->add("support_enabled", coBool);
    def->label = "Generate support material";
    def->category = "Support material";
    def->tooltip = "Generate support under overhanging faces.";
    def->cli = "support-enabled!";
    def->default_value = new ConfigOptionBool(false);

    def = this->add("support_threshold", coFloat);
    def->label = "Overhang threshold";
    def->category = "Support material";
    def->tooltip = "Overhang angle from the horizontal above which faces need support.";
    def->sidetext = "°";
    def->cli = "support-threshold=f";
    def->min = 20;
    def->max = 80;
    def->default_value = new ConfigOptionFloat(45);

    def = this->add("support_density", coPercent);
    def->label = "Support density";
    def->category = "Support material";
    def->tooltip = "Density of the support lines.";
    def->sidetext = "%";
    def->cli = "support-density=s";
    def->min = 5;
    def->max = 50;
    def->default_value = new ConfigOptionPercent(15);

    def = this->add("support_pattern", coEnum);
    def->label = "Pattern";
    def->category = "Support material";
    def->tooltip = "Pattern of the support lines.";
    def->cli = "support-pattern=s";
    def->enum_keys_map = ConfigOptionEnum<SupportPattern>::get_enum_values();
    def->enum_values.push_back("lines");
    def->enum_values.push_back("grid");
    def->enum_values.push_back("zigzag");
    def->default_value = new ConfigOptionEnum<SupportPattern>(supLines);

    def = this->add("support_interface_enabled", coBool);
    def->label = "Support interface";
    def->category = "Support material";
    def->tooltip = "Print dense interface layers on top of the support.";
    def->cli = "support-interface-enabled!";
    def->default_value = new ConfigOptionBool(true);

    def = this->add("support_interface_layers", coInt);
    def->label = "Interface layers";
    def->category = "Support material";
    def->tooltip = "Number of dense layers at the top of the support.";
    def->cli = "support-interface-layers=i";
    def->min = 0;
    def->max = 10;
    def->default_value = new ConfigOptionInt(2);

    def = this->add("support_z_distance", coFloat);
    def->label = "Contact Z distance";
    def->category = "Support material";
    def->tooltip = "Vertical gap between the support and the overhang.";
    def->sidetext = "mm";
    def->cli = "support-z-distance=f";
    def->min = 0;
    def->max = 5;
    def->default_value = new ConfigOptionFloat(0.2);

    def = this->add("support_xy_distance", coFloat);
    def->label = "XY separation";
    def->category = "Support material";
    def->tooltip = "Horizontal gap between the support and the part.";
    def->sidetext = "mm";
    def->cli = "support-xy-distance=f";
    def->min = 0;
    def->max = 5;
    def->default_value = new ConfigOptionFloat(0.7);

    def = this->add("printer_name", coString);
    def->label = "Printer name";
    def->category = "Printer";
    def->tooltip = "Name of the printer profile.";
    def->cli = "printer-name=s";
    def->default_value = new ConfigOptionString("Generic FDM");

    def = this->add("bed_size_x", coFloat);
    def->label = "Bed size X";
    def->category = "Printer";
    def->tooltip = "Width of the print bed.";
    def->sidetext = "mm";
    def->cli = "bed-size-x=f";
    def->min = 50;
    def->max = 2000;
    def->default_value = new ConfigOptionFloat(220);

    def = this->add("bed_size_y", coFloat);
    def->label = "Bed size Y";
    def->category = "Printer";
    def->tooltip = "Depth of the print bed.";
    def->sidetext = "mm";
    def->cli = "bed-size-y=f";
    def->min = 50;
    def->max = 2000;
    def->default_value = new ConfigOptionFloat(220);

    def = this->add("bed_size_z", coFloat);
    def->label = "Max print height";
    def->category = "Printer";
    def->tooltip = "Build height of the printer.";
    def->sidetext = "mm";
    def->cli = "bed-size-z=f";
    def->min = 50;
    def->max = 2000;
    def->default_value = new ConfigOptionFloat(250);

    def = this->add("bed_temp_max", coInt);
    def->label = "Maximum bed temperature";
    def->category = "Printer";
    def->tooltip = "Bed temperature requests above this are clamped.";
    def->sidetext = "°C";
    def->cli = "bed-temp-max=i";
    def->min = 0;
    def->max = 200;
    def->default_value = new ConfigOptionInt(100);

    def = this->add("max_speed", coFloat);
    def->label = "Maximum speed";
    def->category = "Printer";
    def->tooltip = "Ceiling for every feed rate, travel included.";
    def->sidetext = "mm/s";
    def->cli = "max-speed=f";
    def->min = 10;
    def->max = 1000;
    def->default_value = new ConfigOptionFloat(200);

    def = this->add("default_speed", coFloat);
    def->label = "Default speed";
    def->category = "Printer";
    def->tooltip = "Suggested print speed for this printer.";
    def->sidetext = "mm/s";
    def->cli = "default-speed=f";
    def->min = 1;
    def->max = 1000;
    def->default_value = new ConfigOptionFloat(60);

    def = this->add("default_layer_height", coFloat);
    def->label = "Default layer height";
    def->category = "Printer";
    def->tooltip = "Suggested layer height for this printer.";
    def->sidetext = "mm";
    def->cli = "default-layer-height=f";
    def->min = 0.05;
    def->max = 1;
    def->default_value = new ConfigOptionFloat(0.2);

    def = this->add("start_gcode", coString);
    def->label = "Start G-code";
    def->category = "Printer";
    def->tooltip = "Printed before the first layer. {print_temp}, {bed_temp}, {nozzle_diameter}, {first_layer_temp}, {filament_diameter} and {layer_height} are substituted.";
    def->cli = "start-gcode=s";
    def->default_value = new ConfigOptionString("G28\nG92 E0");

    def = this->add("end_gcode", coString);
    def->label = "End G-code";
    def->category = "Printer";
    def->tooltip = "Printed after the last layer, with the same placeholders as the start G-code.";
    def->cli = "end-gcode=s";
    def->default_value = new ConfigOptionString("M104 S0\nM140 S0\nM84");
}

const PrintConfigDef print_config_def;

CLIConfigDef::CLIConfigDef()
{
    ConfigOptionDef* def;
    
    def = this->add("help", coBool);
    def->label = "Help";
    def->tooltip = "Show this help.";
    def->cli = "help|h";
    def->default_value = new ConfigOptionBool(false);

    def = this->add("info", coBool);
    def->label = "Output mesh info";
    def->tooltip = "Write information about the mesh to the console and exit.";
    def->cli = "info";
    def->default_value = new ConfigOptionBool(false);

    def = this->add("load", coStrings);
    def->label = "Load config file";
    def->tooltip = "Load slice settings from the specified file. It can be used more than once; later files win.";
    def->cli = "load";

    def = this->add("printer", coString);
    def->label = "Load printer profile";
    def->tooltip = "Load the printer profile from the specified file.";
    def->cli = "printer";

    def = this->add("material", coString);
    def->label = "Material";
    def->tooltip = "Apply a built-in material preset (PLA).";
    def->cli = "material";

    def = this->add("save", coString);
    def->label = "Save config file";
    def->tooltip = "Save the merged slice settings to the specified file.";
    def->cli = "save";

    def = this->add("output", coString);
    def->label = "Output File";
    def->tooltip = "The file where the G-code will be written (if not specified, it will be based on the input file).";
    def->cli = "output|o";

    def = this->add("threads", coInt);
    def->label = "Threads";
    def->tooltip = "Number of worker threads used for slicing (0 uses every core).";
    def->cli = "threads|j";
    def->min = 0;
    def->max = 256;
    def->default_value = new ConfigOptionInt(0);

    def = this->add("verbose", coBool);
    def->label = "Verbose";
    def->tooltip = "Log informational and debugging messages.";
    def->cli = "verbose|v";
    def->default_value = new ConfigOptionBool(false);

    def = this->add("quiet", coBool);
    def->label = "Quiet";
    def->tooltip = "Only log errors.";
    def->cli = "quiet|q";
    def->default_value = new ConfigOptionBool(false);
}

const CLIConfigDef cli_config_def;

void
MaterialPreset::apply_to(SliceConfig &config) const
{
    config.print_temp.value             = this->print_temp;
    config.bed_temp.value               = this->bed_temp;
    config.fan_speed.value              = this->fan_speed;
    config.retraction_distance.value    = this->retraction_distance;
}

MaterialPreset
MaterialPreset::builtin(const std::string &name)
{
    const std::string key = boost::algorithm::to_upper_copy(name);
    if (key == "PLA")
        return MaterialPreset { "PLA", 210, 60, 100, 5.0 };
    throw UnknownOptionException(name);
}

}
