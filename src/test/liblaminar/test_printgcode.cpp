#include <catch.hpp>

#include "Exception.hpp"
#include "PrintGCode.hpp"
#include "test_data.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

using namespace Laminar;

// n layers of a 10mm square wall with two infill lines.
static SlicedLayers make_layers(size_t n, coordf_t first_layer_height = 0.3, coordf_t layer_height = 0.2)
{
    SlicedLayers layers;
    for (size_t i = 0; i < n; ++i) {
        SlicedLayer layer(i, first_layer_height + i * layer_height);
        layer.perimeters.push_back(PerimeterLoop(Test::square(0, 0, 10).contour, true, 0));
        layer.infill.push_back(Line(Point::new_scale(1, 2), Point::new_scale(9, 2)));
        layer.infill.push_back(Line(Point::new_scale(9, 8), Point::new_scale(1, 8)));
        layers.push_back(layer);
    }
    return layers;
}

// Value following " <axis>" on a G1 line, or def when absent.
static double axis_value(const std::string &line, char axis, double def)
{
    const std::string token = std::string(" ") + axis;
    const size_t pos = line.find(token);
    if (pos == std::string::npos) return def;
    return std::atof(line.c_str() + pos + 2);
}

static size_t count_substr(const std::string &gcode, const std::string &needle)
{
    size_t n = 0;
    for (size_t pos = gcode.find(needle); pos != std::string::npos; pos = gcode.find(needle, pos + 1))
        ++n;
    return n;
}

SCENARIO("PrintGCode: printer templates") {
    std::map<std::string, std::string> vars;
    vars["print_temp"] = "210";
    vars["bed_temp"]   = "60";
    THEN("placeholders are replaced by their values") {
        REQUIRE(PrintGCode::apply_template("M190 S{bed_temp}\nM109 S{print_temp}", vars)
            == "M190 S60\nM109 S210");
        REQUIRE(PrintGCode::apply_template("G28", vars) == "G28");
    }
    THEN("an unknown placeholder is an error") {
        REQUIRE_THROWS_AS(PrintGCode::apply_template("M109 S{hotend}", vars), EmissionException);
    }
    THEN("an unterminated placeholder is an error") {
        REQUIRE_THROWS_AS(PrintGCode::apply_template("M109 S{print_temp", vars), EmissionException);
    }
    GIVEN("A configuration") {
        SliceConfig config = Test::config();
        config.print_temp.value = 205;
        PrinterConfig printer = Test::printer();
        printer.nozzle_diameter.value = 0.6;
        const SlicedLayers no_layers;
        std::ostringstream out;
        PrintGCode gcode(no_layers, config, printer, out);
        THEN("the known placeholders come from it") {
            const std::map<std::string, std::string> known = gcode.template_vars();
            REQUIRE(known.at("print_temp") == "205");
            REQUIRE(known.at("nozzle_diameter") == "0.6");
            REQUIRE(known.count("first_layer_temp") == 1);
            REQUIRE(known.count("bed_temp") == 1);
            REQUIRE(known.count("filament_diameter") == 1);
            REQUIRE(known.count("layer_height") == 1);
        }
    }
}

SCENARIO("PrintGCode: program layout") {
    SliceConfig config = Test::config();
    PrinterConfig printer = Test::printer();
    printer.printer_name.value = "Test Printer";
    const SlicedLayers layers = make_layers(3);

    GIVEN("Default settings") {
        GCodeStats stats;
        const std::string gcode = export_gcode(layers, config, printer, &stats);
        const std::vector<std::string> lines = Test::lines(gcode);
        THEN("a header names the generator and the printer") {
            REQUIRE(lines[0].find("; generated by Laminar") == 0);
            REQUIRE(lines[1] == "; printer: Test Printer");
        }
        THEN("the start template runs before the first layer and the end template after the last") {
            const size_t start = gcode.find("G28");
            const size_t layer0 = gcode.find(";LAYER:0");
            const size_t end = gcode.find("M84");
            REQUIRE(start < layer0);
            REQUIRE(layer0 < end);
            REQUIRE(gcode.find(";LAYER:2") < end);
        }
        THEN("bed and hotend are heated and waited for before the first layer") {
            const size_t layer0 = gcode.find(";LAYER:0");
            REQUIRE(gcode.find("M190 S60") < layer0);
            REQUIRE(gcode.find("M109 S215") < layer0);
        }
        THEN("the hotend drops to the print temperature on the second layer") {
            const size_t m104 = gcode.find("M104 S210");
            REQUIRE(m104 > gcode.find(";LAYER:1"));
            REQUIRE(m104 < gcode.find(";LAYER:2"));
        }
        THEN("each layer gets a marker") {
            REQUIRE(Test::count_lines(gcode, ";LAYER:") == 3);
            REQUIRE(Test::count_lines(gcode, ";TYPE:WALL-OUTER") == 3);
            REQUIRE(Test::count_lines(gcode, ";TYPE:FILL") == 3);
        }
        THEN("the fan stays off until the kick-in layer") {
            const size_t layer2 = gcode.find(";LAYER:2");
            REQUIRE(gcode.find("M106") > layer2);
            REQUIRE(gcode.find("M107") < gcode.find(";LAYER:1"));
        }
        THEN("the totals are reported") {
            REQUIRE(stats.layers == 3);
            REQUIRE(stats.filament_used_mm > 0);
            REQUIRE(stats.extruded_volume > 0);
            REQUIRE(stats.moves > 0);
            REQUIRE(lines.back().find("; filament used = ") == 0);
        }
    }
    GIVEN("Retraction turned on and off") {
        config.retraction_enabled.value = true;
        const std::string with = export_gcode(layers, config, printer);
        config.retraction_enabled.value = false;
        const std::string without = export_gcode(layers, config, printer);
        THEN("long travels retract only when it is enabled") {
            REQUIRE(count_substr(with, "; retract\n") > 1);
            REQUIRE(count_substr(with, "; unretract\n") > 0);
            // the end of the program always retracts
            REQUIRE(count_substr(without, "; retract\n") == 1);
            REQUIRE(count_substr(without, "; unretract\n") == 0);
        }
    }
    GIVEN("Infill before walls") {
        config.sparse_before_walls.value = true;
        const std::string gcode = export_gcode(layers, config, printer);
        THEN("the fill marker comes first in each layer") {
            const size_t layer1 = gcode.find(";LAYER:1");
            REQUIRE(gcode.find(";TYPE:FILL", layer1) < gcode.find(";TYPE:WALL-OUTER", layer1));
        }
    }
    GIVEN("An empty start template") {
        printer.start_gcode.value = " \n";
        THEN("emission fails") {
            REQUIRE_THROWS_AS(export_gcode(layers, config, printer), EmissionException);
        }
    }
    GIVEN("An end template with an unknown placeholder") {
        printer.end_gcode.value = "M104 S{cooldown}";
        THEN("emission fails before anything is written") {
            std::ostringstream out;
            PrintGCode gcode(layers, config, printer, out);
            REQUIRE_THROWS_AS(gcode.output(), EmissionException);
            REQUIRE(out.str().empty());
        }
    }
}

SCENARIO("PrintGCode: feature speeds") {
    SliceConfig config = Test::config();
    PrinterConfig printer = Test::printer();
    const SlicedLayers no_layers;
    std::ostringstream out;
    PrintGCode gcode(no_layers, config, printer, out);

    THEN("the first layer runs at first_layer_speed whatever the role") {
        REQUIRE(gcode.role_speed(erExternalPerimeter, 0) == Approx(config.first_layer_speed.value));
        REQUIRE(gcode.role_speed(erInternalInfill, 0) == Approx(config.first_layer_speed.value));
    }
    THEN("later layers use the speed of each role") {
        REQUIRE(gcode.role_speed(erExternalPerimeter, 3) == Approx(config.outer_perimeter_speed.value));
        REQUIRE(gcode.role_speed(erPerimeter, 3) == Approx(config.print_speed.value));
        REQUIRE(gcode.role_speed(erInternalInfill, 3) == Approx(config.infill_speed.value));
        REQUIRE(gcode.role_speed(erSolidInfill, 3) == Approx(config.top_bottom_speed.value));
        REQUIRE(gcode.role_speed(erBridgeInfill, 3) == Approx(config.bridge_speed.value));
    }
    THEN("layer time is path length over speed") {
        SlicedLayer layer(3, 1.0);
        layer.perimeters.push_back(PerimeterLoop(Test::square(0, 0, 10).contour, true, 0));
        REQUIRE(gcode.layer_time(layer) == Approx(40 / config.outer_perimeter_speed.value));
    }
}

SCENARIO("PrintGCode: minimum layer time") {
    SliceConfig config = Test::config();
    PrinterConfig printer = Test::printer();
    const SlicedLayers layers = make_layers(3);

    GIVEN("Small layers with and without a minimum layer time") {
        config.min_layer_time.value = 0;
        const std::string fast = export_gcode(layers, config, printer);
        config.min_layer_time.value = 30;
        const std::string slow = export_gcode(layers, config, printer);
        THEN("extrusions are slowed down to fill the minimum time") {
            double fast_max = 0, slow_max = 0;
            for (const std::string &line : Test::lines(fast))
                if (line.find(" E") != std::string::npos && line.find(" X") != std::string::npos)
                    fast_max = std::max(fast_max, axis_value(line, 'F', 0));
            for (const std::string &line : Test::lines(slow))
                if (line.find(" E") != std::string::npos && line.find(" X") != std::string::npos)
                    slow_max = std::max(slow_max, axis_value(line, 'F', 0));
            REQUIRE(fast_max > 0);
            REQUIRE(slow_max > 0);
            REQUIRE(slow_max < fast_max);
        }
    }
}

SCENARIO("PrintGCode: bridges over support") {
    SliceConfig config = Test::config();
    config.bottom_layers.value = 1;
    PrinterConfig printer = Test::printer();
    SlicedLayers layers = make_layers(4);
    layers[2].support.push_back(Line(Point::new_scale(0, -5), Point::new_scale(10, -5)));
    layers[3].top_bottom.push_back(Line(Point::new_scale(1, 5), Point::new_scale(9, 5)));
    const std::string gcode = export_gcode(layers, config, printer);
    THEN("a skin resting on support is marked as a bridge") {
        REQUIRE(Test::count_lines(gcode, ";TYPE:SUPPORT") == 1);
        REQUIRE(gcode.find(";TYPE:BRIDGE") > gcode.find(";LAYER:3"));
        REQUIRE(gcode.find(";TYPE:SKIN") == std::string::npos);
    }
}

SCENARIO("PrintGCode: spiralize") {
    SliceConfig config = Test::config();
    config.spiralize_mode.value = true;
    config.bottom_layers.value = 1;
    config.retraction_z_hop.value = 0;
    PrinterConfig printer = Test::printer();
    const SlicedLayers layers = make_layers(5);
    const std::string gcode = export_gcode(layers, config, printer);

    THEN("Z never goes down once the spiral starts") {
        double last_z = -1;
        bool in_layers = false;
        for (const std::string &line : Test::lines(gcode)) {
            if (line.find(";LAYER:0") == 0) in_layers = true;
            if (!in_layers || line.compare(0, 3, "G1 ") != 0) continue;
            const double z = axis_value(line, 'Z', -1);
            if (z < 0) continue;
            REQUIRE(z >= last_z - 1e-6);
            last_z = z;
        }
        REQUIRE(last_z == Approx(layers.back().z).epsilon(0.001));
    }
    THEN("spiral layers only print the outer wall") {
        const size_t layer2 = gcode.find(";LAYER:2");
        const size_t layer3 = gcode.find(";LAYER:3");
        REQUIRE(gcode.find(";TYPE:FILL", layer2) > layer3);
        REQUIRE(gcode.find(";TYPE:WALL-OUTER", layer2) < layer3);
    }
    THEN("the bottom layers are printed normally") {
        REQUIRE(gcode.find(";TYPE:FILL") < gcode.find(";LAYER:1"));
    }
}

SCENARIO("PrintGCode: spiralize without solid bottom layers") {
    SliceConfig config = Test::config();
    config.spiralize_mode.value = true;
    config.bottom_layers.value = 0;
    config.retraction_z_hop.value = 0;
    PrinterConfig printer = Test::printer();
    SlicedLayers layers = make_layers(4);
    layers[0].brim.push_back(Test::square(-2, -2, 14).contour);
    const std::string gcode = export_gcode(layers, config, printer);
    const size_t layer0 = gcode.find(";LAYER:0");
    const size_t layer1 = gcode.find(";LAYER:1");

    THEN("the first layer is still printed flat at its own height") {
        bool seen_z = false;
        for (const std::string &line : Test::lines(gcode.substr(layer0, layer1 - layer0))) {
            if (line.compare(0, 3, "G1 ") != 0) continue;
            const double z = axis_value(line, 'Z', -1);
            if (z < 0) continue;
            REQUIRE(z == Approx(layers[0].z));
            seen_z = true;
        }
        REQUIRE(seen_z);
    }
    THEN("the first layer keeps its brim and infill") {
        REQUIRE(gcode.find(";TYPE:BRIM", layer0) < layer1);
        REQUIRE(gcode.find(";TYPE:FILL", layer0) < layer1);
    }
    THEN("the spiral starts on the second layer") {
        REQUIRE(gcode.find(";TYPE:FILL", layer1) == std::string::npos);
        double last_z = -1;
        for (const std::string &line : Test::lines(gcode.substr(layer1))) {
            if (line.compare(0, 3, "G1 ") != 0) continue;
            const double z = axis_value(line, 'Z', -1);
            if (z < 0) continue;
            REQUIRE(z > layers[0].z - 1e-6);
            REQUIRE(z >= last_z - 1e-6);
            last_z = z;
        }
    }
}
