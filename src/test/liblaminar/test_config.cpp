#include <catch.hpp>

#include "ConfigBase.hpp"
#include "Exception.hpp"
#include "PrintConfig.hpp"
#include <test_options.hpp>

#include <boost/filesystem.hpp>
#include <string>

using namespace Laminar;

SCENARIO("Slice settings are validated against their declared ranges.") {
    GIVEN("A SliceConfig with default values") {
        SliceConfig config;
        THEN("the defaults are valid") {
            REQUIRE_NOTHROW(config.validate());
            REQUIRE(config.layer_height.value == Approx(0.2));
            REQUIRE(config.wall_count.value == 3);
            REQUIRE(config.infill_pattern.value == ipGrid);
            REQUIRE(config.seam_position.value == spBack);
            REQUIRE(config.support_pattern.value == supLines);
        }
        WHEN("layer_height is set to 0.9, above its maximum") {
            config.layer_height.value = 0.9;
            THEN("validate() names the key in an InvalidOptionException") {
                bool thrown {false};
                try {
                    config.validate();
                } catch (const InvalidOptionException& e) {
                    thrown = true;
                    REQUIRE(e.opt_key == "layer_height");
                }
                REQUIRE(thrown);
            }
        }
        WHEN("wall_count is set to -1") {
            config.wall_count.value = -1;
            THEN("validate() throws") {
                REQUIRE_THROWS_AS(config.validate(), InvalidOptionException);
            }
        }
        WHEN("infill_density is set to 150%") {
            config.set_deserialize("infill_density", "150%");
            THEN("validate() throws") {
                REQUIRE_THROWS_AS(config.validate(), InvalidOptionException);
            }
        }
    }
    GIVEN("A PrinterConfig with default values") {
        PrinterConfig printer;
        THEN("the defaults are valid and carry the stock templates") {
            REQUIRE_NOTHROW(printer.validate());
            REQUIRE(printer.start_gcode.value == "G28\nG92 E0");
            REQUIRE(printer.end_gcode.value == "M104 S0\nM140 S0\nM84");
        }
        WHEN("max_speed is set to 5 mm/s") {
            printer.max_speed.value = 5;
            THEN("validate() throws") {
                REQUIRE_THROWS_AS(printer.validate(), InvalidOptionException);
            }
        }
    }
}

SCENARIO("Config accessors and deserialization.") {
    GIVEN("A SliceConfig") {
        SliceConfig config;
        WHEN("an enum option is set from its name") {
            config.set_deserialize("infill_pattern", "honeycomb");
            THEN("the typed value follows") {
                REQUIRE(config.infill_pattern.value == ipHoneycomb);
                REQUIRE(config.serialize("infill_pattern") == "honeycomb");
            }
        }
        WHEN("an enum option is set to an unknown name") {
            THEN("set_deserialize_throw raises InvalidOptionException") {
                REQUIRE_THROWS_AS(config.set_deserialize_throw("seam_position", "front"), InvalidOptionException);
            }
        }
        WHEN("a key that is not a setting is set") {
            THEN("UnknownOptionException is thrown") {
                REQUIRE_THROWS_AS(config.set_deserialize("perimeters", "3"), UnknownOptionException);
            }
        }
        WHEN("a printer key is set on the slice settings") {
            THEN("UnknownOptionException is thrown") {
                REQUIRE_THROWS_AS(config.set_deserialize("start_gcode", "G28"), UnknownOptionException);
            }
        }
        WHEN("an int option is read as a string") {
            THEN("BadOptionTypeException is thrown") {
                REQUIRE_THROWS_AS(config.getString("wall_count"), BadOptionTypeException);
            }
        }
        WHEN("a percent option is set without its sign") {
            config.set_deserialize("fan_speed", "40");
            THEN("it is read as a percentage and written with one") {
                REQUIRE(config.fan_speed.value == Approx(40));
                REQUIRE(config.serialize("fan_speed") == "40%");
            }
        }
        WHEN("a boolean option is set from \"true\"") {
            config.set_deserialize("brim_enabled", "true");
            THEN("it is serialized as 1") {
                REQUIRE(config.brim_enabled.value);
                REQUIRE(config.serialize("brim_enabled") == "1");
            }
        }
    }
    GIVEN("A multi-line template") {
        PrinterConfig printer;
        printer.start_gcode.value = "G28\nG1 Z5 \"fast\"";
        WHEN("it is serialized and read back") {
            const std::string text = printer.serialize("start_gcode");
            PrinterConfig other;
            other.set_deserialize("start_gcode", text);
            THEN("new lines are escaped on one line and restored") {
                REQUIRE(text.find('\n') == std::string::npos);
                REQUIRE(other.start_gcode.value == printer.start_gcode.value);
            }
        }
    }
}

SCENARIO("Config files.") {
    GIVEN("An INI file with slice settings and an unknown key") {
        SliceConfig config;
        WHEN("it is loaded") {
            config.load(testfile("test_config/basic.ini"));
            THEN("the known keys are read and the unknown one skipped") {
                REQUIRE(config.layer_height.value == Approx(0.15));
                REQUIRE(config.wall_count.value == 2);
                REQUIRE(config.infill_pattern.value == ipHoneycomb);
                REQUIRE(config.infill_density.value == Approx(35));
                REQUIRE(config.seam_position.value == spSharpest);
                REQUIRE(config.spiralize_mode.value);
            }
            THEN("keys missing from the file keep their defaults") {
                REQUIRE(config.print_temp.value == 210);
            }
        }
    }
    GIVEN("A printer profile") {
        PrinterConfig printer;
        SliceConfig config;
        WHEN("it is loaded into both configs") {
            printer.load(testfile("test_config/printer.ini"));
            config.load(testfile("test_config/printer.ini"));
            THEN("the printer fields are read, templates unescaped") {
                REQUIRE(printer.printer_name.value == "Test Printer");
                REQUIRE(printer.bed_temp_max.value == 90);
                REQUIRE(printer.start_gcode.value == "G28\nG1 Z5 F3000\nM109 S{print_temp}");
            }
            THEN("the shared keys become slice defaults") {
                REQUIRE(config.nozzle_diameter.value == Approx(0.6));
                REQUIRE(config.filament_diameter.value == Approx(2.85));
            }
        }
    }
    GIVEN("An INI file with an out of range value") {
        SliceConfig config;
        config.load(testfile("test_config/out_of_range.ini"));
        THEN("loading succeeds and validation fails") {
            REQUIRE_THROWS_AS(config.validate(), InvalidOptionException);
        }
    }
    GIVEN("A missing file") {
        SliceConfig config;
        THEN("load throws") {
            REQUIRE_THROWS(config.load(testfile("test_config/missing.ini")));
        }
    }
    GIVEN("A config with every field changed") {
        SliceConfig config;
        config.layer_height.value = 0.12;
        config.infill_pattern.value = ipLines;
        config.support_pattern.value = supZigzag;
        config.fan_speed.value = 35;
        config.outer_before_inner.value = true;
        config.infill_angle.value = 30;
        config.travel_speed.value = 123.456789;
        config.support_z_distance.value = 1.0 / 3.0;
        config.infill_density.value = 33.3333333333;
        WHEN("it is saved and loaded into a fresh config") {
            const std::string file = (boost::filesystem::temp_directory_path()
                / boost::filesystem::unique_path("laminar-%%%%-%%%%.ini")).string();
            config.save(file);
            SliceConfig loaded;
            loaded.load(file);
            boost::filesystem::remove(file);
            THEN("every field round-trips") {
                REQUIRE(loaded.diff(config).empty());
                REQUIRE(loaded.equals(config));
                REQUIRE(loaded.travel_speed.value == config.travel_speed.value);
                REQUIRE(loaded.support_z_distance.value == config.support_z_distance.value);
            }
        }
    }
}

SCENARIO("Float options keep every digit.") {
    GIVEN("Values with more than six significant digits") {
        THEN("a float serializes and parses back to the same double") {
            for (double v : { 0.1234567, 123.456789, 1.0 / 3.0, 0.1, 1e-9, 2.0 / 7.0 * 1e5 }) {
                const ConfigOptionFloat opt(v);
                ConfigOptionFloat back;
                REQUIRE(back.deserialize(opt.serialize()));
                REQUIRE(back.value == v);
            }
        }
        THEN("a percent keeps its digits") {
            const ConfigOptionPercent opt(12.3456789);
            REQUIRE(opt.serialize() == "12.3456789%");
            ConfigOptionPercent back;
            REQUIRE(back.deserialize(opt.serialize()));
            REQUIRE(back.value == opt.value);
        }
        THEN("short decimals stay short") {
            REQUIRE(ConfigOptionFloat(0.2).serialize() == "0.2");
            REQUIRE(ConfigOptionFloat(60).serialize() == "60");
        }
    }
}

SCENARIO("Material presets.") {
    GIVEN("A SliceConfig with non-default material fields") {
        SliceConfig config;
        config.print_temp.value = 240;
        config.bed_temp.value = 100;
        config.fan_speed.value = 0;
        config.retraction_distance.value = 1;
        config.layer_height.value = 0.1;
        WHEN("the built-in PLA preset is applied, named in lower case") {
            MaterialPreset::builtin("pla").apply_to(config);
            THEN("exactly the four material fields change") {
                REQUIRE(config.print_temp.value == 210);
                REQUIRE(config.bed_temp.value == 60);
                REQUIRE(config.fan_speed.value == Approx(100));
                REQUIRE(config.retraction_distance.value == Approx(5.0));
                REQUIRE(config.layer_height.value == Approx(0.1));
            }
        }
        WHEN("an unknown material is requested") {
            THEN("UnknownOptionException is thrown") {
                REQUIRE_THROWS_AS(MaterialPreset::builtin("unobtainium"), UnknownOptionException);
            }
        }
    }
}

SCENARIO("Command line parsing.") {
    GIVEN("A DynamicConfig over the CLI and slice definitions") {
        ConfigDef def;
        def.merge(cli_config_def);
        def.merge(print_config_def);
        DynamicConfig config(&def);
        t_config_option_keys input_files;
        WHEN("options and a file are given") {
            const bool ok = config.read_cli(std::vector<std::string> {
                "--load", "a.ini", "--load", "b.ini", "--layer-height", "0.1",
                "--infill_pattern=lines", "-o", "out.gcode", "--no-retraction-enabled", "part.stl" },
                &input_files);
            THEN("they are all parsed") {
                REQUIRE(ok);
                REQUIRE(input_files == t_config_option_keys { "part.stl" });
                REQUIRE(config.getStrings("load") == std::vector<std::string> { "a.ini", "b.ini" });
                REQUIRE(config.getFloat("layer_height") == Approx(0.1));
                REQUIRE(config.serialize("infill_pattern") == "lines");
                REQUIRE(config.getString("output") == "out.gcode");
                REQUIRE_FALSE(config.getBool("retraction_enabled"));
            }
            AND_WHEN("the slice options are applied onto a SliceConfig") {
                SliceConfig slice;
                slice.apply(config, true);
                THEN("the typed fields follow and the CLI-only keys are ignored") {
                    REQUIRE(slice.layer_height.value == Approx(0.1));
                    REQUIRE(slice.infill_pattern.value == ipLines);
                    REQUIRE_FALSE(slice.retraction_enabled.value);
                }
            }
        }
        WHEN("an unknown option is given") {
            const bool ok = config.read_cli(std::vector<std::string> { "--shiny" }, &input_files);
            THEN("parsing fails") {
                REQUIRE_FALSE(ok);
            }
        }
        WHEN("an option misses its value") {
            const bool ok = config.read_cli(std::vector<std::string> { "--threads" }, &input_files);
            THEN("parsing fails") {
                REQUIRE_FALSE(ok);
            }
        }
    }
}
