#include <catch.hpp>

#include "GCodeWriter.hpp"
#include "test_data.hpp"

using namespace Laminar;

SCENARIO("GCodeWriter: machine setup") {
    SliceConfig config = Test::config();
    PrinterConfig printer = Test::printer();
    GCodeWriter writer(&config, &printer);

    THEN("the preamble selects millimetres and absolute coordinates and resets E") {
        const std::string gcode = writer.preamble();
        REQUIRE(gcode.find("G21") == 0);
        REQUIRE(gcode.find("G90") != std::string::npos);
        REQUIRE(gcode.find("M82") != std::string::npos);
        REQUIRE(gcode.find("G92 E0") != std::string::npos);
    }
    THEN("hotend temperatures are set with or without waiting") {
        REQUIRE(writer.set_temperature(210).find("M104 S210") == 0);
        REQUIRE(writer.set_temperature(215, true).find("M109 S215") == 0);
    }
    WHEN("the bed is asked for more than the printer allows") {
        printer.bed_temp_max.value = 90;
        THEN("the request is clamped") {
            REQUIRE(writer.set_bed_temperature(120, true).find("M190 S90") == 0);
            REQUIRE(writer.set_bed_temperature(60).find("M140 S60") == 0);
        }
    }
}

SCENARIO("GCodeWriter: fan") {
    SliceConfig config = Test::config();
    PrinterConfig printer = Test::printer();
    GCodeWriter writer(&config, &printer);

    THEN("percentages map onto the 0-255 PWM range") {
        REQUIRE(writer.set_fan(100).find("M106 S255") == 0);
        REQUIRE(writer.set_fan(50).find("M106 S128") == 0);
    }
    THEN("zero switches the fan off") {
        REQUIRE(writer.set_fan(0).find("M107") == 0);
    }
    THEN("an unchanged speed writes nothing") {
        REQUIRE_FALSE(writer.set_fan(40).empty());
        REQUIRE(writer.set_fan(40).empty());
    }
}

SCENARIO("GCodeWriter: moves") {
    SliceConfig config = Test::config();
    PrinterConfig printer = Test::printer();
    GCodeWriter writer(&config, &printer);

    THEN("feed rates are in mm/min and capped by the printer") {
        printer.max_speed.value = 150;
        REQUIRE(writer.feedrate(50) == Approx(3000));
        REQUIRE(writer.feedrate(300) == Approx(9000));
    }
    WHEN("the head travels") {
        config.travel_speed.value = 100;
        const std::string gcode = writer.travel_to_xy(Pointf(10, 20.5));
        THEN("a G1 move without E is written at travel speed") {
            REQUIRE(gcode == "G1 X10 Y20.5 F6000\n");
            REQUIRE(writer.get_position().x == Approx(10));
            REQUIRE(writer.moves() == 1);
        }
    }
    WHEN("two extrusions use the same feed rate") {
        const std::string first  = writer.extrude_to_xy(Pointf(1, 0), 0.5, 1800);
        const std::string second = writer.extrude_to_xy(Pointf(2, 0), 0.25, 1800);
        THEN("E is absolute and F is only written once") {
            REQUIRE(first == "G1 X1 Y0 E0.5 F1800\n");
            REQUIRE(second == "G1 X2 Y0 E0.75\n");
        }
    }
    WHEN("E is reset") {
        (void)writer.extrude_to_xy(Pointf(1, 0), 2, 1800);
        THEN("G92 E0 is written once") {
            REQUIRE(writer.reset_e() == "G92 E0 ; reset extrusion distance\n");
            REQUIRE(writer.reset_e().empty());
            REQUIRE(writer.extruder.used_filament() == Approx(2));
        }
    }
}

SCENARIO("GCodeWriter: retraction") {
    SliceConfig config = Test::config();
    config.retraction_distance.value = 5;
    config.retraction_speed.value = 45;
    PrinterConfig printer = Test::printer();
    GCodeWriter writer(&config, &printer);
    (void)writer.extrude_to_xy(Pointf(10, 0), 10, 1800);

    WHEN("the filament is retracted") {
        const std::string gcode = writer.retract();
        THEN("E goes back by the retraction distance") {
            REQUIRE(gcode == "G1 E5 F2700 ; retract\n");
        }
        THEN("a second retraction is a no-op") {
            REQUIRE(writer.retract().empty());
        }
        THEN("unretracting primes it back") {
            REQUIRE(writer.unretract() == "G1 E10 F2700 ; unretract\n");
            REQUIRE(writer.unretract().empty());
        }
    }
    WHEN("an extra prime is configured") {
        config.retraction_extra_prime.value = 0.5;
        (void)writer.retract();
        THEN("the unretraction pushes the extra length") {
            REQUIRE(writer.unretract() == "G1 E10.5 F2700 ; unretract\n");
        }
    }
    WHEN("retraction is followed by a Z hop") {
        config.retraction_z_hop.value = 0.4;
        (void)writer.travel_to_z(1.0);
        const std::string lift = writer.lift();
        THEN("the head lifts once and comes back down") {
            REQUIRE(lift.find("G1 Z1.4") == 0);
            REQUIRE(writer.is_lifted());
            REQUIRE(writer.lift().empty());
            REQUIRE(writer.unlift().find("G1 Z1 ") == 0);
            REQUIRE_FALSE(writer.is_lifted());
        }
        THEN("moving to the next layer within the lift absorbs it") {
            REQUIRE(writer.travel_to_z(1.2).empty());
            REQUIRE(writer.unlift().find("G1 Z1.2 ") == 0);
        }
    }
    WHEN("no Z hop is configured") {
        THEN("lift writes nothing") {
            REQUIRE(writer.lift().empty());
        }
    }
}
