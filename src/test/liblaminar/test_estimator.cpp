#include <catch.hpp>

#include "PrintEstimator.hpp"
#include "PrintGCode.hpp"
#include "test_data.hpp"

using namespace Laminar;

SCENARIO("Print estimates") {
    SliceConfig config = Test::config();
    config.first_layer_speed.value  = 25;
    config.print_speed.value        = 60;
    config.infill_speed.value       = 80;
    config.line_width.value         = 0.4;
    config.layer_height.value       = 0.2;
    config.first_layer_height.value = 0.3;
    config.filament_diameter.value  = 1.75;

    GIVEN("No layers") {
        const SlicedLayers layers;
        THEN("only the heat-up allowance is counted") {
            REQUIRE(estimate_print_time(layers, config) == Approx(HEATUP_TIME));
            REQUIRE(estimate_filament(layers, config) == Approx(0));
            REQUIRE(estimate_filament_length(layers, config) == Approx(0));
        }
    }
    GIVEN("A first layer with a 10mm square wall and a second layer with 16mm of infill added") {
        SlicedLayers layers;
        layers.push_back(SlicedLayer(0, 0.3));
        layers.back().perimeters.push_back(PerimeterLoop(Test::square(0, 0, 10).contour, true, 0));
        layers.push_back(SlicedLayer(1, 0.5));
        layers.back().perimeters.push_back(PerimeterLoop(Test::square(0, 0, 10).contour, true, 0));
        layers.back().infill.push_back(Line(Point::new_scale(1, 2), Point::new_scale(9, 2)));
        layers.back().infill.push_back(Line(Point::new_scale(9, 8), Point::new_scale(1, 8)));

        THEN("the first layer is timed at first layer speed, the rest per feature") {
            REQUIRE(estimate_print_time(layers, config) == Approx(HEATUP_TIME + 40./25 + 40./60 + 16./80));
        }
        THEN("the mass follows from the extruded volume at PLA density") {
            const double volume = 40 * 0.4 * 0.3 + 56 * 0.4 * 0.2;
            REQUIRE(estimate_filament(layers, config) == Approx(volume * PLA_DENSITY));
            REQUIRE(estimate_filament_length(layers, config) == Approx(volume / (PI * 0.875 * 0.875)));
        }
        THEN("the filament length agrees with what the G-code extrudes") {
            config.retraction_extra_prime.value = 0;
            config.spiralize_mode.value = false;
            GCodeStats stats;
            export_gcode(layers, config, Test::printer(), &stats);
            REQUIRE(stats.filament_used_mm == Approx(estimate_filament_length(layers, config)));
        }
        THEN("the combined estimate matches the parts") {
            const PrintEstimate est = estimate(layers, config);
            REQUIRE(est.seconds == Approx(estimate_print_time(layers, config)));
            REQUIRE(est.grams == Approx(estimate_filament(layers, config)));
            REQUIRE(est.filament_mm == Approx(estimate_filament_length(layers, config)));
        }
    }
    GIVEN("The same layer counted once and twice") {
        SlicedLayers once;
        once.push_back(SlicedLayer(1, 0.5));
        once.back().infill.push_back(Line(Point::new_scale(0, 0), Point::new_scale(10, 0)));
        SlicedLayers twice = once;
        twice.push_back(once.front());
        THEN("the filament mass doubles") {
            REQUIRE(estimate_filament(twice, config) == Approx(2 * estimate_filament(once, config)));
        }
    }
    GIVEN("A first layer with and without a brim") {
        const SlicedLayers small = { SlicedLayer(0, 0.3) };
        SlicedLayers big = small;
        big.front().brim.push_back(Test::square(-2, -2, 24).contour);
        THEN("more path means more time and material") {
            REQUIRE(estimate_print_time(big, config) > estimate_print_time(small, config));
            REQUIRE(estimate_filament(big, config) > estimate_filament(small, config));
        }
    }
}

SCENARIO("Duration formatting") {
    THEN("hours, minutes and seconds are shown as needed") {
        REQUIRE(format_duration(3723) == "1h 02m 03s");
        REQUIRE(format_duration(245) == "4m 05s");
        REQUIRE(format_duration(7) == "7s");
        REQUIRE(format_duration(0) == "0s");
    }
    THEN("fractions are rounded and negative values read as zero") {
        REQUIRE(format_duration(59.6) == "1m 00s");
        REQUIRE(format_duration(-5) == "0s");
    }
}
