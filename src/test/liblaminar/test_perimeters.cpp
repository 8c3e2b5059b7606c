#include <catch.hpp>

#include "PerimeterGenerator.hpp"
#include "test_data.hpp"

using namespace Laminar;

static double area_mm2(const ExPolygons &expolygons) {
    double a = 0;
    for (const ExPolygon &expp : expolygons)
        a += expp.area();
    return a * SCALING_FACTOR * SCALING_FACTOR;
}

SCENARIO("Perimeters: wall loops") {
    SliceConfig config = Test::config();
    config.line_width.value = 0.4;
    GIVEN("A 20mm square and three walls") {
        config.wall_count.value = 3;
        const ExPolygon square = Test::square(0, 0, 20);
        PerimeterLoops loops;
        ExPolygons inner;
        PerimeterGenerator g(&square, 0, config, &loops, &inner);
        WHEN("the loops are generated") {
            const PerimeterLoops made = g.make_loops();
            THEN("one contour per depth is made, outermost first") {
                REQUIRE(made.size() == 3);
                for (size_t i = 0; i < made.size(); ++i) {
                    REQUIRE(made[i].depth == i);
                    REQUIRE(made[i].is_contour);
                }
                REQUIRE(made[0].is_external());
                REQUIRE(made[1].polygon.area() * SCALING_FACTOR * SCALING_FACTOR == Approx(19.2 * 19.2).epsilon(0.001));
            }
        }
        WHEN("the island is processed with inner walls first") {
            config.outer_before_inner.value = false;
            PerimeterGenerator inner_first(&square, 0, config, &loops, &inner);
            inner_first.process();
            THEN("the loops run from the innermost to the external one") {
                REQUIRE(loops.size() == 3);
                REQUIRE(loops.front().depth == 2);
                REQUIRE(loops.back().depth == 0);
            }
            THEN("the inner area is the square shrunk by the wall thickness") {
                REQUIRE(inner.size() == 1);
                REQUIRE(area_mm2(inner) == Approx(17.6 * 17.6).epsilon(0.001));
            }
        }
        WHEN("the island is processed with the external wall first") {
            config.outer_before_inner.value = true;
            PerimeterGenerator outer_first(&square, 0, config, &loops, &inner);
            outer_first.process();
            THEN("the external loop comes first") {
                REQUIRE(loops.front().depth == 0);
                REQUIRE(loops.back().depth == 2);
            }
        }
    }
    GIVEN("A square with a hole and two walls") {
        config.wall_count.value = 2;
        ExPolygon ring = Test::square(0, 0, 20);
        Polygon hole = Test::square(5, 5, 10).contour;
        hole.make_clockwise();
        ring.holes.push_back(hole);
        PerimeterLoops loops;
        ExPolygons inner;
        PerimeterGenerator(&ring, 0, config, &loops, &inner).process();
        THEN("each depth has a contour loop and a hole loop") {
            REQUIRE(loops.size() == 4);
            size_t holes = 0;
            for (const PerimeterLoop &loop : loops)
                if (!loop.is_contour) ++holes;
            REQUIRE(holes == 2);
        }
        THEN("the inner area keeps its hole") {
            REQUIRE(inner.size() == 1);
            REQUIRE(inner.front().holes.size() == 1);
        }
    }
    GIVEN("A 1mm wide strip and five walls") {
        config.wall_count.value = 5;
        const ExPolygon strip = Test::square(0, 0, 1);
        PerimeterLoops loops;
        ExPolygons inner;
        PerimeterGenerator(&strip, 3, config, &loops, &inner).process();
        THEN("wall generation stops once the island is used up") {
            REQUIRE(loops.size() == 2);
            REQUIRE(inner.empty());
        }
    }
    GIVEN("No walls") {
        config.wall_count.value = 0;
        const ExPolygon square = Test::square(0, 0, 10);
        PerimeterLoops loops;
        ExPolygons inner;
        PerimeterGenerator(&square, 0, config, &loops, &inner).process();
        THEN("the whole island is left for infill") {
            REQUIRE(loops.empty());
            REQUIRE(area_mm2(inner) == Approx(100));
        }
    }
}

SCENARIO("Perimeters: seams") {
    SliceConfig config = Test::config();
    config.wall_count.value = 1;
    GIVEN("A pentagon with one sharp tip") {
        ExPolygon pentagon;
        pentagon.contour.points = Points {
            Point::new_scale(0, 0), Point::new_scale(20, 0), Point::new_scale(20, 10),
            Point::new_scale(10, 40), Point::new_scale(0, 10) };
        WHEN("the seam is placed on the sharpest corner") {
            config.seam_position.value = spSharpest;
            PerimeterLoops loops;
            ExPolygons inner;
            PerimeterGenerator(&pentagon, 0, config, &loops, &inner).process();
            THEN("the loop starts at the tip") {
                REQUIRE(loops.size() == 1);
                REQUIRE(loops.front().polygon.points.front().coincides_with(Point::new_scale(10, 40)));
            }
        }
    }
    GIVEN("A 20mm square") {
        const ExPolygon square = Test::square(0, 0, 20);
        WHEN("the seam is placed at the back") {
            config.seam_position.value = spBack;
            PerimeterLoops loops;
            ExPolygons inner;
            PerimeterGenerator(&square, 0, config, &loops, &inner).process();
            THEN("the loop starts on the back edge") {
                REQUIRE(loops.front().polygon.points.front().y == Point::new_scale(0, 20).y);
            }
        }
        WHEN("random seams are placed twice on the same layer") {
            config.seam_position.value = spRandom;
            PerimeterLoops first, second;
            ExPolygons inner;
            PerimeterGenerator(&square, 7, config, &first, &inner).process();
            PerimeterGenerator(&square, 7, config, &second, &inner).process();
            THEN("both runs choose the same start") {
                REQUIRE(first.front().polygon.points.front().coincides_with(
                    second.front().polygon.points.front()));
            }
        }
    }
}

SCENARIO("Perimeters: brim") {
    const ExPolygons islands { Test::square(0, 0, 20) };
    GIVEN("A 2mm brim of 0.4mm lines") {
        const Polygons brim = make_brim(islands, 2.0, 0.4);
        THEN("five loops are made, innermost first") {
            REQUIRE(brim.size() == 5);
            REQUIRE(brim.front().area() * SCALING_FACTOR * SCALING_FACTOR == Approx(20.8 * 20.8).epsilon(0.001));
            for (size_t i = 1; i < brim.size(); ++i)
                REQUIRE(brim[i].area() > brim[i-1].area());
        }
    }
    GIVEN("A brim narrower than half a line") {
        THEN("a single loop is still made") {
            REQUIRE(make_brim(islands, 0.1, 0.4).size() == 1);
        }
    }
    GIVEN("Nothing to surround") {
        THEN("no brim is made") {
            REQUIRE(make_brim(ExPolygons(), 2.0, 0.4).empty());
        }
    }
}
