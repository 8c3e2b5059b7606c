#include <catch.hpp>

#include "Layer.hpp"
#include "SupportMaterial.hpp"
#include "test_data.hpp"

using namespace Laminar;

static double area_mm2(const ExPolygons &expolygons) {
    double a = 0;
    for (const ExPolygon &expp : expolygons)
        a += expp.area();
    return a * SCALING_FACTOR * SCALING_FACTOR;
}

SCENARIO("Support: overhang test on facet normals") {
    THEN("a facet facing straight down overhangs") {
        REQUIRE(SupportMaterial::is_overhang(Pointf3(0, 0, -1), 45));
    }
    THEN("facets facing up or sideways do not") {
        REQUIRE_FALSE(SupportMaterial::is_overhang(Pointf3(0, 0, 1), 45));
        REQUIRE_FALSE(SupportMaterial::is_overhang(Pointf3(1, 0, 0), 45));
    }
    THEN("a 30 degree slope needs support only below a 30 degree threshold") {
        const Pointf3 slope(std::sqrt(0.75), 0, -0.5);
        REQUIRE_FALSE(SupportMaterial::is_overhang(slope, 45));
        REQUIRE(SupportMaterial::is_overhang(slope, 20));
    }
}

SCENARIO("Support: overhang detection") {
    SliceConfig config = Test::config();
    config.support_enabled.value = true;
    GIVEN("A cube resting on the bed") {
        SupportMaterial support(&config);
        support.detect_overhangs(Test::mesh(Test::TestMesh::cube_20x20x20));
        THEN("its bottom does not count as an overhang") {
            REQUIRE(support.overhangs_count() == 0);
            REQUIRE(support.top_z() == -1);
            REQUIRE(support.footprint().empty());
        }
    }
    GIVEN("A pyramid") {
        SupportMaterial support(&config);
        support.detect_overhangs(Test::mesh(Test::TestMesh::pyramid));
        THEN("nothing overhangs") {
            REQUIRE(support.overhangs_count() == 0);
        }
    }
    GIVEN("A T shape whose cap overhangs its stem") {
        SupportMaterial support(&config);
        support.detect_overhangs(Test::mesh(Test::TestMesh::overhang_t));
        THEN("the underside of the cap is found at Z = 10") {
            REQUIRE(support.overhangs_count() == 2);
            REQUIRE(support.top_z() == Approx(10));
        }
        THEN("the footprint is the cap grown by two line widths") {
            const double side = 20 + 4 * config.line_width.value;
            REQUIRE(area_mm2(support.footprint()) == Approx(side * side).epsilon(0.01));
        }
        THEN("the footprint below the contact gap covers the cap") {
            REQUIRE_FALSE(support.footprint(5).empty());
        }
        THEN("nothing is left within the contact gap under the cap") {
            REQUIRE(support.footprint(10 - config.support_z_distance.value / 2).empty());
        }
    }
}

SCENARIO("Support: generation") {
    SliceConfig config = Test::config();
    config.support_enabled.value = true;
    config.layer_height.value = 0.2;
    TriangleMesh t = Test::mesh(Test::TestMesh::overhang_t);

    std::vector<coordf_t> z;
    for (int i = 1; i <= 75; ++i) z.push_back(i * 0.2);
    const std::vector<ExPolygons> slices = t.slice(std::vector<double>(z.begin(), z.end()), 1);

    GIVEN("The T shape and its cross-sections") {
        SupportMaterial support(&config);
        support.detect_overhangs(t);
        const SupportLayers layers = support.generate(z, slices);
        THEN("support starts on the first layer") {
            REQUIRE(layers.count(0) == 1);
        }
        THEN("support stops below the contact gap") {
            for (const auto &layer : layers)
                REQUIRE(z[layer.first] < 10 - config.support_z_distance.value + EPSILON);
            REQUIRE(layers.count(60) == 0);
        }
        THEN("support keeps clear of the stem") {
            const ExPolygon stem = Test::square(4.5, 4.5, 11);
            for (const Line &l : layers.at(0))
                REQUIRE_FALSE(stem.contains(l.midpoint()));
        }
        THEN("the top support layer is a dense interface") {
            const size_t top = layers.rbegin()->first;
            REQUIRE(total_length(layers.at(top)) > 3 * total_length(layers.at(0)));
        }
    }
    GIVEN("Interface layers turned off") {
        config.support_interface_enabled.value = false;
        SupportMaterial support(&config);
        support.detect_overhangs(t);
        const SupportLayers layers = support.generate(z, slices);
        THEN("every support layer has the same sparse density") {
            const size_t top = layers.rbegin()->first;
            REQUIRE(total_length(layers.at(top)) == Approx(total_length(layers.at(0))).epsilon(0.05));
        }
    }
    GIVEN("No cross-sections to avoid") {
        SupportMaterial support(&config);
        support.detect_overhangs(t);
        const SupportLayers layers = support.generate(z, std::vector<ExPolygons>());
        THEN("support fills the whole footprint, stem included") {
            const ExPolygon stem = Test::square(6, 6, 8);
            bool crosses_stem = false;
            for (const Line &l : layers.at(0))
                if (stem.contains(l.midpoint())) crosses_stem = true;
            REQUIRE(crosses_stem);
        }
    }
    GIVEN("A mesh without overhangs") {
        SupportMaterial support(&config);
        support.detect_overhangs(Test::mesh(Test::TestMesh::cube_20x20x20));
        THEN("no support layers are generated") {
            REQUIRE(support.generate(z, slices).empty());
        }
    }
}

SCENARIO("Support: patterns") {
    SliceConfig config = Test::config();
    const ExPolygons area { Test::square(0, 0, 20) };
    GIVEN("Lines and zigzag support over the same area") {
        config.support_pattern.value = supLines;
        const Lines lines = SupportMaterial(&config).generate_layer(0, area, ExPolygons());
        config.support_pattern.value = supZigzag;
        const Lines zigzag = SupportMaterial(&config).generate_layer(0, area, ExPolygons());
        THEN("zigzag joins the lines with connectors") {
            REQUIRE_FALSE(lines.empty());
            REQUIRE(zigzag.size() > lines.size());
            REQUIRE(total_length(zigzag) > total_length(lines));
        }
    }
    GIVEN("Grid support") {
        config.support_pattern.value = supGrid;
        const Lines grid = SupportMaterial(&config).generate_layer(0, area, ExPolygons());
        config.support_pattern.value = supLines;
        const Lines lines = SupportMaterial(&config).generate_layer(0, area, ExPolygons());
        THEN("it lays two families of lines") {
            REQUIRE(total_length(grid) == Approx(2 * total_length(lines)).epsilon(0.1));
        }
    }
    GIVEN("An interface covering the whole area") {
        const Lines dense = SupportMaterial(&config).generate_layer(0, area, area);
        const Lines sparse = SupportMaterial(&config).generate_layer(0, area, ExPolygons());
        THEN("the interface is laid at the line width") {
            REQUIRE(total_length(dense) > 3 * total_length(sparse));
        }
    }
}

SCENARIO("Support: nothing to fill") {
    SliceConfig config = Test::config();
    const ExPolygons area { Test::square(0, 0, 20) };
    for (SupportPattern pattern : { supLines, supGrid, supZigzag }) {
        GIVEN("Support pattern " + ConfigOptionEnum<SupportPattern>(pattern).serialize()) {
            config.support_pattern.value = pattern;
            THEN("an empty area gives no segments, with or without interface") {
                const SupportMaterial support(&config);
                REQUIRE(support.generate_layer(0, ExPolygons(), ExPolygons()).empty());
                REQUIRE(support.generate_layer(4, ExPolygons(), ExPolygons()).empty());
            }
            THEN("a zero density gives no sparse segments") {
                config.support_density.value = 0;
                const SupportMaterial support(&config);
                REQUIRE(support.generate_layer(0, area, ExPolygons()).empty());
            }
        }
    }
}
