#include "test_data.hpp"
#include <sstream>

namespace Laminar { namespace Test {

const char*
mesh_name(TestMesh m)
{
    switch (m) {
        case TestMesh::cube_20x20x20:   return "cube_20x20x20";
        case TestMesh::hollow_box:      return "hollow_box";
        case TestMesh::overhang_t:      return "overhang_t";
        case TestMesh::pyramid:         return "pyramid";
    }
    return "";
}

// Two triangles of the quad a b c d; its normal follows the right hand rule.
static void
add_quad(Point3s &facets, int a, int b, int c, int d)
{
    facets.push_back(Point3(a, b, c));
    facets.push_back(Point3(a, c, d));
}

// Closed box between (x0, y0, z0) and (x1, y1, z1), outward normals.
static void
add_box(Pointf3s &vertices, Point3s &facets,
    double x0, double y0, double z0, double x1, double y1, double z1)
{
    const int o = int(vertices.size());
    vertices.push_back(Pointf3(x0, y0, z0));
    vertices.push_back(Pointf3(x1, y0, z0));
    vertices.push_back(Pointf3(x1, y1, z0));
    vertices.push_back(Pointf3(x0, y1, z0));
    vertices.push_back(Pointf3(x0, y0, z1));
    vertices.push_back(Pointf3(x1, y0, z1));
    vertices.push_back(Pointf3(x1, y1, z1));
    vertices.push_back(Pointf3(x0, y1, z1));

    add_quad(facets, o+0, o+3, o+2, o+1);   // bottom
    add_quad(facets, o+4, o+5, o+6, o+7);   // top
    add_quad(facets, o+0, o+1, o+5, o+4);   // y = y0
    add_quad(facets, o+1, o+2, o+6, o+5);   // x = x1
    add_quad(facets, o+2, o+3, o+7, o+6);   // y = y1
    add_quad(facets, o+3, o+0, o+4, o+7);   // x = x0
}

static TriangleMesh
hollow_box()
{
    const double h = 10;
    Pointf3s vertices {
        // outer ring, bottom then top
        Pointf3(0, 0, 0),   Pointf3(20, 0, 0),  Pointf3(20, 20, 0), Pointf3(0, 20, 0),
        Pointf3(0, 0, h),   Pointf3(20, 0, h),  Pointf3(20, 20, h), Pointf3(0, 20, h),
        // inner ring, bottom then top
        Pointf3(5, 5, 0),   Pointf3(15, 5, 0),  Pointf3(15, 15, 0), Pointf3(5, 15, 0),
        Pointf3(5, 5, h),   Pointf3(15, 5, h),  Pointf3(15, 15, h), Pointf3(5, 15, h),
    };
    Point3s facets;
    for (int k = 0; k < 4; ++k) {
        const int n = (k + 1) % 4;
        add_quad(facets, k, n, 4 + n, 4 + k);               // outer wall
        add_quad(facets, 8 + n, 8 + k, 12 + k, 12 + n);     // inner wall, facing the hole
        add_quad(facets, 4 + k, 4 + n, 12 + n, 12 + k);     // top ring
        add_quad(facets, n, k, 8 + k, 8 + n);               // bottom ring
    }
    return TriangleMesh(vertices, facets);
}

static TriangleMesh
pyramid()
{
    Pointf3s vertices {
        Pointf3(0, 0, 0), Pointf3(20, 0, 0), Pointf3(20, 20, 0), Pointf3(0, 20, 0),
        Pointf3(10, 10, 10),
    };
    Point3s facets {
        Point3(0, 2, 1), Point3(0, 3, 2),
        Point3(0, 1, 4), Point3(1, 2, 4), Point3(2, 3, 4), Point3(3, 0, 4),
    };
    return TriangleMesh(vertices, facets);
}

TriangleMesh
mesh(TestMesh m)
{
    TriangleMesh result;
    switch (m) {
        case TestMesh::cube_20x20x20:
            result = TriangleMesh::make_cube(20, 20, 20);
            break;
        case TestMesh::hollow_box:
            result = hollow_box();
            break;
        case TestMesh::overhang_t: {
            Pointf3s vertices;
            Point3s facets;
            add_box(vertices, facets, 5, 5, 0, 15, 15, 10);
            add_box(vertices, facets, 0, 0, 10, 20, 20, 15);
            result = TriangleMesh(vertices, facets);
            break;
        }
        case TestMesh::pyramid:
            result = pyramid();
            break;
    }
    result.repair();
    return result;
}

TriangleMesh
mesh(TestMesh m, Pointf3 translate)
{
    TriangleMesh result = mesh(m);
    result.translate(translate);
    return result;
}

SliceConfig
config()
{
    SliceConfig config;
    config.wall_count.value         = 2;
    config.top_layers.value         = 2;
    config.bottom_layers.value      = 2;
    config.infill_density.value     = 20;
    config.min_layer_time.value     = 0;
    return config;
}

PrinterConfig
printer()
{
    return PrinterConfig();
}

ExPolygon
square(double x, double y, double size)
{
    Polygon contour;
    contour.points.push_back(Point::new_scale(x, y));
    contour.points.push_back(Point::new_scale(x + size, y));
    contour.points.push_back(Point::new_scale(x + size, y + size));
    contour.points.push_back(Point::new_scale(x, y + size));
    return ExPolygon(contour);
}

std::vector<std::string>
lines(const std::string &gcode)
{
    std::vector<std::string> result;
    std::istringstream in(gcode);
    std::string line;
    while (std::getline(in, line))
        result.push_back(line);
    return result;
}

size_t
count_lines(const std::string &gcode, const std::string &prefix)
{
    size_t n = 0;
    for (const std::string &line : lines(gcode))
        if (line.compare(0, prefix.size(), prefix) == 0) ++n;
    return n;
}

} } // namespace Laminar::Test
