#include <catch.hpp>

#include "Exception.hpp"
#include "MeshLoader.hpp"
#include "test_options.hpp"

using namespace Laminar;
using namespace Laminar::IO;

// Accepts one extension and hands back a fixed cube.
class CubeStrategy : public MeshLoadStrategy
{
    public:
    explicit CubeStrategy(const std::string &ext) : ext(ext) {};
    std::string name() const { return "Cube"; };
    bool accepts(const std::string &input_file) const { return has_extension(input_file, this->ext); };
    bool try_load(const std::string &, TriangleMesh* mesh, std::string*) const {
        *mesh = TriangleMesh::make_cube(5, 5, 5);
        return true;
    };
    private:
    std::string ext;
};

// Accepts every file and always fails.
class BrokenStrategy : public MeshLoadStrategy
{
    public:
    std::string name() const { return "Broken"; };
    bool accepts(const std::string &) const { return true; };
    bool try_load(const std::string &, TriangleMesh*, std::string* error) const {
        *error = "always fails";
        return false;
    };
};

SCENARIO("Mesh loading") {
    MeshLoader loader;
    GIVEN("An ASCII STL cube") {
        TriangleMesh mesh = loader.load(testfile("test_loader/cube.stl"));
        THEN("it is read, repaired and watertight") {
            REQUIRE(mesh.facets_count() == 12);
            REQUIRE(mesh.repaired);
            REQUIRE(mesh.is_manifold());
            REQUIRE(mesh.volume() == Approx(1000));
        }
    }
    GIVEN("An OBJ cube with quad faces") {
        TriangleMesh mesh = loader.load(testfile("test_loader/cube.obj"));
        THEN("the quads are triangulated") {
            REQUIRE(mesh.facets_count() == 12);
            REQUIRE(mesh.volume() == Approx(1000));
            REQUIRE(mesh.size().z == Approx(10));
        }
    }
    GIVEN("An OBJ box without a top") {
        TriangleMesh mesh = loader.load(testfile("test_loader/open_box.obj"));
        THEN("it is still loaded") {
            REQUIRE(mesh.facets_count() >= 10);
        }
    }
    GIVEN("A file that does not exist") {
        THEN("loading fails with the cause") {
            REQUIRE_THROWS_WITH(loader.load(testfile("test_loader/missing.stl")),
                Catch::Contains("file not found"));
        }
    }
    GIVEN("A file no strategy accepts") {
        THEN("loading fails as unsupported") {
            REQUIRE_THROWS_WITH(loader.load(testfile("test_loader/model.3mf")),
                Catch::Contains("unsupported file type"));
        }
    }
    GIVEN("An OBJ facet pointing past the vertex list") {
        THEN("the OBJ reader reports it") {
            REQUIRE_THROWS_WITH(loader.load(testfile("test_loader/bad_index.obj")),
                Catch::Contains("OBJ: facet refers to a missing vertex"));
        }
    }
    GIVEN("An OBJ file without faces") {
        THEN("loading fails for want of facets") {
            try {
                loader.load(testfile("test_loader/empty.obj"));
                FAIL("no exception thrown");
            } catch (MeshLoadException &e) {
                REQUIRE(e.causes.size() == 1);
                REQUIRE(e.causes.front() == "OBJ: no facets");
                REQUIRE(e.path == testfile("test_loader/empty.obj"));
            }
        }
    }
    GIVEN("A custom strategy put in front") {
        loader.prepend(std::make_shared<CubeStrategy>("3mf"));
        THEN("it handles the files it accepts") {
            REQUIRE(loader.strategies().size() == 3);
            REQUIRE(loader.strategies().front()->name() == "Cube");
            TriangleMesh mesh = loader.load(testfile("test_loader/model.3mf"));
            REQUIRE(mesh.volume() == Approx(125));
        }
        THEN("the built-in strategies still handle the rest") {
            REQUIRE(loader.load(testfile("test_loader/cube.stl")).facets_count() == 12);
        }
    }
    GIVEN("A failing strategy in front") {
        loader.prepend(std::make_shared<BrokenStrategy>());
        THEN("the next accepting strategy is tried") {
            REQUIRE(loader.load(testfile("test_loader/cube.stl")).facets_count() == 12);
        }
        THEN("every failure is listed when none succeeds") {
            try {
                loader.load(testfile("test_loader/bad_index.obj"));
                FAIL("no exception thrown");
            } catch (MeshLoadException &e) {
                REQUIRE(e.causes.size() == 2);
                REQUIRE(e.causes[0] == "Broken: always fails");
                REQUIRE(std::string(e.what()).find("Unable to load") == 0);
            }
        }
    }
}

SCENARIO("Extension matching") {
    THEN("extensions are compared without case") {
        REQUIRE(has_extension("part.STL", "stl"));
        REQUIRE(has_extension("dir.v2/part.obj", "obj"));
        REQUIRE_FALSE(has_extension("part.stl.bak", "stl"));
        REQUIRE_FALSE(has_extension("stl", "stl"));
    }
}
