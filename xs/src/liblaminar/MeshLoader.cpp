#include "MeshLoader.hpp"
#include "Exception.hpp"
#include "Log.hpp"
#include <stdexcept>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include <boost/nowide/fstream.hpp>

#define TINYOBJLOADER_IMPLEMENTATION
#include <tiny_obj_loader.h>

namespace Laminar { namespace IO {

bool
has_extension(const std::string &input_file, const std::string &ext)
{
    const std::string actual = boost::filesystem::path(input_file).extension().string();
    return boost::iequals(actual, "." + ext);
}

bool
STL::accepts(const std::string &input_file) const
{
    return has_extension(input_file, "stl");
}

bool
STL::try_load(const std::string &input_file, TriangleMesh* mesh, std::string* error) const
{
    try {
        TriangleMesh tmp;
        tmp.ReadSTLFile(input_file);
        tmp.check_topology();
        *mesh = std::move(tmp);
    } catch (std::runtime_error &e) {
        *error = e.what();
        return false;
    }
    return true;
}

bool
OBJ::accepts(const std::string &input_file) const
{
    return has_extension(input_file, "obj");
}

bool
OBJ::try_load(const std::string &input_file, TriangleMesh* mesh, std::string* error) const
{
    tinyobj::attrib_t attrib;
    std::vector<tinyobj::shape_t> shapes;
    std::vector<tinyobj::material_t> materials;
    std::string err;
    boost::nowide::ifstream ifs(input_file);
    if (!ifs.good()) {
        *error = "cannot open file";
        return false;
    }
    const bool ret = tinyobj::LoadObj(&attrib, &shapes, &materials, &err, &ifs);

    if (!err.empty()) // `err` may contain warning message.
        Log::warn("Loader") << input_file << ": " << err << std::endl;

    if (!ret) {
        *error = err.empty() ? "malformed OBJ file" : err;
        return false;
    }

    Pointf3s points;
    for (size_t v = 0; v + 2 < attrib.vertices.size(); v += 3)
        points.push_back(Pointf3(attrib.vertices[v], attrib.vertices[v+1], attrib.vertices[v+2]));

    // all shapes index the same vertex array
    std::vector<Point3> facets;
    for (const tinyobj::shape_t &shape : shapes) {
        size_t index_offset = 0;
        for (size_t f = 0; f < shape.mesh.num_face_vertices.size(); ++f) {
            const size_t fv = shape.mesh.num_face_vertices[f];
            if (fv == 3) {
                const int a = shape.mesh.indices[index_offset+0].vertex_index;
                const int b = shape.mesh.indices[index_offset+1].vertex_index;
                const int c = shape.mesh.indices[index_offset+2].vertex_index;
                if (a < 0 || b < 0 || c < 0 || size_t(std::max(a, std::max(b, c))) >= points.size()) {
                    *error = "facet refers to a missing vertex";
                    return false;
                }
                facets.push_back(Point3(a, b, c));
            }
            index_offset += fv;
        }
    }

    if (facets.empty()) {
        *error = "no facets";
        return false;
    }

    TriangleMesh tmp(points, facets);
    tmp.check_topology();
    *mesh = std::move(tmp);
    return true;
}

MeshLoader::MeshLoader()
{
    this->_strategies.push_back(std::make_shared<STL>());
    this->_strategies.push_back(std::make_shared<OBJ>());
}

void
MeshLoader::prepend(std::shared_ptr<MeshLoadStrategy> strategy)
{
    this->_strategies.insert(this->_strategies.begin(), strategy);
}

TriangleMesh
MeshLoader::load(const std::string &input_file) const
{
    if (!boost::filesystem::exists(input_file))
        throw MeshLoadException(input_file, std::vector<std::string>(1, "file not found"));

    std::vector<std::string> causes;
    for (const std::shared_ptr<MeshLoadStrategy> &strategy : this->_strategies) {
        if (!strategy->accepts(input_file)) continue;

        TriangleMesh mesh;
        std::string error;
        if (!strategy->try_load(input_file, &mesh, &error)) {
            causes.push_back(strategy->name() + ": " + error);
            continue;
        }
        if (mesh.facets_count() == 0) {
            causes.push_back(strategy->name() + ": no facets");
            continue;
        }

        const bool watertight = mesh.is_manifold();
        mesh.repair();
        Log::info("Loader") << "Loaded " << input_file << " with " << strategy->name()
            << " (" << mesh.facets_count() << " facets)." << std::endl;
        if (!watertight)
            Log::warn("Loader") << input_file << " is not watertight, estimates may be off." << std::endl;
        return mesh;
    }

    if (causes.empty())
        causes.push_back("unsupported file type");
    throw MeshLoadException(input_file, causes);
}

} }
