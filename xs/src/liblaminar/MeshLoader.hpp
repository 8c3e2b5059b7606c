#ifndef laminar_MeshLoader_hpp_
#define laminar_MeshLoader_hpp_

#include "liblaminar.h"
#include <memory>
#include <string>
#include <vector>
#include "TriangleMesh.hpp"

namespace Laminar { namespace IO {

/// One way of reading a mesh file.
class MeshLoadStrategy
{
    public:
    virtual ~MeshLoadStrategy() {};
    virtual std::string name() const = 0;
    /// Whether this strategy handles the file, judged by its extension.
    virtual bool accepts(const std::string &input_file) const = 0;
    /// Read input_file into mesh. On failure returns false and sets error.
    virtual bool try_load(const std::string &input_file, TriangleMesh* mesh, std::string* error) const = 0;
};

/// ASCII and binary STL through admesh.
class STL : public MeshLoadStrategy
{
    public:
    std::string name() const { return "STL"; };
    bool accepts(const std::string &input_file) const;
    bool try_load(const std::string &input_file, TriangleMesh* mesh, std::string* error) const;
};

/// Wavefront OBJ through tinyobjloader; polygons are triangulated and all
/// shapes are merged into one mesh.
class OBJ : public MeshLoadStrategy
{
    public:
    std::string name() const { return "OBJ"; };
    bool accepts(const std::string &input_file) const;
    bool try_load(const std::string &input_file, TriangleMesh* mesh, std::string* error) const;
};

/// Case-insensitive extension check, ext given without the dot.
bool has_extension(const std::string &input_file, const std::string &ext);

/// Tries its strategies in order; the first one that reads a non-empty mesh wins.
class MeshLoader
{
    public:
    /// Starts with the built-in STL and OBJ strategies.
    MeshLoader();

    /// Put a strategy in front of the others.
    void prepend(std::shared_ptr<MeshLoadStrategy> strategy);

    const std::vector<std::shared_ptr<MeshLoadStrategy>>& strategies() const { return this->_strategies; };

    /// Load and repair a mesh. Throws MeshLoadException listing the cause
    /// of every strategy that failed.
    TriangleMesh load(const std::string &input_file) const;

    private:
    std::vector<std::shared_ptr<MeshLoadStrategy>> _strategies;
};

} }

#endif
