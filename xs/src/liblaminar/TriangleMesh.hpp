#ifndef laminar_TriangleMesh_hpp_
#define laminar_TriangleMesh_hpp_

#include "liblaminar.h"
#include <admesh/stl.h>
#include <vector>
#include <boost/thread.hpp>
#include "BoundingBox.hpp"
#include "Line.hpp"
#include "Point.hpp"
#include "Polygon.hpp"
#include "ExPolygon.hpp"

namespace Laminar {

class TriangleMesh;
class TriangleMeshSlicer;

/// Interface to available statistics from the underlying mesh. 
struct mesh_stats {
    size_t number_of_facets {0};
    size_t number_of_parts {0};
    double volume {0};
    size_t degenerate_facets {0};
    size_t edges_fixed {0};
    size_t facets_removed {0};
    size_t facets_added {0};
    size_t facets_reversed {0};
    size_t backwards_edges {0};
    size_t normals_fixed {0};
};

/// Triangle mesh stored in an admesh stl_file. The slicing core only reads
/// it; loaders and the command line tool place and repair it.
class TriangleMesh
{
    public:
    TriangleMesh();

    /// Adapts containers that offer .data() and .size():
    /// a container of Pointf3 vertices and a container of Point3 facets
    /// holding vertex indices.
    template <typename Vertex_Cont, typename Facet_Cont>
    TriangleMesh(const Vertex_Cont& vertices, const Facet_Cont& facets) : TriangleMesh(vertices.data(), facets.data(), facets.size()) {}

    TriangleMesh(const TriangleMesh &other);
    TriangleMesh& operator= (const TriangleMesh& other);
    TriangleMesh& operator= (TriangleMesh&& other);
    TriangleMesh(TriangleMesh&& other);

    ~TriangleMesh();

    /// Read an ASCII or binary STL file. Throws std::runtime_error on failure.
    void ReadSTLFile(const std::string &input_file);
    void repair();
    void check_topology();
    float volume();
    /// True when every facet has three connected neighbours (watertight).
    bool is_manifold() const;

    void scale(float factor);
    void translate(float x, float y, float z);
    void translate(Pointf3 vec);
    /// Rotate around the Z axis; angle in radians.
    void rotate_z(float angle);
    void align_to_origin();
    void center_around_origin();
    /// Put the lowest point on Z = 0.
    void align_to_bed();
    /// Center in XY on a bed of the given size and drop onto it.
    void center_on_bed(double bed_x, double bed_y);

    /// Union of all facets projected on XY, in scaled coordinates.
    ExPolygons horizontal_projection() const;
    BoundingBoxf3 bounding_box() const;
    bool needed_repair() const;
    size_t facets_count() const;
    void require_shared_vertices();
    
    /// Return a copy of the vertex array defining this mesh.
    Pointf3s vertices();


    /// Return a copy of the per-facet normals.
    Pointf3s normals() const;

    /// Return the size of the mesh in coordinates.
    Pointf3 size() const;

    /// Return the center of the related bounding box.
    Pointf3 center() const;

    /// Slice this mesh at the provided Z levels; one ExPolygons per level.
    std::vector<ExPolygons> slice(const std::vector<double>& z, int threads = boost::thread::hardware_concurrency());

    /// Contains general statistics from underlying mesh structure.
    mesh_stats stats() const;

    /// Generate a mesh representing a cube with dimensions (x, y, z), with one corner at (0,0,0).
    static TriangleMesh make_cube(double x, double y, double z);
    
    stl_file stl;
    /// Whether or not this mesh has been repaired.
    bool repaired;
    
    private:

    /// Works on raw pointers without bounds checking; used by the
    /// container constructor.
    TriangleMesh(const Pointf3* points, const Point3* facets, size_t n_facets); 

    /// Perform the mechanics of a stl copy
    void clone(const TriangleMesh& other);

    friend class TriangleMeshSlicer;
};

enum FacetEdgeType { feNone, feTop, feBottom, feHorizontal };

class IntersectionPoint : public Point
{
    public:
    int point_id;
    int edge_id;
    IntersectionPoint() : point_id(-1), edge_id(-1) {};
};

class IntersectionLine : public Line
{
    public:
    int             a_id;
    int             b_id;
    int             edge_a_id;
    int             edge_b_id;
    FacetEdgeType   edge_type;
    bool            skip;
    IntersectionLine() : a_id(-1), b_id(-1), edge_a_id(-1), edge_b_id(-1), edge_type(feNone), skip(false) {};
};
typedef std::vector<IntersectionLine> IntersectionLines;
typedef std::vector<IntersectionLine*> IntersectionLinePtrs;

/// Cross-sections a mesh with horizontal planes.
/// Each plane is independent, so facets and layers are processed in parallel.
class TriangleMeshSlicer
{
    public:
    TriangleMesh* mesh;
    /// Throws std::runtime_error if the mesh has no facets.
    TriangleMeshSlicer(TriangleMesh* _mesh);
    ~TriangleMeshSlicer();
    void slice(const std::vector<float> &z, std::vector<Polygons>* layers) const;
    void slice(const std::vector<float> &z, std::vector<ExPolygons>* layers) const;
    void slice_facet(float slice_z, const stl_facet &facet, const int &facet_idx,
        const float &min_z, const float &max_z, std::vector<IntersectionLine>* lines,
        boost::mutex* lines_mutex = NULL) const;
    
    int threads;
    
    private:
    typedef std::vector< std::vector<int> > t_facets_edges;
    t_facets_edges facets_edges;
    stl_vertex* v_scaled_shared;
    void _slice_do(size_t facet_idx, std::vector<IntersectionLines>* lines, boost::mutex* lines_mutex, const std::vector<float> &z) const;
    void _make_loops_do(size_t i, std::vector<IntersectionLines>* lines, std::vector<Polygons>* layers) const;
    void make_loops(std::vector<IntersectionLine> &lines, Polygons* loops) const;
    void make_expolygons(const Polygons &loops, ExPolygons* slices) const;
};

}

#endif
