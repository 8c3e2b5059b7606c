#include "TriangleMesh.hpp"
#include "ClipperUtils.hpp"
#include "Log.hpp"
#include "Geometry.hpp"
#include <cmath>
#include <vector>
#include <map>
#include <utility>
#include <algorithm>
#include <math.h>
#include <stdexcept>
#include <boost/version.hpp>
#include <boost/config.hpp>
#include <boost/nowide/convert.hpp>
#if BOOST_VERSION >= 107300
#include <boost/bind/bind.hpp>
#else
#include <boost/bind.hpp>
#endif

namespace Laminar {

#if BOOST_VERSION >= 107300
using boost::placeholders::_1;
#endif

TriangleMesh::TriangleMesh()
    : repaired(false)
{
    stl_initialize(&this->stl);
}

TriangleMesh::TriangleMesh(const Pointf3* points, const Point3* facets, size_t n_facets) 
    : repaired(false)
{
    stl_initialize(&this->stl);
    stl_file &stl = this->stl;
    stl.error = 0;
    stl.stats.type = inmemory;

    // count facets and allocate memory
    stl.stats.number_of_facets = n_facets;
    stl.stats.original_num_facets = stl.stats.number_of_facets;
    stl_allocate(&stl);

    for (int i = 0; i < stl.stats.number_of_facets; i++) {
        stl_facet facet;
        facet.normal.x = 0;
        facet.normal.y = 0;
        facet.normal.z = 0;

        const Pointf3* corners[3] = { &points[facets[i].x], &points[facets[i].y], &points[facets[i].z] };
        for (int v = 0; v < 3; ++v) {
            facet.vertex[v].x = corners[v]->x;
            facet.vertex[v].y = corners[v]->y;
            facet.vertex[v].z = corners[v]->z;
        }
        
        facet.extra[0] = 0;
        facet.extra[1] = 0;

        stl.facet_start[i] = facet;
    }
    stl_get_size(&stl);
}

TriangleMesh::TriangleMesh(const TriangleMesh &other)
    : stl(other.stl), repaired(other.repaired)
{
    this->clone(other);
}

TriangleMesh& TriangleMesh::operator= (const TriangleMesh& other)
{
    if (this == &other) return *this;
    stl_close(&this->stl);
    this->stl = other.stl;
    this->repaired = other.repaired;
    this->clone(other);

    return *this;
}

void TriangleMesh::clone(const TriangleMesh& other) {
    this->stl.heads = NULL;
    this->stl.tail  = NULL;
    this->stl.error = other.stl.error;
    if (other.stl.facet_start != NULL) {
        this->stl.facet_start = (stl_facet*)calloc(other.stl.stats.number_of_facets, sizeof(stl_facet));
        std::copy(other.stl.facet_start, other.stl.facet_start + other.stl.stats.number_of_facets, this->stl.facet_start);
    }
    if (other.stl.neighbors_start != NULL) {
        this->stl.neighbors_start = (stl_neighbors*)calloc(other.stl.stats.number_of_facets, sizeof(stl_neighbors));
        std::copy(other.stl.neighbors_start, other.stl.neighbors_start + other.stl.stats.number_of_facets, this->stl.neighbors_start);
    }
    if (other.stl.v_indices != NULL) {
        this->stl.v_indices = (v_indices_struct*)calloc(other.stl.stats.number_of_facets, sizeof(v_indices_struct));
        std::copy(other.stl.v_indices, other.stl.v_indices + other.stl.stats.number_of_facets, this->stl.v_indices);
    }
    if (other.stl.v_shared != NULL) {
        this->stl.v_shared = (stl_vertex*)calloc(other.stl.stats.shared_vertices, sizeof(stl_vertex));
        std::copy(other.stl.v_shared, other.stl.v_shared + other.stl.stats.shared_vertices, this->stl.v_shared);
    }
}

TriangleMesh::TriangleMesh(TriangleMesh&& other) {
    this->repaired = std::move(other.repaired);
    this->stl = std::move(other.stl);
    stl_initialize(&other.stl);
}

TriangleMesh& TriangleMesh::operator= (TriangleMesh&& other)
{
    if (this == &other) return *this;
    stl_close(&this->stl);
    this->repaired = std::move(other.repaired);
    this->stl = std::move(other.stl);
    stl_initialize(&other.stl);

    return *this;
}

TriangleMesh::~TriangleMesh() {
    stl_close(&this->stl);
}

void
TriangleMesh::ReadSTLFile(const std::string &input_file) {
    #ifdef BOOST_WINDOWS
    stl_open(&stl, boost::nowide::widen(input_file).c_str());
    #else
    stl_open(&stl, input_file.c_str());
    #endif
    if (this->stl.error != 0) throw std::runtime_error("Failed to read STL file");
}

void
TriangleMesh::repair() {
    if (this->repaired) return;
    
    // admesh fails when repairing empty meshes
    if (this->stl.stats.number_of_facets == 0) return;
    
    this->check_topology();

    stl_repair(&(this->stl),  // operate on this STL
               true,  // flag: try to fix everything
               true,  // flag: check for perfectly aligned edges
               false, // flag: don't use tolerance
               0.0,    // null tolerance value
               false, // flag: don't increment tolerance
               0.0,   // amount to increment tolerance on each iteration
               true,  // find and try to connect nearby bad facets
               10,    // Perform 10 iterations
               true,  // remove unconnected
               true,  // fill holes
               true,  // fix normal directions
               true,  // fix normal values
               false, // reverse direction of all facets and normals
               0);  // Verbosity
    
    // always calculate the volume and reverse all normals if volume is negative
    (void)this->volume();
    
    // neighbors
    stl_verify_neighbors(&stl);
    
    if (this->needed_repair()) {
        const mesh_stats s = this->stats();
        Log::info("Mesh") << "repaired: " << s.degenerate_facets << " degenerate facets, "
            << s.edges_fixed << " edges fixed, " << s.facets_removed << " facets removed, "
            << s.facets_added << " facets added, " << s.facets_reversed << " facets reversed" << std::endl;
    }
    this->repaired = true;
}

float
TriangleMesh::volume()
{
    if (this->stl.stats.volume == -1) stl_calculate_volume(&this->stl);
    return this->stl.stats.volume;
}

void
TriangleMesh::check_topology()
{
    // checking exact
    stl_check_facets_exact(&stl);
    stl.stats.facets_w_1_bad_edge = (stl.stats.connected_facets_2_edge - stl.stats.connected_facets_3_edge);
    stl.stats.facets_w_2_bad_edge = (stl.stats.connected_facets_1_edge - stl.stats.connected_facets_2_edge);
    stl.stats.facets_w_3_bad_edge = (stl.stats.number_of_facets - stl.stats.connected_facets_1_edge);
    
    // checking nearby
    float tolerance = stl.stats.shortest_edge;
    float increment = stl.stats.bounding_diameter / 10000.0;
    const int iterations = 2;
    for (int i = 0; i < iterations; i++) {
        if (stl.stats.connected_facets_3_edge >= stl.stats.number_of_facets) break;
        stl_check_facets_nearby(&stl, tolerance);
        tolerance += increment;
    }
}

bool
TriangleMesh::is_manifold() const
{
    return this->stl.stats.connected_facets_3_edge == this->stl.stats.number_of_facets;
}

bool
TriangleMesh::needed_repair() const
{
    return this->stl.stats.degenerate_facets    > 0
        || this->stl.stats.edges_fixed          > 0
        || this->stl.stats.facets_removed       > 0
        || this->stl.stats.facets_added         > 0
        || this->stl.stats.facets_reversed      > 0
        || this->stl.stats.backwards_edges      > 0;
}

size_t
TriangleMesh::facets_count() const
{
    return this->stl.stats.number_of_facets;
}

void TriangleMesh::scale(float factor)
{
    stl_scale(&(this->stl), factor);
    stl_invalidate_shared_vertices(&this->stl);
}

void TriangleMesh::translate(float x, float y, float z)
{
    stl_translate_relative(&(this->stl), x, y, z);
    stl_invalidate_shared_vertices(&this->stl);
}

void TriangleMesh::translate(Pointf3 vec) {
    this->translate(
        static_cast<float>(vec.x),
        static_cast<float>(vec.y),
        static_cast<float>(vec.z)
    );
}

void TriangleMesh::rotate_z(float angle)
{
    // admesh uses degrees
    stl_rotate_z(&(this->stl), Geometry::rad2deg(angle));
    stl_invalidate_shared_vertices(&this->stl);
}

void TriangleMesh::align_to_origin()
{
    this->translate(
        -(this->stl.stats.min.x),
        -(this->stl.stats.min.y),
        -(this->stl.stats.min.z)
    );
}

void TriangleMesh::center_around_origin()
{
    this->align_to_origin();
    this->translate(
        -(this->stl.stats.size.x/2),
        -(this->stl.stats.size.y/2),
        -(this->stl.stats.size.z/2)
    );
}

void TriangleMesh::align_to_bed()
{
    stl_translate_relative(&(this->stl), 0.0f, 0.0f, -this->stl.stats.min.z);
    stl_invalidate_shared_vertices(&this->stl);
}

void TriangleMesh::center_on_bed(double bed_x, double bed_y)
{
    const Pointf3 c = this->center();
    this->translate(bed_x / 2 - c.x, bed_y / 2 - c.y, -this->stl.stats.min.z);
}

Pointf3s TriangleMesh::vertices()
{
    Pointf3s tmp {};
    if (this->repaired) {
        if (this->stl.v_shared == nullptr) 
            stl_generate_shared_vertices(&stl); // build the list of vertices
        for (auto i = 0; i < this->stl.stats.shared_vertices; i++) {
            const auto& v = this->stl.v_shared[i];
            tmp.emplace_back(Pointf3(v.x, v.y, v.z));
        }
    } else {
        Log::warn("Mesh") << "vertices() requires repair()" << std::endl;
    }
    return tmp;
}

Pointf3s TriangleMesh::normals() const
{
    Pointf3s tmp {};
    if (this->repaired) {
        for (auto i = 0; i < stl.stats.number_of_facets; i++) {
            const auto& n = stl.facet_start[i].normal;
            tmp.emplace_back(Pointf3(n.x, n.y, n.z));
        }
    } else {
        Log::warn("Mesh") << "normals() requires repair()" << std::endl;
    }
    return tmp;
}

Pointf3 TriangleMesh::size() const
{
    const auto& sz = stl.stats.size;
    return Pointf3(sz.x, sz.y, sz.z);
}

Pointf3
TriangleMesh::center() const {
    return this->bounding_box().center();
}

std::vector<ExPolygons> 
TriangleMesh::slice(const std::vector<double>& z, int threads)
{
    // convert doubles to floats
    std::vector<float> z_f(z.begin(), z.end());
    TriangleMeshSlicer mslicer(this);
    mslicer.threads = threads;
    std::vector<ExPolygons> layers;

    mslicer.slice(z_f, &layers);

    return layers;
}

mesh_stats
TriangleMesh::stats() const {
    mesh_stats tmp_stats;
    tmp_stats.number_of_facets = this->stl.stats.number_of_facets;
    tmp_stats.number_of_parts = this->stl.stats.number_of_parts;
    tmp_stats.volume = this->stl.stats.volume;
    tmp_stats.degenerate_facets = this->stl.stats.degenerate_facets;
    tmp_stats.edges_fixed = this->stl.stats.edges_fixed;
    tmp_stats.facets_removed = this->stl.stats.facets_removed;
    tmp_stats.facets_added = this->stl.stats.facets_added;
    tmp_stats.facets_reversed = this->stl.stats.facets_reversed;
    tmp_stats.backwards_edges = this->stl.stats.backwards_edges;
    tmp_stats.normals_fixed = this->stl.stats.normals_fixed;
    return tmp_stats;
}

/* this will return scaled ExPolygons */
ExPolygons
TriangleMesh::horizontal_projection() const
{
    Polygons pp;
    pp.reserve(this->stl.stats.number_of_facets);
    for (int i = 0; i < this->stl.stats.number_of_facets; i++) {
        stl_facet* facet = &this->stl.facet_start[i];
        Polygon p;
        p.points.resize(3);
        for (int v = 0; v < 3; ++v)
            p.points[v] = Point(facet->vertex[v].x / SCALING_FACTOR, facet->vertex[v].y / SCALING_FACTOR);
        p.make_counter_clockwise();  // do this after scaling, as winding order might change while doing that
        pp.push_back(p);
    }
    
    // the offset factor was tuned using groovemount.stl
    return union_ex(offset(pp, 0.01 / SCALING_FACTOR), true);
}

BoundingBoxf3
TriangleMesh::bounding_box() const
{
    BoundingBoxf3 bb;
    bb.min.x = this->stl.stats.min.x;
    bb.min.y = this->stl.stats.min.y;
    bb.min.z = this->stl.stats.min.z;
    bb.max.x = this->stl.stats.max.x;
    bb.max.y = this->stl.stats.max.y;
    bb.max.z = this->stl.stats.max.z;
    bb.defined = this->stl.stats.number_of_facets > 0;
    return bb;
}

void
TriangleMesh::require_shared_vertices()
{
    if (!this->repaired) this->repair();
    if (this->stl.v_shared == NULL) stl_generate_shared_vertices(&(this->stl));
}

// Generate the vertex list for a cube solid of arbitrary size in X/Y/Z.
TriangleMesh
TriangleMesh::make_cube(double x, double y, double z) {
    Pointf3 pv[8] = { 
        Pointf3(x, y, 0), Pointf3(x, 0, 0), Pointf3(0, 0, 0), 
        Pointf3(0, y, 0), Pointf3(x, y, z), Pointf3(0, y, z), 
        Pointf3(0, 0, z), Pointf3(x, 0, z) 
    };
    Point3 fv[12] = { 
        Point3(0, 1, 2), Point3(0, 2, 3), Point3(4, 5, 6), 
        Point3(4, 6, 7), Point3(0, 4, 7), Point3(0, 7, 1), 
        Point3(1, 7, 6), Point3(1, 6, 2), Point3(2, 6, 5), 
        Point3(2, 5, 3), Point3(4, 0, 3), Point3(4, 3, 5) 
    };

    Point3s facets(&fv[0], &fv[0]+12);
    Pointf3s vertices(&pv[0], &pv[0]+8);

    TriangleMesh mesh(vertices ,facets);
    mesh.repair();
    return mesh;
}

void
TriangleMeshSlicer::slice(const std::vector<float> &z, std::vector<Polygons>* layers) const
{
    /*  Every facet is intersected with the planes it spans (facets in
        parallel, collecting lines per plane), then the lines of every
        plane are chained into closed loops (planes in parallel).
        z holds unscaled coordinates as floats to match the mesh type. */
    
    layers->clear();
    layers->resize(z.size());
    if (z.empty()) return;
    
    std::vector<IntersectionLines> lines(z.size());
    {
        boost::mutex lines_mutex;
        parallelize<int>(
            0,
            this->mesh->stl.stats.number_of_facets-1,
            boost::bind(&TriangleMeshSlicer::_slice_do, this, _1, &lines, &lines_mutex, z),
            this->threads
        );
    }
    
    parallelize<size_t>(
        0,
        lines.size()-1,
        boost::bind(&TriangleMeshSlicer::_make_loops_do, this, _1, &lines, layers),
        this->threads
    );
}

void
TriangleMeshSlicer::_slice_do(size_t facet_idx, std::vector<IntersectionLines>* lines, boost::mutex* lines_mutex, 
    const std::vector<float> &z) const
{
    const stl_facet &facet = this->mesh->stl.facet_start[facet_idx];
    
    // find facet extents
    const float min_z = fminf(facet.vertex[0].z, fminf(facet.vertex[1].z, facet.vertex[2].z));
    const float max_z = fmaxf(facet.vertex[0].z, fmaxf(facet.vertex[1].z, facet.vertex[2].z));
    
    // find layer extents
    std::vector<float>::const_iterator min_layer, max_layer;
    min_layer = std::lower_bound(z.begin(), z.end(), min_z); // first layer whose slice_z is >= min_z
    max_layer = std::upper_bound(min_layer, z.end(), max_z); // one past the last layer whose slice_z is <= max_z
    
    for (std::vector<float>::const_iterator it = min_layer; it != max_layer; ++it) {
        std::vector<float>::size_type layer_idx = it - z.begin();
        this->slice_facet(*it / SCALING_FACTOR, facet, facet_idx, min_z / SCALING_FACTOR, max_z / SCALING_FACTOR,
            &(*lines)[layer_idx], lines_mutex);
    }
}

void
TriangleMeshSlicer::slice(const std::vector<float> &z, std::vector<ExPolygons>* layers) const
{
    std::vector<Polygons> layers_p;
    this->slice(z, &layers_p);
    
    layers->clear();
    layers->resize(z.size());
    for (size_t i = 0; i < layers_p.size(); ++i)
        this->make_expolygons(layers_p[i], &(*layers)[i]);
}

void
TriangleMeshSlicer::slice_facet(float slice_z, const stl_facet &facet, const int &facet_idx,
    const float &min_z, const float &max_z, std::vector<IntersectionLine>* lines,
    boost::mutex* lines_mutex) const
{
    std::vector<IntersectionPoint> points;
    std::vector< std::vector<IntersectionPoint>::size_type > points_on_layer;
    bool found_horizontal_edge = false;
    
    const v_indices_struct &indices = this->mesh->stl.v_indices[facet_idx];
    
    /* reorder vertices so that the first one is the one with lowest Z
       this is needed to get all intersection lines in a consistent order
       (external on the right of the line) */
    int i = 0;
    if (this->v_scaled_shared[indices.vertex[1]].z == min_z) {
        i = 1;
    } else if (this->v_scaled_shared[indices.vertex[2]].z == min_z) {
        i = 2;
    }
    for (int j = i; (j-i) < 3; j++) {  // loop through facet edges
        int edge_id = this->facets_edges[facet_idx][j % 3];
        int a_id = indices.vertex[j % 3];
        int b_id = indices.vertex[(j+1) % 3];
        const stl_vertex* a = &this->v_scaled_shared[a_id];
        const stl_vertex* b = &this->v_scaled_shared[b_id];
        
        if (a->z == b->z && a->z == slice_z) {
            // edge is horizontal and belongs to the current layer
            const stl_vertex &v0 = this->v_scaled_shared[ indices.vertex[0] ];
            const stl_vertex &v1 = this->v_scaled_shared[ indices.vertex[1] ];
            const stl_vertex &v2 = this->v_scaled_shared[ indices.vertex[2] ];
            IntersectionLine line;
            if (min_z == max_z) {
                line.edge_type = feHorizontal;
                if (facet.normal.z < 0) {
                    // bottom horizontal facet: reverse its point order
                    std::swap(a, b);
                    std::swap(a_id, b_id);
                }
            } else if (v0.z < slice_z || v1.z < slice_z || v2.z < slice_z) {
                line.edge_type = feTop;
                std::swap(a, b);
                std::swap(a_id, b_id);
            } else {
                line.edge_type = feBottom;
            }
            line.a.x    = a->x;
            line.a.y    = a->y;
            line.b.x    = b->x;
            line.b.y    = b->y;
            line.a_id   = a_id;
            line.b_id   = b_id;
            if (lines_mutex != NULL) {
                boost::lock_guard<boost::mutex> l(*lines_mutex);
                lines->push_back(line);
            } else {
                lines->push_back(line);
            }
            
            found_horizontal_edge = true;
            
            // a top or bottom edge is the only thing this facet contributes
            if (line.edge_type != feHorizontal) return;
        } else if (a->z == slice_z) {
            IntersectionPoint point;
            point.x         = a->x;
            point.y         = a->y;
            point.point_id  = a_id;
            points.push_back(point);
            points_on_layer.push_back(points.size()-1);
        } else if (b->z == slice_z) {
            IntersectionPoint point;
            point.x         = b->x;
            point.y         = b->y;
            point.point_id  = b_id;
            points.push_back(point);
            points_on_layer.push_back(points.size()-1);
        } else if ((a->z < slice_z && b->z > slice_z) || (b->z < slice_z && a->z > slice_z)) {
            // edge intersects the current layer; calculate intersection
            IntersectionPoint point;
            point.x         = b->x + (a->x - b->x) * (slice_z - b->z) / (a->z - b->z);
            point.y         = b->y + (a->y - b->y) * (slice_z - b->z) / (a->z - b->z);
            point.edge_id   = edge_id;
            points.push_back(point);
        }
    }
    if (found_horizontal_edge) return;
    
    if (!points_on_layer.empty()) {
        // each vertex on the plane is detected twice (once for each edge)
        if (points_on_layer.size() != 2 || points.size() < 3) return;  // V-shaped facet tangent to plane
        points.erase( points.begin() + points_on_layer[1] );
    }
    
    // facets intersect each plane 0 or 2 times; anything else is degenerate
    if (points.size() == 2) {
        IntersectionLine line;
        line.a          = (Point)points[1];
        line.b          = (Point)points[0];
        line.a_id       = points[1].point_id;
        line.b_id       = points[0].point_id;
        line.edge_a_id  = points[1].edge_id;
        line.edge_b_id  = points[0].edge_id;
        if (lines_mutex != NULL) {
            boost::lock_guard<boost::mutex> l(*lines_mutex);
            lines->push_back(line);
        } else {
            lines->push_back(line);
        }
    }
}

void
TriangleMeshSlicer::_make_loops_do(size_t i, std::vector<IntersectionLines>* lines, std::vector<Polygons>* layers) const
{
    this->make_loops((*lines)[i], &(*layers)[i]);
}

void
TriangleMeshSlicer::make_loops(std::vector<IntersectionLine> &lines, Polygons* loops) const
{
    // remove tangent edges
    for (IntersectionLines::iterator line = lines.begin(); line != lines.end(); ++line) {
        if (line->skip || line->edge_type == feNone) continue;
        
        /* if the line is a facet edge, find another facet edge
           having the same endpoints but in reverse order */
        for (IntersectionLines::iterator line2 = line + 1; line2 != lines.end(); ++line2) {
            if (line2->skip || line2->edge_type == feNone) continue;
            
            // are these facets adjacent? (sharing a common edge on this layer)
            if (line->a_id == line2->a_id && line->b_id == line2->b_id) {
                line2->skip = true;
                
                /* both oriented upwards or downwards (like a 'V'): the edge
                   doesn't affect the sliced shape, drop both. Otherwise keep
                   one of them; all 'top' lines were reversed at slicing. */
                if (line->edge_type == line2->edge_type) {
                    line->skip = true;
                    break;
                }
            } else if (line->a_id == line2->b_id && line->b_id == line2->a_id) {
                /* if this edge joins two horizontal facets, remove both of them */
                if (line->edge_type == feHorizontal && line2->edge_type == feHorizontal) {
                    line->skip = true;
                    line2->skip = true;
                    break;
                }
            }
        }
    }
    
    // build a map of lines by edge_a_id and a_id
    std::vector<IntersectionLinePtrs> by_edge_a_id, by_a_id;
    by_edge_a_id.resize(this->mesh->stl.stats.number_of_facets * 3);
    by_a_id.resize(this->mesh->stl.stats.shared_vertices);
    for (IntersectionLines::iterator line = lines.begin(); line != lines.end(); ++line) {
        if (line->skip) continue;
        if (line->edge_a_id != -1) by_edge_a_id[line->edge_a_id].push_back(&(*line));
        if (line->a_id != -1) by_a_id[line->a_id].push_back(&(*line));
    }
    
    size_t failed_loops = 0;
    IntersectionLines::iterator spare = lines.begin();
    while (true) {
        // take first spare line and start a new loop
        while (spare != lines.end() && spare->skip) ++spare;
        if (spare == lines.end()) break;
        IntersectionLine* first_line = &(*spare);
        first_line->skip = true;
        IntersectionLinePtrs loop;
        loop.push_back(first_line);
        
        while (true) {
            // find a line starting where last one finishes
            IntersectionLine* next_line = NULL;
            if (loop.back()->edge_b_id != -1) {
                for (IntersectionLine* candidate : by_edge_a_id[loop.back()->edge_b_id]) {
                    if (candidate->skip) continue;
                    next_line = candidate;
                    break;
                }
            }
            if (next_line == NULL && loop.back()->b_id != -1) {
                for (IntersectionLine* candidate : by_a_id[loop.back()->b_id]) {
                    if (candidate->skip) continue;
                    next_line = candidate;
                    break;
                }
            }
            
            if (next_line == NULL) {
                // check whether we closed this loop
                if ((loop.front()->edge_a_id != -1 && loop.front()->edge_a_id == loop.back()->edge_b_id)
                    || (loop.front()->a_id != -1 && loop.front()->a_id == loop.back()->b_id)) {
                    Polygon p;
                    p.points.reserve(loop.size());
                    for (const IntersectionLine* lineptr : loop)
                        p.points.push_back(lineptr->a);
                    loops->push_back(p);
                } else {
                    ++failed_loops;
                }
                break;
            }
            loop.push_back(next_line);
            next_line->skip = true;
        }
    }
    if (failed_loops > 0)
        Log::debug("Mesh") << "unable to close " << failed_loops << " loop(s)" << std::endl;
}

void
TriangleMeshSlicer::make_expolygons(const Polygons &loops, ExPolygons* slices) const
{
    /*  Consecutive concentric loops can share a winding order, so neither
        evenodd nor nonzero filling is right for them. Loops are sorted by
        absolute area (outermost first) and applied in order: CCW loops are
        added, CW loops are subtracted. */
    std::vector<double> area;
    std::vector<size_t> sorted_area;  // vector of indices
    for (Polygons::const_iterator loop = loops.begin(); loop != loops.end(); ++loop) {
        area.push_back(loop->area());
        sorted_area.push_back(loop - loops.begin());
    }
    
    std::sort(sorted_area.begin(), sorted_area.end(), [&area](size_t a, size_t b) {
        return std::fabs(area[a]) > std::fabs(area[b]);
    });

    // we don't perform a safety offset now because it might reverse cw loops
    Polygons p_slices;
    for (size_t loop_idx : sorted_area) {
        const Polygon &loop = loops[loop_idx];
        if (area[loop_idx] > +EPSILON) {
            p_slices.push_back(loop);
        } else if (area[loop_idx] < -EPSILON) {
            p_slices = diff(p_slices, loop);
        }
    }

    // perform a safety offset to merge very close facets
    double safety_offset = scale_(0.0499);
    ExPolygons ex_slices = offset2_ex(p_slices, +safety_offset, -safety_offset);
    
    // anything still invalid goes through the repair path
    for (ExPolygon &ex : ex_slices) {
        if (ex.is_valid()) {
            slices->push_back(std::move(ex));
        } else {
            expolygons_append(*slices, repair_polygons(to_polygons(ex)));
        }
    }
}

TriangleMeshSlicer::TriangleMeshSlicer(TriangleMesh* _mesh) 
    : mesh(_mesh), threads(boost::thread::hardware_concurrency()), v_scaled_shared(NULL)
{
    if (this->mesh->facets_count() == 0)
        throw std::runtime_error("Cannot slice a mesh without facets");
    
    // build a table to map a facet_idx to its three edge indices
    this->mesh->require_shared_vertices();
    typedef std::pair<int,int>              t_edge;
    typedef std::map<t_edge,int>            t_edges_map;  // a_id,b_id => edge_idx
    
    this->facets_edges.resize(this->mesh->stl.stats.number_of_facets);
    
    {
        int edges_count = 0;
        t_edges_map edges_map;
        for (int facet_idx = 0; facet_idx < this->mesh->stl.stats.number_of_facets; facet_idx++) {
            this->facets_edges[facet_idx].resize(3);
            for (int i = 0; i <= 2; i++) {
                int a_id = this->mesh->stl.v_indices[facet_idx].vertex[i];
                int b_id = this->mesh->stl.v_indices[facet_idx].vertex[(i+1) % 3];
                
                int edge_idx;
                t_edges_map::const_iterator my_edge = edges_map.find(std::make_pair(b_id,a_id));
                if (my_edge == edges_map.end()) {
                    /* admesh can assign the same edge ID to more than two facets,
                       so also look for this edge in the same orientation */
                    my_edge = edges_map.find(std::make_pair(a_id,b_id));
                }
                if (my_edge != edges_map.end()) {
                    edge_idx = my_edge->second;
                } else {
                    edge_idx = edges_count++;
                    edges_map[ std::make_pair(a_id,b_id) ] = edge_idx;
                }
                this->facets_edges[facet_idx][i] = edge_idx;
            }
        }
    }
    
    // clone shared vertices coordinates and scale them
    this->v_scaled_shared = (stl_vertex*)calloc(this->mesh->stl.stats.shared_vertices, sizeof(stl_vertex));
    std::copy(this->mesh->stl.v_shared, this->mesh->stl.v_shared + this->mesh->stl.stats.shared_vertices, this->v_scaled_shared);
    for (int i = 0; i < this->mesh->stl.stats.shared_vertices; i++) {
        this->v_scaled_shared[i].x /= SCALING_FACTOR;
        this->v_scaled_shared[i].y /= SCALING_FACTOR;
        this->v_scaled_shared[i].z /= SCALING_FACTOR;
    }
}

TriangleMeshSlicer::~TriangleMeshSlicer()
{
    free(this->v_scaled_shared);
}

}
