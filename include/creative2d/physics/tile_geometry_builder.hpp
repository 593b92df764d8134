// Creative2D Physics Engine
// tile_geometry_builder.hpp - Collision geometry from occupancy grids and alpha masks

#pragma once

#include "types.hpp"

#include <cstdint>
#include <vector>

namespace creative2d::physics {

// ============================================================================
// Generated Geometry
// ============================================================================

// Axis-aligned rectangle in the source's local space (centre relative to the source centre)
struct TileRect {
    Vec2 center{0.0};
    Vec2 size{0.0};
};

struct TilePolygon {
    std::vector<Vec2> vertices;
};

struct TileGeometry {
    std::vector<TileRect> rects;
    std::vector<TilePolygon> polygons;  // Triangles in polygon mode
    std::vector<TilePolygon> outlines;  // Simplified contours before triangulation

    [[nodiscard]] bool empty() const { return rects.empty() && polygons.empty(); }

    void clear() {
        rects.clear();
        polygons.clear();
        outlines.clear();
    }
};

// ============================================================================
// Tile Geometry Builder
// ============================================================================

class TileGeometryBuilder {
public:
    static constexpr uint8_t SOLID_ALPHA = 128;  // Alpha strictly above this is solid
    static constexpr double MIN_ISLAND_AREA = 10.0;

    // Merge occupied cells (row-major, non-zero = occupied) into rectangles with a greedy
    // row-major scan. Centres are relative to the middle of a source of `source_size`.
    [[nodiscard]] static std::vector<TileRect> merge_cells(const std::vector<uint8_t>& cells, int columns, int rows,
                                                           const Vec2& cell_size, const Vec2& source_size);

    // Downsample an alpha mask into `resolution`-sized cells. A cell is occupied when any
    // of its pixels is solid.
    [[nodiscard]] static std::vector<uint8_t> rasterize_mask(const std::vector<uint8_t>& alpha, int width,
                                                             int height, int resolution, int& out_columns,
                                                             int& out_rows);

    // Rectangles mode: rasterize, merge, and centre on the mask centre
    [[nodiscard]] static std::vector<TileRect> build_mask_rects(const std::vector<uint8_t>& alpha, int width,
                                                                int height, int resolution);

    // Polygon mode: trace, simplify, drop holes and slivers, triangulate
    static void build_mask_polygons(const std::vector<uint8_t>& alpha, int width, int height, int resolution,
                                    double simplify_tolerance, TileGeometry& out);

    // ========================================================================
    // Building Blocks
    // ========================================================================

    // Moore-neighbour boundary trace starting at a solid pixel. Pixels around the
    // traced path are marked in `visited` so later scans do not restart inside it.
    [[nodiscard]] static std::vector<Vec2> trace_contour(const std::vector<uint8_t>& alpha, int width, int height,
                                                         int start_x, int start_y, std::vector<uint8_t>& visited);

    // Ramer-Douglas-Peucker polyline simplification
    [[nodiscard]] static std::vector<Vec2> simplify(const std::vector<Vec2>& points, double tolerance);

    // Ear clipping. Output triangles wind counter-clockwise on screen.
    [[nodiscard]] static std::vector<TilePolygon> triangulate(const std::vector<Vec2>& vertices);

private:
    TileGeometryBuilder() = delete;
};

}  // namespace creative2d::physics
