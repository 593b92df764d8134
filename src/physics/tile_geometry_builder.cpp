// Creative2D Physics Engine
// tile_geometry_builder.cpp - Collision geometry from occupancy grids and alpha masks

#include <creative2d/core/logger.hpp>
#include <creative2d/physics/geometry.hpp>
#include <creative2d/physics/tile_geometry_builder.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace creative2d::physics {

namespace {

// Moore neighbourhood, clockwise on screen starting at north
constexpr std::array<int, 8> NEIGHBOUR_DX = {0, 1, 1, 1, 0, -1, -1, -1};
constexpr std::array<int, 8> NEIGHBOUR_DY = {-1, -1, 0, 1, 1, 1, 0, -1};

class AlphaMask {
public:
    AlphaMask(const std::vector<uint8_t>& alpha, int width, int height)
        : alpha_(alpha), width_(width), height_(height) {}

    // Out-of-range pixels read as empty
    [[nodiscard]] bool solid(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) {
            return false;
        }
        return alpha_[static_cast<size_t>(y) * width_ + x] > TileGeometryBuilder::SOLID_ALPHA;
    }

    [[nodiscard]] bool boundary(int x, int y) const {
        if (!solid(x, y)) {
            return false;
        }
        return !solid(x - 1, y) || !solid(x + 1, y) || !solid(x, y - 1) || !solid(x, y + 1);
    }

private:
    const std::vector<uint8_t>& alpha_;
    int width_;
    int height_;
};

bool mask_is_valid(const std::vector<uint8_t>& alpha, int width, int height) {
    return width > 0 && height > 0 && alpha.size() >= static_cast<size_t>(width) * static_cast<size_t>(height);
}

void simplify_range(const std::vector<Vec2>& points, size_t first, size_t last, double tolerance,
                    std::vector<bool>& keep) {
    if (last <= first + 1) {
        return;
    }

    double max_distance = 0.0;
    size_t index = first;
    for (size_t i = first + 1; i < last; ++i) {
        double d = geometry::distance_to_segment(points[i], points[first], points[last]);
        if (d > max_distance) {
            max_distance = d;
            index = i;
        }
    }

    if (max_distance > tolerance) {
        keep[index] = true;
        simplify_range(points, first, index, tolerance, keep);
        simplify_range(points, index, last, tolerance, keep);
    }
}

bool is_ear(const std::vector<Vec2>& polygon, size_t prev, size_t curr, size_t next) {
    const Vec2& p1 = polygon[prev];
    const Vec2& p2 = polygon[curr];
    const Vec2& p3 = polygon[next];

    // Counter-clockwise on screen means a convex corner turns negative
    if (cross(p2 - p1, p3 - p2) >= 0.0) {
        return false;
    }

    for (size_t i = 0; i < polygon.size(); ++i) {
        if (i == prev || i == curr || i == next) {
            continue;
        }
        if (geometry::point_in_triangle(polygon[i], p1, p2, p3)) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ============================================================================
// Rectangle Merging
// ============================================================================

std::vector<TileRect> TileGeometryBuilder::merge_cells(const std::vector<uint8_t>& cells, int columns, int rows,
                                                       const Vec2& cell_size, const Vec2& source_size) {
    std::vector<TileRect> rects;
    if (columns <= 0 || rows <= 0 || cells.size() < static_cast<size_t>(columns) * static_cast<size_t>(rows)) {
        return rects;
    }

    auto index = [columns](int col, int row) { return static_cast<size_t>(row) * columns + col; };
    std::vector<uint8_t> visited(cells.size(), 0);
    auto available = [&](int col, int row) { return cells[index(col, row)] != 0 && visited[index(col, row)] == 0; };

    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < columns; ++col) {
            if (!available(col, row)) {
                continue;
            }

            int width = 1;
            while (col + width < columns && available(col + width, row)) {
                ++width;
            }

            int height = 1;
            while (row + height < rows) {
                bool row_free = true;
                for (int k = 0; k < width; ++k) {
                    if (!available(col + k, row + height)) {
                        row_free = false;
                        break;
                    }
                }
                if (!row_free) {
                    break;
                }
                ++height;
            }

            for (int dy = 0; dy < height; ++dy) {
                for (int dx = 0; dx < width; ++dx) {
                    visited[index(col + dx, row + dy)] = 1;
                }
            }

            TileRect rect;
            rect.size = Vec2(width * cell_size.x, height * cell_size.y);
            rect.center = Vec2(col * cell_size.x, row * cell_size.y) + rect.size * 0.5 - source_size * 0.5;
            rects.push_back(rect);
        }
    }

    return rects;
}

std::vector<uint8_t> TileGeometryBuilder::rasterize_mask(const std::vector<uint8_t>& alpha, int width, int height,
                                                         int resolution, int& out_columns, int& out_rows) {
    out_columns = 0;
    out_rows = 0;
    if (!mask_is_valid(alpha, width, height) || resolution <= 0) {
        return {};
    }

    out_columns = (width + resolution - 1) / resolution;
    out_rows = (height + resolution - 1) / resolution;

    AlphaMask mask(alpha, width, height);
    std::vector<uint8_t> cells(static_cast<size_t>(out_columns) * out_rows, 0);

    for (int row = 0; row < out_rows; ++row) {
        for (int col = 0; col < out_columns; ++col) {
            int end_y = std::min(height, (row + 1) * resolution);
            int end_x = std::min(width, (col + 1) * resolution);
            bool occupied = false;
            for (int py = row * resolution; py < end_y && !occupied; ++py) {
                for (int px = col * resolution; px < end_x; ++px) {
                    if (mask.solid(px, py)) {
                        occupied = true;
                        break;
                    }
                }
            }
            cells[static_cast<size_t>(row) * out_columns + col] = occupied ? 1 : 0;
        }
    }

    return cells;
}

std::vector<TileRect> TileGeometryBuilder::build_mask_rects(const std::vector<uint8_t>& alpha, int width, int height,
                                                            int resolution) {
    int columns = 0;
    int rows = 0;
    auto cells = rasterize_mask(alpha, width, height, resolution, columns, rows);
    auto rects = merge_cells(cells, columns, rows, Vec2(resolution), Vec2(width, height));

    CREATIVE2D_LOG_DEBUG(core::log_category::PHYSICS, "Terrain mask {}x{} merged into {} rectangles", width, height,
                         rects.size());
    return rects;
}

// ============================================================================
// Polygon Mode
// ============================================================================

void TileGeometryBuilder::build_mask_polygons(const std::vector<uint8_t>& alpha, int width, int height,
                                              int resolution, double simplify_tolerance, TileGeometry& out) {
    if (!mask_is_valid(alpha, width, height)) {
        return;
    }

    AlphaMask mask(alpha, width, height);
    std::vector<uint8_t> visited(static_cast<size_t>(width) * height, 0);
    const int step = std::max(2, resolution / 4);
    const Vec2 half_size(width * 0.5, height * 0.5);

    for (int y = 0; y < height; y += step) {
        for (int x = 0; x < width; x += step) {
            if (visited[static_cast<size_t>(y) * width + x] != 0 || !mask.boundary(x, y)) {
                continue;
            }

            auto contour = trace_contour(alpha, width, height, x, y, visited);
            if (contour.size() <= 3) {
                continue;
            }

            auto simplified = simplify(contour, simplify_tolerance);
            if (simplified.size() <= 2) {
                continue;
            }

            for (auto& vertex : simplified) {
                vertex -= half_size;
            }

            // Islands wind clockwise on screen; holes and slivers are dropped
            if (geometry::signed_area(simplified) <= MIN_ISLAND_AREA) {
                continue;
            }

            for (auto& triangle : triangulate(simplified)) {
                out.polygons.push_back(std::move(triangle));
            }
            out.outlines.push_back(TilePolygon{std::move(simplified)});
        }
    }

    CREATIVE2D_LOG_DEBUG(core::log_category::PHYSICS, "Terrain mask {}x{} traced into {} outlines, {} triangles",
                         width, height, out.outlines.size(), out.polygons.size());
}

std::vector<Vec2> TileGeometryBuilder::trace_contour(const std::vector<uint8_t>& alpha, int width, int height,
                                                     int start_x, int start_y, std::vector<uint8_t>& visited) {
    std::vector<Vec2> points;
    if (!mask_is_valid(alpha, width, height) || visited.size() < static_cast<size_t>(width) * height) {
        return points;
    }

    AlphaMask mask(alpha, width, height);
    int x = start_x;
    int y = start_y;
    int entry_dir = 2;  // Entered from the west
    const long max_iterations = static_cast<long>(width) * height;
    long iterations = 0;

    do {
        points.emplace_back(x, y);
        visited[static_cast<size_t>(y) * width + x] = 1;

        bool found = false;
        int check_dir = (entry_dir + 6) % 8;
        for (int i = 0; i < 8; ++i) {
            int dir = (check_dir + i) % 8;
            int next_x = x + NEIGHBOUR_DX[dir];
            int next_y = y + NEIGHBOUR_DY[dir];
            if (!mask.solid(next_x, next_y)) {
                continue;
            }

            for (int sy = -1; sy <= 1; ++sy) {
                for (int sx = -1; sx <= 1; ++sx) {
                    int vx = x + sx;
                    int vy = y + sy;
                    if (vx >= 0 && vx < width && vy >= 0 && vy < height) {
                        visited[static_cast<size_t>(vy) * width + vx] = 1;
                    }
                }
            }

            x = next_x;
            y = next_y;
            entry_dir = dir;
            found = true;
            break;
        }

        if (!found) {
            break;  // Isolated pixel
        }
        ++iterations;
    } while ((x != start_x || y != start_y) && iterations < max_iterations);

    return points;
}

std::vector<Vec2> TileGeometryBuilder::simplify(const std::vector<Vec2>& points, double tolerance) {
    if (points.size() < 3) {
        return points;
    }

    std::vector<bool> keep(points.size(), false);
    keep.front() = true;
    keep.back() = true;
    simplify_range(points, 0, points.size() - 1, tolerance, keep);

    std::vector<Vec2> result;
    for (size_t i = 0; i < points.size(); ++i) {
        if (keep[i]) {
            result.push_back(points[i]);
        }
    }
    return result;
}

std::vector<TilePolygon> TileGeometryBuilder::triangulate(const std::vector<Vec2>& vertices) {
    std::vector<TilePolygon> triangles;
    if (vertices.size() < 3) {
        return triangles;
    }

    std::vector<Vec2> working = vertices;
    if (geometry::signed_area(working) > 0.0) {
        std::reverse(working.begin(), working.end());
    }
    if (working.size() == 3) {
        triangles.push_back(TilePolygon{working});
        return triangles;
    }

    const size_t max_iterations = working.size() * 10;
    size_t iterations = 0;

    while (working.size() > 3 && iterations < max_iterations) {
        bool ear_found = false;
        for (size_t i = 0; i < working.size(); ++i) {
            size_t prev = (i + working.size() - 1) % working.size();
            size_t next = (i + 1) % working.size();
            if (!is_ear(working, prev, i, next)) {
                continue;
            }
            triangles.push_back(TilePolygon{{working[prev], working[i], working[next]}});
            working.erase(working.begin() + static_cast<std::ptrdiff_t>(i));
            ear_found = true;
            break;
        }

        if (!ear_found) {
            CREATIVE2D_LOG_WARN(core::log_category::PHYSICS,
                                "Ear clipping stopped with {} vertices left; outline is not simple", working.size());
            break;
        }
        ++iterations;
    }

    if (working.size() == 3) {
        triangles.push_back(TilePolygon{working});
    }
    return triangles;
}

}  // namespace creative2d::physics
