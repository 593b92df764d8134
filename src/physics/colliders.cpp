// Creative2D Physics Engine
// colliders.cpp - Collider shapes and lazily generated tile geometry

#include <creative2d/core/logger.hpp>
#include <creative2d/physics/colliders.hpp>

#include <algorithm>
#include <cmath>

namespace creative2d::physics {

// ============================================================================
// TilemapShape
// ============================================================================

TilemapShape::TilemapShape(int columns, int rows, const Vec2& cell_size)
    : columns_(std::max(0, columns)),
      rows_(std::max(0, rows)),
      cell_size_(cell_size),
      cells_(static_cast<size_t>(columns_) * rows_, 0) {}

void TilemapShape::resize(int columns, int rows) {
    columns = std::max(0, columns);
    rows = std::max(0, rows);
    if (columns == columns_ && rows == rows_) {
        return;
    }

    std::vector<uint8_t> resized(static_cast<size_t>(columns) * rows, 0);
    for (int row = 0; row < std::min(rows, rows_); ++row) {
        for (int col = 0; col < std::min(columns, columns_); ++col) {
            resized[static_cast<size_t>(row) * columns + col] = cells_[static_cast<size_t>(row) * columns_ + col];
        }
    }

    cells_ = std::move(resized);
    columns_ = columns;
    rows_ = rows;
    dirty_ = true;
}

void TilemapShape::set_cell_size(const Vec2& cell_size) {
    if (cell_size != cell_size_) {
        cell_size_ = cell_size;
        dirty_ = true;
    }
}

void TilemapShape::set_tile(int column, int row, bool solid) {
    if (column < 0 || column >= columns_ || row < 0 || row >= rows_) {
        return;
    }
    uint8_t& cell = cells_[static_cast<size_t>(row) * columns_ + column];
    uint8_t value = solid ? 1 : 0;
    if (cell != value) {
        cell = value;
        dirty_ = true;
    }
}

bool TilemapShape::is_solid(int column, int row) const {
    if (column < 0 || column >= columns_ || row < 0 || row >= rows_) {
        return false;
    }
    return cells_[static_cast<size_t>(row) * columns_ + column] != 0;
}

void TilemapShape::fill(int column, int row, int width, int height, bool solid) {
    for (int r = row; r < row + height; ++r) {
        for (int c = column; c < column + width; ++c) {
            set_tile(c, r, solid);
        }
    }
}

void TilemapShape::clear() {
    std::fill(cells_.begin(), cells_.end(), 0);
    dirty_ = true;
}

const TileGeometry& TilemapShape::geometry() {
    if (dirty_) {
        regenerate();
    }
    return geometry_;
}

void TilemapShape::regenerate() {
    geometry_.clear();
    geometry_.rects = TileGeometryBuilder::merge_cells(cells_, columns_, rows_, cell_size_, get_extent());
    dirty_ = false;

    CREATIVE2D_LOG_DEBUG(core::log_category::PHYSICS, "Tilemap {}x{} generated {} rectangles", columns_, rows_,
                         geometry_.rects.size());
}

// ============================================================================
// TerrainShape
// ============================================================================

TerrainShape::TerrainShape(int width, int height, std::vector<uint8_t> alpha) {
    set_mask(width, height, std::move(alpha));
}

void TerrainShape::set_mask(int width, int height, std::vector<uint8_t> alpha) {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    alpha_ = std::move(alpha);
    alpha_.resize(static_cast<size_t>(width_) * height_, 0);
    dirty_ = true;
}

void TerrainShape::set_alpha(int x, int y, uint8_t alpha) {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return;
    }
    uint8_t& pixel = alpha_[static_cast<size_t>(y) * width_ + x];
    if (pixel != alpha) {
        pixel = alpha;
        dirty_ = true;
    }
}

uint8_t TerrainShape::get_alpha(int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return 0;
    }
    return alpha_[static_cast<size_t>(y) * width_ + x];
}

void TerrainShape::paint_circle(const Vec2& center, double radius, uint8_t alpha) {
    int min_x = static_cast<int>(std::floor(center.x - radius));
    int max_x = static_cast<int>(std::ceil(center.x + radius));
    int min_y = static_cast<int>(std::floor(center.y - radius));
    int max_y = static_cast<int>(std::ceil(center.y + radius));
    double radius_sq = radius * radius;

    for (int y = min_y; y <= max_y; ++y) {
        for (int x = min_x; x <= max_x; ++x) {
            Vec2 delta = Vec2(x + 0.5, y + 0.5) - center;
            if (glm::dot(delta, delta) <= radius_sq) {
                set_alpha(x, y, alpha);
            }
        }
    }
}

void TerrainShape::set_mode(TerrainMode mode) {
    if (mode_ != mode) {
        mode_ = mode;
        dirty_ = true;
    }
}

void TerrainShape::set_resolution(int resolution) {
    resolution = std::max(1, resolution);
    if (resolution_ != resolution) {
        resolution_ = resolution;
        dirty_ = true;
    }
}

void TerrainShape::set_simplify_tolerance(double tolerance) {
    if (simplify_tolerance_ != tolerance) {
        simplify_tolerance_ = tolerance;
        dirty_ = true;
    }
}

const TileGeometry& TerrainShape::geometry() {
    if (dirty_) {
        regenerate();
    }
    return geometry_;
}

void TerrainShape::regenerate() {
    geometry_.clear();
    if (mode_ == TerrainMode::Polygon) {
        TileGeometryBuilder::build_mask_polygons(alpha_, width_, height_, resolution_, simplify_tolerance_, geometry_);
    } else {
        geometry_.rects = TileGeometryBuilder::build_mask_rects(alpha_, width_, height_, resolution_);
    }
    dirty_ = false;
}

// ============================================================================
// Collider
// ============================================================================

const char* to_string(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Box:
            return "box";
        case ShapeKind::Capsule:
            return "capsule";
        case ShapeKind::Polygon:
            return "polygon";
        case ShapeKind::Tilemap:
            return "tilemap";
        case ShapeKind::Terrain:
            return "terrain";
        case ShapeKind::LineChain:
            return "line_chain";
    }
    return "unknown";
}

Collider Collider::box(const Vec2& size, bool trigger) {
    return Collider(BoxShape{size}, Vec2(0.0), trigger);
}

Collider Collider::capsule(const Vec2& size, CapsuleDirection direction) {
    return Collider(CapsuleShape{size, direction});
}

Collider Collider::polygon(std::vector<Vec2> vertices) {
    return Collider(PolygonShape{std::move(vertices)});
}

Collider Collider::line_chain(std::vector<Vec2> points) {
    return Collider(LineChainShape{std::move(points)});
}

Collider Collider::tilemap(TilemapShape source) {
    return Collider(std::move(source));
}

Collider Collider::terrain(TerrainShape source) {
    return Collider(std::move(source));
}

const TileGeometry* Collider::generated_geometry() {
    if (auto* tilemap_shape = get<TilemapShape>()) {
        return &tilemap_shape->geometry();
    }
    if (auto* terrain_shape = get<TerrainShape>()) {
        return &terrain_shape->geometry();
    }
    return nullptr;
}

std::optional<Vec2> Collider::nominal_size() const {
    if (const auto* box_shape = get<BoxShape>()) {
        return box_shape->size;
    }
    if (const auto* capsule_shape = get<CapsuleShape>()) {
        return capsule_shape->size;
    }
    return std::nullopt;
}

}  // namespace creative2d::physics
