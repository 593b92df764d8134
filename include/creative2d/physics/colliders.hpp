// Creative2D Physics Engine
// colliders.hpp - Collider shapes (box, capsule, polygon, tilemap, terrain, line chain)

#pragma once

#include "tile_geometry_builder.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace creative2d::physics {

// ============================================================================
// Primitive Shapes
// ============================================================================

struct BoxShape {
    Vec2 size{50.0, 50.0};
};

enum class CapsuleDirection : uint8_t { Vertical, Horizontal };

struct CapsuleShape {
    Vec2 size{50.0, 50.0};
    CapsuleDirection direction = CapsuleDirection::Vertical;
};

// Vertices in body-local space. Assumed convex.
struct PolygonShape {
    std::vector<Vec2> vertices{{-50.0, -50.0}, {50.0, -50.0}, {50.0, 50.0}, {-50.0, 50.0}};
};

// Open polyline; each consecutive pair of points collides as a thin box
struct LineChainShape {
    std::vector<Vec2> points{{-50.0, 0.0}, {50.0, 0.0}};
};

// ============================================================================
// Tilemap Shape
// ============================================================================

// Occupancy grid centred on the body. Geometry is regenerated lazily after edits.
class TilemapShape {
public:
    static constexpr int DEFAULT_COLUMNS = 30;
    static constexpr int DEFAULT_ROWS = 20;

    explicit TilemapShape(int columns = DEFAULT_COLUMNS, int rows = DEFAULT_ROWS, const Vec2& cell_size = Vec2(32.0));

    [[nodiscard]] int get_columns() const { return columns_; }
    [[nodiscard]] int get_rows() const { return rows_; }
    [[nodiscard]] Vec2 get_cell_size() const { return cell_size_; }
    [[nodiscard]] Vec2 get_extent() const { return Vec2(columns_ * cell_size_.x, rows_ * cell_size_.y); }

    // Existing tiles inside the new bounds are kept
    void resize(int columns, int rows);
    void set_cell_size(const Vec2& cell_size);

    // Out-of-range coordinates are ignored / read as empty
    void set_tile(int column, int row, bool solid);
    [[nodiscard]] bool is_solid(int column, int row) const;
    void fill(int column, int row, int width, int height, bool solid = true);
    void clear();

    [[nodiscard]] bool is_dirty() const { return dirty_; }
    void mark_dirty() { dirty_ = true; }

    // Regenerates first when dirty
    const TileGeometry& geometry();
    [[nodiscard]] const TileGeometry& cached_geometry() const { return geometry_; }

private:
    void regenerate();

    int columns_;
    int rows_;
    Vec2 cell_size_;
    std::vector<uint8_t> cells_;
    TileGeometry geometry_;
    bool dirty_ = true;
};

// ============================================================================
// Terrain Shape
// ============================================================================

enum class TerrainMode : uint8_t { Rectangles, Polygon };

// Alpha mask (one byte per pixel, row-major) centred on the body
class TerrainShape {
public:
    static constexpr int DEFAULT_RESOLUTION = 16;
    static constexpr double DEFAULT_SIMPLIFY_TOLERANCE = 2.0;

    TerrainShape() = default;
    TerrainShape(int width, int height, std::vector<uint8_t> alpha);

    [[nodiscard]] int get_width() const { return width_; }
    [[nodiscard]] int get_height() const { return height_; }
    [[nodiscard]] const std::vector<uint8_t>& get_alpha() const { return alpha_; }

    void set_mask(int width, int height, std::vector<uint8_t> alpha);
    void set_alpha(int x, int y, uint8_t alpha);
    [[nodiscard]] uint8_t get_alpha(int x, int y) const;

    // Paint a filled circle, as a brush would
    void paint_circle(const Vec2& center, double radius, uint8_t alpha = 255);

    [[nodiscard]] TerrainMode get_mode() const { return mode_; }
    void set_mode(TerrainMode mode);

    [[nodiscard]] int get_resolution() const { return resolution_; }
    void set_resolution(int resolution);

    [[nodiscard]] double get_simplify_tolerance() const { return simplify_tolerance_; }
    void set_simplify_tolerance(double tolerance);

    [[nodiscard]] bool is_dirty() const { return dirty_; }
    void mark_dirty() { dirty_ = true; }

    const TileGeometry& geometry();
    [[nodiscard]] const TileGeometry& cached_geometry() const { return geometry_; }

private:
    void regenerate();

    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> alpha_;
    TerrainMode mode_ = TerrainMode::Rectangles;
    int resolution_ = DEFAULT_RESOLUTION;
    double simplify_tolerance_ = DEFAULT_SIMPLIFY_TOLERANCE;
    TileGeometry geometry_;
    bool dirty_ = true;
};

// ============================================================================
// Collider
// ============================================================================

// Order matches the alternatives of Collider::Shape
enum class ShapeKind : uint8_t { Box, Capsule, Polygon, Tilemap, Terrain, LineChain };

[[nodiscard]] const char* to_string(ShapeKind kind);

struct Collider {
    using Shape = std::variant<BoxShape, CapsuleShape, PolygonShape, TilemapShape, TerrainShape, LineChainShape>;

    Shape shape = BoxShape{};
    Vec2 offset{0.0};
    bool is_trigger = false;

    Collider() = default;
    explicit Collider(Shape s, const Vec2& local_offset = Vec2(0.0), bool trigger = false)
        : shape(std::move(s)), offset(local_offset), is_trigger(trigger) {}

    [[nodiscard]] static Collider box(const Vec2& size = Vec2(50.0), bool trigger = false);
    [[nodiscard]] static Collider capsule(const Vec2& size = Vec2(50.0),
                                          CapsuleDirection direction = CapsuleDirection::Vertical);
    [[nodiscard]] static Collider polygon(std::vector<Vec2> vertices);
    [[nodiscard]] static Collider line_chain(std::vector<Vec2> points);
    [[nodiscard]] static Collider tilemap(TilemapShape source);
    [[nodiscard]] static Collider terrain(TerrainShape source);

    [[nodiscard]] ShapeKind kind() const { return static_cast<ShapeKind>(shape.index()); }

    // Tilemap and terrain colliders produce their geometry from a source
    [[nodiscard]] bool is_generated() const { return kind() == ShapeKind::Tilemap || kind() == ShapeKind::Terrain; }

    // Generated geometry, regenerating if dirty. nullptr for other shapes.
    const TileGeometry* generated_geometry();

    // Box and capsule size before scaling. Used for inertia and buoyancy reach.
    [[nodiscard]] std::optional<Vec2> nominal_size() const;

    template<typename T>
    [[nodiscard]] T* get() {
        return std::get_if<T>(&shape);
    }

    template<typename T>
    [[nodiscard]] const T* get() const {
        return std::get_if<T>(&shape);
    }
};

}  // namespace creative2d::physics
