#pragma once

#include <entt/entt.hpp>

#include <cstdint>

namespace harvest::ecs {

// ============================================================================
// Spatial Components
// ============================================================================

struct Point {
    int x{0};
    int y{0};

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// One-step move request. Attached as a component and consumed by MovementSystem.
enum class Moving : std::uint8_t {
    Up,
    Down,
    Left,
    Right
};

using Direction = Moving;

// Logical cell position on the map.
struct Position {
    int x{0};
    int y{0};

    Position() = default;
    Position(int px, int py) : x(px), y(py) {}

    Point to_point() const { return Point{x, y}; }
    void update(const Point& to);

    // Euclidean distance between the two cells.
    double distance(const Position& other) const;

    // This position relative to another one, e.g. {1, 6}.relative({3, 2}) == {-2, 4}.
    Point relative(const Position& other) const;

    // Neighbouring cell in the given direction. No bounds check.
    Point after(Direction direction) const;
};

// ============================================================================
// Rendering Components
// ============================================================================

enum class Glyph : std::uint8_t {
    Farm,
    Goblin,
    House,
    Player,
    Tree,
    Wall
};

const char* glyph_name(Glyph glyph);

struct Renderable {
    Glyph glyph{Glyph::Player};
};

// ============================================================================
// Role Tags
// ============================================================================

struct Player {};

struct Monster {};

// Houses, farms and walls: what the goblins raid.
struct Town {};

enum class AI : std::uint8_t {
    Wander,
    PrioritizeTown,
    PrioritizePlayer
};

// ============================================================================
// Combat Components
// ============================================================================

struct Attacking {
    entt::entity target{entt::null};
};

enum class HealthState : std::uint8_t {
    Alive,
    Defeated
};

struct Health {
    std::uint8_t amount{1};

    Health() = default;
    explicit Health(std::uint8_t a) : amount(a) {}

    // Saturating decrease; reports whether the entity is now defeated.
    HealthState reduce(std::uint8_t by);

    // Saturating increase, never above cap.
    void increase(std::uint8_t by, std::uint8_t cap = 255);
};

struct Defeated {};

} // namespace harvest::ecs
