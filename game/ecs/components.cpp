#include "components.hpp"

#include <cmath>

namespace harvest::ecs {

void Position::update(const Point& to) {
    x = to.x;
    y = to.y;
}

double Position::distance(const Position& other) const {
    const int dx = x - other.x;
    const int dy = y - other.y;
    return std::sqrt(static_cast<double>(dx * dx + dy * dy));
}

Point Position::relative(const Position& other) const {
    return Point{x - other.x, y - other.y};
}

Point Position::after(Direction direction) const {
    Point p{x, y};
    switch (direction) {
        case Moving::Up:    p.y -= 1; break;
        case Moving::Down:  p.y += 1; break;
        case Moving::Left:  p.x -= 1; break;
        case Moving::Right: p.x += 1; break;
    }
    return p;
}

const char* glyph_name(Glyph glyph) {
    switch (glyph) {
        case Glyph::Farm:   return "Farm";
        case Glyph::Goblin: return "Goblin";
        case Glyph::House:  return "House";
        case Glyph::Player: return "Player";
        case Glyph::Tree:   return "Tree";
        case Glyph::Wall:   return "Wall";
    }
    return "Unknown";
}

HealthState Health::reduce(std::uint8_t by) {
    amount = (by >= amount) ? 0 : static_cast<std::uint8_t>(amount - by);
    return amount == 0 ? HealthState::Defeated : HealthState::Alive;
}

void Health::increase(std::uint8_t by, std::uint8_t cap) {
    const int next = static_cast<int>(amount) + by;
    amount = static_cast<std::uint8_t>(next > cap ? (amount > cap ? amount : cap) : next);
}

} // namespace harvest::ecs
