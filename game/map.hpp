#pragma once

#include "ecs/components.hpp"

#include <entt/entt.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace harvest::game {

// Grid bounds plus a spatial index of blocking entities (one per cell).
class Map {
public:
    Map(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    bool in_bounds(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    // Entity occupying the cell, if any. Out of bounds is always empty.
    std::optional<entt::entity> get_entity(int x, int y) const;

    bool is_open(int x, int y) const;

    void clear_index();
    void index_entity(int x, int y, entt::entity entity);
    void unindex(int x, int y);

    // Moves whatever occupies `from` to `to`. The destination must be open.
    void move_entity(const ecs::Point& from, const ecs::Point& to);

    std::vector<ecs::Point> open_edge_cells() const;

private:
    std::size_t index_of(int x, int y) const {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
    }

    int width_{0};
    int height_{0};
    std::vector<entt::entity> cells_;
};

} // namespace harvest::game
