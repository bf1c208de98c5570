#include "map.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace harvest::game {

Map::Map(int width, int height)
    : width_(width)
    , height_(height)
{
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Map dimensions must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    cells_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), entt::null);
}

std::optional<entt::entity> Map::get_entity(int x, int y) const {
    if (!in_bounds(x, y)) return std::nullopt;

    const entt::entity e = cells_[index_of(x, y)];
    if (e == entt::null) return std::nullopt;
    return e;
}

bool Map::is_open(int x, int y) const {
    return in_bounds(x, y) && cells_[index_of(x, y)] == entt::null;
}

void Map::clear_index() {
    std::fill(cells_.begin(), cells_.end(), entt::entity{entt::null});
}

void Map::index_entity(int x, int y, entt::entity entity) {
    if (!in_bounds(x, y)) return;
    cells_[index_of(x, y)] = entity;
}

void Map::unindex(int x, int y) {
    if (!in_bounds(x, y)) return;
    cells_[index_of(x, y)] = entt::null;
}

void Map::move_entity(const ecs::Point& from, const ecs::Point& to) {
    if (!in_bounds(from.x, from.y) || !in_bounds(to.x, to.y)) return;

    cells_[index_of(to.x, to.y)] = cells_[index_of(from.x, from.y)];
    cells_[index_of(from.x, from.y)] = entt::null;
}

std::vector<ecs::Point> Map::open_edge_cells() const {
    std::vector<ecs::Point> out;
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            const bool edge = x == 0 || y == 0 || x == width_ - 1 || y == height_ - 1;
            if (edge && cells_[index_of(x, y)] == entt::null) out.push_back({x, y});
        }
    }
    return out;
}

} // namespace harvest::game
