#include "level_generator.hpp"
#include "prefabs.hpp"

#include <raylib.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace harvest::game {

LevelGenerator::LevelGenerator(int width, int height)
    : width_(width)
    , height_(height)
{
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("LevelGenerator: dimensions must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
}

std::vector<LevelInsert> LevelGenerator::generate(Rng& rng, int houses, float density, std::uint8_t player_health) {
    if (houses <= 0) {
        throw std::invalid_argument("LevelGenerator: at least one house is required");
    }
    if (!(density >= 0.0f && density <= 1.0f)) {
        throw std::invalid_argument("LevelGenerator: density must be within [0, 1], got " + std::to_string(density));
    }
    if (player_health == 0) {
        throw std::invalid_argument("LevelGenerator: player health must be non-zero");
    }

    const std::int64_t total_tiles = static_cast<std::int64_t>(width_) * height_;
    const std::int64_t settlement_tiles = static_cast<std::int64_t>(houses) * 4;  // house + farm + two walls
    if (settlement_tiles + 1 > total_tiles) {
        throw std::invalid_argument("LevelGenerator: " + std::to_string(houses) + " houses do not fit on a " +
                                    std::to_string(width_) + "x" + std::to_string(height_) + " map");
    }

    Grid grid(static_cast<std::size_t>(height_), std::vector<std::optional<LevelItem>>(static_cast<std::size_t>(width_)));

    auto place = [&grid](std::pair<int, int> at, LevelItemKind kind, std::uint8_t health = 0) {
        grid[static_cast<std::size_t>(at.second)][static_cast<std::size_t>(at.first)] = LevelItem{kind, health};
    };

    // Houses. The first one lands in the central third, the rest 2-3 tiles from another house.
    {
        const int x_lo = width_ / 3;
        const int y_lo = height_ / 3;
        const int x_hi = std::max(x_lo + 1, x_lo * 2);
        const int y_hi = std::max(y_lo + 1, y_lo * 2);

        place({rng.range(x_lo, x_hi), rng.range(y_lo, y_hi)}, LevelItemKind::House);

        for (int added = 1; added < houses; ++added) {
            place(find_somewhat_adjacent_position(rng, 2, 4, LevelItemKind::House, grid), LevelItemKind::House);
        }
    }

    // One farm right next to a house, per house.
    for (int added = 0; added < houses; ++added) {
        place(find_somewhat_adjacent_position(rng, 1, 2, LevelItemKind::House, grid), LevelItemKind::Farm);
    }

    // Two walls per house, each guarding a house or a farm on its outward side.
    for (int added = 0; added < houses * 2; ++added) {
        const LevelItemKind protect = rng.range(0, 2) == 0 ? LevelItemKind::House : LevelItemKind::Farm;
        place(find_adjacent_outwards_facing_position(rng, protect, grid), LevelItemKind::Wall);
    }

    // Trees until the target density is met. One cell always stays free for the player.
    std::int64_t trees = 0;
    {
        auto current_density = [&]() {
            return static_cast<float>(settlement_tiles + trees) / static_cast<float>(total_tiles);
        };

        while (current_density() < density && settlement_tiles + trees + 1 < total_tiles) {
            place(find_any_open_position(rng, grid), LevelItemKind::Tree);
            ++trees;
        }
    }

    // Player near the houses.
    place(find_somewhat_adjacent_position(rng, 1, 3, LevelItemKind::House, grid), LevelItemKind::Player, player_health);

    TraceLog(LOG_INFO, "[level] generated %dx%d: %d houses, %d trees (seed %u)",
             width_, height_, houses, static_cast<int>(trees), rng.seed());

    return convert_to_level_inserts(grid);
}

std::vector<std::pair<int, int>> LevelGenerator::all_items_of_kind_shuffled(Rng& rng, LevelItemKind of,
                                                                            const Grid& grid) const {
    std::vector<std::pair<int, int>> positions;

    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            const auto& cell = grid[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
            if (cell && cell->kind == of) {
                positions.emplace_back(x, y);
            }
        }
    }

    shuffle(rng, positions);
    return positions;
}

std::vector<std::pair<int, int>> LevelGenerator::closest_board_edges(int x, int y) const {
    struct Spot {
        int x;
        int y;
        int distance_to_nearest_edge;
    };

    std::vector<Spot> spots;

    auto add_spot_if_in_bounds = [&](int sx, int sy) {
        if (sx < 0 || sx >= width_ || sy < 0 || sy >= height_) return;
        const int d = std::min({sx, sy, width_ - 1 - sx, height_ - 1 - sy});
        spots.push_back({sx, sy, d});
    };

    add_spot_if_in_bounds(x - 1, y);
    add_spot_if_in_bounds(x + 1, y);
    add_spot_if_in_bounds(x, y - 1);
    add_spot_if_in_bounds(x, y + 1);

    std::stable_sort(spots.begin(), spots.end(), [](const Spot& a, const Spot& b) {
        return a.distance_to_nearest_edge < b.distance_to_nearest_edge;
    });

    std::vector<std::pair<int, int>> out;
    out.reserve(spots.size());
    for (const auto& s : spots) {
        out.emplace_back(s.x, s.y);
    }
    return out;
}

std::pair<int, int> LevelGenerator::find_adjacent_outwards_facing_position(Rng& rng, LevelItemKind of,
                                                                           const Grid& grid) const {
    auto positions = all_items_of_kind_shuffled(rng, of, grid);

    while (!positions.empty()) {
        const auto next = positions.back();
        positions.pop_back();

        for (const auto& [x, y] : closest_board_edges(next.first, next.second)) {
            if (!grid[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)]) {
                return {x, y};
            }
        }
    }

    return find_any_open_position(rng, grid);
}

std::pair<int, int> LevelGenerator::find_somewhat_adjacent_position(Rng& rng, int outside, int within,
                                                                    LevelItemKind of, const Grid& grid) const {
    static constexpr int kOffsets[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

    const auto positions = all_items_of_kind_shuffled(rng, of, grid);

    for (int distance = outside; distance < within; ++distance) {
        for (const auto& [px, py] : positions) {
            for (const auto& offset : kOffsets) {
                const int x = px + offset[0] * distance;
                const int y = py + offset[1] * distance;

                if (x < 0 || x >= width_ || y < 0 || y >= height_) continue;

                if (!grid[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)]) {
                    return {x, y};
                }
            }
        }
    }

    return find_any_open_position(rng, grid);
}

std::pair<int, int> LevelGenerator::find_any_open_position(Rng& rng, const Grid& grid) const {
    std::vector<std::pair<int, int>> positions;

    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            if (!grid[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)]) {
                positions.emplace_back(x, y);
            }
        }
    }

    if (positions.empty()) {
        throw std::runtime_error("LevelGenerator: no open cell left on the map");
    }

    return positions[rng.range(std::size_t{0}, positions.size())];
}

std::vector<LevelInsert> LevelGenerator::convert_to_level_inserts(const Grid& grid) const {
    std::vector<LevelInsert> level;

    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            const auto& cell = grid[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
            if (cell) {
                level.push_back(LevelInsert{ecs::Point{x, y}, *cell});
            }
        }
    }

    return level;
}

std::optional<entt::entity> LevelGenerator::insert(entt::registry& registry, const std::vector<LevelInsert>& level) {
    std::optional<entt::entity> player;

    for (const auto& insert : level) {
        const int x = insert.position.x;
        const int y = insert.position.y;

        switch (insert.item.kind) {
            case LevelItemKind::Player:
                player = create_player(registry, x, y, insert.item.health);
                break;
            case LevelItemKind::Farm:
                create_farm(registry, x, y);
                break;
            case LevelItemKind::House:
                create_house(registry, x, y);
                break;
            case LevelItemKind::Wall:
                create_wall(registry, x, y);
                break;
            case LevelItemKind::Tree:
                create_tree(registry, x, y);
                break;
        }
    }

    return player;
}

} // namespace harvest::game
