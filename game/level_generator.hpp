#pragma once

#include "ecs/components.hpp"
#include "rng.hpp"

#include <entt/entt.hpp>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace harvest::game {

enum class LevelItemKind : std::uint8_t {
    Player,
    Farm,
    House,
    Tree,
    Wall
};

struct LevelItem {
    LevelItemKind kind{LevelItemKind::Tree};
    std::uint8_t health{0};  // Player only; other kinds use their prefab default.

    bool operator==(const LevelItem& other) const { return kind == other.kind && health == other.health; }
};

struct LevelInsert {
    ecs::Point position{};
    LevelItem item{};
};

// Builds a settlement layout: houses, farms, walls, trees, then the player.
class LevelGenerator {
public:
    using Grid = std::vector<std::vector<std::optional<LevelItem>>>;

    // Throws std::invalid_argument when either dimension is not positive.
    LevelGenerator(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    /**
     * @brief Generate a level.
     *
     * @param houses Number of houses (> 0). Each house also brings one farm and two walls.
     * @param density Target fraction of occupied cells in [0, 1]; trees fill the gap.
     * @param player_health Starting health of the player.
     * @throws std::invalid_argument on bad parameters or when the settlement cannot fit.
     */
    std::vector<LevelInsert> generate(Rng& rng, int houses, float density, std::uint8_t player_health = 5);

    // Spawns the inserts into an empty registry. Returns the player entity if one was placed.
    static std::optional<entt::entity> insert(entt::registry& registry, const std::vector<LevelInsert>& level);

    template <typename T>
    static void shuffle(Rng& rng, std::vector<T>& items);

    // Random open cell exactly `outside`..`within - 1` orthogonal steps from an item of `of`.
    std::pair<int, int> find_somewhat_adjacent_position(Rng& rng, int outside, int within,
                                                        LevelItemKind of, const Grid& grid) const;

    // Neighbours of (x, y), nearest to a board edge first.
    std::vector<std::pair<int, int>> closest_board_edges(int x, int y) const;

private:
    std::vector<std::pair<int, int>> all_items_of_kind_shuffled(Rng& rng, LevelItemKind of, const Grid& grid) const;
    std::pair<int, int> find_adjacent_outwards_facing_position(Rng& rng, LevelItemKind of, const Grid& grid) const;
    std::pair<int, int> find_any_open_position(Rng& rng, const Grid& grid) const;
    std::vector<LevelInsert> convert_to_level_inserts(const Grid& grid) const;

    int width_;
    int height_;
};

template <typename T>
void LevelGenerator::shuffle(Rng& rng, std::vector<T>& items) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        const std::size_t j = rng.range(std::size_t{0}, items.size());
        std::swap(items[i], items[j]);
    }
}

} // namespace harvest::game
