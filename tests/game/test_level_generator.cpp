/**
 * @file test_level_generator.cpp
 * @brief Unit tests for settlement layout generation and insertion.
 *
 * Tests parameter validation, layout invariants across seeds, and spawning
 * a layout into a registry.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/test_utils.hpp"
#include "level_generator.hpp"
#include "prefabs.hpp"

#include <algorithm>
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace harvest;
using namespace harvest::game;
using namespace test_helpers::seeds;

namespace {

std::size_t count_kind(const std::vector<LevelInsert>& level, LevelItemKind kind) {
    return static_cast<std::size_t>(std::count_if(level.begin(), level.end(), [kind](const LevelInsert& i) {
        return i.item.kind == kind;
    }));
}

// Same row or column, with a Manhattan distance in [lo, hi].
bool orthogonal_within(const LevelInsert& a, const LevelInsert& b, int lo, int hi) {
    const int dx = std::abs(a.position.x - b.position.x);
    const int dy = std::abs(a.position.y - b.position.y);
    if (dx != 0 && dy != 0) return false;
    return dx + dy >= lo && dx + dy <= hi;
}

const LevelInsert* find_kind(const std::vector<LevelInsert>& level, LevelItemKind kind) {
    for (const auto& i : level) {
        if (i.item.kind == kind) return &i;
    }
    return nullptr;
}

} // namespace

// =============================================================================
// Parameter validation
// =============================================================================

TEST_CASE("LevelGenerator rejects non-positive dimensions", "[level][validation]") {
    REQUIRE_THROWS_AS(LevelGenerator(0, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(LevelGenerator(10, 0), std::invalid_argument);
}

TEST_CASE("LevelGenerator::generate rejects bad parameters", "[level][validation]") {
    LevelGenerator generator(10, 10);
    Rng rng(DEFAULT_TEST_SEED);

    SECTION("No houses") {
        REQUIRE_THROWS_AS(generator.generate(rng, 0, 0.3f), std::invalid_argument);
    }

    SECTION("Density below zero") {
        REQUIRE_THROWS_AS(generator.generate(rng, 2, -0.1f), std::invalid_argument);
    }

    SECTION("Density above one") {
        REQUIRE_THROWS_AS(generator.generate(rng, 2, 1.5f), std::invalid_argument);
    }

    SECTION("Zero player health") {
        REQUIRE_THROWS_AS(generator.generate(rng, 2, 0.3f, 0), std::invalid_argument);
    }

    SECTION("Settlement larger than the map") {
        LevelGenerator tiny(3, 3);
        REQUIRE_THROWS_AS(tiny.generate(rng, 3, 0.0f), std::invalid_argument);
    }

    SECTION("House count large enough to overflow a 32-bit tile count") {
        LevelGenerator wide(1000, 1000);
        REQUIRE_THROWS_AS(wide.generate(rng, 1000000000, 0.0f), std::invalid_argument);
    }
}

// =============================================================================
// Layout invariants
// =============================================================================

TEST_CASE("Generated level has the expected population", "[level][generate]") {
    const int width = 16;
    const int height = 16;
    const int houses = 3;
    const float density = 0.25f;

    for (std::uint32_t seed : {DEFAULT_TEST_SEED, SMALL_MAP_SEED, LARGE_MAP_SEED, 1u, 2u, 3u}) {
        LevelGenerator generator(width, height);
        Rng rng(seed);
        const auto level = generator.generate(rng, houses, density, 7);

        REQUIRE(count_kind(level, LevelItemKind::House) == 3);
        REQUIRE(count_kind(level, LevelItemKind::Farm) == 3);
        REQUIRE(count_kind(level, LevelItemKind::Wall) == 6);
        REQUIRE(count_kind(level, LevelItemKind::Player) == 1);

        const auto* player = find_kind(level, LevelItemKind::Player);
        REQUIRE(player != nullptr);
        REQUIRE(player->item.health == 7);

        // Everything except the player counts toward density.
        const float occupied = static_cast<float>(level.size() - 1) / static_cast<float>(width * height);
        REQUIRE(occupied >= density);

        std::set<std::pair<int, int>> cells;
        for (const auto& insert : level) {
            REQUIRE(insert.position.x >= 0);
            REQUIRE(insert.position.x < width);
            REQUIRE(insert.position.y >= 0);
            REQUIRE(insert.position.y < height);
            cells.emplace(insert.position.x, insert.position.y);
        }
        REQUIRE(cells.size() == level.size());
    }
}

TEST_CASE("Zero density places no trees", "[level][generate]") {
    LevelGenerator generator(12, 12);
    Rng rng(DEFAULT_TEST_SEED);

    const auto level = generator.generate(rng, 2, 0.0f);

    REQUIRE(count_kind(level, LevelItemKind::Tree) == 0);
    REQUIRE(level.size() == 2 * 4 + 1);
}

TEST_CASE("Full density still leaves room for the player", "[level][generate]") {
    LevelGenerator generator(6, 6);
    Rng rng(SMALL_MAP_SEED);

    const auto level = generator.generate(rng, 1, 1.0f);

    REQUIRE(level.size() == 36);
    REQUIRE(count_kind(level, LevelItemKind::Player) == 1);
    REQUIRE(count_kind(level, LevelItemKind::Tree) == 36 - 4 - 1);
}

TEST_CASE("A settlement that exactly fits fills the map", "[level][generate]") {
    LevelGenerator generator(3, 3);
    Rng rng(SMALL_MAP_SEED);

    const auto level = generator.generate(rng, 2, 0.5f);

    REQUIRE(level.size() == 9);
    REQUIRE(count_kind(level, LevelItemKind::Tree) == 0);
    REQUIRE(count_kind(level, LevelItemKind::Player) == 1);
}

TEST_CASE("First house lands in the central third", "[level][generate]") {
    for (std::uint32_t seed = 1; seed <= 20; ++seed) {
        LevelGenerator generator(15, 15);
        Rng rng(seed);
        const auto level = generator.generate(rng, 1, 0.0f);

        const auto* house = find_kind(level, LevelItemKind::House);
        REQUIRE(house != nullptr);
        REQUIRE(house->position.x >= 5);
        REQUIRE(house->position.x < 10);
        REQUIRE(house->position.y >= 5);
        REQUIRE(house->position.y < 10);
    }
}

TEST_CASE("Farms sit next to a house", "[level][generate]") {
    LevelGenerator generator(16, 16);
    Rng rng(LARGE_MAP_SEED);
    const auto level = generator.generate(rng, 3, 0.0f);

    for (const auto& farm : level) {
        if (farm.item.kind != LevelItemKind::Farm) continue;

        bool beside_house = false;
        for (const auto& house : level) {
            if (house.item.kind != LevelItemKind::House) continue;
            const int d = std::abs(farm.position.x - house.position.x) + std::abs(farm.position.y - house.position.y);
            beside_house = beside_house || d == 1;
        }
        REQUIRE(beside_house);
    }
}

TEST_CASE("Houses cluster two to three tiles apart", "[level][generate]") {
    for (std::uint32_t seed = 1; seed <= 20; ++seed) {
        LevelGenerator generator(20, 20);
        Rng rng(seed);
        const auto level = generator.generate(rng, 4, 0.0f);

        for (const auto& house : level) {
            if (house.item.kind != LevelItemKind::House) continue;

            bool near_other_house = false;
            for (const auto& other : level) {
                if (other.item.kind != LevelItemKind::House || &other == &house) continue;
                near_other_house = near_other_house || orthogonal_within(house, other, 2, 3);
            }
            REQUIRE(near_other_house);
        }
    }
}

TEST_CASE("Walls sit next to a house or farm", "[level][generate]") {
    for (std::uint32_t seed = 1; seed <= 20; ++seed) {
        LevelGenerator generator(20, 20);
        Rng rng(seed);
        const auto level = generator.generate(rng, 2, 0.0f);

        for (const auto& wall : level) {
            if (wall.item.kind != LevelItemKind::Wall) continue;

            bool guards_building = false;
            for (const auto& building : level) {
                if (building.item.kind != LevelItemKind::House && building.item.kind != LevelItemKind::Farm) continue;
                guards_building = guards_building || orthogonal_within(wall, building, 1, 1);
            }
            REQUIRE(guards_building);
        }
    }
}

TEST_CASE("Player starts one or two tiles from a house", "[level][generate]") {
    for (std::uint32_t seed = 1; seed <= 20; ++seed) {
        LevelGenerator generator(20, 20);
        Rng rng(seed);
        const auto level = generator.generate(rng, 3, 0.0f);

        const auto* player = find_kind(level, LevelItemKind::Player);
        REQUIRE(player != nullptr);

        bool near_house = false;
        for (const auto& house : level) {
            if (house.item.kind != LevelItemKind::House) continue;
            near_house = near_house || orthogonal_within(*player, house, 1, 2);
        }
        REQUIRE(near_house);
    }
}

TEST_CASE("Same seed generates the same level", "[level][determinism]") {
    LevelGenerator generator(16, 16);
    Rng a(DEFAULT_TEST_SEED);
    Rng b(DEFAULT_TEST_SEED);

    const auto first = generator.generate(a, 3, 0.3f);
    const auto second = generator.generate(b, 3, 0.3f);

    REQUIRE(first.size() == second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        REQUIRE(first[i].position == second[i].position);
        REQUIRE(first[i].item == second[i].item);
    }
}

// =============================================================================
// Helpers
// =============================================================================

TEST_CASE("closest_board_edges orders neighbours by edge distance", "[level][helpers]") {
    LevelGenerator generator(10, 10);

    SECTION("Near the left edge") {
        const auto spots = generator.closest_board_edges(1, 5);
        REQUIRE(spots.size() == 4);
        REQUIRE(spots.front() == std::make_pair(0, 5));
    }

    SECTION("Near the bottom edge") {
        const auto spots = generator.closest_board_edges(5, 8);
        REQUIRE(spots.size() == 4);
        REQUIRE(spots.front() == std::make_pair(5, 9));
    }

    SECTION("Corner drops out-of-bounds neighbours") {
        const auto spots = generator.closest_board_edges(0, 0);
        REQUIRE(spots.size() == 2);
    }
}

TEST_CASE("LevelGenerator::shuffle keeps every element", "[level][helpers]") {
    Rng rng(DEFAULT_TEST_SEED);
    std::vector<int> items = {1, 2, 3, 4, 5, 6, 7, 8};

    LevelGenerator::shuffle(rng, items);

    std::vector<int> sorted = items;
    std::sort(sorted.begin(), sorted.end());
    REQUIRE(sorted == std::vector<int>{1, 2, 3, 4, 5, 6, 7, 8});
}

// =============================================================================
// Insertion
// =============================================================================

TEST_CASE("LevelGenerator::insert spawns every item", "[level][insert]") {
    entt::registry registry;

    const std::vector<LevelInsert> level = {
        {{0, 0}, {LevelItemKind::House, 0}},
        {{1, 0}, {LevelItemKind::Farm, 0}},
        {{2, 0}, {LevelItemKind::Wall, 0}},
        {{3, 0}, {LevelItemKind::Tree, 0}},
        {{4, 0}, {LevelItemKind::Player, 9}},
    };

    const auto player = LevelGenerator::insert(registry, level);
    REQUIRE(player.has_value());

    REQUIRE(registry.all_of<ecs::Player>(*player));
    REQUIRE(registry.get<ecs::Health>(*player).amount == 9);
    REQUIRE(registry.get<ecs::Position>(*player).x == 4);

    REQUIRE(test_helpers::count_with<ecs::Town>(registry) == 3);
    REQUIRE(test_helpers::count_glyph(registry, ecs::Glyph::Tree) == 1);

    auto view = registry.view<ecs::Renderable, ecs::Health>();
    for (auto entity : view) {
        const auto glyph = view.get<ecs::Renderable>(entity).glyph;
        const auto amount = view.get<ecs::Health>(entity).amount;
        switch (glyph) {
            case ecs::Glyph::House: REQUIRE(amount == kHouseHealth); break;
            case ecs::Glyph::Farm:  REQUIRE(amount == kFarmHealth); break;
            case ecs::Glyph::Wall:  REQUIRE(amount == kWallHealth); break;
            case ecs::Glyph::Tree:  REQUIRE(amount == kTreeHealth); break;
            default: break;
        }
    }
}

TEST_CASE("LevelGenerator::insert without a player", "[level][insert]") {
    entt::registry registry;
    const std::vector<LevelInsert> level = {
        {{0, 0}, {LevelItemKind::Tree, 0}},
    };

    REQUIRE_FALSE(LevelGenerator::insert(registry, level).has_value());
}
