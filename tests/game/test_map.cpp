/**
 * @file test_map.cpp
 * @brief Unit tests for map bounds and the spatial index.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/test_utils.hpp"
#include "map.hpp"
#include "prefabs.hpp"

#include <stdexcept>

using namespace harvest;
using namespace harvest::game;

namespace {

int count_open(const Map& map) {
    int open = 0;
    for (int y = 0; y < map.height(); ++y) {
        for (int x = 0; x < map.width(); ++x) {
            if (map.is_open(x, y)) ++open;
        }
    }
    return open;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEST_CASE("Map rejects non-positive dimensions", "[map]") {
    REQUIRE_THROWS_AS(Map(0, 5), std::invalid_argument);
    REQUIRE_THROWS_AS(Map(5, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(Map(-3, 4), std::invalid_argument);
}

TEST_CASE("Map starts with every cell open", "[map]") {
    Map map(4, 3);

    REQUIRE(map.width() == 4);
    REQUIRE(map.height() == 3);

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 4; ++x) {
            REQUIRE(map.is_open(x, y));
            REQUIRE_FALSE(map.get_entity(x, y).has_value());
        }
    }
}

// =============================================================================
// Bounds
// =============================================================================

TEST_CASE("Map::in_bounds", "[map][bounds]") {
    Map map(5, 4);

    REQUIRE(map.in_bounds(0, 0));
    REQUIRE(map.in_bounds(4, 3));
    REQUIRE_FALSE(map.in_bounds(5, 0));
    REQUIRE_FALSE(map.in_bounds(0, 4));
    REQUIRE_FALSE(map.in_bounds(-1, 0));
    REQUIRE_FALSE(map.in_bounds(0, -1));
}

TEST_CASE("Out-of-bounds cells are never open", "[map][bounds]") {
    Map map(3, 3);

    REQUIRE_FALSE(map.is_open(-1, 1));
    REQUIRE_FALSE(map.is_open(3, 1));
    REQUIRE_FALSE(map.get_entity(10, 10).has_value());
}

// =============================================================================
// Spatial index
// =============================================================================

TEST_CASE("Map indexes and unindexes entities", "[map][index]") {
    entt::registry registry;
    Map map(4, 4);
    const auto e = registry.create();

    map.index_entity(2, 1, e);
    REQUIRE_FALSE(map.is_open(2, 1));
    REQUIRE(map.get_entity(2, 1) == e);

    map.unindex(2, 1);
    REQUIRE(map.is_open(2, 1));
}

TEST_CASE("Map::move_entity transfers occupancy", "[map][index]") {
    entt::registry registry;
    Map map(4, 4);
    const auto e = registry.create();

    map.index_entity(0, 0, e);
    map.move_entity({0, 0}, {1, 0});

    REQUIRE(map.is_open(0, 0));
    REQUIRE(map.get_entity(1, 0) == e);
}

TEST_CASE("Map::clear_index empties every cell", "[map][index]") {
    entt::registry registry;
    Map map(3, 3);
    map.index_entity(0, 0, registry.create());
    map.index_entity(2, 2, registry.create());

    map.clear_index();

    REQUIRE(count_open(map) == 9);
}

TEST_CASE("Map::open_edge_cells skips the interior and occupied cells", "[map][index]") {
    entt::registry registry;
    Map map(3, 3);

    // 3x3 has 8 edge cells around a single interior cell.
    REQUIRE(map.open_edge_cells().size() == 8);

    map.index_entity(0, 0, registry.create());
    map.index_entity(1, 1, registry.create());

    const auto edges = map.open_edge_cells();
    REQUIRE(edges.size() == 7);
    for (const auto& p : edges) {
        REQUIRE_FALSE((p.x == 1 && p.y == 1));
        REQUIRE_FALSE((p.x == 0 && p.y == 0));
    }
}

TEST_CASE("MapIndexingSystem rebuilds the index from positions", "[map][index][systems]") {
    test_helpers::Board board(5, 5);

    const auto house = create_house(board.registry, 1, 2);
    const auto tree = create_tree(board.registry, 4, 4);

    // Stale entry from a previous turn.
    board.map.index_entity(0, 0, house);

    board.reindex();

    REQUIRE(board.map.is_open(0, 0));
    REQUIRE(board.map.get_entity(1, 2) == house);
    REQUIRE(board.map.get_entity(4, 4) == tree);
    REQUIRE(count_open(board.map) == 23);
}
