/**
 * @file test_tree_growth.cpp
 * @brief Unit tests for tree regrowth between rounds.
 */

#include <catch2/catch_test_macros.hpp>

#include "ecs/systems/tree_growth_system.hpp"
#include "helpers/test_utils.hpp"
#include "prefabs.hpp"
#include "rng.hpp"

using namespace harvest;
using namespace harvest::ecs;
using namespace harvest::game;
using test_helpers::seeds::DEFAULT_TEST_SEED;

TEST_CASE("Trees grow on the monster turn", "[trees]") {
    test_helpers::Board board;
    Rng rng(DEFAULT_TEST_SEED);
    const auto tree = create_tree(board.registry, 1, 1);

    TreeGrowthSystem growth;
    growth.set_rng(&rng);
    growth.set_run_state(&board.state);
    growth.set_growth_chance_percent(100);

    growth.update(board.registry);
    REQUIRE(board.registry.get<Health>(tree).amount == kTreeHealth + 1);
}

TEST_CASE("Trees stop growing at the cap", "[trees]") {
    test_helpers::Board board;
    Rng rng(DEFAULT_TEST_SEED);
    const auto tree = create_tree(board.registry, 1, 1);

    TreeGrowthSystem growth;
    growth.set_rng(&rng);
    growth.set_run_state(&board.state);
    growth.set_growth_chance_percent(100);
    growth.set_max_health(3);

    for (int i = 0; i < 10; ++i) {
        growth.update(board.registry);
    }
    REQUIRE(board.registry.get<Health>(tree).amount == 3);
}

TEST_CASE("Tree growth leaves other entities alone", "[trees]") {
    test_helpers::Board board;
    Rng rng(DEFAULT_TEST_SEED);
    const auto house = create_house(board.registry, 2, 2);
    const auto player = create_player(board.registry, 3, 3, 4);

    TreeGrowthSystem growth;
    growth.set_rng(&rng);
    growth.set_run_state(&board.state);
    growth.set_growth_chance_percent(100);

    growth.update(board.registry);

    REQUIRE(board.registry.get<Health>(house).amount == kHouseHealth);
    REQUIRE(board.registry.get<Health>(player).amount == 4);
}

TEST_CASE("Tree growth respects chance and phase", "[trees]") {
    test_helpers::Board board;
    Rng rng(DEFAULT_TEST_SEED);
    const auto tree = create_tree(board.registry, 1, 1);

    TreeGrowthSystem growth;
    growth.set_rng(&rng);
    growth.set_run_state(&board.state);

    SECTION("Zero chance") {
        growth.set_growth_chance_percent(0);
        growth.update(board.registry);
    }

    SECTION("Player turn") {
        growth.set_growth_chance_percent(100);
        board.state = RunState::PlayerTurn;
        growth.update(board.registry);
    }

    REQUIRE(board.registry.get<Health>(tree).amount == kTreeHealth);
}
