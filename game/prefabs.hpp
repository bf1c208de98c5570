#pragma once

#include "ecs/components.hpp"

#include <entt/entt.hpp>

#include <cstdint>

namespace harvest::game {

// Default starting health per entity kind.
inline constexpr std::uint8_t kFarmHealth = 1;
inline constexpr std::uint8_t kHouseHealth = 2;
inline constexpr std::uint8_t kWallHealth = 3;
inline constexpr std::uint8_t kTreeHealth = 1;
inline constexpr std::uint8_t kGoblinHealth = 2;

// Entity factories. None of them touch the map index.
entt::entity create_player(entt::registry& registry, int x, int y, std::uint8_t health);
entt::entity create_goblin(entt::registry& registry, int x, int y, ecs::AI ai,
                           std::uint8_t health = kGoblinHealth);
entt::entity create_farm(entt::registry& registry, int x, int y);
entt::entity create_house(entt::registry& registry, int x, int y);
entt::entity create_wall(entt::registry& registry, int x, int y);
entt::entity create_tree(entt::registry& registry, int x, int y);

} // namespace harvest::game
