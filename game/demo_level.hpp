#pragma once

#include <entt/entt.hpp>

#include <array>
#include <string_view>

namespace harvest::game {

inline constexpr int kDemoLevelSize = 12;

// 'G' goblin, 'F' farm, 'H' house, 'W' wall, '@' player, anything else empty.
using DemoLayout = std::array<std::string_view, kDemoLevelSize>;

const DemoLayout& demo_layout();

// Spawns a hand-made layout and returns the player entity.
// Throws std::runtime_error when the layout has no '@'.
entt::entity spawn_demo(entt::registry& registry, const DemoLayout& layout = demo_layout());

} // namespace harvest::game
