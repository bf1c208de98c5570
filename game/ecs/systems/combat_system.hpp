#pragma once

// =============================================================================
// Combat systems
// =============================================================================
//
// A turn resolves combat in four passes:
//   MeleeConversionSystem  - a move into an occupied cell becomes an attack
//   ApplyAttackSystem      - every attack removes one health from its target
//   DefeatSystem           - zero health swaps Health for Defeated
//   RemoveDefeatedSystem   - defeated entities leave the world
//

#include "../system.hpp"
#include "../components.hpp"

namespace harvest::game {
class Map;
class Logs;
}

namespace harvest::ecs {

class MeleeConversionSystem : public System {
public:
    void update(entt::registry& registry) override;
    void set_map(const game::Map* map) { map_ = map; }

private:
    const game::Map* map_{nullptr};
};

class ApplyAttackSystem : public System {
public:
    void update(entt::registry& registry) override;
    void set_logs(game::Logs* logs) { logs_ = logs; }

private:
    game::Logs* logs_{nullptr};
};

class DefeatSystem : public System {
public:
    void update(entt::registry& registry) override;
};

class RemoveDefeatedSystem : public System {
public:
    void update(entt::registry& registry) override;
    void set_map(game::Map* map) { map_ = map; }

private:
    game::Map* map_{nullptr};
};

} // namespace harvest::ecs
