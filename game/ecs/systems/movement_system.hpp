#pragma once

#include "../system.hpp"
#include "../components.hpp"

namespace harvest::game {
class Map;
}

namespace harvest::ecs {

// Applies pending one-step moves. Blocked or off-map moves are dropped.
class MovementSystem : public System {
public:
    void update(entt::registry& registry) override;
    void set_map(game::Map* map) { map_ = map; }

private:
    game::Map* map_{nullptr};
};

} // namespace harvest::ecs
