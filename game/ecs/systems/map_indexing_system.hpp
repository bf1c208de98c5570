#pragma once

#include "../system.hpp"
#include "../components.hpp"

namespace harvest::game {
class Map;
}

namespace harvest::ecs {

// Rebuilds the map's spatial index from every positioned entity.
class MapIndexingSystem : public System {
public:
    void update(entt::registry& registry) override;
    void set_map(game::Map* map) { map_ = map; }

private:
    game::Map* map_{nullptr};
};

} // namespace harvest::ecs
