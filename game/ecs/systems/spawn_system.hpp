#pragma once

#include "../system.hpp"
#include "../components.hpp"
#include "../../run_state.hpp"

namespace harvest::game {
class Map;
class Logs;
class Rng;
}

namespace harvest::ecs {

// Brings new goblins in from the map edges at the end of each round.
class SpawnSystem : public System {
public:
    void update(entt::registry& registry) override;

    void set_map(game::Map* map) { map_ = map; }
    void set_logs(game::Logs* logs) { logs_ = logs; }
    void set_rng(game::Rng* rng) { rng_ = rng; }
    void set_run_state(const game::RunState* state) { state_ = state; }

    void set_spawn_chance_percent(int percent) { chance_percent_ = percent; }
    void set_max_goblins(int max_goblins) { max_goblins_ = max_goblins; }

private:
    AI pick_ai();

    game::Map* map_{nullptr};
    game::Logs* logs_{nullptr};
    game::Rng* rng_{nullptr};
    const game::RunState* state_{nullptr};

    int chance_percent_{25};
    int max_goblins_{6};
};

} // namespace harvest::ecs
