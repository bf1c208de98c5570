#pragma once

#include "../system.hpp"
#include "../components.hpp"
#include "../../run_state.hpp"

#include <cstdint>

namespace harvest::game {
class Rng;
}

namespace harvest::ecs {

// Trees regrow a little health at the end of each round.
class TreeGrowthSystem : public System {
public:
    void update(entt::registry& registry) override;

    void set_rng(game::Rng* rng) { rng_ = rng; }
    void set_run_state(const game::RunState* state) { state_ = state; }

    void set_growth_chance_percent(int percent) { chance_percent_ = percent; }
    void set_max_health(std::uint8_t max_health) { max_health_ = max_health; }

private:
    game::Rng* rng_{nullptr};
    const game::RunState* state_{nullptr};
    int chance_percent_{20};
    std::uint8_t max_health_{5};
};

} // namespace harvest::ecs
