#pragma once

// =============================================================================
// AI System - chooses a move for every AI-driven entity on the monster turn
// =============================================================================
//
// A monster standing next to the player always turns on the player.
// Otherwise the behaviour follows the entity's AI component:
//   Wander            - random direction
//   PrioritizeTown    - toward the nearest Town entity (player when none left)
//   PrioritizePlayer  - toward the player
//
// The chosen direction is attached as a Moving component; melee conversion
// and movement resolve it afterwards.
//

#include "../system.hpp"
#include "../components.hpp"
#include "../../run_state.hpp"

namespace harvest::game {
class Rng;
}

namespace harvest::ecs {

class AISystem : public System {
public:
    void update(entt::registry& registry) override;

    void set_rng(game::Rng* rng) { rng_ = rng; }
    void set_run_state(const game::RunState* state) { state_ = state; }

    // Greedy step from one cell toward another, larger axis first.
    static Direction best_direction(const Position& from, const Position& to);

private:
    Direction wander();

    game::Rng* rng_{nullptr};
    const game::RunState* state_{nullptr};
};

} // namespace harvest::ecs
