#include "tree_growth_system.hpp"
#include "../../rng.hpp"

namespace harvest::ecs {

void TreeGrowthSystem::update(entt::registry& registry) {
    if (!rng_ || !state_ || *state_ != game::RunState::MonsterTurn) return;

    auto view = registry.view<Health, Renderable>();
    for (auto entity : view) {
        if (view.get<Renderable>(entity).glyph != Glyph::Tree) continue;

        if (rng_->roll_percent(chance_percent_)) {
            view.get<Health>(entity).increase(1, max_health_);
        }
    }
}

} // namespace harvest::ecs
