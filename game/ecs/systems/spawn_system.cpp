#include "spawn_system.hpp"
#include "../../logs.hpp"
#include "../../map.hpp"
#include "../../prefabs.hpp"
#include "../../rng.hpp"

#include <raylib.h>

#include <array>

namespace harvest::ecs {

AI SpawnSystem::pick_ai() {
    // Raiders are twice as common as hunters or wanderers.
    static const std::array<AI, 4> kWeighted = {
        AI::PrioritizeTown, AI::PrioritizeTown, AI::PrioritizePlayer, AI::Wander
    };
    return rng_->random_entry(kWeighted);
}

void SpawnSystem::update(entt::registry& registry) {
    if (!map_ || !rng_ || !state_ || *state_ != game::RunState::MonsterTurn) return;

    int goblins = 0;
    for (auto entity : registry.view<Monster>()) {
        (void)entity;
        ++goblins;
    }
    if (goblins >= max_goblins_) return;

    if (!rng_->roll_percent(chance_percent_)) return;

    const auto edges = map_->open_edge_cells();
    if (edges.empty()) {
        TraceLog(LOG_DEBUG, "[spawn] no open edge cell, skipping");
        return;
    }

    const Point at = rng_->random_entry(edges);
    const AI ai = pick_ai();

    auto goblin = game::create_goblin(registry, at.x, at.y, ai);
    map_->index_entity(at.x, at.y, goblin);

    TraceLog(LOG_INFO, "[spawn] goblin at (%d,%d), ai=%d", at.x, at.y, static_cast<int>(ai));

    if (logs_) {
        game::SpawnedMessage msg;
        msg.glyph = Glyph::Goblin;
        msg.position = at;
        logs_->add(msg);
    }
}

} // namespace harvest::ecs
