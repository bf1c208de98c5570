#include "combat_system.hpp"
#include "../../map.hpp"
#include "../../logs.hpp"

#include <raylib.h>

#include <vector>

namespace harvest::ecs {

// ============================================================================
// MeleeConversionSystem
// ============================================================================

void MeleeConversionSystem::update(entt::registry& registry) {
    if (!map_) return;

    std::vector<entt::entity> stop_movement;

    auto view = registry.view<Position, Moving>();
    for (auto entity : view) {
        const auto& pos = view.get<Position>(entity);
        const auto direction = view.get<Moving>(entity);

        const Point prospective = pos.after(direction);
        auto target = map_->get_entity(prospective.x, prospective.y);
        if (!target || *target == entity) continue;

        // Bumping into anything cancels the move.
        stop_movement.push_back(entity);

        if (!registry.valid(*target) || !registry.all_of<Health>(*target)) continue;

        // Goblins shuffle past each other instead of fighting.
        if (registry.all_of<Monster>(entity) && registry.all_of<Monster>(*target)) continue;

        registry.emplace_or_replace<Attacking>(entity, *target);
    }

    for (auto entity : stop_movement) {
        registry.remove<Moving>(entity);
    }
}

// ============================================================================
// ApplyAttackSystem
// ============================================================================

void ApplyAttackSystem::update(entt::registry& registry) {
    auto view = registry.view<Attacking, Renderable>();
    for (auto entity : view) {
        const auto& attack = view.get<Attacking>(entity);
        const auto& attacker = view.get<Renderable>(entity);

        const entt::entity target = attack.target;
        if (!registry.valid(target)) continue;

        auto* health = registry.try_get<Health>(target);
        if (!health || health->amount == 0) continue;

        const bool defeated = health->reduce(1) == HealthState::Defeated;

        const auto* target_render = registry.try_get<Renderable>(target);
        const auto* target_pos = registry.try_get<Position>(target);

        if (logs_ && target_render && target_pos) {
            game::AttackedMessage msg;
            msg.attacker = attacker.glyph;
            msg.target = target_render->glyph;
            msg.position = target_pos->to_point();
            msg.defeated = defeated;
            logs_->add(msg);
        }
    }

    registry.clear<Attacking>();
}

// ============================================================================
// DefeatSystem
// ============================================================================

void DefeatSystem::update(entt::registry& registry) {
    std::vector<entt::entity> defeated;

    auto view = registry.view<Health>();
    for (auto entity : view) {
        if (view.get<Health>(entity).amount == 0) {
            defeated.push_back(entity);
        }
    }

    for (auto entity : defeated) {
        registry.remove<Health>(entity);
        registry.emplace_or_replace<Defeated>(entity);
    }
}

// ============================================================================
// RemoveDefeatedSystem
// ============================================================================

void RemoveDefeatedSystem::update(entt::registry& registry) {
    std::vector<entt::entity> to_be_removed;

    auto view = registry.view<Defeated>();
    for (auto entity : view) {
        to_be_removed.push_back(entity);
    }

    for (auto entity : to_be_removed) {
        if (const auto* pos = registry.try_get<Position>(entity)) {
            if (map_ && map_->get_entity(pos->x, pos->y) == entity) {
                map_->unindex(pos->x, pos->y);
            }

            const auto* render = registry.try_get<Renderable>(entity);
            TraceLog(LOG_DEBUG, "[combat] removed %s at (%d,%d)",
                     render ? glyph_name(render->glyph) : "entity", pos->x, pos->y);
        }
        registry.destroy(entity);
    }
}

} // namespace harvest::ecs
