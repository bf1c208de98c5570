#include "movement_system.hpp"
#include "../../map.hpp"

namespace harvest::ecs {

void MovementSystem::update(entt::registry& registry) {
    if (map_) {
        auto view = registry.view<Position, Moving>();
        for (auto entity : view) {
            auto& pos = view.get<Position>(entity);
            const auto direction = view.get<Moving>(entity);

            const Point from = pos.to_point();
            const Point prospective = pos.after(direction);

            // is_open covers both bounds and occupancy; the index is kept current
            // so two movers can never land on the same cell.
            if (!map_->is_open(prospective.x, prospective.y)) continue;

            if (map_->get_entity(from.x, from.y) == entity) {
                map_->move_entity(from, prospective);
            } else {
                map_->index_entity(prospective.x, prospective.y, entity);
            }
            pos.update(prospective);
        }
    }

    registry.clear<Moving>();
}

} // namespace harvest::ecs
