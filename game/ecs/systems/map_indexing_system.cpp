#include "map_indexing_system.hpp"
#include "../../map.hpp"

namespace harvest::ecs {

void MapIndexingSystem::update(entt::registry& registry) {
    if (!map_) return;

    map_->clear_index();

    auto view = registry.view<Position>();
    for (auto entity : view) {
        const auto& pos = view.get<Position>(entity);
        map_->index_entity(pos.x, pos.y, entity);
    }
}

} // namespace harvest::ecs
