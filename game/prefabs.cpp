#include "prefabs.hpp"

namespace harvest::game {

namespace {

entt::entity create_placed(entt::registry& registry, int x, int y, ecs::Glyph glyph, std::uint8_t health) {
    auto entity = registry.create();
    registry.emplace<ecs::Position>(entity, x, y);
    registry.emplace<ecs::Renderable>(entity, glyph);
    registry.emplace<ecs::Health>(entity, health);
    return entity;
}

} // namespace

entt::entity create_player(entt::registry& registry, int x, int y, std::uint8_t health) {
    auto entity = create_placed(registry, x, y, ecs::Glyph::Player, health);
    registry.emplace<ecs::Player>(entity);
    return entity;
}

entt::entity create_goblin(entt::registry& registry, int x, int y, ecs::AI ai, std::uint8_t health) {
    auto entity = create_placed(registry, x, y, ecs::Glyph::Goblin, health);
    registry.emplace<ecs::Monster>(entity);
    registry.emplace<ecs::AI>(entity, ai);
    return entity;
}

entt::entity create_farm(entt::registry& registry, int x, int y) {
    auto entity = create_placed(registry, x, y, ecs::Glyph::Farm, kFarmHealth);
    registry.emplace<ecs::Town>(entity);
    return entity;
}

entt::entity create_house(entt::registry& registry, int x, int y) {
    auto entity = create_placed(registry, x, y, ecs::Glyph::House, kHouseHealth);
    registry.emplace<ecs::Town>(entity);
    return entity;
}

entt::entity create_wall(entt::registry& registry, int x, int y) {
    auto entity = create_placed(registry, x, y, ecs::Glyph::Wall, kWallHealth);
    registry.emplace<ecs::Town>(entity);
    return entity;
}

entt::entity create_tree(entt::registry& registry, int x, int y) {
    return create_placed(registry, x, y, ecs::Glyph::Tree, kTreeHealth);
}

} // namespace harvest::game
