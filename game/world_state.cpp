#include "world_state.hpp"
#include "demo_level.hpp"
#include "level_generator.hpp"
#include "ecs/systems/ai_system.hpp"
#include "ecs/systems/combat_system.hpp"
#include "ecs/systems/map_indexing_system.hpp"
#include "ecs/systems/movement_system.hpp"
#include "ecs/systems/spawn_system.hpp"
#include "ecs/systems/tree_growth_system.hpp"

#include <raylib.h>

#include <stdexcept>

namespace harvest::game {

namespace {

int map_width(const WorldOptions& options) {
    return options.level == LevelSource::Demo ? kDemoLevelSize : options.width;
}

int map_height(const WorldOptions& options) {
    return options.level == LevelSource::Demo ? kDemoLevelSize : options.height;
}

} // namespace

WorldState::WorldState(const WorldOptions& options)
    : map_(map_width(options), map_height(options))
    , rng_(options.seed)
{
    wire_systems(options);

    if (options.level == LevelSource::Demo) {
        player_ = spawn_demo(registry_);
        TraceLog(LOG_INFO, "[game] demo level loaded");
    } else {
        LevelGenerator generator(options.width, options.height);
        const auto level = generator.generate(rng_, options.houses, options.tree_density, options.player_health);

        auto player = LevelGenerator::insert(registry_, level);
        if (!player) {
            throw std::runtime_error("Generated level has no player");
        }
        player_ = *player;
    }

    run_state_ = RunState::PreRun;
}

WorldState::~WorldState() = default;

void WorldState::wire_systems(const WorldOptions& options) {
    map_indexing_system_ = std::make_unique<ecs::MapIndexingSystem>();
    map_indexing_system_->set_map(&map_);

    ai_system_ = std::make_unique<ecs::AISystem>();
    ai_system_->set_rng(&rng_);
    ai_system_->set_run_state(&run_state_);

    melee_conversion_system_ = std::make_unique<ecs::MeleeConversionSystem>();
    melee_conversion_system_->set_map(&map_);

    movement_system_ = std::make_unique<ecs::MovementSystem>();
    movement_system_->set_map(&map_);

    apply_attack_system_ = std::make_unique<ecs::ApplyAttackSystem>();
    apply_attack_system_->set_logs(&logs_);

    defeat_system_ = std::make_unique<ecs::DefeatSystem>();

    remove_defeated_system_ = std::make_unique<ecs::RemoveDefeatedSystem>();
    remove_defeated_system_->set_map(&map_);

    tree_growth_system_ = std::make_unique<ecs::TreeGrowthSystem>();
    tree_growth_system_->set_rng(&rng_);
    tree_growth_system_->set_run_state(&run_state_);
    tree_growth_system_->set_growth_chance_percent(options.tree_growth_chance_percent);
    tree_growth_system_->set_max_health(options.max_tree_health);

    spawn_system_ = std::make_unique<ecs::SpawnSystem>();
    spawn_system_->set_map(&map_);
    spawn_system_->set_logs(&logs_);
    spawn_system_->set_rng(&rng_);
    spawn_system_->set_run_state(&run_state_);
    spawn_system_->set_spawn_chance_percent(options.spawn_chance_percent);
    spawn_system_->set_max_goblins(options.max_goblins);
}

void WorldState::tick() {
    RunState next = run_state_;

    switch (run_state_) {
        case RunState::PreRun:
            run_systems();
            next = RunState::AwaitingInput;
            break;

        case RunState::AwaitingInput:
            break;

        case RunState::PlayerTurn:
            run_systems();
            next = RunState::MonsterTurn;
            break;

        case RunState::MonsterTurn:
            run_systems();
            ++turn_;
            next = RunState::AwaitingInput;
            break;

        case RunState::GameOver:
            break;
    }

    if (run_state_ != RunState::GameOver && !registry_.valid(player_)) {
        TraceLog(LOG_INFO, "[game] player defeated after %u turns", turn_);
        next = RunState::GameOver;
    }

    run_state_ = next;
}

void WorldState::player_move(ecs::Direction direction) {
    if (run_state_ != RunState::AwaitingInput) return;
    if (!registry_.valid(player_)) return;

    registry_.emplace_or_replace<ecs::Moving>(player_, direction);
    run_state_ = RunState::PlayerTurn;
}

void WorldState::player_wait() {
    if (run_state_ != RunState::AwaitingInput) return;
    run_state_ = RunState::PlayerTurn;
}

void WorldState::run_systems() {
    map_indexing_system_->update(registry_);
    ai_system_->update(registry_);
    melee_conversion_system_->update(registry_);
    movement_system_->update(registry_);
    apply_attack_system_->update(registry_);
    defeat_system_->update(registry_);
    remove_defeated_system_->update(registry_);
    tree_growth_system_->update(registry_);
    spawn_system_->update(registry_);
}

std::vector<DrawEntity> WorldState::to_render() const {
    std::vector<DrawEntity> drawables;

    auto view = registry_.view<const ecs::Position, const ecs::Renderable>();
    for (auto [entity, pos, render] : view.each()) {
        DrawEntity d;
        d.x = pos.x;
        d.y = pos.y;
        d.glyph = render.glyph;
        if (const auto* health = registry_.try_get<ecs::Health>(entity)) {
            d.health = health->amount;
        }
        drawables.push_back(d);
    }

    return drawables;
}

std::optional<entt::entity> WorldState::player() const {
    if (!registry_.valid(player_)) return std::nullopt;
    return player_;
}

std::optional<int> WorldState::player_health() const {
    if (!registry_.valid(player_)) return std::nullopt;
    const auto* health = registry_.try_get<ecs::Health>(player_);
    if (!health) return std::nullopt;
    return static_cast<int>(health->amount);
}

int WorldState::settlement_remaining() const {
    int count = 0;
    for (auto entity : registry_.view<const ecs::Town>()) {
        (void)entity;
        ++count;
    }
    return count;
}

} // namespace harvest::game
