#pragma once

#include "ecs/components.hpp"
#include "logs.hpp"
#include "map.hpp"
#include "rng.hpp"
#include "run_state.hpp"

#include <entt/entt.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace harvest::ecs {
class MapIndexingSystem;
class AISystem;
class MeleeConversionSystem;
class MovementSystem;
class ApplyAttackSystem;
class DefeatSystem;
class RemoveDefeatedSystem;
class TreeGrowthSystem;
class SpawnSystem;
}

namespace harvest::game {

enum class LevelSource : std::uint8_t {
    Generated,
    Demo
};

struct WorldOptions {
    std::uint32_t seed{1};
    LevelSource level{LevelSource::Generated};

    // Generated levels only; the demo layout is always 12x12.
    int width{16};
    int height{16};
    int houses{3};
    float tree_density{0.25f};
    std::uint8_t player_health{5};

    int spawn_chance_percent{25};
    int max_goblins{6};

    int tree_growth_chance_percent{20};
    std::uint8_t max_tree_health{5};
};

// What the UI needs to draw one entity.
struct DrawEntity {
    int x{0};
    int y{0};
    ecs::Glyph glyph{ecs::Glyph::Player};
    int health{0};
};

// Logical game world: entities, map, turn state machine.
class WorldState {
public:
    explicit WorldState(const WorldOptions& options = {});
    ~WorldState();

    WorldState(const WorldState&) = delete;
    WorldState& operator=(const WorldState&) = delete;

    // Advance the turn state machine by one step. Called once per frame.
    void tick();

    // Queue the player's move. Ignored unless the world is awaiting input.
    void player_move(ecs::Direction direction);

    // Skip the player's move. Ignored unless the world is awaiting input.
    void player_wait();

    std::vector<DrawEntity> to_render() const;
    std::vector<LogMessage> flush_logs() { return logs_.flush(); }

    RunState run_state() const { return run_state_; }
    std::uint32_t turn() const { return turn_; }
    std::uint32_t seed() const { return rng_.seed(); }

    int width() const { return map_.width(); }
    int height() const { return map_.height(); }
    const Map& map() const { return map_; }

    std::optional<entt::entity> player() const;
    std::optional<int> player_health() const;
    int settlement_remaining() const;

    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

private:
    void wire_systems(const WorldOptions& options);
    void run_systems();

    entt::registry registry_;
    Map map_;
    Logs logs_;
    Rng rng_;

    RunState run_state_{RunState::PreRun};
    entt::entity player_{entt::null};
    std::uint32_t turn_{0};

    std::unique_ptr<ecs::MapIndexingSystem> map_indexing_system_;
    std::unique_ptr<ecs::AISystem> ai_system_;
    std::unique_ptr<ecs::MeleeConversionSystem> melee_conversion_system_;
    std::unique_ptr<ecs::MovementSystem> movement_system_;
    std::unique_ptr<ecs::ApplyAttackSystem> apply_attack_system_;
    std::unique_ptr<ecs::DefeatSystem> defeat_system_;
    std::unique_ptr<ecs::RemoveDefeatedSystem> remove_defeated_system_;
    std::unique_ptr<ecs::TreeGrowthSystem> tree_growth_system_;
    std::unique_ptr<ecs::SpawnSystem> spawn_system_;
};

} // namespace harvest::game
