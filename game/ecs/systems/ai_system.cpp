#include "ai_system.hpp"
#include "../../rng.hpp"

#include <raylib.h>

#include <array>
#include <cstdlib>
#include <limits>
#include <optional>
#include <vector>

namespace harvest::ecs {

Direction AISystem::best_direction(const Position& from, const Position& to) {
    const int x_diff = to.x - from.x;
    const int y_diff = to.y - from.y;

    if (std::abs(x_diff) > std::abs(y_diff)) {
        return x_diff > 0 ? Moving::Right : Moving::Left;
    }
    return y_diff > 0 ? Moving::Down : Moving::Up;
}

Direction AISystem::wander() {
    static const std::array<Moving, 4> kDirections = {
        Moving::Up, Moving::Down, Moving::Left, Moving::Right
    };

    if (!rng_) return Moving::Up;
    return rng_->random_entry(kDirections);
}

void AISystem::update(entt::registry& registry) {
    if (!state_ || *state_ != game::RunState::MonsterTurn) return;

    std::optional<Position> player_position;
    {
        auto players = registry.view<Player, Position>();
        for (auto entity : players) {
            player_position = players.get<Position>(entity);
            break;
        }
    }

    if (!player_position) {
        TraceLog(LOG_DEBUG, "[ai] no player on the map, monsters idle");
        return;
    }

    std::vector<Position> town_positions;
    {
        auto towns = registry.view<Town, Position>();
        for (auto entity : towns) {
            town_positions.push_back(towns.get<Position>(entity));
        }
    }

    auto view = registry.view<AI, Position>();
    for (auto entity : view) {
        const auto ai = view.get<AI>(entity);
        const auto& pos = view.get<Position>(entity);

        if (registry.all_of<Monster>(entity) && player_position->distance(pos) == 1.0) {
            registry.emplace_or_replace<Moving>(entity, best_direction(pos, *player_position));
            continue;
        }

        Direction direction = Moving::Up;
        switch (ai) {
            case AI::Wander:
                direction = wander();
                break;

            case AI::PrioritizeTown: {
                double closest_distance = std::numeric_limits<double>::max();
                Position closest = *player_position;
                for (const auto& town : town_positions) {
                    const double d = pos.distance(town);
                    if (d < closest_distance) {
                        closest_distance = d;
                        closest = town;
                    }
                }
                direction = best_direction(pos, closest);
                break;
            }

            case AI::PrioritizePlayer:
                direction = best_direction(pos, *player_position);
                break;
        }

        registry.emplace_or_replace<Moving>(entity, direction);
    }
}

} // namespace harvest::ecs
