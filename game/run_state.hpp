#pragma once

#include <cstdint>

namespace harvest::game {

// Turn phases the world steps through.
enum class RunState : std::uint8_t {
    PreRun,
    AwaitingInput,
    PlayerTurn,
    MonsterTurn,
    GameOver
};

inline const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::PreRun:        return "PreRun";
        case RunState::AwaitingInput: return "AwaitingInput";
        case RunState::PlayerTurn:    return "PlayerTurn";
        case RunState::MonsterTurn:   return "MonsterTurn";
        case RunState::GameOver:      return "GameOver";
    }
    return "Unknown";
}

} // namespace harvest::game
