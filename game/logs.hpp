#pragma once

#include "ecs/components.hpp"

#include <string>
#include <variant>
#include <vector>

namespace harvest::game {

// Something was attacked. `position` is where the target stood.
struct AttackedMessage {
    ecs::Glyph attacker{ecs::Glyph::Goblin};
    ecs::Glyph target{ecs::Glyph::Player};
    ecs::Point position{};
    bool defeated{false};
};

// A new entity entered the map.
struct SpawnedMessage {
    ecs::Glyph glyph{ecs::Glyph::Goblin};
    ecs::Point position{};
};

using LogMessage = std::variant<AttackedMessage, SpawnedMessage>;

std::string describe(const LogMessage& message);

// Turn event log, drained by the UI once per frame.
class Logs {
public:
    void add(LogMessage message);

    // Returns all pending messages in insertion order and clears the log.
    std::vector<LogMessage> flush();

    std::size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }

private:
    std::vector<LogMessage> messages_;
};

} // namespace harvest::game
