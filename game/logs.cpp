#include "logs.hpp"

#include <raylib.h>

#include <utility>

namespace harvest::game {

namespace {

std::string point_text(const ecs::Point& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

struct Describer {
    std::string operator()(const AttackedMessage& m) const {
        std::string text = std::string(ecs::glyph_name(m.attacker)) + " attacked " +
                           ecs::glyph_name(m.target) + " at " + point_text(m.position);
        if (m.defeated) {
            text += m.target == ecs::Glyph::Tree ? ", harvesting it" : ", destroying it";
        }
        return text;
    }

    std::string operator()(const SpawnedMessage& m) const {
        return std::string(ecs::glyph_name(m.glyph)) + " appeared at " + point_text(m.position);
    }
};

} // namespace

std::string describe(const LogMessage& message) {
    return std::visit(Describer{}, message);
}

void Logs::add(LogMessage message) {
    TraceLog(LOG_DEBUG, "[game] %s", describe(message).c_str());
    messages_.push_back(std::move(message));
}

std::vector<LogMessage> Logs::flush() {
    std::vector<LogMessage> out;
    out.swap(messages_);
    return out;
}

} // namespace harvest::game
