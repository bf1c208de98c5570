#pragma once

#include "core/config.hpp"
#include "world_state.hpp"

#include <raylib.h>

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace harvest::ui {

struct GlyphAppearance {
    char symbol{'?'};
    Color color{WHITE};
};

// Character and colour for an entity. Trees get brighter as they grow.
GlyphAppearance glyph_appearance(ecs::Glyph glyph, int health);

// Side-panel and game-over help text built from the configured keys.
struct ControlHints {
    std::string move;
    std::string system;
    std::string restart;
};

ControlHints control_hints(const core::ControlsConfig& controls);

// Rolling buffer of the latest game-log lines, newest last.
class LogPanel {
public:
    explicit LogPanel(std::size_t capacity = 12) : capacity_(capacity) {}

    void push(const std::vector<game::LogMessage>& messages);
    void push_line(std::string line);
    void clear() { lines_.clear(); }

    const std::deque<std::string>& lines() const { return lines_; }

private:
    std::size_t capacity_;
    std::deque<std::string> lines_;
};

// Draws the board, the status side panel and the log.
class BoardView {
public:
    void draw(const game::WorldState& world, const LogPanel& log, int screen_width, int screen_height) const;

    void set_show_fps(bool show) { show_fps_ = show; }
    void set_controls(const core::ControlsConfig& controls) { hints_ = control_hints(controls); }

private:
    void draw_grid(const game::WorldState& world, int origin_x, int origin_y, int cell) const;
    void draw_side_panel(const game::WorldState& world, const LogPanel& log, int x, int screen_height) const;
    void draw_game_over(int screen_width, int screen_height) const;
    void draw_fps_box(int x, int y) const;

    bool show_fps_{false};
    ControlHints hints_;
};

} // namespace harvest::ui
