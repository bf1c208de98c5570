#include "board_view.hpp"

#include <algorithm>
#include <utility>

namespace harvest::ui {

namespace {

constexpr int kPanelWidth = 340;
constexpr int kMargin = 16;
constexpr Color kBackground{18, 18, 24, 255};
constexpr Color kCellColor{30, 32, 40, 255};
constexpr Color kGridLine{44, 46, 56, 255};

} // namespace

ControlHints control_hints(const core::ControlsConfig& controls) {
    using core::key_name;

    ControlHints hints;
    hints.move = "Move: " + key_name(controls.up) + key_name(controls.left) + key_name(controls.down) +
                 key_name(controls.right) + " / " + key_name(controls.up_alt) + " " + key_name(controls.left_alt) +
                 " " + key_name(controls.down_alt) + " " + key_name(controls.right_alt) +
                 "  Wait: " + key_name(controls.wait);
    hints.system = "Restart: " + key_name(controls.restart) + "  Quit: " + key_name(controls.exit);
    hints.restart = "Press " + key_name(controls.restart) + " to start over";
    return hints;
}

GlyphAppearance glyph_appearance(ecs::Glyph glyph, int health) {
    switch (glyph) {
        case ecs::Glyph::Player: return {'@', YELLOW};
        case ecs::Glyph::Goblin: return {'g', GREEN};
        case ecs::Glyph::Farm:   return {'F', GOLD};
        case ecs::Glyph::House:  return {'H', BROWN};
        case ecs::Glyph::Wall:   return {'W', LIGHTGRAY};
        case ecs::Glyph::Tree: {
            const int level = std::clamp(health, 1, 5);
            const unsigned char g = static_cast<unsigned char>(100 + level * 30);
            return {'T', Color{20, g, 40, 255}};
        }
    }
    return {'?', MAGENTA};
}

// ============================================================================
// LogPanel
// ============================================================================

void LogPanel::push(const std::vector<game::LogMessage>& messages) {
    for (const auto& msg : messages) {
        push_line(game::describe(msg));
    }
}

void LogPanel::push_line(std::string line) {
    lines_.push_back(std::move(line));
    while (lines_.size() > capacity_) {
        lines_.pop_front();
    }
}

// ============================================================================
// BoardView
// ============================================================================

void BoardView::draw(const game::WorldState& world, const LogPanel& log, int screen_width, int screen_height) const {
    ClearBackground(kBackground);

    const int board_w = std::max(1, screen_width - kPanelWidth - kMargin * 3);
    const int board_h = std::max(1, screen_height - kMargin * 2);
    const int cell = std::max(4, std::min(board_w / world.width(), board_h / world.height()));

    draw_grid(world, kMargin, kMargin, cell);

    const int panel_x = kMargin * 2 + cell * world.width();
    draw_side_panel(world, log, panel_x, screen_height);

    if (world.run_state() == game::RunState::GameOver) {
        draw_game_over(screen_width, screen_height);
    }

    if (show_fps_) {
        draw_fps_box(screen_width - 190, kMargin);
    }
}

void BoardView::draw_grid(const game::WorldState& world, int origin_x, int origin_y, int cell) const {
    for (int y = 0; y < world.height(); ++y) {
        for (int x = 0; x < world.width(); ++x) {
            const int px = origin_x + x * cell;
            const int py = origin_y + y * cell;
            DrawRectangle(px, py, cell, cell, kCellColor);
            DrawRectangleLines(px, py, cell, cell, kGridLine);
        }
    }

    const int font_size = std::max(8, cell * 3 / 4);

    for (const auto& d : world.to_render()) {
        const GlyphAppearance look = glyph_appearance(d.glyph, d.health);
        const char text[2] = {look.symbol, '\0'};

        const int text_w = MeasureText(text, font_size);
        const int px = origin_x + d.x * cell + (cell - text_w) / 2;
        const int py = origin_y + d.y * cell + (cell - font_size) / 2;
        DrawText(text, px, py, font_size, look.color);
    }
}

void BoardView::draw_side_panel(const game::WorldState& world, const LogPanel& log, int x, int screen_height) const {
    int y = kMargin;

    DrawText("HARVEST", x, y, 28, GOLD);
    y += 40;

    DrawText(TextFormat("Turn: %u", world.turn()), x, y, 20, RAYWHITE);
    y += 26;

    if (auto hp = world.player_health()) {
        DrawText(TextFormat("Health: %d", *hp), x, y, 20, *hp > 2 ? RAYWHITE : RED);
    } else {
        DrawText("Health: -", x, y, 20, RED);
    }
    y += 26;

    DrawText(TextFormat("Settlement: %d", world.settlement_remaining()), x, y, 20, RAYWHITE);
    y += 26;

    DrawText(TextFormat("Seed: %u", world.seed()), x, y, 16, GRAY);
    y += 22;

    DrawText(game::run_state_name(world.run_state()), x, y, 16, GRAY);
    y += 34;

    DrawText(hints_.move.c_str(), x, y, 14, GRAY);
    y += 18;
    DrawText(hints_.system.c_str(), x, y, 14, GRAY);
    y += 30;

    const int line_h = 18;
    for (const auto& line : log.lines()) {
        if (y + line_h > screen_height - kMargin) break;
        DrawText(line.c_str(), x, y, 14, LIGHTGRAY);
        y += line_h;
    }
}

void BoardView::draw_game_over(int screen_width, int screen_height) const {
    const int box_w = 420;
    const int box_h = 110;
    const int bx = (screen_width - box_w) / 2;
    const int by = (screen_height - box_h) / 2;

    DrawRectangle(bx, by, box_w, box_h, Fade(BLACK, 0.85f));
    DrawRectangleLines(bx, by, box_w, box_h, RED);

    const char* title = "The harvest is lost";
    DrawText(title, bx + (box_w - MeasureText(title, 28)) / 2, by + 22, 28, RED);

    const char* hint = hints_.restart.c_str();
    DrawText(hint, bx + (box_w - MeasureText(hint, 18)) / 2, by + 68, 18, RAYWHITE);
}

void BoardView::draw_fps_box(int x, int y) const {
    DrawRectangle(x, y, 174, 48, BLACK);
    DrawRectangleLines(x, y, 174, 48, WHITE);
    DrawText(TextFormat("FPS: %d", GetFPS()), x + 8, y + 6, 16, YELLOW);
    DrawText(TextFormat("Frame Time: %.1fms", GetFrameTime() * 1000.0f), x + 8, y + 26, 16, SKYBLUE);
}

} // namespace harvest::ui
