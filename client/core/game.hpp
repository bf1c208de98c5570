#pragma once

#include "config.hpp"
#include "../ui/board_view.hpp"

#include "world_state.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace harvest::core {

// Maps the [game] config section onto world construction options.
game::WorldOptions world_options_from_config(const GameConfig& cfg, std::uint32_t seed);

class Game {
public:
    Game();
    ~Game();

    // Loads config, opens the window and builds the first world.
    // Throws when the configured level cannot be generated.
    bool init(const std::string& config_path);
    void run();
    void shutdown();

    // One input/update/draw step. Driven by run() or the browser main loop.
    void frame();

private:
    void update();
    void render();

    void handle_global_input();
    void handle_turn_input();

    void start_new_world();
    std::uint32_t next_seed();

    int screen_width_{1024};
    int screen_height_{720};
    bool should_exit_{false};
    bool window_open_{false};

    std::uint32_t restarts_{0};

    std::unique_ptr<game::WorldState> world_;
    ui::BoardView board_view_{};
    ui::LogPanel log_panel_{};
};

} // namespace harvest::core
