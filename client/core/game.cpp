#include "game.hpp"
#include "logger.hpp"

#include <raylib.h>

#if defined(__EMSCRIPTEN__)
#include <emscripten/emscripten.h>
#endif

#include <ctime>

namespace harvest::core {

game::WorldOptions world_options_from_config(const GameConfig& cfg, std::uint32_t seed) {
    game::WorldOptions opts;
    opts.seed = seed;
    opts.level = cfg.demo_level ? game::LevelSource::Demo : game::LevelSource::Generated;
    opts.width = cfg.width;
    opts.height = cfg.height;
    opts.houses = cfg.houses;
    opts.tree_density = cfg.tree_density;
    opts.player_health = static_cast<std::uint8_t>(cfg.player_health);
    opts.spawn_chance_percent = cfg.spawn_chance_percent;
    opts.max_goblins = cfg.max_goblins;
    opts.tree_growth_chance_percent = cfg.tree_growth_chance_percent;
    opts.max_tree_health = static_cast<std::uint8_t>(cfg.max_tree_health);
    return opts;
}

Game::Game() = default;

Game::~Game() {
    shutdown();
}

bool Game::init(const std::string& config_path) {
    const bool cfg_ok = Config::instance().load_from_file(config_path);
    const auto& window = Config::instance().window();

    screen_width_ = window.width;
    screen_height_ = window.height;

    InitWindow(screen_width_, screen_height_, window.title.c_str());
    if (!IsWindowReady()) {
        TraceLog(LOG_ERROR, "[game] failed to open window");
        return false;
    }
    window_open_ = true;

    SetTargetFPS(window.target_fps);
    SetExitKey(KEY_NULL);

    Logger::instance().init(Config::instance().logging());

    TraceLog(LOG_INFO, "[config] %s: %s", config_path.c_str(), cfg_ok ? "ok" : "missing (defaults)");

    board_view_.set_show_fps(window.show_fps);
    board_view_.set_controls(Config::instance().controls());

    start_new_world();

    TraceLog(LOG_INFO, "[game] initialized, move with %s/%s/%s/%s",
             key_name(Config::instance().controls().up).c_str(),
             key_name(Config::instance().controls().left).c_str(),
             key_name(Config::instance().controls().down).c_str(),
             key_name(Config::instance().controls().right).c_str());

    return true;
}

std::uint32_t Game::next_seed() {
    const std::uint32_t configured = Config::instance().game().seed;
    if (configured != 0) {
        return configured + restarts_;
    }
    return static_cast<std::uint32_t>(std::time(nullptr)) + restarts_;
}

void Game::start_new_world() {
    const auto opts = world_options_from_config(Config::instance().game(), next_seed());

    world_ = std::make_unique<game::WorldState>(opts);
    log_panel_.clear();
    log_panel_.push_line("Defend the harvest!");

    TraceLog(LOG_INFO, "[game] new world %dx%d, seed %u", world_->width(), world_->height(), world_->seed());
}

#if defined(__EMSCRIPTEN__)
static void web_frame(void* arg) {
    static_cast<Game*>(arg)->frame();
}
#endif

void Game::run() {
#if defined(__EMSCRIPTEN__)
    emscripten_set_main_loop_arg(&web_frame, this, 0, 1);
#else
    while (!should_exit_ && !WindowShouldClose()) {
        frame();
    }
#endif
}

void Game::frame() {
    update();

    BeginDrawing();
    render();
    EndDrawing();
}

void Game::update() {
    handle_global_input();
    if (should_exit_ || !world_) return;

    handle_turn_input();

    world_->tick();
    log_panel_.push(world_->flush_logs());
}

void Game::handle_global_input() {
    const auto& controls = Config::instance().controls();

    if (IsKeyPressed(controls.exit)) {
        should_exit_ = true;
        return;
    }

    if (IsKeyPressed(controls.restart)) {
        ++restarts_;
        start_new_world();
    }
}

void Game::handle_turn_input() {
    if (world_->run_state() != game::RunState::AwaitingInput) return;

    const auto& c = Config::instance().controls();

    if (IsKeyPressed(c.up) || IsKeyPressed(c.up_alt)) {
        world_->player_move(ecs::Moving::Up);
    } else if (IsKeyPressed(c.down) || IsKeyPressed(c.down_alt)) {
        world_->player_move(ecs::Moving::Down);
    } else if (IsKeyPressed(c.left) || IsKeyPressed(c.left_alt)) {
        world_->player_move(ecs::Moving::Left);
    } else if (IsKeyPressed(c.right) || IsKeyPressed(c.right_alt)) {
        world_->player_move(ecs::Moving::Right);
    } else if (IsKeyPressed(c.wait)) {
        world_->player_wait();
    }
}

void Game::render() {
    if (!world_) {
        ClearBackground(BLACK);
        return;
    }
    board_view_.draw(*world_, log_panel_, GetScreenWidth(), GetScreenHeight());
}

void Game::shutdown() {
    world_.reset();

    if (window_open_) {
        CloseWindow();
        window_open_ = false;
    }

    Logger::instance().shutdown();
}

} // namespace harvest::core
