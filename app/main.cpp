#include "../client/core/game.hpp"

#include <raylib.h>

#include <exception>
#include <string>

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "harvest.conf";

    harvest::core::Game game;

    try {
        if (!game.init(config_path)) {
            game.shutdown();
            return 1;
        }

        game.run();
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "[game] %s", e.what());
        game.shutdown();
        return 1;
    }

    game.shutdown();

    return 0;
}
