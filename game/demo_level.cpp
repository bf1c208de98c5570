#include "demo_level.hpp"
#include "prefabs.hpp"

#include <stdexcept>

namespace harvest::game {

namespace {

constexpr std::uint8_t kDemoPlayerHealth = 32;

} // namespace

const DemoLayout& demo_layout() {
    static const DemoLayout kLayout = {
        "       G    ",
        "            ",
        "            ",
        "            ",
        "           G",
        "     F@     ",
        "G   WH  W   ",
        "     W HFW  ",
        "            ",
        "            ",
        "            ",
        "     G      ",
    };
    return kLayout;
}

entt::entity spawn_demo(entt::registry& registry, const DemoLayout& layout) {
    entt::entity player = entt::null;

    for (int y = 0; y < static_cast<int>(layout.size()); ++y) {
        const auto row = layout[static_cast<std::size_t>(y)];
        for (int x = 0; x < static_cast<int>(row.size()); ++x) {
            switch (row[static_cast<std::size_t>(x)]) {
                case '@': player = create_player(registry, x, y, kDemoPlayerHealth); break;
                case 'G': create_goblin(registry, x, y, ecs::AI::PrioritizePlayer); break;
                case 'F': create_farm(registry, x, y); break;
                case 'W': create_wall(registry, x, y); break;
                case 'H': create_house(registry, x, y); break;
                default: break;
            }
        }
    }

    if (player == entt::null) {
        throw std::runtime_error("Demo level has no player ('@')");
    }
    return player;
}

} // namespace harvest::game
