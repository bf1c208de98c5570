#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace harvest::core {

struct ControlsConfig {
    int up{0};
    int down{0};
    int left{0};
    int right{0};

    int up_alt{0};
    int down_alt{0};
    int left_alt{0};
    int right_alt{0};

    int wait{0};
    int restart{0};
    int exit{0};
};

struct LoggingConfig {
    bool enabled{true};
    int level{0};
    std::string file{};
};

struct WindowConfig {
    int width{1024};
    int height{720};
    std::string title{"Harvest"};
    int target_fps{60};
    bool show_fps{false};
};

struct GameConfig {
    std::uint32_t seed{0};  // 0 = seed from the clock
    bool demo_level{false};

    int width{16};
    int height{16};
    int houses{3};
    float tree_density{0.25f};
    int player_health{5};

    int spawn_chance_percent{25};
    int max_goblins{6};

    int tree_growth_chance_percent{20};
    int max_tree_health{5};
};

struct ClientConfig {
    ControlsConfig controls{};
    LoggingConfig logging{};
    WindowConfig window{};
    GameConfig game{};
};

class Config {
public:
    static Config& instance();

    bool load_from_file(const std::string& path);

    // Parses INI text directly. Unknown sections and keys are ignored.
    void load_from_string(const std::string& text);

    // Back to built-in defaults.
    void reset();

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const ClientConfig& get() const { return config_; }

    const ControlsConfig& controls() const { return config_.controls; }
    const LoggingConfig& logging() const { return config_.logging; }
    const WindowConfig& window() const { return config_.window; }
    const GameConfig& game() const { return config_.game; }

private:
    Config();

    ClientConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);
    static float parse_float(const std::string& v, float default_value);

    static int key_from_string(const std::string& v, int default_value);
    static int log_level_from_string(const std::string& v, int default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
    void parse_line(std::string line, std::string& section);
};

std::string key_name(int key);

} // namespace harvest::core
