#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <raylib.h>

namespace harvest::core {

std::string key_name(int key) {
    // Letters
    if (key >= KEY_A && key <= KEY_Z) {
        char c = static_cast<char>('A' + (key - KEY_A));
        return std::string(1, c);
    }

    // Digits
    if (key >= KEY_ZERO && key <= KEY_NINE) {
        char c = static_cast<char>('0' + (key - KEY_ZERO));
        return std::string(1, c);
    }

    switch (key) {
        case KEY_SPACE: return "SPACE";
        case KEY_ESCAPE: return "ESC";
        case KEY_ENTER: return "ENTER";
        case KEY_TAB: return "TAB";
        case KEY_BACKSPACE: return "BACKSPACE";
        case KEY_UP: return "UP";
        case KEY_DOWN: return "DOWN";
        case KEY_LEFT: return "LEFT";
        case KEY_RIGHT: return "RIGHT";
        case KEY_KP_8: return "KP8";
        case KEY_KP_2: return "KP2";
        case KEY_KP_4: return "KP4";
        case KEY_KP_6: return "KP6";
        case KEY_KP_5: return "KP5";
        default: break;
    }

    // Fallback to numeric.
    return std::to_string(key);
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

Config::Config() {
    reset();
}

void Config::reset() {
    config_ = ClientConfig{};
    loaded_from_path_.clear();

    config_.controls.up = KEY_W;
    config_.controls.down = KEY_S;
    config_.controls.left = KEY_A;
    config_.controls.right = KEY_D;

    config_.controls.up_alt = KEY_UP;
    config_.controls.down_alt = KEY_DOWN;
    config_.controls.left_alt = KEY_LEFT;
    config_.controls.right_alt = KEY_RIGHT;

    config_.controls.wait = KEY_SPACE;
    config_.controls.restart = KEY_R;
    config_.controls.exit = KEY_ESCAPE;

    config_.logging.enabled = true;
    config_.logging.level = LOG_INFO;
    config_.logging.file = "";
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    try {
        size_t idx = 0;
        const std::string s = trim(v);
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::exception&) {
        return default_value;
    }
}

float Config::parse_float(const std::string& v, float default_value) {
    try {
        size_t idx = 0;
        const std::string s = trim(v);
        float out = std::stof(s, &idx);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::exception&) {
        return default_value;
    }
}

static std::string strip_quotes(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

int Config::key_from_string(const std::string& v, int default_value) {
    std::string s = to_lower(strip_quotes(v));

    // Allow raw ASCII letters/digits like "w".
    if (s.size() == 1) {
        const char c = s[0];
        if (c >= 'a' && c <= 'z') {
            return KEY_A + (c - 'a');
        }
        if (c >= '0' && c <= '9') {
            return KEY_ZERO + (c - '0');
        }
    }

    if (s.rfind("key_", 0) == 0) s = s.substr(4);

    static const std::unordered_map<std::string, int> map = {
        {"space", KEY_SPACE},
        {"escape", KEY_ESCAPE}, {"esc", KEY_ESCAPE},
        {"enter", KEY_ENTER}, {"return", KEY_ENTER},
        {"tab", KEY_TAB},
        {"backspace", KEY_BACKSPACE},
        {"up", KEY_UP}, {"down", KEY_DOWN}, {"left", KEY_LEFT}, {"right", KEY_RIGHT},
        {"kp8", KEY_KP_8}, {"kp2", KEY_KP_2}, {"kp4", KEY_KP_4}, {"kp6", KEY_KP_6}, {"kp5", KEY_KP_5},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    return default_value;
}

int Config::log_level_from_string(const std::string& v, int default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, int> map = {
        {"all", LOG_ALL},
        {"trace", LOG_TRACE},
        {"debug", LOG_DEBUG},
        {"info", LOG_INFO},
        {"warning", LOG_WARNING}, {"warn", LOG_WARNING},
        {"error", LOG_ERROR},
        {"fatal", LOG_FATAL},
        {"none", LOG_NONE}, {"off", LOG_NONE},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    return parse_int(s, default_value);
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "controls") {
        auto& c = config_.controls;
        if (k == "up") c.up = key_from_string(v, c.up);
        else if (k == "down") c.down = key_from_string(v, c.down);
        else if (k == "left") c.left = key_from_string(v, c.left);
        else if (k == "right") c.right = key_from_string(v, c.right);
        else if (k == "up_alt") c.up_alt = key_from_string(v, c.up_alt);
        else if (k == "down_alt") c.down_alt = key_from_string(v, c.down_alt);
        else if (k == "left_alt") c.left_alt = key_from_string(v, c.left_alt);
        else if (k == "right_alt") c.right_alt = key_from_string(v, c.right_alt);
        else if (k == "wait") c.wait = key_from_string(v, c.wait);
        else if (k == "restart") c.restart = key_from_string(v, c.restart);
        else if (k == "exit") c.exit = key_from_string(v, c.exit);
        return;
    }

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }

    if (sec == "window") {
        auto& w = config_.window;
        if (k == "width") w.width = std::max(320, parse_int(v, w.width));
        else if (k == "height") w.height = std::max(240, parse_int(v, w.height));
        else if (k == "title") w.title = v;
        else if (k == "target_fps") w.target_fps = std::max(1, parse_int(v, w.target_fps));
        else if (k == "show_fps") w.show_fps = parse_bool(v, w.show_fps);
        return;
    }

    if (sec == "game") {
        auto& g = config_.game;
        if (k == "seed") {
            const int seed = parse_int(v, static_cast<int>(g.seed));
            g.seed = static_cast<std::uint32_t>(std::max(0, seed));
        }
        else if (k == "level") {
            const std::string lv = to_lower(v);
            if (lv == "demo") g.demo_level = true;
            else if (lv == "generated" || lv == "random") g.demo_level = false;
        }
        else if (k == "width") g.width = std::clamp(parse_int(v, g.width), 1, 256);
        else if (k == "height") g.height = std::clamp(parse_int(v, g.height), 1, 256);
        else if (k == "houses") g.houses = std::clamp(parse_int(v, g.houses), 1, 1024);
        else if (k == "tree_density") g.tree_density = std::clamp(parse_float(v, g.tree_density), 0.0f, 1.0f);
        else if (k == "player_health") g.player_health = std::clamp(parse_int(v, g.player_health), 1, 255);
        else if (k == "spawn_chance_percent") g.spawn_chance_percent = std::clamp(parse_int(v, g.spawn_chance_percent), 0, 100);
        else if (k == "max_goblins") g.max_goblins = std::max(0, parse_int(v, g.max_goblins));
        else if (k == "tree_growth_chance_percent") g.tree_growth_chance_percent = std::clamp(parse_int(v, g.tree_growth_chance_percent), 0, 100);
        else if (k == "max_tree_health") g.max_tree_health = std::clamp(parse_int(v, g.max_tree_health), 1, 255);
        return;
    }
}

void Config::parse_line(std::string line, std::string& section) {
    // Strip comments (# or ;) - cut at first occurrence.
    auto hash = line.find('#');
    auto semi = line.find(';');
    size_t cut = std::string::npos;
    if (hash != std::string::npos) cut = hash;
    if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
    if (cut != std::string::npos) line = line.substr(0, cut);

    line = trim(line);
    if (line.empty()) return;

    if (line.front() == '[' && line.back() == ']') {
        section = trim(line.substr(1, line.size() - 2));
        return;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) return;

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (key.empty()) return;

    apply_kv(section, key, value);
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        parse_line(line, section);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        parse_line(line, section);
    }

    loaded_from_path_ = path;
    return true;
}

} // namespace harvest::core
