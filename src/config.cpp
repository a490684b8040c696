#include "scoreboard/config.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string>
#include <spdlog/spdlog.h>

namespace scoreboard {

namespace {

std::string trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = sv.find_last_not_of(" \t\r\n");
    return std::string(sv.substr(start, end - start + 1));
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 &&
        ((s.front() == '"' && s.back() == '"') ||
         (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::optional<int> parse_int(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

// Positive integer from the environment, or nullopt with a warning when the
// variable is set to something else.
std::optional<int> env_positive_int(const std::string& key) {
    auto raw = get_env(key);
    if (!raw) return std::nullopt;
    auto value = parse_int(trim(*raw));
    if (!value || *value <= 0) {
        spdlog::warn("Ignoring {}={}: expected a positive integer", key, *raw);
        return std::nullopt;
    }
    return value;
}

} // namespace

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path) {

    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    if (!file.is_open()) return vars;

    std::string line;
    while (std::getline(file, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto eq = trimmed.find('=');
        if (eq == std::string::npos) continue;

        auto key = trim(trimmed.substr(0, eq));
        auto val = strip_quotes(trim(trimmed.substr(eq + 1)));

        if (!key.empty()) {
            vars[key] = val;
            ::setenv(key.c_str(), val.c_str(), 0); // don't overwrite existing
        }
    }

    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    if (auto* val = std::getenv(key.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

std::optional<TeamOrder> parse_team_order(const std::string& value) {
    if (value == "position") return TeamOrder::Position;
    if (value == "kills") return TeamOrder::KillsDescending;
    return std::nullopt;
}

AppConfig load_config() {
    AppConfig config;

    if (auto version = get_env("ASSET_VERSION")) {
        config.asset_source.version = *version;
    } else if (auto riot_version = get_env("RIOT_VERSION")) {
        config.asset_source.version = *riot_version;
    }
    if (auto host = get_env("ASSET_HOST")) config.asset_source.host = *host;
    if (auto cache_path = get_env("CACHE_PATH")) config.cache.root = *cache_path;

    if (auto concurrency = env_positive_int("RENDER_CONCURRENCY")) {
        config.render.concurrency = *concurrency;
    }
    if (auto secs = env_positive_int("RENDER_TIMEOUT_SECS")) {
        config.render.timeout = std::chrono::seconds(*secs);
        config.render.admission_timeout = std::chrono::seconds(*secs);
    }
    if (auto slots = env_positive_int("MAIN_ITEM_SLOTS")) {
        if (*slots == 6 || *slots == 7) {
            config.render.layout.main_item_slots = *slots;
        } else {
            spdlog::warn("Ignoring MAIN_ITEM_SLOTS={}: must be 6 or 7", *slots);
        }
    }
    if (auto order = get_env("TEAM_ORDER")) {
        if (auto parsed = parse_team_order(trim(*order))) {
            config.render.layout.order = *parsed;
        } else {
            spdlog::warn("Ignoring TEAM_ORDER={}: expected position or kills", *order);
        }
    }
    if (auto font = get_env("HEADING_FONT")) config.render.heading_font = *font;
    if (auto font = get_env("STATS_FONT")) config.render.stats_font = *font;

    return config;
}

} // namespace scoreboard
