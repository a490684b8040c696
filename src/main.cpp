#include "scoreboard/asset_cache.hpp"
#include "scoreboard/asset_fetcher.hpp"
#include "scoreboard/config.hpp"
#include "scoreboard/layout.hpp"
#include "scoreboard/match_reader.hpp"
#include "scoreboard/preview.hpp"
#include "scoreboard/renderer.hpp"
#include "scoreboard/types.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace {

struct CliArgs {
    std::string match_file;
    std::string puuid;
    std::string out = "scoreboard.png";
    std::optional<std::string> cache_dir;
    std::optional<std::string> version;
    std::optional<int> slots;
    std::optional<scoreboard::TeamOrder> order;
    bool stats = false;
    std::optional<int> cleanup_days;
    bool no_preview = false;
};

constexpr int max_cleanup_days = 36500;

void print_usage() {
    std::cerr << R"(Usage: scoreboard-render <match.json> <puuid> [options]
  --out <file.png>          Output image (default: scoreboard.png)
  --cache <dir>             Icon cache directory (or set CACHE_PATH)
  --version <v>             Asset version (or set ASSET_VERSION)
  --slots <6|7>             Main item slots (default: 6)
  --order <position|kills>  Row order within a team (default: position)
  --stats                   Print icon cache statistics
  --cleanup-days <n>        Delete cached icons not accessed for n days
  --no-preview              Skip the terminal table preview
)";
}

std::optional<int> parse_number(const std::string& flag, const std::string& val) {
    try {
        size_t used = 0;
        int n = std::stoi(val, &used);
        if (used == val.size()) return n;
    } catch (const std::exception&) {
        // fall through to the error below
    }
    std::cerr << "Invalid number for " << flag << ": " << val << "\n";
    return std::nullopt;
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 3) return std::nullopt;

    CliArgs args;
    args.match_file = argv[1];
    args.puuid = argv[2];

    for (int i = 3; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--stats") {
            args.stats = true;
            continue;
        }
        if (flag == "--no-preview") {
            args.no_preview = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        std::string val = argv[++i];

        if (flag == "--out") args.out = val;
        else if (flag == "--cache") args.cache_dir = val;
        else if (flag == "--version") args.version = val;
        else if (flag == "--slots") {
            auto n = parse_number(flag, val);
            if (!n) return std::nullopt;
            if (*n != 6 && *n != 7) {
                std::cerr << "--slots must be 6 or 7\n";
                return std::nullopt;
            }
            args.slots = n;
        }
        else if (flag == "--order") {
            args.order = scoreboard::parse_team_order(val);
            if (!args.order) {
                std::cerr << "--order must be position or kills\n";
                return std::nullopt;
            }
        }
        else if (flag == "--cleanup-days") {
            auto n = parse_number(flag, val);
            if (!n) return std::nullopt;
            if (*n < 0 || *n > max_cleanup_days) {
                std::cerr << "--cleanup-days must be between 0 and " << max_cleanup_days << "\n";
                return std::nullopt;
            }
            args.cleanup_days = n;
        }
        else {
            std::cerr << "Unknown option: " << flag << "\n";
            return std::nullopt;
        }
    }

    return args;
}

void configure_logging() {
    if (auto level = scoreboard::get_env("SCOREBOARD_LOG_LEVEL")) {
        spdlog::set_level(spdlog::level::from_str(*level));
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    scoreboard::load_env();
    configure_logging();

    auto config = scoreboard::load_config();
    if (args->cache_dir) config.cache.root = *args->cache_dir;
    if (args->version) config.asset_source.version = *args->version;
    if (args->slots) config.render.layout.main_item_slots = *args->slots;
    if (args->order) config.render.layout.order = *args->order;

    scoreboard::AssetCache cache(config.cache, config.asset_source,
                                 scoreboard::make_http_fetcher(config.asset_source));

    if (args->cleanup_days) {
        int removed = cache.cleanup_older_than(std::chrono::days(*args->cleanup_days));
        std::cerr << "Removed " << removed << " cached icons\n";
    }

    // Load match
    auto match = scoreboard::read_match_file(args->match_file);
    if (!match) {
        std::cerr << "Error reading match: " << match.error().message << "\n";
        return 1;
    }

    scoreboard::TrackedAccount account{.puuid = args->puuid};
    auto me = std::ranges::find(match->participants, args->puuid,
                                &scoreboard::MatchParticipant::puuid);
    if (me != match->participants.end()) account.game_name = me->summoner_name;

    // Render
    scoreboard::ScoreboardRenderer renderer(cache, config.render);
    std::cerr << "Rendering " << match->match_id << "...\n";
    auto image = renderer.render_summary(account, *match);
    if (!image) {
        std::cerr << "Error rendering scoreboard: " << image.error().message << "\n";
        return 1;
    }

    std::ofstream file(args->out, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error writing " << args->out << "\n";
        return 1;
    }
    file.write(reinterpret_cast<const char*>(image->png.data()),
               static_cast<std::streamsize>(image->png.size()));
    if (!file) {
        std::cerr << "Error writing " << args->out << "\n";
        return 1;
    }
    std::cerr << "Wrote " << args->out << " (" << image->width << "x" << image->height << ")\n";

    if (!args->no_preview) {
        auto layout = scoreboard::compute_layout(*match, account.puuid, config.render.layout);
        scoreboard::print_element(scoreboard::render_preview(layout, *match));
    }

    if (args->stats) {
        scoreboard::print_element(
            scoreboard::render_cache_stats(cache.stats(), cache.root().string()));
    }

    return 0;
}
