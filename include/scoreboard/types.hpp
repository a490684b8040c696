#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace scoreboard {

using Clock = std::chrono::steady_clock;

struct TrackedAccount {
    std::string puuid;
    std::string game_name;
    std::string tag_line;
};

struct MatchParticipant {
    std::string puuid;
    std::string summoner_name;
    std::string champion_name;
    int champion_level = 0;
    int kills = 0;
    int deaths = 0;
    int assists = 0;
    int minions_killed = 0;
    int neutral_minions_killed = 0;
    int gold_earned = 0;
    int damage_to_champions = 0;
    bool win = false;
    std::array<int, 6> items{};
    int trinket = 0;
    int role_item = 0;
    std::string team_position;

    int creep_score() const { return minions_killed + neutral_minions_killed; }
};

struct MatchData {
    std::string match_id;
    std::string game_mode;
    int64_t game_duration_secs = 0;
    std::vector<MatchParticipant> participants;
};

// Asset cache types

enum class AssetKind : uint8_t {
    Champion,
    Item,
};

struct AssetKey {
    AssetKind kind = AssetKind::Item;
    std::string identifier;
};

struct CacheStats {
    int file_count = 0;
    uintmax_t total_size_bytes = 0;
};

struct PlayerAssets {
    std::filesystem::path champion;
    std::vector<std::filesystem::path> main_items; // packed, non-empty only
    std::filesystem::path trinket;
    std::filesystem::path role_item;
};

// Errors

enum class AssetErrorKind : uint8_t {
    Cancelled,
    FetchFailed,
    CacheIo,
    InvalidKey,
};

struct AssetError {
    AssetErrorKind kind = AssetErrorKind::FetchFailed;
    int status_code = 0;
    std::string message;
};

enum class RenderErrorKind : uint8_t {
    InvalidInput,
    AdmissionTimeout,
    Cancelled,
    EncodeFailure,
};

struct RenderError {
    RenderErrorKind kind = RenderErrorKind::InvalidInput;
    std::string message;
};

struct ReadError {
    std::string message;
};

// Configuration

enum class TeamOrder : uint8_t {
    Position,
    KillsDescending,
};

struct AssetSourceConfig {
    std::string host = "ddragon.riotgames.com";
    std::string path_prefix = "/cdn";
    std::string version = "16.3.1";
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{30};
};

struct CacheConfig {
    std::filesystem::path root = "cache";
};

struct LayoutConfig {
    int image_width = 750;
    int header_height = 80;
    int team_header_height = 32;
    int column_header_height = 22;
    int row_height = 44;
    int team_spacing = 12;
    int bottom_padding = 16;

    int col_champion = 8;
    int col_name = 56;
    int col_items = 170;
    int col_kda = 420;
    int col_cs = 510;
    int col_gold = 570;
    int col_damage = 655;

    int champion_icon_size = 32;
    int item_icon_size = 24;
    int item_spacing = 2;
    int trinket_gap = 5;

    int main_item_slots = 6;
    TeamOrder order = TeamOrder::Position;
};

struct RenderConfig {
    int concurrency = 2;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds admission_timeout{30000};
    std::filesystem::path heading_font = "assets/fonts/Cinzel-Bold.ttf";
    std::filesystem::path stats_font = "assets/fonts/RobotoCondensed-Bold.ttf";
    LayoutConfig layout;
};

struct AppConfig {
    AssetSourceConfig asset_source;
    CacheConfig cache;
    RenderConfig render;
};

} // namespace scoreboard
