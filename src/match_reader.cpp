#include "scoreboard/match_reader.hpp"
#include <fstream>

namespace scoreboard {

namespace {

int safe_int(const nlohmann::json& j, const std::string& key, int fallback = 0) {
    if (j.contains(key) && !j[key].is_null() && j[key].is_number())
        return j[key].get<int>();
    return fallback;
}

std::string safe_str(const nlohmann::json& j, const std::string& key,
                     const std::string& fallback = "") {
    if (j.contains(key) && !j[key].is_null() && j[key].is_string())
        return j[key].get<std::string>();
    return fallback;
}

bool safe_bool(const nlohmann::json& j, const std::string& key, bool fallback = false) {
    if (j.contains(key) && j[key].is_boolean()) return j[key].get<bool>();
    return fallback;
}

} // namespace

MatchParticipant parse_participant(const nlohmann::json& j) {
    MatchParticipant p;
    p.puuid = safe_str(j, "puuid");
    p.summoner_name = safe_str(j, "riotIdGameName");
    if (p.summoner_name.empty()) p.summoner_name = safe_str(j, "summonerName");
    p.champion_name = safe_str(j, "championName");
    p.champion_level = safe_int(j, "champLevel");
    p.kills = safe_int(j, "kills");
    p.deaths = safe_int(j, "deaths");
    p.assists = safe_int(j, "assists");
    p.minions_killed = safe_int(j, "totalMinionsKilled");
    p.neutral_minions_killed = safe_int(j, "neutralMinionsKilled");
    p.gold_earned = safe_int(j, "goldEarned");
    p.damage_to_champions = safe_int(j, "totalDamageDealtToChampions");
    p.win = safe_bool(j, "win");

    for (size_t i = 0; i < p.items.size(); ++i) {
        p.items[i] = safe_int(j, "item" + std::to_string(i));
    }
    p.trinket = safe_int(j, "item6");
    p.role_item = safe_int(j, "roleBoundItem");
    p.team_position = safe_str(j, "teamPosition");
    return p;
}

MatchData parse_match(const nlohmann::json& j) {
    MatchData match;
    if (j.contains("metadata") && j["metadata"].is_object()) {
        match.match_id = safe_str(j["metadata"], "matchId");
    }

    if (!j.contains("info") || !j["info"].is_object()) return match;
    auto& info = j["info"];

    match.game_mode = safe_str(info, "gameMode");
    if (info.contains("gameDuration") && info["gameDuration"].is_number()) {
        match.game_duration_secs = info["gameDuration"].get<int64_t>();
    }

    if (info.contains("participants") && info["participants"].is_array()) {
        for (auto& pj : info["participants"]) {
            if (pj.is_object()) match.participants.push_back(parse_participant(pj));
        }
    }
    return match;
}

TrackedAccount parse_account(const nlohmann::json& j) {
    return {
        .puuid = safe_str(j, "puuid"),
        .game_name = safe_str(j, "gameName"),
        .tag_line = safe_str(j, "tagLine"),
    };
}

std::expected<MatchData, ReadError> read_match_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ReadError{"Cannot open match file: " + path.string()});
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(ReadError{std::string("JSON parse error: ") + e.what()});
    }

    if (!j.is_object() || !j.contains("info")) {
        return std::unexpected(ReadError{"Match document has no info object"});
    }
    return parse_match(j);
}

} // namespace scoreboard
