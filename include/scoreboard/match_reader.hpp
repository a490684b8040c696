#pragma once

#include "scoreboard/types.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace scoreboard {

MatchParticipant parse_participant(const nlohmann::json& j);
MatchData parse_match(const nlohmann::json& j);
TrackedAccount parse_account(const nlohmann::json& j);

std::expected<MatchData, ReadError> read_match_file(const std::filesystem::path& path);

} // namespace scoreboard
