#pragma once

#include "scoreboard/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace scoreboard {

// Reads KEY=value lines into the process environment. Variables that are
// already set keep their value.
std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

std::optional<std::string> get_env(const std::string& key);

// Builds the application config from the environment, falling back to the
// struct defaults for anything unset or unparsable.
AppConfig load_config();

std::optional<TeamOrder> parse_team_order(const std::string& value);

} // namespace scoreboard
