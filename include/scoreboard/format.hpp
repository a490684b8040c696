#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace scoreboard {

// Number of UTF-8 code points in s.
size_t utf8_length(std::string_view s);

// Names longer than 12 characters keep the first 10 followed by "..".
// Characters are counted as UTF-8 code points.
std::string truncate_name(const std::string& name);

// 15432 -> "15.4k", 850 -> "850".
std::string format_stat(int value);

std::string format_kda(int kills, int deaths, int assists);

// "CLASSIC • 31:07"
std::string format_duration(const std::string& mode, int64_t duration_secs);

} // namespace scoreboard
