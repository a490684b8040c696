#include "scoreboard/format.hpp"
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace scoreboard {

namespace {

constexpr size_t max_name_length = 12;
constexpr size_t truncated_name_length = 10;

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Byte offset just past the first n code points.
size_t codepoint_prefix_bytes(const std::string& s, size_t n) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_continuation_byte(s[i])) {
            if (seen == n) return i;
            ++seen;
        }
    }
    return s.size();
}

} // namespace

size_t utf8_length(std::string_view s) {
    size_t count = 0;
    for (char c : s) {
        if (!is_continuation_byte(c)) ++count;
    }
    return count;
}

std::string truncate_name(const std::string& name) {
    if (utf8_length(name) <= max_name_length) return name;
    return name.substr(0, codepoint_prefix_bytes(name, truncated_name_length)) + "..";
}

std::string format_stat(int value) {
    if (value < 1000) return std::to_string(value);
    // Tenths of a thousand, half rounded up.
    int64_t tenths = (static_cast<int64_t>(value) + 50) / 100;
    return std::to_string(tenths / 10) + "." + std::to_string(tenths % 10) + "k";
}

std::string format_kda(int kills, int deaths, int assists) {
    return std::to_string(kills) + " / " + std::to_string(deaths) + " / " +
           std::to_string(assists);
}

std::string format_duration(const std::string& mode, int64_t duration_secs) {
    int64_t minutes = duration_secs / 60;
    int64_t seconds = duration_secs % 60;
    std::ostringstream oss;
    oss << mode << " • " << minutes << ":" << std::setw(2) << std::setfill('0') << seconds;
    return oss.str();
}

} // namespace scoreboard
