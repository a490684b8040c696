#pragma once

#include "scoreboard/layout.hpp"
#include "scoreboard/types.hpp"
#include <string>
#include <ftxui/dom/elements.hpp>

namespace scoreboard {

// Item bar as text, trinket and role item after a "|": "1001  1002  ·  ... | 3340".
std::string describe_item_bar(const std::vector<ItemCell>& cells);

ftxui::Element render_preview(const ScoreboardLayout& layout, const MatchData& match);
ftxui::Element render_cache_stats(const CacheStats& stats, const std::string& root);

// Renders to a plain string of the given width (no colour codes when piped).
std::string to_text(const ftxui::Element& element, int width = 100);

void print_element(const ftxui::Element& element);

} // namespace scoreboard
