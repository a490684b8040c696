#pragma once

#include "scoreboard/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace scoreboard {

enum class SlotKind : uint8_t {
    Item,     // packed main item
    Empty,    // placeholder tile
    Trinket,
    RoleItem,
};

struct ItemCell {
    SlotKind kind = SlotKind::Empty;
    int item_id = 0;
    int x = 0;
};

struct RowLayout {
    size_t participant_index = 0;
    int y = 0;
    bool tracked = false;
    bool won = false;
    std::string display_name;
    std::string kda;
    std::string creep_score;
    std::string gold;
    std::string damage;
    std::vector<ItemCell> items;
};

struct TeamLayout {
    bool won = false;
    std::string title;
    int banner_y = 0;
    int column_header_y = 0;
    std::vector<RowLayout> rows;
};

struct ScoreboardLayout {
    int width = 0;
    int height = 0;
    bool tracked_won = false;
    std::string title;
    std::string subtitle;
    TeamLayout winners;
    TeamLayout losers;
};

// TOP=0 .. UTILITY=4, anything else 99.
int position_rank(std::string_view team_position);

// Indices into participants for one team, ordered per config.order. Stable.
std::vector<size_t> order_team(const std::vector<MatchParticipant>& participants,
                               bool won, TeamOrder order);

// Main ids (plus the role item in 7-slot mode) with zeros removed, in slot order.
std::vector<int> packed_main_items(const MatchParticipant& p, const LayoutConfig& config);

// Fixed-width item bar: packed items, empty fillers, trinket, optional role item.
std::vector<ItemCell> pack_item_bar(const MatchParticipant& p, const LayoutConfig& config);

int image_height(const LayoutConfig& config, int winner_rows, int loser_rows);

ScoreboardLayout compute_layout(const MatchData& match, const std::string& tracked_puuid,
                                const LayoutConfig& config);

} // namespace scoreboard
