#include "scoreboard/layout.hpp"
#include "scoreboard/format.hpp"
#include <algorithm>
#include <functional>
#include <ranges>

namespace scoreboard {

namespace {

constexpr int unknown_position_rank = 99;

RowLayout make_row(const MatchParticipant& p, size_t index, int y,
                   const std::string& tracked_puuid, const LayoutConfig& config) {
    return {
        .participant_index = index,
        .y = y,
        .tracked = p.puuid == tracked_puuid,
        .won = p.win,
        .display_name = truncate_name(p.summoner_name),
        .kda = format_kda(p.kills, p.deaths, p.assists),
        .creep_score = std::to_string(p.creep_score()),
        .gold = format_stat(p.gold_earned),
        .damage = format_stat(p.damage_to_champions),
        .items = pack_item_bar(p, config),
    };
}

// Lays out one team section starting at y; returns the y just past its last row.
int layout_team(TeamLayout& team, const MatchData& match, bool won, int y,
                const std::string& tracked_puuid, const LayoutConfig& config) {
    team.won = won;
    team.title = won ? "VICTORY" : "DEFEAT";
    team.banner_y = y;
    y += config.team_header_height;
    team.column_header_y = y;
    y += config.column_header_height;

    for (size_t index : order_team(match.participants, won, config.order)) {
        team.rows.push_back(make_row(match.participants[index], index, y, tracked_puuid, config));
        y += config.row_height;
    }
    return y;
}

} // namespace

int position_rank(std::string_view team_position) {
    if (team_position == "TOP") return 0;
    if (team_position == "JUNGLE") return 1;
    if (team_position == "MIDDLE") return 2;
    if (team_position == "BOTTOM") return 3;
    if (team_position == "UTILITY") return 4;
    return unknown_position_rank;
}

std::vector<size_t> order_team(const std::vector<MatchParticipant>& participants,
                               bool won, TeamOrder order) {
    std::vector<size_t> team;
    for (size_t i = 0; i < participants.size(); ++i) {
        if (participants[i].win == won) team.push_back(i);
    }

    switch (order) {
        case TeamOrder::Position:
            std::ranges::stable_sort(team, {}, [&](size_t i) {
                return position_rank(participants[i].team_position);
            });
            break;
        case TeamOrder::KillsDescending:
            std::ranges::stable_sort(team, std::ranges::greater{}, [&](size_t i) {
                return participants[i].kills;
            });
            break;
    }
    return team;
}

std::vector<int> packed_main_items(const MatchParticipant& p, const LayoutConfig& config) {
    std::vector<int> ids(p.items.begin(), p.items.end());
    if (config.main_item_slots > static_cast<int>(p.items.size())) {
        ids.push_back(p.role_item);
    }

    std::vector<int> packed;
    for (int id : ids) {
        if (id != 0) packed.push_back(id);
    }
    return packed;
}

std::vector<ItemCell> pack_item_bar(const MatchParticipant& p, const LayoutConfig& config) {
    const int stride = config.item_icon_size + config.item_spacing;
    const int slots = config.main_item_slots;
    auto packed = packed_main_items(p, config);

    std::vector<ItemCell> cells;
    for (int i = 0; i < slots; ++i) {
        int x = config.col_items + i * stride;
        if (i < static_cast<int>(packed.size())) {
            cells.push_back({SlotKind::Item, packed[i], x});
        } else {
            cells.push_back({SlotKind::Empty, 0, x});
        }
    }

    int trinket_x = config.col_items + slots * stride + config.trinket_gap;
    if (p.trinket != 0) {
        cells.push_back({SlotKind::Trinket, p.trinket, trinket_x});
    } else {
        cells.push_back({SlotKind::Empty, 0, trinket_x});
    }

    // In 7-slot mode the role item already sits among the main slots.
    bool role_cell = slots <= static_cast<int>(p.items.size()) && p.role_item != 0;
    if (role_cell) {
        cells.push_back({SlotKind::RoleItem, p.role_item, trinket_x + stride});
    }
    return cells;
}

int image_height(const LayoutConfig& config, int winner_rows, int loser_rows) {
    int team_bands = config.team_header_height + config.column_header_height;
    return config.header_height +
           team_bands + winner_rows * config.row_height +
           config.team_spacing +
           team_bands + loser_rows * config.row_height +
           config.bottom_padding;
}

ScoreboardLayout compute_layout(const MatchData& match, const std::string& tracked_puuid,
                                const LayoutConfig& config) {
    ScoreboardLayout layout;
    layout.width = config.image_width;

    auto tracked = std::ranges::find(match.participants, tracked_puuid, &MatchParticipant::puuid);
    layout.tracked_won = tracked != match.participants.end() && tracked->win;
    layout.title = layout.tracked_won ? "VICTORY" : "DEFEAT";
    layout.subtitle = format_duration(match.game_mode, match.game_duration_secs);

    int y = config.header_height;
    y = layout_team(layout.winners, match, true, y, tracked_puuid, config);
    y += config.team_spacing;
    y = layout_team(layout.losers, match, false, y, tracked_puuid, config);
    layout.height = y + config.bottom_padding;
    return layout;
}

} // namespace scoreboard
