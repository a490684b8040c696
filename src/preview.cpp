#include "scoreboard/preview.hpp"
#include "scoreboard/format.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace scoreboard {

using namespace ftxui;

namespace {

std::string f1(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v;
    return oss.str();
}

// Pads to a fixed column width counted in code points.
std::string pad_cell(const std::string& s) {
    constexpr size_t width = 5;
    size_t columns = utf8_length(s);
    return columns >= width ? s : s + std::string(width - columns, ' ');
}

Element render_team(const TeamLayout& team, const MatchData& match) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Player", "Champion", "Lvl", "Items", "KDA", "CS", "Gold", "DMG"});
    for (auto& row : team.rows) {
        const auto& p = match.participants[row.participant_index];
        rows.push_back({
            row.display_name, p.champion_name, std::to_string(p.champion_level),
            describe_item_bar(row.items), row.kda, row.creep_score, row.gold, row.damage,
        });
    }

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);

    for (size_t i = 0; i < team.rows.size(); ++i) {
        if (team.rows[i].tracked) {
            table.SelectRow(static_cast<int>(i) + 1).Decorate(color(Color::Yellow));
        }
        table.SelectCell(6, static_cast<int>(i) + 1).Decorate(color(Color::Yellow3));
        table.SelectCell(7, static_cast<int>(i) + 1).Decorate(color(Color::Red));
    }

    Color team_color = team.won ? Color::SteelBlue : Color::IndianRed;
    return vbox({
        text(team.title) | bold | color(team_color),
        table.Render(),
    });
}

} // namespace

std::string describe_item_bar(const std::vector<ItemCell>& cells) {
    std::string out;
    for (auto& cell : cells) {
        if (!out.empty()) out += ' ';
        if (cell.kind == SlotKind::Trinket || cell.kind == SlotKind::RoleItem) out += "| ";
        out += cell.kind == SlotKind::Empty ? pad_cell("·") : pad_cell(std::to_string(cell.item_id));
    }
    // Trailing padding of the last cell.
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

Element render_preview(const ScoreboardLayout& layout, const MatchData& match) {
    Color title_color = layout.tracked_won ? Color::SteelBlue : Color::IndianRed;
    return vbox({
        hbox({
            text(" " + layout.title) | bold | color(title_color),
            text("  |  "),
            text(layout.subtitle),
            text("  |  "),
            text(std::to_string(layout.width) + "x" + std::to_string(layout.height) + " px") | dim,
        }) | borderLight,
        render_team(layout.winners, match),
        text(""),
        render_team(layout.losers, match),
    });
}

Element render_cache_stats(const CacheStats& stats, const std::string& root) {
    double mb = static_cast<double>(stats.total_size_bytes) / (1024.0 * 1024.0);
    return hbox({
        text(" Cache " + root) | bold,
        text("  |  "),
        text(std::to_string(stats.file_count) + " files"),
        text("  |  "),
        text(f1(mb) + " MB"),
    }) | borderLight | color(Color::Cyan);
}

std::string to_text(const Element& element, int width) {
    auto screen = Screen::Create(Dimension::Fixed(width), Dimension::Fit(element));
    Render(screen, element);
    return screen.ToString();
}

void print_element(const Element& element) {
    auto screen = Screen::Create(Dimension::Full(), Dimension::Fit(element));
    Render(screen, element);
    screen.Print();
    std::cout << "\n";
}

} // namespace scoreboard
