#include <gtest/gtest.h>
#include "scoreboard/preview.hpp"
#include "scoreboard/format.hpp"

using namespace scoreboard;

namespace {

MatchData make_match() {
    MatchData match;
    match.game_mode = "ARAM";
    match.game_duration_secs = 905;
    for (int i = 0; i < 2; ++i) {
        MatchParticipant p;
        p.puuid = "p" + std::to_string(i);
        p.summoner_name = i == 0 ? "Winner" : "Loser";
        p.champion_name = i == 0 ? "Jinx" : "Lux";
        p.champion_level = 18;
        p.kills = 10 - i;
        p.gold_earned = 15432;
        p.win = i == 0;
        p.items = {3031, 0, 0, 0, 0, 0};
        p.trinket = 3363;
        match.participants.push_back(p);
    }
    return match;
}

} // namespace

TEST(DescribeItemBar, SeparatesTrinket) {
    MatchParticipant p;
    p.items = {1001, 0, 1002, 0, 0, 0};
    p.trinket = 3340;
    auto text = describe_item_bar(pack_item_bar(p, LayoutConfig{}));
    EXPECT_EQ(text.rfind("1001", 0), 0u);
    EXPECT_NE(text.find("| 3340"), std::string::npos);
    EXPECT_LT(text.find("1002"), text.find("| 3340"));
}

TEST(DescribeItemBar, EmptySlotsKeepColumnWidth) {
    MatchParticipant full;
    full.items = {1001, 1002, 1003, 1004, 1005, 1006};
    full.trinket = 3340;
    MatchParticipant bare;
    bare.trinket = 3340;

    auto full_text = describe_item_bar(pack_item_bar(full, LayoutConfig{}));
    auto bare_text = describe_item_bar(pack_item_bar(bare, LayoutConfig{}));
    EXPECT_EQ(utf8_length(bare_text), utf8_length(full_text));
}

TEST(RenderPreview, ShowsBothTeams) {
    auto match = make_match();
    auto layout = compute_layout(match, "p0", LayoutConfig{});
    auto text = to_text(render_preview(layout, match), 140);

    EXPECT_NE(text.find("VICTORY"), std::string::npos);
    EXPECT_NE(text.find("DEFEAT"), std::string::npos);
    EXPECT_NE(text.find("ARAM"), std::string::npos);
    EXPECT_NE(text.find("Winner"), std::string::npos);
    EXPECT_NE(text.find("Lux"), std::string::npos);
    EXPECT_NE(text.find("15.4k"), std::string::npos);
    EXPECT_LT(text.find("Winner"), text.find("Loser"));
}

TEST(RenderCacheStats, ShowsCountAndSize) {
    CacheStats stats{.file_count = 12, .total_size_bytes = 3 * 1024 * 1024};
    auto text = to_text(render_cache_stats(stats, "cache"), 80);
    EXPECT_NE(text.find("12 files"), std::string::npos);
    EXPECT_NE(text.find("3.0 MB"), std::string::npos);
}
