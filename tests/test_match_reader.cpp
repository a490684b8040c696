#include <gtest/gtest.h>
#include "scoreboard/match_reader.hpp"
#include <filesystem>
#include <fstream>

using namespace scoreboard;

namespace {

nlohmann::json sample_participant() {
    return {
        {"puuid", "p-1"},
        {"riotIdGameName", "Hide on bush"},
        {"summonerName", "OldName"},
        {"championName", "Ahri"},
        {"champLevel", 16},
        {"kills", 7},
        {"deaths", 2},
        {"assists", 11},
        {"totalMinionsKilled", 180},
        {"neutralMinionsKilled", 24},
        {"goldEarned", 12345},
        {"totalDamageDealtToChampions", 25800},
        {"win", true},
        {"item0", 3089}, {"item1", 0}, {"item2", 3020},
        {"item3", 0}, {"item4", 0}, {"item5", 3157},
        {"item6", 3340},
        {"roleBoundItem", 3865},
        {"teamPosition", "MIDDLE"},
    };
}

class MatchFileTest : public ::testing::Test {
protected:
    std::filesystem::path path = "test_match_file.json";

    void TearDown() override {
        std::filesystem::remove(path);
    }

    void write(const std::string& content) {
        std::ofstream f(path);
        f << content;
    }
};

} // namespace

TEST(ParseParticipant, MapsFields) {
    auto p = parse_participant(sample_participant());
    EXPECT_EQ(p.puuid, "p-1");
    EXPECT_EQ(p.summoner_name, "Hide on bush");
    EXPECT_EQ(p.champion_name, "Ahri");
    EXPECT_EQ(p.champion_level, 16);
    EXPECT_EQ(p.kills, 7);
    EXPECT_EQ(p.creep_score(), 204);
    EXPECT_EQ(p.gold_earned, 12345);
    EXPECT_EQ(p.damage_to_champions, 25800);
    EXPECT_TRUE(p.win);
    EXPECT_EQ(p.items, (std::array<int, 6>{3089, 0, 3020, 0, 0, 3157}));
    EXPECT_EQ(p.trinket, 3340);
    EXPECT_EQ(p.role_item, 3865);
    EXPECT_EQ(p.team_position, "MIDDLE");
}

TEST(ParseParticipant, FallsBackToSummonerName) {
    auto j = sample_participant();
    j.erase("riotIdGameName");
    EXPECT_EQ(parse_participant(j).summoner_name, "OldName");

    j["riotIdGameName"] = "";
    EXPECT_EQ(parse_participant(j).summoner_name, "OldName");
}

TEST(ParseParticipant, MissingAndNullFieldsDefault) {
    nlohmann::json j = {{"puuid", "p-2"}, {"kills", nullptr}, {"item3", "bad"}};
    auto p = parse_participant(j);
    EXPECT_EQ(p.kills, 0);
    EXPECT_EQ(p.items[3], 0);
    EXPECT_EQ(p.role_item, 0);
    EXPECT_FALSE(p.win);
}

TEST(ParseMatch, ReadsInfo) {
    nlohmann::json j = {
        {"metadata", {{"matchId", "NA1_5012345678"}}},
        {"info", {
            {"gameMode", "CLASSIC"},
            {"gameDuration", 1867},
            {"participants", {sample_participant(), sample_participant()}},
        }},
    };
    auto match = parse_match(j);
    EXPECT_EQ(match.match_id, "NA1_5012345678");
    EXPECT_EQ(match.game_mode, "CLASSIC");
    EXPECT_EQ(match.game_duration_secs, 1867);
    EXPECT_EQ(match.participants.size(), 2u);
}

TEST(ParseAccount, ReadsRiotId) {
    auto account = parse_account({{"puuid", "p-1"}, {"gameName", "Faker"}, {"tagLine", "KR1"}});
    EXPECT_EQ(account.puuid, "p-1");
    EXPECT_EQ(account.game_name, "Faker");
    EXPECT_EQ(account.tag_line, "KR1");
}

TEST_F(MatchFileTest, ReadsDocument) {
    nlohmann::json j = {
        {"metadata", {{"matchId", "EUW1_1"}}},
        {"info", {{"gameMode", "ARAM"}, {"gameDuration", 900},
                  {"participants", {sample_participant()}}}},
    };
    write(j.dump());
    auto match = read_match_file(path);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->match_id, "EUW1_1");
    EXPECT_EQ(match->participants.size(), 1u);
}

TEST_F(MatchFileTest, MissingFile) {
    auto match = read_match_file("does_not_exist.json");
    ASSERT_FALSE(match.has_value());
    EXPECT_NE(match.error().message.find("Cannot open"), std::string::npos);
}

TEST_F(MatchFileTest, MalformedJson) {
    write("{\"info\": [");
    auto match = read_match_file(path);
    ASSERT_FALSE(match.has_value());
    EXPECT_NE(match.error().message.find("JSON parse error"), std::string::npos);
}

TEST_F(MatchFileTest, NoInfoObject) {
    write("{\"metadata\": {}}");
    EXPECT_FALSE(read_match_file(path).has_value());
}
