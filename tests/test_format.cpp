#include <gtest/gtest.h>
#include "scoreboard/format.hpp"

using namespace scoreboard;

TEST(FormatStat, BelowThousandIsPlain) {
    EXPECT_EQ(format_stat(0), "0");
    EXPECT_EQ(format_stat(850), "850");
    EXPECT_EQ(format_stat(999), "999");
}

TEST(FormatStat, ThousandsUseOneDecimal) {
    EXPECT_EQ(format_stat(1000), "1.0k");
    EXPECT_EQ(format_stat(15432), "15.4k");
    EXPECT_EQ(format_stat(12345), "12.3k");
}

TEST(FormatStat, HalfwayValuesRoundUp) {
    EXPECT_EQ(format_stat(1050), "1.1k");
    EXPECT_EQ(format_stat(2050), "2.1k");
    EXPECT_EQ(format_stat(3050), "3.1k");
    EXPECT_EQ(format_stat(1049), "1.0k");
    EXPECT_EQ(format_stat(9999), "10.0k");
}

TEST(FormatKda, SlashSeparated) {
    EXPECT_EQ(format_kda(7, 2, 11), "7 / 2 / 11");
    EXPECT_EQ(format_kda(0, 0, 0), "0 / 0 / 0");
}

TEST(TruncateName, ShortNamesUnchanged) {
    EXPECT_EQ(truncate_name("Faker"), "Faker");
    EXPECT_EQ(truncate_name("TwelveChars!"), "TwelveChars!");
}

TEST(TruncateName, LongNamesKeepTenCharacters) {
    EXPECT_EQ(truncate_name("ThirteenChars"), "ThirteenCh..");
    EXPECT_EQ(truncate_name("AVeryLongSummonerName"), "AVeryLongS..");
}

TEST(TruncateName, CountsCodePointsNotBytes) {
    // 12 two-byte characters: within the limit despite being 24 bytes.
    std::string twelve;
    for (int i = 0; i < 12; ++i) twelve += "é";
    EXPECT_EQ(truncate_name(twelve), twelve);

    std::string thirteen = twelve + "é";
    std::string ten;
    for (int i = 0; i < 10; ++i) ten += "é";
    EXPECT_EQ(truncate_name(thirteen), ten + "..");
}

TEST(FormatDuration, PadsSeconds) {
    EXPECT_EQ(format_duration("CLASSIC", 1867), "CLASSIC • 31:07");
    EXPECT_EQ(format_duration("ARAM", 60), "ARAM • 1:00");
    EXPECT_EQ(format_duration("CLASSIC", 0), "CLASSIC • 0:00");
}
