#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "boxpuzzle/app/CommandConsole.hpp"
#include "boxpuzzle/generation/FigureAssembler.hpp"
#include "boxpuzzle/generation/TagDistribution.hpp"
#include "TempDirectory.hpp"

using boxpuzzle::app::CommandConsole;
using boxpuzzle::app::GeneratorConfig;
using boxpuzzle::geometry::Debuff;
using boxpuzzle::tests::TempDirectory;

namespace
{
bool LogContains(const CommandConsole& console, const std::string& text)
{
    const auto& log = console.GetLog();
    return std::any_of(log.begin(), log.end(), [&](const std::string& line) {
        return line.find(text) != std::string::npos;
    });
}

std::ptrdiff_t LogIndexOf(const CommandConsole& console, const std::string& line)
{
    const auto& log = console.GetLog();
    const auto it = std::find(log.begin(), log.end(), line);
    return it == log.end() ? -1 : std::distance(log.begin(), it);
}

class CommandConsoleTest : public ::testing::Test
{
protected:
    TempDirectory temp;
    GeneratorConfig config{temp.Path() / "generator.json"};
    CommandConsole console{config};
};
} // namespace

TEST(Tokenize, SplitsOnWhitespace)
{
    const std::vector<std::string> expected{"split", "2", "3", "4"};
    EXPECT_EQ(boxpuzzle::app::Tokenize("  split 2\t3   4 "), expected);
    EXPECT_TRUE(boxpuzzle::app::Tokenize("   ").empty());
}

TEST_F(CommandConsoleTest, SplitStoresBoxes)
{
    ASSERT_TRUE(console.Execute("split 2 2 2 1 42"));
    EXPECT_EQ(console.GetBoxes().size(), 2U);
    EXPECT_EQ(console.GetSeed(), 42U);
    EXPECT_FALSE(console.GetLevel().has_value());
    EXPECT_TRUE(LogContains(console, "# split 2 2 2 1 42"));
    EXPECT_TRUE(LogContains(console, "into 2 boxes"));
}

TEST_F(CommandConsoleTest, SplitErrorsAreReported)
{
    EXPECT_FALSE(console.Execute("split 2 2 2 8 1"));
    EXPECT_EQ(console.GetLog().back().rfind("Error: Too many cuts", 0), 0U);
    EXPECT_TRUE(console.GetBoxes().empty());

    EXPECT_FALSE(console.Execute("split 2 two 2 1"));
    EXPECT_FALSE(console.Execute("split 2 2"));
    EXPECT_FALSE(console.Execute("split 2 2 2 1 -5"));
}

TEST_F(CommandConsoleTest, UnknownCommand)
{
    EXPECT_FALSE(console.Execute("frobnicate 1 2"));
    EXPECT_TRUE(LogContains(console, "Unknown command 'frobnicate'"));
}

TEST_F(CommandConsoleTest, BlankLineIsIgnored)
{
    EXPECT_TRUE(console.Execute("   "));
    EXPECT_TRUE(console.GetLog().empty());
}

TEST_F(CommandConsoleTest, HelpGroupsByCategory)
{
    ASSERT_TRUE(console.Execute("help"));
    const std::ptrdiff_t files = LogIndexOf(console, "[Files]");
    const std::ptrdiff_t general = LogIndexOf(console, "[General]");
    const std::ptrdiff_t generation = LogIndexOf(console, "[Generation]");
    ASSERT_GE(files, 0);
    ASSERT_GE(general, 0);
    ASSERT_GE(generation, 0);
    EXPECT_LT(files, general);
    EXPECT_LT(general, generation);
    EXPECT_TRUE(LogContains(console, "  split w h d cuts [seed] - "));
    EXPECT_TRUE(LogContains(console, "  config_reload - "));
}

TEST_F(CommandConsoleTest, FigureMatchesGenerator)
{
    ASSERT_TRUE(console.Execute("figure 7 5"));
    const boxpuzzle::generation::Figure expected = boxpuzzle::generation::GenerateFigure(7, 5);
    EXPECT_EQ(console.GetBoxes(), expected.boxes);
    EXPECT_TRUE(LogContains(console, "has 5 boxes"));
}

TEST_F(CommandConsoleTest, LevelCommand)
{
    ASSERT_TRUE(console.Execute("level 3 easy"));
    ASSERT_TRUE(console.GetLevel().has_value());
    EXPECT_EQ(console.GetLevel()->difficultyId, "easy");
    EXPECT_EQ(console.GetBoxes(), console.GetLevel()->figure.boxes);

    EXPECT_FALSE(console.Execute("level 3 impossible"));
    EXPECT_TRUE(LogContains(console, "Unknown difficulty 'impossible'"));
}

TEST_F(CommandConsoleTest, TagAppliesToLastSet)
{
    EXPECT_FALSE(console.Execute("tag FRAGILE 2"));

    ASSERT_TRUE(console.Execute("split 3 3 3 5 9"));
    ASSERT_TRUE(console.Execute("tag FRAGILE 2"));
    EXPECT_EQ(boxpuzzle::generation::CountDebuff(console.GetBoxes(), Debuff::Fragile), 2U);

    EXPECT_FALSE(console.Execute("tag SHINY 2"));
    EXPECT_FALSE(console.Execute("tag HEAVY many"));
}

TEST_F(CommandConsoleTest, GenerateUsesConfig)
{
    ASSERT_TRUE(console.Execute("generate"));
    ASSERT_EQ(console.GetBoxes().size(), 3U);
    EXPECT_EQ(console.GetSeed(), 123U);
    EXPECT_EQ(boxpuzzle::generation::CountDebuff(console.GetBoxes(), Debuff::Fragile), 1U);
    EXPECT_EQ(boxpuzzle::generation::CountDebuff(console.GetBoxes(), Debuff::Heavy), 2U);
    EXPECT_EQ(boxpuzzle::generation::CountDebuff(console.GetBoxes(), Debuff::NonTiltable), 1U);
}

TEST_F(CommandConsoleTest, SaveAndLoadFigure)
{
    const std::string path = (temp.Path() / "out" / "figure.json").string();
    EXPECT_FALSE(console.Execute("save " + path));

    ASSERT_TRUE(console.Execute("figure 11 4"));
    const std::vector<boxpuzzle::geometry::Box> saved = console.GetBoxes();
    ASSERT_TRUE(console.Execute("save " + path));

    ASSERT_TRUE(console.Execute("split 2 2 2 1 1"));
    ASSERT_TRUE(console.Execute("load " + path));
    EXPECT_EQ(console.GetBoxes(), saved);
    EXPECT_EQ(console.GetSeed(), 11U);
    EXPECT_FALSE(console.GetLevel().has_value());
}

TEST_F(CommandConsoleTest, SaveAndLoadLevel)
{
    const std::string path = (temp.Path() / "level.json").string();
    ASSERT_TRUE(console.Execute("level 5 medium"));
    const float angle = console.GetLevel()->targetAngle;
    ASSERT_TRUE(console.Execute("save " + path));

    ASSERT_TRUE(console.Execute("figure 1 2"));
    ASSERT_TRUE(console.Execute("load " + path));
    ASSERT_TRUE(console.GetLevel().has_value());
    EXPECT_EQ(console.GetLevel()->difficultyId, "medium");
    EXPECT_FLOAT_EQ(console.GetLevel()->targetAngle, angle);
}

TEST_F(CommandConsoleTest, LoadMissingFileFails)
{
    EXPECT_FALSE(console.Execute("load " + (temp.Path() / "nope.json").string()));
}

TEST_F(CommandConsoleTest, Stats)
{
    ASSERT_TRUE(console.Execute("stats"));
    EXPECT_TRUE(LogContains(console, "No boxes"));

    ASSERT_TRUE(console.Execute("split 2 2 2 1 42"));
    console.ClearLog();
    ASSERT_TRUE(console.Execute("stats"));
    EXPECT_TRUE(LogContains(console, "Boxes: 2"));
    EXPECT_TRUE(LogContains(console, "Volume: 8"));
    EXPECT_TRUE(LogContains(console, "Connected: yes"));
}

TEST_F(CommandConsoleTest, ConfigReloadCreatesFile)
{
    ASSERT_TRUE(console.Execute("config_reload"));
    EXPECT_TRUE(std::filesystem::exists(temp.Path() / "generator.json"));
    EXPECT_TRUE(LogContains(console, "seed=123"));
}

TEST_F(CommandConsoleTest, CustomCommands)
{
    int calls = 0;
    console.RegisterCommand("ping [n]", "Reply with pong", [&](const std::vector<std::string>& tokens) {
        ++calls;
        console.AddLog("pong " + std::to_string(tokens.size()));
    });

    EXPECT_TRUE(console.HasCommand("ping"));
    ASSERT_TRUE(console.Execute("ping 1"));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(console.GetLog().back(), "pong 2");

    console.RegisterCommand("ping", "Fail instead", [&](const std::vector<std::string>&) {
        console.AddError("no");
    });
    EXPECT_FALSE(console.Execute("ping"));
    const auto pingEntries = std::count_if(console.GetCommands().begin(), console.GetCommands().end(), [](const auto& info) {
        return info.usage.rfind("ping", 0) == 0;
    });
    EXPECT_EQ(pingEntries, 1);
}
