// ==============================================================================
// test_command_splitter_gtest.cpp - Unit tests for command splitting
// ==============================================================================

#include "mudgate/command_splitter.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace mudgate {

using Commands = std::vector<std::string>;

// ============================================================================
// Separator handling
// ============================================================================

TEST(CommandSplitter, SplitsOnSeparator) {
    EXPECT_EQ(split_commands("a;b"), (Commands{"a", "b"}));
}

TEST(CommandSplitter, EscapedSeparatorIsLiteral) {
    EXPECT_EQ(split_commands("a\\;b"), (Commands{"a;b"}));
}

TEST(CommandSplitter, TrailingEmptyCommandDropped) {
    EXPECT_EQ(split_commands("a;"), (Commands{"a"}));
}

TEST(CommandSplitter, LoneSeparatorYieldsNothing) {
    EXPECT_TRUE(split_commands(";").empty());
    EXPECT_TRUE(split_commands("").empty());
}

TEST(CommandSplitter, InteriorEmptyCommandKept) {
    EXPECT_EQ(split_commands("a;;b"), (Commands{"a", "", "b"}));
}

TEST(CommandSplitter, BackslashEscapesAnyCharacter) {
    EXPECT_EQ(split_commands("say \\\\o/"), (Commands{"say \\o/"}));
    EXPECT_EQ(split_commands("\\x"), (Commands{"x"}));
}

TEST(CommandSplitter, TrailingBackslashDropped) {
    EXPECT_EQ(split_commands("look\\"), (Commands{"look"}));
}

TEST(CommandSplitter, WhitespacePreserved) {
    EXPECT_EQ(split_commands(" n ; s "), (Commands{" n ", " s "}));
}

TEST(CommandSplitter, CustomSeparator) {
    EXPECT_EQ(split_commands("n|e;s", '|'), (Commands{"n", "e;s"}));
    EXPECT_EQ(split_commands("n\\|e", '|'), (Commands{"n|e"}));
}

// ============================================================================
// Agreement with plain slicing
// ============================================================================

namespace {

Commands slice(const std::string& text, char separator) {
    Commands out;
    std::string current;
    for (char c : text) {
        if (c == separator) {
            out.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) out.push_back(current);
    return out;
}

} // namespace

TEST(CommandSplitter, MatchesPlainSlicingWithoutEscapes) {
    const std::vector<std::string> inputs = {
        "n",
        "n;e;s;w",
        "get all from corpse;drop sword",
        ";;look",
        "kill orc;;flee;",
        "say hello world",
        "a;b;c;d;e;f;g;h",
    };

    for (const auto& input : inputs) {
        EXPECT_EQ(split_commands(input), slice(input, ';')) << input;
    }
}

} // namespace mudgate
