// ==============================================================================
// test_alias_engine_gtest.cpp - Unit tests for alias expansion
// ==============================================================================

#include "mudgate/alias_engine.hpp"

#include <gtest/gtest.h>

namespace mudgate {

namespace {

Alias make_alias(std::string pattern, std::string replacement, bool enabled = true) {
    Alias alias;
    alias.pattern = std::move(pattern);
    alias.replacement = std::move(replacement);
    alias.enabled = enabled;
    return alias;
}

} // namespace

// ============================================================================
// Matching
// ============================================================================

TEST(AliasEngine, RestPlaceholder) {
    const AliasSet aliases = {make_alias("k", "kill $*")};
    EXPECT_EQ(apply_alias("k orc", aliases), "kill orc");
}

TEST(AliasEngine, NoMatchReturnsCommandUnchanged) {
    const AliasSet aliases = {make_alias("k", "kill $*")};
    EXPECT_EQ(apply_alias("kick orc", aliases), "kick orc");
    EXPECT_EQ(apply_alias("  look  ", aliases), "  look  ");
    EXPECT_EQ(apply_alias("", aliases), "");
}

TEST(AliasEngine, HeadComparedCaseInsensitively) {
    const AliasSet aliases = {make_alias("K", "kill $*")};
    EXPECT_EQ(apply_alias("k orc", aliases), "kill orc");
    EXPECT_EQ(apply_alias("K orc", aliases), "kill orc");
}

TEST(AliasEngine, CommandWithoutArguments) {
    const AliasSet aliases = {make_alias("gg", "get gold from corpse")};
    EXPECT_EQ(apply_alias("gg", aliases), "get gold from corpse");
}

TEST(AliasEngine, DisabledAliasSkipped) {
    const AliasSet aliases = {
        make_alias("k", "kick $*", false),
        make_alias("k", "kill $*"),
    };
    EXPECT_EQ(apply_alias("k orc", aliases), "kill orc");
}

TEST(AliasEngine, FirstMatchWins) {
    const AliasSet aliases = {
        make_alias("k", "kill $*"),
        make_alias("k", "kick $*"),
    };
    EXPECT_EQ(apply_alias("k orc", aliases), "kill orc");
}

TEST(AliasEngine, ExpansionNotRescanned) {
    const AliasSet aliases = {
        make_alias("k", "kill $*"),
        make_alias("kill", "say no killing"),
    };
    EXPECT_EQ(apply_alias("k orc", aliases), "kill orc");
}

TEST(AliasEngine, IdempotentOnExpandedCommand) {
    const AliasSet aliases = {make_alias("k", "kill $*")};
    const auto once = apply_alias("k orc", aliases);
    EXPECT_EQ(apply_alias(once, aliases), once);
}

// ============================================================================
// Template expansion
// ============================================================================

TEST(AliasEngine, PositionalPlaceholders) {
    EXPECT_EQ(expand_alias_template("give $2 to $1", "bob sword"), "give sword to bob");
}

TEST(AliasEngine, PositionalSkipsWhitespaceRuns) {
    EXPECT_EQ(expand_alias_template("$1-$2", "  a    b  "), "a-b");
}

TEST(AliasEngine, RestKeptVerbatim) {
    EXPECT_EQ(expand_alias_template("say $*", "hello   there"), "say hello   there");
}

TEST(AliasEngine, UnresolvedPlaceholderRendersEmpty) {
    EXPECT_EQ(expand_alias_template("cast $1 $2", "heal"), "cast heal");
    EXPECT_EQ(expand_alias_template("cast $1", ""), "cast");
}

TEST(AliasEngine, MultiDigitIndex) {
    EXPECT_EQ(expand_alias_template("$10", "a b c d e f g h i j"), "j");
    EXPECT_EQ(expand_alias_template("$1$0", "x"), "x");
}

TEST(AliasEngine, RestTextNotResubstituted) {
    EXPECT_EQ(expand_alias_template("say $*", "$1 dollars"), "say $1 dollars");
}

TEST(AliasEngine, LoneDollarKept) {
    EXPECT_EQ(expand_alias_template("pay 5$", "x"), "pay 5$");
    EXPECT_EQ(expand_alias_template("a $b", "x"), "a $b");
}

TEST(AliasEngine, ResultTrimmed) {
    EXPECT_EQ(expand_alias_template("  look $1  ", ""), "look");
}

} // namespace mudgate
