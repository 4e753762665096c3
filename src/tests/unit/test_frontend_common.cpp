//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_frontend_common.cpp
// Purpose: Unit tests for the shared front-end helpers: character classes,
//          decimal literal parsing, scope tracking and name allocation.
//
//===----------------------------------------------------------------------===//

#include "frontends/common/CharUtils.hpp"
#include "frontends/common/NameMangler.hpp"
#include "frontends/common/NumberParsing.hpp"
#include "frontends/common/ScopeTracker.hpp"

#include <gtest/gtest.h>

using namespace rosella::frontends::common;

TEST(CharUtils, Classification)
{
    EXPECT_TRUE(char_utils::isIdentifierStart('_'));
    EXPECT_TRUE(char_utils::isIdentifierStart('Q'));
    EXPECT_FALSE(char_utils::isIdentifierStart('7'));
    EXPECT_TRUE(char_utils::isIdentifierContinue('7'));
    EXPECT_TRUE(char_utils::isNewline('\r'));
    EXPECT_FALSE(char_utils::isHorizontalWhitespace('\n'));
    EXPECT_EQ(char_utils::toLowercase("MiXeD_42"), "mixed_42");
}

TEST(NumberParsing, AcceptsUpToInt32Max)
{
    auto zero = number_parsing::parseDecimalLiteral("0");
    EXPECT_TRUE(zero.valid);
    EXPECT_EQ(zero.intValue, 0);

    auto max = number_parsing::parseDecimalLiteral("2147483647");
    EXPECT_TRUE(max.valid);
    EXPECT_FALSE(max.overflow);
    EXPECT_EQ(max.intValue, 2147483647);

    auto leading = number_parsing::parseDecimalLiteral("007");
    EXPECT_TRUE(leading.valid);
    EXPECT_EQ(leading.intValue, 7);
}

TEST(NumberParsing, RejectsOverflowAndJunk)
{
    auto over = number_parsing::parseDecimalLiteral("2147483648");
    EXPECT_FALSE(over.valid);
    EXPECT_TRUE(over.overflow);

    auto huge = number_parsing::parseDecimalLiteral("99999999999999999999999");
    EXPECT_FALSE(huge.valid);
    EXPECT_TRUE(huge.overflow);

    EXPECT_FALSE(number_parsing::parseDecimalLiteral("").valid);
    EXPECT_FALSE(number_parsing::parseDecimalLiteral("12a").valid);
    EXPECT_FALSE(number_parsing::parseDecimalLiteral("12a").overflow);
}

TEST(ScopeTracker, InnermostBindingWins)
{
    ScopeTracker scopes;
    scopes.pushScope();
    scopes.bind("x", 1);
    {
        ScopeTracker::ScopedScope inner(scopes);
        EXPECT_EQ(scopes.depth(), 2u);
        EXPECT_FALSE(scopes.isDeclaredInCurrentScope("x"));
        scopes.bind("x", 2);
        EXPECT_EQ(scopes.resolve("x"), 2u);
    }
    EXPECT_EQ(scopes.depth(), 1u);
    EXPECT_EQ(scopes.resolve("x"), 1u);
    EXPECT_FALSE(scopes.resolve("y").has_value());
}

TEST(ScopeTracker, RebindInSameScopeReplaces)
{
    ScopeTracker scopes;
    scopes.pushScope();
    scopes.bind("v", 3);
    scopes.bind("v", 4);
    EXPECT_TRUE(scopes.isDeclaredInCurrentScope("v"));
    EXPECT_EQ(scopes.resolve("v"), 4u);

    scopes.popScope();
    scopes.popScope(); // popping an empty stack is a no-op
    EXPECT_EQ(scopes.depth(), 0u);
    scopes.bind("w", 1);
    EXPECT_FALSE(scopes.resolve("w").has_value());
}

TEST(NameMangler, UniqueIsCaseInsensitive)
{
    NameMangler names;
    names.reserve("PATH");
    EXPECT_EQ(names.unique("path"), "path_1");
    EXPECT_EQ(names.unique("x"), "x");
    EXPECT_EQ(names.unique("X"), "X_1");
    EXPECT_EQ(names.unique("x"), "x_2");
}

TEST(NameMangler, TempsResetPerStatement)
{
    NameMangler names;
    EXPECT_EQ(names.nextTemp(), "__t1");
    EXPECT_EQ(names.nextTemp(), "__t2");
    names.resetTemps();
    EXPECT_EQ(names.nextTemp(), "__t1");
}

TEST(NameMangler, BlockLabelsCountPerHint)
{
    NameMangler names;
    EXPECT_EQ(names.block("while"), "while_1");
    EXPECT_EQ(names.block("if"), "if_1");
    EXPECT_EQ(names.block("while"), "while_2");
    names.resetTemps();
    EXPECT_EQ(names.block("if"), "if_2");
}
