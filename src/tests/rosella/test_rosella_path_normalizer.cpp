//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "codegen/script/PathNormalizer.hpp"

#include <gtest/gtest.h>

using rosella::codegen::script::decodeStringLiteral;
using rosella::codegen::script::normalizePathLiteral;
using rosella::frontends::script::Target;

TEST(RosellaPathNormalizer, SlashesFollowTarget)
{
    EXPECT_EQ(normalizePathLiteral("dir/sub/file.txt", Target::Batch), "dir\\sub\\file.txt");
    EXPECT_EQ(normalizePathLiteral("dir\\sub\\file.txt", Target::Shell), "dir/sub/file.txt");
    EXPECT_EQ(normalizePathLiteral("dir/sub", Target::Shell), "dir/sub");
}

TEST(RosellaPathNormalizer, EscapedSlashesSurvive)
{
    EXPECT_EQ(normalizePathLiteral(R"(http:\/\/example.com\/x)", Target::Batch),
              "http://example.com/x");
    EXPECT_EQ(normalizePathLiteral(R"(a\\b)", Target::Shell), "a\\b");
}

TEST(RosellaPathNormalizer, EscapedQuote)
{
    EXPECT_EQ(normalizePathLiteral(R"(say \"hi\")", Target::Shell), "say \"hi\"");
    EXPECT_EQ(decodeStringLiteral(R"(say \"hi\")"), "say \"hi\"");
}

TEST(RosellaPathNormalizer, DecodeLeavesSeparatorsAlone)
{
    EXPECT_EQ(decodeStringLiteral("a/b\\c"), "a/b\\c");
    EXPECT_EQ(decodeStringLiteral(R"(a\/b)"), "a/b");
}

TEST(RosellaPathNormalizer, TrailingBackslash)
{
    EXPECT_EQ(decodeStringLiteral("end\\"), "end\\");
    EXPECT_EQ(normalizePathLiteral("end\\", Target::Shell), "end/");
}

TEST(RosellaPathNormalizer, EmptyString)
{
    EXPECT_EQ(normalizePathLiteral("", Target::Batch), "");
    EXPECT_EQ(decodeStringLiteral(""), "");
}
