#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "papercache/util/strings.hh"
#include "papercache/util/error.hh"

namespace papercache {

/* ----------------------------------------------------------------------------
 * tokenizeString, concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, defaultSeparatorsAreWhitespace)
{
    ASSERT_EQ(tokenizeString<Strings>("lock-timeout \t=\n 5"), (Strings{"lock-timeout", "=", "5"}));
}

TEST(tokenizeString, nothingButSeparators)
{
    ASSERT_TRUE(tokenizeString<Strings>("").empty());
    ASSERT_TRUE(tokenizeString<Strings>(" \n ").empty());
}

TEST(tokenizeString, emptyPiecesAreDropped)
{
    ASSERT_EQ(tokenizeString<Strings>("/hep-th//9901001/", "/"), (Strings{"hep-th", "9901001"}));
}

TEST(tokenizeString, onlyGivenSeparatorsSplit)
{
    ASSERT_EQ(tokenizeString<Strings>("a b,c\n", ","), (Strings{"a b", "c\n"}));
}

RC_GTEST_PROP(tokenizeString, tokensNeverContainSeparators, (const std::string & s))
{
    for (auto & token : tokenizeString<std::vector<std::string>>(s, "/"))
        RC_ASSERT(!token.empty() && token.find('/') == std::string::npos);
}

TEST(concatStringsSep, joins)
{
    ASSERT_EQ(concatStringsSep(" ", Strings{}), "");
    ASSERT_EQ(concatStringsSep(" ", Strings{"Mozilla/5.0"}), "Mozilla/5.0");
    ASSERT_EQ(concatStringsSep(" ", Strings{"Mozilla/5.0", "(X11)"}), "Mozilla/5.0 (X11)");
    ASSERT_EQ(concatStringsSep(",", Strings{"", ""}), ",");
}

RC_GTEST_PROP(concatStringsSep, undoesTokenize, (const std::vector<std::string> & pieces))
{
    std::vector<std::string> words;
    for (auto & p : pieces)
        if (!p.empty() && p.find(' ') == std::string::npos)
            words.push_back(p);
    RC_ASSERT(tokenizeString<std::vector<std::string>>(concatStringsSep(" ", words), " ") == words);
}

/* ----------------------------------------------------------------------------
 * trim
 * --------------------------------------------------------------------------*/

TEST(trim, whitespaceAtBothEnds)
{
    ASSERT_EQ(trim("\n    Seconds to wait.\n  "), "Seconds to wait.");
    ASSERT_EQ(trim("inner  space"), "inner  space");
}

TEST(trim, allWhitespace)
{
    ASSERT_EQ(trim(" \n\t "), "");
    ASSERT_EQ(trim(""), "");
}

TEST(trim, customWhitespace)
{
    ASSERT_EQ(trim("--x--", "-"), "x");
}

/* ----------------------------------------------------------------------------
 * string2Int, string2IntWithUnitPrefix
 * --------------------------------------------------------------------------*/

TEST(string2Int, valid)
{
    ASSERT_EQ(string2Int<unsigned int>("30"), 30u);
    ASSERT_EQ(string2Int<int>("-7"), -7);
}

TEST(string2Int, invalid)
{
    ASSERT_FALSE(string2Int<unsigned int>("3O"));
    ASSERT_FALSE(string2Int<unsigned int>(""));
    ASSERT_FALSE(string2Int<unsigned int>("-1"));
    ASSERT_FALSE(string2Int<int>("99999999999"));
}

TEST(string2IntWithUnitPrefix, units)
{
    ASSERT_EQ(string2IntWithUnitPrefix<unsigned long>("3"), 3ul);
    ASSERT_EQ(string2IntWithUnitPrefix<unsigned long>("2K"), 2048ul);
    ASSERT_EQ(string2IntWithUnitPrefix<unsigned long>("1m"), 1ul << 20);
}

TEST(string2IntWithUnitPrefix, rejected)
{
    ASSERT_THROW(string2IntWithUnitPrefix<unsigned long>("3X"), UsageError);
    ASSERT_THROW(string2IntWithUnitPrefix<unsigned long>("three"), UsageError);
    ASSERT_THROW(string2IntWithUnitPrefix<unsigned long>("K"), UsageError);
    ASSERT_THROW(string2IntWithUnitPrefix<unsigned int>("8G"), UsageError);
}

/* ----------------------------------------------------------------------------
 * hasPrefix, hasSuffix
 * --------------------------------------------------------------------------*/

TEST(hasPrefix, works)
{
    ASSERT_TRUE(hasPrefix("2301.00001.1-2", "2301.00001"));
    ASSERT_TRUE(hasPrefix("abc", ""));
    ASSERT_FALSE(hasPrefix("ab", "abc"));
}

TEST(hasSuffix, works)
{
    ASSERT_TRUE(hasSuffix("main.tex", ".tex"));
    ASSERT_FALSE(hasSuffix("main.tex.bak", ".tex"));
    ASSERT_FALSE(hasSuffix("tex", ".tex"));
}

} // namespace papercache
