#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "papercache/cache/key.hh"

namespace papercache {

/* ----------------------------------------------------------------------------
 * checkKey
 * --------------------------------------------------------------------------*/

TEST(checkKey, acceptsArxivIdentifiers)
{
    ASSERT_NO_THROW(checkKey("2301.00001"));
    ASSERT_NO_THROW(checkKey("2301.00001v2"));
    ASSERT_NO_THROW(checkKey("hep-th9901001"));
}

TEST(checkKey, rejectsEmpty)
{
    ASSERT_THROW(checkKey(""), InvalidKey);
}

TEST(checkKey, rejectsDotNames)
{
    ASSERT_THROW(checkKey("."), InvalidKey);
    ASSERT_THROW(checkKey(".."), InvalidKey);
    ASSERT_THROW(checkKey(".locks"), InvalidKey);
    ASSERT_THROW(checkKey(".staging"), InvalidKey);
}

TEST(checkKey, rejectsSlashes)
{
    ASSERT_THROW(checkKey("hep-th/9901001"), InvalidKey);
    ASSERT_THROW(checkKey("/abs"), InvalidKey);
    ASSERT_THROW(checkKey("trailing/"), InvalidKey);
}

TEST(checkKey, rejectsNul)
{
    ASSERT_THROW(checkKey(std::string_view("a\0b", 3)), InvalidKey);
}

/* ----------------------------------------------------------------------------
 * hashKey
 * --------------------------------------------------------------------------*/

TEST(hashKey, knownValue)
{
    ASSERT_EQ(hashKey("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(hashKey, distinguishesSimilarKeys)
{
    ASSERT_NE(hashKey("2301.00001"), hashKey("2301.00001v1"));
}

RC_GTEST_PROP(hashKey, isFixedLengthLowerHex, (const std::string & key))
{
    auto h = hashKey(key);
    RC_ASSERT(h.size() == 64);
    RC_ASSERT(h.find_first_not_of("0123456789abcdef") == std::string::npos);
}

RC_GTEST_PROP(hashKey, isDeterministic, (const std::string & key))
{
    RC_ASSERT(hashKey(key) == hashKey(std::string(key)));
}

RC_GTEST_PROP(hashKey, differsForDifferentKeys, (const std::string & a, const std::string & b))
{
    RC_PRE(a != b);
    RC_ASSERT(hashKey(a) != hashKey(b));
}

} // namespace papercache
