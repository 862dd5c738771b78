#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "papercache/util/hash.hh"

namespace papercache {

/* ----------------------------------------------------------------------------
 * hashString
 * --------------------------------------------------------------------------*/

TEST(hashString, testKnownSHA256Hashes1)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    auto s = "abc";
    auto hash = hashString(s);
    ASSERT_EQ(hash.to_base16(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(hashString, testKnownSHA256Hashes2)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    auto s = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    auto hash = hashString(s);
    ASSERT_EQ(hash.to_base16(), "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(hashString, empty)
{
    ASSERT_EQ(hashString("").to_base16(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(hashString, ordering)
{
    auto a = hashString("a");
    auto b = hashString("b");
    ASSERT_EQ(a, hashString("a"));
    ASSERT_NE(a, b);
    ASSERT_TRUE((a < b) != (b < a));
}

RC_GTEST_PROP(hashString, base16IsTwiceTheSize, (const std::string & s))
{
    RC_ASSERT(hashString(s).to_base16().size() == 2 * Hash::size);
}

} // namespace papercache
