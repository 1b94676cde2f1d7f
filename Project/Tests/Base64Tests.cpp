#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Reflection/Base64.hpp"

using namespace Serial;

namespace {
    std::vector<unsigned char> BytesOf(const std::string& s) { return std::vector<unsigned char>(s.begin(), s.end()); }
}

TEST(Base64Test, EncodesWithPadding)
{
    EXPECT_EQ(Base64_Encode(BytesOf("Man")), "TWFu");
    EXPECT_EQ(Base64_Encode(BytesOf("Ma")), "TWE=");
    EXPECT_EQ(Base64_Encode(BytesOf("M")), "TQ==");
    EXPECT_EQ(Base64_Encode({}), "");
}

TEST(Base64Test, DecodesPaddedInput)
{
    auto decoded = Base64_Decode("TWE=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, BytesOf("Ma"));
}

TEST(Base64Test, IgnoresWhitespace)
{
    auto decoded = Base64_Decode(" TW\r\nFu\t");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, BytesOf("Man"));
}

TEST(Base64Test, EmptyInputDecodesToNoBytes)
{
    auto decoded = Base64_Decode("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(Base64Test, RejectsMalformedInput)
{
    EXPECT_FALSE(Base64_Decode("TWF").has_value());     // length
    EXPECT_FALSE(Base64_Decode("TW=u").has_value());    // padding in the middle
    EXPECT_FALSE(Base64_Decode("TW*u").has_value());    // alphabet
    EXPECT_FALSE(Base64_Decode("A===").has_value());
}

TEST(Base64Test, BinaryBytesSurvive)
{
    std::vector<unsigned char> bytes;
    for (int i = 0; i < 256; ++i) bytes.push_back(static_cast<unsigned char>(i));

    auto decoded = Base64_Decode(Base64_Encode(bytes));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}
