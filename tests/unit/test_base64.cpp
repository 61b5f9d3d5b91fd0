#include <gtest/gtest.h>

#include "Base64.h"
#include "ErrorCodes.h"

#include <string>
#include <vector>

using namespace ChatCast;

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(Base64::encode(std::string("hello")), "aGVsbG8=");
    EXPECT_EQ(Base64::encode(std::string("hi")), "aGk=");
    EXPECT_EQ(Base64::encode(std::string("abc")), "YWJj");
    EXPECT_EQ(Base64::encode(std::vector<uint8_t>{}), "");
}

TEST(Base64Test, DecodesPaddedInput) {
    auto one = Base64::decode("aGVsbG8=");
    ASSERT_TRUE(one.isOk());
    EXPECT_EQ(std::string(one.value().begin(), one.value().end()), "hello");

    auto two = Base64::decode("aGk=");
    ASSERT_TRUE(two.isOk());
    EXPECT_EQ(two.value().size(), 2u);

    auto none = Base64::decode("YWJj");
    ASSERT_TRUE(none.isOk());
    EXPECT_EQ(none.value().size(), 3u);
}

TEST(Base64Test, BinaryPayloadSurvives) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<uint8_t>(i));
    }
    auto decoded = Base64::decode(Base64::encode(data));
    ASSERT_TRUE(decoded.isOk());
    EXPECT_EQ(decoded.value(), data);
}

TEST(Base64Test, EmptyStringIsEmptyPayload) {
    auto decoded = Base64::decode("");
    ASSERT_TRUE(decoded.isOk());
    EXPECT_TRUE(decoded.value().empty());
}

TEST(Base64Test, RejectsMalformedInput) {
    for (const char* bad : {"abc", "ab!d", "a===", "ab=c", "====", "aGVsbG8", "aGVs bG8="}) {
        auto decoded = Base64::decode(bad);
        ASSERT_TRUE(decoded.isError()) << bad;
        EXPECT_EQ(decoded.error().code, static_cast<int>(Core::ErrorCode::INVALID_ENCODING)) << bad;
    }
}
