#include <gtest/gtest.h>

#include "ErrorCodes.h"
#include "IntegrityCodec.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

using namespace ChatCast;

namespace {
    std::vector<uint8_t> bytes(const std::string& s) {
        return std::vector<uint8_t>(s.begin(), s.end());
    }

    std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }
}

TEST(Crc32IntegrityCodecTest, MatchesStandardCheckValue) {
    EXPECT_EQ(Crc32IntegrityCodec::crc32(bytes("123456789")), 0xCBF43926u);

    Crc32IntegrityCodec codec;
    EXPECT_EQ(codec.tag(bytes("123456789"), 0), "cbf43926");
    EXPECT_EQ(codec.tag(bytes("123456789"), 1), "cbf43927");
}

TEST(Crc32IntegrityCodecTest, TagIsZeroPaddedLowercaseHex) {
    Crc32IntegrityCodec codec;
    std::string tag = codec.tag({}, 5);
    EXPECT_EQ(tag, "00000005");

    std::string other = codec.tag(bytes("hello"), 7);
    ASSERT_EQ(other.size(), 8u);
    EXPECT_TRUE(std::all_of(other.begin(), other.end(),
                            [](char c) { return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f'); }));
}

TEST(Crc32IntegrityCodecTest, VerifyIgnoresCase) {
    Crc32IntegrityCodec codec;
    auto payload = bytes("chunk payload");
    std::string tag = codec.tag(payload, 12);

    EXPECT_TRUE(codec.verify(payload, 12, tag));
    EXPECT_TRUE(codec.verify(payload, 12, upper(tag)));
}

TEST(Crc32IntegrityCodecTest, TagIsBoundToSequence) {
    Crc32IntegrityCodec codec;
    auto payload = bytes("the same bytes");
    std::string tag = codec.tag(payload, 3);

    for (uint32_t other : {0u, 2u, 4u, 1000u, 0xFFFFFFFFu}) {
        EXPECT_FALSE(codec.verify(payload, other, tag)) << "sequence " << other;
    }
}

TEST(Crc32IntegrityCodecTest, DetectsCorruptedPayload) {
    Crc32IntegrityCodec codec;
    auto payload = bytes("abcdefgh");
    std::string tag = codec.tag(payload, 0);

    payload[4] ^= 0x01;
    EXPECT_FALSE(codec.verify(payload, 0, tag));
    EXPECT_FALSE(codec.verify(payload, 0, ""));
}

TEST(HmacIntegrityCodecTest, MatchesKnownDigest) {
    // The 4-byte big-endian sequence 0x54686520 is "The "
    HmacIntegrityCodec codec(bytes("key"));
    std::string tag = codec.tag(bytes("quick brown fox jumps over the lazy dog"), 0x54686520u);
    EXPECT_EQ(tag, "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}

TEST(HmacIntegrityCodecTest, VerifiesAndBindsSequence) {
    HmacIntegrityCodec codec(bytes("relay-secret"));
    auto payload = bytes("hello");
    std::string tag = codec.tag(payload, 9);

    ASSERT_EQ(tag.size(), 64u);
    EXPECT_TRUE(codec.verify(payload, 9, tag));
    EXPECT_TRUE(codec.verify(payload, 9, upper(tag)));
    EXPECT_FALSE(codec.verify(payload, 10, tag));
    EXPECT_FALSE(codec.verify(payload, 9, tag.substr(0, 63)));
}

TEST(IntegrityCodecTest, OnlyHmacIsKeyed) {
    Crc32IntegrityCodec crc;
    HmacIntegrityCodec hmac(bytes("k"));
    EXPECT_FALSE(crc.isKeyed());
    EXPECT_TRUE(hmac.isKeyed());
}

TEST(IntegrityCodecTest, MatchesComparesPrecomputedTags) {
    HmacIntegrityCodec hmac(bytes("relay-secret"));
    std::string tag = hmac.tag(bytes("hello"), 4);

    EXPECT_TRUE(hmac.matches(tag, upper(tag)));
    EXPECT_FALSE(hmac.matches(tag, tag.substr(1)));
    EXPECT_FALSE(hmac.matches(tag, ""));

    Crc32IntegrityCodec crc;
    EXPECT_TRUE(crc.matches("cbf43926", "CBF43926"));
    EXPECT_FALSE(crc.matches("cbf43926", "cbf43927"));
}

TEST(HmacIntegrityCodecTest, DifferentKeysDisagree) {
    HmacIntegrityCodec a(bytes("key-a"));
    HmacIntegrityCodec b(bytes("key-b"));
    auto payload = bytes("payload");

    EXPECT_FALSE(b.verify(payload, 1, a.tag(payload, 1)));
}

TEST(HmacIntegrityCodecTest, RejectsEmptyKey) {
    EXPECT_THROW(HmacIntegrityCodec(std::vector<uint8_t>{}), std::invalid_argument);
}

TEST(IntegrityCodecFactoryTest, SelectsCodecByMode) {
    auto crc = makeIntegrityCodec("", "");
    ASSERT_TRUE(crc.isOk());
    EXPECT_STREQ(crc.value()->name(), "crc32");
    EXPECT_FALSE(crc.value()->isKeyed());

    auto crcUpper = makeIntegrityCodec("CRC32", "");
    ASSERT_TRUE(crcUpper.isOk());
    EXPECT_STREQ(crcUpper.value()->name(), "crc32");

    auto hmac = makeIntegrityCodec("hmac-sha256", "secret");
    ASSERT_TRUE(hmac.isOk());
    EXPECT_STREQ(hmac.value()->name(), "hmac-sha256");
    EXPECT_TRUE(hmac.value()->isKeyed());
}

TEST(IntegrityCodecFactoryTest, RejectsBadConfiguration) {
    auto noKey = makeIntegrityCodec("hmac-sha256", "");
    ASSERT_TRUE(noKey.isError());
    EXPECT_EQ(noKey.error().code, static_cast<int>(Core::ErrorCode::INVALID_CONFIGURATION));

    auto unknown = makeIntegrityCodec("md5", "");
    ASSERT_TRUE(unknown.isError());
    EXPECT_EQ(unknown.error().code, static_cast<int>(Core::ErrorCode::INVALID_CONFIGURATION));
}

TEST(IntegrityCodecFactoryTest, TagComparisonIgnoresCaseOnly) {
    EXPECT_TRUE(tagsEqualIgnoreCase("00ABcdef", "00abCDEF"));
    EXPECT_FALSE(tagsEqualIgnoreCase("00abcdef", "00abcdee"));
    EXPECT_FALSE(tagsEqualIgnoreCase("abc", "abcd"));
}
