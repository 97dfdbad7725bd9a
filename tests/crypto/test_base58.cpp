// DOGEPROV - Base58 Tests
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include <gtest/gtest.h>
#include "dogeprov/crypto/base58.h"
#include "dogeprov/core/hex.h"

namespace dogeprov {
namespace test {

namespace {

std::vector<uint8_t> FromHex(const std::string& hex) {
    return TryHexToBytes(hex).value_or(std::vector<uint8_t>{});
}

} // namespace

TEST(Base58Test, EncodeKnownVectors) {
    EXPECT_EQ(EncodeBase58({}), "");
    EXPECT_EQ(EncodeBase58(FromHex("61")), "2g");
    EXPECT_EQ(EncodeBase58(FromHex("626262")), "a3gV");
    EXPECT_EQ(EncodeBase58(FromHex("636363")), "aPEr");
    EXPECT_EQ(EncodeBase58(FromHex("0000287fb4cd")), "11233QC4");
    EXPECT_EQ(EncodeBase58(FromHex("00eb15231dfceb60925886b67d065299925915aeb172c06647")),
              "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L");
}

TEST(Base58Test, DecodeKnownVectors) {
    auto decoded = DecodeBase58("11233QC4");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, FromHex("0000287fb4cd"));
}

TEST(Base58Test, DecodeRejectsInvalidCharacters) {
    EXPECT_FALSE(DecodeBase58("0OIl").has_value());
    EXPECT_FALSE(DecodeBase58("abc!").has_value());
}

TEST(Base58CheckTest, RoundTrip) {
    std::vector<uint8_t> payload = FromHex("1e0102030405060708090a0b0c0d0e0f1011121314");
    std::string encoded = EncodeBase58Check(payload);

    auto decoded = DecodeBase58Check(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, payload);
}

TEST(Base58CheckTest, DetectsCorruption) {
    std::string encoded = EncodeBase58Check(FromHex("1e00112233"));
    encoded.back() = encoded.back() == '2' ? '3' : '2';
    EXPECT_FALSE(DecodeBase58Check(encoded).has_value());
}

TEST(Base58CheckTest, RejectsTooShort) {
    EXPECT_FALSE(DecodeBase58Check("1").has_value());
}

} // namespace test
} // namespace dogeprov
