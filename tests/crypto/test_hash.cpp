// DOGEPROV - Hash and Base64 Tests
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include <gtest/gtest.h>
#include "dogeprov/crypto/hash.h"
#include "dogeprov/core/hex.h"

#include <string>

namespace dogeprov {
namespace test {

namespace {

std::vector<Byte> Bytes(const std::string& s) {
    return std::vector<Byte>(s.begin(), s.end());
}

std::string RawHex(const Hash256& h) {
    return BytesToHex(h.data(), h.size());
}

} // namespace

// ============================================================================
// SHA-256
// ============================================================================

TEST(SHA256Test, EmptyInput) {
    EXPECT_EQ(RawHex(SHA256Hash(Bytes(""))),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(RawHex(SHA256Hash(Bytes("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, DoubleHashOfEmpty) {
    EXPECT_EQ(RawHex(DoubleSHA256(Bytes(""))),
              "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
}

TEST(SHA256Test, DoubleIsHashOfHash) {
    auto once = SHA256Hash(Bytes("much wow"));
    std::vector<Byte> inner(once.begin(), once.end());
    EXPECT_EQ(DoubleSHA256(Bytes("much wow")), SHA256Hash(inner));
}

// ============================================================================
// Base64
// ============================================================================

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(Base64Encode(Bytes("")), "");
    EXPECT_EQ(Base64Encode(Bytes("f")), "Zg==");
    EXPECT_EQ(Base64Encode(Bytes("fo")), "Zm8=");
    EXPECT_EQ(Base64Encode(Bytes("foo")), "Zm9v");
    EXPECT_EQ(Base64Encode(Bytes("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, SignatureLength) {
    std::vector<Byte> sig(65);
    for (size_t i = 0; i < sig.size(); ++i) {
        sig[i] = static_cast<Byte>(i * 3 + 1);
    }
    std::string encoded = Base64Encode(sig);
    EXPECT_EQ(encoded.size(), 88u);
    EXPECT_EQ(encoded.find('='), std::string::npos);
}

} // namespace test
} // namespace dogeprov
