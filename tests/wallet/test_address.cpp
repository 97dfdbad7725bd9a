// DOGEPROV - Address Tests
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include <gtest/gtest.h>
#include "dogeprov/crypto/base58.h"
#include "dogeprov/crypto/hash.h"
#include "dogeprov/wallet/address.h"
#include "dogeprov/wallet/message.h"
#include "provider/fakes.h"

#include <algorithm>

namespace dogeprov {
namespace wallet {
namespace test {

using dogeprov::test::FakeSigner;
using dogeprov::test::MakeAddress;

namespace {

Hash160 Filled(Byte b) {
    std::array<Byte, 20> bytes;
    bytes.fill(b);
    return Hash160(bytes);
}

} // namespace

// ============================================================================
// Encoding
// ============================================================================

TEST(AddressTest, PubKeyHashAddressesStartWithD) {
    std::string encoded = EncodeAddress({AddressType::P2PKH, Filled(0x42)});
    ASSERT_FALSE(encoded.empty());
    EXPECT_EQ(encoded[0], 'D');
    EXPECT_EQ(encoded.size(), 34u);
}

TEST(AddressTest, ScriptHashAddressesStartWithNineOrA) {
    std::string encoded = EncodeAddress({AddressType::P2SH, Filled(0x42)});
    ASSERT_FALSE(encoded.empty());
    EXPECT_TRUE(encoded[0] == '9' || encoded[0] == 'A') << encoded;
}

TEST(AddressTest, DecodeRestoresTypeAndHash) {
    for (auto type : {AddressType::P2PKH, AddressType::P2SH}) {
        Address original{type, Filled(0x07)};
        auto decoded = DecodeAddress(EncodeAddress(original));
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(*decoded, original);
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST(AddressTest, RejectsOtherNetworks) {
    // Bitcoin mainnet pubkey-hash version
    std::vector<uint8_t> payload(21, 0x11);
    payload[0] = 0x00;
    EXPECT_FALSE(IsValidAddress(EncodeBase58Check(payload)));

    // Dogecoin testnet pubkey-hash version
    payload[0] = 0x71;
    EXPECT_FALSE(IsValidAddress(EncodeBase58Check(payload)));
}

TEST(AddressTest, RejectsWrongLength) {
    std::vector<uint8_t> payload(20, 0x11);
    payload[0] = PUBKEY_ADDRESS_VERSION;
    EXPECT_FALSE(IsValidAddress(EncodeBase58Check(payload)));
}

TEST(AddressTest, RejectsGarbage) {
    EXPECT_FALSE(IsValidAddress(""));
    EXPECT_FALSE(IsValidAddress("not-an-address"));

    std::string valid = MakeAddress(3);
    std::string corrupted = valid;
    corrupted[5] = corrupted[5] == 'x' ? 'y' : 'x';
    EXPECT_TRUE(IsValidAddress(valid));
    EXPECT_FALSE(IsValidAddress(corrupted));
}

TEST(AddressTest, ScriptForAddress) {
    auto p2pkh = ScriptForAddress(EncodeAddress({AddressType::P2PKH, Filled(1)}));
    ASSERT_TRUE(p2pkh.has_value());
    EXPECT_EQ(*p2pkh, Script::CreateP2PKH(Filled(1)));

    auto p2sh = ScriptForAddress(EncodeAddress({AddressType::P2SH, Filled(1)}));
    ASSERT_TRUE(p2sh.has_value());
    EXPECT_EQ(*p2sh, Script::CreateP2SH(Filled(1)));

    EXPECT_FALSE(ScriptForAddress("bogus").has_value());
}

// ============================================================================
// Signed Messages
// ============================================================================

TEST(MessageTest, HashCoversMagicAndMessage) {
    EXPECT_EQ(MESSAGE_MAGIC, "Dogecoin Signed Message:\n");
    EXPECT_NE(MessageHash("hello"), MessageHash("hello "));
    EXPECT_EQ(MessageHash("hello"), MessageHash("hello"));
}

TEST(MessageTest, HashMatchesManualLayout) {
    DataStream ss;
    ss << std::string("Dogecoin Signed Message:\n") << std::string("much wow");
    EXPECT_EQ(MessageHash("much wow"), DoubleSHA256(ss.Data()));
}

TEST(MessageTest, SignReturnsBase64CompactSignature) {
    FakeSigner signer;
    auto signature = SignMessage(signer, "hello", MakeAddress(1));
    ASSERT_TRUE(signature.has_value());

    ASSERT_EQ(signer.signedHashes.size(), 1u);
    EXPECT_EQ(signer.signedHashes[0], MessageHash("hello"));

    // The fake signer echoes the digest into the first 32 bytes
    std::vector<uint8_t> raw(COMPACT_SIGNATURE_SIZE, 0x1f);
    std::copy(signer.signedHashes[0].begin(), signer.signedHashes[0].end(), raw.begin());
    EXPECT_EQ(*signature, Base64Encode(raw));
}

TEST(MessageTest, DeclinedSignature) {
    FakeSigner signer;
    signer.failMessages = true;
    EXPECT_FALSE(SignMessage(signer, "hello", MakeAddress(1)).has_value());
}

TEST(MessageTest, WrongSignatureLength) {
    FakeSigner signer;
    signer.signatureSize = 64;
    EXPECT_FALSE(SignMessage(signer, "hello", MakeAddress(1)).has_value());
}

} // namespace test
} // namespace wallet
} // namespace dogeprov
