// DOGEPROV - Script Tests
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include <gtest/gtest.h>
#include "dogeprov/core/script.h"

#include <algorithm>

namespace dogeprov {
namespace test {

namespace {

Hash160 SampleHash() {
    std::array<Byte, 20> bytes;
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<Byte>(i + 1);
    }
    return Hash160(bytes);
}

} // namespace

TEST(ScriptTest, P2PKHLayout) {
    Script script = Script::CreateP2PKH(SampleHash());
    ASSERT_EQ(script.size(), 25u);
    EXPECT_EQ(script[0], OP_DUP);
    EXPECT_EQ(script[1], OP_HASH160);
    EXPECT_EQ(script[2], 20);
    EXPECT_EQ(script[23], OP_EQUALVERIFY);
    EXPECT_EQ(script[24], OP_CHECKSIG);
    EXPECT_TRUE(std::equal(script.begin() + 3, script.begin() + 23, SampleHash().begin()));
}

TEST(ScriptTest, P2SHLayout) {
    Script script = Script::CreateP2SH(SampleHash());
    ASSERT_EQ(script.size(), 23u);
    EXPECT_EQ(script[0], OP_HASH160);
    EXPECT_EQ(script[1], 20);
    EXPECT_TRUE(std::equal(script.begin() + 2, script.begin() + 22, SampleHash().begin()));
    EXPECT_EQ(script[22], OP_EQUAL);
}

TEST(ScriptTest, SerializesWithLengthPrefix) {
    Script script = Script::CreateP2SH(SampleHash());
    DataStream ss;
    ss << script;
    ASSERT_EQ(ss.size(), 24u);

    Script out;
    ss >> out;
    EXPECT_EQ(out, script);
}

} // namespace test
} // namespace dogeprov
