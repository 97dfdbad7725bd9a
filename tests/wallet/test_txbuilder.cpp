// DOGEPROV - Transaction Builder Tests
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include <gtest/gtest.h>
#include "dogeprov/wallet/address.h"
#include "dogeprov/wallet/txbuilder.h"
#include "provider/fakes.h"

#include <algorithm>
#include <memory>

namespace dogeprov {
namespace wallet {
namespace test {

using dogeprov::test::FakeNetwork;
using dogeprov::test::FakeSigner;
using dogeprov::test::MakeAddress;
using dogeprov::test::MakeDoginal;
using dogeprov::test::MakeOutPoint;
using dogeprov::test::MakeTxid;

class TransactionBuilderTest : public ::testing::Test {
protected:
    FakeNetwork network_;
    FakeSigner signer_;
    FeePolicy policy_;
    std::unique_ptr<AccountState> accounts_;
    std::unique_ptr<TransactionBuilder> builder_;

    std::string wallet_ = MakeAddress(1);
    std::string recipient_ = MakeAddress(2);
    std::string devAddress_ = MakeAddress(0xdd);

    void SetUp() override {
        policy_.feeRate = 200;
        accounts_ = std::make_unique<AccountState>(network_, policy_.protectThreshold);
        accounts_->AddAccount(wallet_);
        builder_ = std::make_unique<TransactionBuilder>(
            *accounts_, signer_, network_, policy_, *ScriptForAddress(devAddress_));
    }

    void Load() {
        ASSERT_TRUE(accounts_->Refresh());
    }

    bool Holds(const OutPoint& op) const {
        auto utxos = accounts_->UtxoSet();
        return std::any_of(utxos.begin(), utxos.end(),
                           [&op](const UTXO& u) { return u.outpoint == op; });
    }
};

// ============================================================================
// Planning
// ============================================================================

TEST_F(TransactionBuilderTest, PaymentOutputLayout) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 50000000);
    network_.AddUtxo(wallet_, MakeOutPoint(11), 10000000);
    Load();

    auto result = builder_->PlanPayment(recipient_, 50000000);
    ASSERT_TRUE(result.success) << result.error;
    const auto& tx = result.plan.unsignedTx;

    ASSERT_EQ(tx.vin.size(), 2u);
    ASSERT_EQ(tx.vout.size(), 3u);
    EXPECT_EQ(tx.vout[0].nValue, 50000000);
    EXPECT_EQ(tx.vout[0].scriptPubKey, *ScriptForAddress(recipient_));
    EXPECT_EQ(tx.vout[1].nValue, 1000000);
    EXPECT_EQ(tx.vout[1].scriptPubKey, *ScriptForAddress(devAddress_));
    EXPECT_EQ(tx.vout[2].nValue, 8800000);
    EXPECT_EQ(tx.vout[2].scriptPubKey, *ScriptForAddress(wallet_));
    EXPECT_EQ(result.plan.changeIndex, 2);
    EXPECT_EQ(result.plan.selection.networkFee, 200000);
    EXPECT_FALSE(result.plan.IsDoginalTransfer());
    EXPECT_EQ(result.plan.from, wallet_);
}

TEST_F(TransactionBuilderTest, NoChangeOutputWhenAbsorbed) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 51500000);
    Load();

    auto result = builder_->PlanPayment(recipient_, 50000000);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.plan.changeIndex, -1);
    EXPECT_EQ(result.plan.unsignedTx.vout.size(), 2u);
    EXPECT_EQ(result.plan.selection.networkFee, 500000);
}

TEST_F(TransactionBuilderTest, PlanRejectsBadInput) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 50000000);
    Load();

    auto bad = builder_->PlanPayment("DnotAnAddress", 1000);
    EXPECT_EQ(bad.failure, BuildFailure::InvalidRecipient);
    EXPECT_EQ(bad.error, "Invalid recipient address");

    EXPECT_EQ(builder_->PlanPayment(recipient_, 0).failure, BuildFailure::InvalidAmount);
    EXPECT_EQ(builder_->PlanPayment(recipient_, 100 * COIN).failure,
              BuildFailure::InsufficientFunds);
}

TEST_F(TransactionBuilderTest, ReservedOutputsSkipped) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 50000000);
    Load();
    ASSERT_TRUE(accounts_->Reserve({MakeOutPoint(10)}));

    EXPECT_EQ(builder_->PlanPayment(recipient_, 1000000).failure,
              BuildFailure::InsufficientFunds);
}

TEST_F(TransactionBuilderTest, DoginalOutputLayout) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 5000000);
    network_.AddUtxo(wallet_, MakeOutPoint(11), 50000000);
    network_.doginals[wallet_].push_back(MakeDoginal("d0i0", MakeOutPoint(10)));
    Load();

    auto result = builder_->PlanDoginals(recipient_, {"d0i0"});
    ASSERT_TRUE(result.success) << result.error;
    const auto& tx = result.plan.unsignedTx;

    ASSERT_EQ(tx.vin.size(), 2u);
    EXPECT_EQ(tx.vin[0].prevout, MakeOutPoint(10));
    ASSERT_EQ(tx.vout.size(), 3u);
    EXPECT_EQ(tx.vout[0].nValue, 5000000);
    EXPECT_EQ(tx.vout[0].scriptPubKey, *ScriptForAddress(recipient_));
    EXPECT_EQ(tx.vout[1].nValue, 1000000);
    EXPECT_EQ(tx.vout[2].nValue, 39000000);
    EXPECT_TRUE(result.plan.IsDoginalTransfer());
}

TEST_F(TransactionBuilderTest, DoginalFailures) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 5000000);
    network_.AddUtxo(wallet_, MakeOutPoint(11), 50000000);
    network_.doginals[wallet_].push_back(MakeDoginal("d0i0", MakeOutPoint(10)));
    Load();

    EXPECT_EQ(builder_->PlanDoginals(recipient_, {"unknown"}).failure,
              BuildFailure::InscriptionNotFound);
    EXPECT_EQ(builder_->PlanDoginals(recipient_, {}).failure, BuildFailure::InvalidAmount);

    ASSERT_TRUE(accounts_->Reserve({MakeOutPoint(10)}));
    EXPECT_EQ(builder_->PlanDoginals(recipient_, {"d0i0"}).failure,
              BuildFailure::InputsUnavailable);
}

TEST_F(TransactionBuilderTest, FeeRateOverride) {
    builder_->SetFeeRate(1000);
    EXPECT_EQ(builder_->Policy().feeRate, 1000);

    network_.AddUtxo(wallet_, MakeOutPoint(10), 50000000);
    Load();
    auto result = builder_->PlanPayment(recipient_, 10000000);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.plan.selection.networkFee, 1000000);
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(TransactionBuilderTest, ExecuteBroadcastsAndMarksSpent) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 50000000);
    network_.AddUtxo(wallet_, MakeOutPoint(11), 10000000);
    Load();

    auto planned = builder_->PlanPayment(recipient_, 50000000);
    ASSERT_TRUE(planned.success);

    auto result = builder_->Execute(planned.plan);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.fee, 200000);
    EXPECT_EQ(result.change, 8800000);

    ASSERT_EQ(signer_.signedTxs.size(), 1u);
    ASSERT_EQ(network_.broadcasts.size(), 1u);
    EXPECT_EQ(result.txid, ComputeTxid(network_.broadcasts[0]));

    EXPECT_FALSE(Holds(MakeOutPoint(10)));
    EXPECT_FALSE(Holds(MakeOutPoint(11)));
    EXPECT_TRUE(Holds(OutPoint(result.txid, 2)));
    EXPECT_EQ(accounts_->Balance(), 8800000);
}

TEST_F(TransactionBuilderTest, NetworkTxidWins) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 50000000);
    network_.reportedTxid = MakeTxid(0x77);
    Load();

    auto planned = builder_->PlanPayment(recipient_, 20000000);
    ASSERT_TRUE(planned.success);
    auto result = builder_->Execute(planned.plan);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.txid, MakeTxid(0x77));
    EXPECT_TRUE(Holds(OutPoint(MakeTxid(0x77), 2)));
}

TEST_F(TransactionBuilderTest, SigningFailureChangesNothing) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 50000000);
    Load();
    signer_.failTransactions = true;

    auto planned = builder_->PlanPayment(recipient_, 20000000);
    ASSERT_TRUE(planned.success);
    auto result = builder_->Execute(planned.plan);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, BuildFailure::SigningFailed);
    EXPECT_TRUE(network_.broadcasts.empty());
    EXPECT_TRUE(Holds(MakeOutPoint(10)));
    EXPECT_EQ(accounts_->Balance(), 50000000);
}

TEST_F(TransactionBuilderTest, BroadcastFailureChangesNothing) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 50000000);
    Load();
    network_.failBroadcast = true;

    auto planned = builder_->PlanPayment(recipient_, 20000000);
    ASSERT_TRUE(planned.success);
    auto result = builder_->Execute(planned.plan);
    EXPECT_EQ(result.failure, BuildFailure::BroadcastFailed);
    EXPECT_EQ(result.error, "node rejected transaction");
    EXPECT_TRUE(Holds(MakeOutPoint(10)));
}

TEST_F(TransactionBuilderTest, ExecuteRejectsVanishedInputs) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 50000000);
    Load();
    auto planned = builder_->PlanPayment(recipient_, 20000000);
    ASSERT_TRUE(planned.success);

    network_.utxos[wallet_].clear();
    Load();

    auto result = builder_->Execute(planned.plan);
    EXPECT_EQ(result.failure, BuildFailure::InputsUnavailable);
    EXPECT_EQ(result.error, "Selected inputs are no longer available");
    EXPECT_TRUE(signer_.signedTxs.empty());
}

TEST_F(TransactionBuilderTest, ExecuteRejectsAfterAccountSwitch) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 50000000);
    Load();
    auto planned = builder_->PlanPayment(recipient_, 20000000);
    ASSERT_TRUE(planned.success);

    accounts_->AddAccount(MakeAddress(3));
    ASSERT_TRUE(accounts_->SwitchAccount(1));

    auto result = builder_->Execute(planned.plan);
    EXPECT_EQ(result.failure, BuildFailure::InputsUnavailable);
    EXPECT_EQ(result.error, "Active account changed");
}

TEST_F(TransactionBuilderTest, DoginalTransferRemovesInscription) {
    network_.AddUtxo(wallet_, MakeOutPoint(10), 5000000);
    network_.AddUtxo(wallet_, MakeOutPoint(11), 50000000);
    network_.doginals[wallet_].push_back(MakeDoginal("d0i0", MakeOutPoint(10)));
    Load();

    auto planned = builder_->PlanDoginals(recipient_, {"d0i0"});
    ASSERT_TRUE(planned.success);
    auto result = builder_->Execute(planned.plan);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(accounts_->Doginals().empty());
    EXPECT_EQ(accounts_->Snapshot()->FindDoginal("d0i0"), nullptr);
}

TEST(BuildFailureTest, Names) {
    EXPECT_STREQ(BuildFailureToString(BuildFailure::SigningFailed), "signing failed");
    EXPECT_STREQ(BuildFailureToString(BuildFailure::InputsUnavailable), "inputs unavailable");
}

} // namespace test
} // namespace wallet
} // namespace dogeprov
