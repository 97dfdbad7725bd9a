// DOGEPROV - Test Fakes
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// In-memory signer, network and approval presenter shared by the wallet
// and provider tests.

#ifndef DOGEPROV_TESTS_PROVIDER_FAKES_H
#define DOGEPROV_TESTS_PROVIDER_FAKES_H

#include "dogeprov/core/serialize.h"
#include "dogeprov/core/transaction.h"
#include "dogeprov/provider/approval.h"
#include "dogeprov/wallet/address.h"
#include "dogeprov/wallet/interfaces.h"

#include <array>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace dogeprov {
namespace test {

// ============================================================================
// Helpers
// ============================================================================

inline std::string MakeAddress(uint8_t seed) {
    std::array<Byte, Hash160::SIZE> bytes;
    bytes.fill(seed);
    return wallet::EncodeAddress({wallet::AddressType::P2PKH, Hash160(bytes)});
}

inline TxHash MakeTxid(uint8_t seed) {
    std::array<Byte, Hash256::SIZE> bytes;
    bytes.fill(seed);
    return TxHash(Hash256(bytes));
}

inline OutPoint MakeOutPoint(uint8_t seed, uint32_t n = 0) {
    return OutPoint(MakeTxid(seed), n);
}

inline wallet::Doginal MakeDoginal(const std::string& id, const OutPoint& outpoint) {
    wallet::Doginal doginal;
    doginal.inscriptionId = id;
    doginal.outpoint = outpoint;
    doginal.contentType = "image/png";
    doginal.content = "https://ord.example/content/" + id;
    return doginal;
}

// ============================================================================
// FakeSigner
// ============================================================================

class FakeSigner : public wallet::ISigner {
public:
    bool failTransactions{false};
    bool failMessages{false};
    size_t signatureSize{wallet::COMPACT_SIGNATURE_SIZE};

    std::vector<MutableTransaction> signedTxs;
    std::vector<Hash256> signedHashes;

    wallet::SignResult SignTransaction(const MutableTransaction& unsignedTx,
                                       const std::vector<wallet::UTXO>& inputs,
                                       const std::string&) override {
        wallet::SignResult result;
        if (failTransactions) {
            result.error = "key unavailable";
            return result;
        }
        if (inputs.size() != unsignedTx.vin.size()) {
            result.error = "input count mismatch";
            return result;
        }

        MutableTransaction tx = unsignedTx;
        for (auto& in : tx.vin) {
            in.scriptSig = Script{0x01, 0x02, 0x03};
        }
        signedTxs.push_back(tx);

        DataStream ss;
        ss << tx;
        result.success = true;
        result.signedTx = ss.Data();
        return result;
    }

    std::optional<std::vector<uint8_t>> SignCompact(const Hash256& messageHash,
                                                    const std::string&) override {
        if (failMessages) {
            return std::nullopt;
        }
        signedHashes.push_back(messageHash);
        std::vector<uint8_t> signature(signatureSize, 0x1f);
        for (size_t i = 0; i < signature.size() && i < Hash256::SIZE; ++i) {
            signature[i] = messageHash[i];
        }
        return signature;
    }
};

// ============================================================================
// FakeNetwork
// ============================================================================

class FakeNetwork : public wallet::INetwork {
public:
    std::map<std::string, std::vector<wallet::UTXO>> utxos;
    std::map<std::string, std::vector<wallet::Doginal>> doginals;
    std::map<std::string, Amount> balances;
    std::optional<wallet::FeeRate> feeRate;

    bool failUtxos{false};
    bool failDoginals{false};
    bool failBroadcast{false};
    TxHash reportedTxid;

    std::vector<std::vector<uint8_t>> broadcasts;
    int utxoFetches{0};

    void AddUtxo(const std::string& address, const OutPoint& outpoint, Amount value) {
        utxos[address].emplace_back(outpoint, value);
    }

    std::optional<std::vector<wallet::UTXO>> FetchUtxos(const std::string& address) override {
        ++utxoFetches;
        if (failUtxos) {
            return std::nullopt;
        }
        return utxos[address];
    }

    std::optional<Amount> FetchBalance(const std::string& address) override {
        auto it = balances.find(address);
        if (it == balances.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::vector<wallet::Doginal>> FetchDoginals(
        const std::string& address) override {
        if (failDoginals) {
            return std::nullopt;
        }
        return doginals[address];
    }

    std::optional<wallet::FeeRate> FetchFeeRate() override {
        return feeRate;
    }

    wallet::BroadcastResult Broadcast(const std::vector<uint8_t>& signedTx) override {
        wallet::BroadcastResult result;
        if (failBroadcast) {
            result.error = "node rejected transaction";
            return result;
        }
        broadcasts.push_back(signedTx);
        result.success = true;
        result.txid = reportedTxid;
        return result;
    }
};

// ============================================================================
// FakePresenter
// ============================================================================

class FakePresenter : public provider::IApprovalPresenter {
public:
    void Present(const provider::PendingApproval& approval) override {
        std::lock_guard<std::mutex> lock(mutex_);
        presented_.push_back(approval);
    }

    std::vector<provider::PendingApproval> Presented() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return presented_;
    }

    size_t Count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return presented_.size();
    }

    /// Most recently presented request
    provider::PendingApproval Last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return presented_.back();
    }

    void Withdraw(const provider::PendingApproval& approval) override {
        std::lock_guard<std::mutex> lock(mutex_);
        withdrawn_.push_back(approval.id);
    }

    std::vector<provider::ApprovalId> Withdrawn() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return withdrawn_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<provider::PendingApproval> presented_;
    std::vector<provider::ApprovalId> withdrawn_;
};

} // namespace test
} // namespace dogeprov

#endif // DOGEPROV_TESTS_PROVIDER_FAKES_H
