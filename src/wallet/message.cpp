// DOGEPROV - Signed Messages Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/wallet/message.h"
#include "dogeprov/core/serialize.h"
#include "dogeprov/crypto/hash.h"
#include "dogeprov/util/logging.h"

namespace dogeprov {
namespace wallet {

const std::string MESSAGE_MAGIC = "Dogecoin Signed Message:\n";

Hash256 MessageHash(const std::string& message) {
    DataStream ss;
    ss << MESSAGE_MAGIC;
    ss << message;
    return DoubleSHA256(ss.Data());
}

std::optional<std::string> SignMessage(ISigner& signer, const std::string& message,
                                       const std::string& address) {
    auto signature = signer.SignCompact(MessageHash(message), address);
    if (!signature) {
        LOG_WARN(util::LogCategory::TXBUILDER) << "Signer declined message for " << address;
        return std::nullopt;
    }
    if (signature->size() != COMPACT_SIGNATURE_SIZE) {
        LOG_WARN(util::LogCategory::TXBUILDER) << "Signer returned " << signature->size()
                                               << "-byte signature";
        return std::nullopt;
    }
    return Base64Encode(*signature);
}

} // namespace wallet
} // namespace dogeprov
