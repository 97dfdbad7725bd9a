// DOGEPROV - Signed Messages
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#ifndef DOGEPROV_WALLET_MESSAGE_H
#define DOGEPROV_WALLET_MESSAGE_H

#include "dogeprov/core/types.h"
#include "dogeprov/wallet/interfaces.h"

#include <optional>
#include <string>

namespace dogeprov {
namespace wallet {

extern const std::string MESSAGE_MAGIC;

/// SHA256d(varstr(MESSAGE_MAGIC) || varstr(message))
Hash256 MessageHash(const std::string& message);

/// Base64 compact signature, or nullopt if the signer fails or returns
/// anything but 65 bytes
std::optional<std::string> SignMessage(ISigner& signer, const std::string& message,
                                       const std::string& address);

} // namespace wallet
} // namespace dogeprov

#endif // DOGEPROV_WALLET_MESSAGE_H
