// DOGEPROV - Provider Errors
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Error kinds surfaced to pages. Messages are stable; pages match on them.

#ifndef DOGEPROV_PROVIDER_ERRORS_H
#define DOGEPROV_PROVIDER_ERRORS_H

#include <stdexcept>
#include <string>

namespace dogeprov {
namespace provider {

enum class ErrorKind {
    NotConnected,
    RejectedConnect,
    RejectedTransaction,
    RejectedDoginalTransfer,
    RejectedSigning,
    WalletLocked,
    InsufficientFunds,
    InscriptionNotFound,
    UnsupportedMethod,
    SigningFailed,
    BroadcastFailed,
    Timeout,
    InvalidParams
};

const char* ErrorKindToString(ErrorKind kind);

/// True for the four user-rejection kinds
bool IsUserRejection(ErrorKind kind);

/**
 * Failure of a page-facing operation. Futures returned to pages carry it
 * as their exception.
 */
class ProviderError : public std::runtime_error {
public:
    ProviderError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

    static ProviderError NotConnected();
    static ProviderError WalletLocked();
    static ProviderError InsufficientFunds();
    static ProviderError InscriptionNotFound();
    static ProviderError UnsupportedMethod(const std::string& method);
    static ProviderError TransactionSigningFailed();
    static ProviderError MessageSigningFailed();
    static ProviderError BroadcastFailed();
    static ProviderError Timeout();
    static ProviderError InvalidParams(const std::string& detail);

    /// Rejection message for a rejection kind
    static ProviderError Rejected(ErrorKind rejectionKind);

private:
    ErrorKind kind_;
};

} // namespace provider
} // namespace dogeprov

#endif // DOGEPROV_PROVIDER_ERRORS_H
