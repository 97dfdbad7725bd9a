// DOGEPROV - Provider Errors Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/provider/errors.h"

namespace dogeprov {
namespace provider {

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotConnected: return "NotConnected";
        case ErrorKind::RejectedConnect: return "RejectedConnect";
        case ErrorKind::RejectedTransaction: return "RejectedTransaction";
        case ErrorKind::RejectedDoginalTransfer: return "RejectedDoginalTransfer";
        case ErrorKind::RejectedSigning: return "RejectedSigning";
        case ErrorKind::WalletLocked: return "WalletLocked";
        case ErrorKind::InsufficientFunds: return "InsufficientFunds";
        case ErrorKind::InscriptionNotFound: return "InscriptionNotFound";
        case ErrorKind::UnsupportedMethod: return "UnsupportedMethod";
        case ErrorKind::SigningFailed: return "SigningFailed";
        case ErrorKind::BroadcastFailed: return "BroadcastFailed";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::InvalidParams: return "InvalidParams";
    }
    return "Unknown";
}

bool IsUserRejection(ErrorKind kind) {
    return kind == ErrorKind::RejectedConnect || kind == ErrorKind::RejectedTransaction ||
           kind == ErrorKind::RejectedDoginalTransfer || kind == ErrorKind::RejectedSigning;
}

ProviderError ProviderError::NotConnected() {
    return ProviderError(ErrorKind::NotConnected, "Site not connected");
}

ProviderError ProviderError::WalletLocked() {
    return ProviderError(ErrorKind::WalletLocked, "Wallet is locked");
}

ProviderError ProviderError::InsufficientFunds() {
    return ProviderError(ErrorKind::InsufficientFunds, "Insufficient funds");
}

ProviderError ProviderError::InscriptionNotFound() {
    return ProviderError(ErrorKind::InscriptionNotFound, "Inscription not found");
}

ProviderError ProviderError::UnsupportedMethod(const std::string& method) {
    return ProviderError(ErrorKind::UnsupportedMethod, "Unsupported method: " + method);
}

ProviderError ProviderError::TransactionSigningFailed() {
    return ProviderError(ErrorKind::SigningFailed, "Failed to sign transaction");
}

ProviderError ProviderError::MessageSigningFailed() {
    return ProviderError(ErrorKind::SigningFailed, "Failed to sign message");
}

ProviderError ProviderError::BroadcastFailed() {
    return ProviderError(ErrorKind::BroadcastFailed, "Failed to broadcast transaction");
}

ProviderError ProviderError::Timeout() {
    return ProviderError(ErrorKind::Timeout, "Request timed out");
}

ProviderError ProviderError::InvalidParams(const std::string& detail) {
    return ProviderError(ErrorKind::InvalidParams, "Invalid parameters: " + detail);
}

ProviderError ProviderError::Rejected(ErrorKind rejectionKind) {
    switch (rejectionKind) {
        case ErrorKind::RejectedConnect:
            return ProviderError(rejectionKind, "User rejected connection request");
        case ErrorKind::RejectedDoginalTransfer:
            return ProviderError(rejectionKind, "Doginal transfer rejected by user");
        case ErrorKind::RejectedSigning:
            return ProviderError(rejectionKind, "Message signing rejected by user");
        default:
            return ProviderError(ErrorKind::RejectedTransaction, "Transaction rejected by user");
    }
}

} // namespace provider
} // namespace dogeprov
