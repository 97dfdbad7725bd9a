// DOGEPROV - Hashing and Encoding Primitives
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Thin wrappers over OpenSSL's EVP digests and base64 codec.

#ifndef DOGEPROV_CRYPTO_HASH_H
#define DOGEPROV_CRYPTO_HASH_H

#include "dogeprov/core/types.h"
#include <cstddef>
#include <string>
#include <vector>

namespace dogeprov {

/// Single SHA-256
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// SHA256(SHA256(data)), used for txids, Base58Check checksums and
/// signed message digests
Hash256 DoubleSHA256(const Byte* data, size_t len);

inline Hash256 DoubleSHA256(const std::vector<Byte>& data) {
    return DoubleSHA256(data.data(), data.size());
}

/// Standard base64 with padding
std::string Base64Encode(const std::vector<Byte>& data);

} // namespace dogeprov

#endif // DOGEPROV_CRYPTO_HASH_H
