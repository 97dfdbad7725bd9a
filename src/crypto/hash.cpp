// DOGEPROV - Hashing and Encoding Primitives Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/crypto/hash.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace dogeprov {

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    unsigned int outLen = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    bool ok = ctx &&
              EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data, len) == 1 &&
              EVP_DigestFinal_ex(ctx, result.data(), &outLen) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok || outLen != Hash256::SIZE) {
        throw std::runtime_error("SHA256 digest failed");
    }
    return result;
}

Hash256 DoubleSHA256(const Byte* data, size_t len) {
    Hash256 first = SHA256Hash(data, len);
    return SHA256Hash(first.data(), first.size());
}

std::string Base64Encode(const std::vector<Byte>& data) {
    if (data.empty()) {
        return "";
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

} // namespace dogeprov
