// BONDVAULT - SHA256 Hash Function
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// SHA-256 over OpenSSL's EVP interface. Used for message ids and for
// deriving 32-byte domain identifiers from names.

#ifndef BONDVAULT_CRYPTO_SHA256_H
#define BONDVAULT_CRYPTO_SHA256_H

#include "bondvault/core/types.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace bondvault {

/// Incremental hasher. Finalize() returns the digest and rearms the context.
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = Hash256::SIZE;

    SHA256();
    ~SHA256();

    SHA256(SHA256&&) noexcept;
    SHA256& operator=(SHA256&&) noexcept;

    SHA256& Write(const Byte* data, size_t len);
    SHA256& Write(const std::string& text) {
        return Write(reinterpret_cast<const Byte*>(text.data()), text.size());
    }

    Hash256 Finalize();

    SHA256& Reset();

private:
    struct ContextFree {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, ContextFree> ctx_;
};

Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& text) {
    return SHA256().Write(text).Finalize();
}

} // namespace bondvault

#endif // BONDVAULT_CRYPTO_SHA256_H
