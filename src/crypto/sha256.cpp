// BONDVAULT - SHA256 Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/crypto/sha256.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace bondvault {

namespace {

void Check(int rc, const char* what) {
    if (rc != 1) {
        throw std::runtime_error(std::string("OpenSSL ") + what + " failed");
    }
}

} // namespace

void SHA256::ContextFree::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("OpenSSL EVP_MD_CTX_new failed");
    }
    Reset();
}

SHA256::~SHA256() = default;
SHA256::SHA256(SHA256&&) noexcept = default;
SHA256& SHA256::operator=(SHA256&&) noexcept = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0) {
        Check(EVP_DigestUpdate(ctx_.get(), data, len), "EVP_DigestUpdate");
    }
    return *this;
}

Hash256 SHA256::Finalize() {
    Hash256 digest;
    unsigned int written = 0;
    Check(EVP_DigestFinal_ex(ctx_.get(), digest.data(), &written), "EVP_DigestFinal_ex");
    if (written != OUTPUT_SIZE) {
        throw std::runtime_error("OpenSSL returned a short SHA-256 digest");
    }
    Reset();
    return digest;
}

SHA256& SHA256::Reset() {
    Check(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr), "EVP_DigestInit_ex");
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    return SHA256().Write(data, len).Finalize();
}

} // namespace bondvault
