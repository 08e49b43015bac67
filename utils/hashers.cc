/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "hashers.hh"

#include <fmt/format.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace utils {

void md5_hasher::ctx_deleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

md5_hasher::md5_hasher()
    : _ctx(EVP_MD_CTX_new()) {
    if (!_ctx || EVP_DigestInit_ex(_ctx.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize MD5 digest");
    }
}

md5_hasher::~md5_hasher() = default;

void md5_hasher::update(const char* ptr, size_t length) {
    if (EVP_DigestUpdate(_ctx.get(), ptr, length) != 1) {
        throw std::runtime_error("MD5 digest update failed");
    }
}

std::array<uint8_t, md5_hasher::size> md5_hasher::finalize_array() {
    std::array<uint8_t, size> digest;
    unsigned len = 0;
    if (EVP_DigestFinal_ex(_ctx.get(), digest.data(), &len) != 1 || len != size) {
        throw std::runtime_error("MD5 digest finalization failed");
    }
    return digest;
}

std::array<uint8_t, 32> sha256_digest(std::string_view data) {
    std::array<uint8_t, 32> digest;
    unsigned len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1 || len != digest.size()) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return digest;
}

std::string base64_encode(std::string_view data) {
    std::string ret(4 * ((data.size() + 2) / 3), '\0');
    auto n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(ret.data()), reinterpret_cast<const unsigned char*>(data.data()), data.size());
    ret.resize(n);
    return ret;
}

std::string base64_decode(std::string_view data) {
    if (data.size() % 4 != 0) {
        throw std::invalid_argument(fmt::format("Invalid base64 length {}", data.size()));
    }
    std::string ret(3 * data.size() / 4, '\0');
    auto n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(ret.data()), reinterpret_cast<const unsigned char*>(data.data()), data.size());
    if (n < 0) {
        throw std::invalid_argument("Invalid base64 input");
    }
    // EVP_DecodeBlock keeps the padding bytes as zeroes
    size_t pad = 0;
    for (auto it = data.rbegin(); it != data.rend() && *it == '=' && pad < 2; ++it) {
        ++pad;
    }
    ret.resize(n - pad);
    return ret;
}

} // namespace utils
