/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace utils {

class md5_hasher {
    struct ctx_deleter {
        void operator()(evp_md_ctx_st*) const noexcept;
    };
    std::unique_ptr<evp_md_ctx_st, ctx_deleter> _ctx;
public:
    static constexpr size_t size = 16;

    md5_hasher();
    md5_hasher(md5_hasher&&) noexcept = default;
    md5_hasher& operator=(md5_hasher&&) noexcept = default;
    ~md5_hasher();

    void update(const char* ptr, size_t length);
    std::array<uint8_t, size> finalize_array();
};

std::array<uint8_t, 32> sha256_digest(std::string_view data);

std::string base64_encode(std::string_view data);
std::string base64_decode(std::string_view data);

template <size_t N>
std::string base64_encode(const std::array<uint8_t, N>& digest) {
    return base64_encode(std::string_view(reinterpret_cast<const char*>(digest.data()), digest.size()));
}

} // namespace utils
