/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace utils {

// Castagnoli CRC (iSCSI polynomial), computed incrementally over google/crc32c.
class crc32c {
    uint32_t _crc = 0;
public:
    void process(const char* data, size_t size) noexcept;
    void process(std::string_view data) noexcept {
        process(data.data(), data.size());
    }

    uint32_t get() const noexcept {
        return _crc;
    }

    // Big-endian byte order, as used by GCS for the object's crc32c property.
    std::array<uint8_t, 4> get_be_bytes() const noexcept;
};

} // namespace utils
