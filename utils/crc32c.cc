/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "crc32c.hh"

#include <crc32c/crc32c.h>

namespace utils {

void crc32c::process(const char* data, size_t size) noexcept {
    _crc = ::crc32c::Extend(_crc, reinterpret_cast<const uint8_t*>(data), size);
}

std::array<uint8_t, 4> crc32c::get_be_bytes() const noexcept {
    auto v = get();
    return {uint8_t(v >> 24), uint8_t(v >> 16), uint8_t(v >> 8), uint8_t(v)};
}

} // namespace utils
