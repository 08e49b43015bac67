/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "utils/crc32c.hh"
#include "utils/hashers.hh"

namespace gcs {

struct checksum_options {
    bool crc32c = false;
    bool md5 = false;
    // Caller-computed base64 values, they take precedence over computing
    std::optional<std::string> client_crc32c;
    std::optional<std::string> client_md5_hash;
};

// Streaming CRC32C / MD5 of the object content, compared with what the server
// reports once the upload completes.
//
// Bytes are fed with their position in the object. Positions already hashed
// are skipped, so replaying data after a partial or failed request does not
// corrupt the digest. A gap in positions (data never seen by this process)
// makes the computed values unusable and disables them.
class checksum_validator {
    std::optional<utils::crc32c> _crc32c;
    std::optional<utils::md5_hasher> _md5;
    std::optional<std::string> _client_crc32c;
    std::optional<std::string> _client_md5_hash;
    uint64_t _hashed_bytes = 0;
    bool _finalized = false;
    std::optional<std::string> _crc32c_value;
    std::optional<std::string> _md5_value;
public:
    // start_offset: position of the first byte this process will see
    explicit checksum_validator(const checksum_options& opts, uint64_t start_offset = 0);

    bool computing() const noexcept { return _crc32c || _md5; }
    bool crc32c_enabled() const noexcept { return _crc32c.has_value(); }
    bool md5_enabled() const noexcept { return _md5.has_value(); }
    uint64_t hashed_bytes() const noexcept { return _hashed_bytes; }
    bool finalized() const noexcept { return _finalized; }

    void update(uint64_t position, const char* data, size_t size);

    // Idempotent. No updates are accepted afterwards.
    void finalize();

    // Computed (after finalize) or caller-supplied values, base64
    std::optional<std::string> crc32c() const;
    std::optional<std::string> md5() const;

    // Values known before the final request is sent. Computed ones count only
    // after finalize().
    std::optional<std::string> x_goog_hash() const;

    // Compares local values against the server's. Returns the mismatch
    // description, if any. Algorithms missing on either side are skipped.
    std::optional<std::string> compare(const std::optional<std::string>& server_crc32c,
                                       const std::optional<std::string>& server_md5) const;
};

} // namespace gcs
