/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "checksum_validator.hh"

#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <seastar/util/log.hh>

namespace gcs {

static seastar::logger checksum_log("gcs_checksum");

checksum_validator::checksum_validator(const checksum_options& opts, uint64_t start_offset)
    : _client_crc32c(opts.client_crc32c)
    , _client_md5_hash(opts.client_md5_hash)
    , _hashed_bytes(start_offset)
{
    if (start_offset != 0) {
        if (opts.crc32c || opts.md5) {
            checksum_log.debug("Resuming at offset {}, local checksums disabled", start_offset);
        }
        return;
    }
    if (opts.crc32c && !opts.client_crc32c) {
        _crc32c.emplace();
    }
    if (opts.md5 && !opts.client_md5_hash) {
        _md5.emplace();
    }
}

void checksum_validator::update(uint64_t position, const char* data, size_t size) {
    if (!computing() || size == 0) {
        return;
    }
    auto end = position + size;
    if (end <= _hashed_bytes) {
        return;
    }
    if (position > _hashed_bytes) {
        checksum_log.warn("Checksum input gap at {} (hashed {}), local checksums disabled", position, _hashed_bytes);
        _crc32c.reset();
        _md5.reset();
        return;
    }
    if (_finalized) {
        throw std::logic_error(fmt::format("Checksum updated at {} after finalization", position));
    }
    auto skip = _hashed_bytes - position;
    data += skip;
    size -= skip;
    if (_crc32c) {
        _crc32c->process(data, size);
    }
    if (_md5) {
        _md5->update(data, size);
    }
    _hashed_bytes = end;
}

void checksum_validator::finalize() {
    if (_finalized) {
        return;
    }
    _finalized = true;
    if (_crc32c) {
        _crc32c_value = utils::base64_encode(_crc32c->get_be_bytes());
    }
    if (_md5) {
        _md5_value = utils::base64_encode(_md5->finalize_array());
    }
}

std::optional<std::string> checksum_validator::crc32c() const {
    return _crc32c ? _crc32c_value : _client_crc32c;
}

std::optional<std::string> checksum_validator::md5() const {
    return _md5 ? _md5_value : _client_md5_hash;
}

std::optional<std::string> checksum_validator::x_goog_hash() const {
    std::vector<std::string> parts;
    if (auto v = crc32c()) {
        parts.push_back(fmt::format("crc32c={}", *v));
    }
    if (auto v = md5()) {
        parts.push_back(fmt::format("md5={}", *v));
    }
    if (parts.empty()) {
        return std::nullopt;
    }
    return fmt::format("{}", fmt::join(parts, ","));
}

std::optional<std::string> checksum_validator::compare(const std::optional<std::string>& server_crc32c,
                                                       const std::optional<std::string>& server_md5) const {
    auto check = [] (const std::optional<std::string>& client, const std::optional<std::string>& server, std::string_view name) -> std::optional<std::string> {
        if (client && server && !client->empty() && !server->empty() && *client != *server) {
            return fmt::format("{} checksum mismatch. Client calculated: {}, Server returned: {}", name, *client, *server);
        }
        return std::nullopt;
    };
    if (auto m = check(crc32c(), server_crc32c, "CRC32C")) {
        return m;
    }
    return check(md5(), server_md5, "MD5");
}

} // namespace gcs
