/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <seastar/http/reply.hh>

namespace gcs {

// Invalid upload options. Raised before any request is issued.
class configuration_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Terminal failure of an upload. Carries the HTTP status when the failure
// came from a server response.
class upload_error : public std::runtime_error {
    std::optional<seastar::http::reply::status_type> _status;
    std::string _code;
    std::vector<std::string> _errors;
public:
    upload_error(std::string message,
                 std::optional<seastar::http::reply::status_type> status = std::nullopt,
                 std::string code = {},
                 std::vector<std::string> errors = {});

    const std::optional<seastar::http::reply::status_type>& status() const noexcept { return _status; }
    const std::string& code() const noexcept { return _code; }
    // Server bodies or detail messages attached to the failure
    const std::vector<std::string>& errors() const noexcept { return _errors; }
};

class retry_limit_exceeded_error : public upload_error {
public:
    explicit retry_limit_exceeded_error(const std::string& last_body,
                                        std::optional<seastar::http::reply::status_type> status = std::nullopt);
};

class retry_timeout_error : public upload_error {
public:
    explicit retry_timeout_error(const std::string& last_body,
                                 std::optional<seastar::http::reply::status_type> status = std::nullopt);
};

// A response that does not follow the resumable protocol, e.g. a missing
// Location header on session creation or an unparsable Range header
class protocol_error : public upload_error {
public:
    using upload_error::upload_error;
};

// The server acknowledged fewer bytes than were already streamed and
// dropped from the local buffers
class offset_regression_error : public upload_error {
public:
    offset_regression_error(uint64_t server_offset, uint64_t bytes_written);
};

// Content checksum reported by the server differs from the local one. The
// object is left in place and the session URI is kept for diagnostics.
class upload_integrity_error : public upload_error {
    std::string _uri;
public:
    static constexpr std::string_view error_code = "FILE_NO_UPLOAD";

    upload_integrity_error(std::string uri, std::string detail);

    const std::string& uri() const noexcept { return _uri; }
};

} // namespace gcs
