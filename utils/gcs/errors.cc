/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "errors.hh"

#include <fmt/format.h>

namespace gcs {

upload_error::upload_error(std::string message,
                           std::optional<seastar::http::reply::status_type> status,
                           std::string code,
                           std::vector<std::string> errors)
    : std::runtime_error(std::move(message))
    , _status(status)
    , _code(std::move(code))
    , _errors(std::move(errors)) {
}

retry_limit_exceeded_error::retry_limit_exceeded_error(const std::string& last_body, std::optional<seastar::http::reply::status_type> status)
    : upload_error(fmt::format("Retry limit exceeded - {}", last_body), status, "RETRY_LIMIT_EXCEEDED", {last_body}) {
}

retry_timeout_error::retry_timeout_error(const std::string& last_body, std::optional<seastar::http::reply::status_type> status)
    : upload_error(fmt::format("Retry total time limit exceeded - {}", last_body), status, "RETRY_TIMEOUT", {last_body}) {
}

offset_regression_error::offset_regression_error(uint64_t server_offset, uint64_t bytes_written)
    : upload_error(fmt::format("The offset is lower than the number of bytes written. The server has {} bytes and while {} bytes has been uploaded"
                               " - thus {} bytes are missing. Stopping as this could result in data loss. Initiate a new upload to continue.",
                               server_offset, bytes_written, bytes_written - server_offset),
                   std::nullopt, "OFFSET_REGRESSION") {
}

upload_integrity_error::upload_integrity_error(std::string uri, std::string detail)
    : upload_error("The uploaded data did not match the data from the server."
                   " The object was left in place; upload it again to be sure the content is the same.",
                   std::nullopt, std::string(error_code), {std::move(detail)})
    , _uri(std::move(uri)) {
}

} // namespace gcs
