/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http_client_error_processing.hh"

#include <cerrno>
#include <netdb.h>

#include <seastar/core/timed_out_error.hh>
#include <seastar/http/exception.hh>

namespace utils::http {

retryable from_http_code(seastar::http::reply::status_type http_code) {
    switch (http_code) {
    case seastar::http::reply::status_type::request_timeout:
    case seastar::http::reply::status_type::too_many_requests:
    case seastar::http::reply::status_type::internal_server_error:
    case seastar::http::reply::status_type::bad_gateway:
    case seastar::http::reply::status_type::service_unavailable:
    case seastar::http::reply::status_type::gateway_timeout:
        return retryable::yes;
    default:
        return retryable::no;
    }
}

retryable from_system_error(const std::system_error& system_error) {
    if (system_error.code().category() == std::system_category()) {
        switch (system_error.code().value()) {
        case ECONNRESET:
        case ECONNREFUSED:
        case ECONNABORTED:
        case EPIPE:
        case ETIMEDOUT:
        case EHOSTUNREACH:
        case ENETUNREACH:
            return retryable::yes;
        default:
            return retryable::no;
        }
    }
    // Name resolution failures are transient more often than not
    if (system_error.code().value() == EAI_AGAIN) {
        return retryable::yes;
    }
    return retryable::no;
}

retryable from_exception(std::exception_ptr eptr) {
    return dispatch_exception<retryable>(std::move(eptr),
            [] (std::exception_ptr, std::string&& msg) {
                // The HTTP client reports a peer that hung up mid-response this way
                return retryable(msg.find("unexpected connection closure") != std::string::npos
                        || msg.find("Connection reset") != std::string::npos);
            },
            make_handler<std::system_error>([] (const std::system_error& e) {
                return from_system_error(e);
            }),
            make_handler<seastar::httpd::unexpected_status_error>([] (const seastar::httpd::unexpected_status_error& e) {
                return from_http_code(e.status());
            }),
            make_handler<seastar::timed_out_error>([] (const seastar::timed_out_error&) {
                return retryable::yes;
            }));
}

} // namespace utils::http
