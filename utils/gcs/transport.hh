/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>
#include <seastar/http/reply.hh>
#include <seastar/util/noncopyable_function.hh>

namespace gcs {

struct case_insensitive_less {
    bool operator()(std::string_view a, std::string_view b) const noexcept;
    using is_transparent = void;
};

using header_map = std::map<std::string, std::string, case_insensitive_less>;

// Writes the request body and closes the stream
using body_writer = seastar::noncopyable_function<seastar::future<>(seastar::output_stream<char>&&)>;

struct request {
    seastar::sstring method;
    // Absolute URL, query string included
    std::string url;
    header_map headers;
    // Unset together with a writer means a chunked (unbounded) body
    std::optional<size_t> content_length;
    body_writer writer;

    static request make(seastar::sstring method, std::string url);

    // Sets a fixed in-memory body
    void set_body(seastar::sstring body, std::string content_type);
};

struct response {
    seastar::http::reply::status_type status = seastar::http::reply::status_type::ok;
    header_map headers;
    seastar::sstring body;

    std::optional<std::string> get_header(std::string_view name) const;

    bool is_success() const noexcept {
        auto s = static_cast<int>(status);
        return s >= 200 && s < 300;
    }
};

inline constexpr auto resume_incomplete = seastar::http::reply::status_type(308);

// Authenticated request execution. A returned response may carry any
// status; only failures to obtain a response are raised as exceptions.
class transport {
public:
    virtual ~transport() = default;

    virtual seastar::future<response> send(request req, seastar::abort_source* as) = 0;

    virtual seastar::future<> close() = 0;
};

// Writes one in-memory buffer, following the close-on-any-outcome pattern
// every body writer in this library uses
seastar::future<> write_buffer(seastar::output_stream<char> out, seastar::sstring body);

} // namespace gcs
