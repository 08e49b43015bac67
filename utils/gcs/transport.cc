/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transport.hh"

#include <algorithm>
#include <cctype>

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

namespace gcs {

bool case_insensitive_less::operator()(std::string_view a, std::string_view b) const noexcept {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [] (unsigned char x, unsigned char y) {
        return std::tolower(x) < std::tolower(y);
    });
}

request request::make(seastar::sstring method, std::string url) {
    request req;
    req.method = std::move(method);
    req.url = std::move(url);
    return req;
}

void request::set_body(seastar::sstring body, std::string content_type) {
    content_length = body.size();
    headers["Content-Type"] = std::move(content_type);
    writer = [body = std::move(body)] (seastar::output_stream<char>&& out) {
        return write_buffer(std::move(out), body);
    };
}

std::optional<std::string> response::get_header(std::string_view name) const {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

seastar::future<> write_buffer(seastar::output_stream<char> out, seastar::sstring body) {
    std::exception_ptr ex;
    try {
        co_await out.write(body.data(), body.size());
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await seastar::coroutine::return_exception_ptr(std::move(ex));
    }
}

} // namespace gcs
