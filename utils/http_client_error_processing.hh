/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <string>
#include <system_error>
#include <type_traits>

#include <seastar/http/reply.hh>
#include <seastar/util/bool_class.hh>

namespace utils::http {

using retryable = seastar::bool_class<struct is_retryable>;

// 408, 429 and the 5xx gateway/availability family
retryable from_http_code(seastar::http::reply::status_type http_code);

// Connection resets, refusals, broken pipes, timeouts and transient
// resolver failures
retryable from_system_error(const std::system_error& system_error);

// Classifies a failure raised by the transport layer. Nested exceptions are
// unwrapped until a known type is met.
retryable from_exception(std::exception_ptr eptr);

template <typename Exc, typename F>
struct TypedHandler {
    static_assert(std::is_base_of_v<std::exception, Exc>, "TypedHandler can only handle std::exception types");
    using return_type = std::invoke_result_t<F, const Exc&>;

    F func;
    [[nodiscard]] bool matches(const std::exception& e) const noexcept { return dynamic_cast<const Exc*>(&e) != nullptr; }
    return_type handle(const std::exception& e) const { return func(static_cast<const Exc&>(e)); }
};

template <typename Exc, typename F>
auto make_handler(F&& f) {
    return TypedHandler<Exc, std::decay_t<F>>{std::forward<F>(f)};
}

// Applies the first matching handler to eptr, unwrapping std::nested_exception
// layers as needed. The default handler receives the innermost exception and
// the message of the outermost one. All handlers must return R.
template <typename R, typename DefaultHandler, typename... Handlers>
R dispatch_exception(std::exception_ptr eptr, DefaultHandler default_handler, Handlers&&... handlers) {
    using default_handler_return_type = std::invoke_result_t<DefaultHandler, std::exception_ptr, std::string&&>;
    static_assert(std::is_same_v<R, default_handler_return_type>, "Default handler must return the same type R");
    static_assert((std::is_same_v<default_handler_return_type, typename std::decay_t<Handlers>::return_type> && ...),
                  "All handlers must return the same type R");

    std::string original_message;

    while (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            if (original_message.empty()) {
                original_message = e.what();
            }

            bool matched = false;
            R result;
            ([&] {
                if (!matched && handlers.matches(e)) {
                    result = handlers.handle(e);
                    matched = true;
                }
            }(),...);

            if (matched) {
                return result;
            }

            try {
                std::rethrow_if_nested(e);
            } catch (...) {
                eptr = std::current_exception();
                continue;
            }
            return default_handler(eptr, std::move(original_message));
        } catch (...) {
            return default_handler(eptr, std::move(original_message));
        }
    }
    return default_handler(eptr, std::move(original_message));
}

} // namespace utils::http
