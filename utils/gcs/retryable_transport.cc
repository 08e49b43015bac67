/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "retryable_transport.hh"

#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/log.hh>

#include "errors.hh"

using namespace seastar;

namespace gcs {

static seastar::logger retry_log("gcs_retry");

retryable_transport::retryable_transport(transport& t, const retry_strategy& retry_strategy)
    : _transport(t), _retry_strategy(retry_strategy) {
}

future<response> retryable_transport::do_retryable_request(request_factory make, abort_source* as) {
    if (as && as->abort_requested()) {
        co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
    }
    uint32_t retries = 0;
    while (true) {
        std::exception_ptr e;
        std::optional<response> resp;
        try {
            resp = co_await _transport.send(make(), as);
        } catch (...) {
            e = std::current_exception();
        }

        bool retry;
        std::string what;
        if (e) {
            if (as && as->abort_requested()) {
                co_await coroutine::return_exception_ptr(std::move(e));
            }
            retry = bool(_retry_strategy.is_retryable(e));
            what = fmt::format("{}", e);
        } else {
            retry = resp->status != http::reply::status_type::ok && bool(_retry_strategy.is_retryable(resp->status));
            what = std::string(resp->body);
        }

        if (!retry) {
            if (e) {
                co_await coroutine::return_exception_ptr(std::move(e));
            }
            co_return std::move(*resp);
        }
        if (retries >= _retry_strategy.get_max_retries()) {
            retry_log.warn("Giving up after {} retries: {}", retries, what);
            co_await coroutine::return_exception(retry_limit_exceeded_error(what, resp ? std::optional(resp->status) : std::nullopt));
        }
        auto delay = _retry_strategy.delay_before_retry(retries);
        retry_log.debug("Retrying request in {}ms (attempt {}): {}", delay.count(), retries + 1, what);
        if (as) {
            co_await sleep_abortable(delay, *as);
        } else {
            co_await sleep(delay);
        }
        ++retries;
    }
}

future<response> retryable_transport::make_request(request_factory make, std::optional<http::reply::status_type> expected, abort_source* as) {
    auto resp = co_await do_retryable_request(std::move(make), as);
    bool ok = expected ? resp.status == *expected : resp.is_success();
    if (!ok) {
        co_await coroutine::return_exception(upload_error(fmt::format("Request failed with status {}", resp.status),
                                                          resp.status, "", {std::string(resp.body)}));
    }
    co_return resp;
}

} // namespace gcs
