/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "session_manager.hh"

#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/log.hh>

#include "errors.hh"

using namespace seastar;

namespace gcs {

static seastar::logger session_log("gcs_session");

session_manager::session_manager(request_executor& executor, transport& t, retry_controller& retry)
    : _executor(executor)
    , _retrying(t, retry.strategy())
    , _retry(retry)
{}

future<std::string> session_manager::create_session(abort_source* as) {
    auto resp = co_await _retrying.make_request([this] { return _executor.make_session_request(); }, std::nullopt, as);
    if (auto err = request_executor::error_in_body(resp)) {
        co_await coroutine::return_exception(upload_error(fmt::format("Session creation failed: {}", *err), resp.status, "", {*err}));
    }
    auto location = resp.get_header("Location");
    if (!location || location->empty()) {
        co_await coroutine::return_exception(protocol_error("Session creation response carries no Location header", resp.status));
    }
    _executor.rotate_create_invocation_id();
    session_log.info("Created upload session {}", *location);
    co_return std::move(*location);
}

future<response> session_manager::do_check_upload_status(const std::string& uri, abort_source* as) {
    auto resp = co_await _executor.execute(_executor.make_status_request(uri), as);
    if (!resp.is_success() && resp.status != resume_incomplete) {
        co_await coroutine::return_exception(upload_error(fmt::format("Upload status check failed with {}", resp.status),
                                                          resp.status, "", {std::string(resp.body)}));
    }
    if (auto err = request_executor::error_in_body(resp)) {
        co_await coroutine::return_exception(upload_error(fmt::format("Upload status check failed: {}", *err), resp.status, "", {*err}));
    }
    _executor.rotate_status_invocation_id();
    co_return resp;
}

future<response> session_manager::check_upload_status(const std::string& uri, bool retry, abort_source* as) {
    uint32_t attempts = 0;
    while (true) {
        std::exception_ptr ex;
        try {
            co_return co_await do_check_upload_status(uri, as);
        } catch (...) {
            ex = std::current_exception();
        }
        if (!retry || (as && as->abort_requested())) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
        bool transient = false;
        std::optional<http::reply::status_type> status;
        std::string last_body;
        try {
            std::rethrow_exception(ex);
        } catch (const upload_error& e) {
            status = e.status();
            last_body = e.errors().empty() ? e.what() : e.errors().front();
            transient = status && bool(_retry.strategy().is_retryable(*status));
        } catch (...) {
            last_body = fmt::format("{}", std::current_exception());
            transient = bool(_retry.strategy().is_retryable(std::current_exception()));
        }
        if (!transient) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
        if (attempts >= _retry.retry_limit()) {
            co_await coroutine::return_exception(retry_limit_exceeded_error(last_body, status));
        }
        auto delay = _retry.delay_after(attempts);
        if (!delay) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
        ++attempts;
        session_log.warn("Upload status check of {} failed, retry {}/{} in {}ms: {}", uri, attempts, _retry.retry_limit(), delay->count(), ex);
        if (as) {
            co_await sleep_abortable(*delay, *as);
        } else {
            co_await sleep(*delay);
        }
    }
}

future<uint64_t> session_manager::probe_offset(const std::string& uri, abort_source* as) {
    auto resp = co_await check_upload_status(uri, false, as);
    uint64_t offset = 0;
    if (resp.status == resume_incomplete) {
        if (auto last = request_executor::parse_range_end(resp.get_header("Range"))) {
            offset = *last + 1;
        }
    }
    session_log.debug("Session {} is at offset {}", uri, offset);
    co_return offset;
}

} // namespace gcs
