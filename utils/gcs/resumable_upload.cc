/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "resumable_upload.hh"

#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/log.hh>

#include "errors.hh"

using namespace seastar;

namespace gcs {

static seastar::logger gcs_log("gcs");

static upload_config validated(upload_config cfg) {
    cfg.validate();
    return cfg;
}

static checksum_options make_checksum_options(const upload_config& cfg) {
    return checksum_options{
        .crc32c = cfg.crc32c,
        .md5 = cfg.md5,
        .client_crc32c = cfg.client_crc32c,
        .client_md5_hash = cfg.client_md5_hash,
    };
}

resumable_upload::resumable_upload(transport& t, upload_config cfg, abort_source* as, std::unique_ptr<retry_strategy> rs)
    : _cfg(validated(std::move(cfg)))
    , _retry_strategy(rs ? std::move(rs) : std::make_unique<default_retry_strategy>(_cfg.retry))
    , _retry(*_retry_strategy, _cfg.retry.total_timeout)
    , _executor(t, _cfg, *_retry_strategy)
    , _sessions(_executor, t, _retry)
    , _checksums(make_checksum_options(_cfg), _cfg.offset.value_or(0))
{
    _state.uri = _cfg.uri;
    if (_cfg.offset) {
        // Resuming an upload another process started, the producer
        // continues right after the persisted bytes
        _state.offset = _cfg.offset;
        _state.bytes_written = *_cfg.offset;
    }
    if (as) {
        _external_abort = as->subscribe([this] () noexcept {
            abort(std::make_exception_ptr(abort_requested_exception()));
        });
        if (!_external_abort) {
            abort(std::make_exception_ptr(abort_requested_exception()));
        }
    }
}

resumable_upload::~resumable_upload() = default;

void resumable_upload::ensure_started() {
    if (!_started) {
        _started = true;
        _loop = run();
    }
}

future<> resumable_upload::write(buffer buf) {
    if (_error) {
        return make_exception_future<>(_error);
    }
    if (_upstream_finished || _done) {
        return make_exception_future<>(std::logic_error("Write to a finished upload"));
    }
    _queue.push_back(std::move(buf));
    ensure_started();
    _data_cv.broadcast();
    if (_queue.size() < _cfg.high_water_mark) {
        return make_ready_future<>();
    }
    gcs_log.trace("{} bytes queued, waiting for the upload to drain them", _queue.size());
    return _drained_cv.wait([this] { return _queue.size() < _cfg.high_water_mark || _done; });
}

future<> resumable_upload::finish() {
    if (!_upstream_finished && !_done) {
        _upstream_finished = true;
        _data_cv.broadcast();
        ensure_started();
    }
    co_await _completion_cv.wait([this] { return _done; });
    if (_error) {
        co_await coroutine::return_exception_ptr(_error);
    }
}

void resumable_upload::abort(std::exception_ptr ex) {
    if (_done) {
        return;
    }
    if (!ex) {
        ex = std::make_exception_ptr(abort_requested_exception());
    }
    gcs_log.warn("Aborting upload of {}/{}: {}", _cfg.bucket, _cfg.object_name, ex);
    fail(std::move(ex));
}

future<> resumable_upload::close() {
    if (!_done) {
        abort(std::make_exception_ptr(std::runtime_error("Upload closed before completion")));
    }
    co_await std::exchange(_loop, make_ready_future<>());
}

void resumable_upload::fail(std::exception_ptr ex) {
    if (_done) {
        return;
    }
    _done = true;
    _error = ex;
    if (!_as.abort_requested()) {
        _as.request_abort_ex(ex);
    }
    _data_cv.broken(ex);
    _drained_cv.broken(ex);
    _completion_cv.broadcast();
    _error_signal(ex);
}

void resumable_upload::finish_successfully() {
    _done = true;
    _drained_cv.broadcast();
    _completion_cv.broadcast();
}

future<> resumable_upload::run() {
    std::exception_ptr ex;
    try {
        co_await do_upload();
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        if (!_done) {
            gcs_log.error("Upload of {}/{} failed: {}", _cfg.bucket, _cfg.object_name, ex);
        }
        fail(std::move(ex));
    } else {
        gcs_log.info("Upload of {}/{} completed, {} bytes", _cfg.bucket, _cfg.object_name, _state.bytes_written);
        finish_successfully();
    }
}

void resumable_upload::set_session(std::string uri) {
    _state.uri = uri;
    _state.offset = 0;
    _uri_signal(uri);
}

future<std::string> resumable_upload::create_uri() {
    auto uri = co_await _sessions.create_session(&_as);
    set_session(uri);
    co_return uri;
}

future<response> resumable_upload::check_upload_status(bool retry) {
    if (!_state.uri) {
        throw configuration_error("Checking the upload status needs a session URI");
    }
    return _sessions.check_upload_status(*_state.uri, retry, &_as);
}

future<> resumable_upload::do_upload() {
    auto next = _state.uri ? step::resume : step::restart;
    if (next == step::resume && _state.offset) {
        next = step::next_chunk;
    }
    while (next != step::done) {
        if (next == step::restart) {
            if (_state.bytes_written) {
                co_await coroutine::return_exception(upload_error(
                        "Attempting to restart an upload after unrecoverable bytes have been written from upstream. "
                        "Stopping as this could result in data loss. Initiate a new upload to continue."));
            }
            set_session(co_await _sessions.create_session(&_as));
        } else if (next == step::resume) {
            std::exception_ptr ex;
            try {
                _state.offset = co_await _sessions.probe_offset(*_state.uri, &_as);
            } catch (...) {
                ex = std::current_exception();
            }
            if (ex) {
                bool transient = false;
                try {
                    std::rethrow_exception(ex);
                } catch (const upload_error& e) {
                    transient = e.status() && bool(_retry.strategy().is_retryable(*e.status()));
                } catch (...) {
                    transient = !_as.abort_requested() && bool(_retry.strategy().is_retryable(ex));
                }
                if (!transient) {
                    co_await coroutine::return_exception_ptr(std::move(ex));
                }
                next = co_await attempt_delayed_retry(std::nullopt, fmt::format("{}", ex));
                continue;
            }
        }
        next = co_await upload_chunk();
    }
}

future<> resumable_upload::wait_for_data() {
    return _data_cv.wait([this] { return !_queue.empty() || _upstream_finished; });
}

future<bool> resumable_upload::wait_for_next_chunk() {
    co_await wait_for_data();
    co_return !_queue.empty();
}

void resumable_upload::account_sent(size_t bytes) {
    _state.chunks_read_in_request++;
    _state.bytes_written += bytes;
    _pending_sent += bytes;
    _progress_signal(upload_progress{_state.bytes_written, _cfg.content_length});
}

future<> resumable_upload::fast_forward(uint64_t bytes) {
    auto target = _state.bytes_written + bytes;
    gcs_log.debug("Skipping {} bytes the server already has", bytes);
    while (_state.bytes_written < target) {
        co_await wait_for_data();
        auto buf = _queue.pop_front(target - _state.bytes_written);
        if (buf.empty()) {
            break;
        }
        _checksums.update(_state.bytes_written, buf.get(), buf.size());
        _state.bytes_written += buf.size();
        _drained_cv.broadcast();
    }
    _state.bytes_written = target;
}

future<resumable_upload::step> resumable_upload::upload_chunk() {
    _state.chunks_read_in_request = 0;
    _pending_sent = 0;
    auto offset = _state.offset.value_or(0);
    _state.offset = offset;

    if (offset < _state.bytes_written) {
        co_await coroutine::return_exception(offset_regression_error(offset, _state.bytes_written));
    }
    if (_state.bytes_written < offset) {
        co_await fast_forward(offset - _state.bytes_written);
    }

    std::optional<uint64_t> expected;
    if (_cfg.content_length) {
        expected = *_cfg.content_length > _state.bytes_written ? *_cfg.content_length - _state.bytes_written : 0;
    }
    if (_cfg.chunk_size) {
        expected = expected ? std::min<uint64_t>(*_cfg.chunk_size, *expected) : *_cfg.chunk_size;
    }

    chunk_request_params params{.offset = offset, .total = _cfg.content_length};
    body_writer writer;
    if (_cfg.multi_chunk()) {
        chunk_iterator it(_queue, expected);
        while (!it.limit_reached()) {
            co_await wait_for_data();
            auto buf = it.next();
            if (buf.empty()) {
                break;
            }
            _checksums.update(_state.bytes_written + _pending.size(), buf.get(), buf.size());
            _pending.append(std::move(buf));
            _drained_cv.broadcast();
        }
        bool is_last = !(co_await wait_for_next_chunk());
        if (is_last) {
            _checksums.finalize();
            params.x_goog_hash = _checksums.x_goog_hash();
            if (!params.total && !_cfg.is_partial_upload) {
                params.total = _state.bytes_written + _pending.size();
            }
        }
        params.length = _pending.size();
        writer = [this] (output_stream<char>&& out) {
            return write_pending(std::move(out));
        };
    } else {
        if (!params.total && _upstream_finished) {
            params.total = _state.bytes_written + _queue.size();
        }
        params.x_goog_hash = _checksums.x_goog_hash();
        writer = [this, expected] (output_stream<char>&& out) {
            return stream_queue(std::move(out), expected);
        };
    }

    auto req = _executor.make_chunk_request(*_state.uri, params, std::move(writer));
    gcs_log.debug("Sending {} of {}", req.headers["Content-Range"], *_state.uri);

    std::optional<response> resp;
    std::exception_ptr ex;
    try {
        resp = co_await _executor.execute(std::move(req), &_as);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        if (_as.abort_requested() || !bool(_retry.strategy().is_retryable(ex))) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
        co_return co_await attempt_delayed_retry(std::nullopt, fmt::format("{}", ex));
    }
    co_return co_await handle_response(std::move(*resp));
}

future<resumable_upload::step> resumable_upload::handle_response(response resp) {
    if (_executor.should_retry(resp)) {
        co_return co_await attempt_delayed_retry(resp.status, std::string(resp.body));
    }
    _response_signal(resp);

    if (auto err = request_executor::error_in_body(resp)) {
        co_await coroutine::return_exception(upload_error(*err, resp.status, "", {*err}));
    }
    _executor.rotate_chunk_invocation_id();

    bool more_data = co_await wait_for_next_chunk();
    auto range_end = request_executor::parse_range_end(resp.get_header("Range"));
    if (resp.status == resume_incomplete && range_end && *range_end + 1 < _state.bytes_written) {
        // Part of the last request still has to be replayed
        more_data = true;
    }
    auto kind = request_executor::classify(resp, classify_context{
        .multi_chunk = _cfg.multi_chunk(),
        .more_data = more_data,
        .partial_upload = _cfg.is_partial_upload,
    });

    switch (kind) {
    case response_kind::continue_upload:
        if (!range_end) {
            co_await coroutine::return_exception(protocol_error(fmt::format("Malformed Range header '{}'", resp.get_header("Range").value_or("")), resp.status));
        }
        reconcile(*range_end + 1);
        co_return step::next_chunk;
    case response_kind::partial_complete:
        gcs_log.debug("Partial upload of {} paused at {} bytes", *_state.uri, _state.bytes_written);
        _pending.clear();
        co_return step::done;
    case response_kind::complete:
        complete(resp);
        co_return step::done;
    case response_kind::failed:
        break;
    }
    co_await coroutine::return_exception(upload_error("Upload failed", resp.status, "", {std::string(resp.body)}));
}

void resumable_upload::reconcile(uint64_t server_offset) {
    _state.offset = server_offset;
    if (server_offset < _state.bytes_written) {
        auto missing = _state.bytes_written - server_offset;
        if (missing > _pending.size()) {
            // Only the last request body is kept, older bytes are gone
            throw offset_regression_error(server_offset, _state.bytes_written);
        }
        gcs_log.debug("Server persisted up to {}, replaying {} bytes", server_offset, missing);
        _queue.prepend(_pending.take_last(missing));
        _state.bytes_written -= missing;
    } else {
        _pending.clear();
    }
    _pending_sent = 0;
}

void resumable_upload::complete(const response& resp) {
    _checksums.finalize();
    auto md = parse_object_metadata(std::string_view(resp.body.data(), resp.body.size()));
    if (auto mismatch = _checksums.compare(md.crc32c, md.md5_hash)) {
        throw upload_integrity_error(_state.uri.value_or(""), *mismatch);
    }
    _pending.clear();
    _metadata_signal(md);
}

future<resumable_upload::step> resumable_upload::attempt_delayed_retry(std::optional<http::reply::status_type> status, std::string body) {
    if (!_retry.can_retry()) {
        co_await coroutine::return_exception(retry_limit_exceeded_error(body, status));
    }
    // A vanished session is replaced right away, only resumes back off
    bool restart = status == http::reply::status_type::not_found && _state.chunks_read_in_request == 0;
    std::optional<std::chrono::milliseconds> delay;
    if (!restart) {
        delay = _retry.next_delay();
        if (!delay) {
            co_await coroutine::return_exception(retry_timeout_error(body, status));
        }
    }

    // Nothing of the failed request is known to have arrived
    _state.bytes_written -= _pending_sent;
    _pending_sent = 0;
    _queue.prepend(_pending.take_all());
    _state.offset.reset();
    _retry.record_retry();

    if (restart) {
        gcs_log.warn("Upload of {}/{} restarts with a new session (retry {}/{}): {}", _cfg.bucket, _cfg.object_name,
                     _retry.num_retries(), _retry.retry_limit(), body);
        co_return step::restart;
    }
    gcs_log.warn("Upload of {}/{} resumes after {}ms (retry {}/{}): {}", _cfg.bucket, _cfg.object_name,
                 delay->count(), _retry.num_retries(), _retry.retry_limit(), body);
    co_await sleep_abortable(*delay, _as);
    co_return step::resume;
}

future<> resumable_upload::write_pending(output_stream<char> out) {
    std::exception_ptr ex;
    try {
        for (const auto& buf : _pending.buffers()) {
            account_sent(buf.size());
            co_await out.write(buf.get(), buf.size());
        }
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

future<> resumable_upload::stream_queue(output_stream<char> out, std::optional<uint64_t> limit) {
    std::exception_ptr ex;
    try {
        chunk_iterator it(_queue, limit);
        while (!it.limit_reached()) {
            co_await wait_for_data();
            auto buf = it.next();
            if (buf.empty()) {
                break;
            }
            _checksums.update(_state.bytes_written, buf.get(), buf.size());
            _pending.replace(buf.share());
            _pending_sent = 0;
            account_sent(buf.size());
            _drained_cv.broadcast();
            co_await out.write(buf.get(), buf.size());
        }
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

} // namespace gcs
