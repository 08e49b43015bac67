/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <seastar/core/abort_source.hh>
#include <seastar/core/condition-variable.hh>
#include <seastar/core/future.hh>
#include <seastar/util/optimized_optional.hh>

#include "byte_queue.hh"
#include "checksum_validator.hh"
#include "request_executor.hh"
#include "retry_controller.hh"
#include "session_manager.hh"
#include "upload_config.hh"
#include "upload_events.hh"

namespace gcs {

// Client view of the session being uploaded to
struct upload_session {
    std::optional<std::string> uri;
    // Bytes the server confirmed. Unset when it has to be asked for.
    std::optional<uint64_t> offset;
    // Bytes handed to requests so far, minus those rewound for replay
    uint64_t bytes_written = 0;
    // Buffers pulled into the body of the request in flight
    uint32_t chunks_read_in_request = 0;
};

// Streams one object through a resumable upload session.
//
// The producer appends data with write() and ends the stream with finish().
// A single upload loop, started by the first write or by finish(), turns the
// queued data into chunk requests, one at a time and in offset order. The
// loop and the producer only meet at two waits: the loop waiting for data
// (or the end of stream) and the producer waiting for the queue to drain
// below the high-water mark. abort() breaks both and cancels the request in
// flight.
//
// close() must be called before destruction.
class resumable_upload {
    enum class step {
        done,
        // offset known, send the next chunk
        next_chunk,
        // offset unknown, ask the server first
        resume,
        // create a new session
        restart,
    };

    upload_config _cfg;
    std::unique_ptr<retry_strategy> _retry_strategy;
    retry_controller _retry;
    request_executor _executor;
    session_manager _sessions;
    checksum_validator _checksums;

    byte_queue _queue;
    pending_chunk _pending;
    // Bytes of _pending already counted in bytes_written
    uint64_t _pending_sent = 0;
    upload_session _state;

    bool _upstream_finished = false;
    bool _started = false;
    bool _done = false;
    std::exception_ptr _error;

    seastar::abort_source _as;
    seastar::optimized_optional<seastar::abort_source::subscription> _external_abort;
    seastar::condition_variable _data_cv;
    seastar::condition_variable _drained_cv;
    seastar::condition_variable _completion_cv;
    seastar::future<> _loop = seastar::make_ready_future<>();

    progress_signal_type _progress_signal;
    uri_signal_type _uri_signal;
    response_signal_type _response_signal;
    metadata_signal_type _metadata_signal;
    error_signal_type _error_signal;

    void ensure_started();
    seastar::future<> run();
    seastar::future<> do_upload();
    seastar::future<step> upload_chunk();
    seastar::future<step> handle_response(response resp);
    seastar::future<step> attempt_delayed_retry(std::optional<seastar::http::reply::status_type> status, std::string body);
    seastar::future<> fast_forward(uint64_t bytes);
    void reconcile(uint64_t server_offset);
    void complete(const response& resp);

    seastar::future<> wait_for_data();
    seastar::future<bool> wait_for_next_chunk();
    void account_sent(size_t bytes);

    seastar::future<> write_pending(seastar::output_stream<char> out);
    seastar::future<> stream_queue(seastar::output_stream<char> out, std::optional<uint64_t> limit);

    void set_session(std::string uri);
    void finish_successfully();
    void fail(std::exception_ptr ex);
public:
    // Throws configuration_error synchronously on invalid options. A null
    // retry strategy selects the default one built from cfg.retry.
    resumable_upload(transport& t, upload_config cfg, seastar::abort_source* as = nullptr,
                     std::unique_ptr<retry_strategy> rs = nullptr);
    ~resumable_upload();

    resumable_upload(const resumable_upload&) = delete;
    resumable_upload& operator=(const resumable_upload&) = delete;

    // Queues buf. Resolves right away unless the queue reached the
    // high-water mark, in which case it resolves once the loop drains it.
    seastar::future<> write(buffer buf);

    // Signals the end of stream and resolves when the upload completed, or
    // fails with the terminal error
    seastar::future<> finish();

    // Tears the upload down: cancels the request in flight and any scheduled
    // retry. The first terminal error wins, later calls are no-ops.
    void abort(std::exception_ptr ex = {});

    // Aborts an unfinished upload and waits for the loop to stop
    seastar::future<> close();

    // Creates a session without sending data and returns its URI
    seastar::future<std::string> create_uri();

    // Asks the server for the state of the session. Needs a session URI.
    seastar::future<response> check_upload_status(bool retry = true);

    const upload_session& session() const noexcept { return _state; }
    const upload_config& config() const noexcept { return _cfg; }
    uint32_t num_retries() const noexcept { return _retry.num_retries(); }
    uint32_t retry_limit() const { return _retry.retry_limit(); }
    size_t queued_bytes() const noexcept { return _queue.size(); }
    bool done() const noexcept { return _done; }
    const checksum_validator& checksums() const noexcept { return _checksums; }

    upload_connection_type on_progress(progress_signal_type::slot_type slot) { return _progress_signal.connect(std::move(slot)); }
    upload_connection_type on_uri(uri_signal_type::slot_type slot) { return _uri_signal.connect(std::move(slot)); }
    upload_connection_type on_response(response_signal_type::slot_type slot) { return _response_signal.connect(std::move(slot)); }
    upload_connection_type on_metadata(metadata_signal_type::slot_type slot) { return _metadata_signal.connect(std::move(slot)); }
    upload_connection_type on_error(error_signal_type::slot_type slot) { return _error_signal.connect(std::move(slot)); }
};

} // namespace gcs
