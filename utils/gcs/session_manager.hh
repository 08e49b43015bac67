/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string>

#include "request_executor.hh"
#include "retry_controller.hh"
#include "retryable_transport.hh"

namespace gcs {

// Allocates resumable sessions and asks the service how much of a session
// it has persisted
class session_manager {
    request_executor& _executor;
    retryable_transport _retrying;
    retry_controller& _retry;

    seastar::future<response> do_check_upload_status(const std::string& uri, seastar::abort_source* as);
public:
    session_manager(request_executor& executor, transport& t, retry_controller& retry);

    // Issues the initiating POST, retrying transient failures. Resolves with
    // the session URI from the Location header.
    seastar::future<std::string> create_session(seastar::abort_source* as);

    // Zero-length PUT with "Content-Range: bytes */*". Responses other than
    // 2xx and 308 raise upload_error. With retry set, retryable failures are
    // re-sent with exponential backoff, at most max_retries times and within
    // the total timeout.
    seastar::future<response> check_upload_status(const std::string& uri, bool retry, seastar::abort_source* as);

    // Server offset of the session: last byte of the Range header of a 308
    // plus one, zero otherwise
    seastar::future<uint64_t> probe_offset(const std::string& uri, seastar::abort_source* as);
};

} // namespace gcs
