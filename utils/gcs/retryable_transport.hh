/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>

#include <seastar/util/noncopyable_function.hh>

#include "retry_strategy.hh"
#include "transport.hh"

namespace gcs {

// Builds a fresh copy of a request for each attempt, body writers are single-use
using request_factory = seastar::noncopyable_function<request()>;

// Re-sends requests that failed with a retryable status or error, waiting
// between attempts as the strategy says. Used for the self-contained calls
// (session creation, multipart parts), not for resumable chunks whose
// bytes have to be reconciled first.
class retryable_transport {
    transport& _transport;
    const retry_strategy& _retry_strategy;

    seastar::future<response> do_retryable_request(request_factory make, seastar::abort_source* as);
public:
    retryable_transport(transport& t, const retry_strategy& retry_strategy);

    // Resolves with the first response that has the expected status (any 2xx
    // when unset). Other responses raise upload_error carrying the status
    // and body; exhausting the retries raises retry_limit_exceeded_error.
    seastar::future<response> make_request(request_factory make,
                                           std::optional<seastar::http::reply::status_type> expected = std::nullopt,
                                           seastar::abort_source* as = nullptr);

    transport& underlying() noexcept { return _transport; }
};

} // namespace gcs
