/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "retry_controller.hh"

#include <algorithm>

using namespace std::chrono_literals;

namespace gcs {

retry_controller::retry_controller(const retry_strategy& strategy, std::chrono::milliseconds total_timeout)
    : _strategy(strategy)
    , _total_timeout(total_timeout)
    , _first_request(clock::now()) {
}

std::chrono::milliseconds retry_controller::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - _first_request);
}

std::optional<std::chrono::milliseconds> retry_controller::next_delay() const {
    return delay_after(_num_retries);
}

std::optional<std::chrono::milliseconds> retry_controller::delay_after(uint32_t attempted_retries) const {
    auto remaining = _total_timeout - elapsed();
    if (remaining <= 0ms) {
        return std::nullopt;
    }
    return std::min(_strategy.delay_before_retry(attempted_retries), remaining);
}

} // namespace gcs
