/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include <seastar/core/lowres_clock.hh>

#include "retry_strategy.hh"

namespace gcs {

// Retry bookkeeping of one upload. The counter only grows and is never reset
// for the lifetime of the upload.
class retry_controller {
public:
    using clock = seastar::lowres_clock;
private:
    const retry_strategy& _strategy;
    std::chrono::milliseconds _total_timeout;
    clock::time_point _first_request;
    uint32_t _num_retries = 0;
public:
    retry_controller(const retry_strategy& strategy, std::chrono::milliseconds total_timeout);

    const retry_strategy& strategy() const noexcept { return _strategy; }

    uint32_t num_retries() const noexcept { return _num_retries; }
    uint32_t retry_limit() const { return _strategy.get_max_retries(); }

    bool can_retry() const { return _num_retries < retry_limit(); }

    // Backoff for the next attempt, shortened so the whole upload stays within
    // the total timeout. Unset when no time is left.
    std::optional<std::chrono::milliseconds> next_delay() const;
    // Same for a call that counts its own attempts
    std::optional<std::chrono::milliseconds> delay_after(uint32_t attempted_retries) const;

    // Accounts one scheduled retry
    void record_retry() noexcept { ++_num_retries; }

    std::chrono::milliseconds elapsed() const;
};

} // namespace gcs
