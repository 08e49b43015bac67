/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <random>

#include <seastar/http/reply.hh>

#include "utils/http_client_error_processing.hh"
#include "upload_config.hh"

namespace gcs {

using retryable = utils::http::retryable;

class retry_strategy {
public:
    virtual ~retry_strategy() = default;

    // Whether a response with this status is worth re-sending
    [[nodiscard]] virtual retryable is_retryable(seastar::http::reply::status_type status) const = 0;

    // Whether a failure to obtain any response is worth re-sending
    [[nodiscard]] virtual retryable is_retryable(std::exception_ptr error) const = 0;

    // Time to wait before the next attempt given the number of retries already made
    [[nodiscard]] virtual std::chrono::milliseconds delay_before_retry(uint32_t attempted_retries) const = 0;

    [[nodiscard]] virtual uint32_t get_max_retries() const = 0;
};

// Exponential backoff: multiplier^attempted * unit plus uniform jitter in
// [0, max_jitter), capped at max_retry_delay
class default_retry_strategy : public retry_strategy {
    uint32_t _max_retries;
    double _multiplier;
    std::chrono::milliseconds _unit;
    std::chrono::milliseconds _max_jitter;
    std::chrono::milliseconds _max_retry_delay;
    mutable std::default_random_engine _rng{std::random_device{}()};

public:
    explicit default_retry_strategy(const retry_options& opts = {});

    [[nodiscard]] retryable is_retryable(seastar::http::reply::status_type status) const override;

    [[nodiscard]] retryable is_retryable(std::exception_ptr error) const override;

    [[nodiscard]] std::chrono::milliseconds delay_before_retry(uint32_t attempted_retries) const override;

    [[nodiscard]] uint32_t get_max_retries() const override { return _max_retries; }
};

} // namespace gcs
