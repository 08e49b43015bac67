/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "retry_strategy.hh"

#include <algorithm>
#include <cmath>

using namespace std::chrono_literals;

namespace gcs {

default_retry_strategy::default_retry_strategy(const retry_options& opts)
    : _max_retries(opts.effective_max_retries())
    , _multiplier(opts.retry_delay_multiplier)
    , _unit(opts.delay_unit)
    , _max_jitter(opts.max_jitter)
    , _max_retry_delay(opts.max_retry_delay) {
}

retryable default_retry_strategy::is_retryable(seastar::http::reply::status_type status) const {
    return utils::http::from_http_code(status);
}

retryable default_retry_strategy::is_retryable(std::exception_ptr error) const {
    return utils::http::from_exception(std::move(error));
}

std::chrono::milliseconds default_retry_strategy::delay_before_retry(uint32_t attempted_retries) const {
    auto base = std::pow(_multiplier, attempted_retries) * _unit.count();
    auto jitter = 0ms;
    if (_max_jitter > 0ms) {
        std::uniform_int_distribution<int64_t> dist(0, _max_jitter.count() - 1);
        jitter = std::chrono::milliseconds(dist(_rng));
    }
    auto delay = std::chrono::milliseconds(static_cast<int64_t>(std::min(base, double(_max_retry_delay.count())))) + jitter;
    return std::min(delay, _max_retry_delay);
}

} // namespace gcs
