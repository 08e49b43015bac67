/*
 * Copyright (C) 2025-present ScyllaDB
 *
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>

#include <boost/signals2/dummy_mutex.hpp>
#include <boost/signals2/signal_type.hpp>

#include "request_executor.hh"
#include "transport.hh"

namespace bs2 = boost::signals2;

namespace gcs {

struct upload_progress {
    uint64_t bytes_written = 0;
    // unset for streams of unknown size
    std::optional<uint64_t> content_length;
};

// Single-threaded signals, all emitted from the upload's own shard
template <typename Signature>
using upload_signal = typename bs2::signal_type<Signature, bs2::keywords::mutex_type<bs2::dummy_mutex>>::type;

using progress_signal_type = upload_signal<void(const upload_progress&)>;
using uri_signal_type = upload_signal<void(const std::string&)>;
using response_signal_type = upload_signal<void(const response&)>;
using metadata_signal_type = upload_signal<void(const object_metadata&)>;
using error_signal_type = upload_signal<void(std::exception_ptr)>;

using upload_connection_type = bs2::scoped_connection;

} // namespace gcs
