/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <deque>
#include <optional>
#include <vector>

#include <seastar/core/temporary_buffer.hh>

namespace gcs {

using buffer = seastar::temporary_buffer<char>;
using buffer_list = std::vector<buffer>;

// Bytes received from the producer and not yet handed to a request. Data is
// appended at the tail, consumed from the head, and unconfirmed data can be
// put back at the head. Splitting a head buffer never reorders bytes.
class byte_queue {
    std::deque<buffer> _bufs;
    size_t _size = 0;
public:
    size_t size() const noexcept { return _size; }
    bool empty() const noexcept { return _size == 0; }
    size_t buffer_count() const noexcept { return _bufs.size(); }

    // Empty buffers are dropped
    void push_back(buffer buf);

    // Puts bufs in front of the current head, keeping their order
    void prepend(buffer_list bufs);

    // Removes up to limit bytes from the head. Returns less only when the
    // queue runs out.
    buffer_list pull(size_t limit);
    buffer_list pull_all();

    // Removes the head buffer, or its first limit bytes
    buffer pop_front(size_t limit);

    // Drops up to n bytes from the head, returns how many were dropped
    size_t discard(size_t n);
};

// Slices the queue into request body pieces. Bounded iterators stop after
// the limit, unbounded ones drain whatever is there. next() never waits: an
// empty result means either the limit is reached or the queue is empty.
class chunk_iterator {
    byte_queue& _queue;
    std::optional<size_t> _remaining;
public:
    chunk_iterator(byte_queue& queue, std::optional<size_t> limit);

    buffer next();

    bool limit_reached() const noexcept { return _remaining && *_remaining == 0; }
    const std::optional<size_t>& remaining() const noexcept { return _remaining; }
};

// The most recent request body that the server has not confirmed yet
class pending_chunk {
    buffer_list _bufs;
    size_t _size = 0;
public:
    size_t size() const noexcept { return _size; }
    bool empty() const noexcept { return _bufs.empty(); }
    const buffer_list& buffers() const noexcept { return _bufs; }

    void append(buffer buf);
    // Keeps only buf, for requests whose body is streamed as it arrives
    void replace(buffer buf);

    // Empties the chunk, returning its last n bytes (all of them when n
    // exceeds the size) in order
    buffer_list take_last(size_t n);
    buffer_list take_all();

    void clear() noexcept;
};

} // namespace gcs
