/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "byte_queue.hh"

#include <algorithm>
#include <iterator>
#include <limits>

namespace gcs {

void byte_queue::push_back(buffer buf) {
    if (buf.empty()) {
        return;
    }
    _size += buf.size();
    _bufs.emplace_back(std::move(buf));
}

void byte_queue::prepend(buffer_list bufs) {
    for (auto it = bufs.rbegin(); it != bufs.rend(); ++it) {
        if (it->empty()) {
            continue;
        }
        _size += it->size();
        _bufs.emplace_front(std::move(*it));
    }
}

buffer byte_queue::pop_front(size_t limit) {
    if (_bufs.empty() || limit == 0) {
        return buffer();
    }
    auto& head = _bufs.front();
    buffer ret;
    if (head.size() <= limit) {
        ret = std::move(head);
        _bufs.pop_front();
    } else {
        ret = head.share(0, limit);
        head.trim_front(limit);
    }
    _size -= ret.size();
    return ret;
}

buffer_list byte_queue::pull(size_t limit) {
    buffer_list ret;
    while (limit > 0 && !_bufs.empty()) {
        auto buf = pop_front(limit);
        limit -= buf.size();
        ret.emplace_back(std::move(buf));
    }
    return ret;
}

buffer_list byte_queue::pull_all() {
    buffer_list ret;
    ret.reserve(_bufs.size());
    std::move(_bufs.begin(), _bufs.end(), std::back_inserter(ret));
    _bufs.clear();
    _size = 0;
    return ret;
}

size_t byte_queue::discard(size_t n) {
    size_t dropped = 0;
    while (dropped < n && !_bufs.empty()) {
        dropped += pop_front(n - dropped).size();
    }
    return dropped;
}

chunk_iterator::chunk_iterator(byte_queue& queue, std::optional<size_t> limit)
    : _queue(queue)
    , _remaining(limit)
{}

buffer chunk_iterator::next() {
    auto buf = _queue.pop_front(_remaining.value_or(std::numeric_limits<size_t>::max()));
    if (_remaining) {
        *_remaining -= buf.size();
    }
    return buf;
}

void pending_chunk::append(buffer buf) {
    _size += buf.size();
    _bufs.emplace_back(std::move(buf));
}

void pending_chunk::replace(buffer buf) {
    clear();
    append(std::move(buf));
}

buffer_list pending_chunk::take_last(size_t n) {
    buffer_list ret;
    size_t kept = 0;
    while (kept < n && !_bufs.empty()) {
        auto buf = std::move(_bufs.back());
        _bufs.pop_back();
        if (kept + buf.size() > n) {
            buf.trim_front(kept + buf.size() - n);
        }
        kept += buf.size();
        ret.emplace_back(std::move(buf));
    }
    std::reverse(ret.begin(), ret.end());
    clear();
    return ret;
}

buffer_list pending_chunk::take_all() {
    auto ret = std::move(_bufs);
    clear();
    return ret;
}

void pending_chunk::clear() noexcept {
    _bufs.clear();
    _size = 0;
}

} // namespace gcs
