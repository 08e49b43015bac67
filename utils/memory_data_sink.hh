/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <algorithm>
#include <vector>

#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/util/backtrace.hh>

class memory_data_sink_buffers {
    std::vector<seastar::temporary_buffer<char>> _bufs;
    size_t _size = 0;
public:
    size_t size() const noexcept { return _size; }
    std::vector<seastar::temporary_buffer<char>>& buffers() noexcept { return _bufs; }
    const std::vector<seastar::temporary_buffer<char>>& buffers() const noexcept { return _bufs; }

    void put(seastar::temporary_buffer<char>&& buf) {
        _size += buf.size();
        _bufs.emplace_back(std::move(buf));
    }

    void clear() noexcept {
        _bufs.clear();
        _size = 0;
    }

    // Copies the content into one contiguous string
    seastar::sstring linearize() const {
        seastar::sstring ret(seastar::sstring::initialized_later(), _size);
        size_t off = 0;
        for (const auto& buf : _bufs) {
            std::copy_n(buf.get(), buf.size(), ret.data() + off);
            off += buf.size();
        }
        return ret;
    }
};

class memory_data_sink : public seastar::data_sink_impl {
    memory_data_sink_buffers& _bufs;
public:
    explicit memory_data_sink(memory_data_sink_buffers& b) : _bufs(b) {}

    virtual seastar::future<> put(seastar::net::packet data) override {
        return put(data.release());
    }
    virtual seastar::future<> put(std::vector<seastar::temporary_buffer<char>> data) override {
        for (auto&& buf : data) {
            if (buf.size()) {
                _bufs.put(std::move(buf));
            }
        }
        return seastar::make_ready_future<>();
    }
    virtual seastar::future<> put(seastar::temporary_buffer<char> buf) override {
        if (buf.size()) {
            _bufs.put(std::move(buf));
        }
        return seastar::make_ready_future<>();
    }
    virtual seastar::future<> flush() override {
        return seastar::make_ready_future<>();
    }
    virtual seastar::future<> close() override {
        return seastar::make_ready_future<>();
    }
    virtual size_t buffer_size() const noexcept override {
        return 128 * 1024;
    }
};
