/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>

#include <seastar/core/coroutine.hh>
#include <seastar/core/iostream.hh>
#include <seastar/util/backtrace.hh>

#include "utils/gcs/resumable_upload.hh"

namespace gcs {

// Producer side of a resumable upload. flush() is the end of stream and
// resolves once the object is complete, close() of an unfinished upload
// aborts it.
class resumable_upload_sink final : public seastar::data_sink_impl {
    std::unique_ptr<resumable_upload> _upload;
public:
    explicit resumable_upload_sink(std::unique_ptr<resumable_upload> upload)
        : _upload(std::move(upload))
    {}

    virtual seastar::future<> put(seastar::net::packet) override {
        seastar::throw_with_backtrace<std::runtime_error>("gcs put(net::packet) unsupported");
    }

    virtual seastar::future<> put(seastar::temporary_buffer<char> buf) override {
        return _upload->write(std::move(buf));
    }

    virtual seastar::future<> put(std::vector<seastar::temporary_buffer<char>> data) override {
        for (auto&& buf : data) {
            co_await _upload->write(std::move(buf));
        }
    }

    virtual seastar::future<> flush() override {
        return _upload->finish();
    }

    virtual seastar::future<> close() override {
        return _upload->close();
    }

    virtual size_t buffer_size() const noexcept override {
        return 128 * 1024;
    }

    resumable_upload& upload() noexcept { return *_upload; }
};

} // namespace gcs
