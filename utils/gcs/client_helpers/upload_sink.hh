/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/coroutine.hh>

#include "upload_sink_base.hh"
#include "utils/gcs/client.hh"

namespace gcs {

// Buffers the stream into parts and uploads them with the XML multipart
// protocol. flush() completes the object.
class multipart_upload_sink final : public upload_sink_base {
    memory_data_sink_buffers _bufs;
    size_t _part_size;

    seastar::future<> maybe_flush() {
        if (_bufs.size() >= _part_size) {
            co_await upload_part(std::exchange(_bufs, {}));
        }
    }

public:
    multipart_upload_sink(seastar::shared_ptr<client> cln, std::string bucket, std::string object_name, seastar::abort_source* as = nullptr)
        : upload_sink_base(cln, std::move(bucket), std::move(object_name), as)
        , _part_size(std::max(cln->config().part_size, minimum_part_size))
    {}

    virtual seastar::future<> put(seastar::temporary_buffer<char> buf) override {
        _bufs.put(std::move(buf));
        return maybe_flush();
    }

    virtual seastar::future<> put(std::vector<seastar::temporary_buffer<char>> data) override {
        for (auto&& buf : data) {
            _bufs.put(std::move(buf));
        }
        return maybe_flush();
    }

    virtual seastar::future<> flush() override {
        if (_bufs.size() != 0) {
            // Objects smaller than a part go in one PUT instead of three
            // requests (create + part + complete)
            if (!upload_started()) {
                co_return co_await _client->put_object(_bucket, _object_name, std::exchange(_bufs, {}), _as);
            }

            co_await upload_part(std::exchange(_bufs, {}));
        }
        if (upload_started()) {
            std::exception_ptr ex;
            try {
                co_await finalize_upload();
            } catch (...) {
                ex = std::current_exception();
            }
            if (ex) {
                co_await abort_upload();
                std::rethrow_exception(ex);
            }
        }
    }
};

} // namespace gcs
