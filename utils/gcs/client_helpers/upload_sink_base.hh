/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/iostream.hh>
#include <seastar/util/backtrace.hh>

#include "multipart_upload.hh"

namespace gcs {

class upload_sink_base : public multipart_upload, public seastar::data_sink_impl {
public:
    upload_sink_base(seastar::shared_ptr<client> cln, std::string bucket, std::string object_name, seastar::abort_source* as)
        : multipart_upload(std::move(cln), std::move(bucket), std::move(object_name), as)
    {
    }

    virtual seastar::future<> put(seastar::net::packet) override {
        seastar::throw_with_backtrace<std::runtime_error>("gcs put(net::packet) unsupported");
    }

    virtual seastar::future<> close() override;

    virtual size_t buffer_size() const noexcept override {
        return 128 * 1024;
    }
};

} // namespace gcs
