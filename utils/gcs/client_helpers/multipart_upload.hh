/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string>
#include <vector>

#include <seastar/core/abort_source.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>

#include "utils/memory_data_sink.hh"

namespace gcs {

class client;

// XML API multipart upload of one object. Parts are uploaded in the
// background, at most part_concurrency of them at a time.
class multipart_upload {
protected:
    seastar::shared_ptr<client> _client;
    std::string _bucket;
    std::string _object_name;
    std::string _object_url;
    seastar::abort_source* _as;
    std::string _upload_id;
    // Indexed by part number - 1, empty for parts still in flight or failed
    std::vector<std::string> _part_etags;
    seastar::gate _bg_flushes;
    seastar::semaphore _flush_sem;

    seastar::future<> start_upload();
    seastar::future<> upload_part(memory_data_sink_buffers bufs);
    // Waits for the parts in flight and completes the object. Fails when
    // some part has no ETag.
    seastar::future<> finalize_upload();
    seastar::future<> abort_upload();
    bool upload_started() const noexcept;

    multipart_upload(seastar::shared_ptr<client> cln, std::string bucket, std::string object_name, seastar::abort_source* as);
public:
    unsigned parts_count() const noexcept { return _part_etags.size(); }
    const std::string& upload_id() const noexcept { return _upload_id; }
};

} // namespace gcs
