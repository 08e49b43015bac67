/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "upload_sink_base.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>

using namespace seastar;

namespace gcs {

static seastar::logger sink_log("gcs_sink");

future<> upload_sink_base::close() {
    if (upload_started()) {
        sink_log.warn("closing incomplete multipart upload of {} -> aborting", _object_name);
        // Background parts may still be handling their responses and need
        // 'this' alive. finalize_upload() may have closed the gate already.
        if (!_bg_flushes.is_closed()) {
            co_await _bg_flushes.close();
        }
        co_await abort_upload();
    } else {
        sink_log.trace("closing multipart upload of {}", _object_name);
    }
}

} // namespace gcs
