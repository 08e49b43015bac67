/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <string>

#include <json/json.h>

#include "retry_strategy.hh"
#include "transport.hh"
#include "upload_config.hh"

namespace gcs {

// Final object resource returned by a completed upload
struct object_metadata {
    Json::Value raw;
    std::string name;
    std::string bucket;
    std::optional<int64_t> generation;
    uint64_t size = 0;
    std::optional<std::string> crc32c;
    std::optional<std::string> md5_hash;
};

object_metadata parse_object_metadata(std::string_view body);

// Describes one chunk PUT against the session URI
struct chunk_request_params {
    // First byte of the body in the object
    uint64_t offset = 0;
    // Body size, unset when the body is streamed until the producer ends
    std::optional<uint64_t> length;
    // Object size, unset while still unknown
    std::optional<uint64_t> total;
    std::optional<std::string> x_goog_hash;
};

enum class response_kind {
    // 2xx, the object is complete
    complete,
    // 308 with a Range header and more data to send
    continue_upload,
    // 308 ending a deliberate partial upload
    partial_complete,
    // anything else
    failed,
};

struct classify_context {
    bool multi_chunk = false;
    bool more_data = false;
    bool partial_upload = false;
};

// Builds the protocol requests of a resumable session and classifies the
// responses. Owns the per-call invocation ids reported to the service.
class request_executor {
    transport& _transport;
    const upload_config& _cfg;
    const retry_strategy& _retry_strategy;
    std::string _create_invocation_id;
    std::string _chunk_invocation_id;
    std::string _status_invocation_id;

    void add_common_headers(request& req, const std::string& invocation_id) const;
    std::string with_user_project(std::string url) const;
public:
    request_executor(transport& t, const upload_config& cfg, const retry_strategy& rs);

    static std::string content_range(const chunk_request_params& p);

    // "bytes=0-N" -> N. Unset for a missing or malformed header.
    static std::optional<uint64_t> parse_range_end(const std::optional<std::string>& range);

    // Server-side failures reported with a success status, as {"error": ...}
    static std::optional<std::string> error_in_body(const response& resp);

    static response_kind classify(const response& resp, const classify_context& ctx);

    request make_session_request() const;
    request make_status_request(const std::string& uri) const;
    request make_chunk_request(const std::string& uri, const chunk_request_params& p, body_writer writer) const;

    // Non-200 responses whose status the retry strategy accepts
    bool should_retry(const response& resp) const;

    seastar::future<response> execute(request req, seastar::abort_source* as);

    // A new id is taken once a call of the given kind succeeded
    void rotate_create_invocation_id();
    void rotate_chunk_invocation_id();
    void rotate_status_invocation_id();

    // POST target creating sessions for the configured bucket
    std::string session_url() const;
};

} // namespace gcs
