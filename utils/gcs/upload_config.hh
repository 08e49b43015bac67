/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

namespace YAML {
class Node;
}

namespace gcs {

using namespace std::chrono_literals;

inline constexpr std::string_view default_api_endpoint = "https://storage.googleapis.com";

// Every chunk but the last one must be a multiple of this
inline constexpr size_t chunk_size_granularity = 256 * 1024;

struct retry_options {
    // false forces max_retries to 0
    bool auto_retry = true;
    unsigned max_retries = 3;
    double retry_delay_multiplier = 2.0;
    std::chrono::milliseconds total_timeout = 600s;
    std::chrono::milliseconds max_retry_delay = 64s;
    // delay = multiplier^retries * delay_unit + random[0, max_jitter)
    std::chrono::milliseconds delay_unit = 1000ms;
    std::chrono::milliseconds max_jitter = 1000ms;

    unsigned effective_max_retries() const noexcept {
        return auto_retry ? max_retries : 0;
    }
};

struct upload_config {
    std::string api_endpoint{default_api_endpoint};
    std::string bucket;
    std::string object_name;

    // Zero is a valid precondition ("object must not exist")
    std::optional<int64_t> generation;

    // Resume an existing session instead of creating one
    std::optional<std::string> uri;
    // Bytes already persisted by a previous attempt. Requires uri.
    std::optional<uint64_t> offset;

    std::optional<uint64_t> content_length;
    std::optional<std::string> content_type;

    // Unset means the whole body goes in a single request
    std::optional<size_t> chunk_size;
    // A terminal 308 with nothing left to send completes the stream
    bool is_partial_upload = false;

    // Producer writes wait once this many bytes are queued
    size_t high_water_mark = 16 * 1024;

    // Object resource body sent on session creation
    Json::Value metadata{Json::objectValue};

    std::optional<std::string> kms_key_name;
    std::optional<std::string> predefined_acl;
    bool make_private = false;
    bool make_public = false;
    std::optional<std::string> user_project;
    std::optional<std::string> origin;
    std::map<std::string, std::string> params;

    // Raw customer-supplied AES-256 key
    std::optional<std::string> encryption_key;

    bool crc32c = false;
    bool md5 = false;
    // Base64 values computed by the caller. Disable computing the respective algorithm.
    std::optional<std::string> client_crc32c;
    std::optional<std::string> client_md5_hash;

    std::optional<std::string> gccl_gcs_cmd;

    retry_options retry;

    // Throws configuration_error when the combination of options is invalid
    void validate() const;

    bool multi_chunk() const noexcept {
        return chunk_size.has_value();
    }

    std::optional<std::string> effective_predefined_acl() const;

    // Scheme defaulted to https, trailing slashes removed
    std::string sanitized_endpoint() const;
};

std::string sanitize_endpoint(std::string_view endpoint);

// Reads a GCS object storage endpoint entry, e.g.
//
//   - name: https://storage.googleapis.com
//     type: gs
//     upload:
//       chunk_size: 8388608
//       high_water_mark: 65536
//       crc32c: true
//       retry:
//         max_retries: 5
//         total_timeout_ms: 600000
//
// Absent keys keep the values of `base`. Throws std::invalid_argument for
// entries of another storage type.
upload_config decode_upload_options(const YAML::Node& node, upload_config base = {});

} // namespace gcs
