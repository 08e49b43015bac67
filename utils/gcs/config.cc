/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <string>
#include <yaml-cpp/yaml.h>

#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>
#include <fmt/format.h>

#include "upload_config.hh"
#include "errors.hh"

using namespace std::string_literals;

namespace gcs {

void upload_config::validate() const {
    if (bucket.empty() || object_name.empty()) {
        throw configuration_error("A bucket and file name are required");
    }
    if (offset && !uri) {
        throw configuration_error("Cannot provide an `offset` without providing a `uri`");
    }
    if (is_partial_upload && !chunk_size) {
        throw configuration_error("Cannot set `isPartialUpload` without providing a `chunkSize`");
    }
    if (chunk_size && (*chunk_size == 0 || *chunk_size % chunk_size_granularity != 0)) {
        throw configuration_error(fmt::format("Chunk size {} is not a positive multiple of {}", *chunk_size, chunk_size_granularity));
    }
    if (high_water_mark == 0) {
        throw configuration_error("High water mark must be positive");
    }
    if (retry.retry_delay_multiplier < 1.0) {
        throw configuration_error(fmt::format("Retry delay multiplier {} is less than 1", retry.retry_delay_multiplier));
    }
    if (!metadata.isObject()) {
        throw configuration_error("Object metadata must be a JSON object");
    }
}

std::optional<std::string> upload_config::effective_predefined_acl() const {
    if (make_public) {
        return "publicRead"s;
    }
    if (make_private) {
        return "private"s;
    }
    return predefined_acl;
}

std::string upload_config::sanitized_endpoint() const {
    return sanitize_endpoint(api_endpoint);
}

std::string sanitize_endpoint(std::string_view endpoint) {
    static const boost::regex protocol(R"(^\w+://)");
    std::string url(endpoint);
    if (!boost::regex_search(url, protocol)) {
        url = "https://" + url;
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

upload_config decode_upload_options(const YAML::Node& node, upload_config base) {
    auto get_opt = [](const YAML::Node& node, const std::string& key, auto def) {
        auto tmp = node[key];
        return tmp ? tmp.template as<std::decay_t<decltype(def)>>() : def;
    };

    auto type = node["type"];
    if (type && type.as<std::string>() != "gs") {
        throw std::invalid_argument(fmt::format("Could not decode GCS upload options: {}", boost::lexical_cast<std::string>(node)));
    }
    base.api_endpoint = get_opt(node, "name", base.api_endpoint);

    auto upload = node["upload"];
    if (!upload) {
        return base;
    }
    if (auto chunk_size = upload["chunk_size"]) {
        base.chunk_size = chunk_size.as<size_t>();
    }
    base.high_water_mark = get_opt(upload, "high_water_mark", base.high_water_mark);
    base.crc32c = get_opt(upload, "crc32c", base.crc32c);
    base.md5 = get_opt(upload, "md5", base.md5);
    if (auto user_project = upload["user_project"]) {
        base.user_project = user_project.as<std::string>();
    }

    if (auto retry = upload["retry"]) {
        auto& r = base.retry;
        r.auto_retry = get_opt(retry, "auto_retry", r.auto_retry);
        r.max_retries = get_opt(retry, "max_retries", r.max_retries);
        r.retry_delay_multiplier = get_opt(retry, "retry_delay_multiplier", r.retry_delay_multiplier);
        r.total_timeout = std::chrono::milliseconds(get_opt(retry, "total_timeout_ms", int64_t(r.total_timeout.count())));
        r.max_retry_delay = std::chrono::milliseconds(get_opt(retry, "max_retry_delay_ms", int64_t(r.max_retry_delay.count())));
    }
    return base;
}

} // namespace gcs
