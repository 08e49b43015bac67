/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "request_executor.hh"

#include <charconv>
#include <memory>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>

#include "errors.hh"
#include "utils/hashers.hh"
#include "utils/http.hh"

using namespace seastar;

namespace gcs {

static seastar::logger req_log("gcs_request");

static constexpr std::string_view user_agent = "gcs-upload-cpp/1.0";

static std::string new_invocation_id() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

static std::optional<Json::Value> parse_json(std::string_view body) {
    if (body.empty()) {
        return std::nullopt;
    }
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
        req_log.trace("Response body is not JSON: {}", errs);
        return std::nullopt;
    }
    return root;
}

static std::string to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder wbuilder;
    wbuilder.settings_["indentation"] = "";
    return Json::writeString(wbuilder, value);
}

object_metadata parse_object_metadata(std::string_view body) {
    object_metadata md;
    auto root = parse_json(body);
    if (!root || !root->isObject()) {
        return md;
    }
    const Json::Value& r = *root;
    md.raw = r;
    md.name = r.get("name", "").asString();
    md.bucket = r.get("bucket", "").asString();
    // Int64 properties are encoded as strings by the JSON API
    auto as_int = [] (const Json::Value& v) -> std::optional<int64_t> {
        if (v.isIntegral()) {
            return v.asInt64();
        }
        if (v.isString()) {
            int64_t ret = 0;
            auto s = v.asString();
            auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), ret);
            if (ec == std::errc() && p == s.data() + s.size()) {
                return ret;
            }
        }
        return std::nullopt;
    };
    md.generation = as_int(r["generation"]);
    md.size = as_int(r["size"]).value_or(0);
    md.raw["size"] = Json::UInt64(md.size);
    if (r.isMember("crc32c")) {
        md.crc32c = r["crc32c"].asString();
    }
    if (r.isMember("md5Hash")) {
        md.md5_hash = r["md5Hash"].asString();
    }
    return md;
}

request_executor::request_executor(transport& t, const upload_config& cfg, const retry_strategy& rs)
    : _transport(t)
    , _cfg(cfg)
    , _retry_strategy(rs)
    , _create_invocation_id(new_invocation_id())
    , _chunk_invocation_id(new_invocation_id())
    , _status_invocation_id(new_invocation_id())
{}

std::string request_executor::content_range(const chunk_request_params& p) {
    auto total = p.total ? fmt::format("{}", *p.total) : std::string("*");
    if (!p.length || *p.length == 0) {
        return fmt::format("bytes {}-*/{}", p.offset, total);
    }
    return fmt::format("bytes {}-{}/{}", p.offset, p.offset + *p.length - 1, total);
}

std::optional<uint64_t> request_executor::parse_range_end(const std::optional<std::string>& range) {
    if (!range) {
        return std::nullopt;
    }
    auto dash = range->rfind('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    uint64_t last = 0;
    auto begin = range->data() + dash + 1;
    auto end = range->data() + range->size();
    auto [p, ec] = std::from_chars(begin, end, last);
    if (ec != std::errc() || p != end || begin == end) {
        return std::nullopt;
    }
    return last;
}

std::optional<std::string> request_executor::error_in_body(const response& resp) {
    auto root = parse_json(std::string_view(resp.body.data(), resp.body.size()));
    if (root && root->isObject() && root->isMember("error")) {
        return to_json_string((*root)["error"]);
    }
    return std::nullopt;
}

response_kind request_executor::classify(const response& resp, const classify_context& ctx) {
    if (resp.status == resume_incomplete) {
        if (ctx.multi_chunk && resp.get_header("Range") && ctx.more_data) {
            return response_kind::continue_upload;
        }
        if (ctx.partial_upload && !ctx.more_data) {
            return response_kind::partial_complete;
        }
        return response_kind::failed;
    }
    return resp.is_success() ? response_kind::complete : response_kind::failed;
}

bool request_executor::should_retry(const response& resp) const {
    return resp.status != http::reply::status_type::ok && bool(_retry_strategy.is_retryable(resp.status));
}

std::string request_executor::with_user_project(std::string url) const {
    if (_cfg.user_project) {
        url += url.find('?') == std::string::npos ? '?' : '&';
        url += "userProject=" + utils::http::url_encode(*_cfg.user_project);
    }
    return url;
}

void request_executor::add_common_headers(request& req, const std::string& invocation_id) const {
    req.headers["User-Agent"] = std::string(user_agent);
    auto api_client = fmt::format("gl-cpp/{} gccl/1.0 gccl-invocation-id/{}", __cplusplus, invocation_id);
    if (_cfg.gccl_gcs_cmd) {
        api_client += fmt::format(" gccl-gcs-cmd/{}", *_cfg.gccl_gcs_cmd);
    }
    req.headers["x-goog-api-client"] = std::move(api_client);
    if (_cfg.encryption_key) {
        req.headers["x-goog-encryption-algorithm"] = "AES256";
        req.headers["x-goog-encryption-key"] = utils::base64_encode(*_cfg.encryption_key);
        req.headers["x-goog-encryption-key-sha256"] = utils::base64_encode(utils::sha256_digest(*_cfg.encryption_key));
    }
}

std::string request_executor::session_url() const {
    return fmt::format("{}/upload/storage/v1/b/{}/o", _cfg.sanitized_endpoint(), utils::http::url_encode(_cfg.bucket));
}

request request_executor::make_session_request() const {
    auto metadata = _cfg.metadata;
    auto content_length = _cfg.content_length;
    auto content_type = _cfg.content_type;
    // These travel as headers, not as part of the object resource
    if (metadata.isMember("contentLength")) {
        auto& v = metadata["contentLength"];
        if (!content_length) {
            content_length = v.isString() ? std::stoull(v.asString()) : v.asUInt64();
        }
        metadata.removeMember("contentLength");
    }
    if (metadata.isMember("contentType")) {
        if (!content_type) {
            content_type = metadata["contentType"].asString();
        }
        metadata.removeMember("contentType");
    }

    std::map<std::string, std::string> params = _cfg.params;
    params["name"] = _cfg.object_name;
    params["uploadType"] = "resumable";
    if (_cfg.generation) {
        params["ifGenerationMatch"] = fmt::format("{}", *_cfg.generation);
    }
    if (_cfg.kms_key_name) {
        params["kmsKeyName"] = *_cfg.kms_key_name;
    }
    if (auto acl = _cfg.effective_predefined_acl()) {
        params["predefinedAcl"] = *acl;
    }

    auto req = request::make("POST", with_user_project(fmt::format("{}?{}", session_url(), utils::http::make_query_string(params))));
    add_common_headers(req, _create_invocation_id);
    if (content_length) {
        req.headers["X-Upload-Content-Length"] = fmt::format("{}", *content_length);
    }
    if (content_type) {
        req.headers["X-Upload-Content-Type"] = *content_type;
    }
    if (_cfg.origin) {
        req.headers["Origin"] = *_cfg.origin;
    }
    req.set_body(to_json_string(metadata), "application/json; charset=UTF-8");
    return req;
}

request request_executor::make_status_request(const std::string& uri) const {
    auto req = request::make("PUT", with_user_project(uri));
    add_common_headers(req, _status_invocation_id);
    req.headers["Content-Range"] = "bytes */*";
    req.content_length = 0;
    return req;
}

request request_executor::make_chunk_request(const std::string& uri, const chunk_request_params& p, body_writer writer) const {
    auto req = request::make("PUT", with_user_project(uri));
    add_common_headers(req, _chunk_invocation_id);
    req.headers["Content-Range"] = content_range(p);
    if (p.x_goog_hash) {
        req.headers["X-Goog-Hash"] = *p.x_goog_hash;
    }
    req.content_length = p.length;
    req.writer = std::move(writer);
    return req;
}

future<response> request_executor::execute(request req, abort_source* as) {
    req_log.trace("{} {} range={}", req.method, req.url, req.headers.contains("Content-Range") ? req.headers["Content-Range"] : "-");
    auto resp = co_await _transport.send(std::move(req), as);
    req_log.trace("response {} range={}", resp.status, resp.get_header("Range").value_or("-"));
    co_return resp;
}

void request_executor::rotate_create_invocation_id() {
    _create_invocation_id = new_invocation_id();
}

void request_executor::rotate_chunk_invocation_id() {
    _chunk_invocation_id = new_invocation_id();
}

void request_executor::rotate_status_invocation_id() {
    _status_invocation_id = new_invocation_id();
}

} // namespace gcs
