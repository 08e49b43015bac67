/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "multipart_upload.hh"

#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/log.hh>

#include "utils/gcs/client.hh"
#include "utils/gcs/errors.hh"
#include "utils/gcs/utils/client_utils.hh"

using namespace seastar;

namespace gcs {

static seastar::logger mpu_log("gcs_multipart");

multipart_upload::multipart_upload(shared_ptr<client> cln, std::string bucket, std::string object_name, abort_source* as)
    : _client(std::move(cln))
    , _bucket(std::move(bucket))
    , _object_name(std::move(object_name))
    , _object_url(_client->object_url(_bucket, _object_name))
    , _as(as)
    , _flush_sem(_client->config().part_concurrency)
{}

bool multipart_upload::upload_started() const noexcept {
    return !_upload_id.empty();
}

future<> multipart_upload::start_upload() {
    mpu_log.trace("POST uploads {}", _object_url);
    auto rep = co_await _client->_retrying.make_request([this] {
        return request::make("POST", _object_url + "?uploads");
    }, http::reply::status_type::ok, _as);
    auto body = rep.body;
    auto upload_id = parse_multipart_upload_id(body);
    if (upload_id.empty()) {
        co_await coroutine::return_exception(protocol_error("cannot initiate upload", rep.status, "", {std::string(rep.body)}));
    }
    mpu_log.trace("created uploads for {} -> id = {}", _object_url, upload_id);
    _upload_id = std::move(upload_id);
}

future<> multipart_upload::upload_part(memory_data_sink_buffers bufs) {
    if (!upload_started()) {
        co_await start_upload();
    }

    auto units = co_await get_units(_flush_sem, 1);
    unsigned part_number = _part_etags.size();
    _part_etags.emplace_back();
    auto url = fmt::format("{}?partNumber={}&uploadId={}", _object_url, part_number + 1, _upload_id);
    mpu_log.trace("PUT part {} {} bytes in {} buffers (upload id {})", part_number, bufs.size(), bufs.buffers().size(), _upload_id);

    // Each attempt re-sends the same bytes
    auto part = make_lw_shared<memory_data_sink_buffers>(std::move(bufs));
    auto make_req = [url = std::move(url), part] {
        auto req = request::make("PUT", url);
        req.content_length = part->size();
        req.writer = [part] (output_stream<char>&& out_) -> future<> {
            auto out = std::move(out_);
            std::exception_ptr ex;
            try {
                for (const auto& buf : part->buffers()) {
                    co_await out.write(buf.get(), buf.size());
                }
                co_await out.flush();
            } catch (...) {
                ex = std::current_exception();
            }
            co_await out.close();
            if (ex) {
                co_await coroutine::return_exception_ptr(std::move(ex));
            }
        };
        return req;
    };

    // upload the parts in the background for better throughput
    auto gh = _bg_flushes.hold();
    // Ignoring the result is safe as all background flushes are waited on with _bg_flushes
    std::ignore = _client->_retrying.make_request(std::move(make_req), http::reply::status_type::ok, _as)
        .then([this, part_number] (response rep) {
            auto etag = rep.get_header("ETag").value_or("");
            if (etag.empty()) {
                return make_exception_future<>(protocol_error(fmt::format("no ETag for part {}", part_number + 1), rep.status));
            }
            mpu_log.trace("uploaded {} part data -> etag = {} (upload id {})", part_number, etag, _upload_id);
            _part_etags[part_number] = std::move(etag);
            return make_ready_future<>();
        }).handle_exception([this, part_number] (auto ex) {
            // At the end the whole upload is aborted, when it sees an empty ETag
            mpu_log.warn("couldn't upload part {}: {} (upload id {})", part_number, ex, _upload_id);
        }).finally([gh = std::move(gh), units = std::move(units)] {});
}

future<> multipart_upload::abort_upload() {
    mpu_log.trace("DELETE upload {}", _upload_id);
    auto url = fmt::format("{}?uploadId={}", _object_url, _upload_id);
    _upload_id = {}; // now upload_started() returns false
    co_await _client->_retrying.make_request([url = std::move(url)] {
        return request::make("DELETE", url);
    }, http::reply::status_type::no_content, nullptr);
}

future<> multipart_upload::finalize_upload() {
    mpu_log.trace("wait for {} parts to complete (upload id {})", _part_etags.size(), _upload_id);
    co_await _bg_flushes.close();

    unsigned parts_xml_len = prepare_multipart_upload_parts(_part_etags);
    if (parts_xml_len == 0) {
        co_await coroutine::return_exception(upload_error(fmt::format("Failed to upload parts of {}. Aborting multipart upload.", _object_name)));
    }

    mpu_log.trace("POST upload completion {} parts (upload id {})", _part_etags.size(), _upload_id);
    auto url = fmt::format("{}?uploadId={}", _object_url, _upload_id);
    auto rep = co_await _client->_retrying.make_request([this, url = std::move(url), parts_xml_len] {
        auto req = request::make("POST", url);
        req.headers["Content-Type"] = "application/xml";
        req.content_length = parts_xml_len;
        req.writer = [this] (output_stream<char>&& out) -> future<> {
            return dump_multipart_upload_parts(std::move(out), _part_etags);
        };
        return req;
    }, http::reply::status_type::ok, _as);

    auto body = rep.body;
    if (auto err = parse_xml_error(body); !err.empty()) {
        co_await coroutine::return_exception(upload_error(fmt::format("Failed to complete multipart upload of {}: {}", _object_name, err),
                                                          rep.status, "", {std::string(rep.body)}));
    }
    _upload_id = {}; // now upload_started() returns false
}

} // namespace gcs
