/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "client.hh"

#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/log.hh>

#include "client_helpers/resumable_upload_sink.hh"
#include "client_helpers/upload_sink.hh"
#include "errors.hh"
#include "session_manager.hh"
#include "utils/http.hh"

using namespace seastar;

namespace gcs {

static seastar::logger client_log("gcs_client");

client::client(std::unique_ptr<transport> t, client_config cfg, private_tag)
    : _cfg(std::move(cfg))
    , _endpoint(sanitize_endpoint(_cfg.api_endpoint))
    , _transport(std::move(t))
    , _retry_strategy(_cfg.retry)
    , _retrying(*_transport, _retry_strategy)
{}

shared_ptr<client> client::make(std::unique_ptr<transport> t, client_config cfg) {
    return seastar::make_shared<client>(std::move(t), std::move(cfg), private_tag{});
}

future<shared_ptr<client>> client::make(client_config cfg, token_provider tokens) {
    auto creds = co_await utils::http::system_trust_credentials();
    auto t = std::make_unique<http_transport>(std::move(tokens), std::move(creds), cfg.max_connections);
    co_return make(std::move(t), std::move(cfg));
}

std::string client::object_url(std::string_view bucket, std::string_view object_name) const {
    std::string path;
    size_t start = 0;
    // Slashes separate path segments and stay as they are
    while (true) {
        auto slash = object_name.find('/', start);
        path += utils::http::url_encode(object_name.substr(start, slash - start));
        if (slash == std::string_view::npos) {
            break;
        }
        path += '/';
        start = slash + 1;
    }
    return fmt::format("{}/{}/{}", _endpoint, utils::http::url_encode(bucket), path);
}

std::unique_ptr<resumable_upload> client::make_resumable_upload(upload_config cfg, abort_source* as) {
    return std::make_unique<resumable_upload>(*_transport, std::move(cfg), as);
}

data_sink client::make_resumable_upload_sink(upload_config cfg, abort_source* as) {
    return data_sink(std::make_unique<resumable_upload_sink>(make_resumable_upload(std::move(cfg), as)));
}

future<std::string> client::create_session(upload_config cfg, abort_source* as) {
    cfg.validate();
    default_retry_strategy rs(cfg.retry);
    retry_controller retry(rs, cfg.retry.total_timeout);
    request_executor executor(*_transport, cfg, rs);
    session_manager sessions(executor, *_transport, retry);
    co_return co_await sessions.create_session(as);
}

future<response> client::check_upload_status(upload_config cfg, bool retry, abort_source* as) {
    cfg.validate();
    if (!cfg.uri) {
        co_await coroutine::return_exception(configuration_error("Checking the upload status needs a session URI"));
    }
    default_retry_strategy rs(cfg.retry);
    retry_controller retries(rs, cfg.retry.total_timeout);
    request_executor executor(*_transport, cfg, rs);
    session_manager sessions(executor, *_transport, retries);
    co_return co_await sessions.check_upload_status(*cfg.uri, retry, as);
}

data_sink client::make_upload_sink(std::string bucket, std::string object_name, abort_source* as) {
    return data_sink(std::make_unique<multipart_upload_sink>(shared_from_this(), std::move(bucket), std::move(object_name), as));
}

future<> client::put_object(std::string bucket, std::string object_name, memory_data_sink_buffers bufs, abort_source* as) {
    auto url = object_url(bucket, object_name);
    client_log.trace("PUT {} ({} bytes)", url, bufs.size());
    auto body = make_lw_shared<memory_data_sink_buffers>(std::move(bufs));
    co_await _retrying.make_request([url, body] {
        auto req = request::make("PUT", url);
        req.content_length = body->size();
        req.writer = [body] (output_stream<char>&& out_) -> future<> {
            auto out = std::move(out_);
            std::exception_ptr ex;
            try {
                for (const auto& buf : body->buffers()) {
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
    }, http::reply::status_type::ok, as);
}

future<> client::put_object(std::string bucket, std::string object_name, temporary_buffer<char> buf, abort_source* as) {
    memory_data_sink_buffers bufs;
    bufs.put(std::move(buf));
    return put_object(std::move(bucket), std::move(object_name), std::move(bufs), as);
}

future<> client::close() {
    client_log.debug("Closing client for {}", _endpoint);
    co_await _transport->close();
}

} // namespace gcs
