/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http_transport.hh"

#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/request.hh>
#include <seastar/util/short_streams.hh>

#include "utils/http.hh"

using namespace seastar;

namespace gcs {

static seastar::logger gcs_http_log("gcs_http");

struct http_transport::endpoint_client {
    std::string host;
    http::experimental::client http;

    endpoint_client(const utils::http::url_info& url, shared_ptr<tls::certificate_credentials> creds, unsigned max_connections)
        : host(url.host)
        , http(std::make_unique<utils::http::dns_connection_factory>(url.host, url.port, url.is_https(), gcs_http_log, std::move(creds)),
               max_connections, http::experimental::client::retry_requests::no)
    {}
};

http_transport::http_transport(token_provider tokens, shared_ptr<tls::certificate_credentials> creds, unsigned max_connections)
    : _tokens(std::move(tokens))
    , _creds(std::move(creds))
    , _max_connections(max_connections)
{}

http_transport::~http_transport() = default;

http_transport::endpoint_client& http_transport::client_for(const std::string& url) {
    auto info = utils::http::parse_simple_url(url);
    auto key = fmt::format("{}://{}:{}", info.scheme, info.host, info.port);
    auto it = _clients.find(key);
    if (it == _clients.end()) {
        gcs_http_log.debug("New connection pool for {}", key);
        it = _clients.emplace(key, std::make_unique<endpoint_client>(info, _creds, _max_connections)).first;
    }
    return *it->second;
}

future<response> http_transport::send(request req, abort_source* as) {
    // The HTTP client does not check the abort source on entry
    if (as && as->abort_requested()) {
        co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
    }

    auto& cln = client_for(req.url);
    auto target = utils::http::parse_simple_url(req.url).path;
    if (target.empty()) {
        target = "/";
    }

    auto hreq = http::request::make(req.method, cln.host, target);
    if (req.writer) {
        if (req.content_length) {
            hreq.write_body("bin", *req.content_length, std::move(req.writer));
        } else {
            hreq.write_body("bin", std::move(req.writer));
        }
    } else if (req.method == "PUT" || req.method == "POST") {
        hreq.write_body("bin", sstring());
    }
    for (auto& [name, value] : req.headers) {
        hreq._headers[sstring(name)] = sstring(value);
    }
    if (_tokens) {
        hreq._headers["Authorization"] = sstring(fmt::format("Bearer {}", co_await _tokens()));
    }

    gcs_http_log.trace("{} {}", req.method, req.url);
    response resp;
    auto handler = [&resp] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        resp.status = rep._status;
        for (const auto& [name, value] : rep._headers) {
            resp.headers.emplace(std::string(name), std::string(value));
        }
        resp.body = co_await util::read_entire_stream_contiguous(in);
    };
    if (as) {
        co_await cln.http.make_request(std::move(hreq), std::move(handler), *as, std::nullopt);
    } else {
        co_await cln.http.make_request(std::move(hreq), std::move(handler), std::nullopt);
    }
    gcs_http_log.trace("{} {} -> {}", req.method, req.url, resp.status);
    co_return resp;
}

future<> http_transport::close() {
    for (auto& [key, cln] : _clients) {
        co_await cln->http.close();
    }
    _clients.clear();
}

} // namespace gcs
