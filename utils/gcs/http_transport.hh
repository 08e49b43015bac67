/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <unordered_map>

#include <seastar/http/client.hh>
#include <seastar/net/tls.hh>

#include "transport.hh"

namespace gcs {

// Supplies the OAuth2 access token injected as "Authorization: Bearer ...".
// Obtaining and refreshing it is up to the caller.
using token_provider = seastar::noncopyable_function<seastar::future<std::string>()>;

// Transport over Seastar's HTTP client. One connection pool is kept per
// scheme/host/port triple, session URIs may point to a host other than the
// API endpoint.
class http_transport final : public transport {
    struct endpoint_client;

    token_provider _tokens;
    seastar::shared_ptr<seastar::tls::certificate_credentials> _creds;
    unsigned _max_connections;
    std::unordered_map<std::string, std::unique_ptr<endpoint_client>> _clients;

    endpoint_client& client_for(const std::string& url);
public:
    explicit http_transport(token_provider tokens = {},
                            seastar::shared_ptr<seastar::tls::certificate_credentials> creds = {},
                            unsigned max_connections = 4);
    ~http_transport();

    virtual seastar::future<response> send(request req, seastar::abort_source* as) override;
    virtual seastar::future<> close() override;
};

} // namespace gcs
