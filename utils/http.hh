/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/http/client.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/net/tls.hh>
#include <seastar/util/log.hh>

namespace utils::http {

using namespace seastar;

future<shared_ptr<tls::certificate_credentials>> system_trust_credentials();

struct url_info {
    std::string scheme;
    std::string host;
    // path including the query string, if any
    std::string path;
    uint16_t port;

    bool is_https() const;
};

url_info parse_simple_url(std::string_view uri);

// Percent-encodes everything but the RFC 3986 unreserved characters.
std::string url_encode(std::string_view s);

// Renders "k1=v1&k2=v2" with both keys and values encoded, in map order.
std::string make_query_string(const std::map<std::string, std::string>& params);

// Connects to one host, resolving its name lazily. Addresses are reused
// round-robin until the shortest record TTL expires.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    std::string _host;
    uint16_t _port;
    bool _use_https;
    seastar::logger& _logger;
    shared_ptr<tls::certificate_credentials> _creds;
    bool _creds_init = false;
    semaphore _resolve_sem{1};
    std::vector<net::inet_address> _addr_list;
    size_t _addr_pos = 0;
    lowres_clock::time_point _addr_expiry;

    bool addresses_valid() const noexcept;
    future<> resolve();
    future<net::inet_address> get_address();
    future<shared_ptr<tls::certificate_credentials>> get_creds();
public:
    dns_connection_factory(std::string host, uint16_t port, bool use_https, seastar::logger& logger, shared_ptr<tls::certificate_credentials> = {});

    virtual future<connected_socket> make(abort_source*) override;
};

} // namespace utils::http
