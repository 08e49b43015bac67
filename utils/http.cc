/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http.hh"

#include <algorithm>
#include <cctype>
#include <netdb.h>
#include <ranges>
#include <strings.h>
#include <system_error>

#include <boost/regex.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/net/dns.hh>
#include <seastar/net/api.hh>

future<shared_ptr<tls::certificate_credentials>> utils::http::system_trust_credentials() {
    static thread_local shared_ptr<tls::certificate_credentials> system_trust_credentials;
    if (!system_trust_credentials) {
        // can race, and overwrite the object. that is fine.
        auto cred = make_shared<tls::certificate_credentials>();
        co_await cred->set_system_trust();
        system_trust_credentials = std::move(cred);
    }
    co_return system_trust_credentials;
}

utils::http::dns_connection_factory::dns_connection_factory(std::string host, uint16_t port, bool use_https, seastar::logger& logger, shared_ptr<tls::certificate_credentials> creds)
    : _host(std::move(host))
    , _port(port)
    , _use_https(use_https)
    , _logger(logger)
    , _creds(std::move(creds))
{}

bool utils::http::dns_connection_factory::addresses_valid() const noexcept {
    return !_addr_list.empty() && lowres_clock::now() < _addr_expiry;
}

future<> utils::http::dns_connection_factory::resolve() {
    auto hent = co_await net::dns::get_host_by_name(_host, net::inet_address::family::INET);
    if (hent.addr_entries.empty()) {
        co_await coroutine::return_exception(std::system_error(EAI_NONAME, std::generic_category(), fmt::format("No address for {}", _host)));
    }
    auto ttl = std::ranges::min_element(hent.addr_entries, {}, &net::hostent::address_entry::ttl)->ttl;
    _addr_list = hent.addr_entries | std::views::transform(&net::hostent::address_entry::addr) | std::ranges::to<std::vector>();
    // A zero TTL is valid for the connection in progress only (RFC 1035 3.2.1)
    _addr_expiry = lowres_clock::now() + ttl;
    _logger.debug("Resolved {} to {}, ttl={}s", _host, _addr_list, ttl.count());
}

future<net::inet_address> utils::http::dns_connection_factory::get_address() {
    if (!addresses_valid()) [[unlikely]] {
        auto units = co_await get_units(_resolve_sem, 1);
        if (!addresses_valid()) {
            co_await resolve();
        }
    }
    co_return _addr_list[_addr_pos++ % _addr_list.size()];
}

future<shared_ptr<tls::certificate_credentials>> utils::http::dns_connection_factory::get_creds() {
    if (!_creds_init) [[unlikely]] {
        if (!_use_https) {
            _creds = {};
        } else if (!_creds) {
            _creds = co_await system_trust_credentials();
        }
        _creds_init = true;
    }
    co_return _creds;
}

future<connected_socket> utils::http::dns_connection_factory::make(abort_source*) {
    auto socket_addr = socket_address(co_await get_address(), _port);
    if (auto creds = co_await get_creds()) {
        _logger.debug("Making new HTTPS connection addr={} host={}", socket_addr, _host);
        co_return co_await tls::connect(creds, socket_addr, tls::tls_options{.server_name = _host});
    }
    _logger.debug("Making new HTTP connection addr={} host={}", socket_addr, _host);
    co_return co_await seastar::connect(socket_addr, {}, transport::TCP);
}

static const char HTTPS[] = "https";

utils::http::url_info utils::http::parse_simple_url(std::string_view uri) {
    /**
     * https://en.wikipedia.org/wiki/IPv6#Addressing
     * In case a port is included with a numerical ipv6 address,
     * the address part is encases in a "[]" wrapper, like
     * http://[2001:db8:4006:812::200e]:8080
     */
    static boost::regex simple_url(R"foo(([a-zA-Z]+):\/\/((?:\[[^\]]+\])|[^\/:?]+)(:\d+)?([\/?].*)?)foo");

    boost::smatch m;
    std::string tmp(uri);

    if (!boost::regex_match(tmp, m, simple_url)) {
        throw std::invalid_argument(fmt::format("Could not parse URI {}", uri));
    }

    auto scheme = m[1].str();
    auto host = m[2].str();
    auto port = m[3].str();
    auto path = m[4].str();

    bool https = (strcasecmp(scheme.c_str(), HTTPS) == 0);

    // check for numeric ipv6 address + port case
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (!path.empty() && path.front() == '?') {
        path.insert(path.begin(), '/');
    }
    return url_info {
        .scheme = std::move(scheme),
        .host = std::move(host),
        .path = std::move(path),
        .port = uint16_t(port.empty() ? (https ? 443 : 80) : std::stoi(port.substr(1)))
    };
}

bool utils::http::url_info::is_https() const {
    return strcasecmp(scheme.c_str(), HTTPS) == 0;
}

std::string utils::http::url_encode(std::string_view s) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string ret;
    ret.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            ret.push_back(c);
        } else {
            ret.push_back('%');
            ret.push_back(hex[c >> 4]);
            ret.push_back(hex[c & 0xf]);
        }
    }
    return ret;
}

std::string utils::http::make_query_string(const std::map<std::string, std::string>& params) {
    return fmt::format("{}", fmt::join(params | std::views::transform([] (const auto& p) {
        return fmt::format("{}={}", url_encode(p.first), url_encode(p.second));
    }), "&"));
}
