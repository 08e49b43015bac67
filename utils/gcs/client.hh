/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <string>

#include <seastar/core/abort_source.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/shared_ptr.hh>

#include "http_transport.hh"
#include "resumable_upload.hh"
#include "retry_strategy.hh"
#include "retryable_transport.hh"
#include "upload_config.hh"
#include "utils/memory_data_sink.hh"

namespace gcs {

// Each part must be at least 5 MiB in size, except the last part
inline constexpr size_t minimum_part_size = 5 * 1024 * 1024;

struct client_config {
    std::string api_endpoint{default_api_endpoint};
    unsigned max_connections = 4;
    // Retry behavior of the XML API requests
    retry_options retry;
    size_t part_size = minimum_part_size;
    unsigned part_concurrency = 2;
};

class client : public seastar::enable_shared_from_this<client> {
    client_config _cfg;
    std::string _endpoint;
    std::unique_ptr<transport> _transport;
    default_retry_strategy _retry_strategy;
    retryable_transport _retrying;

    struct private_tag {};

    friend class multipart_upload;
public:
    client(std::unique_ptr<transport> t, client_config cfg, private_tag);

    static seastar::shared_ptr<client> make(std::unique_ptr<transport> t, client_config cfg = {});
    // Talks to the service over Seastar's HTTP client, trusting the system CAs
    static seastar::future<seastar::shared_ptr<client>> make(client_config cfg, token_provider tokens);

    const client_config& config() const noexcept { return _cfg; }
    transport& get_transport() noexcept { return *_transport; }

    // Resumable (JSON API) uploads
    std::unique_ptr<resumable_upload> make_resumable_upload(upload_config cfg, seastar::abort_source* as = nullptr);
    seastar::data_sink make_resumable_upload_sink(upload_config cfg, seastar::abort_source* as = nullptr);
    // Creates a session without uploading data, returns its URI
    seastar::future<std::string> create_session(upload_config cfg, seastar::abort_source* as = nullptr);
    // Asks the service about the session in cfg.uri
    seastar::future<response> check_upload_status(upload_config cfg, bool retry = true, seastar::abort_source* as = nullptr);

    // XML API uploads
    seastar::data_sink make_upload_sink(std::string bucket, std::string object_name, seastar::abort_source* as = nullptr);
    seastar::future<> put_object(std::string bucket, std::string object_name, memory_data_sink_buffers bufs, seastar::abort_source* as = nullptr);
    seastar::future<> put_object(std::string bucket, std::string object_name, seastar::temporary_buffer<char> buf, seastar::abort_source* as = nullptr);
    std::string object_url(std::string_view bucket, std::string_view object_name) const;

    seastar::future<> close();
};

} // namespace gcs
