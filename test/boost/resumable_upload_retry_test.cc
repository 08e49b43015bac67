/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>

#include <boost/test/unit_test.hpp>

#include <fmt/format.h>
#include <seastar/core/thread.hh>
#include <seastar/testing/thread_test_case.hh>

#include "test/lib/fake_transport.hh"
#include "test/lib/log.hh"
#include "test/lib/upload_test_utils.hh"
#include "utils/gcs/errors.hh"
#include "utils/gcs/resumable_upload.hh"

using namespace seastar;
using namespace std::chrono_literals;
using status = http::reply::status_type;

static constexpr size_t chunk = gcs::chunk_size_granularity;
static constexpr auto session_uri = "https://uploads.test/upload/session-1";

namespace {

// Treats a vanished session as worth another attempt
class not_found_retrying_strategy : public gcs::default_retry_strategy {
public:
    using gcs::default_retry_strategy::default_retry_strategy;
    using gcs::default_retry_strategy::is_retryable;

    gcs::retryable is_retryable(status s) const override {
        if (s == status::not_found) {
            return gcs::retryable::yes;
        }
        return gcs::default_retry_strategy::is_retryable(s);
    }
};

gcs::upload_config multi_chunk_config() {
    auto cfg = tests::make_test_config();
    cfg.chunk_size = chunk;
    return cfg;
}

bool is_status_check(const tests::recorded_request& r) {
    return r.header("Content-Range") == "bytes */*";
}

}

SEASTAR_THREAD_TEST_CASE(test_partially_persisted_chunk_is_replayed) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    server.persist_limit = 100000;
    t.set_fallback(server.handler());
    auto cfg = multi_chunk_config();
    cfg.crc32c = true;
    auto data = tests::random_content(2 * chunk + 5000);

    gcs::resumable_upload up(t, cfg);
    tests::write_in_pieces(up, data, {4096});
    up.finish().get();
    up.close().get();

    BOOST_REQUIRE(server.data() == data);
    auto puts = tests::requests_of(t, "PUT");
    BOOST_REQUIRE_EQUAL(puts.size(), 3u);
    BOOST_REQUIRE_EQUAL(*puts[1].header("Content-Range"), fmt::format("bytes 100000-{}/*", 100000 + chunk - 1));
    // A 308 is not a failure
    BOOST_REQUIRE_EQUAL(up.num_retries(), 0u);
    // Replayed bytes are hashed once
    BOOST_REQUIRE_EQUAL(puts.back().header("X-Goog-Hash").value_or(""), "crc32c=" + tests::x_goog_hash_of(data).substr(7, 8));
}

SEASTAR_THREAD_TEST_CASE(test_partially_persisted_last_chunk_is_replayed) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    server.persist_limit = 400;
    t.set_fallback(server.handler());
    auto data = tests::random_content(1000);

    gcs::resumable_upload up(t, multi_chunk_config());
    tests::write_in_pieces(up, data, {100});
    up.finish().get();
    up.close().get();

    BOOST_REQUIRE(server.data() == data);
    auto puts = tests::requests_of(t, "PUT");
    BOOST_REQUIRE_EQUAL(puts.size(), 2u);
    BOOST_REQUIRE_EQUAL(*puts[0].header("Content-Range"), "bytes 0-999/1000");
    BOOST_REQUIRE_EQUAL(*puts[1].header("Content-Range"), "bytes 400-999/1000");
}

SEASTAR_THREAD_TEST_CASE(test_short_acknowledgement_of_single_request_fails) {
    tests::fake_transport t;
    t.reply(status::ok, {{"Location", session_uri}});
    t.reply(gcs::resume_incomplete, {{"Range", "bytes=0-9"}});
    auto data = tests::random_content(20);

    gcs::resumable_upload up(t, tests::make_test_config());
    up.write(gcs::buffer(data.data(), data.size())).get();
    BOOST_REQUIRE_EXCEPTION(up.finish().get(), gcs::upload_error, [] (const gcs::upload_error& e) {
        return std::string(e.what()) == "Upload failed" && e.status() == gcs::resume_incomplete;
    });
    up.close().get();

    // Single-request bodies are not replayed
    auto puts = tests::requests_of(t, "PUT");
    BOOST_REQUIRE_EQUAL(puts.size(), 1u);
    BOOST_REQUIRE(puts[0].body == data);
    BOOST_REQUIRE_EQUAL(up.num_retries(), 0u);
    BOOST_REQUIRE_EQUAL(t.script_left(), 0u);
}

SEASTAR_THREAD_TEST_CASE(test_short_acknowledgement_of_partial_upload_is_replayed) {
    tests::fake_transport t;
    t.reply(status::ok, {{"Location", session_uri}});
    t.reply(gcs::resume_incomplete, {{"Range", "bytes=0-9"}});
    t.reply(gcs::resume_incomplete, {{"Range", "bytes=0-19"}});
    auto cfg = multi_chunk_config();
    cfg.is_partial_upload = true;
    auto data = tests::random_content(20);

    gcs::resumable_upload up(t, cfg);
    up.write(gcs::buffer(data.data(), data.size())).get();
    up.finish().get();
    up.close().get();

    // The pause only happens once everything sent is persisted
    auto puts = tests::requests_of(t, "PUT");
    BOOST_REQUIRE_EQUAL(puts.size(), 2u);
    BOOST_REQUIRE_EQUAL(*puts[0].header("Content-Range"), "bytes 0-19/*");
    BOOST_REQUIRE_EQUAL(*puts[1].header("Content-Range"), "bytes 10-19/*");
    BOOST_REQUIRE(puts[1].body == data.substr(10));
    BOOST_REQUIRE_EQUAL(up.session().bytes_written, 20u);
    BOOST_REQUIRE_EQUAL(up.num_retries(), 0u);
}

SEASTAR_THREAD_TEST_CASE(test_not_found_restart_does_not_back_off) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.reply(status::not_found, {}, "session expired", false);
    t.set_fallback(server.handler());
    auto cfg = multi_chunk_config();
    // a resume would sleep for an hour
    cfg.retry.delay_unit = 1h;

    gcs::resumable_upload up(t, cfg, nullptr, std::make_unique<not_found_retrying_strategy>(cfg.retry));
    auto data = tests::random_content(1000);
    up.write(gcs::buffer(data.data(), data.size())).get();
    up.finish().get();
    up.close().get();

    BOOST_REQUIRE_EQUAL(server.sessions_created(), 2u);
    BOOST_REQUIRE(server.data() == data);
    BOOST_REQUIRE_EQUAL(up.num_retries(), 1u);
}

SEASTAR_THREAD_TEST_CASE(test_retryable_status_then_success) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.reply(status::service_unavailable, {}, "busy");
    t.set_fallback(server.handler());
    std::vector<status> responses;

    gcs::resumable_upload up(t, multi_chunk_config());
    auto c = up.on_response([&] (const gcs::response& r) { responses.push_back(r.status); });
    auto data = tests::random_content(chunk + 1);
    tests::write_in_pieces(up, data, {chunk / 8});
    up.finish().get();
    up.close().get();

    BOOST_REQUIRE(server.data() == data);
    BOOST_REQUIRE_EQUAL(up.num_retries(), 1u);
    // The offset is unknown after a failure, so the server is asked first
    auto puts = tests::requests_of(t, "PUT");
    BOOST_REQUIRE(is_status_check(puts.at(1)));
    BOOST_REQUIRE_EQUAL(*puts.at(2).header("Content-Range"), fmt::format("bytes 0-{}/*", chunk - 1));
    // Retried responses are not reported
    BOOST_REQUIRE(std::find(responses.begin(), responses.end(), status::service_unavailable) == responses.end());
}

SEASTAR_THREAD_TEST_CASE(test_retry_limit) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.set_fallback([&server] (const tests::recorded_request& req, abort_source*) {
        if (is_status_check(req)) {
            return make_ready_future<gcs::response>(server.handle(req));
        }
        return make_ready_future<gcs::response>(tests::make_response(status::service_unavailable, {}, "busy"));
    });
    unsigned errors = 0;

    gcs::resumable_upload up(t, multi_chunk_config());
    auto c = up.on_error([&] (std::exception_ptr) { errors++; });
    up.write(gcs::buffer(1000)).get();
    BOOST_REQUIRE_EXCEPTION(up.finish().get(), gcs::retry_limit_exceeded_error, [] (const gcs::retry_limit_exceeded_error& e) {
        return std::string(e.what()) == "Retry limit exceeded - busy" && e.status() == status::service_unavailable;
    });
    up.close().get();

    BOOST_REQUIRE_EQUAL(up.num_retries(), 3u);
    BOOST_REQUIRE_EQUAL(up.retry_limit(), 3u);
    auto puts = tests::requests_of(t, "PUT");
    auto data_puts = std::count_if(puts.begin(), puts.end(), [] (const auto& r) { return !is_status_check(r); });
    BOOST_REQUIRE_EQUAL(data_puts, 4);
    BOOST_REQUIRE_EQUAL(errors, 1u);
}

SEASTAR_THREAD_TEST_CASE(test_retries_disabled) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.reply(status::too_many_requests, {}, "slow down");
    auto cfg = multi_chunk_config();
    cfg.retry.auto_retry = false;

    gcs::resumable_upload up(t, cfg);
    up.write(gcs::buffer(10)).get();
    BOOST_REQUIRE_THROW(up.finish().get(), gcs::retry_limit_exceeded_error);
    up.close().get();
    BOOST_REQUIRE_EQUAL(up.num_retries(), 0u);
}

SEASTAR_THREAD_TEST_CASE(test_total_timeout) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.reply(status::internal_server_error, {}, "oops");
    auto cfg = multi_chunk_config();
    cfg.retry.total_timeout = 0ms;

    gcs::resumable_upload up(t, cfg);
    up.write(gcs::buffer(10)).get();
    BOOST_REQUIRE_EXCEPTION(up.finish().get(), gcs::retry_timeout_error, [] (const gcs::retry_timeout_error& e) {
        return std::string(e.what()) == "Retry total time limit exceeded - oops";
    });
    up.close().get();
    BOOST_REQUIRE_EQUAL(t.requests().size(), 2u);
}

SEASTAR_THREAD_TEST_CASE(test_not_found_before_body_restarts_session) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.reply(status::not_found, {}, "session expired", false);
    t.set_fallback(server.handler());
    std::vector<std::string> uris;
    auto cfg = multi_chunk_config();

    gcs::resumable_upload up(t, cfg, nullptr, std::make_unique<not_found_retrying_strategy>(cfg.retry));
    auto c = up.on_uri([&] (const std::string& uri) { uris.push_back(uri); });
    auto data = tests::random_content(5000);
    tests::write_in_pieces(up, data, {1000});
    up.finish().get();
    up.close().get();

    BOOST_REQUIRE_EQUAL(server.sessions_created(), 2u);
    BOOST_REQUIRE(server.data() == data);
    BOOST_REQUIRE_EQUAL(uris.size(), 2u);
    BOOST_REQUIRE_EQUAL(up.session().uri.value_or(""), server.location());
    BOOST_REQUIRE_EQUAL(up.num_retries(), 1u);
    BOOST_REQUIRE(!t.requests().at(1).body_read);
}

SEASTAR_THREAD_TEST_CASE(test_not_found_after_body_resumes_session) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.reply(status::not_found, {}, "not yet");
    t.set_fallback(server.handler());
    auto cfg = multi_chunk_config();

    gcs::resumable_upload up(t, cfg, nullptr, std::make_unique<not_found_retrying_strategy>(cfg.retry));
    auto data = tests::random_content(5000);
    tests::write_in_pieces(up, data, {1000});
    up.finish().get();
    up.close().get();

    BOOST_REQUIRE_EQUAL(server.sessions_created(), 1u);
    BOOST_REQUIRE(server.data() == data);
    BOOST_REQUIRE(is_status_check(t.requests().at(2)));
}

SEASTAR_THREAD_TEST_CASE(test_restart_refused_after_data_was_sent) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.expect(server.handler());
    t.reply(status::not_found, {}, "session expired", false);
    auto cfg = multi_chunk_config();

    gcs::resumable_upload up(t, cfg, nullptr, std::make_unique<not_found_retrying_strategy>(cfg.retry));
    tests::write_in_pieces(up, tests::random_content(chunk + 100), {chunk / 2});
    BOOST_REQUIRE_EXCEPTION(up.finish().get(), gcs::upload_error, [] (const gcs::upload_error& e) {
        return std::string(e.what()).starts_with("Attempting to restart an upload after unrecoverable bytes have been written");
    });
    up.close().get();
    BOOST_REQUIRE_EQUAL(server.sessions_created(), 1u);
}

SEASTAR_THREAD_TEST_CASE(test_non_retryable_status) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.reply(status::bad_request, {}, "bad");

    gcs::resumable_upload up(t, multi_chunk_config());
    up.write(gcs::buffer(10)).get();
    BOOST_REQUIRE_EXCEPTION(up.finish().get(), gcs::upload_error, [] (const gcs::upload_error& e) {
        return std::string(e.what()) == "Upload failed" && e.status() == status::bad_request && e.errors().at(0) == "bad";
    });
    up.close().get();
    BOOST_REQUIRE_EQUAL(up.num_retries(), 0u);
}

SEASTAR_THREAD_TEST_CASE(test_error_in_success_body) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.reply(status::ok, {}, R"({"error": {"code": 412, "message": "precondition failed"}})");

    gcs::resumable_upload up(t, multi_chunk_config());
    up.write(gcs::buffer(10)).get();
    BOOST_REQUIRE_EXCEPTION(up.finish().get(), gcs::upload_error, [] (const gcs::upload_error& e) {
        return std::string(e.what()).find("precondition failed") != std::string::npos;
    });
    up.close().get();
}

SEASTAR_THREAD_TEST_CASE(test_connection_reset_is_retried) {
    for (bool multi : {false, true}) {
        tests::fake_transport t;
        tests::fake_gcs_server server;
        t.expect(server.handler());
        t.fail_with(std::make_exception_ptr(std::system_error(ECONNRESET, std::system_category())));
        t.set_fallback(server.handler());
        auto cfg = multi ? multi_chunk_config() : tests::make_test_config();

        gcs::resumable_upload up(t, cfg);
        auto data = tests::random_content(3000);
        up.write(gcs::buffer(data.data(), data.size())).get();
        up.finish().get();
        up.close().get();

        BOOST_REQUIRE(server.data() == data);
        BOOST_REQUIRE_EQUAL(up.num_retries(), 1u);
    }
}

SEASTAR_THREAD_TEST_CASE(test_status_check_failure_is_retried) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.reply(status::service_unavailable);
    t.reply(status::gateway_timeout);
    t.set_fallback(server.handler());

    gcs::resumable_upload up(t, multi_chunk_config());
    auto data = tests::random_content(100);
    up.write(gcs::buffer(data.data(), data.size())).get();
    up.finish().get();
    up.close().get();

    BOOST_REQUIRE(server.data() == data);
    // one for the chunk, one for the status check
    BOOST_REQUIRE_EQUAL(up.num_retries(), 2u);
}

SEASTAR_THREAD_TEST_CASE(test_offset_regression_is_fatal) {
    tests::fake_transport t;
    t.reply(status::ok, {{"Location", session_uri}});
    t.reply(gcs::resume_incomplete, {{"Range", fmt::format("bytes=0-{}", chunk - 1)}});
    t.reply(status::service_unavailable);
    // The server lost most of what it acknowledged before
    t.reply(gcs::resume_incomplete, {{"Range", "bytes=0-99"}});

    gcs::resumable_upload up(t, multi_chunk_config());
    tests::write_in_pieces(up, tests::random_content(2 * chunk + 10), {chunk / 4});
    BOOST_REQUIRE_EXCEPTION(up.finish().get(), gcs::offset_regression_error, [] (const gcs::offset_regression_error& e) {
        return e.code() == "OFFSET_REGRESSION";
    });
    up.close().get();
    BOOST_REQUIRE_EQUAL(t.script_left(), 0u);
}

SEASTAR_THREAD_TEST_CASE(test_acknowledged_range_before_last_request_is_fatal) {
    tests::fake_transport t;
    t.reply(status::ok, {{"Location", session_uri}});
    t.reply(gcs::resume_incomplete, {{"Range", fmt::format("bytes=0-{}", chunk - 1)}});
    t.reply(gcs::resume_incomplete, {{"Range", "bytes=0-99"}});

    gcs::resumable_upload up(t, multi_chunk_config());
    tests::write_in_pieces(up, tests::random_content(2 * chunk + 10), {chunk / 4});
    BOOST_REQUIRE_THROW(up.finish().get(), gcs::offset_regression_error);
    up.close().get();
}

SEASTAR_THREAD_TEST_CASE(test_abort_cancels_scheduled_retry) {
    tests::fake_transport t;
    tests::fake_gcs_server server;
    t.expect(server.handler());
    t.reply(status::service_unavailable);
    auto cfg = multi_chunk_config();
    cfg.retry.delay_unit = 1h;

    gcs::resumable_upload up(t, cfg);
    up.write(gcs::buffer(10)).get();
    auto finished = up.finish();
    while (up.num_retries() == 0) {
        seastar::thread::yield();
    }
    up.abort();
    BOOST_REQUIRE_THROW(finished.get(), abort_requested_exception);
    up.close().get();
    BOOST_REQUIRE_EQUAL(t.requests().size(), 2u);
}
