/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE checksum_validator

#include <boost/test/unit_test.hpp>

#include <string>

#include <fmt/format.h>

#include "utils/gcs/checksum_validator.hh"

static constexpr std::string_view hello_crc32c = "yZRlqg==";
static constexpr std::string_view hello_md5 = "XrY7u+Ae7tCTyyK7j1rNww==";

static gcs::checksum_options both() {
    return gcs::checksum_options{.crc32c = true, .md5 = true};
}

BOOST_AUTO_TEST_CASE(test_disabled_by_default) {
    gcs::checksum_validator v(gcs::checksum_options{});
    BOOST_REQUIRE(!v.computing());
    v.update(0, "hello", 5);
    v.finalize();
    BOOST_REQUIRE(!v.crc32c());
    BOOST_REQUIRE(!v.md5());
    BOOST_REQUIRE(!v.x_goog_hash());
    BOOST_REQUIRE(!v.compare(std::string("AAAAAA=="), std::nullopt));
}

BOOST_AUTO_TEST_CASE(test_computed_values) {
    gcs::checksum_validator v(both());
    v.update(0, "hello ", 6);
    v.update(6, "world", 5);
    // computed values are published only once final
    BOOST_REQUIRE(!v.x_goog_hash());
    v.finalize();
    BOOST_REQUIRE_EQUAL(*v.crc32c(), hello_crc32c);
    BOOST_REQUIRE_EQUAL(*v.md5(), hello_md5);
    BOOST_REQUIRE_EQUAL(*v.x_goog_hash(), fmt::format("crc32c={},md5={}", hello_crc32c, hello_md5));
}

BOOST_AUTO_TEST_CASE(test_replayed_positions_are_skipped) {
    gcs::checksum_validator v(both());
    v.update(0, "hello wo", 8);
    // The server kept 6 bytes, the rest is sent again
    v.update(6, "world", 5);
    v.update(3, "lo", 2);
    v.finalize();
    BOOST_REQUIRE_EQUAL(v.hashed_bytes(), 11u);
    BOOST_REQUIRE_EQUAL(*v.crc32c(), hello_crc32c);
    BOOST_REQUIRE_EQUAL(*v.md5(), hello_md5);
}

BOOST_AUTO_TEST_CASE(test_gap_disables_checksums) {
    gcs::checksum_validator v(both());
    v.update(0, "hello", 5);
    v.update(7, "rld", 3);
    BOOST_REQUIRE(!v.computing());
    v.finalize();
    BOOST_REQUIRE(!v.crc32c());
    BOOST_REQUIRE(!v.compare(std::string(hello_crc32c), std::string(hello_md5)));
}

BOOST_AUTO_TEST_CASE(test_resume_offset_disables_computing) {
    gcs::checksum_validator v(both(), 1024);
    BOOST_REQUIRE(!v.computing());
}

BOOST_AUTO_TEST_CASE(test_client_values_take_precedence) {
    gcs::checksum_validator v(gcs::checksum_options{
        .crc32c = true,
        .md5 = false,
        .client_crc32c = std::string(hello_crc32c),
    });
    BOOST_REQUIRE(!v.crc32c_enabled());
    // known before any data is seen
    BOOST_REQUIRE_EQUAL(*v.x_goog_hash(), fmt::format("crc32c={}", hello_crc32c));
    v.update(0, "whatever", 8);
    v.finalize();
    BOOST_REQUIRE_EQUAL(*v.crc32c(), hello_crc32c);
}

BOOST_AUTO_TEST_CASE(test_compare_reports_mismatch) {
    gcs::checksum_validator v(both());
    v.update(0, "hello world", 11);
    v.finalize();
    BOOST_REQUIRE(!v.compare(std::string(hello_crc32c), std::string(hello_md5)));
    BOOST_REQUIRE(!v.compare(std::nullopt, std::nullopt));

    auto crc_mismatch = v.compare(std::string("AAAAAA=="), std::string(hello_md5));
    BOOST_REQUIRE(crc_mismatch);
    BOOST_REQUIRE_EQUAL(*crc_mismatch, fmt::format("CRC32C checksum mismatch. Client calculated: {}, Server returned: AAAAAA==", hello_crc32c));

    auto md5_mismatch = v.compare(std::string(hello_crc32c), std::string("1B2M2Y8AsgTpgAmY7PhCfg=="));
    BOOST_REQUIRE(md5_mismatch);
    BOOST_REQUIRE(md5_mismatch->starts_with("MD5 checksum mismatch."));
}

BOOST_AUTO_TEST_CASE(test_update_after_finalize) {
    gcs::checksum_validator v(both());
    v.update(0, "hello", 5);
    v.finalize();
    v.finalize();
    // already hashed bytes are fine
    BOOST_REQUIRE_NO_THROW(v.update(0, "hello", 5));
    BOOST_REQUIRE_THROW(v.update(5, " world", 6), std::logic_error);
}
