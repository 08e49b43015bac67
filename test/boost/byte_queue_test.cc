/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE byte_queue

#include <boost/test/unit_test.hpp>

#include <string>

#include "utils/gcs/byte_queue.hh"

using gcs::buffer;
using gcs::buffer_list;

static buffer make_buffer(std::string_view s) {
    return buffer(s.data(), s.size());
}

static std::string to_string(const buffer_list& bufs) {
    std::string ret;
    for (const auto& b : bufs) {
        ret.append(b.get(), b.size());
    }
    return ret;
}

static std::string drain(gcs::byte_queue& q) {
    return to_string(q.pull_all());
}

BOOST_AUTO_TEST_CASE(test_push_and_pull) {
    gcs::byte_queue q;
    BOOST_REQUIRE(q.empty());
    q.push_back(make_buffer("abc"));
    q.push_back(make_buffer(""));
    q.push_back(make_buffer("defgh"));
    BOOST_REQUIRE_EQUAL(q.size(), 8u);
    BOOST_REQUIRE_EQUAL(q.buffer_count(), 2u);

    auto head = q.pull(4);
    BOOST_REQUIRE_EQUAL(to_string(head), "abcd");
    BOOST_REQUIRE_EQUAL(q.size(), 4u);
    BOOST_REQUIRE_EQUAL(drain(q), "efgh");
    BOOST_REQUIRE(q.empty());
}

BOOST_AUTO_TEST_CASE(test_pull_more_than_available) {
    gcs::byte_queue q;
    q.push_back(make_buffer("xyz"));
    BOOST_REQUIRE_EQUAL(to_string(q.pull(100)), "xyz");
    BOOST_REQUIRE(q.pull(100).empty());
}

BOOST_AUTO_TEST_CASE(test_prepend_keeps_order) {
    gcs::byte_queue q;
    q.push_back(make_buffer("world"));
    buffer_list back;
    back.push_back(make_buffer("hel"));
    back.push_back(make_buffer(""));
    back.push_back(make_buffer("lo "));
    q.prepend(std::move(back));
    BOOST_REQUIRE_EQUAL(q.size(), 11u);
    BOOST_REQUIRE_EQUAL(drain(q), "hello world");
}

BOOST_AUTO_TEST_CASE(test_discard) {
    gcs::byte_queue q;
    q.push_back(make_buffer("0123"));
    q.push_back(make_buffer("4567"));
    BOOST_REQUIRE_EQUAL(q.discard(6), 6u);
    BOOST_REQUIRE_EQUAL(drain(q), "67");
    BOOST_REQUIRE_EQUAL(q.discard(6), 0u);
}

BOOST_AUTO_TEST_CASE(test_bounded_chunk_iterator) {
    gcs::byte_queue q;
    q.push_back(make_buffer("aaaa"));
    q.push_back(make_buffer("bbbb"));
    q.push_back(make_buffer("cccc"));

    gcs::chunk_iterator it(q, 6);
    std::string chunk;
    while (!it.limit_reached()) {
        auto b = it.next();
        if (b.empty()) {
            break;
        }
        chunk.append(b.get(), b.size());
    }
    BOOST_REQUIRE_EQUAL(chunk, "aaaabb");
    BOOST_REQUIRE_EQUAL(*it.remaining(), 0u);
    BOOST_REQUIRE(it.next().empty());
    BOOST_REQUIRE_EQUAL(drain(q), "bbcccc");
}

BOOST_AUTO_TEST_CASE(test_bounded_iterator_runs_dry) {
    gcs::byte_queue q;
    q.push_back(make_buffer("ab"));
    gcs::chunk_iterator it(q, 10);
    BOOST_REQUIRE_EQUAL(it.next().size(), 2u);
    BOOST_REQUIRE(it.next().empty());
    BOOST_REQUIRE(!it.limit_reached());
    BOOST_REQUIRE_EQUAL(*it.remaining(), 8u);

    // Data arriving later is picked up by the same iterator
    q.push_back(make_buffer("cdefghijklmn"));
    BOOST_REQUIRE_EQUAL(it.next().size(), 8u);
    BOOST_REQUIRE(it.limit_reached());
    BOOST_REQUIRE_EQUAL(q.size(), 4u);
}

BOOST_AUTO_TEST_CASE(test_unbounded_chunk_iterator) {
    gcs::byte_queue q;
    q.push_back(make_buffer("one"));
    q.push_back(make_buffer("two"));
    gcs::chunk_iterator it(q, std::nullopt);
    std::string all;
    for (auto b = it.next(); !b.empty(); b = it.next()) {
        all.append(b.get(), b.size());
    }
    BOOST_REQUIRE_EQUAL(all, "onetwo");
    BOOST_REQUIRE(!it.limit_reached());
    BOOST_REQUIRE(q.empty());
}

BOOST_AUTO_TEST_CASE(test_pending_take_last_splits_buffer) {
    gcs::pending_chunk p;
    p.append(make_buffer("0123"));
    p.append(make_buffer("4567"));
    p.append(make_buffer("89"));
    BOOST_REQUIRE_EQUAL(p.size(), 10u);

    auto tail = p.take_last(5);
    BOOST_REQUIRE_EQUAL(to_string(tail), "56789");
    BOOST_REQUIRE(p.empty());
    BOOST_REQUIRE_EQUAL(p.size(), 0u);
}

BOOST_AUTO_TEST_CASE(test_pending_take_last_more_than_held) {
    gcs::pending_chunk p;
    p.append(make_buffer("abc"));
    BOOST_REQUIRE_EQUAL(to_string(p.take_last(100)), "abc");
}

BOOST_AUTO_TEST_CASE(test_pending_replace) {
    gcs::pending_chunk p;
    p.append(make_buffer("old"));
    p.replace(make_buffer("new!"));
    BOOST_REQUIRE_EQUAL(p.size(), 4u);
    BOOST_REQUIRE_EQUAL(to_string(p.take_all()), "new!");
    BOOST_REQUIRE(p.empty());
}

BOOST_AUTO_TEST_CASE(test_replay_through_queue) {
    // A chunk the server only partly persisted goes back in front of the
    // data that was never sent
    gcs::byte_queue q;
    q.push_back(make_buffer("AAAABBBBCCCC"));
    gcs::pending_chunk p;
    gcs::chunk_iterator it(q, 8);
    for (auto b = it.next(); !b.empty(); b = it.next()) {
        p.append(std::move(b));
    }
    BOOST_REQUIRE_EQUAL(p.size(), 8u);
    q.prepend(p.take_last(3));
    BOOST_REQUIRE_EQUAL(drain(q), "BBBCCCC");
}
