// Copyright 2026 The incsnap Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <incsnap.h>

#include <cstdint>
#include <set>
#include <string>

using namespace incsnap;

namespace {

Key int_key(std::int64_t v) {
    return Key{v};
}

IncrementalSnapshotContext context_with(std::initializer_list<const char*> tables) {
    IncrementalSnapshotContext ctx;
    std::vector<std::string> names(tables.begin(), tables.end());
    ctx.add_data_collections(names);
    return ctx;
}

} // namespace

TEST_CASE("context: initial state is idle") {
    IncrementalSnapshotContext ctx;
    CHECK_FALSE(ctx.snapshot_running());
    CHECK_FALSE(ctx.deduplication_needed());
    CHECK_FALSE(ctx.is_non_initial_chunk());
    CHECK_FALSE(ctx.current_chunk_id().has_value());
    CHECK_FALSE(ctx.maximum_key().has_value());
    CHECK_FALSE(ctx.current_data_collection_id().has_value());
}

TEST_CASE("context: window signals ignored without a chunk") {
    IncrementalSnapshotContext ctx;
    CHECK_FALSE(ctx.open_window("anything"));
    CHECK_FALSE(ctx.deduplication_needed());
    CHECK_FALSE(ctx.close_window("anything"));
}

TEST_CASE("context: chunk ids are unique UUIDs") {
    IncrementalSnapshotContext ctx;
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ctx.start_new_chunk();
        REQUIRE(ctx.current_chunk_id().has_value());
        const auto& id = *ctx.current_chunk_id();
        CHECK(id.size() == 36);
        CHECK(id[14] == '4');
        ids.insert(id);
    }
    CHECK(ids.size() == 1000);
}

TEST_CASE("context: open and close window with the current chunk id") {
    IncrementalSnapshotContext ctx;
    ctx.start_new_chunk();
    auto id = *ctx.current_chunk_id();

    CHECK(ctx.open_window(id));
    CHECK(ctx.deduplication_needed());
    CHECK(ctx.open_window(id));  // idempotent
    CHECK(ctx.deduplication_needed());

    CHECK(ctx.close_window(id));
    CHECK_FALSE(ctx.deduplication_needed());
}

TEST_CASE("context: window id must be prefixed by the current chunk id") {
    IncrementalSnapshotContext ctx;
    ctx.start_new_chunk();
    auto id = *ctx.current_chunk_id();

    SUBCASE("suffix matches") {
        CHECK(ctx.open_window(id + "-open"));
        CHECK(ctx.deduplication_needed());
        CHECK(ctx.close_window(id + "-close"));
        CHECK_FALSE(ctx.deduplication_needed());
    }
    SUBCASE("truncated id does not match") {
        CHECK_FALSE(ctx.open_window(id.substr(0, 10)));
        CHECK_FALSE(ctx.deduplication_needed());
    }
    SUBCASE("id embedded after a prefix does not match") {
        CHECK_FALSE(ctx.open_window("x" + id));
        CHECK_FALSE(ctx.deduplication_needed());
    }
    SUBCASE("stale chunk id is ignored after a new chunk starts") {
        ctx.start_new_chunk();
        CHECK_FALSE(ctx.open_window(id));
        CHECK_FALSE(ctx.deduplication_needed());

        CHECK(ctx.open_window(*ctx.current_chunk_id()));
        CHECK_FALSE(ctx.close_window(id));
        CHECK(ctx.deduplication_needed());
    }
}

TEST_CASE("context: start_new_chunk leaves window and bounds untouched") {
    IncrementalSnapshotContext ctx;
    ctx.start_new_chunk();
    ctx.open_window(*ctx.current_chunk_id());
    ctx.next_chunk_position(int_key(10));
    ctx.start_new_chunk();
    CHECK(ctx.deduplication_needed());
    CHECK(ctx.chunk_end_position() == int_key(10));
}

TEST_CASE("context: chunk position and last event") {
    IncrementalSnapshotContext ctx;
    ctx.next_chunk_position(int_key(100));
    CHECK(ctx.is_non_initial_chunk());
    CHECK(ctx.chunk_end_position() == int_key(100));

    ctx.send_event(int_key(7));
    CHECK(ctx.last_event_key_sent() == int_key(7));
}

TEST_CASE("context: revert_chunk rolls back to the last key sent") {
    IncrementalSnapshotContext ctx;
    ctx.start_new_chunk();
    ctx.open_window(*ctx.current_chunk_id());
    ctx.send_event(int_key(42));
    ctx.next_chunk_position(int_key(100));

    ctx.revert_chunk();
    CHECK(ctx.chunk_end_position() == int_key(42));
    CHECK_FALSE(ctx.deduplication_needed());

    SUBCASE("nothing sent reverts to an initial chunk") {
        IncrementalSnapshotContext fresh;
        fresh.next_chunk_position(int_key(5));
        fresh.revert_chunk();
        CHECK_FALSE(fresh.is_non_initial_chunk());
        CHECK_FALSE(fresh.deduplication_needed());
    }
}

TEST_CASE("context: next_data_collection resets chunk state") {
    auto ctx = context_with({"t1", "t2"});
    ctx.maximum_key(int_key(1000));
    ctx.send_event(int_key(3));
    ctx.next_chunk_position(int_key(10));

    auto head = ctx.next_data_collection();
    REQUIRE(head.has_value());
    CHECK(head->table == "t1");
    CHECK_FALSE(ctx.last_event_key_sent().has_value());
    CHECK_FALSE(ctx.chunk_end_position().has_value());
    CHECK_FALSE(ctx.maximum_key().has_value());
    CHECK(ctx.tables_to_be_snapshotted_count() == 1);
    CHECK(ctx.current_data_collection_id()->table == "t2");

    CHECK(ctx.next_data_collection()->table == "t2");
    CHECK_FALSE(ctx.snapshot_running());
    CHECK_FALSE(ctx.next_data_collection().has_value());
}

TEST_CASE("context: add_data_collections appends parsed ids") {
    IncrementalSnapshotContext ctx(false);
    auto added = ctx.add_data_collections({"public.a", "b"});
    REQUIRE(added.size() == 2);
    CHECK(added[0].schema == "public");
    CHECK(added[0].table == "a");
    CHECK(ctx.tables_to_be_snapshotted_count() == 2);

    ctx.add_data_collections({"c"});
    CHECK(ctx.data_collections().to_persistable_string() == "public.a,b,c");
}

TEST_CASE("context: stop_snapshot clears everything") {
    auto ctx = context_with({"t1", "t2"});
    ctx.start_new_chunk();
    auto id = *ctx.current_chunk_id();
    ctx.open_window(id);
    ctx.maximum_key(int_key(9));
    ctx.send_event(int_key(1));
    ctx.next_chunk_position(int_key(2));

    ctx.stop_snapshot();
    CHECK_FALSE(ctx.snapshot_running());
    CHECK_FALSE(ctx.deduplication_needed());
    CHECK_FALSE(ctx.is_non_initial_chunk());
    CHECK_FALSE(ctx.maximum_key().has_value());
    CHECK_FALSE(ctx.close_window(id));
}

TEST_CASE("context: table scan scenario") {
    auto ctx = context_with({"T1", "T2"});

    auto head = ctx.next_data_collection();
    REQUIRE(head.has_value());
    CHECK(head->table == "T1");
    CHECK(ctx.tables_to_be_snapshotted_count() == 1);
    CHECK_FALSE(ctx.is_non_initial_chunk());

    ctx.start_new_chunk();
    auto c1 = *ctx.current_chunk_id();
    CHECK(ctx.open_window(c1 + "-suffix"));
    CHECK(ctx.deduplication_needed());

    ctx.send_event(int_key(5));
    CHECK(ctx.last_event_key_sent() == int_key(5));

    CHECK_FALSE(ctx.close_window("C1-suffix"));
    CHECK(ctx.deduplication_needed());
    CHECK(ctx.close_window(c1 + "-suffix"));
    CHECK_FALSE(ctx.deduplication_needed());
}

TEST_CASE("context: to_string describes the state") {
    auto ctx = context_with({"t1"});
    ctx.maximum_key(int_key(9));
    auto s = ctx.to_string();
    CHECK(s.find("t1") != std::string::npos);
    CHECK(s.find("maximum_key=[9]") != std::string::npos);
    CHECK(s.find("chunk_end_position=null") != std::string::npos);
}
