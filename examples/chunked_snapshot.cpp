// Copyright 2026 The incsnap Authors
// SPDX-License-Identifier: Apache-2.0
#include <incsnap.h>

#include <spdlog/spdlog.h>

#include <sqlite3.h>

#include <cstdint>
#include <cstdio>
#include <string>

using namespace incsnap;

// Simulated change stream: a change to `id` arriving while the snapshot runs.
static void stream_change(SnapshotCoordinator& coord, const TableId& table,
                          std::int64_t id) {
    bool dup = coord.should_suppress(table, Key{id});
    std::printf("  [stream] change to %s id=%lld %s\n",
                table.to_string().c_str(), static_cast<long long>(id),
                dup ? "suppressed (snapshot row wins)" : "emitted");
}

static void print_offsets(const OffsetRecord& offset) {
    for (const auto& [k, v] : offset) {
        std::printf("  %s = %s\n", k.c_str(), v.c_str());
    }
}

int main() {
    spdlog::set_level(spdlog::level::info);

    sqlite3* db = nullptr;
    if (sqlite3_open(":memory:", &db) != SQLITE_OK) {
        std::fprintf(stderr, "cannot open database: %s\n",
                     db ? sqlite3_errmsg(db) : "out of memory");
        sqlite3_close(db);
        return 1;
    }

    char* err = nullptr;
    int rc = sqlite3_exec(db,
        "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT);"
        "CREATE TABLE orders (id INTEGER PRIMARY KEY, user_id INTEGER);"
        "WITH RECURSIVE n(i) AS (SELECT 1 UNION ALL SELECT i + 1 FROM n WHERE i < 12)"
        "  INSERT INTO users SELECT i, 'user' || i FROM n;"
        "INSERT INTO orders VALUES (1, 3), (2, 7), (3, 7);",
        nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::fprintf(stderr, "setup failed: %s\n", err ? err : sqlite3_errstr(rc));
        sqlite3_free(err);
        sqlite3_close(db);
        return 1;
    }

    SqliteOffsetStore offsets(db);
    SqliteChunkSource source(db);
    const auto users = TableId::parse("users");

    // 1. Snapshot the first chunk, with a concurrent change inside its window.
    std::printf("=== First chunk ===\n");
    OffsetRecord committed;
    {
        SnapshotCoordinator coord;
        coord.handle_signal(AddDataCollectionsSignal{{"users", "orders"}});

        SnapshotDriver driver(coord, source,
            [&](const TableId& t, const SnapshotRow& row) {
                std::printf("  [snapshot] %s %s\n", t.to_string().c_str(),
                            to_string(row.key).c_str());
                if (row.key == Key{std::int64_t{2}}) {
                    stream_change(coord, users, 4);
                    stream_change(coord, users, 1);
                }
            },
            SnapshotConfig{5});
        driver.step();

        committed = coord.store(OffsetRecord{{"lsn", "1001"}});
        offsets.commit("example", committed);
        std::printf("Committed offsets:\n");
        print_offsets(committed);
    }

    // 2. "Restart": resume from the committed offsets.
    std::printf("\n=== Resume after restart ===\n");
    SnapshotCoordinator coord(IncrementalSnapshotContext::restore(offsets.load("example")));
    SnapshotDriver driver(coord, source,
        [&](const TableId& t, const SnapshotRow& row) {
            std::printf("  [snapshot] %s %s\n", t.to_string().c_str(),
                        to_string(row.key).c_str());
        },
        SnapshotConfig{5});
    auto rows = driver.run();

    offsets.commit("example", coord.store(OffsetRecord{{"lsn", "1002"}}));
    std::printf("\nResumed snapshot emitted %zu rows. Final offsets:\n", rows);
    print_offsets(offsets.load("example"));

    sqlite3_close(db);
    return 0;
}
