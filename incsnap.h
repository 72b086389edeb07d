// Copyright 2026 The incsnap Authors
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// ── types.h ─────────────────────────────────────────────────────
namespace incsnap {

/// Raw byte string.
using Bytes = std::vector<std::uint8_t>;

/// Arbitrary-precision decimal: unscaled * 10^-scale.
/// `unscaled` is a run of ASCII digits with an optional leading '-'.
struct Decimal {
    std::string  unscaled;
    std::int32_t scale = 0;

    bool operator==(const Decimal&) const = default;
};

/// Calendar date as days since 1970-01-01.
struct Date {
    std::int32_t days = 0;

    bool operator==(const Date&) const = default;
};

/// Time of day in microseconds since midnight.
struct Time {
    std::int64_t micros = 0;

    bool operator==(const Time&) const = default;
};

/// UTC instant in microseconds since the epoch.
struct Timestamp {
    std::int64_t micros = 0;

    bool operator==(const Timestamp&) const = default;
};

/// One primary key column value. Alternative order is significant: it is
/// the cross-type ordering used by compare_values().
using Value = std::variant<
    std::monostate,  // NULL
    bool,
    std::int64_t,
    double,
    Decimal,
    Date,
    Time,
    Timestamp,
    std::string,
    Bytes
>;

/// Composite primary key, one Value per key column in key order.
using Key = std::vector<Value>;

/// Three-way comparison in the natural column ordering.
/// Returns <0, 0 or >0. Values of different types order by type.
int compare_values(const Value& a, const Value& b);

/// Lexicographic comparison of two keys; a proper prefix orders first.
int compare_keys(const Key& a, const Key& b);

/// Human-readable rendering for logs, e.g. "[5, 'abc']".
std::string to_string(const Value& v);
std::string to_string(const Key& key);

/// Durable offset record of a connector task, merged with other offsets
/// owned by the caller.
using OffsetRecord = std::map<std::string, std::string>;

} // namespace incsnap

// ── error.h ─────────────────────────────────────────────────────
namespace incsnap {

/// Error codes returned by incsnap operations.
enum class ErrorCode : int {
    Ok = 0,
    CodecError,    ///< Malformed persisted key or identifier text.
    SqliteError,   ///< An underlying SQLite call failed.
    InvalidState,  ///< Operation not valid in the current state.
};

/// Exception thrown by incsnap operations.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace incsnap

// ── key_codec.h ─────────────────────────────────────────────────
namespace incsnap {

inline constexpr std::uint8_t kKeyFormatVersion = 1;

/// Type tags of the key encoding. Values are part of the persisted format.
enum class ValueTag : std::uint8_t {
    Null      = 0x00,
    Bool      = 0x01,
    Int64     = 0x02,
    Double    = 0x03,
    Decimal   = 0x04,
    Date      = 0x05,
    Time      = 0x06,
    Timestamp = 0x07,
    Text      = 0x08,
    Bytes     = 0x09,
};

/// Encode a key as lowercase hex of:
/// [1-byte version][4-byte count LE] then per value [1-byte tag][payload].
std::string encode_key(const Key& key);

/// Inverse of encode_key(). Throws Error(CodecError) naming `field` and
/// `text` if the text is not a valid encoding.
Key decode_key(std::string_view field, std::string_view text);

} // namespace incsnap

// ── table_id.h ──────────────────────────────────────────────────
namespace incsnap {

/// Identifies one table. Empty components are omitted from the string form.
struct TableId {
    std::string catalog;
    std::string schema;
    std::string table;

    /// Parse "table", "a.table" or "catalog.schema.table". Parts may be
    /// double-quoted to contain '.'. With two parts, the first is the
    /// catalog if `catalog_before_schema`, the schema otherwise.
    static TableId parse(std::string_view text, bool catalog_before_schema = true);

    /// Dot-joined form accepted by parse().
    std::string to_string() const;

    bool operator==(const TableId&) const = default;
};

} // namespace incsnap

// ── collection_queue.h ──────────────────────────────────────────
namespace incsnap {

/// FIFO of tables still awaiting a snapshot pass. The head is the table
/// being scanned.
class DataCollectionQueue {
public:
    void enqueue_all(const std::vector<TableId>& ids);

    std::optional<TableId> peek_head() const;
    std::optional<TableId> dequeue_head();

    std::size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }
    void clear() { ids_.clear(); }

    const std::deque<TableId>& ids() const { return ids_; }

    /// Comma-joined identifiers in queue order. Commas inside identifiers
    /// are not escaped.
    std::string to_persistable_string() const;

    static DataCollectionQueue from_persistable_string(
        std::string_view s, bool catalog_before_schema = true);

private:
    std::deque<TableId> ids_;
};

/// Split a comma-joined identifier list into its parts.
std::vector<std::string> split_data_collections(std::string_view s);

} // namespace incsnap

// ── snapshot_context.h ──────────────────────────────────────────
namespace incsnap {

inline constexpr const char* kDataCollectionsKey = "incremental_snapshot_collections";
inline constexpr const char* kEventPrimaryKey    = "incremental_snapshot_primary_key";
inline constexpr const char* kTableMaximumKey    = "incremental_snapshot_maximum_key";

/// State of an incremental snapshot: the tables left to scan and the
/// position of the chunk in flight.
///
/// Not thread-safe. Shared access goes through SnapshotCoordinator.
class IncrementalSnapshotContext {
public:
    explicit IncrementalSnapshotContext(bool catalog_before_schema = true);

    /// Rebuild a context from persisted offsets. The persisted primary key
    /// becomes the chunk end position so the first chunk after a restart
    /// resumes after the last row sent. No chunk id survives.
    static IncrementalSnapshotContext restore(const OffsetRecord& offset,
                                              bool catalog_before_schema = true);

    /// Merge the snapshot state into `offset`. Returns `offset` unchanged
    /// when no snapshot is running.
    OffsetRecord store(OffsetRecord offset) const;

    /// Window signals are accepted only if `id` starts with the current
    /// chunk id. Mismatches are logged and ignored.
    bool open_window(const std::string& id);
    bool close_window(const std::string& id);
    bool deduplication_needed() const { return window_opened_; }

    void start_new_chunk();
    const std::optional<std::string>& current_chunk_id() const { return current_chunk_id_; }

    void send_event(Key key);
    const std::optional<Key>& last_event_key_sent() const { return last_event_key_sent_; }

    void next_chunk_position(Key end);
    const std::optional<Key>& chunk_end_position() const { return chunk_end_position_; }
    bool is_non_initial_chunk() const { return chunk_end_position_.has_value(); }

    /// Abandon the chunk in flight; the next chunk restarts after the last
    /// row actually sent.
    void revert_chunk();

    /// Reset the chunk state and pop the head table.
    std::optional<TableId> next_data_collection();

    void maximum_key(Key key);
    const std::optional<Key>& maximum_key() const { return maximum_key_; }

    /// Parse `names` and append them to the queue. Returns the parsed ids.
    std::vector<TableId> add_data_collections(const std::vector<std::string>& names);

    /// Drop every queued table and the chunk state.
    void stop_snapshot();

    bool snapshot_running() const { return !data_collections_.empty(); }
    std::optional<TableId> current_data_collection_id() const { return data_collections_.peek_head(); }
    std::size_t tables_to_be_snapshotted_count() const { return data_collections_.size(); }
    const DataCollectionQueue& data_collections() const { return data_collections_; }

    std::string to_string() const;

private:
    bool not_expected_chunk(const std::string& id) const;
    void reset_chunk();

    bool                       catalog_before_schema_;
    bool                       window_opened_ = false;
    DataCollectionQueue        data_collections_;
    std::optional<std::string> current_chunk_id_;
    std::optional<Key>         chunk_end_position_;
    std::optional<Key>         last_event_key_sent_;
    std::optional<Key>         maximum_key_;
};

} // namespace incsnap

// ── signal.h ────────────────────────────────────────────────────
namespace incsnap {

/// Opens the deduplication window of the chunk whose id prefixes `id`.
struct OpenWindowSignal {
    std::string id;
};

/// Closes the deduplication window of the chunk whose id prefixes `id`.
struct CloseWindowSignal {
    std::string id;
};

/// Adds tables to the running (or a new) incremental snapshot.
struct AddDataCollectionsSignal {
    std::vector<std::string> names;
};

/// Abandons the incremental snapshot.
struct StopSnapshotSignal {};

using Signal = std::variant<
    OpenWindowSignal,
    CloseWindowSignal,
    AddDataCollectionsSignal,
    StopSnapshotSignal
>;

} // namespace incsnap

// ── coordinator.h ───────────────────────────────────────────────
namespace incsnap {

/// Sole owner of an IncrementalSnapshotContext. Every access, from the
/// scan loop, the change stream consumer or the signal handler, is
/// serialized on one mutex.
class SnapshotCoordinator {
public:
    explicit SnapshotCoordinator(
        IncrementalSnapshotContext context = IncrementalSnapshotContext{});

    SnapshotCoordinator(const SnapshotCoordinator&) = delete;
    SnapshotCoordinator& operator=(const SnapshotCoordinator&) = delete;

    /// Run `fn(IncrementalSnapshotContext&)` under the lock.
    template <typename Fn>
    auto with_context(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(context_);
    }

    /// True if a change event for `key` in `table` overlaps the open chunk
    /// window, i.e. falls within [last event sent, chunk end], and must be
    /// dropped in favour of the snapshot row.
    bool should_suppress(const TableId& table, const Key& key);

    /// Apply a control signal. Returns false if it was ignored.
    bool handle_signal(const Signal& signal);

    OffsetRecord store(OffsetRecord offset);

    bool snapshot_running();

private:
    std::mutex                 mutex_;
    IncrementalSnapshotContext context_;
};

} // namespace incsnap

// ── chunk_source.h ──────────────────────────────────────────────
namespace incsnap {

/// One row read by a chunk query.
struct SnapshotRow {
    Key                key;
    std::vector<Value> values;  // all columns, in table order
};

/// Executes the bounded range reads of an incremental snapshot.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    /// Largest key currently in `table`, or empty if the table has no rows.
    virtual std::optional<Key> max_key(const TableId& table) = 0;

    /// Rows with after < key <= upper (no lower bound if `after` is empty),
    /// ordered by key, at most `limit` of them.
    virtual std::vector<SnapshotRow> read_chunk(
        const TableId& table, const std::optional<Key>& after,
        const Key& upper, std::size_t limit) = 0;
};

/// ChunkSource over SQLite tables with explicit PRIMARY KEYs.
/// The schema component of a TableId names the attached database, or the
/// catalog when there is no schema. Setting both is an InvalidState error.
///
/// Does NOT own the sqlite3* handle. Caller must keep it open for
/// the source's lifetime.
class SqliteChunkSource : public ChunkSource {
public:
    explicit SqliteChunkSource(sqlite3* db);
    ~SqliteChunkSource() override;

    SqliteChunkSource(const SqliteChunkSource&) = delete;
    SqliteChunkSource& operator=(const SqliteChunkSource&) = delete;

    std::optional<Key> max_key(const TableId& table) override;

    std::vector<SnapshotRow> read_chunk(
        const TableId& table, const std::optional<Key>& after,
        const Key& upper, std::size_t limit) override;

    /// Primary key column names of `table`, in key order.
    std::vector<std::string> key_columns(const TableId& table);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace incsnap

// ── driver.h ────────────────────────────────────────────────────
namespace incsnap {

struct SnapshotConfig {
    /// Maximum number of rows fetched per chunk.
    std::size_t chunk_size = 1024;
};

/// Called once per snapshot row, in key order.
using RowCallback = std::function<void(const TableId&, const SnapshotRow&)>;

/// Drives the chunk loop of an incremental snapshot.
///
/// Does NOT own the coordinator or the source.
class SnapshotDriver {
public:
    SnapshotDriver(SnapshotCoordinator& coordinator, ChunkSource& source,
                   RowCallback on_row, SnapshotConfig config = {});
    ~SnapshotDriver();

    SnapshotDriver(const SnapshotDriver&) = delete;
    SnapshotDriver& operator=(const SnapshotDriver&) = delete;
    SnapshotDriver(SnapshotDriver&&) noexcept;
    SnapshotDriver& operator=(SnapshotDriver&&) noexcept;

    /// Process one chunk. Returns false once no table is left.
    /// On failure the chunk is reverted and the exception propagates.
    bool step();

    /// Call step() until the snapshot completes. Returns the number of
    /// rows emitted.
    std::size_t run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace incsnap

// ── offset_store.h ──────────────────────────────────────────────
namespace incsnap {

/// Persists offset records per source partition in _incsnap_offsets.
///
/// Does NOT own the sqlite3* handle. Caller must keep it open for
/// the store's lifetime.
class SqliteOffsetStore {
public:
    explicit SqliteOffsetStore(sqlite3* db);

    /// Empty record if nothing was committed for `partition`.
    OffsetRecord load(const std::string& partition) const;

    /// Atomically replace the record stored for `partition`.
    void commit(const std::string& partition, const OffsetRecord& offset);

private:
    sqlite3* db_;
};

} // namespace incsnap
