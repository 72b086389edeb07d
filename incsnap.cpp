// Copyright 2026 The incsnap Authors
// SPDX-License-Identifier: Apache-2.0
#include "incsnap.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <random>
#include <span>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <utility>

// ── sqlite_util.h ───────────────────────────────────────────────
namespace incsnap::detail {

/// RAII wrapper for sqlite3_stmt*.
class StmtGuard {
public:
    StmtGuard() = default;
    explicit StmtGuard(sqlite3_stmt* s) : stmt_(s) {}
    ~StmtGuard() { if (stmt_) sqlite3_finalize(stmt_); }

    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
    StmtGuard(StmtGuard&& o) noexcept : stmt_(o.stmt_) { o.stmt_ = nullptr; }
    StmtGuard& operator=(StmtGuard&& o) noexcept {
        if (this != &o) {
            if (stmt_) sqlite3_finalize(stmt_);
            stmt_ = o.stmt_;
            o.stmt_ = nullptr;
        }
        return *this;
    }

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/// Execute SQL or throw.
inline void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw Error(ErrorCode::SqliteError, msg);
    }
}

/// Prepare a statement or throw.
inline StmtGuard prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
    return StmtGuard(stmt);
}

/// Step a statement expecting SQLITE_DONE, or throw.
inline void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
}

/// Quote an SQL identifier, doubling embedded quotes.
inline std::string quote_ident(const std::string& ident) {
    std::string out = "\"";
    for (char c : ident) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace incsnap::detail

// ── value.cpp ───────────────────────────────────────────────────
namespace incsnap {

namespace {

template <typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

struct DecimalParts {
    int              sign;    // -1, 0 or 1
    std::string_view digits;  // no leading zeros
};

DecimalParts split_decimal(const Decimal& d) {
    std::string_view s = d.unscaled;
    bool negative = !s.empty() && s.front() == '-';
    if (negative) s.remove_prefix(1);
    while (!s.empty() && s.front() == '0') s.remove_prefix(1);
    if (s.empty()) return {0, s};
    return {negative ? -1 : 1, s};
}

int compare_decimals(const Decimal& a, const Decimal& b) {
    auto pa = split_decimal(a);
    auto pb = split_decimal(b);
    if (pa.sign != pb.sign) return three_way(pa.sign, pb.sign);
    if (pa.sign == 0) return 0;

    // Both values are 0.d1d2... * 10^exp with exp = digits - scale.
    auto ea = static_cast<std::int64_t>(pa.digits.size()) - a.scale;
    auto eb = static_cast<std::int64_t>(pb.digits.size()) - b.scale;
    int magnitude = three_way(ea, eb);
    auto n = std::max(pa.digits.size(), pb.digits.size());
    for (std::size_t i = 0; i < n && magnitude == 0; ++i) {
        char ca = i < pa.digits.size() ? pa.digits[i] : '0';
        char cb = i < pb.digits.size() ? pb.digits[i] : '0';
        magnitude = three_way(ca, cb);
    }
    return pa.sign * magnitude;
}

// Exact integer/real comparison; a double cannot hold every int64.
int compare_int_double(std::int64_t i, double d) {
    if (std::isnan(d)) return 0;
    if (d >= 9223372036854775808.0) return -1;
    if (d < -9223372036854775808.0) return 1;

    double whole = std::trunc(d);
    auto t = static_cast<std::int64_t>(whole);
    if (i != t) return three_way(i, t);
    return three_way(0.0, d - whole);
}

} // namespace

int compare_values(const Value& a, const Value& b) {
    // Integers and reals share one numeric ordering, as in SQL.
    if (std::holds_alternative<std::int64_t>(a) && std::holds_alternative<double>(b)) {
        return compare_int_double(std::get<std::int64_t>(a), std::get<double>(b));
    }
    if (std::holds_alternative<double>(a) && std::holds_alternative<std::int64_t>(b)) {
        return -compare_int_double(std::get<std::int64_t>(b), std::get<double>(a));
    }
    if (a.index() != b.index()) return three_way(a.index(), b.index());

    return std::visit([&](const auto& x) -> int {
        using T = std::decay_t<decltype(x)>;
        const auto& y = std::get<T>(b);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return 0;
        }
        else if constexpr (std::is_same_v<T, Decimal>) {
            return compare_decimals(x, y);
        }
        else if constexpr (std::is_same_v<T, Date>) {
            return three_way(x.days, y.days);
        }
        else if constexpr (std::is_same_v<T, Time> || std::is_same_v<T, Timestamp>) {
            return three_way(x.micros, y.micros);
        }
        else {
            return three_way(x, y);
        }
    }, a);
}

int compare_keys(const Key& a, const Key& b) {
    auto n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        int c = compare_values(a[i], b[i]);
        if (c != 0) return c;
    }
    return three_way(a.size(), b.size());
}

std::string to_string(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        }
        else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        }
        else if constexpr (std::is_same_v<T, Decimal>) {
            return fmt::format("{}E{}", x.unscaled, -static_cast<std::int64_t>(x.scale));
        }
        else if constexpr (std::is_same_v<T, Date>) {
            return fmt::format("date({})", x.days);
        }
        else if constexpr (std::is_same_v<T, Time>) {
            return fmt::format("time({})", x.micros);
        }
        else if constexpr (std::is_same_v<T, Timestamp>) {
            return fmt::format("timestamp({})", x.micros);
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + x + "'";
        }
        else if constexpr (std::is_same_v<T, Bytes>) {
            std::string out = "0x";
            for (auto b : x) out += fmt::format("{:02x}", b);
            return out;
        }
        else {
            return fmt::format("{}", x);
        }
    }, v);
}

std::string to_string(const Key& key) {
    std::string out = "[";
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (i > 0) out += ", ";
        out += to_string(key[i]);
    }
    out += "]";
    return out;
}

} // namespace incsnap

// ── key_codec.cpp ───────────────────────────────────────────────
namespace incsnap {

namespace {

// ── Little-endian encoding helpers ──────────────────────────────────

void put_u8(std::vector<std::uint8_t>& buf, std::uint8_t v) {
    buf.push_back(v);
}

void put_u32(std::vector<std::uint8_t>& buf, std::uint32_t v) {
    buf.push_back(static_cast<std::uint8_t>(v));
    buf.push_back(static_cast<std::uint8_t>(v >> 8));
    buf.push_back(static_cast<std::uint8_t>(v >> 16));
    buf.push_back(static_cast<std::uint8_t>(v >> 24));
}

void put_i32(std::vector<std::uint8_t>& buf, std::int32_t v) {
    put_u32(buf, static_cast<std::uint32_t>(v));
}

void put_u64(std::vector<std::uint8_t>& buf, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<std::uint8_t>(v >> (i * 8)));
    }
}

void put_i64(std::vector<std::uint8_t>& buf, std::int64_t v) {
    put_u64(buf, static_cast<std::uint64_t>(v));
}

void put_bytes(std::vector<std::uint8_t>& buf,
               const void* data, std::uint32_t len) {
    put_u32(buf, len);
    auto* p = static_cast<const std::uint8_t*>(data);
    buf.insert(buf.end(), p, p + len);
}

void put_string(std::vector<std::uint8_t>& buf, const std::string& s) {
    put_bytes(buf, s.data(), static_cast<std::uint32_t>(s.size()));
}

void put_tag(std::vector<std::uint8_t>& buf, ValueTag tag) {
    put_u8(buf, static_cast<std::uint8_t>(tag));
}

// ── Reader for decoding ─────────────────────────────────────────────

class Reader {
public:
    Reader(std::span<const std::uint8_t> buf)
        : data_(buf.data()), size_(buf.size()), pos_(0) {}

    std::uint8_t read_u8() {
        check(1);
        return data_[pos_++];
    }

    std::uint32_t read_u32() {
        check(4);
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i)
            v |= static_cast<std::uint32_t>(data_[pos_++]) << (i * 8);
        return v;
    }

    std::int32_t read_i32() {
        return static_cast<std::int32_t>(read_u32());
    }

    std::uint64_t read_u64() {
        check(8);
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i)
            v |= static_cast<std::uint64_t>(data_[pos_++]) << (i * 8);
        return v;
    }

    std::int64_t read_i64() {
        return static_cast<std::int64_t>(read_u64());
    }

    std::string read_string() {
        auto len = read_u32();
        check(len);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len;
        return s;
    }

    Bytes read_bytes() {
        auto len = read_u32();
        check(len);
        Bytes b(data_ + pos_, data_ + pos_ + len);
        pos_ += len;
        return b;
    }

    bool at_end() const { return pos_ >= size_; }

private:
    void check(std::size_t n) {
        if (n > size_ - pos_) {
            throw Error(ErrorCode::CodecError, "unexpected end of key");
        }
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string to_hex(const std::vector<std::uint8_t>& buf) {
    std::string out;
    out.reserve(buf.size() * 2);
    for (auto b : buf) {
        out += kHexDigits[b >> 4];
        out += kHexDigits[b & 0x0f];
    }
    return out;
}

std::vector<std::uint8_t> from_hex(std::string_view text) {
    if (text.size() % 2 != 0) {
        throw Error(ErrorCode::CodecError, "odd number of hex digits");
    }
    std::vector<std::uint8_t> buf;
    buf.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            throw Error(ErrorCode::CodecError,
                        "invalid hex digit at offset " + std::to_string(hi < 0 ? i : i + 1));
        }
        buf.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return buf;
}

bool valid_unscaled(const std::string& s) {
    std::size_t start = (!s.empty() && s.front() == '-') ? 1 : 0;
    if (start == s.size()) return false;
    return std::all_of(s.begin() + static_cast<std::ptrdiff_t>(start), s.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

void put_value(std::vector<std::uint8_t>& buf, const Value& value) {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            put_tag(buf, ValueTag::Null);
        }
        else if constexpr (std::is_same_v<T, bool>) {
            put_tag(buf, ValueTag::Bool);
            put_u8(buf, v ? 1 : 0);
        }
        else if constexpr (std::is_same_v<T, std::int64_t>) {
            put_tag(buf, ValueTag::Int64);
            put_i64(buf, v);
        }
        else if constexpr (std::is_same_v<T, double>) {
            put_tag(buf, ValueTag::Double);
            std::uint64_t bits = 0;
            std::memcpy(&bits, &v, sizeof(bits));
            put_u64(buf, bits);
        }
        else if constexpr (std::is_same_v<T, Decimal>) {
            if (!valid_unscaled(v.unscaled)) {
                throw Error(ErrorCode::CodecError,
                            "invalid decimal digits '" + v.unscaled + "'");
            }
            put_tag(buf, ValueTag::Decimal);
            put_i32(buf, v.scale);
            put_string(buf, v.unscaled);
        }
        else if constexpr (std::is_same_v<T, Date>) {
            put_tag(buf, ValueTag::Date);
            put_i32(buf, v.days);
        }
        else if constexpr (std::is_same_v<T, Time>) {
            put_tag(buf, ValueTag::Time);
            put_i64(buf, v.micros);
        }
        else if constexpr (std::is_same_v<T, Timestamp>) {
            put_tag(buf, ValueTag::Timestamp);
            put_i64(buf, v.micros);
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            put_tag(buf, ValueTag::Text);
            put_string(buf, v);
        }
        else if constexpr (std::is_same_v<T, Bytes>) {
            put_tag(buf, ValueTag::Bytes);
            put_bytes(buf, v.data(), static_cast<std::uint32_t>(v.size()));
        }
    }, value);
}

Value read_value(Reader& r) {
    auto tag = static_cast<ValueTag>(r.read_u8());

    switch (tag) {
    case ValueTag::Null:
        return std::monostate{};
    case ValueTag::Bool: {
        auto b = r.read_u8();
        if (b > 1) {
            throw Error(ErrorCode::CodecError,
                        "invalid bool byte: " + std::to_string(b));
        }
        return b == 1;
    }
    case ValueTag::Int64:
        return r.read_i64();
    case ValueTag::Double: {
        auto bits = r.read_u64();
        double d = 0;
        std::memcpy(&d, &bits, sizeof(d));
        return d;
    }
    case ValueTag::Decimal: {
        Decimal d;
        d.scale = r.read_i32();
        d.unscaled = r.read_string();
        if (!valid_unscaled(d.unscaled)) {
            throw Error(ErrorCode::CodecError,
                        "invalid decimal digits '" + d.unscaled + "'");
        }
        return d;
    }
    case ValueTag::Date:
        return Date{r.read_i32()};
    case ValueTag::Time:
        return Time{r.read_i64()};
    case ValueTag::Timestamp:
        return Timestamp{r.read_i64()};
    case ValueTag::Text:
        return r.read_string();
    case ValueTag::Bytes:
        return r.read_bytes();
    default:
        throw Error(ErrorCode::CodecError,
                    "unknown value tag: " +
                    std::to_string(static_cast<int>(tag)));
    }
}

} // namespace

std::string encode_key(const Key& key) {
    std::vector<std::uint8_t> buf;
    put_u8(buf, kKeyFormatVersion);
    put_u32(buf, static_cast<std::uint32_t>(key.size()));
    for (const auto& v : key) {
        put_value(buf, v);
    }
    return to_hex(buf);
}

Key decode_key(std::string_view field, std::string_view text) {
    try {
        auto buf = from_hex(text);
        Reader r(buf);

        auto version = r.read_u8();
        if (version != kKeyFormatVersion) {
            throw Error(ErrorCode::CodecError,
                        "unsupported key format version " + std::to_string(version));
        }

        auto count = r.read_u32();
        Key key;
        for (std::uint32_t i = 0; i < count; ++i) {
            key.push_back(read_value(r));
        }
        if (!r.at_end()) {
            throw Error(ErrorCode::CodecError, "trailing bytes after key");
        }
        return key;
    } catch (const Error& e) {
        throw Error(ErrorCode::CodecError,
                    fmt::format("failed to deserialize '{}' with value '{}': {}",
                                field, text, e.what()));
    }
}

} // namespace incsnap

// ── table_id.cpp ────────────────────────────────────────────────
namespace incsnap {

namespace {

[[noreturn]] void invalid_table_id(std::string_view text, const char* reason) {
    throw Error(ErrorCode::CodecError,
                fmt::format("invalid table identifier '{}': {}", text, reason));
}

std::string quote_part(const std::string& part) {
    if (part.find_first_of(".\"") == std::string::npos) return part;
    std::string out = "\"";
    for (char c : part) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

TableId TableId::parse(std::string_view text, bool catalog_before_schema) {
    std::vector<std::string> parts;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quoted) {
            if (c != '"') {
                current += c;
            } else if (i + 1 < text.size() && text[i + 1] == '"') {
                current += '"';
                ++i;
            } else {
                quoted = false;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == '.') {
            parts.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (quoted) invalid_table_id(text, "unterminated quote");
    parts.push_back(std::move(current));

    if (parts.size() > 3) invalid_table_id(text, "too many components");
    for (const auto& p : parts) {
        if (p.empty()) invalid_table_id(text, "empty component");
    }

    TableId id;
    switch (parts.size()) {
    case 3:
        id.catalog = std::move(parts[0]);
        id.schema = std::move(parts[1]);
        id.table = std::move(parts[2]);
        break;
    case 2:
        if (catalog_before_schema) {
            id.catalog = std::move(parts[0]);
        } else {
            id.schema = std::move(parts[0]);
        }
        id.table = std::move(parts[1]);
        break;
    default:
        id.table = std::move(parts[0]);
        break;
    }
    return id;
}

std::string TableId::to_string() const {
    std::string out;
    for (const auto* part : {&catalog, &schema, &table}) {
        if (part->empty()) continue;
        if (!out.empty()) out += '.';
        out += quote_part(*part);
    }
    return out;
}

} // namespace incsnap

// ── collection_queue.cpp ────────────────────────────────────────
namespace incsnap {

void DataCollectionQueue::enqueue_all(const std::vector<TableId>& ids) {
    ids_.insert(ids_.end(), ids.begin(), ids.end());
}

std::optional<TableId> DataCollectionQueue::peek_head() const {
    if (ids_.empty()) return std::nullopt;
    return ids_.front();
}

std::optional<TableId> DataCollectionQueue::dequeue_head() {
    if (ids_.empty()) return std::nullopt;
    TableId head = std::move(ids_.front());
    ids_.pop_front();
    return head;
}

std::string DataCollectionQueue::to_persistable_string() const {
    std::string out;
    for (const auto& id : ids_) {
        if (!out.empty()) out += ',';
        out += id.to_string();
    }
    return out;
}

DataCollectionQueue DataCollectionQueue::from_persistable_string(
    std::string_view s, bool catalog_before_schema) {
    std::vector<TableId> ids;
    for (const auto& name : split_data_collections(s)) {
        ids.push_back(TableId::parse(name, catalog_before_schema));
    }
    DataCollectionQueue queue;
    queue.enqueue_all(ids);
    return queue;
}

std::vector<std::string> split_data_collections(std::string_view s) {
    std::vector<std::string> names;
    if (s.empty()) return names;

    std::size_t start = 0;
    while (true) {
        auto comma = s.find(',', start);
        if (comma == std::string_view::npos) {
            names.emplace_back(s.substr(start));
            break;
        }
        names.emplace_back(s.substr(start, comma - start));
        start = comma + 1;
    }
    return names;
}

} // namespace incsnap

// ── snapshot_context.cpp ────────────────────────────────────────
namespace incsnap::detail {

/// Random (version 4) UUID in canonical text form.
std::string generate_chunk_id() {
    thread_local std::mt19937_64 rng = [] {
        std::random_device rd;
        std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seed);
    }();

    std::uint64_t hi = rng();
    std::uint64_t lo = rng();
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff,
                       lo >> 48, lo & 0xffffffffffffULL);
}

} // namespace incsnap::detail

namespace incsnap {

namespace {

void put_key(OffsetRecord& offset, const char* name, const std::optional<Key>& key) {
    if (key) {
        offset[name] = encode_key(*key);
    } else {
        offset.erase(name);
    }
}

const std::string* find_field(const OffsetRecord& offset, const char* name) {
    auto it = offset.find(name);
    return it == offset.end() ? nullptr : &it->second;
}

std::string optional_key_string(const std::optional<Key>& key) {
    return key ? to_string(*key) : "null";
}

} // namespace

IncrementalSnapshotContext::IncrementalSnapshotContext(bool catalog_before_schema)
    : catalog_before_schema_(catalog_before_schema) {}

bool IncrementalSnapshotContext::open_window(const std::string& id) {
    if (not_expected_chunk(id)) {
        SPDLOG_INFO("received request to open window with id = '{}', expected = '{}', request ignored",
                    id, current_chunk_id_.value_or(""));
        return false;
    }
    SPDLOG_DEBUG("opening window for incremental snapshot chunk");
    window_opened_ = true;
    return true;
}

bool IncrementalSnapshotContext::close_window(const std::string& id) {
    if (not_expected_chunk(id)) {
        SPDLOG_INFO("received request to close window with id = '{}', expected = '{}', request ignored",
                    id, current_chunk_id_.value_or(""));
        return false;
    }
    SPDLOG_DEBUG("closing window for incremental snapshot chunk");
    window_opened_ = false;
    return true;
}

// Window signals may be replayed after a restart, or arrive after the
// snapshot completed. Only the chunk in flight may toggle the window.
bool IncrementalSnapshotContext::not_expected_chunk(const std::string& id) const {
    return !current_chunk_id_ || !id.starts_with(*current_chunk_id_);
}

void IncrementalSnapshotContext::start_new_chunk() {
    current_chunk_id_ = detail::generate_chunk_id();
    SPDLOG_DEBUG("starting new chunk with id '{}'", *current_chunk_id_);
}

void IncrementalSnapshotContext::send_event(Key key) {
    last_event_key_sent_ = std::move(key);
}

void IncrementalSnapshotContext::next_chunk_position(Key end) {
    chunk_end_position_ = std::move(end);
}

void IncrementalSnapshotContext::revert_chunk() {
    chunk_end_position_ = last_event_key_sent_;
    window_opened_ = false;
}

void IncrementalSnapshotContext::reset_chunk() {
    last_event_key_sent_.reset();
    chunk_end_position_.reset();
    maximum_key_.reset();
}

std::optional<TableId> IncrementalSnapshotContext::next_data_collection() {
    reset_chunk();
    return data_collections_.dequeue_head();
}

void IncrementalSnapshotContext::maximum_key(Key key) {
    maximum_key_ = std::move(key);
}

std::vector<TableId> IncrementalSnapshotContext::add_data_collections(
    const std::vector<std::string>& names) {
    std::vector<TableId> ids;
    ids.reserve(names.size());
    for (const auto& name : names) {
        ids.push_back(TableId::parse(name, catalog_before_schema_));
    }
    data_collections_.enqueue_all(ids);
    return ids;
}

void IncrementalSnapshotContext::stop_snapshot() {
    reset_chunk();
    data_collections_.clear();
    current_chunk_id_.reset();
    window_opened_ = false;
}

OffsetRecord IncrementalSnapshotContext::store(OffsetRecord offset) const {
    if (!snapshot_running()) {
        return offset;
    }
    put_key(offset, kEventPrimaryKey, last_event_key_sent_);
    put_key(offset, kTableMaximumKey, maximum_key_);
    offset[kDataCollectionsKey] = data_collections_.to_persistable_string();
    return offset;
}

IncrementalSnapshotContext IncrementalSnapshotContext::restore(
    const OffsetRecord& offset, bool catalog_before_schema) {
    IncrementalSnapshotContext context(catalog_before_schema);

    if (const auto* s = find_field(offset, kEventPrimaryKey)) {
        auto key = decode_key(kEventPrimaryKey, *s);
        context.chunk_end_position_ = key;
        context.last_event_key_sent_ = std::move(key);
    }
    if (const auto* s = find_field(offset, kTableMaximumKey)) {
        context.maximum_key_ = decode_key(kTableMaximumKey, *s);
    }
    if (const auto* s = find_field(offset, kDataCollectionsKey)) {
        try {
            context.data_collections_ =
                DataCollectionQueue::from_persistable_string(*s, catalog_before_schema);
        } catch (const Error& e) {
            throw Error(ErrorCode::CodecError,
                        fmt::format("failed to deserialize '{}' with value '{}': {}",
                                    kDataCollectionsKey, *s, e.what()));
        }
    }

    if (context.snapshot_running()) {
        SPDLOG_INFO("resuming incremental snapshot: {}", context.to_string());
    }
    return context;
}

std::string IncrementalSnapshotContext::to_string() const {
    return fmt::format(
        "IncrementalSnapshotContext [window_opened={}, chunk_end_position={}, "
        "data_collections_to_snapshot=[{}], last_event_key_sent={}, maximum_key={}]",
        window_opened_, optional_key_string(chunk_end_position_),
        data_collections_.to_persistable_string(),
        optional_key_string(last_event_key_sent_),
        optional_key_string(maximum_key_));
}

} // namespace incsnap

// ── coordinator.cpp ─────────────────────────────────────────────
namespace incsnap {

SnapshotCoordinator::SnapshotCoordinator(IncrementalSnapshotContext context)
    : context_(std::move(context)) {}

bool SnapshotCoordinator::should_suppress(const TableId& table, const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!context_.deduplication_needed()) return false;

    auto head = context_.current_data_collection_id();
    if (!head || !(*head == table)) return false;

    const auto& end = context_.chunk_end_position();
    if (!end || compare_keys(key, *end) > 0) return false;

    const auto& last = context_.last_event_key_sent();
    if (last && compare_keys(key, *last) < 0) return false;

    return true;
}

bool SnapshotCoordinator::handle_signal(const Signal& signal) {
    std::lock_guard<std::mutex> lock(mutex_);

    return std::visit([&](const auto& s) -> bool {
        using T = std::decay_t<decltype(s)>;

        if constexpr (std::is_same_v<T, OpenWindowSignal>) {
            return context_.open_window(s.id);
        }
        else if constexpr (std::is_same_v<T, CloseWindowSignal>) {
            return context_.close_window(s.id);
        }
        else if constexpr (std::is_same_v<T, AddDataCollectionsSignal>) {
            auto added = context_.add_data_collections(s.names);
            for (const auto& id : added) {
                SPDLOG_INFO("table '{}' added to incremental snapshot", id.to_string());
            }
            return !added.empty();
        }
        else if constexpr (std::is_same_v<T, StopSnapshotSignal>) {
            SPDLOG_INFO("stopping incremental snapshot, {} tables left unsnapshotted",
                        context_.tables_to_be_snapshotted_count());
            context_.stop_snapshot();
            return true;
        }
    }, signal);
}

OffsetRecord SnapshotCoordinator::store(OffsetRecord offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.store(std::move(offset));
}

bool SnapshotCoordinator::snapshot_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.snapshot_running();
}

} // namespace incsnap

// ── chunk_source.cpp ────────────────────────────────────────────
namespace incsnap {

namespace {

/// Convert a result column to our Value variant.
Value column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_NULL:
        return std::monostate{};
    case SQLITE_INTEGER:
        return static_cast<std::int64_t>(sqlite3_column_int64(stmt, col));
    case SQLITE_FLOAT:
        return sqlite3_column_double(stmt, col);
    case SQLITE_TEXT: {
        auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        int len = sqlite3_column_bytes(stmt, col);
        return std::string(text, static_cast<std::size_t>(len));
    }
    case SQLITE_BLOB: {
        auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, col));
        int len = sqlite3_column_bytes(stmt, col);
        if (!data) return Bytes{};
        return Bytes(data, data + len);
    }
    default:
        return std::monostate{};
    }
}

/// Bind a key value. Temporal values bind as their integer encoding and
/// decimals as reals.
void bind_value(sqlite3* db, sqlite3_stmt* stmt, int idx, const Value& value) {
    int rc = std::visit([&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return sqlite3_bind_null(stmt, idx);
        }
        else if constexpr (std::is_same_v<T, bool>) {
            return sqlite3_bind_int(stmt, idx, v ? 1 : 0);
        }
        else if constexpr (std::is_same_v<T, std::int64_t>) {
            return sqlite3_bind_int64(stmt, idx, v);
        }
        else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, idx, v);
        }
        else if constexpr (std::is_same_v<T, Decimal>) {
            auto text = fmt::format("{}e{}", v.unscaled, -static_cast<std::int64_t>(v.scale));
            return sqlite3_bind_double(stmt, idx, std::strtod(text.c_str(), nullptr));
        }
        else if constexpr (std::is_same_v<T, Date>) {
            return sqlite3_bind_int64(stmt, idx, v.days);
        }
        else if constexpr (std::is_same_v<T, Time> || std::is_same_v<T, Timestamp>) {
            return sqlite3_bind_int64(stmt, idx, v.micros);
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt, idx, v.c_str(),
                                     static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
        else if constexpr (std::is_same_v<T, Bytes>) {
            if (v.empty()) return sqlite3_bind_zeroblob(stmt, idx, 0);
            return sqlite3_bind_blob(stmt, idx, v.data(),
                                     static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);

    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError,
                    std::string("bind key value: ") + sqlite3_errmsg(db));
    }
}

std::string join(const std::vector<std::string>& parts, const char* suffix = "") {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ", ";
        out += p;
        out += suffix;
    }
    return out;
}

} // namespace

struct SqliteChunkSource::Impl {
    sqlite3* db;

    // Quoted primary key columns, keyed by TableId string form.
    std::map<std::string, std::vector<std::string>> key_columns;

    // SQLite has one namespace level above tables: the attached database.
    // It may come from either the catalog or the schema component.
    std::string database_of(const TableId& table) const {
        if (!table.catalog.empty() && !table.schema.empty()) {
            throw Error(ErrorCode::InvalidState,
                        "table '" + table.to_string() +
                        "' has both catalog and schema; SQLite supports one database level");
        }
        return table.schema.empty() ? table.catalog : table.schema;
    }

    std::string qualified_name(const TableId& table) const {
        auto database = database_of(table);
        if (database.empty()) return detail::quote_ident(table.table);
        return detail::quote_ident(database) + "." + detail::quote_ident(table.table);
    }

    const std::vector<std::string>& columns_for(const TableId& table) {
        auto name = table.to_string();
        auto it = key_columns.find(name);
        if (it != key_columns.end()) return it->second;

        auto database = database_of(table);
        std::string pragma = "PRAGMA ";
        if (!database.empty()) pragma += detail::quote_ident(database) + ".";
        pragma += "table_info(" + detail::quote_ident(table.table) + ")";
        auto stmt = detail::prepare(db, pragma);

        bool found = false;
        std::vector<std::pair<int, std::string>> pk;
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            found = true;
            int ordinal = sqlite3_column_int(stmt.get(), 5);
            if (ordinal > 0) {
                auto* col = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
                pk.emplace_back(ordinal, col ? col : "");
            }
        }

        if (!found) {
            throw Error(ErrorCode::InvalidState, "table '" + name + "' not found");
        }
        if (pk.empty()) {
            throw Error(ErrorCode::InvalidState,
                        "table '" + name + "' has no explicit PRIMARY KEY");
        }

        std::sort(pk.begin(), pk.end());
        std::vector<std::string> cols;
        for (auto& [ordinal, col] : pk) {
            cols.push_back(detail::quote_ident(col));
        }
        SPDLOG_DEBUG("table '{}' key columns: {}", name, join(cols));
        return key_columns.emplace(name, std::move(cols)).first->second;
    }

    void check_arity(const TableId& table, const Key& key, std::size_t n) const {
        if (key.size() != n) {
            throw Error(ErrorCode::InvalidState,
                        fmt::format("key {} does not match the {} key columns of '{}'",
                                    to_string(key), n, table.to_string()));
        }
    }
};

SqliteChunkSource::SqliteChunkSource(sqlite3* db)
    : impl_(std::make_unique<Impl>()) {
    impl_->db = db;
}

SqliteChunkSource::~SqliteChunkSource() = default;

std::vector<std::string> SqliteChunkSource::key_columns(const TableId& table) {
    return impl_->columns_for(table);
}

std::optional<Key> SqliteChunkSource::max_key(const TableId& table) {
    const auto& cols = impl_->columns_for(table);

    auto sql = "SELECT " + join(cols) + " FROM " + impl_->qualified_name(table) +
               " ORDER BY " + join(cols, " DESC") + " LIMIT 1";
    auto stmt = detail::prepare(impl_->db, sql);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(impl_->db));
    }

    Key key;
    for (std::size_t i = 0; i < cols.size(); ++i) {
        key.push_back(column_value(stmt.get(), static_cast<int>(i)));
    }
    return key;
}

std::vector<SnapshotRow> SqliteChunkSource::read_chunk(
    const TableId& table, const std::optional<Key>& after,
    const Key& upper, std::size_t limit) {
    const auto& cols = impl_->columns_for(table);
    impl_->check_arity(table, upper, cols.size());
    if (after) impl_->check_arity(table, *after, cols.size());

    std::string tuple = "(" + join(cols) + ")";
    std::string params = "(" + join(std::vector<std::string>(cols.size(), "?")) + ")";

    std::string sql = "SELECT " + join(cols) + ", * FROM " + impl_->qualified_name(table) +
                      " WHERE ";
    if (after) sql += tuple + " > " + params + " AND ";
    sql += tuple + " <= " + params + " ORDER BY " + join(cols) + " LIMIT ?";

    auto stmt = detail::prepare(impl_->db, sql);
    int idx = 1;
    if (after) {
        for (const auto& v : *after) bind_value(impl_->db, stmt.get(), idx++, v);
    }
    for (const auto& v : upper) bind_value(impl_->db, stmt.get(), idx++, v);
    sqlite3_bind_int64(stmt.get(), idx, static_cast<sqlite3_int64>(limit));

    std::vector<SnapshotRow> rows;
    int n = static_cast<int>(cols.size());
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        SnapshotRow row;
        int total = sqlite3_column_count(stmt.get());
        for (int i = 0; i < n; ++i) {
            row.key.push_back(column_value(stmt.get(), i));
        }
        for (int i = n; i < total; ++i) {
            row.values.push_back(column_value(stmt.get(), i));
        }
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError,
                    std::string("read chunk: ") + sqlite3_errmsg(impl_->db));
    }
    return rows;
}

} // namespace incsnap

// ── driver.cpp ──────────────────────────────────────────────────
namespace incsnap {

struct SnapshotDriver::Impl {
    SnapshotCoordinator* coordinator;
    ChunkSource*         source;
    RowCallback          on_row;
    SnapshotConfig       config;
    std::size_t          emitted = 0;

    struct ChunkStart {
        std::string        id;
        std::optional<Key> after;
    };

    // False once a signal has dropped `table` or superseded chunk `id`.
    static bool chunk_current(const IncrementalSnapshotContext& c,
                              const TableId& table, const std::string& id) {
        auto head = c.current_data_collection_id();
        return head && *head == table && c.current_chunk_id() == id;
    }

    static bool table_current(const IncrementalSnapshotContext& c, const TableId& table) {
        auto head = c.current_data_collection_id();
        return head && *head == table;
    }

    void complete_table(const TableId& table, const std::string* chunk_id = nullptr) {
        bool advanced = coordinator->with_context([&](IncrementalSnapshotContext& c) {
            if (chunk_id ? !chunk_current(c, table, *chunk_id) : !table_current(c, table)) {
                return false;
            }
            c.next_data_collection();
            return true;
        });
        if (advanced) {
            SPDLOG_INFO("incremental snapshot of table '{}' completed", table.to_string());
        }
    }

    void abandon_chunk(const std::string& id, const TableId& table) {
        SPDLOG_INFO("chunk '{}' of '{}' abandoned, table no longer being snapshotted",
                    id, table.to_string());
    }

    bool step() {
        auto table = coordinator->with_context([](IncrementalSnapshotContext& c) {
            return c.current_data_collection_id();
        });
        if (!table) return false;

        auto max = coordinator->with_context([](IncrementalSnapshotContext& c) {
            return c.maximum_key();
        });
        if (!max) {
            max = source->max_key(*table);
            if (!max) {
                SPDLOG_WARN("table '{}' is empty, skipping incremental snapshot",
                            table->to_string());
                complete_table(*table);
                return true;
            }
            bool current = coordinator->with_context([&](IncrementalSnapshotContext& c) {
                if (!table_current(c, *table)) return false;
                c.maximum_key(*max);
                return true;
            });
            if (!current) return true;
            SPDLOG_INFO("incremental snapshot of table '{}' up to key {}",
                        table->to_string(), to_string(*max));
        }

        auto started = coordinator->with_context(
            [&](IncrementalSnapshotContext& c) -> std::optional<ChunkStart> {
                if (!table_current(c, *table)) return std::nullopt;
                c.start_new_chunk();
                return ChunkStart{*c.current_chunk_id(), c.chunk_end_position()};
            });
        if (!started) return true;
        const ChunkStart& start = *started;

        try {
            coordinator->handle_signal(OpenWindowSignal{start.id + "-open"});

            auto rows = source->read_chunk(*table, start.after, *max, config.chunk_size);
            if (rows.empty()) {
                coordinator->handle_signal(CloseWindowSignal{start.id + "-close"});
                complete_table(*table, &start.id);
                return true;
            }

            const Key last = rows.back().key;
            bool current = coordinator->with_context([&](IncrementalSnapshotContext& c) {
                if (!chunk_current(c, *table, start.id)) return false;
                c.next_chunk_position(last);
                return true;
            });
            if (!current) {
                abandon_chunk(start.id, *table);
                return true;
            }
            SPDLOG_DEBUG("chunk '{}' of '{}': {} rows up to {}", start.id,
                         table->to_string(), rows.size(), to_string(last));

            for (auto& row : rows) {
                on_row(*table, row);
                ++emitted;
                // A stop signal may arrive from within on_row or concurrently.
                current = coordinator->with_context([&](IncrementalSnapshotContext& c) {
                    if (!chunk_current(c, *table, start.id)) return false;
                    c.send_event(std::move(row.key));
                    return true;
                });
                if (!current) {
                    abandon_chunk(start.id, *table);
                    return true;
                }
            }

            coordinator->handle_signal(CloseWindowSignal{start.id + "-close"});

            if (compare_keys(last, *max) >= 0) {
                complete_table(*table, &start.id);
            }
            return true;
        } catch (const std::exception& e) {
            SPDLOG_ERROR("incremental snapshot chunk '{}' of '{}' failed: {}",
                         start.id, table->to_string(), e.what());
            coordinator->with_context([&](IncrementalSnapshotContext& c) {
                if (chunk_current(c, *table, start.id)) c.revert_chunk();
            });
            throw;
        }
    }
};

SnapshotDriver::SnapshotDriver(SnapshotCoordinator& coordinator, ChunkSource& source,
                               RowCallback on_row, SnapshotConfig config)
    : impl_(std::make_unique<Impl>()) {
    if (config.chunk_size == 0) {
        throw Error(ErrorCode::InvalidState, "chunk_size must be positive");
    }
    impl_->coordinator = &coordinator;
    impl_->source = &source;
    impl_->on_row = std::move(on_row);
    impl_->config = config;
}

SnapshotDriver::~SnapshotDriver() = default;
SnapshotDriver::SnapshotDriver(SnapshotDriver&&) noexcept = default;
SnapshotDriver& SnapshotDriver::operator=(SnapshotDriver&&) noexcept = default;

bool SnapshotDriver::step() {
    return impl_->step();
}

std::size_t SnapshotDriver::run() {
    auto before = impl_->emitted;
    while (impl_->step()) {
    }
    return impl_->emitted - before;
}

} // namespace incsnap

// ── offset_store.cpp ────────────────────────────────────────────
namespace incsnap {

SqliteOffsetStore::SqliteOffsetStore(sqlite3* db) : db_(db) {
    detail::exec(db_,
        "CREATE TABLE IF NOT EXISTS _incsnap_offsets ("
        "  partition_id TEXT NOT NULL,"
        "  key          TEXT NOT NULL,"
        "  value        TEXT NOT NULL,"
        "  PRIMARY KEY (partition_id, key)"
        ")");
}

OffsetRecord SqliteOffsetStore::load(const std::string& partition) const {
    auto stmt = detail::prepare(db_,
        "SELECT key, value FROM _incsnap_offsets WHERE partition_id = ?");
    sqlite3_bind_text(stmt.get(), 1, partition.c_str(),
                      static_cast<int>(partition.size()), SQLITE_TRANSIENT);

    OffsetRecord offset;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto* key = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
        auto* value = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
        offset[key ? key : ""] = value ? value : "";
    }
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError,
                    std::string("load offsets: ") + sqlite3_errmsg(db_));
    }
    return offset;
}

void SqliteOffsetStore::commit(const std::string& partition, const OffsetRecord& offset) {
    detail::exec(db_, "SAVEPOINT incsnap_commit");
    try {
        auto del = detail::prepare(db_,
            "DELETE FROM _incsnap_offsets WHERE partition_id = ?");
        sqlite3_bind_text(del.get(), 1, partition.c_str(),
                          static_cast<int>(partition.size()), SQLITE_TRANSIENT);
        detail::step_done(db_, del.get());

        auto ins = detail::prepare(db_,
            "INSERT INTO _incsnap_offsets (partition_id, key, value) VALUES (?, ?, ?)");
        for (const auto& [key, value] : offset) {
            sqlite3_reset(ins.get());
            sqlite3_bind_text(ins.get(), 1, partition.c_str(),
                              static_cast<int>(partition.size()), SQLITE_TRANSIENT);
            sqlite3_bind_text(ins.get(), 2, key.c_str(),
                              static_cast<int>(key.size()), SQLITE_TRANSIENT);
            sqlite3_bind_text(ins.get(), 3, value.c_str(),
                              static_cast<int>(value.size()), SQLITE_TRANSIENT);
            detail::step_done(db_, ins.get());
        }
    } catch (...) {
        detail::exec(db_, "ROLLBACK TO incsnap_commit");
        detail::exec(db_, "RELEASE incsnap_commit");
        throw;
    }
    detail::exec(db_, "RELEASE incsnap_commit");
    SPDLOG_DEBUG("committed {} offset fields for partition '{}'", offset.size(), partition);
}

} // namespace incsnap
