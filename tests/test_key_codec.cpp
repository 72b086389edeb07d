// Copyright 2026 The incsnap Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <incsnap.h>

#include <cstdint>
#include <limits>
#include <string>

using namespace incsnap;

namespace {

void check_round_trip(const Key& key) {
    auto text = encode_key(key);
    CHECK(decode_key("test", text) == key);
}

ErrorCode decode_error(const std::string& text) {
    try {
        decode_key(kEventPrimaryKey, text);
    } catch (const Error& e) {
        return e.code();
    }
    return ErrorCode::Ok;
}

} // namespace

TEST_CASE("key codec: single integer key round-trip") {
    check_round_trip(Key{std::int64_t{5}});
    check_round_trip(Key{std::int64_t{-1}});
    check_round_trip(Key{std::numeric_limits<std::int64_t>::min()});
    check_round_trip(Key{std::numeric_limits<std::int64_t>::max()});
}

TEST_CASE("key codec: composite key with every value type") {
    Key key{
        std::monostate{},
        true,
        std::int64_t{42},
        3.25,
        Decimal{"-12345678901234567890", 4},
        Date{19000},
        Time{3600LL * 1000000},
        Timestamp{-86400LL * 1000000},
        std::string("héllo, world"),
        Bytes{0x00, 0xff, 0x10},
    };
    check_round_trip(key);
}

TEST_CASE("key codec: empty key and empty payloads") {
    check_round_trip(Key{});
    check_round_trip(Key{std::string(), Bytes{}});
}

TEST_CASE("key codec: encoding is lowercase hex with version prefix") {
    auto text = encode_key(Key{std::int64_t{1}});
    // version 01, count 01000000, tag 02, value 0100000000000000
    CHECK(text == "010100000002" "0100000000000000");
}

TEST_CASE("key codec: decoding accepts uppercase hex") {
    CHECK(decode_key("f", "010100000002" "0A00000000000000") == Key{std::int64_t{10}});
}

TEST_CASE("key codec: malformed input is a CodecError") {
    CHECK(decode_error("") == ErrorCode::CodecError);
    CHECK(decode_error("0") == ErrorCode::CodecError);
    CHECK(decode_error("zz") == ErrorCode::CodecError);
    CHECK(decode_error("0201000000") == ErrorCode::CodecError);           // bad version
    CHECK(decode_error("0101000000") == ErrorCode::CodecError);           // missing value
    CHECK(decode_error("01010000007f") == ErrorCode::CodecError);         // unknown tag
    CHECK(decode_error("010100000002010000") == ErrorCode::CodecError);   // truncated int
    CHECK(decode_error("0100000000ff") == ErrorCode::CodecError);         // trailing byte
    CHECK(decode_error("01010000000102") == ErrorCode::CodecError);       // bool byte 2
    CHECK(decode_error("0101000000040000000002000000" "2d78") == ErrorCode::CodecError);  // "-x"
}

TEST_CASE("key codec: error message names field and text") {
    try {
        decode_key(kTableMaximumKey, "nothex");
        FAIL("expected CodecError");
    } catch (const Error& e) {
        std::string msg = e.what();
        CHECK(msg.find(kTableMaximumKey) != std::string::npos);
        CHECK(msg.find("nothex") != std::string::npos);
    }
}

TEST_CASE("key codec: encoding rejects invalid decimal digits") {
    CHECK_THROWS_AS(encode_key(Key{Decimal{"1.5", 0}}), Error);
}

TEST_CASE("key ordering: integers, decimals and mixed numerics") {
    CHECK(compare_keys(Key{std::int64_t{1}}, Key{std::int64_t{2}}) < 0);
    CHECK(compare_keys(Key{std::int64_t{2}}, Key{std::int64_t{2}}) == 0);
    CHECK(compare_keys(Key{std::int64_t{3}}, Key{2.5}) > 0);
    CHECK(compare_values(Decimal{"150", 2}, Decimal{"15", 1}) == 0);
    CHECK(compare_values(Decimal{"-2", 0}, Decimal{"1", 5}) < 0);
    CHECK(compare_values(Decimal{"999", 3}, Decimal{"1", 0}) < 0);
    CHECK(compare_values(Decimal{"000", 0}, Decimal{"-0", 7}) == 0);
}

TEST_CASE("key ordering: integers and reals compare exactly beyond 2^53") {
    const std::int64_t big = 9007199254740993;  // 2^53 + 1
    CHECK(compare_values(big, 9007199254740992.0) > 0);
    CHECK(compare_values(9007199254740992.0, big) < 0);
    CHECK(compare_values(std::int64_t{9007199254740992}, 9007199254740992.0) == 0);
    CHECK(compare_values(std::int64_t{2}, 2.5) < 0);
    CHECK(compare_values(std::int64_t{-3}, -2.5) < 0);
    CHECK(compare_values(std::int64_t{0}, -0.5) > 0);
    CHECK(compare_values(std::numeric_limits<std::int64_t>::max(), 9223372036854775808.0) < 0);
    CHECK(compare_values(std::numeric_limits<std::int64_t>::min(), -9223372036854775808.0) == 0);
}

TEST_CASE("key ordering: lexicographic with null first") {
    CHECK(compare_keys(Key{std::int64_t{1}, std::string("b")},
                       Key{std::int64_t{1}, std::string("c")}) < 0);
    CHECK(compare_keys(Key{std::monostate{}}, Key{std::int64_t{-100}}) < 0);
    CHECK(compare_keys(Key{std::int64_t{1}}, Key{std::int64_t{1}, std::int64_t{0}}) < 0);
}
