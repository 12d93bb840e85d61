#include <doctest/doctest.h>
#include "genid/uuid.hpp"

#include <set>

using namespace genid;

TEST_CASE("default Uuid is nil") {
    Uuid id;
    CHECK(id.is_nil());
    CHECK(id.version() == 0);
    CHECK(id.to_hex_string() == Uuid::HexStr("00000000-0000-0000-0000-000000000000"));
}

TEST_CASE("buffer constructor copies 16 bytes; short buffers give nil") {
    uint8_t raw[16];
    for (int i = 0; i < 16; ++i) raw[i] = static_cast<uint8_t>(i * 17);

    Uuid a(raw, sizeof(raw));
    uint8_t back[16]{};
    a.pack(back);
    for (int i = 0; i < 16; ++i) CHECK(back[i] == raw[i]);

    Uuid b(raw, 15);
    CHECK(b.is_nil());
}

TEST_CASE("hex rendering in all four shapes") {
    const uint8_t raw[16] = {0x55, 0x0e, 0x84, 0x00, 0xe2, 0x9b, 0x41, 0xd4,
                             0xa7, 0x16, 0x44, 0x66, 0x55, 0x44, 0x00, 0x00};
    Uuid id(raw, 16);

    CHECK(id.to_hex_string(true, false)  == Uuid::HexStr("550e8400-e29b-41d4-a716-446655440000"));
    CHECK(id.to_hex_string(false, false) == Uuid::HexStr("550e8400e29b41d4a716446655440000"));
    CHECK(id.to_hex_string(true, true)   == Uuid::HexStr("550E8400-E29B-41D4-A716-446655440000"));
    CHECK(id.to_hex_string(false, true)  == Uuid::HexStr("550E8400E29B41D4A716446655440000"));
}

TEST_CASE("new_v4 fixes version and variant") {
    for (int i = 0; i < 64; ++i) {
        Uuid id = Uuid::new_v4();
        CHECK(id.version() == 4);
        CHECK(id.is_rfc_variant());
    }
}

TEST_CASE("v7_at places the timestamp in bytes 0-5") {
    const uint64_t ms = 0x0123456789ABull;
    Uuid id = Uuid::v7_at(ms);

    CHECK(id.version() == 7);
    CHECK(id.is_rfc_variant());
    CHECK(id.timestamp_ms() == ms);
    CHECK(id.bytes[0] == 0x01);
    CHECK(id.bytes[5] == 0xAB);
}

TEST_CASE("v7 values order by timestamp, in bytes and in text") {
    Uuid earlier = Uuid::v7_at(1700000000000ull);
    Uuid later   = Uuid::v7_at(1700000000001ull);

    CHECK(earlier < later);
    CHECK_FALSE(later < earlier);
    CHECK(std::string(earlier.to_hex_string().c_str()) < std::string(later.to_hex_string().c_str()));
}

TEST_CASE("now_v7 tracks the wall clock") {
    uint64_t before = now_unix_ms();
    Uuid id = Uuid::now_v7();
    uint64_t after = now_unix_ms();

    CHECK(id.timestamp_ms() >= before);
    CHECK(id.timestamp_ms() <= after);
}

TEST_CASE("hex_char_to_val accepts both cases and rejects the rest") {
    uint8_t v = 0xFF;
    CHECK(Uuid::hex_char_to_val('0', v)); CHECK(v == 0);
    CHECK(Uuid::hex_char_to_val('a', v)); CHECK(v == 10);
    CHECK(Uuid::hex_char_to_val('F', v)); CHECK(v == 15);
    CHECK_FALSE(Uuid::hex_char_to_val('g', v));
    CHECK_FALSE(Uuid::hex_char_to_val('-', v));
    CHECK(v == 15); // untouched on failure
}

TEST_CASE("equality is byte-wise") {
    Uuid a = Uuid::new_v4();
    Uuid b = a;
    CHECK(a == b);
    b.bytes[15] ^= 0x01;
    CHECK(a != b);
}
