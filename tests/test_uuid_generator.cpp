#include <doctest/doctest.h>
#include "genid/uuid_generator.hpp"
#include "genid/uuid_parser.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>
#include <thread>

using namespace genid;

static bool no_lowercase(const std::string& s) {
    return std::none_of(s.begin(), s.end(), [](char c){ return c >= 'a' && c <= 'z'; });
}

static bool all_hex(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c){ return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

static void check_hyphenated(const std::string& s) {
    REQUIRE(s.size() == 36);
    CHECK(s[8] == '-');
    CHECK(s[13] == '-');
    CHECK(s[18] == '-');
    CHECK(s[23] == '-');
    CHECK(std::count(s.begin(), s.end(), '-') == 4);
}

static void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

TEST_CASE("default generator is v4, standard, no prefix") {
    UuidGenerator gen;
    CHECK(gen.version() == UuidVersion::V4);
    CHECK(gen.format() == UuidFormat::Standard);
    CHECK_FALSE(gen.has_prefix());
    CHECK(gen.metadata_support());

    std::string id = gen.generate();
    check_hyphenated(id);
    auto parsed = parse_uuid(id);
    REQUIRE(parsed.has_value());
    CHECK(parsed->version() == 4);
}

TEST_CASE("v7 generator stamps version 7 and the current time") {
    UuidGenerator gen = UuidGenerator::v7();
    uint64_t before = now_unix_ms();
    auto parsed = parse_uuid(gen.generate());
    uint64_t after = now_unix_ms();

    REQUIRE(parsed.has_value());
    CHECK(parsed->version() == 7);
    CHECK(parsed->is_rfc_variant());
    CHECK(parsed->timestamp_ms() >= before);
    CHECK(parsed->timestamp_ms() <= after);
}

TEST_CASE("format invariants for every version/format pair") {
    const UuidFormat formats[] = {UuidFormat::Standard, UuidFormat::Simple,
                                  UuidFormat::StandardUppercase, UuidFormat::SimpleUppercase};
    const UuidVersion versions[] = {UuidVersion::V4, UuidVersion::V7};

    for (UuidVersion v : versions) {
        for (UuidFormat f : formats) {
            std::string id = UuidGenerator(v, f).generate();
            switch (f) {
                case UuidFormat::Standard:
                    check_hyphenated(id);
                    CHECK(id == std::string(parse_uuid(id)->to_hex_string(true, false).c_str()));
                    break;
                case UuidFormat::Simple:
                    CHECK(id.size() == 32);
                    CHECK(all_hex(id));
                    break;
                case UuidFormat::StandardUppercase:
                    check_hyphenated(id);
                    CHECK(no_lowercase(id));
                    break;
                case UuidFormat::SimpleUppercase:
                    CHECK(id.size() == 32);
                    CHECK(all_hex(id));
                    CHECK(no_lowercase(id));
                    break;
            }
            CHECK(parse_uuid(id).has_value());
        }
    }
}

TEST_CASE("prefix adds exactly its own length in front") {
    UuidGenerator gen = UuidGenerator::v4().with_prefix("user_");
    std::string id = gen.generate();
    CHECK(id.rfind("user_", 0) == 0);
    CHECK(id.size() == 5 + 36);
    CHECK(parse_uuid(id.substr(5)).has_value());

    std::string simple = UuidGenerator::v4().with_format(UuidFormat::Simple).with_prefix("id_").generate();
    CHECK(simple.rfind("id_", 0) == 0);
    CHECK(simple.size() == 3 + 32);
}

TEST_CASE("derivations never mutate the base configuration") {
    const UuidGenerator base = UuidGenerator::v7();
    UuidGenerator upper = base.with_format(UuidFormat::SimpleUppercase);
    UuidGenerator pref  = base.with_prefix("trade_");
    UuidGenerator bare  = pref.without_prefix();
    UuidGenerator v4    = base.with_version(UuidVersion::V4);

    CHECK(base.format() == UuidFormat::Standard);
    CHECK_FALSE(base.has_prefix());
    CHECK(base.version() == UuidVersion::V7);

    CHECK(upper.format() == UuidFormat::SimpleUppercase);
    CHECK(pref.prefix() == "trade_");
    CHECK_FALSE(bare.has_prefix());
    CHECK(bare.generate().size() == 36);
    CHECK(v4.version() == UuidVersion::V4);
}

TEST_CASE("batch of v4 identifiers is all distinct") {
    auto batch = UuidGenerator::v4().generate_batch(100);
    REQUIRE(batch.size() == 100);
    std::set<std::string> unique(batch.begin(), batch.end());
    CHECK(unique.size() == 100);
    for (const auto& id : batch) CHECK(parse_uuid(id).has_value());
}

TEST_CASE("empty batch") {
    CHECK(UuidGenerator::v7().generate_batch(0).empty());
    ClientMetadata meta(OsType::Linux, OsVersion{6, 1}, "server-01");
    CHECK(UuidGenerator::v7().generate_batch_with_metadata(0, meta).empty());
}

TEST_CASE("batch keeps prefix and format on every item") {
    auto batch = UuidGenerator::v7().with_format(UuidFormat::SimpleUppercase).with_prefix("ORDER_").generate_batch(5);
    REQUIRE(batch.size() == 5);
    for (const auto& id : batch) {
        CHECK(id.rfind("ORDER_", 0) == 0);
        CHECK(id.size() == 6 + 32);
        CHECK(no_lowercase(id.substr(6)));
    }
}

TEST_CASE("v7 text sorts in generation order") {
    UuidGenerator gen = UuidGenerator::v7();
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(gen.generate());
        sleep_ms(2);
    }
    std::vector<std::string> sorted = ids;
    std::sort(sorted.begin(), sorted.end());
    CHECK(sorted == ids);
}

TEST_CASE("metadata-bearing text still sorts in generation order") {
    ClientMetadata meta(OsType::MacOS, OsVersion{14, 0}, "test");
    UuidGenerator gen = UuidGenerator::v7();
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(gen.generate_with_metadata(meta));
        sleep_ms(2);
    }
    std::vector<std::string> sorted = ids;
    std::sort(sorted.begin(), sorted.end());
    CHECK(sorted == ids);
}

TEST_CASE("generate_with_metadata round-trips through the parser") {
    ClientMetadata meta(OsType::MacOS, OsVersion{14, 5}, "test-machine");
    std::string id = UuidGenerator::v7().generate_with_metadata(meta);
    check_hyphenated(id);

    Uuid value;
    std::optional<ExtractedMetadata> got;
    REQUIRE(parse_uuid_with_metadata(id, value, got) == ParseError::None);
    REQUIRE(got.has_value());
    CHECK(value.version() == 7);
    CHECK(got->os_type == OsType::MacOS);
    CHECK(got->os_version == OsVersion{14, 5});
}

TEST_CASE("metadata survives a prefix once the caller strips it") {
    ClientMetadata meta(OsType::Linux, OsVersion{6, 1}, "server-01");
    std::string id = UuidGenerator::v7().with_prefix("trade_").generate_with_metadata(meta);
    CHECK(id.size() == 6 + 36);

    Uuid value;
    std::optional<ExtractedMetadata> got;
    REQUIRE(parse_uuid_with_metadata(id.substr(6), value, got) == ParseError::None);
    REQUIRE(got.has_value());
    CHECK(got->os_type == OsType::Linux);
    CHECK(got->os_version == OsVersion{6, 1});
}

TEST_CASE("generate_with_metadata is v7 even from a v4 generator") {
    ClientMetadata meta(OsType::Windows, OsVersion{10, 0}, "workstation");
    auto parsed = parse_uuid(UuidGenerator::v4().generate_with_metadata(meta));
    REQUIRE(parsed.has_value());
    CHECK(parsed->version() == 7);
}

TEST_CASE("metadata batch: every item carries the record and all differ") {
    ClientMetadata meta(OsType::Windows, OsVersion{10, 0}, "workstation");
    auto batch = UuidGenerator::v7().generate_batch_with_metadata(5, meta);
    REQUIRE(batch.size() == 5);

    for (const auto& id : batch) {
        Uuid value;
        std::optional<ExtractedMetadata> got;
        REQUIRE(parse_uuid_with_metadata(id, value, got) == ParseError::None);
        REQUIRE(got.has_value());
        CHECK(got->os_type == OsType::Windows);
        CHECK(got->os_version == OsVersion{10, 0});
    }
    std::set<std::string> unique(batch.begin(), batch.end());
    CHECK(unique.size() == 5);
}

TEST_CASE("same metadata, consecutive calls still differ") {
    ClientMetadata meta = ClientMetadata(OsType::Linux, OsVersion{5, 15}, "dev-machine")
                              .with_user_agent("TradingApp/1.0");
    UuidGenerator gen = UuidGenerator::v7();
    CHECK(gen.generate_with_metadata(meta) != gen.generate_with_metadata(meta));
}

TEST_CASE("different hostnames: same os fields, different extended hash") {
    ClientMetadata m1(OsType::Linux, OsVersion{5, 15}, "host-001");
    ClientMetadata m2(OsType::Linux, OsVersion{5, 15}, "host-002");
    UuidGenerator gen = UuidGenerator::v7();

    Uuid v1, v2;
    std::optional<ExtractedMetadata> e1, e2;
    REQUIRE(parse_uuid_with_metadata(gen.generate_with_metadata(m1), v1, e1) == ParseError::None);
    REQUIRE(parse_uuid_with_metadata(gen.generate_with_metadata(m2), v2, e2) == ParseError::None);
    REQUIRE(e1.has_value());
    REQUIRE(e2.has_value());

    CHECK(e1->os_type == e2->os_type);
    CHECK(e1->os_version == e2->os_version);
    CHECK(e1->extended_hash != e2->extended_hash);
}

TEST_CASE("metadata support switched off leaves the v7 random bytes alone") {
    ClientMetadata meta(OsType::IOS, OsVersion{17, 2}, "phone");
    UuidGenerator gen = UuidGenerator::v7().with_metadata_support(false);
    CHECK_FALSE(gen.metadata_support());

    // With embedding on, byte 9 is a pure function of the hostname; off, it
    // is random. Over 32 draws at least one must differ.
    uint8_t fixed = UuidGenerator::v7().generate_raw_with_metadata(meta).bytes[9];
    bool saw_other = false;
    for (int i = 0; i < 32 && !saw_other; ++i) {
        Uuid id = gen.generate_raw_with_metadata(meta);
        CHECK(id.version() == 7);
        saw_other = id.bytes[9] != fixed;
    }
    CHECK(saw_other);
}

TEST_CASE("format names") {
    UuidFormat f = UuidFormat::Standard;
    CHECK(uuid_format_from_name("simple-upper", f));
    CHECK(f == UuidFormat::SimpleUppercase);
    CHECK_FALSE(uuid_format_from_name("braced", f));
    CHECK(std::string(uuid_format_name(UuidFormat::StandardUppercase)) == "standard-upper");
}
