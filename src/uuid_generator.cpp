// -----------------------------------------------------------------------------
// @file uuid_generator.cpp
// @brief UuidGenerator: builder-style settings, generation and rendering.
//
// Nothing here holds shared state. Each generate call reads the wall clock
// and getrandom(2) and returns a fresh string.
// -----------------------------------------------------------------------------
#include "genid/uuid_generator.hpp"

#include <utility>

namespace genid {

// =============================================================================
// Format names
// =============================================================================

const char* uuid_format_name(UuidFormat format) {
    switch (format) {
        case UuidFormat::Standard:          return "standard";
        case UuidFormat::Simple:            return "simple";
        case UuidFormat::StandardUppercase: return "standard-upper";
        case UuidFormat::SimpleUppercase:   return "simple-upper";
    }
    return "standard";
}

bool uuid_format_from_name(const std::string& name, UuidFormat& out) {
    static const UuidFormat all[] = {
        UuidFormat::Standard, UuidFormat::Simple,
        UuidFormat::StandardUppercase, UuidFormat::SimpleUppercase
    };
    for (UuidFormat f : all) {
        if (name == uuid_format_name(f)) { out = f; return true; }
    }
    return false;
}

// =============================================================================
// Construction & derivation
// =============================================================================

UuidGenerator::UuidGenerator()
    : version_(UuidVersion::V4), format_(UuidFormat::Standard), prefix_(), metadata_support_(true) {}

UuidGenerator::UuidGenerator(UuidVersion version, UuidFormat format)
    : version_(version), format_(format), prefix_(), metadata_support_(true) {}

UuidGenerator UuidGenerator::v4() { return UuidGenerator(UuidVersion::V4, UuidFormat::Standard); }

UuidGenerator UuidGenerator::v7() { return UuidGenerator(UuidVersion::V7, UuidFormat::Standard); }

UuidGenerator UuidGenerator::with_version(UuidVersion version) const {
    UuidGenerator copy = *this;
    copy.version_ = version;
    return copy;
}

UuidGenerator UuidGenerator::with_format(UuidFormat format) const {
    UuidGenerator copy = *this;
    copy.format_ = format;
    return copy;
}

UuidGenerator UuidGenerator::with_prefix(std::string prefix) const {
    UuidGenerator copy = *this;
    copy.prefix_ = std::move(prefix);
    return copy;
}

UuidGenerator UuidGenerator::without_prefix() const {
    UuidGenerator copy = *this;
    copy.prefix_.clear();
    return copy;
}

UuidGenerator UuidGenerator::with_metadata_support(bool enabled) const {
    UuidGenerator copy = *this;
    copy.metadata_support_ = enabled;
    return copy;
}

// =============================================================================
// Generation
// =============================================================================

Uuid UuidGenerator::generate_raw() const {
    return version_ == UuidVersion::V7 ? Uuid::now_v7() : Uuid::new_v4();
}

Uuid UuidGenerator::generate_raw_with_metadata(const ClientMetadata& meta) const {
    // Timestamp, version and variant come from the plain v7 value
    Uuid id = Uuid::now_v7();
    if (metadata_support_) {
        embed_metadata(id, meta);
    }
    return id;
}

std::string UuidGenerator::generate() const {
    return format_uuid(generate_raw());
}

std::string UuidGenerator::generate_with_metadata(const ClientMetadata& meta) const {
    return format_uuid(generate_raw_with_metadata(meta));
}

std::vector<std::string> UuidGenerator::generate_batch(size_t count) const {
    std::vector<std::string> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) out.push_back(generate());
    return out;
}

std::vector<std::string> UuidGenerator::generate_batch_with_metadata(size_t count,
                                                                     const ClientMetadata& meta) const {
    std::vector<std::string> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) out.push_back(generate_with_metadata(meta));
    return out;
}

// =============================================================================
// Rendering
// =============================================================================

std::string UuidGenerator::format_uuid(const Uuid& id) const {
    bool hyphenated = (format_ == UuidFormat::Standard || format_ == UuidFormat::StandardUppercase);
    bool uppercase  = (format_ == UuidFormat::StandardUppercase || format_ == UuidFormat::SimpleUppercase);

    Uuid::HexStr body = id.to_hex_string(hyphenated, uppercase);

    std::string out;
    out.reserve(prefix_.size() + body.size());
    out += prefix_;
    out.append(body.c_str(), body.size());
    return out;
}

} // namespace genid
