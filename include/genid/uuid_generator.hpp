/**
 * @file uuid_generator.hpp
 * @brief genid UuidGenerator: immutable generation settings plus the generate calls.
 *
 * A UuidGenerator is a small value: which version to mint, how to render it,
 * an optional literal prefix, and whether metadata embedding is enabled.
 * Every `with_*` call returns a new generator, so a base configuration can be
 * shared between threads and specialised freely:
 *
 * @code
 * const genid::UuidGenerator orders = genid::UuidGenerator::v7().with_prefix("order_");
 * std::string a = orders.generate();                                   // order_0190...
 * std::string b = orders.with_format(genid::UuidFormat::Simple).generate();
 * @endcode
 *
 * Output formats:
 *
 * | Format             | Example                                    |
 * |--------------------|--------------------------------------------|
 * | Standard           | `550e8400-e29b-41d4-a716-446655440000`     |
 * | Simple             | `550e8400e29b41d4a716446655440000`         |
 * | StandardUppercase  | `550E8400-E29B-41D4-A716-446655440000`     |
 * | SimpleUppercase    | `550E8400E29B41D4A716446655440000`         |
 *
 * The prefix is cosmetic. It is not part of the 128-bit value and callers
 * must strip it before handing the text to parse_uuid().
 */
#ifndef GENID_UUID_GENERATOR_HPP
#define GENID_UUID_GENERATOR_HPP

#include "genid/os_metadata.hpp"
#include "genid/uuid.hpp"
#include <stddef.h>
#include <string>
#include <vector>

namespace genid {

/// Text rendering of a generated identifier.
enum class UuidFormat {
    Standard,           ///< 8-4-4-4-12, lowercase (36 chars)
    Simple,             ///< 32 hex digits, lowercase
    StandardUppercase,  ///< 8-4-4-4-12, uppercase
    SimpleUppercase,    ///< 32 hex digits, uppercase
};

/// Which identifier version generate() produces.
enum class UuidVersion {
    V4,  ///< Fully random
    V7,  ///< Millisecond timestamp + random, sortable
};

/// @brief "standard", "simple", "standard-upper", "simple-upper".
const char* uuid_format_name(UuidFormat format);

/**
 * @brief Reverse of uuid_format_name().
 * @return false if @p name is not one of the four format names.
 */
bool uuid_format_from_name(const std::string& name, UuidFormat& out);

class UuidGenerator {
public:
    /// Version 4, Standard format, no prefix, metadata support on.
    UuidGenerator();

    UuidGenerator(UuidVersion version, UuidFormat format);

    static UuidGenerator v4();
    static UuidGenerator v7();

    // Derivation: each returns a modified copy and leaves *this alone.
    UuidGenerator with_version(UuidVersion version) const;
    UuidGenerator with_format(UuidFormat format) const;
    UuidGenerator with_prefix(std::string prefix) const;
    UuidGenerator without_prefix() const;

    /**
     * @brief Turn metadata embedding on or off.
     *
     * With support off, generate_with_metadata() still returns a version-7
     * identifier but leaves its random bytes alone.
     */
    UuidGenerator with_metadata_support(bool enabled) const;

    UuidVersion version() const { return version_; }
    UuidFormat format() const { return format_; }
    const std::string& prefix() const { return prefix_; }
    bool has_prefix() const { return !prefix_.empty(); }
    bool metadata_support() const { return metadata_support_; }

    /// @brief One identifier of the configured version, formatted and prefixed.
    std::string generate() const;

    /**
     * @brief A version-7 identifier carrying @p meta in its payload bytes.
     *
     * Always time-ordered, whatever version() says. See os_metadata.hpp for
     * the byte layout.
     */
    std::string generate_with_metadata(const ClientMetadata& meta) const;

    /// @brief @p count independent generate() results.
    std::vector<std::string> generate_batch(size_t count) const;

    /// @brief @p count independent generate_with_metadata() results.
    std::vector<std::string> generate_batch_with_metadata(size_t count,
                                                          const ClientMetadata& meta) const;

    /// @brief Raw value for the configured version, before formatting.
    Uuid generate_raw() const;

    /// @brief Raw version-7 value with metadata applied (if supported).
    Uuid generate_raw_with_metadata(const ClientMetadata& meta) const;

    /// @brief Render @p id with this generator's format and prefix.
    std::string format_uuid(const Uuid& id) const;

private:
    UuidVersion version_;
    UuidFormat format_;
    std::string prefix_;
    bool metadata_support_;
};

} // namespace genid

#endif // GENID_UUID_GENERATOR_HPP
