/**
 * @file json_io.cpp
 * @brief JSON layer for genid: config loading and machine-readable reports.
 * @details
 *   Everything JSON-shaped in genid goes through this file so the codec,
 *   generator and parser never see a JSON type:
 *     - Loading a ClientMetadata from a config document (@c client_metadata_from_json,
 *       @c load_client_metadata).
 *     - Serializing metadata records (@c to_json).
 *     - Building the per-input report printed by `genid parse --output json`
 *       (@c parse_report_json).
 *
 *   ## Error Suppression & Robustness
 *   nlohmann::json signals malformed input and type mismatches with exceptions.
 *   They are caught here and turned into @c std::nullopt, so callers only ever
 *   see an empty optional for a bad config. Output is serialized with the
 *   @c replace error handler: invalid UTF-8 in caller text becomes U+FFFD.
 */

#include "genid/json_io.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace genid {
namespace json_io {

namespace {

// Version components must be plain integers in 0..255; wider values are
// rejected here, narrower ones are masked later by the codec.
bool read_version_component(const json& j, uint8_t& out) {
    if (!j.is_number_integer()) return false;
    long long v = j.get<long long>();
    if (v < 0 || v > 255) return false;
    out = static_cast<uint8_t>(v);
    return true;
}

json version_array(OsVersion v) {
    return json::array({v.major_version, v.minor_version});
}

// Caller text (inputs, hostnames) may hold invalid UTF-8. Replace it with
// U+FFFD instead of letting the strict handler throw out of the serializer.
std::string dump_text(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json extracted_value(const ExtractedMetadata& meta) {
    json j;
    j["timestamp_ms"]  = meta.timestamp_ms;
    j["os"]            = os_type_name(meta.os_type);
    j["os_version"]    = version_array(meta.os_version);
    j["hostname_hash"] = meta.hostname_hash;
    j["extended_hash"] = meta.extended_hash;
    return j;
}

} // namespace

std::optional<ClientMetadata> client_metadata_from_json(const std::string& json_str,
                                                        const ClientMetadata& base) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) return std::nullopt;

        ClientMetadata meta = base;

        if (j.contains("os")) {
            if (!j["os"].is_string()) return std::nullopt;
            OsType os;
            if (!os_type_from_name(j["os"].get<std::string>(), os)) return std::nullopt;
            meta.os_type = os;
        }

        if (j.contains("os_version")) {
            const json& v = j["os_version"];
            if (v.is_array()) {
                if (v.size() != 2) return std::nullopt;
                OsVersion parsed{0, 0};
                if (!read_version_component(v[0], parsed.major_version)) return std::nullopt;
                if (!read_version_component(v[1], parsed.minor_version)) return std::nullopt;
                meta.os_version = parsed;
            } else if (v.is_string()) {
                // "14.5" style, same rules as the uname probe
                meta.os_version = parse_os_version(v.get<std::string>(), meta.os_version);
            } else {
                return std::nullopt;
            }
        }

        if (j.contains("hostname")) {
            if (!j["hostname"].is_string()) return std::nullopt;
            meta.hostname = j["hostname"].get<std::string>();
        }

        if (j.contains("user_agent")) {
            const json& ua = j["user_agent"];
            if (ua.is_null()) {
                meta.user_agent.reset();
            } else if (ua.is_string()) {
                meta.user_agent = ua.get<std::string>();
            } else {
                return std::nullopt;
            }
        }

        return meta;
    }
    catch (const json::exception&) {
        return std::nullopt;
    }
}

std::optional<ClientMetadata> load_client_metadata(const std::string& path,
                                                   const ClientMetadata& base) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return client_metadata_from_json(ss.str(), base);
}

std::string to_json(const ClientMetadata& meta) {
    json j;
    j["os"]         = os_type_name(meta.os_type);
    j["os_version"] = version_array(meta.os_version);
    j["hostname"]   = meta.hostname;
    if (meta.user_agent) j["user_agent"] = *meta.user_agent;
    return dump_text(j);
}

std::string to_json(const ExtractedMetadata& meta) {
    return dump_text(extracted_value(meta));
}

std::string parse_report_json(const std::string& input, ParseError err, const Uuid& id,
                              const std::optional<ExtractedMetadata>& meta) {
    json j;
    j["input"] = input;
    if (err != ParseError::None) {
        j["ok"]    = false;
        j["error"] = parse_error_str(err);
        return dump_text(j);
    }

    j["ok"]      = true;
    j["uuid"]    = std::string(id.to_hex_string(true, false).c_str());
    j["version"] = id.version();
    if (meta) {
        j["metadata"] = extracted_value(*meta);
    }
    return dump_text(j);
}

} // namespace json_io
} // namespace genid
