/**
 * @file main.cpp
 * @brief genid CLI: mint, parse and inspect identifiers from the shell.
 *
 * Responsibilities:
 *  - `gen`: build a UuidGenerator from flags (CLI11) and print N identifiers,
 *    optionally carrying client metadata.
 *  - `parse`: normalize and decode identifiers; with --metadata also show the
 *    embedded record of version-7 values.
 *  - `inspect`: expose the raw 12-bit OS field codec for debugging.
 *
 * Metadata source for `gen --metadata`, lowest priority first:
 *  1. the running host (uname / gethostname),
 *  2. a JSON file given with --config,
 *  3. individual flags (--os, --os-version, --hostname, --user-agent).
 *
 * Exit status: 0 success, 1 at least one input failed to parse, 2 usage or
 * config error.
 */

#include <cstdio>
#include <cstdint>
#include <string>
#include <vector>
#include <iostream>
#include <iomanip>
#include <optional>
#include <sstream>

#include <unistd.h> // isatty

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "genid/json_io.hpp"
#include "genid/os_metadata.hpp"
#include "genid/system_info.hpp"
#include "genid/uuid.hpp"
#include "genid/uuid_generator.hpp"
#include "genid/uuid_parser.hpp"

using json = nlohmann::json;
using namespace genid;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }
static bool is_tty_stderr() { return ::isatty(fileno(stderr)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static std::string hex_u32(uint32_t v, int width) {
  std::ostringstream os;
  os << "0x" << std::hex << std::setfill('0') << std::setw(width) << v;
  return os.str();
}

static std::string version_str(OsVersion v) {
  return std::to_string(v.major_version) + "." + std::to_string(v.minor_version);
}

static void print_metadata_pretty(const ExtractedMetadata& m, const Ansi& ansi) {
  auto kv = [&](const char* k, const std::string& v){
    std::cout << "  " << ansi.bold(std::string("[") + k + "] ") << v << "\n";
  };
  kv("TIME",  std::to_string(m.timestamp_ms) + " ms");
  kv("OS",    os_type_name(m.os_type));
  kv("VER",   version_str(m.os_version));
  kv("HOST",  hex_u32(m.hostname_hash, 2));
  kv("HASH",  hex_u32(m.extended_hash, 8));
}

// ---------- subcommands ----------

struct GenOptions {
  bool v4 = false;
  bool v7 = false;
  std::string format = "standard";
  std::string prefix;
  size_t count = 1;
  bool metadata = false;
  std::string config;
  std::string os;
  std::string os_version;
  std::string hostname;
  std::string user_agent;
  std::string output = "text";
};

// Resolve the metadata record in priority order; nullopt (with a message on
// stderr) when the config file or a flag value is unusable.
static std::optional<ClientMetadata> resolve_metadata(const GenOptions& o) {
  ClientMetadata meta = from_system();

  if (!o.config.empty()) {
    auto loaded = json_io::load_client_metadata(o.config, meta);
    if (!loaded) {
      std::cerr << "error: cannot load metadata config: " << o.config << "\n";
      return std::nullopt;
    }
    meta = *loaded;
  }

  if (!o.os.empty()) {
    OsType os;
    if (!os_type_from_name(o.os, os)) {
      std::cerr << "error: unknown os '" << o.os << "'\n";
      return std::nullopt;
    }
    meta.os_type = os;
  }
  if (!o.os_version.empty()) meta.os_version = parse_os_version(o.os_version, meta.os_version);
  if (!o.hostname.empty())   meta.hostname = o.hostname;
  if (!o.user_agent.empty()) meta = meta.with_user_agent(o.user_agent);

  return meta;
}

static int run_gen(const GenOptions& o) {
  UuidFormat format = UuidFormat::Standard;
  if (!uuid_format_from_name(o.format, format)) {
    std::cerr << "error: unknown format '" << o.format << "'\n";
    return 2;
  }

  // --metadata implies v7; otherwise v4 unless --v7 was given
  UuidGenerator gen = (o.v7 || o.metadata) ? UuidGenerator::v7() : UuidGenerator::v4();
  gen = gen.with_format(format);
  if (!o.prefix.empty()) gen = gen.with_prefix(o.prefix);

  std::vector<std::string> ids;
  if (o.metadata) {
    std::optional<ClientMetadata> meta = resolve_metadata(o);
    if (!meta) return 2;
    ids = gen.generate_batch_with_metadata(o.count, *meta);
  } else {
    ids = gen.generate_batch(o.count);
  }

  if (o.output == "json") {
    json arr = json::array();
    for (const auto& id : ids) arr.push_back(id);
    // --prefix is user text; replace invalid UTF-8 rather than throw
    std::cout << arr.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
  } else {
    for (const auto& id : ids) std::cout << id << "\n";
  }
  return 0;
}

static int run_parse(const std::vector<std::string>& inputs, bool with_metadata,
                     const std::string& output, const Ansi& ansi, const Ansi& ansi_err) {
  int status = 0;

  for (const auto& in : inputs) {
    Uuid id;
    std::optional<ExtractedMetadata> meta;
    ParseError err = with_metadata ? parse_uuid_with_metadata(in, id, meta)
                                   : parse_uuid(in, id);
    if (err != ParseError::None) status = 1;

    if (output == "json") {
      std::cout << json_io::parse_report_json(in, err, id, meta) << "\n";
      continue;
    }

    if (err != ParseError::None) {
      std::cerr << ansi_err.red("error: ") << in << ": " << parse_error_str(err) << "\n";
      continue;
    }

    if (output == "raw") {
      std::cout << id.to_hex_string(true, false).c_str() << "\n";
      continue;
    }

    std::cout << ansi.bold(id.to_hex_string(true, false).c_str())
              << ansi.dim("  v" + std::to_string(id.version())) << "\n";
    if (with_metadata) {
      if (meta) print_metadata_pretty(*meta, ansi);
      else      std::cout << ansi.dim("  (no metadata: not a version-7 identifier)") << "\n";
    }
  }
  return status;
}

static int run_inspect(const std::string& os_field_hex, const std::string& encode_os,
                       const std::string& encode_version) {
  if (!os_field_hex.empty()) {
    unsigned long raw = 0;
    try {
      raw = std::stoul(os_field_hex, nullptr, 16);
    } catch (const std::exception&) {
      std::cerr << "error: --os-field expects a hex value\n";
      return 2;
    }
    if (raw > OS_FIELD_MASK) {
      std::cerr << "error: --os-field must fit in 12 bits (0x000-0xFFF)\n";
      return 2;
    }
    OsField f = decode_os_field(static_cast<uint16_t>(raw));
    std::cout << hex_u32(static_cast<uint32_t>(raw), 3) << " -> "
              << os_type_name(f.os_type) << " " << version_str(f.version) << "\n";
    return 0;
  }

  OsType os;
  if (!os_type_from_name(encode_os, os)) {
    std::cerr << "error: unknown os '" << encode_os << "'\n";
    return 2;
  }
  OsVersion v = parse_os_version(encode_version, OsVersion{0, 0});
  uint16_t field = encode_os_field(os, v);
  std::cout << os_type_name(os) << " " << version_str(v) << " -> "
            << hex_u32(field, 3) << "\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"genid: sortable identifiers with embedded client metadata"};
  app.require_subcommand(1);

  bool opt_no_color = false;
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  // gen
  GenOptions g;
  CLI::App* gen = app.add_subcommand("gen", "Generate identifiers");
  auto* f_v4 = gen->add_flag("--v4", g.v4, "Random identifiers (default)");
  auto* f_v7 = gen->add_flag("--v7", g.v7, "Time-ordered identifiers");
  f_v4->excludes(f_v7);
  gen->add_option("--format", g.format, "standard|simple|standard-upper|simple-upper")
      ->check(CLI::IsMember({"standard", "simple", "standard-upper", "simple-upper"}));
  gen->add_option("--prefix", g.prefix, "Literal text prepended to each identifier");
  gen->add_option("-n,--count", g.count, "How many identifiers")
      ->capture_default_str()->check(CLI::Range(size_t{0}, size_t{1000000}));
  auto* f_meta = gen->add_flag("--metadata", g.metadata, "Embed client metadata (implies --v7)");
  f_v4->excludes(f_meta);
  gen->add_option("--config", g.config, "JSON file with os/os_version/hostname/user_agent")
      ->check(CLI::ExistingFile);
  gen->add_option("--os", g.os, "linux|windows|macos|android|ios");
  gen->add_option("--os-version", g.os_version, "MAJOR.MINOR");
  gen->add_option("--hostname", g.hostname, "Hostname or machine identifier");
  gen->add_option("--user-agent", g.user_agent, "User agent mixed into the extended hash");
  gen->add_option("--output", g.output, "text|json")->check(CLI::IsMember({"text", "json"}));

  // parse
  std::vector<std::string> p_inputs;
  bool p_metadata = false;
  std::string p_output = "pretty";
  CLI::App* parse = app.add_subcommand("parse", "Parse identifiers");
  parse->add_option("uuids", p_inputs, "Identifiers (urn:uuid:, uuid: and {} accepted)")->required();
  parse->add_flag("--metadata", p_metadata, "Extract embedded metadata from version-7 values");
  parse->add_option("--output", p_output, "pretty|json|raw")
      ->check(CLI::IsMember({"pretty", "json", "raw"}));

  // inspect
  std::string i_field, i_os, i_version;
  CLI::App* inspect = app.add_subcommand("inspect", "Encode or decode the 12-bit OS field");
  auto* o_field = inspect->add_option("--os-field", i_field, "Hex OS field to decode");
  auto* o_os = inspect->add_option("--encode", i_os, "OS family to encode");
  inspect->add_option("--os-version", i_version, "MAJOR.MINOR to encode with --encode");
  o_field->excludes(o_os);
  inspect->require_option(1, 2);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout();
  Ansi ansi_err;
  ansi_err.enabled = !opt_no_color && is_tty_stderr();

  if (*gen)     return run_gen(g);
  if (*parse)   return run_parse(p_inputs, p_metadata, p_output, ansi, ansi_err);
  if (*inspect) {
    if (i_field.empty() && i_os.empty()) {
      std::cerr << "error: inspect needs --os-field or --encode\n";
      return 2;
    }
    return run_inspect(i_field, i_os, i_version);
  }
  return 2;
}
