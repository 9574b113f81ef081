#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "carver/audit.hpp"
#include "carver/bootstrap.hpp"
#include "carver/config.hpp"
#include "carver/engine.hpp"
#include "carver/hash.hpp"
#include "carver/jsonlite.hpp"
#include "carver/observability.hpp"
#include "carver/version.hpp"

#ifndef CARVER_VERSION
#define CARVER_VERSION "0.1.0"
#endif

namespace {

struct CliArgs {
  std::string config_path;
  std::string ledger_root;
  std::string identity;
  std::vector<std::string> positional;
};

CliArgs parse_args(int argc, char **argv) {
  CliArgs a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc)
      a.config_path = argv[++i];
    else if (arg == "--ledger" && i + 1 < argc)
      a.ledger_root = argv[++i];
    else if (arg == "--identity" && i + 1 < argc)
      a.identity = argv[++i];
    else
      a.positional.push_back(arg);
  }
  return a;
}

bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  *out = std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
  return true;
}

int fail(const std::string &code, const std::string &detail = "",
         int exit_code = 2) {
  std::cout << "{\"ok\":false,\"error\":\"" << carver::jsonlite::escape(code)
            << "\"";
  if (!detail.empty())
    std::cout << ",\"detail\":\"" << carver::jsonlite::escape(detail) << "\"";
  std::cout << "}\n";
  return exit_code;
}

void usage() {
  std::cerr << "usage: carver <command> [--config f] [--ledger dir|:memory:] "
               "[--identity 0x..]\n"
               "  artifacts persist under " << carver::kDefaultLedgerRoot
            << " unless --ledger says otherwise\n"
               "  address <hex>      predict the address of runtime code\n"
               "  carve <hex>        store runtime code at its address\n"
               "  verify <address>   check an address holds carved code\n"
               "  read <address>     print the code stored at an address\n"
               "  prefix             bootstrap prefix and disassembly\n"
               "  health | version | stats\n"
               "  config check <file> | config show\n";
}

// Config file, then CARVER_* environment, then command-line flags.
bool load_config(const CliArgs &args, carver::EngineConfig *cfg,
                 std::string *error) {
  if (!args.config_path.empty()) {
    std::string text;
    if (!read_file(args.config_path, &text)) {
      *error = "cannot read config file: " + args.config_path;
      return false;
    }
    if (!carver::parse_config(text, cfg, error))
      return false;
  }
  if (!carver::apply_env_overrides(cfg, error))
    return false;
  if (!args.ledger_root.empty())
    cfg->ledger_root = args.ledger_root;
  if (!args.identity.empty() &&
      !carver::Address::from_hex(args.identity, cfg->engine_identity)) {
    *error = "--identity must be a 20-byte hex address";
    return false;
  }
  return true;
}

std::string json_string_array(const std::vector<std::string> &items) {
  std::string out = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i)
      out += ",";
    out += "\"" + carver::jsonlite::escape(items[i]) + "\"";
  }
  return out + "]";
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line))
    lines.push_back(line);
  return lines;
}

} // namespace

int main(int argc, char **argv) {
  const CliArgs args = parse_args(argc, argv);
  if (args.positional.empty()) {
    usage();
    return 1;
  }
  const std::string &cmd = args.positional[0];

  if (cmd == "health") {
    const auto h = carver::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_backend\":\"" << h.backend
              << "\",\"hash_version\":\"" << h.version
              << "\",\"hash_available\":"
              << (h.blake3_available ? "true" : "false")
              << ",\"ledger_backends\":[\"memory\",\"local_fs\"]"
              << ",\"compression_capabilities\":[\"off\"";
#if defined(CARVER_WITH_ZSTD)
    std::cout << ",\"zstd\"";
#endif
    std::cout << "]}\n";
    return 0;
  }

  if (cmd == "version") {
    std::cout << carver::version::manifest_to_json(
                     carver::version::current_manifest(CARVER_VERSION))
              << "\n";
    return 0;
  }

  if (cmd == "prefix") {
    const std::string_view prefix = carver::bootstrap_prefix();
    std::cout << "{\"prefix\":\"0x" << carver::to_hex(prefix)
              << "\",\"size\":" << prefix.size() << ",\"disassembly\":"
              << json_string_array(split_lines(carver::disassemble(prefix)))
              << "}\n";
    return 0;
  }

  const std::string operand = args.positional.size() > 1 ? args.positional[1] : "";

  if (cmd == "config" && operand != "show") {
    if (args.positional.size() < 3 || operand != "check") {
      usage();
      return 1;
    }
    std::string text;
    if (!read_file(args.positional[2], &text))
      return fail(carver::to_string(carver::ErrorCode::config_invalid),
                  "cannot read " + args.positional[2]);
    const auto r = carver::validate_config(text);
    std::cout << "{\"ok\":" << (r.ok ? "true" : "false")
              << ",\"config_version\":\""
              << carver::jsonlite::escape(r.config_version)
              << "\",\"errors\":" << json_string_array(r.errors)
              << ",\"warnings\":" << json_string_array(r.warnings) << "}\n";
    return r.ok ? 0 : 2;
  }

  // Everything below operates on an engine.
  carver::EngineConfig cfg = carver::persistent_config();
  std::string err;
  if (!load_config(args, &cfg, &err))
    return fail(carver::to_string(carver::ErrorCode::config_invalid), err);

  if (cmd == "config") {
    std::cout << carver::config_to_json(cfg) << "\n";
    return 0;
  }

  carver::set_audit_log_path(cfg.audit_log_path);
  carver::set_event_log_path(cfg.event_log_path);

  auto ledger = carver::make_ledger(cfg);
  carver::CarveEngine engine(cfg, ledger);

  if (cmd == "address" || cmd == "carve") {
    std::string code;
    if (args.positional.size() < 2 || !carver::from_hex(operand, &code))
      return fail(carver::to_string(carver::ErrorCode::invalid_hex),
                  "expected runtime code as hex");

    if (cmd == "address") {
      std::cout << "{\"address\":\"" << engine.address_of(code).hex()
                << "\",\"code_size\":" << code.size()
                << ",\"engine_identity\":\"" << engine.identity().hex()
                << "\"}\n";
      return 0;
    }

    const carver::CarveResult r = engine.carve(code);
    if (!r.ok)
      return fail(carver::to_string(r.error_code));
    std::cout << "{\"ok\":true,\"address\":\"" << r.address.hex()
              << "\",\"code_size\":" << code.size() << ",\"ledger\":\""
              << ledger->backend_id() << "\"}\n";
    return 0;
  }

  if (cmd == "verify" || cmd == "read") {
    carver::Address address;
    if (args.positional.size() < 2 || !carver::Address::from_hex(operand, address))
      return fail(carver::to_string(carver::ErrorCode::invalid_hex),
                  "expected a 20-byte hex address");

    if (cmd == "verify") {
      std::cout << "{\"address\":\"" << address.hex() << "\",\"carved\":"
                << (engine.is_carved(address) ? "true" : "false") << "}\n";
      return 0;
    }

    const std::string code = ledger->read_code(address);
    std::cout << "{\"address\":\"" << address.hex() << "\",\"occupied\":"
              << (ledger->contains(address) ? "true" : "false")
              << ",\"code\":\"0x" << carver::to_hex(code)
              << "\",\"code_size\":" << code.size() << "}\n";
    return 0;
  }

  if (cmd == "stats") {
    std::cout << "{\"ledger\":{\"backend\":\"" << ledger->backend_id()
              << "\",\"artifacts\":" << ledger->size()
              << "},\"audit\":{\"enabled\":"
              << (carver::global_audit_log().enabled() ? "true" : "false")
              << ",\"chain_entries\":"
              << (cfg.audit_log_path.empty()
                      ? 0
                      : carver::verify_audit_chain(cfg.audit_log_path))
              << "},\"engine\":" << carver::global_engine_stats().to_json()
              << "}\n";
    return 0;
  }

  usage();
  return fail("unknown_command", cmd, 1);
}
