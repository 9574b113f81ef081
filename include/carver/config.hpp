#pragma once

// carver/config.hpp - Engine configuration: JSON file and environment.
//
// Config file (all keys optional except where noted):
//   {
//     "config_version": "1",
//     "engine_identity": "0x<40 hex>",          // or "anchor", not both
//     "anchor": {"factory": "0x<40 hex>", "salt": "<64 hex>",
//                "init_code": "0x<hex>"},
//     "max_code_size": 24576,
//     "forbidden_first_byte": 239,
//     "enforce_forbidden_first_byte": true,
//     "ledger_root": ".carver/ledger/v1",
//     "compression": "off" | "zstd",
//     "audit_log": "/path/audit.ndjson",
//     "event_log": "/path/events.jsonl"
//   }
//
// Environment overrides (applied by apply_env_overrides):
//   CARVER_ENGINE_IDENTITY, CARVER_MAX_CODE_SIZE, CARVER_LEDGER_ROOT,
//   CARVER_AUDIT_LOG, CARVER_EVENT_LOG

#include <string>
#include <vector>

#include "carver/types.hpp"

namespace carver {

struct EngineConfig {
  Address engine_identity;
  HostRules rules;
  std::string ledger_root;          // empty or ":memory:" = in-memory ledger
  std::string compression{"off"};
  std::string audit_log_path;       // empty = audit log disabled
  std::string event_log_path;       // empty = CARVER_EVENT_LOG or disabled
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Defaults for a process-spanning deployment such as the command-line tool:
// artifacts persist under kDefaultLedgerRoot, so separate invocations share
// one ledger.
EngineConfig persistent_config();

// Checks a config document without applying it. Never throws.
ConfigValidationResult validate_config(const std::string& config_json);

// Validate, then apply the document over *out. On failure *out is left
// untouched and *error holds the first error.
bool parse_config(const std::string& config_json, EngineConfig* out, std::string* error);

// Overlay CARVER_* environment variables on *cfg. On a malformed value,
// returns false with *error set and *cfg untouched.
bool apply_env_overrides(EngineConfig* cfg, std::string* error);

std::string config_to_json(const EngineConfig& cfg);

}  // namespace carver
