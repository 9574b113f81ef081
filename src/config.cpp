#include "carver/config.hpp"

#include <cstdlib>
#include <set>
#include <stdexcept>
#include <utility>
#include <variant>

#include "carver/bootstrap.hpp"
#include "carver/derivation.hpp"
#include "carver/hash.hpp"
#include "carver/jsonlite.hpp"
#include "carver/ledger.hpp"

namespace carver {

namespace {

const std::set<std::string> kKnownKeys = {
    "config_version", "engine_identity", "anchor", "max_code_size",
    "forbidden_first_byte", "enforce_forbidden_first_byte", "ledger_root",
    "compression", "audit_log", "event_log",
};

template <typename T>
bool is_type(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && std::holds_alternative<T>(it->second.v);
}

void check_string(const jsonlite::Object& obj, const std::string& key, ConfigValidationResult& r) {
  if (jsonlite::has_key(obj, key) && !is_type<std::string>(obj, key)) {
    r.errors.push_back(key + " must be a string");
  }
}

// Resolves an "anchor" object to an identity. Returns false with a message.
bool resolve_anchor(const jsonlite::Object& anchor, Address* out, std::string* error) {
  Address factory;
  Hash32 salt;
  std::string init_code;
  if (!Address::from_hex(jsonlite::get_string(anchor, "factory"), factory)) {
    *error = "anchor.factory must be a 20-byte hex address";
    return false;
  }
  if (jsonlite::has_key(anchor, "salt") &&
      !Hash32::from_hex(jsonlite::get_string(anchor, "salt"), salt)) {
    *error = "anchor.salt must be 32 bytes of hex";
    return false;
  }
  if (!from_hex(jsonlite::get_string(anchor, "init_code"), &init_code) || init_code.empty()) {
    *error = "anchor.init_code must be non-empty hex";
    return false;
  }
  *out = anchor_identity(factory, salt, init_code);
  return true;
}

}  // namespace

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;

  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  for (const auto& [key, value] : obj) {
    (void)value;
    if (kKnownKeys.count(key) == 0) r.warnings.push_back("unknown key: " + key);
  }

  r.config_version = jsonlite::get_string(obj, "config_version", "1");
  if (r.config_version != "1") {
    r.errors.push_back("unsupported config_version: " + r.config_version);
  }

  const bool has_identity = jsonlite::has_key(obj, "engine_identity");
  const bool has_anchor = jsonlite::has_key(obj, "anchor");
  if (has_identity && has_anchor) {
    r.errors.push_back("engine_identity and anchor are mutually exclusive");
  }
  if (has_identity) {
    Address id;
    if (!Address::from_hex(jsonlite::get_string(obj, "engine_identity"), id)) {
      r.errors.push_back("engine_identity must be a 20-byte hex address");
    } else if (id.is_zero()) {
      r.warnings.push_back("engine_identity is the zero address");
    }
  } else if (has_anchor) {
    auto anchor = jsonlite::get_object(obj, "anchor");
    Address id;
    std::string msg;
    if (!anchor) {
      r.errors.push_back("anchor must be an object");
    } else if (!resolve_anchor(*anchor, &id, &msg)) {
      r.errors.push_back(msg);
    }
  } else {
    r.warnings.push_back("no engine_identity configured; the zero address will be used");
  }

  if (jsonlite::has_key(obj, "max_code_size")) {
    const std::uint64_t size = jsonlite::get_u64(obj, "max_code_size", 0);
    if (!is_type<std::uint64_t>(obj, "max_code_size") || size == 0) {
      r.errors.push_back("max_code_size must be a positive integer");
    } else if (size > kMaxSupportedCodeSize) {
      r.errors.push_back("max_code_size must not exceed " + std::to_string(kMaxSupportedCodeSize));
    }
  }
  if (jsonlite::has_key(obj, "forbidden_first_byte")) {
    if (!is_type<std::uint64_t>(obj, "forbidden_first_byte") ||
        jsonlite::get_u64(obj, "forbidden_first_byte", 256) > 0xff) {
      r.errors.push_back("forbidden_first_byte must be an integer in [0, 255]");
    }
  }
  if (jsonlite::has_key(obj, "enforce_forbidden_first_byte") &&
      !is_type<bool>(obj, "enforce_forbidden_first_byte")) {
    r.errors.push_back("enforce_forbidden_first_byte must be a boolean");
  }

  check_string(obj, "ledger_root", r);
  check_string(obj, "audit_log", r);
  check_string(obj, "event_log", r);
  check_string(obj, "compression", r);
  const std::string compression = jsonlite::get_string(obj, "compression", "off");
  if (compression != "off" && compression != "zstd") {
    r.errors.push_back("compression must be \"off\" or \"zstd\"");
  }
#if !defined(CARVER_WITH_ZSTD)
  if (compression == "zstd") {
    r.warnings.push_back("compression=zstd requested but carver was built without zstd");
  }
#endif

  r.ok = r.errors.empty();
  return r;
}

bool parse_config(const std::string& config_json, EngineConfig* out, std::string* error) {
  const ConfigValidationResult v = validate_config(config_json);
  if (!v.ok) {
    if (error) *error = v.errors.front();
    return false;
  }

  const auto obj = jsonlite::parse(config_json, nullptr);

  EngineConfig cfg = *out;
  if (jsonlite::has_key(obj, "engine_identity")) {
    if (!Address::from_hex(jsonlite::get_string(obj, "engine_identity"), cfg.engine_identity)) {
      if (error) *error = "engine_identity must be a 20-byte hex address";
      return false;
    }
  } else if (auto anchor = jsonlite::get_object(obj, "anchor")) {
    std::string msg;
    if (!resolve_anchor(*anchor, &cfg.engine_identity, &msg)) {
      if (error) *error = msg;
      return false;
    }
  }
  cfg.rules.max_code_size = static_cast<std::size_t>(
      jsonlite::get_u64(obj, "max_code_size", cfg.rules.max_code_size));
  cfg.rules.forbidden_first_byte = static_cast<uint8_t>(
      jsonlite::get_u64(obj, "forbidden_first_byte", cfg.rules.forbidden_first_byte));
  cfg.rules.enforce_forbidden_first_byte = jsonlite::get_bool(
      obj, "enforce_forbidden_first_byte", cfg.rules.enforce_forbidden_first_byte);
  cfg.ledger_root = jsonlite::get_string(obj, "ledger_root", cfg.ledger_root);
  cfg.compression = jsonlite::get_string(obj, "compression", cfg.compression);
  cfg.audit_log_path = jsonlite::get_string(obj, "audit_log", cfg.audit_log_path);
  cfg.event_log_path = jsonlite::get_string(obj, "event_log", cfg.event_log_path);

  *out = cfg;
  return true;
}

bool apply_env_overrides(EngineConfig* cfg, std::string* error) {
  EngineConfig next = *cfg;

  if (const char* e = std::getenv("CARVER_ENGINE_IDENTITY"); e && e[0]) {
    if (!Address::from_hex(e, next.engine_identity)) {
      if (error) *error = "CARVER_ENGINE_IDENTITY must be a 20-byte hex address";
      return false;
    }
  }
  if (const char* e = std::getenv("CARVER_MAX_CODE_SIZE"); e && e[0]) {
    try {
      std::size_t pos = 0;
      const unsigned long long v = std::stoull(e, &pos);
      if (pos != std::string(e).size() || v == 0) throw std::invalid_argument(e);
      if (v > kMaxSupportedCodeSize) throw std::out_of_range(e);
      next.rules.max_code_size = static_cast<std::size_t>(v);
    } catch (const std::exception&) {
      if (error) {
        *error = "CARVER_MAX_CODE_SIZE must be a positive integer no larger than " +
                 std::to_string(kMaxSupportedCodeSize);
      }
      return false;
    }
  }
  if (const char* e = std::getenv("CARVER_LEDGER_ROOT"); e && e[0]) next.ledger_root = e;
  if (const char* e = std::getenv("CARVER_AUDIT_LOG"); e && e[0]) next.audit_log_path = e;
  if (const char* e = std::getenv("CARVER_EVENT_LOG"); e && e[0]) next.event_log_path = e;

  *cfg = next;
  return true;
}

EngineConfig persistent_config() {
  EngineConfig cfg;
  cfg.ledger_root = kDefaultLedgerRoot;
  return cfg;
}

std::string config_to_json(const EngineConfig& cfg) {
  jsonlite::Object obj;
  obj["config_version"] = jsonlite::Value{std::string("1")};
  obj["engine_identity"] = jsonlite::Value{cfg.engine_identity.hex()};
  obj["max_code_size"] = jsonlite::Value{static_cast<std::uint64_t>(cfg.rules.max_code_size)};
  obj["forbidden_first_byte"] =
      jsonlite::Value{static_cast<std::uint64_t>(cfg.rules.forbidden_first_byte)};
  obj["enforce_forbidden_first_byte"] = jsonlite::Value{cfg.rules.enforce_forbidden_first_byte};
  obj["ledger_root"] = jsonlite::Value{cfg.ledger_root};
  obj["compression"] = jsonlite::Value{cfg.compression};
  obj["audit_log"] = jsonlite::Value{cfg.audit_log_path};
  obj["event_log"] = jsonlite::Value{cfg.event_log_path};
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

}  // namespace carver
