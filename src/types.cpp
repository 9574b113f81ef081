#include "carver/types.hpp"

#include <algorithm>

#include "carver/hash.hpp"

namespace carver {

namespace {

template <std::size_t N>
bool decode_fixed(std::string_view text, std::array<uint8_t, N>& out) {
  std::string raw;
  if (!from_hex(text, &raw) || raw.size() != N) return false;
  std::copy(raw.begin(), raw.end(), out.begin());
  return true;
}

}  // namespace

bool Address::is_zero() const {
  return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

std::string Address::hex() const {
  return "0x" + to_hex(bytes.data(), bytes.size());
}

bool Address::from_hex(std::string_view text, Address& out) {
  return decode_fixed(text, out.bytes);
}

bool Hash32::is_zero() const {
  return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

std::string Hash32::hex() const {
  return to_hex(bytes.data(), bytes.size());
}

bool Hash32::from_hex(std::string_view text, Hash32& out) {
  return decode_fixed(text, out.bytes);
}

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::deployment_failed: return "deployment_failed";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::invalid_hex: return "invalid_hex";
  }
  return "";
}

std::string to_string(FailureReason reason) {
  switch (reason) {
    case FailureReason::none: return "";
    case FailureReason::empty_code: return "empty_code";
    case FailureReason::forbidden_first_byte: return "forbidden_first_byte";
    case FailureReason::code_too_large: return "code_too_large";
    case FailureReason::address_collision: return "address_collision";
    case FailureReason::bootstrap_rejected: return "bootstrap_rejected";
    case FailureReason::address_mismatch: return "address_mismatch";
    case FailureReason::size_mismatch: return "size_mismatch";
    case FailureReason::ledger_io: return "ledger_io";
  }
  return "";
}

}  // namespace carver
