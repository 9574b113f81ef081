#include "carver/ledger.hpp"

// FileLedger - local filesystem placement ledger.
//
// Artifact file layout (one file per address, written once):
//   {"address":"0x..","code_size":N,"created_at":T,"encoding":"identity",
//    "format_version":1,"stored_blob_hash":"<blake3 hex>","stored_size":M}
//   \n<stored blob>
//
// format_version is LEDGER_FORMAT_VERSION. A file written under any other
// version reads as empty.
//
// EXTENSION_POINT: append_only_journal
//   Current: the artifacts/ tree is the only record. A journal of place()
//   calls (address, code hash, timestamp) would allow listing artifacts in
//   placement order without walking the tree. The tree stays authoritative.

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>
#include <utility>

#if defined(CARVER_WITH_ZSTD)
#include <zstd.h>
#endif

#include "carver/hash.hpp"
#include "carver/jsonlite.hpp"
#include "carver/version.hpp"

namespace fs = std::filesystem;

namespace carver {

namespace {

#if defined(CARVER_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n))
    return {};
  out.resize(n);
  return out;
}

bool decompress_zstd(const std::string& data, std::size_t original_size, std::string* out) {
  std::string buf;
  buf.resize(original_size);
  size_t n = ZSTD_decompress(buf.data(), buf.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size)
    return false;
  *out = std::move(buf);
  return true;
}
#endif

// Unique temporary filename so concurrent writers never share a temp file.
std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

bool write_file(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs)
    return false;
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  ofs.flush();
  return static_cast<bool>(ofs);
}

enum class PublishResult { published, exists, io_error };

// Create-once publish: write to a temp file, then hard-link it to target.
// link() refuses to overwrite, so a concurrent or earlier writer wins.
PublishResult publish_once(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec)
    return PublishResult::io_error;

  const std::string tmp = make_tmp_name(target.parent_path());
  if (!write_file(tmp, data)) {
    std::remove(tmp.c_str());
    return PublishResult::io_error;
  }

  fs::create_hard_link(tmp, target, ec);
  std::remove(tmp.c_str());
  if (!ec)
    return PublishResult::published;
  if (ec == std::errc::file_exists)
    return PublishResult::exists;
  return PublishResult::io_error;
}

std::string header_json(const Address& address, const std::string& encoding, std::size_t code_size,
                        std::size_t stored_size, const std::string& stored_blob_hash,
                        uint64_t created_at) {
  return "{\"address\":\"" + address.hex() + "\",\"code_size\":" + std::to_string(code_size) +
         ",\"created_at\":" + std::to_string(created_at) + ",\"encoding\":\"" + encoding +
         "\",\"format_version\":" + std::to_string(version::LEDGER_FORMAT_VERSION) +
         ",\"stored_blob_hash\":\"" + stored_blob_hash +
         "\",\"stored_size\":" + std::to_string(stored_size) + "}";
}

}  // namespace

FileLedger::FileLedger(std::string root, HostRules rules, std::string compression)
    : root_(std::move(root)), rules_(rules), compression_(std::move(compression)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "artifacts", ec);
}

std::string FileLedger::artifact_path(const Address& address) const {
  const std::string hex = address.hex().substr(2);
  return (fs::path(root_) / "artifacts" / hex.substr(0, 2) / hex.substr(2, 2) / hex).string();
}

PlacementResult FileLedger::place(std::string_view init_code, const Address& caller,
                                  const Hash32& salt, const CommitGuard& guard) {
  PlacementResult result;

  HostPreparation prep = prepare_placement(init_code, caller, salt, rules_);
  if (!prep.ok) {
    result.reason = prep.reason;
    return result;
  }

  // In-process serialization point. Cross-process races are settled by
  // publish_once() below.
  std::lock_guard<std::mutex> lk(mu_);

  const fs::path target = artifact_path(prep.address);
  std::error_code ec;
  if (fs::exists(target, ec)) {
    result.reason = FailureReason::address_collision;
    return result;
  }

  const PendingArtifact pending{prep.address, prep.code.size()};
  if (guard) {
    const FailureReason verdict = guard(pending);
    if (verdict != FailureReason::none) {
      result.reason = verdict;
      return result;
    }
  }

  std::string stored = prep.code;
  std::string encoding = "identity";
#if defined(CARVER_WITH_ZSTD)
  if (compression_ == "zstd" && !prep.code.empty()) {
    auto c = compress_zstd(prep.code);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression_;
#endif

  const std::string header =
      header_json(prep.address, encoding, prep.code.size(), stored.size(), blake3_hex(stored),
                  static_cast<uint64_t>(std::time(nullptr)));

  switch (publish_once(target, header + "\n" + stored)) {
    case PublishResult::published:
      break;
    case PublishResult::exists:
      result.reason = FailureReason::address_collision;
      return result;
    case PublishResult::io_error:
      result.reason = FailureReason::ledger_io;
      return result;
  }

  result.ok = true;
  result.address = pending.address;
  result.code_size = pending.code_size;
  return result;
}

std::string FileLedger::read_code(const Address& address) const {
  const fs::path p = artifact_path(address);
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs)
    return {};
  const std::string raw((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

  const auto nl = raw.find('\n');
  if (nl == std::string::npos)
    return {};

  std::optional<jsonlite::JsonError> err;
  const auto header = jsonlite::parse(raw.substr(0, nl), &err);
  if (err)
    return {};
  if (jsonlite::get_u64(header, "format_version", 0) != version::LEDGER_FORMAT_VERSION)
    return {};

  std::string stored = raw.substr(nl + 1);
  const std::size_t code_size = static_cast<std::size_t>(jsonlite::get_u64(header, "code_size", 0));
  const std::size_t stored_size = static_cast<std::size_t>(jsonlite::get_u64(header, "stored_size", 0));
  if (stored.size() != stored_size)
    return {};
  if (jsonlite::get_string(header, "address") != address.hex())
    return {};

  // Verify stored blob integrity before decoding.
  if (blake3_hex(stored) != jsonlite::get_string(header, "stored_blob_hash"))
    return {};

  const std::string encoding = jsonlite::get_string(header, "encoding", "identity");
  if (encoding == "zstd") {
#if defined(CARVER_WITH_ZSTD)
    std::string code;
    if (!decompress_zstd(stored, code_size, &code))
      return {};
    return code;
#else
    return {};
#endif
  }
  if (encoding != "identity" || stored.size() != code_size)
    return {};
  return stored;
}

std::size_t FileLedger::size_of(const Address& address) const {
  return read_code(address).size();
}

bool FileLedger::contains(const Address& address) const {
  std::error_code ec;
  return fs::exists(artifact_path(address), ec);
}

std::size_t FileLedger::size() const {
  std::size_t count = 0;
  std::error_code ec;
  const fs::path dir = fs::path(root_) / "artifacts";
  if (!fs::exists(dir, ec))
    return 0;
  for (auto it = fs::recursive_directory_iterator(dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec))
      continue;
    const std::string name = it->path().filename().string();
    if (name.rfind(".tmp_", 0) == 0)
      continue;
    ++count;
  }
  return count;
}

}  // namespace carver
