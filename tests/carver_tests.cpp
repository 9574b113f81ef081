#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "carver/audit.hpp"
#include "carver/bootstrap.hpp"
#include "carver/config.hpp"
#include "carver/derivation.hpp"
#include "carver/engine.hpp"
#include "carver/hash.hpp"
#include "carver/jsonlite.hpp"
#include "carver/ledger.hpp"
#include "carver/observability.hpp"
#include "carver/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

std::string bytes(const std::string& hex) {
  std::string out;
  expect(carver::from_hex(hex, &out), "test fixture hex must decode: " + hex);
  return out;
}

carver::Address make_identity(uint8_t fill) {
  carver::Address a;
  a.bytes.fill(fill);
  return a;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("carver_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::unique_ptr<carver::CarveEngine> memory_engine(const carver::Address& id,
                                                   std::shared_ptr<carver::MemoryLedger>* out = nullptr) {
  auto ledger = std::make_shared<carver::MemoryLedger>();
  if (out) *out = ledger;
  return std::make_unique<carver::CarveEngine>(id, ledger);
}

// Scenario payloads.
const std::string kScenarioA = "602a60005260206000f3";
std::string scenario_b() {
  std::string s;
  for (int i = 1; i <= 0x20; ++i) s.push_back(static_cast<char>(i));
  return s;
}

// ============================================================================
// Hash primitive
// ============================================================================

void test_blake3_known_vectors() {
  expect(carver::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(carver::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(carver::hash_bytes("hello").hex() == carver::blake3_hex("hello"),
         "hash_bytes and blake3_hex agree");
  const auto info = carver::hash_runtime_info();
  expect(info.primitive == "blake3" && info.blake3_available, "runtime reports blake3");
}

void test_hex_helpers() {
  std::string out = "untouched";
  expect(carver::from_hex("0x00ff10", &out) && out == std::string("\x00\xff\x10", 3),
         "0x-prefixed hex decodes");
  expect(carver::from_hex("ABcd", &out) && out == "\xab\xcd", "mixed case decodes");
  expect(carver::from_hex("", &out) && out.empty(), "empty hex is empty bytes");

  out = "untouched";
  expect(!carver::from_hex("abc", &out) && out == "untouched", "odd length rejected, out untouched");
  expect(!carver::from_hex("zz", &out), "non-hex rejected");
  expect(carver::to_hex(std::string("\x01\xab", 2)) == "01ab", "to_hex lowercase, no prefix");

  carver::Address a;
  expect(carver::Address::from_hex("0x" + std::string(40, 'a'), a), "address parses");
  expect(a.hex() == "0x" + std::string(40, 'a'), "address hex round trip");
  expect(!carver::Address::from_hex(std::string(38, 'a'), a), "short address rejected");
  expect(carver::Address{}.is_zero() && !a.is_zero(), "is_zero");
  expect(carver::kZeroSalt.is_zero(), "zero salt");
}

// ============================================================================
// Bootstrap prefix
// ============================================================================

void test_bootstrap_prefix_constant() {
  expect(carver::bootstrap_prefix().size() == 11, "prefix is 11 bytes");
  expect(carver::to_hex(carver::bootstrap_prefix()) == "600b380380600b3d393df3", "prefix bytes");
  const std::string init = carver::compose_init_code("\x01\x02");
  expect(init.size() == 13 && init.substr(11) == "\x01\x02", "compose appends runtime");
}

void test_bootstrap_returns_suffix() {
  const std::vector<std::string> suffixes = {
      "", bytes(kScenarioA), scenario_b(), std::string(300, '\x5b'), std::string(24576, '\x00'),
      std::string("\xef\x00", 2)};
  for (const auto& s : suffixes) {
    const auto out = carver::run_init_code(carver::compose_init_code(s));
    expect(out.ok, "prefix runs for suffix of size " + std::to_string(s.size()));
    expect(out.returned == s, "prefix returns the suffix exactly, size " + std::to_string(s.size()));
  }
}

void test_bootstrap_memory_ceiling() {
  const std::size_t limit = carver::kMaxSupportedCodeSize;
  const std::string at_limit(limit, '\x01');
  const auto ok = carver::run_init_code(carver::compose_init_code(at_limit));
  expect(ok.ok && ok.returned == at_limit, "prefix returns a suffix of the maximum supported size");

  const auto over = carver::run_init_code(carver::compose_init_code(std::string(limit + 1, '\x01')));
  expect(!over.ok, "suffix past the memory ceiling is rejected");
}

void test_bootstrap_rejects_unsupported() {
  auto r = carver::run_init_code(bytes("6001600101"));  // PUSH1 1 PUSH1 1 ADD
  expect(!r.ok && r.error.find("unsupported_opcode_0x01") == 0, "ADD is unsupported");
  expect(r.returned.empty(), "failed run returns nothing");

  r = carver::run_init_code(bytes("03"));
  expect(!r.ok && r.error == "stack_underflow", "SUB on empty stack underflows");

  r = carver::run_init_code(bytes("60ff60fff3"));  // RETURN offset 0xff size 0xff
  expect(r.ok && r.returned == std::string(0xff, '\0'), "RETURN of untouched memory is zeros");

  r = carver::run_init_code(bytes("6000"));
  expect(r.ok && r.returned.empty(), "running off the end stops with empty return");
}

void test_disassemble_prefix() {
  const std::string text = carver::disassemble(carver::bootstrap_prefix());
  expect(text.find("0000 PUSH1 0x0b") != std::string::npos, "first instruction");
  expect(text.find("0008 CODECOPY") != std::string::npos, "codecopy offset");
  expect(text.find("000a RETURN") != std::string::npos, "final RETURN");
  expect(carver::disassemble("\x01").find("INVALID(0x01)") != std::string::npos, "invalid opcode shown");
}

// ============================================================================
// Address derivation
// ============================================================================

void test_derivation_deterministic() {
  const auto id = make_identity(0x11);
  const std::string code = bytes(kScenarioA);
  const auto a1 = carver::address_of(code, id);
  const auto a2 = carver::address_of(code, id);
  expect(a1 == a2, "address_of is deterministic");
  expect(!a1.is_zero(), "derived address is non-zero");

  expect(carver::address_of(code, make_identity(0x12)) != a1, "identity changes the address");
  expect(carver::address_of(code + std::string(1, '\0'), id) != a1, "one more byte moves the address");

  // address_of is the placement rule over the composed init code.
  const auto expected =
      carver::derive_address(id, carver::kZeroSalt, carver::hash_bytes(carver::compose_init_code(code)));
  expect(a1 == expected, "address_of == derive_address(identity, 0, H(prefix||code))");
}

void test_derivation_total() {
  const auto id = make_identity(0x11);
  const auto empty = carver::address_of("", id);
  expect(!empty.is_zero(), "address_of(\"\") is defined");
  expect(carver::address_of("", id) == empty, "address_of(\"\") is stable");
  expect(!carver::address_of(std::string(100000, '\x01'), id).is_zero(), "oversize input still derives");
  expect(!carver::address_of("\xef", id).is_zero(), "forbidden first byte still derives");
}

void test_salt_and_deployer_bind() {
  carver::Hash32 salt;
  salt.bytes[31] = 1;
  const auto h = carver::hash_bytes("init");
  const auto base = carver::derive_address(make_identity(1), carver::kZeroSalt, h);
  expect(carver::derive_address(make_identity(1), salt, h) != base, "salt binds");
  expect(carver::derive_address(make_identity(2), carver::kZeroSalt, h) != base, "deployer binds");
  expect(carver::derive_address(make_identity(1), carver::kZeroSalt, carver::hash_bytes("init2")) != base,
         "init code hash binds");
}

void test_anchor_identity() {
  const auto factory = make_identity(0x4e);
  const std::string init = bytes("6080604052");
  const auto id1 = carver::anchor_identity(factory, carver::kZeroSalt, init);
  const auto id2 = carver::anchor_identity(factory, carver::kZeroSalt, init);
  expect(id1 == id2, "anchor identity is host-independent");
  expect(id1 == carver::derive_address(factory, carver::kZeroSalt, carver::hash_bytes(init)),
         "anchor identity follows the placement rule");
}

// ============================================================================
// Engine: carve / address_of / is_carved
// ============================================================================

void check_scenario(const std::string& code, const std::string& label) {
  const auto id = make_identity(0x22);
  std::shared_ptr<carver::MemoryLedger> ledger;
  auto engine = memory_engine(id, &ledger);

  const auto predicted = engine->address_of(code);
  const auto r = engine->carve(code);
  expect(r.ok, label + ": carve succeeds");
  expect(r.error_code == carver::ErrorCode::none, label + ": no error code");
  expect(r.address == predicted, label + ": carve lands at the predicted address");
  expect(ledger->read_code(r.address) == code, label + ": stored bytes equal input");
  expect(ledger->size_of(r.address) == code.size(), label + ": stored size equals input size");
  expect(engine->is_carved(r.address), label + ": is_carved after carve");
  expect(engine->address_of(code) == predicted, label + ": prediction unchanged after carve");
}

void test_scenario_a() { check_scenario(bytes(kScenarioA), "scenario A"); }

void test_scenario_b() { check_scenario(scenario_b(), "scenario B"); }

void test_scenario_c() {
  const std::string code = scenario_b() + scenario_b();
  expect(code.size() == 64, "scenario C payload is 64 bytes");
  check_scenario(code, "scenario C");
}

void test_init_code_stored_as_data() {
  // Another engine's init code (prefix || A), padded to 64 bytes.
  std::string code = carver::compose_init_code(bytes(kScenarioA));
  code.resize(64, '\x00');
  check_scenario(code, "init code payload");

  // The bytes are inert: they are stored, not run.
  const auto id = make_identity(0x23);
  auto engine = memory_engine(id);
  const auto r = engine->carve(code);
  expect(r.ok && engine->ledger().read_code(r.address) == code, "init code stored verbatim");
}

void test_duplicate_carve_fails() {
  const auto id = make_identity(0x33);
  std::shared_ptr<carver::MemoryLedger> ledger;
  auto engine = memory_engine(id, &ledger);
  const std::string code = bytes(kScenarioA);

  const auto first = engine->carve(code);
  expect(first.ok, "first carve succeeds");
  const auto second = engine->carve(code);
  expect(!second.ok, "second carve of identical bytes fails");
  expect(second.error_code == carver::ErrorCode::deployment_failed, "failure is deployment_failed");
  expect(second.address.is_zero(), "failed carve returns no address");
  expect(ledger->read_code(first.address) == code, "original artifact unchanged");
  expect(ledger->size() == 1, "ledger still holds one artifact");
}

void test_precondition_failures() {
  const auto id = make_identity(0x44);
  std::shared_ptr<carver::MemoryLedger> ledger;
  auto engine = memory_engine(id, &ledger);

  auto r = engine->carve("");
  expect(!r.ok && r.error_code == carver::ErrorCode::deployment_failed, "empty input fails");

  r = engine->carve(bytes("ef00"));
  expect(!r.ok && r.error_code == carver::ErrorCode::deployment_failed, "0xEF first byte fails");

  r = engine->carve(std::string(24577, '\x01'));
  expect(!r.ok && r.error_code == carver::ErrorCode::deployment_failed, "24577 bytes fails");

  expect(ledger->size() == 0, "failed carves leave the ledger empty");

  r = engine->carve(std::string(24576, '\x01'));
  expect(r.ok, "exactly max_code_size bytes succeeds");
  r = engine->carve(bytes("00ef"));
  expect(r.ok, "0xEF in a later position is fine");
}

void test_host_rules_enforced_by_ledger() {
  // Engine allows more than the host does: the host still refuses.
  carver::HostRules host;
  auto ledger = std::make_shared<carver::MemoryLedger>(host);
  carver::EngineConfig cfg;
  cfg.engine_identity = make_identity(0x45);
  cfg.rules.max_code_size = 100000;
  cfg.rules.enforce_forbidden_first_byte = false;
  carver::CarveEngine engine(cfg, ledger);

  auto r = engine.carve(std::string(host.max_code_size + 1, '\x01'));
  expect(!r.ok && r.error_code == carver::ErrorCode::deployment_failed, "host refuses oversize code");
  r = engine.carve(bytes("ef01"));
  expect(!r.ok, "host refuses forbidden first byte");
  expect(ledger->size() == 0, "refused placements leave no trace");
}

void test_guard_rejection_leaves_ledger_unchanged() {
  carver::MemoryLedger ledger;
  const auto init = carver::compose_init_code(bytes(kScenarioA));
  const auto rejected = ledger.place(init, make_identity(1), carver::kZeroSalt,
                                     [](const carver::PendingArtifact&) {
                                       return carver::FailureReason::size_mismatch;
                                     });
  expect(!rejected.ok && rejected.reason == carver::FailureReason::size_mismatch,
         "guard verdict is returned");
  expect(ledger.size() == 0, "rejected placement not committed");

  carver::PendingArtifact seen;
  const auto accepted = ledger.place(init, make_identity(1), carver::kZeroSalt,
                                     [&seen](const carver::PendingArtifact& p) {
                                       seen = p;
                                       return carver::FailureReason::none;
                                     });
  expect(accepted.ok && seen.address == accepted.address, "guard sees the pending address");
  expect(seen.code_size == 10, "guard sees the stored size");

  const auto bad = ledger.place(bytes("6001600101"), make_identity(1), carver::kZeroSalt, nullptr);
  expect(!bad.ok && bad.reason == carver::FailureReason::bootstrap_rejected, "bad init code rejected");
}

void test_is_carved_negative() {
  const auto id = make_identity(0x55);
  std::shared_ptr<carver::MemoryLedger> ledger;
  auto engine = memory_engine(id, &ledger);

  expect(!engine->is_carved(make_identity(0x99)), "unoccupied address is not carved");
  expect(!engine->is_carved(carver::Address{}), "zero address is not carved");

  // A foreign artifact at the address X would carve to, holding other bytes.
  const std::string x = bytes(kScenarioA);
  const auto target = engine->address_of(x);
  expect(ledger->preload(target, scenario_b()), "preload foreign artifact");
  expect(!engine->is_carved(target), "foreign bytes at a derived address are rejected");
  expect(!engine->carve(x).ok, "carve into a preloaded address fails");
  expect(ledger->read_code(target) == scenario_b(), "preloaded artifact untouched");

  // Carved bytes at an address that is not their derived address.
  const auto elsewhere = make_identity(0x77);
  expect(ledger->preload(elsewhere, x), "preload at arbitrary address");
  expect(!engine->is_carved(elsewhere), "bytes at the wrong address are rejected");

  // A different engine does not recognize this engine's artifacts.
  auto other = std::make_unique<carver::CarveEngine>(make_identity(0x56), ledger);
  const auto mine = engine->carve(scenario_b());
  expect(mine.ok, "carve scenario B");
  expect(!other->is_carved(mine.address), "other identity does not verify");
}

void test_is_carved_empty_address() {
  const auto id = make_identity(0x66);
  auto engine = memory_engine(id);
  const auto empty_addr = engine->address_of("");
  expect(engine->is_carved(empty_addr), "address_of(\"\") verifies: empty re-derives to itself");
  expect(!engine->carve("").ok, "but empty code can never be carved");
}

void test_concurrent_carve_single_winner() {
  const auto id = make_identity(0x88);
  std::shared_ptr<carver::MemoryLedger> ledger;
  auto engine = memory_engine(id, &ledger);
  const std::string code = scenario_b();

  constexpr int kThreads = 16;
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      if (engine->carve(code).ok) winners.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();

  expect(winners.load() == 1, "exactly one concurrent carve wins");
  expect(ledger->size() == 1, "one artifact stored");
  expect(engine->is_carved(engine->address_of(code)), "winner's artifact verifies");
}

// ============================================================================
// FileLedger
// ============================================================================

void test_file_ledger_persistence() {
  const auto dir = fresh_dir("persist");
  const auto id = make_identity(0x10);
  const std::string code = bytes(kScenarioA);
  carver::Address placed;
  {
    auto ledger = std::make_shared<carver::FileLedger>(dir.string());
    carver::CarveEngine engine(id, ledger);
    const auto r = engine.carve(code);
    expect(r.ok, "file carve succeeds");
    placed = r.address;
    expect(fs::exists(ledger->artifact_path(placed)), "artifact file exists");
    expect(ledger->artifact_path(placed).find("artifacts") != std::string::npos, "sharded under artifacts/");
  }
  {
    auto ledger = std::make_shared<carver::FileLedger>(dir.string());
    carver::CarveEngine engine(id, ledger);
    expect(ledger->read_code(placed) == code, "artifact survives reopen");
    expect(ledger->size() == 1, "one artifact on disk");
    expect(engine.is_carved(placed), "reopened ledger verifies");
    expect(!engine.carve(code).ok, "collision detected across instances");
    expect(ledger->read_code(placed) == code, "artifact unchanged after collision");
  }
  fs::remove_all(dir);
}

void test_file_ledger_corruption_reads_empty() {
  const auto dir = fresh_dir("corrupt");
  const auto id = make_identity(0x10);
  auto ledger = std::make_shared<carver::FileLedger>(dir.string());
  carver::CarveEngine engine(id, ledger);
  const auto r = engine.carve(scenario_b());
  expect(r.ok, "carve before corruption");

  const std::string path = ledger->artifact_path(r.address);
  {
    std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
    f.seekp(-1, std::ios::end);
    f.put('\x7f');
  }
  expect(ledger->read_code(r.address).empty(), "tampered blob reads as empty");
  expect(ledger->contains(r.address), "tampered address stays occupied");
  expect(!engine.is_carved(r.address), "tampered artifact does not verify");
  expect(!engine.carve(scenario_b()).ok, "tampered address cannot be re-carved");
  fs::remove_all(dir);
}

void test_file_ledger_format_version() {
  const auto dir = fresh_dir("format");
  auto ledger = std::make_shared<carver::FileLedger>(dir.string());
  carver::CarveEngine engine(make_identity(0x10), ledger);
  const auto r = engine.carve(scenario_b());
  expect(r.ok, "carve before header inspection");

  const std::string path = ledger->artifact_path(r.address);
  std::string raw;
  {
    std::ifstream ifs(path, std::ios::binary);
    raw.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  }
  const auto nl = raw.find('\n');
  expect(nl != std::string::npos, "artifact has a header line");
  std::optional<carver::jsonlite::JsonError> err;
  const auto header = carver::jsonlite::parse(raw.substr(0, nl), &err);
  expect(!err, "header is JSON");
  expect(carver::jsonlite::get_u64(header, "format_version", 0) == carver::version::LEDGER_FORMAT_VERSION,
         "header carries the ledger format version");

  // Same blob, same hash, different format version.
  const std::string stamp = "\"format_version\":" + std::to_string(carver::version::LEDGER_FORMAT_VERSION);
  const auto pos = raw.find(stamp);
  expect(pos != std::string::npos && pos < nl, "format stamp is in the header");
  raw.replace(pos, stamp.size(),
              "\"format_version\":" + std::to_string(carver::version::LEDGER_FORMAT_VERSION + 1));
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << raw;
  }
  expect(ledger->read_code(r.address).empty(), "unknown format version reads as empty");
  expect(ledger->contains(r.address), "address stays occupied");
  expect(!engine.is_carved(r.address), "unknown format version does not verify");
  fs::remove_all(dir);
}

void test_default_ledger_shared_across_engines() {
  const auto dir = fresh_dir("default_root");
  const fs::path cwd = fs::current_path();
  fs::current_path(dir);

  carver::EngineConfig cfg = carver::persistent_config();
  expect(cfg.ledger_root == carver::kDefaultLedgerRoot, "defaults name the on-disk ledger");
  cfg.engine_identity = make_identity(0x41);

  // Two engines that share nothing but the working directory, like two
  // invocations of the command-line tool.
  carver::Address placed;
  {
    auto ledger = carver::make_ledger(cfg);
    expect(ledger->backend_id() == "local_fs", "default ledger lives on disk");
    carver::CarveEngine engine(cfg, ledger);
    const auto r = engine.carve(bytes(kScenarioA));
    expect(r.ok, "first engine carves");
    placed = r.address;
  }
  {
    carver::CarveEngine engine(cfg, carver::make_ledger(cfg));
    expect(engine.is_carved(placed), "second engine verifies the first engine's carve");
    expect(engine.ledger().read_code(placed) == bytes(kScenarioA), "second engine reads the bytes");
    expect(!engine.carve(bytes(kScenarioA)).ok, "second engine cannot carve the same code again");
  }
  expect(fs::exists(dir / ".carver" / "ledger" / "v1"), "ledger created under the working directory");

  fs::current_path(cwd);
  fs::remove_all(dir);
}

void test_file_ledger_concurrent_instances() {
  const auto dir = fresh_dir("race");
  const auto id = make_identity(0x10);
  const std::string code = bytes(kScenarioA);

  // Separate ledger instances share nothing but the directory, like separate
  // processes would.
  constexpr int kThreads = 8;
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      auto ledger = std::make_shared<carver::FileLedger>(dir.string());
      carver::CarveEngine engine(id, ledger);
      if (engine.carve(code).ok) winners.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();

  carver::FileLedger check(dir.string());
  expect(winners.load() == 1, "exactly one writer wins across instances");
  expect(check.size() == 1, "no temp files or duplicates counted");
  expect(check.read_code(carver::address_of(code, id)) == code, "winner's bytes intact");
  fs::remove_all(dir);
}

// ============================================================================
// Observability and audit
// ============================================================================

std::vector<carver::CarveEvent>* g_captured = nullptr;

void capture_hook(const carver::CarveEvent& ev) {
  if (g_captured) g_captured->push_back(ev);
}

void test_events_and_stats() {
  auto& stats = carver::global_engine_stats();
  stats.reset();
  std::vector<carver::CarveEvent> events;
  g_captured = &events;
  carver::set_carve_event_hook(&capture_hook);

  auto engine = memory_engine(make_identity(0x31));
  const std::string code = bytes(kScenarioA);
  const auto ok = engine->carve(code);
  const auto dup = engine->carve(code);
  (void)engine->is_carved(ok.address);
  (void)engine->address_of(code);

  carver::set_carve_event_hook(nullptr);
  g_captured = nullptr;

  expect(ok.ok && !dup.ok, "carve then duplicate");
  expect(events.size() == 3, "two carve events and one verify event");
  expect(events[0].operation == "carve" && events[0].ok, "first event is successful carve");
  expect(events[1].failure_reason == carver::FailureReason::address_collision,
         "duplicate is reported as a collision");
  expect(events[1].error_code == "deployment_failed", "event carries public error code");
  expect(events[2].operation == "verify" && events[2].ok, "verify event");
  expect(events[0].code_hash == carver::blake3_hex(code), "event carries code hash");

  expect(stats.carves_total.load() == 2, "carves_total");
  expect(stats.carves_ok.load() == 1 && stats.carves_failed.load() == 1, "ok/failed split");
  expect(stats.collisions.load() == 1, "collision counted");
  expect(stats.verifications_positive.load() == 1, "positive verification counted");
  expect(stats.derivations.load() == 1, "explicit derivation counted");
  expect(stats.failure_breakdown().at("address_collision") == 1, "failure breakdown");
  expect(stats.carve_latency.count() == 2, "latency recorded per carve");
  expect(stats.recent_events_snapshot().size() == 3, "ring holds recent events");

  std::optional<carver::jsonlite::JsonError> err;
  const auto obj = carver::jsonlite::parse(stats.to_json(), &err);
  expect(!err && carver::jsonlite::has_key(obj, "carves"), "stats JSON parses");
  stats.reset();
}

void test_event_log_sink() {
  const auto dir = fresh_dir("events");
  const std::string path = (dir / "events.jsonl").string();
  carver::set_event_log_path(path);
  auto engine = memory_engine(make_identity(0x32));
  expect(engine->carve(bytes(kScenarioA)).ok, "carve with event sink");
  carver::set_event_log_path("");

  std::ifstream ifs(path);
  std::string line;
  expect(static_cast<bool>(std::getline(ifs, line)), "event line written");
  std::optional<carver::jsonlite::JsonError> err;
  const auto obj = carver::jsonlite::parse(line, &err);
  expect(!err, "event line is JSON");
  expect(carver::jsonlite::get_string(obj, "operation") == "carve", "event operation");
  expect(carver::jsonlite::get_bool(obj, "ok", false), "event ok");
  fs::remove_all(dir);
}

void test_audit_chain() {
  const auto dir = fresh_dir("audit");
  const std::string path = (dir / "audit.ndjson").string();
  carver::set_audit_log_path(path);

  auto engine = memory_engine(make_identity(0x34));
  expect(engine->carve(bytes(kScenarioA)).ok, "audited carve");
  expect(!engine->carve(bytes(kScenarioA)).ok, "audited failure");
  expect(!engine->carve("").ok, "audited empty input");

  expect(carver::global_audit_log().entry_count() == 3, "three entries appended");
  expect(carver::verify_audit_chain(path) == 3, "chain verifies");

  // Reopening resumes the chain.
  carver::set_audit_log_path(path);
  expect(engine->carve(scenario_b()).ok, "carve after reopen");
  expect(carver::verify_audit_chain(path) == 4, "resumed chain verifies");

  carver::set_audit_log_path("");

  // Remove the first line: the chain breaks.
  std::ifstream ifs(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(ifs, line)) lines.push_back(line);
  ifs.close();
  expect(lines.size() == 4, "four audit lines");
  expect(lines[1].find("\"failure_reason\":\"address_collision\"") != std::string::npos,
         "audit records the failure reason");
  const std::string version_stamp =
      "\"audit_log_version\":" + std::to_string(carver::version::AUDIT_LOG_VERSION);
  for (const auto& l : lines) expect(l.find(version_stamp) != std::string::npos, "entry carries the log version");

  // An entry from another log version fails verification.
  {
    std::string last = lines.back();
    last.replace(last.find(version_stamp), version_stamp.size(),
                 "\"audit_log_version\":" + std::to_string(carver::version::AUDIT_LOG_VERSION + 1));
    std::ofstream ofs(path, std::ios::trunc);
    for (size_t i = 0; i + 1 < lines.size(); ++i) ofs << lines[i] << "\n";
    ofs << last << "\n";
  }
  expect(carver::verify_audit_chain(path) == -1, "foreign log version detected");
  {
    std::ofstream ofs(path, std::ios::trunc);
    for (size_t i = 1; i < lines.size(); ++i) ofs << lines[i] << "\n";
  }
  expect(carver::verify_audit_chain(path) == -1, "truncated chain detected");
  fs::remove_all(dir);
}

void test_audit_reconfigure_during_carve() {
  const auto dir = fresh_dir("audit_reopen");
  const std::string path = (dir / "audit.ndjson").string();
  carver::set_audit_log_path(path);
  carver::ImmutableAuditLog* const log = &carver::global_audit_log();

  std::atomic<bool> done{false};
  std::thread reconfigure([&] {
    for (int n = 0; n < 200 && !done.load(); ++n) {
      carver::set_audit_log_path(path);
      std::this_thread::yield();
    }
  });

  auto engine = memory_engine(make_identity(0x35));
  constexpr int kCarves = 400;
  for (int i = 0; i < kCarves; ++i) {
    const std::string code = "\x01" + std::to_string(i);
    expect(engine->carve(code).ok, "carve while the audit log is reconfigured");
  }
  done.store(true);
  reconfigure.join();

  expect(&carver::global_audit_log() == log, "reconfiguring keeps the same log instance");
  expect(carver::verify_audit_chain(path) == kCarves, "every carve lands on one unbroken chain");

  carver::set_audit_log_path("");
  expect(!carver::global_audit_log().enabled(), "empty path disables the global log");
  fs::remove_all(dir);
}

void test_audit_disabled_is_noop() {
  carver::ImmutableAuditLog log("");
  carver::CarveRecord rec;
  expect(!log.enabled(), "empty path disables the log");
  expect(log.append(rec), "disabled append succeeds");
  expect(log.entry_count() == 0, "nothing written");
}

// ============================================================================
// JSON
// ============================================================================

std::string parse_string_field(const std::string& doc, bool* ok) {
  std::optional<carver::jsonlite::JsonError> err;
  const auto obj = carver::jsonlite::parse(doc, &err);
  *ok = !err;
  return err ? std::string() : carver::jsonlite::get_string(obj, "k");
}

void test_json_string_escapes() {
  bool ok = false;
  expect(parse_string_field("{\"k\":\"/tmp/\\u0041\"}", &ok) == "/tmp/A" && ok, "\\u0041 decodes to A");
  expect(parse_string_field("{\"k\":\"\\u00e9\"}", &ok) == "\xc3\xa9" && ok, "two-byte UTF-8");
  expect(parse_string_field("{\"k\":\"\\u20AC\"}", &ok) == "\xe2\x82\xac" && ok, "three-byte UTF-8");
  expect(parse_string_field("{\"k\":\"\\ud83d\\ude00\"}", &ok) == "\xf0\x9f\x98\x80" && ok,
         "surrogate pair joins to one code point");
  expect(parse_string_field("{\"k\":\"a\\/b\\\"c\\\\d\"}", &ok) == "a/b\"c\\d" && ok, "simple escapes");

  parse_string_field("{\"k\":\"\\u12\"}", &ok);
  expect(!ok, "short \\u escape rejected");
  parse_string_field("{\"k\":\"\\uzzzz\"}", &ok);
  expect(!ok, "non-hex \\u escape rejected");
  parse_string_field("{\"k\":\"\\ud83d\"}", &ok);
  expect(!ok, "unpaired high surrogate rejected");
  parse_string_field("{\"k\":\"\\ude00\"}", &ok);
  expect(!ok, "lone low surrogate rejected");
  parse_string_field("{\"k\":\"\\q\"}", &ok);
  expect(!ok, "unknown escape rejected");

  // Control characters survive escape() and parse().
  const std::string raw("a\x01\x1f" "b", 4);
  expect(parse_string_field("{\"k\":\"" + carver::jsonlite::escape(raw) + "\"}", &ok) == raw && ok,
         "escaped control characters parse back");

  // Config paths written with \u escapes resolve to the same path.
  carver::EngineConfig cfg;
  std::string err;
  expect(carver::parse_config("{\"ledger_root\":\"/tmp/\\u0041\"}", &cfg, &err), "config parses: " + err);
  expect(cfg.ledger_root == "/tmp/A", "escaped config path decoded");
}

// ============================================================================
// Configuration and version
// ============================================================================

void test_config_validation() {
  auto r = carver::validate_config(
      "{\"config_version\":\"1\",\"engine_identity\":\"0x" + std::string(40, '1') +
      "\",\"max_code_size\":1000}");
  expect(r.ok && r.errors.empty(), "valid config accepted");

  r = carver::validate_config("{\"engine_identity\":\"0x1234\"}");
  expect(!r.ok, "short identity rejected");

  r = carver::validate_config("{\"max_code_size\":0}");
  expect(!r.ok, "zero max_code_size rejected");

  r = carver::validate_config("{\"a\":1,\"a\":2}");
  expect(!r.ok && r.errors.front().find("json_duplicate_key") == 0, "duplicate keys rejected");

  r = carver::validate_config("{\"engine_identity\":\"0x" + std::string(40, '0') + "\",\"x\":1}");
  expect(r.ok && r.warnings.size() == 2, "zero identity and unknown key are warnings");

  r = carver::validate_config("{\"engine_identity\":\"0x" + std::string(40, '1') +
                              "\",\"anchor\":{}}");
  expect(!r.ok, "identity and anchor are exclusive");

  r = carver::validate_config("{\"compression\":\"lz4\"}");
  expect(!r.ok, "unknown compression rejected");
}

void test_config_max_code_size_ceiling() {
  const std::size_t limit = carver::kMaxSupportedCodeSize;
  auto r = carver::validate_config("{\"max_code_size\":" + std::to_string(limit) + "}");
  expect(r.ok, "max_code_size at the interpreter ceiling accepted");
  r = carver::validate_config("{\"max_code_size\":" + std::to_string(limit + 1) + "}");
  expect(!r.ok, "max_code_size past the interpreter ceiling rejected");

  carver::EngineConfig cfg;
  std::string err;
  expect(!carver::parse_config("{\"max_code_size\":" + std::to_string(limit + 1) + "}", &cfg, &err),
         "parse refuses an oversized max_code_size");
  expect(cfg.rules.max_code_size == 24576, "refused parse leaves config untouched");

  ::setenv("CARVER_MAX_CODE_SIZE", std::to_string(limit + 1).c_str(), 1);
  expect(!carver::apply_env_overrides(&cfg, &err), "oversized env max_code_size rejected");
  ::setenv("CARVER_MAX_CODE_SIZE", std::to_string(limit).c_str(), 1);
  expect(carver::apply_env_overrides(&cfg, &err) && cfg.rules.max_code_size == limit,
         "env max_code_size at the ceiling applied");
  ::unsetenv("CARVER_MAX_CODE_SIZE");

  // Code of the largest accepted size carves.
  carver::CarveEngine engine(cfg, carver::make_ledger(cfg));
  const std::string code(limit, '\x01');
  const auto placed = engine.carve(code);
  expect(placed.ok, "code at the ceiling carves");
  expect(engine.ledger().size_of(placed.address) == limit, "full size stored");

  // Rules set directly past the ceiling still refuse larger code.
  carver::EngineConfig loose;
  loose.rules.max_code_size = limit * 2;
  carver::CarveEngine loose_engine(loose, carver::make_ledger(loose));
  expect(!loose_engine.carve(std::string(limit + 1, '\x01')).ok, "code past the ceiling refused");
}

void test_config_parse() {
  carver::EngineConfig cfg;
  std::string err;
  const std::string id_hex = "0x" + std::string(40, 'a');
  expect(carver::parse_config("{\"engine_identity\":\"" + id_hex +
                                  "\",\"max_code_size\":64,\"enforce_forbidden_first_byte\":false,"
                                  "\"ledger_root\":\"/tmp/l\"}",
                              &cfg, &err),
         "config parses: " + err);
  expect(cfg.engine_identity.hex() == id_hex, "identity applied");
  expect(cfg.rules.max_code_size == 64, "max_code_size applied");
  expect(!cfg.rules.enforce_forbidden_first_byte, "enforce flag applied");
  expect(cfg.rules.forbidden_first_byte == 0xEF, "default forbidden byte kept");
  expect(cfg.ledger_root == "/tmp/l", "ledger root applied");

  // The resolved config serializes to a document that parses back to itself.
  carver::EngineConfig reparsed;
  expect(carver::parse_config(carver::config_to_json(cfg), &reparsed, &err), "config_to_json reparses: " + err);
  expect(reparsed.engine_identity == cfg.engine_identity, "identity survives serialization");
  expect(reparsed.rules.max_code_size == 64 && !reparsed.rules.enforce_forbidden_first_byte,
         "rules survive serialization");
  expect(reparsed.ledger_root == "/tmp/l", "ledger root survives serialization");

  carver::EngineConfig untouched;
  expect(!carver::parse_config("{\"max_code_size\":\"big\"}", &untouched, &err), "bad type rejected");
  expect(untouched.rules.max_code_size == 24576, "failed parse leaves config untouched");

  // Anchor derives the identity through the factory rule.
  carver::EngineConfig anchored;
  const std::string factory = "0x" + std::string(40, '4');
  expect(carver::parse_config("{\"anchor\":{\"factory\":\"" + factory + "\",\"init_code\":\"0x6080\"}}",
                              &anchored, &err),
         "anchor config parses: " + err);
  carver::Address f;
  expect(carver::Address::from_hex(factory, f), "factory parses");
  expect(anchored.engine_identity == carver::anchor_identity(f, carver::kZeroSalt, bytes("6080")),
         "anchor resolves to the factory-derived identity");

  // The parsed config drives the engine.
  carver::CarveEngine engine(cfg, carver::make_ledger(carver::EngineConfig{}));
  expect(!engine.carve(std::string(65, '\x01')).ok, "configured max_code_size enforced");
  expect(engine.config().ledger_root == "/tmp/l", "engine exposes its config");
}

void test_config_env_overrides() {
  carver::EngineConfig cfg;
  std::string err;
  ::setenv("CARVER_MAX_CODE_SIZE", "512", 1);
  ::setenv("CARVER_ENGINE_IDENTITY", ("0x" + std::string(40, 'b')).c_str(), 1);
  expect(carver::apply_env_overrides(&cfg, &err), "env overrides apply: " + err);
  expect(cfg.rules.max_code_size == 512, "env max_code_size");
  expect(cfg.engine_identity == make_identity(0xbb), "env identity");

  ::setenv("CARVER_MAX_CODE_SIZE", "12abc", 1);
  carver::EngineConfig before = cfg;
  expect(!carver::apply_env_overrides(&cfg, &err), "malformed env rejected");
  expect(cfg.rules.max_code_size == before.rules.max_code_size, "config untouched on error");
  ::unsetenv("CARVER_MAX_CODE_SIZE");
  ::unsetenv("CARVER_ENGINE_IDENTITY");
}

void test_make_ledger() {
  carver::EngineConfig cfg;
  expect(carver::make_ledger(cfg)->backend_id() == "memory", "empty root is in-memory");
  cfg.ledger_root = carver::kMemoryLedgerRoot;
  expect(carver::make_ledger(cfg)->backend_id() == "memory", "explicit memory root is in-memory");
  const auto dir = fresh_dir("factory");
  cfg.ledger_root = dir.string();
  expect(carver::make_ledger(cfg)->backend_id() == "local_fs", "root selects the file ledger");
  fs::remove_all(dir);
}

void test_version_manifest() {
  const auto m = carver::version::current_manifest("9.9.9");
  expect(m.engine_semver == "9.9.9", "semver passthrough");
  expect(m.hash_primitive == "blake3", "manifest names blake3");
  expect(m.bootstrap_prefix == "600b380380600b3d393df3", "manifest carries prefix");
  std::optional<carver::jsonlite::JsonError> err;
  const auto obj = carver::jsonlite::parse(carver::version::manifest_to_json(m), &err);
  expect(!err && carver::jsonlite::get_u64(obj, "derivation", 0) == carver::version::DERIVATION_VERSION,
         "manifest JSON");
  expect(carver::version::check_compatibility().ok, "current ABI compatible");
  const auto bad = carver::version::check_compatibility(carver::version::ENGINE_ABI_VERSION + 1);
  expect(!bad.ok && bad.error_code == "abi_version_mismatch", "ABI mismatch reported");
}

}  // namespace

int main() {
  std::cout << "carver tests\n";

  run_test("blake3_known_vectors", test_blake3_known_vectors);
  run_test("hex_helpers", test_hex_helpers);

  run_test("bootstrap_prefix_constant", test_bootstrap_prefix_constant);
  run_test("bootstrap_returns_suffix", test_bootstrap_returns_suffix);
  run_test("bootstrap_memory_ceiling", test_bootstrap_memory_ceiling);
  run_test("bootstrap_rejects_unsupported", test_bootstrap_rejects_unsupported);
  run_test("disassemble_prefix", test_disassemble_prefix);

  run_test("derivation_deterministic", test_derivation_deterministic);
  run_test("derivation_total", test_derivation_total);
  run_test("salt_and_deployer_bind", test_salt_and_deployer_bind);
  run_test("anchor_identity", test_anchor_identity);

  run_test("scenario_a", test_scenario_a);
  run_test("scenario_b", test_scenario_b);
  run_test("scenario_c", test_scenario_c);
  run_test("init_code_stored_as_data", test_init_code_stored_as_data);
  run_test("duplicate_carve_fails", test_duplicate_carve_fails);
  run_test("precondition_failures", test_precondition_failures);
  run_test("host_rules_enforced_by_ledger", test_host_rules_enforced_by_ledger);
  run_test("guard_rejection_leaves_ledger_unchanged", test_guard_rejection_leaves_ledger_unchanged);
  run_test("is_carved_negative", test_is_carved_negative);
  run_test("is_carved_empty_address", test_is_carved_empty_address);
  run_test("concurrent_carve_single_winner", test_concurrent_carve_single_winner);

  run_test("file_ledger_persistence", test_file_ledger_persistence);
  run_test("file_ledger_corruption_reads_empty", test_file_ledger_corruption_reads_empty);
  run_test("file_ledger_format_version", test_file_ledger_format_version);
  run_test("default_ledger_shared_across_engines", test_default_ledger_shared_across_engines);
  run_test("file_ledger_concurrent_instances", test_file_ledger_concurrent_instances);

  run_test("events_and_stats", test_events_and_stats);
  run_test("event_log_sink", test_event_log_sink);
  run_test("audit_chain", test_audit_chain);
  run_test("audit_reconfigure_during_carve", test_audit_reconfigure_during_carve);
  run_test("audit_disabled_is_noop", test_audit_disabled_is_noop);

  run_test("json_string_escapes", test_json_string_escapes);

  run_test("config_validation", test_config_validation);
  run_test("config_max_code_size_ceiling", test_config_max_code_size_ceiling);
  run_test("config_parse", test_config_parse);
  run_test("config_env_overrides", test_config_env_overrides);
  run_test("make_ledger", test_make_ledger);
  run_test("version_manifest", test_version_manifest);

  std::cout << "\n" << g_tests_passed << "/" << g_tests_run << " tests passed\n";
  return 0;
}
