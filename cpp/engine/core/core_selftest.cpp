/*
  Core selftest

  Covers:
    1) A read that blocks past read_timeout_ms fails with IoError
       (kTimeout) and returns close to the bound.
    2) Missing files and oversized files fail with IoError naming the path.
    3) Streamed file hashes match the in-memory FNV-1a of the same bytes.
    4) Settings YAML: overrides apply, unknown keys and bad values are
       ValidationErrors.

  Framework-free; non-zero exit on failure. Writes into a scratch directory
  under the system temp path.
*/

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#ifndef _WIN32
#include <sys/stat.h>
#include <sys/types.h>
#endif

#include "engine/core/errors.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings_yaml.hpp"

namespace rascheck {
namespace {

namespace fs = std::filesystem;

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

class Scratch {
 public:
  Scratch() {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    dir_ = fs::temp_directory_path() / ("rascheck_core_selftest_" + std::to_string(stamp));
    fs::create_directories(dir_);
  }
  ~Scratch() {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string path(const std::string& name) const { return (dir_ / name).string(); }

 private:
  fs::path dir_;
};

void test_read_timeout(const Scratch& dir) {
#ifndef _WIN32
  const std::string fifo = dir.path("blocked.g01");
  if (::mkfifo(fifo.c_str(), 0600) != 0) {
    fail("timeout: cannot create fifo");
    return;
  }

  IoSettings io;
  io.read_timeout_ms = 200;

  bool timed_out = false;
  const auto start = std::chrono::steady_clock::now();
  try {
    // No writer: opening the fifo blocks the reader.
    (void)read_file_bounded(fifo, io);
  } catch (const IoError& e) {
    timed_out = e.code() == ErrorCode::kTimeout;
    expect_true(std::string(e.what()).find("blocked.g01") != std::string::npos, "timeout: message names the path");
  }
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

  expect_true(timed_out, "timeout: blocked read raises IoError(kTimeout)");
  expect_true(elapsed >= 150 && elapsed < 5000, "timeout: returns close to read_timeout_ms");

  // Let the abandoned reader finish.
  std::ofstream unblock(fifo, std::ios::out | std::ios::binary);
  unblock.close();
#else
  (void)dir;
  pass("timeout: fifo test skipped on this platform");
#endif
}

void test_read_errors(const Scratch& dir) {
  IoSettings io;

  bool missing = false;
  try {
    (void)read_file_bounded(dir.path("missing.g01"), io);
  } catch (const IoError& e) {
    missing = e.code() == ErrorCode::kIoError &&
              std::string(e.what()).find("missing.g01") != std::string::npos;
  }
  expect_true(missing, "missing file: IoError naming the path");

  const std::string big = dir.path("big.g01");
  write_text_file(big, std::string(64, 'x'));
  io.max_text_bytes = 16;
  bool oversized = false;
  try {
    (void)read_file_bounded(big, io);
  } catch (const IoError& e) {
    oversized = std::string(e.what()).find("max_text_bytes") != std::string::npos;
  }
  expect_true(oversized, "oversized file: IoError");

  const std::string prefix = read_file_prefix(big, 8, io);
  expect_true(prefix == std::string(8, 'x'), "prefix read ignores max_text_bytes");
}

void test_file_hash(const Scratch& dir) {
  const std::string p = dir.path("hashed.g01");
  std::string content;
  for (int i = 0; i < 20000; ++i) content += "line " + std::to_string(i) + "\n";
  write_text_file(p, content);

  Fnv1a64 h;
  h.update_bytes(content.data(), content.size());
  IoSettings io;
  expect_true(hash_file_bounded(p, io) == h.digest(), "streamed hash equals in-memory hash");
}

void test_settings_yaml() {
  const Settings s = parse_settings_yaml(
      "io:\n"
      "  read_timeout_ms: 500\n"
      "merge:\n"
      "  precedence: design_overrides_result\n"
      "eval:\n"
      "  max_workers: 4\n"
      "log:\n"
      "  level: warn\n");
  expect_true(s.io.read_timeout_ms == 500, "settings: io override");
  expect_true(s.merge.precedence == MergePrecedence::kDesignOverridesResult, "settings: precedence override");
  expect_true(s.eval.max_workers == 4, "settings: eval override");
  expect_true(s.log_level == LogLevel::WARN, "settings: log level");
  expect_true(s.parse.parallel, "settings: untouched keys keep defaults");

  const auto rejects = [](const std::string& text) {
    try {
      (void)parse_settings_yaml(text);
    } catch (const ValidationError&) {
      return true;
    }
    return false;
  };
  expect_true(rejects("io:\n  read_timeot_ms: 5\n"), "settings: unknown key rejected");
  expect_true(rejects("io:\n  read_timeout_ms: -1\n"), "settings: negative timeout rejected");
  expect_true(rejects("log:\n  level: loud\n"), "settings: unknown log level rejected");
  expect_true(rejects("io: [1, 2\n"), "settings: invalid YAML rejected");
}

} // namespace
} // namespace rascheck

int main() {
  using namespace rascheck;
  try {
    set_log_level(LogLevel::ERROR);
    const Scratch dir;
    test_read_timeout(dir);
    test_read_errors(dir);
    test_file_hash(dir);
    test_settings_yaml();
  } catch (const std::exception& e) {
    std::cerr << "Unhandled exception: " << e.what() << "\n";
    return 1;
  }

  if (g_fail_count != 0) {
    std::cerr << "Selftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "All selftests passed.\n";
  return 0;
}
