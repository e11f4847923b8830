#include "engine/core/file_io.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <sstream>
#include <system_error>
#include <thread>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"

namespace rascheck {
namespace {

// limit == 0 means "whole file".
std::string read_now(const std::string& path, std::size_t limit, std::uint64_t max_bytes) {
  std::error_code ec;
  const bool regular = std::filesystem::is_regular_file(path, ec);
  if (!regular && !std::filesystem::is_fifo(path, ec)) {
    throw IoError("file not found or not a regular file: " + path);
  }
  // Pipes have no size up front; they are checked after the read.
  if (regular && limit == 0 && max_bytes > 0) {
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) throw IoError("cannot stat file: " + path + " (" + ec.message() + ")");
    if (size > max_bytes) {
      throw IoError("file exceeds max_text_bytes (" + std::to_string(size) + " > " +
                    std::to_string(max_bytes) + "): " + path);
    }
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) throw IoError("cannot open file: " + path);

  std::string out;
  if (limit == 0) {
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw IoError("read failure: " + path);
    out = ss.str();
    if (max_bytes > 0 && out.size() > max_bytes) {
      throw IoError("file exceeds max_text_bytes (" + std::to_string(out.size()) + " > " +
                    std::to_string(max_bytes) + "): " + path);
    }
  } else {
    out.resize(limit);
    in.read(out.data(), static_cast<std::streamsize>(limit));
    if (in.bad()) throw IoError("read failure: " + path);
    out.resize(static_cast<std::size_t>(in.gcount()));
  }
  return out;
}

Hash64 hash_now(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw IoError("file not found or not a regular file: " + path);
  }
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) throw IoError("cannot open file: " + path);

  Fnv1a64 h;
  std::vector<char> buf(64 * 1024);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    if (in.bad()) throw IoError("read failure: " + path);
    h.update_bytes(buf.data(), static_cast<std::size_t>(in.gcount()));
  }
  return h.digest();
}

// Runs fn() on a detached worker and waits at most read_timeout_ms.
template <class T, class Fn>
T run_with_timeout(const std::string& path, const IoSettings& io, Fn fn) {
  auto done = std::make_shared<std::promise<T>>();
  std::future<T> fut = done->get_future();

  std::thread worker([done, fn]() {
    try {
      done->set_value(fn());
    } catch (...) {
      done->set_exception(std::current_exception());
    }
  });
  worker.detach();

  if (fut.wait_for(std::chrono::milliseconds(io.read_timeout_ms)) != std::future_status::ready) {
    throw IoError("read timed out after " + std::to_string(io.read_timeout_ms) + " ms: " + path,
                  ErrorCode::kTimeout);
  }
  return fut.get();
}

std::string read_with_timeout(const std::string& path,
                              std::size_t limit,
                              const IoSettings& io) {
  return run_with_timeout<std::string>(
      path, io, [path, limit, max_bytes = io.max_text_bytes]() { return read_now(path, limit, max_bytes); });
}

} // namespace

std::string read_file_bounded(const std::string& path, const IoSettings& io) {
  io.validate_or_throw();
  return read_with_timeout(path, 0, io);
}

std::string read_file_prefix(const std::string& path, std::size_t n, const IoSettings& io) {
  io.validate_or_throw();
  if (n == 0) return {};
  return read_with_timeout(path, n, io);
}

Hash64 hash_file_bounded(const std::string& path, const IoSettings& io) {
  io.validate_or_throw();
  return run_with_timeout<Hash64>(path, io, [path]() { return hash_now(path); });
}

void write_text_file(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) throw IoError("cannot open for writing: " + path);
  out << content;
  out.flush();
  if (!out) throw IoError("write failure: " + path);
}

bool file_exists(const std::string& path) noexcept {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

} // namespace rascheck
