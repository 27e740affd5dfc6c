#pragma once

// permagate/fs_util.hpp — Filesystem primitives shared by the on-disk stores.
//
// INVARIANT: every file a store publishes goes through atomic_write(), so a
// reader sees either nothing or the complete bytes, and two writers racing on
// the same content-addressed key both leave the same file behind.

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <utility>

namespace permagate {

// Writes to a sibling temp file, then rename()s into place. Creates parent
// directories. Throws std::filesystem::filesystem_error or
// GatewayError(io_error) on failure; the temp file never survives a failure.
void atomic_write(const std::filesystem::path& target, const std::string& data);

// Reads a whole regular file. Throws on any error, including "not a file".
std::string read_file(const std::filesystem::path& path);

// Consumes a single-pass stream to EOF in fixed-size blocks, handing each
// block to `sink`. Returns the byte count. Streams that rethrow from their
// streambuf propagate that exception; other read faults throw io_error.
uint64_t consume_stream(std::istream& in,
                        const std::function<void(const char*, size_t)>& sink);

std::string read_stream(std::istream& in);

// A fresh ".tmp_<random>" name inside `dir`. Does not create the file.
std::filesystem::path temp_path_in(const std::filesystem::path& dir);

// Owns a temp file path and unlinks it on destruction unless release()d.
// A stream already opened on the file keeps reading it after the unlink.
class ScopedTempFile {
 public:
  explicit ScopedTempFile(std::filesystem::path path) : path_(std::move(path)) {}
  ~ScopedTempFile();
  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  const std::filesystem::path& path() const { return path_; }
  void release() { path_.clear(); }

 private:
  std::filesystem::path path_;
};

}  // namespace permagate
