#include "permagate/fs_util.hpp"

#include <cstdio>
#include <fstream>
#include <random>

#include "permagate/types.hpp"

namespace fs = std::filesystem;

namespace permagate {

fs::path temp_path_in(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return dir / (".tmp_" + std::to_string(dist(rng)));
}

ScopedTempFile::~ScopedTempFile() {
  if (path_.empty()) return;
  std::error_code ec;
  fs::remove(path_, ec);
}

void atomic_write(const fs::path& target, const std::string& data) {
  fs::create_directories(target.parent_path());
  const std::string tmp = temp_path_in(target.parent_path()).string();
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw GatewayError(ErrorCode::io_error, "cannot open " + tmp + " for writing");
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      ofs.close();
      std::remove(tmp.c_str());
      throw GatewayError(ErrorCode::io_error, "short write to " + tmp);
    }
  }
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    throw fs::filesystem_error("rename into place failed", tmp, target, ec);
  }
}

std::string read_file(const fs::path& path) {
  // file_size() rejects directories and missing paths with a filesystem_error.
  const auto size = fs::file_size(path);
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw GatewayError(ErrorCode::io_error, "cannot open " + path.string());
  }
  std::string out(static_cast<size_t>(size), '\0');
  ifs.read(out.data(), static_cast<std::streamsize>(size));
  if (ifs.gcount() != static_cast<std::streamsize>(size)) {
    throw GatewayError(ErrorCode::io_error, "short read from " + path.string());
  }
  return out;
}

uint64_t consume_stream(std::istream& in,
                        const std::function<void(const char*, size_t)>& sink) {
  char buf[64 * 1024];
  uint64_t total = 0;
  while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
    const auto n = static_cast<size_t>(in.gcount());
    sink(buf, n);
    total += n;
  }
  if (in.bad()) {
    throw GatewayError(ErrorCode::io_error, "stream read failed");
  }
  return total;
}

std::string read_stream(std::istream& in) {
  std::string out;
  consume_stream(in, [&out](const char* data, size_t n) { out.append(data, n); });
  return out;
}

}  // namespace permagate
