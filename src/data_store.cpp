#include "permagate/data_store.hpp"

#include <ctime>
#include <fstream>
#include <stdexcept>
#include <streambuf>
#include <vector>

#include <zstd.h>

#include "permagate/fs_util.hpp"
#include "permagate/hash.hpp"
#include "permagate/jsonlite.hpp"
#include "permagate/types.hpp"

namespace fs = std::filesystem;

namespace permagate {

namespace {

constexpr int kZstdLevel = 3;
constexpr size_t kReadBlock = 64 * 1024;

struct ZstdCCtxFree {
  void operator()(ZSTD_CCtx* ctx) const { ZSTD_freeCCtx(ctx); }
};
struct ZstdDCtxFree {
  void operator()(ZSTD_DCtx* ctx) const { ZSTD_freeDCtx(ctx); }
};

// Local write failure inside put(); keeps it apart from errors raised by the
// input stream, which put() lets through.
class StoreWriteError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Reads a stored blob, decompressing zstd frames on the fly.
class StoredObjectBuf : public std::streambuf {
 public:
  StoredObjectBuf(const fs::path& path, bool zstd) : file_(path, std::ios::binary) {
    if (!file_) throw GatewayError(ErrorCode::io_error, "cannot open " + path.string());
    if (zstd) {
      dctx_.reset(ZSTD_createDCtx());
      if (!dctx_) throw GatewayError(ErrorCode::io_error, "ZSTD_createDCtx failed");
      in_.resize(ZSTD_DStreamInSize());
      out_.resize(ZSTD_DStreamOutSize());
    } else {
      out_.resize(kReadBlock);
    }
  }

 protected:
  int_type underflow() override {
    if (gptr() < egptr()) return traits_type::to_int_type(*gptr());
    const size_t n = dctx_ ? fill_decompressed() : read_block(out_.data(), out_.size());
    if (n == 0) return traits_type::eof();
    setg(out_.data(), out_.data(), out_.data() + n);
    return traits_type::to_int_type(*gptr());
  }

 private:
  size_t read_block(char* dst, size_t cap) {
    file_.read(dst, static_cast<std::streamsize>(cap));
    if (file_.bad()) throw GatewayError(ErrorCode::io_error, "stored object read failed");
    return static_cast<size_t>(file_.gcount());
  }

  size_t fill_decompressed() {
    while (true) {
      if (src_.pos == src_.size && !input_done_) {
        const size_t got = read_block(in_.data(), in_.size());
        if (got == 0) input_done_ = true;
        src_ = ZSTD_inBuffer{in_.data(), got, 0};
      }
      ZSTD_outBuffer dst{out_.data(), out_.size(), 0};
      const size_t before = src_.pos;
      const size_t rc = ZSTD_decompressStream(dctx_.get(), &dst, &src_);
      if (ZSTD_isError(rc)) {
        throw GatewayError(ErrorCode::io_error, std::string("zstd: ") + ZSTD_getErrorName(rc));
      }
      if (rc == 0) {
        in_frame_ = false;
      } else if (src_.pos > before) {
        in_frame_ = true;
      }
      if (dst.pos > 0) return dst.pos;
      if (input_done_ && src_.pos == src_.size) {
        if (in_frame_) throw GatewayError(ErrorCode::io_error, "truncated zstd frame");
        return 0;
      }
    }
  }

  std::ifstream file_;
  std::unique_ptr<ZSTD_DCtx, ZstdDCtxFree> dctx_;
  std::vector<char> in_;
  std::vector<char> out_;
  ZSTD_inBuffer src_{nullptr, 0, 0};
  bool input_done_{false};
  bool in_frame_{false};
};

class StoredObjectStream : public std::istream {
 public:
  StoredObjectStream(const fs::path& path, bool zstd) : std::istream(nullptr), buf_(path, zstd) {
    rdbuf(&buf_);
    exceptions(std::ios::badbit);
  }

 private:
  StoredObjectBuf buf_;
};

// 64-char lowercase hex.
bool valid_digest(const std::string& d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

// base64url alphabet only, so an id can never escape ids/.
bool valid_id(const std::string& id) {
  if (id.empty() || id.size() > 128) return false;
  for (char c : id) {
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) return false;
  }
  return true;
}

std::string meta_to_json(const StoredObjectInfo& info) {
  jsonlite::Object o;
  o["digest"] = info.digest;
  o["encoding"] = info.encoding;
  o["original_size"] = info.original_size;
  o["stored_size"] = info.stored_size;
  o["created_at"] = info.created_at_unix_ts;
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

}  // namespace

FsDataStore::FsDataStore(const Logger& log, std::string root)
    : log_(log.child("FsDataStore")), root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_ / "objects", ec);
  if (!ec) fs::create_directories(root_ / "ids", ec);
  if (ec) {
    log_.error("Failed to create data store directories",
               {{"root", root_.string()}, {"message", ec.message()}});
  }
}

fs::path FsDataStore::object_path(const std::string& digest) const {
  return root_ / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest;
}

fs::path FsDataStore::meta_path(const std::string& digest) const {
  fs::path p = object_path(digest);
  p += ".meta";
  return p;
}

fs::path FsDataStore::id_path(const std::string& id) const {
  return root_ / "ids" / id;
}

std::optional<std::string> FsDataStore::put(std::istream& in, const std::string& compression,
                                            std::optional<uint64_t> expected_size) {
  const fs::path tmp_dir = root_ / "tmp";
  std::error_code ec;
  fs::create_directories(tmp_dir, ec);
  if (ec) {
    log_.error("Failed to create temp directory",
               {{"path", tmp_dir.string()}, {"message", ec.message()}});
    return std::nullopt;
  }
  ScopedTempFile tmp(temp_path_in(tmp_dir));
  std::ofstream out(tmp.path(), std::ios::binary | std::ios::trunc);
  if (!out) {
    log_.error("Failed to open temp object", {{"path", tmp.path().string()}});
    return std::nullopt;
  }

  const bool zstd = compression == "zstd";
  std::unique_ptr<ZSTD_CCtx, ZstdCCtxFree> cctx;
  std::vector<char> zbuf;
  if (zstd) {
    cctx.reset(ZSTD_createCCtx());
    if (!cctx ||
        ZSTD_isError(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, kZstdLevel))) {
      log_.error("Failed to set up zstd compression", {{"path", tmp.path().string()}});
      return std::nullopt;
    }
    zbuf.resize(ZSTD_CStreamOutSize());
  }

  Blake3Hasher content("cas:");
  uint64_t original_size = 0;
  uint64_t stored_size = 0;
  auto write_out = [&](const char* data, size_t n) {
    out.write(data, static_cast<std::streamsize>(n));
    if (!out) throw StoreWriteError("short write to " + tmp.path().string());
    stored_size += n;
  };
  auto compress = [&](ZSTD_inBuffer& src, ZSTD_EndDirective mode) {
    size_t remaining = 0;
    do {
      ZSTD_outBuffer dst{zbuf.data(), zbuf.size(), 0};
      remaining = ZSTD_compressStream2(cctx.get(), &dst, &src, mode);
      if (ZSTD_isError(remaining)) {
        throw StoreWriteError(std::string("zstd: ") + ZSTD_getErrorName(remaining));
      }
      if (dst.pos > 0) write_out(zbuf.data(), dst.pos);
    } while (mode == ZSTD_e_end ? remaining != 0 : src.pos < src.size);
  };

  try {
    original_size = consume_stream(in, [&](const char* data, size_t n) {
      content.update(data, n);
      if (zstd) {
        ZSTD_inBuffer src{data, n, 0};
        compress(src, ZSTD_e_continue);
      } else {
        write_out(data, n);
      }
    });
    if (zstd) {
      ZSTD_inBuffer src{nullptr, 0, 0};
      compress(src, ZSTD_e_end);
    }
    out.close();
    if (!out) throw StoreWriteError("close failed on " + tmp.path().string());
  } catch (const StoreWriteError& e) {
    log_.error("Failed to write object", {{"message", e.what()}});
    return std::nullopt;
  }

  if (expected_size && original_size != *expected_size) {
    throw GatewayError(ErrorCode::upstream_unavailable,
                       "stream ended after " + std::to_string(original_size) + " of " +
                           std::to_string(*expected_size) + " bytes");
  }

  const std::string digest = content.finalize_hex();
  if (auto existing = info(digest); existing && contains(digest)) {
    if (verify(*existing)) return digest;
    log_.warn("Replacing stored object that failed verification", {{"digest", digest}});
  }

  StoredObjectInfo meta;
  meta.digest = digest;
  meta.encoding = zstd ? "zstd" : "identity";
  meta.original_size = original_size;
  meta.stored_size = stored_size;
  meta.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));

  fs::create_directories(object_path(digest).parent_path(), ec);
  if (!ec) fs::rename(tmp.path(), object_path(digest), ec);
  if (ec) {
    log_.error("Failed to move object into place", {{"digest", digest}, {"message", ec.message()}});
    return std::nullopt;
  }
  tmp.release();
  try {
    atomic_write(meta_path(digest), meta_to_json(meta));
  } catch (const std::exception& e) {
    fs::remove(object_path(digest), ec);
    log_.error("Failed to write object metadata", {{"digest", digest}, {"message", e.what()}});
    return std::nullopt;
  }
  return digest;
}

std::optional<StoredObjectInfo> FsDataStore::info(const std::string& digest) const {
  if (!valid_digest(digest)) return std::nullopt;
  std::error_code ec;
  if (!fs::is_regular_file(meta_path(digest), ec)) return std::nullopt;

  std::string text;
  try {
    text = read_file(meta_path(digest));
  } catch (const std::exception& e) {
    log_.error("Failed to read object metadata", {{"digest", digest}, {"message", e.what()}});
    return std::nullopt;
  }

  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(text, &err);
  if (err) {
    log_.warn("Unreadable object metadata", {{"digest", digest}, {"message", err->message}});
    return std::nullopt;
  }
  StoredObjectInfo info;
  info.digest = jsonlite::get_string(obj, "digest");
  info.encoding = jsonlite::get_string(obj, "encoding", "identity");
  info.original_size = jsonlite::get_u64(obj, "original_size");
  info.stored_size = jsonlite::get_u64(obj, "stored_size");
  info.created_at_unix_ts = jsonlite::get_u64(obj, "created_at");
  if (info.digest != digest) return std::nullopt;
  return info;
}

bool FsDataStore::verify(const StoredObjectInfo& meta) const {
  try {
    StoredObjectStream stream(object_path(meta.digest), meta.encoding == "zstd");
    Blake3Hasher hasher("cas:");
    const uint64_t n = consume_stream(
        stream, [&hasher](const char* data, size_t len) { hasher.update(data, len); });
    if (n != meta.original_size || hasher.finalize_hex() != meta.digest) {
      log_.error("Stored object failed verification", {{"digest", meta.digest}});
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    log_.error("Failed to read object", {{"digest", meta.digest}, {"message", e.what()}});
    return false;
  }
}

std::optional<StoredObject> FsDataStore::open(const std::string& digest) const {
  if (!contains(digest)) return std::nullopt;
  auto meta = info(digest);
  if (!meta || !verify(*meta)) return std::nullopt;

  try {
    StoredObject object;
    object.stream =
        std::make_unique<StoredObjectStream>(object_path(digest), meta->encoding == "zstd");
    object.info = std::move(*meta);
    return object;
  } catch (const std::exception& e) {
    log_.error("Failed to open object", {{"digest", digest}, {"message", e.what()}});
    return std::nullopt;
  }
}

bool FsDataStore::contains(const std::string& digest) const {
  if (!valid_digest(digest)) return false;
  std::error_code ec;
  return fs::is_regular_file(object_path(digest), ec);
}

bool FsDataStore::link_id(const std::string& id, const std::string& digest) {
  if (!valid_id(id) || !valid_digest(digest)) return false;
  try {
    atomic_write(id_path(id), digest);
    return true;
  } catch (const std::exception& e) {
    log_.error("Failed to link content id", {{"id", id}, {"message", e.what()}});
    return false;
  }
}

std::optional<std::string> FsDataStore::resolve_id(const std::string& id) const {
  if (!valid_id(id)) return std::nullopt;
  const fs::path p = id_path(id);
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) return std::nullopt;
  try {
    std::string digest = read_file(p);
    if (!valid_digest(digest)) return std::nullopt;
    return digest;
  } catch (const std::exception& e) {
    log_.error("Failed to read content id link", {{"id", id}, {"message", e.what()}});
    return std::nullopt;
  }
}

std::optional<StoredObject> FsDataStore::open_by_id(const std::string& id) const {
  auto digest = resolve_id(id);
  if (!digest) return std::nullopt;
  return open(*digest);
}

}  // namespace permagate
