#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <optional>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "permagate/ans104.hpp"
#include "permagate/ans104_unbundler.hpp"
#include "permagate/arweave_client.hpp"
#include "permagate/bundle_data_importer.hpp"
#include "permagate/config.hpp"
#include "permagate/data_source.hpp"
#include "permagate/data_store.hpp"
#include "permagate/encoding.hpp"
#include "permagate/filters.hpp"
#include "permagate/fs_chunk_cache.hpp"
#include "permagate/fs_util.hpp"
#include "permagate/hash.hpp"
#include "permagate/jsonlite.hpp"
#include "permagate/log.hpp"
#include "permagate/observability.hpp"
#include "permagate/version.hpp"
#include "permagate/worker_pool.hpp"

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

// Runs fn and returns the GatewayError code it threw, or none.
template <typename Fn>
permagate::ErrorCode error_code_of(Fn fn) {
  try {
    fn();
  } catch (const permagate::GatewayError& e) {
    return e.code();
  }
  return permagate::ErrorCode::none;
}

std::string to_hex(const std::string& bytes) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  for (unsigned char c : bytes) {
    out += kHex[c >> 4];
    out += kHex[c & 0x0f];
  }
  return out;
}

struct TempDir {
  fs::path path;
  explicit TempDir(const std::string& name)
      : path(fs::temp_directory_path() / ("permagate_test_" + name)) {
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

bool wait_until(const std::function<bool()>& pred) {
  for (int i = 0; i < 5000; ++i) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

const permagate::Logger kLog("test");

// ---------------------------------------------------------------------------
// Bundle construction (ED25519 layout: 64-byte signature, 32-byte owner)
// ---------------------------------------------------------------------------

struct TestItem {
  std::string id_raw;
  std::string bytes;
};

TestItem make_item(char seed, const permagate::Tags& tags, const std::string& data,
                   bool with_target = false) {
  const std::string signature(64, seed);
  const std::string owner(32, static_cast<char>(seed + 1));
  std::string bytes = permagate::write_le(2, 2);
  bytes += signature;
  bytes += owner;
  if (with_target) {
    bytes += '\x01';
    bytes += std::string(32, 't');
  } else {
    bytes += '\x00';
  }
  bytes += '\x00';  // no anchor
  const std::string tag_bytes = permagate::ans104::encode_tags(tags);
  bytes += permagate::write_le(tags.size(), 8);
  bytes += permagate::write_le(tag_bytes.size(), 8);
  bytes += tag_bytes;
  bytes += data;
  return {permagate::sha256_bytes(signature), bytes};
}

std::string make_bundle(const std::vector<TestItem>& items) {
  std::string out = permagate::write_le(items.size(), 32);
  for (const auto& it : items) {
    out += permagate::write_le(it.bytes.size(), 32);
    out += it.id_raw;
  }
  for (const auto& it : items) out += it.bytes;
  return out;
}

// Three items; 0 and 2 carry Keep=yes, 1 carries Keep=no.
std::vector<TestItem> three_items() {
  return {make_item('a', {{"Keep", "yes"}, {"Content-Type", "text/plain"}}, "first"),
          make_item('b', {{"Keep", "no"}}, "second"),
          make_item('c', {{"Keep", "yes"}}, "third", true)};
}

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

class FakeDataSource : public permagate::IContiguousDataSource {
 public:
  std::map<std::string, std::string> objects;
  std::optional<permagate::GatewayError> error;
  std::optional<uint64_t> declared_size;  // overrides the real size when set

  permagate::DataSourceResult get_data(const std::string& id) override {
    {
      std::lock_guard<std::mutex> lk(mu_);
      requested_.push_back(id);
    }
    if (error) throw *error;
    auto it = objects.find(id);
    if (it == objects.end()) {
      throw permagate::GatewayError(permagate::ErrorCode::not_found, "no object " + id);
    }
    permagate::DataSourceResult r;
    r.size = declared_size ? *declared_size : it->second.size();
    r.stream = std::make_unique<std::istringstream>(it->second);
    return r;
  }

  std::vector<std::string> requested() const {
    std::lock_guard<std::mutex> lk(mu_);
    return requested_;
  }

 private:
  mutable std::mutex mu_;
  std::vector<std::string> requested_;
};

class RecordingUnbundler : public permagate::IUnbundler {
 public:
  void queue_item(const permagate::BundleItem& item, bool prioritized) override {
    std::lock_guard<std::mutex> lk(mu_);
    calls_.emplace_back(item, prioritized);
  }

  std::vector<std::pair<permagate::BundleItem, bool>> calls() const {
    std::lock_guard<std::mutex> lk(mu_);
    return calls_;
  }

 private:
  mutable std::mutex mu_;
  std::vector<std::pair<permagate::BundleItem, bool>> calls_;
};

class RecordingSink : public permagate::IDataItemSink {
 public:
  void on_item(const permagate::DataItem& item) override {
    std::lock_guard<std::mutex> lk(mu_);
    items_.push_back(item);
  }

  std::vector<permagate::DataItem> items() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_;
  }

 private:
  mutable std::mutex mu_;
  std::vector<permagate::DataItem> items_;
};

// Upstream chunk source serving fixed bytes for every offset.
class CountingChunkSource : public permagate::IChunkSource, public permagate::IChunkDataSource {
 public:
  std::string chunk_bytes{"chunk-bytes"};
  std::string data_path{"proof-bytes"};
  std::optional<permagate::GatewayError> error;
  std::atomic<int> calls{0};
  std::atomic<uint64_t> last_absolute_offset{0};

  permagate::Chunk get_chunk_by_absolute_or_relative_offset(uint64_t absolute_offset,
                                                            const std::string&,
                                                            uint64_t) override {
    calls++;
    last_absolute_offset = absolute_offset;
    if (error) throw *error;
    return permagate::Chunk{chunk_bytes, data_path, ""};
  }

  std::unique_ptr<std::istream> get_chunk_data_by_absolute_or_relative_offset(
      uint64_t absolute_offset, const std::string& data_root, uint64_t relative_offset) override {
    auto c = get_chunk_by_absolute_or_relative_offset(absolute_offset, data_root, relative_offset);
    return std::make_unique<std::istringstream>(c.chunk);
  }
};

// Serves `data` in fixed-size slices keyed by relative offset.
class SlicingChunkSource : public permagate::IChunkDataSource {
 public:
  SlicingChunkSource(std::string data, size_t chunk_size)
      : data_(std::move(data)), chunk_size_(chunk_size) {}

  std::optional<uint64_t> fail_at;
  std::vector<uint64_t> absolute_offsets;

  std::unique_ptr<std::istream> get_chunk_data_by_absolute_or_relative_offset(
      uint64_t absolute_offset, const std::string&, uint64_t relative_offset) override {
    absolute_offsets.push_back(absolute_offset);
    if (fail_at && *fail_at == relative_offset) {
      throw permagate::GatewayError(permagate::ErrorCode::http_error, "chunk fetch failed");
    }
    return std::make_unique<std::istringstream>(
        data_.substr(static_cast<size_t>(relative_offset), chunk_size_));
  }

 private:
  std::string data_;
  size_t chunk_size_;
};

class MemoryChunkCache : public permagate::IChunkDataCache {
 public:
  std::map<uint64_t, std::string> chunks;
  int sets{0};

  bool has_chunk_data(const std::string&, uint64_t relative_offset) override {
    return chunks.count(relative_offset) > 0;
  }
  std::optional<std::string> get_chunk_data(const std::string&, uint64_t relative_offset) override {
    auto it = chunks.find(relative_offset);
    if (it == chunks.end()) return std::nullopt;
    return it->second;
  }
  void set_chunk_data(const std::string& data, const std::string&,
                      uint64_t relative_offset) override {
    chunks[relative_offset] = data;
    ++sets;
  }
};

class FixedTxInfo : public permagate::ITxInfoSource {
 public:
  permagate::TxChunkInfo info;
  permagate::TxChunkInfo get_tx_chunk_info(const std::string&) override { return info; }
};

class FakeHttpClient : public permagate::IHttpClient {
 public:
  std::map<std::string, permagate::HttpResponse> responses;
  std::vector<std::string> urls;

  long get_to(const std::string& url, std::ostream& body) override {
    urls.push_back(url);
    auto it = responses.find(url);
    if (it == responses.end()) return 404;
    body << it->second.body;
    return it->second.status;
  }
};

const std::string kDataRoot(32, 'r');

// ============================================================================
// Phase 1: Encoding and hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(permagate::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(permagate::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(permagate::cas_content_hash("x") != permagate::blake3_hex("x"),
         "cas: domain separates store keys from plain BLAKE3");

  permagate::Blake3Hasher plain;
  plain.update("hel", 3);
  plain.update("lo", 2);
  expect(plain.finalize_hex() == permagate::blake3_hex("hello"), "incremental BLAKE3 matches");
  permagate::Blake3Hasher cas("cas:");
  cas.update("x", 1);
  expect(cas.finalize_hex() == permagate::cas_content_hash("x"),
         "domain-prefixed hasher matches cas_content_hash");
}

void test_sha256_vectors() {
  expect(to_hex(permagate::sha256_bytes("abc")) ==
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA-256 abc vector");

  permagate::Sha256Hasher h;
  h.update("a", 1);
  h.update("bc", 2);
  expect(h.finalize() == permagate::sha256_bytes("abc"), "incremental SHA-256 matches one-shot");
  expect(permagate::sha256_b64url("abc").size() == 43, "b64url SHA-256 is 43 chars");
}

void test_b64url() {
  expect(permagate::to_b64url("\xfb\xff") == "-_8", "b64url uses - and _ without padding");
  auto decoded = permagate::from_b64url("-_8");
  expect(decoded && *decoded == "\xfb\xff", "b64url decodes");
  auto standard = permagate::from_b64url("+/8=");
  expect(standard && *standard == "\xfb\xff", "standard alphabet with padding accepted");
  expect(!permagate::from_b64url("ab$d").has_value(), "invalid character rejected");
  expect(permagate::to_b64url(kDataRoot).size() == 43, "32 bytes encode to 43 chars");
}

void test_little_endian_fields() {
  expect(permagate::write_le(0x0102, 4) == std::string("\x02\x01\x00\x00", 4), "write_le layout");
  auto v = permagate::read_le(permagate::write_le(123456789, 32));
  expect(v && *v == 123456789, "read_le of 32-byte field");

  std::string huge(32, '\0');
  huge[20] = 1;
  expect(!permagate::read_le(huge).has_value(), "value beyond 64 bits rejected");
}

void test_chunk_metadata_msgpack() {
  permagate::ChunkMetadata m;
  m.data_root = kDataRoot;
  m.data_size = 262144;
  m.offset = 524288;
  m.data_path = std::string(300, 'p');

  const std::string packed = permagate::chunk_metadata_to_msgpack(m);
  expect(packed.find("data_root") != std::string::npos, "field names kept in encoding");
  auto back = permagate::chunk_metadata_from_msgpack(packed);
  expect(back && *back == m, "metadata decodes to the same record");

  expect(!permagate::chunk_metadata_from_msgpack(packed.substr(0, packed.size() / 2)),
         "truncated metadata rejected");
  expect(!permagate::chunk_metadata_from_msgpack("xyz"), "non-map metadata rejected");

  // Files written by earlier releases: fixstr keys, bin8 bytes, smallest uint.
  const std::string root32(32, 'R');
  std::string legacy = "\x84\xa9" "data_root\xc4\x20";
  legacy += root32;
  legacy += "\xa9" "data_size\x2a";
  legacy += "\xa6" "offset";
  legacy += std::string("\xcd\x01\x00", 3);
  legacy += "\xa9" "data_path\xc4\x03" "abc";
  auto old = permagate::chunk_metadata_from_msgpack(legacy);
  expect(old && old->data_root == root32 && old->data_size == 42 && old->offset == 256 &&
             old->data_path == "abc",
         "existing metadata files still decode");
  permagate::ChunkMetadata same;
  same.data_root = root32;
  same.data_size = 42;
  same.offset = 256;
  same.data_path = "abc";
  expect(permagate::chunk_metadata_to_msgpack(same) == legacy, "byte layout unchanged on write");

  const std::string extra = std::string("\x85") + legacy.substr(1) + "\xa5" "extra\x01";
  auto skipped = permagate::chunk_metadata_from_msgpack(extra);
  expect(skipped && *skipped == same, "unknown fields skipped");

  std::string wrong_type = legacy;
  wrong_type[wrong_type.find("data_size") + 9] = '\xc0';  // nil instead of uint
  expect(!permagate::chunk_metadata_from_msgpack(wrong_type), "wrong field type rejected");
}

// ============================================================================
// Phase 2: JSON and configuration
// ============================================================================

void test_json_parse() {
  std::optional<permagate::jsonlite::JsonError> err;
  auto obj = permagate::jsonlite::parse(
      R"({"size":"10","offset":12345678901,"list":["a","b"],"nested":{"ok":true}})", &err);
  expect(!err, "valid JSON parses");
  expect(permagate::jsonlite::get_string(obj, "size") == "10", "string field");
  expect(permagate::jsonlite::get_u64(obj, "offset") == 12345678901ULL, "u64 field");
  expect(permagate::jsonlite::get_string_array(obj, "list").size() == 2, "array field");

  permagate::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");

  auto v = permagate::jsonlite::parse_value(R"({"x":1} trailing)", &err);
  expect(!v && err, "trailing data rejected");
}

void clear_config_env() {
  for (const char* name :
       {"PERMAGATE_TRUSTED_NODE_URL", "PERMAGATE_TRUSTED_GATEWAY_URLS",
        "PERMAGATE_CHUNK_CACHE_DIR", "PERMAGATE_CONTIGUOUS_DATA_DIR",
        "PERMAGATE_CONTIGUOUS_DATA_COMPRESSION", "PERMAGATE_ANS104_DOWNLOAD_WORKERS",
        "PERMAGATE_ANS104_DOWNLOAD_QUEUE_SIZE", "PERMAGATE_ANS104_UNBUNDLE_WORKERS",
        "PERMAGATE_ANS104_UNBUNDLE_QUEUE_SIZE", "PERMAGATE_ANS104_INDEX_FILTER",
        "PERMAGATE_HTTP_TIMEOUT_MS", "PERMAGATE_LOG_LEVEL", "PERMAGATE_EVENT_LOG"}) {
    unsetenv(name);
  }
}

void test_config_layers() {
  clear_config_env();
  TempDir tmp("config");
  const fs::path file = tmp.path / "gateway.json";
  {
    std::ofstream ofs(file);
    ofs << R"({"trusted_node_url":"http://node.local","ans104_unbundle_workers":4,)"
        << R"("ans104_index_filter":{"never":true},"contiguous_data_compression":"zstd"})";
  }

  const auto defaults = permagate::load_config();
  expect(defaults.ans104_download_workers == 1, "default download workers");
  expect(defaults.contiguous_data_compression == "off", "default compression");

  auto c = permagate::load_config(file.string());
  expect(c.trusted_node_url == "http://node.local", "file sets node url");
  expect(c.ans104_unbundle_workers == 4, "file sets unbundle workers");
  expect(c.ans104_index_filter == R"({"never":true})", "inline filter object kept as JSON");
  expect(c.contiguous_data_compression == "zstd", "file sets compression");

  setenv("PERMAGATE_ANS104_UNBUNDLE_WORKERS", "7", 1);
  setenv("PERMAGATE_TRUSTED_GATEWAY_URLS", "https://a.example/, https://b.example", 1);
  c = permagate::load_config(file.string());
  expect(c.ans104_unbundle_workers == 7, "env overrides file");
  expect(c.trusted_gateway_urls.size() == 2 && c.trusted_gateway_urls[0] == "https://a.example" &&
             c.trusted_gateway_urls[1] == "https://b.example",
         "gateway list split and trimmed");

  setenv("PERMAGATE_ANS104_INDEX_FILTER", "", 1);
  c = permagate::load_config();
  expect(c.ans104_index_filter.empty(), "empty filter env is honoured");

  clear_config_env();
  expect(permagate::load_config().to_json().find("\"ans104_download_queue_size\":100") !=
             std::string::npos,
         "config serializes");
}

void test_config_invalid_values() {
  clear_config_env();
  setenv("PERMAGATE_ANS104_DOWNLOAD_WORKERS", "many", 1);
  expect(error_code_of([] { permagate::load_config(); }) == permagate::ErrorCode::config_invalid,
         "non-numeric worker count rejected");
  clear_config_env();

  setenv("PERMAGATE_CONTIGUOUS_DATA_COMPRESSION", "gzip", 1);
  expect(error_code_of([] { permagate::load_config(); }) == permagate::ErrorCode::config_invalid,
         "unknown compression rejected");
  clear_config_env();

  setenv("PERMAGATE_ANS104_INDEX_FILTER", "{\"tags\":", 1);
  expect(error_code_of([] { permagate::load_config(); }) == permagate::ErrorCode::filter_invalid,
         "unparsable filter rejected");
  clear_config_env();

  expect(error_code_of([] { permagate::load_config(std::string("/nonexistent/gw.json")); }) ==
             permagate::ErrorCode::config_invalid,
         "missing config file rejected");

  TempDir tmp("config_invalid");
  const auto load_file = [&](const std::string& name, const std::string& text) {
    const fs::path file = tmp.path / name;
    {
      std::ofstream ofs(file);
      ofs << text;
    }
    return error_code_of([&] { permagate::load_config(file.string()); });
  };
  expect(load_file("negative.json", R"({"ans104_download_workers": -3})") ==
             permagate::ErrorCode::config_invalid,
         "negative worker count in file rejected");
  expect(load_file("string.json", R"({"http_timeout_ms": "abc"})") ==
             permagate::ErrorCode::config_invalid,
         "string timeout in file rejected");
  expect(load_file("fraction.json", R"({"ans104_unbundle_queue_size": 2.5})") ==
             permagate::ErrorCode::config_invalid,
         "fractional queue size in file rejected");
  expect(load_file("dir.json", R"({"chunk_cache_dir": 7})") ==
             permagate::ErrorCode::config_invalid,
         "non-string directory in file rejected");
  expect(load_file("urls.json", R"({"trusted_gateway_urls": ["https://a.example", 3]})") ==
             permagate::ErrorCode::config_invalid,
         "non-string gateway url in file rejected");
  expect(load_file("ok.json", R"({"ans104_download_workers": 3})") == permagate::ErrorCode::none,
         "well-typed file accepted");
}

// ============================================================================
// Phase 3: Bounded worker queue
// ============================================================================

void test_queue_fifo_order() {
  std::mutex mu;
  std::vector<int> seen;
  permagate::BoundedWorkQueue<int> q(
      permagate::WorkQueueOptions{"fifo", 1, 10, nullptr},
      [&](const permagate::QueueEntry<int>& e) {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(e.payload);
      },
      kLog);
  for (int i = 1; i <= 5; ++i) expect(q.push(i, i == 3), "admitted below capacity");
  q.drain();
  expect(seen == std::vector<int>({1, 2, 3, 4, 5}), "single worker drains in FIFO order");
  expect(q.counters().completed.load() == 5, "completed counter");
}

void test_queue_priority_bypass() {
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();
  std::mutex mu;
  std::vector<int> seen;
  permagate::BoundedWorkQueue<int> q(
      permagate::WorkQueueOptions{"bypass", 1, 1, nullptr},
      [&](const permagate::QueueEntry<int>& e) {
        if (e.payload == 1) opened.wait();
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(e.payload);
      },
      kLog);

  expect(q.push(1, false), "first item admitted");
  expect(wait_until([&] { return q.in_flight() == 1; }), "worker picked up first item");

  expect(q.push(2, false), "second item fills the queue");
  expect(!q.push(3, false), "background item dropped when full");
  expect(q.push(4, true), "prioritized item admitted when full");
  expect(q.queue_depth() == 2, "prioritized admission exceeds nominal bound");

  gate.set_value();
  q.drain();
  expect(seen == std::vector<int>({1, 2, 4}), "priority does not reorder; dropped item never runs");
  expect(q.counters().dropped.load() == 1, "drop counted");
  expect(q.counters().admitted.load() == 3, "admissions counted");
}

void test_queue_failure_isolation() {
  std::mutex mu;
  std::vector<int> seen;
  permagate::BoundedWorkQueue<int> q(
      permagate::WorkQueueOptions{"isolation", 1, 10, nullptr},
      [&](const permagate::QueueEntry<int>& e) {
        if (e.payload == 2) throw permagate::GatewayError(permagate::ErrorCode::io_error, "boom");
        if (e.payload == 4) throw 42;
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(e.payload);
      },
      kLog, [](const int& v) { return std::to_string(v); });
  q.push(1, false);
  q.push(2, false);
  q.push(3, false);
  q.push(4, false);
  q.push(5, false);
  q.drain();
  expect(seen == std::vector<int>({1, 3, 5}), "later items still processed after a failure");
  expect(q.counters().failed.load() == 2, "failures counted, including non-standard throws");
  expect(q.counters().completed.load() == 3, "successes counted");
}

void test_queue_zero_workers_and_shutdown() {
  std::atomic<int> runs{0};
  {
    permagate::BoundedWorkQueue<int> q(permagate::WorkQueueOptions{"idle", 0, 10, nullptr},
                                       [&](const permagate::QueueEntry<int>&) { runs++; }, kLog);
    expect(!q.push(1, false), "zero workers admit nothing");
    expect(!q.push(2, true), "zero workers admit nothing, even prioritized");
  }
  permagate::BoundedWorkQueue<int> q(permagate::WorkQueueOptions{"closing", 2, 10, nullptr},
                                     [&](const permagate::QueueEntry<int>&) { runs++; }, kLog);
  q.push(1, false);
  q.push(2, false);
  q.shutdown();
  expect(runs.load() == 2, "shutdown finishes queued work");
  expect(!q.push(3, true), "closed queue admits nothing");
}

// ============================================================================
// Phase 4: Bundle data importer
// ============================================================================

std::shared_ptr<FakeDataSource> testing_data_source() {
  auto ds = std::make_shared<FakeDataSource>();
  ds->objects["testId"] = "testing...";
  return ds;
}

const permagate::BundleItem kMockItem{"testId", 1, "testId"};

void test_importer_queues_when_not_full() {
  auto ds = testing_data_source();
  auto unbundler = std::make_shared<RecordingUnbundler>();
  permagate::BundleDataImporter importer(kLog, ds, unbundler, {1, 1});

  importer.queue_item(kMockItem, false);
  importer.drain();
  expect(ds->requested() == std::vector<std::string>({"testId"}), "getData called with item id");
  expect(unbundler->calls().size() == 1, "bundle forwarded to unbundler");
}

void test_importer_drops_when_full() {
  auto ds = testing_data_source();
  auto unbundler = std::make_shared<RecordingUnbundler>();
  permagate::BundleDataImporter importer(kLog, ds, unbundler, {1, 0});

  importer.queue_item(kMockItem, false);
  importer.drain();
  expect(ds->requested().empty(), "full queue: background item causes no I/O");
  expect(unbundler->calls().empty(), "full queue: nothing forwarded");
  expect(importer.counters().dropped.load() == 1, "drop counted");
}

void test_importer_prioritized_bypasses_full_queue() {
  auto ds = testing_data_source();
  auto unbundler = std::make_shared<RecordingUnbundler>();
  permagate::BundleDataImporter importer(kLog, ds, unbundler, {1, 0});

  importer.queue_item(kMockItem, true);
  importer.drain();
  expect(ds->requested() == std::vector<std::string>({"testId"}),
         "prioritized item fetched despite full queue");
}

void test_importer_download_forwards_item_and_priority() {
  auto ds = testing_data_source();
  auto unbundler = std::make_shared<RecordingUnbundler>();
  permagate::BundleDataImporter importer(kLog, ds, unbundler, {1, 1});

  importer.download(kMockItem, true);
  importer.download(kMockItem, false);
  const auto calls = unbundler->calls();
  expect(calls.size() == 2, "one forward per download");
  expect(calls[0].first == kMockItem && calls[0].second, "forwarded (item, true) unchanged");
  expect(calls[1].first == kMockItem && !calls[1].second, "forwarded (item, false) unchanged");
}

void test_importer_download_failure_not_forwarded() {
  auto ds = testing_data_source();
  ds->error = permagate::GatewayError(permagate::ErrorCode::http_error, "Failed to get data");
  auto unbundler = std::make_shared<RecordingUnbundler>();
  permagate::BundleDataImporter importer(kLog, ds, unbundler, {1, 1});

  std::string message;
  const auto code = error_code_of([&] {
    try {
      importer.download(kMockItem, false);
    } catch (const std::exception& e) {
      message = e.what();
      throw;
    }
  });
  expect(code == permagate::ErrorCode::http_error, "download rethrows the source error");
  expect(message == "Failed to get data", "error message preserved");
  expect(unbundler->calls().empty(), "unbundler not called on fetch failure");

  ds->error.reset();
  ds->declared_size = 11;
  expect(error_code_of([&] { importer.download(kMockItem, false); }) ==
             permagate::ErrorCode::upstream_unavailable,
         "short stream fails the download");
  expect(unbundler->calls().empty(), "short stream not forwarded");
}

// ============================================================================
// Phase 5: ANS-104 parsing
// ============================================================================

void test_ans104_parse_items() {
  const auto items = three_items();
  const std::string bundle = make_bundle(items);
  std::istringstream in(bundle);
  const auto parsed = permagate::ans104::parse_bundle(in, bundle.size(), "bundleId", "rootTx");

  expect(parsed.size() == 3, "three items parsed");
  const uint64_t header = 32 + 3 * 64;
  expect(parsed[0].offset == header, "first item starts after the header");
  expect(parsed[1].offset == header + items[0].bytes.size(), "offsets accumulate");
  for (size_t i = 0; i < parsed.size(); ++i) {
    expect(parsed[i].index == i, "index matches position");
    expect(parsed[i].id == permagate::to_b64url(items[i].id_raw), "id is b64url of header id");
    expect(parsed[i].size == items[i].bytes.size(), "size from header");
    expect(parsed[i].parent_id == "bundleId" && parsed[i].root_tx_id == "rootTx", "lineage");
    expect(parsed[i].signature_type == 2, "signature type");
  }
  expect(parsed[0].data_size == 5 && parsed[2].data_size == 5, "payload sizes");
  expect(bundle.substr(parsed[1].data_offset, parsed[1].data_size) == "second",
         "data offset addresses the payload");
  expect(parsed[0].tags.size() == 2 && parsed[0].tags[1].first == "Content-Type", "tags decoded");
  expect(parsed[0].owner_address == permagate::sha256_b64url(std::string(32, 'b')),
         "owner address is SHA-256 of owner");
  expect(parsed[2].target == permagate::to_b64url(std::string(32, 't')), "target decoded");
  expect(parsed[0].target.empty() && parsed[0].anchor.empty(), "absent target/anchor empty");
}

void test_ans104_avro_negative_block() {
  // count=-1 (zigzag 0x01), block bytes=8, "a" -> "b", terminator.
  const std::string bytes("\x01\x10\x02" "a" "\x02" "b" "\x00", 8);
  const auto tags = permagate::ans104::decode_tags(bytes);
  expect(tags.size() == 1 && tags[0].first == "a" && tags[0].second == "b",
         "negative block count form decoded");
  expect(error_code_of([] { permagate::ans104::decode_tags(std::string("\x02\x02", 2)); }) ==
             permagate::ErrorCode::bundle_parse_error,
         "tag bytes ending mid-entry rejected");
}

void test_ans104_checksum_mismatch() {
  auto items = three_items();
  items[1].id_raw[0] ^= 0x01;
  const std::string bundle = make_bundle(items);
  std::istringstream in(bundle);
  expect(error_code_of([&] { permagate::ans104::parse_bundle(in, bundle.size(), "b", "b"); }) ==
             permagate::ErrorCode::checksum_mismatch,
         "id not matching SHA-256(signature) fails the bundle");
}

void test_ans104_truncated_and_malformed() {
  const std::string bundle = make_bundle(three_items());
  {
    std::istringstream in(bundle.substr(0, bundle.size() - 3));
    expect(error_code_of([&] { permagate::ans104::parse_bundle(in, bundle.size(), "b", "b"); }) ==
               permagate::ErrorCode::bundle_truncated,
           "short stream reported as truncated");
  }
  {
    std::istringstream in(bundle);
    expect(error_code_of([&] { permagate::ans104::parse_bundle(in, 100, "b", "b"); }) ==
               permagate::ErrorCode::bundle_parse_error,
           "items past declared size rejected");
  }
  {
    auto item = make_item('z', {}, "data");
    item.bytes[0] = 99;  // unknown signature type
    const std::string bad = make_bundle({item});
    std::istringstream in(bad);
    expect(error_code_of([&] { permagate::ans104::parse_bundle(in, bad.size(), "b", "b"); }) ==
               permagate::ErrorCode::bundle_parse_error,
           "unknown signature type rejected");
  }
  {
    std::string huge_count = permagate::write_le(1000000, 32);
    std::istringstream in(huge_count);
    expect(error_code_of([&] { permagate::ans104::parse_bundle(in, 64, "b", "b"); }) ==
               permagate::ErrorCode::bundle_parse_error,
           "item count larger than the bundle rejected");
  }
  {
    // Zigzag varint decoding to INT64_MIN as a block count.
    const std::string tags = std::string(9, '\xff') + '\x01';
    expect(error_code_of([&] { permagate::ans104::decode_tags(tags); }) ==
               permagate::ErrorCode::bundle_parse_error,
           "minimum block count rejected");
  }
}

// ============================================================================
// Phase 6: Filters and unbundling
// ============================================================================

permagate::DataItem sample_item() {
  permagate::DataItem item;
  item.id = "item-1";
  item.signature_type = 1;
  item.owner_address = "owner-1";
  item.tags = {{"App-Name", "ArDrive-Web"}, {"Content-Type", "image/png"}};
  return item;
}

void test_filters() {
  const auto item = sample_item();
  expect(permagate::create_filter(std::string(R"({"always":true})"))->match(item), "always");
  expect(!permagate::create_filter(std::string(R"({"never":true})"))->match(item), "never");
  expect(!permagate::create_filter(std::string(""))->match(item), "empty expression never matches");
  expect(permagate::create_filter(std::string(R"({"tags":[{"name":"App-Name","value":"ArDrive-Web"}]})"))
             ->match(item),
         "tag equality");
  expect(permagate::create_filter(std::string(R"({"tags":[{"name":"App-Name","valueStartsWith":"ArDrive"}]})"))
             ->match(item),
         "tag prefix");
  expect(!permagate::create_filter(
              std::string(R"({"tags":[{"name":"App-Name"},{"name":"Content-Type","value":"text/html"}]})"))
              ->match(item),
         "all tag entries must match");
  expect(permagate::create_filter(std::string(R"({"attributes":{"owner_address":"owner-1","signature_type":1}})"))
             ->match(item),
         "attributes");
  expect(permagate::create_filter(
             std::string(R"({"or":[{"never":true},{"and":[{"always":true},{"not":{"never":true}}]}]})"))
             ->match(item),
         "and/or/not compose");

  for (const char* bad : {"[1]", R"({"bogus":1})", R"({"tags":"x"})",
                          R"({"attributes":{"colour":"red"}})", R"({"always":true,"never":true})"}) {
    expect(error_code_of([&] { permagate::create_filter(std::string(bad)); }) ==
               permagate::ErrorCode::filter_invalid,
           std::string("invalid filter rejected: ") + bad);
  }
}

void test_unbundler_emits_in_index_order() {
  const auto items = three_items();
  auto ds = std::make_shared<FakeDataSource>();
  ds->objects["bundle-1"] = make_bundle(items);
  auto sink = std::make_shared<RecordingSink>();
  permagate::Ans104Unbundler unbundler(
      kLog, ds, permagate::create_filter(std::string(R"({"tags":[{"name":"Keep","value":"yes"}]})")), sink,
      {2, 10});

  unbundler.queue_item({"bundle-1", 0, "bundle-1"}, false);
  unbundler.drain();

  const auto emitted = sink->items();
  expect(emitted.size() == 2, "filtered item not emitted");
  expect(emitted[0].index == 0 && emitted[1].index == 2, "emission order is 0 then 2");
  expect(emitted[0].id == permagate::to_b64url(items[0].id_raw), "first emitted id");
  expect(emitted[1].id == permagate::to_b64url(items[2].id_raw), "second emitted id");
  expect(unbundler.counters().completed.load() == 1, "bundle completed");
}

void test_unbundler_failure_emits_nothing() {
  auto bad_items = three_items();
  bad_items[2].id_raw[5] ^= 0x40;
  auto ds = std::make_shared<FakeDataSource>();
  ds->objects["bad"] = make_bundle(bad_items);
  ds->objects["good"] = make_bundle(three_items());
  auto sink = std::make_shared<RecordingSink>();
  permagate::Ans104Unbundler unbundler(kLog, ds, permagate::create_filter(std::string(R"({"always":true})")),
                                       sink, {1, 10});

  unbundler.queue_item({"bad", 0, "bad"}, false);
  unbundler.queue_item({"missing", 0, "missing"}, false);
  unbundler.queue_item({"good", 0, "good"}, false);
  unbundler.drain();

  const auto emitted = sink->items();
  expect(emitted.size() == 3, "only the good bundle emits");
  for (const auto& di : emitted) expect(di.parent_id == "good", "no partial emission from bad");
  expect(unbundler.counters().failed.load() == 2, "bad and missing bundles failed");
  expect(unbundler.counters().completed.load() == 1, "good bundle completed");
}

void test_unbundler_empty_filter_parses_only() {
  auto ds = std::make_shared<FakeDataSource>();
  ds->objects["b"] = make_bundle(three_items());
  auto sink = std::make_shared<RecordingSink>();
  permagate::Ans104Unbundler unbundler(kLog, ds, permagate::create_filter(std::string("")), sink, {1, 1});

  auto& stats = permagate::global_pipeline_stats();
  stats.reset();
  unbundler.unbundle({"b", 0, "b"});
  expect(sink->items().empty(), "never-match filter emits nothing");
  expect(stats.data_items_parsed.load() == 3, "items still parsed");
  expect(stats.data_items_emitted.load() == 0, "nothing counted as emitted");
}

void test_item_channel_and_jsonl_sink() {
  auto channel = std::make_shared<permagate::DataItemChannel>(4);
  auto ds = std::make_shared<FakeDataSource>();
  ds->objects["b"] = make_bundle(three_items());
  permagate::Ans104Unbundler unbundler(kLog, ds, permagate::create_filter(std::string(R"({"always":true})")),
                                       channel, {1, 1});
  unbundler.unbundle({"b", 0, "b"});
  expect(channel->size() == 3, "channel buffers emitted items");
  for (uint64_t i = 0; i < 3; ++i) {
    auto di = channel->pop();
    expect(di && di->index == i, "channel preserves order");
  }
  channel->close();
  expect(!channel->pop().has_value(), "closed and drained channel yields nothing");

  std::ostringstream out;
  permagate::JsonlDataItemSink jsonl(out);
  jsonl.on_item(sample_item());
  const std::string line = out.str();
  expect(line.back() == '\n', "one line per item");
  std::optional<permagate::jsonlite::JsonError> err;
  auto obj = permagate::jsonlite::parse(line.substr(0, line.size() - 1), &err);
  expect(!err, "line is valid JSON");
  expect(permagate::jsonlite::get_string(obj, "id") == "item-1", "id serialized");
  expect(permagate::jsonlite::get_u64(obj, "signature_type") == 1, "signature type serialized");
}

// ============================================================================
// Phase 7: Chunk caches
// ============================================================================

void test_chunk_data_set_get_idempotent() {
  TempDir tmp("chunk_idem");
  auto upstream = std::make_shared<CountingChunkSource>();
  permagate::FsChunkDataCache cache(kLog, upstream, tmp.path.string());

  expect(!cache.has_chunk_data(kDataRoot, 0), "cold cache has nothing");
  expect(!cache.get_chunk_data(kDataRoot, 0).has_value(), "cold get is absent");

  cache.set_chunk_data("payload", kDataRoot, 0);
  cache.set_chunk_data("payload", kDataRoot, 0);
  expect(cache.has_chunk_data(kDataRoot, 0), "has after set");
  auto got = cache.get_chunk_data(kDataRoot, 0);
  expect(got && *got == "payload", "byte-identical after repeated writes");

  const fs::path dir = tmp.path / permagate::to_b64url(kDataRoot) / "data";
  expect(cache.data_path(kDataRoot, 0) == dir / "0", "layout is <b64url root>/data/<offset>");
  size_t files = 0;
  for (const auto& e : fs::directory_iterator(dir)) {
    (void)e;
    ++files;
  }
  expect(files == 1, "repeated writes leave one file and no temp files");
}

void test_chunk_data_fallthrough() {
  TempDir tmp("chunk_fall");
  auto upstream = std::make_shared<CountingChunkSource>();
  permagate::FsChunkDataCache cache(kLog, upstream, tmp.path.string());

  auto cold = cache.get_chunk_data_by_absolute_or_relative_offset(1000, kDataRoot, 0);
  expect(permagate::read_stream(*cold) == "chunk-bytes", "cold read returns upstream bytes");
  expect(upstream->calls.load() == 1, "cold read calls upstream once");
  expect(upstream->last_absolute_offset.load() == 1000, "upstream addressed by absolute offset");
  expect(!cache.has_chunk_data(kDataRoot, 0), "read path does not write back");

  cache.set_chunk_data("cached-bytes", kDataRoot, 0);
  auto warm = cache.get_chunk_data_by_absolute_or_relative_offset(99999, kDataRoot, 0);
  expect(permagate::read_stream(*warm) == "cached-bytes", "warm read serves cache");
  expect(upstream->calls.load() == 1, "warm read does not call upstream");
}

void test_chunk_data_errors_read_as_miss() {
  TempDir tmp("chunk_err");
  auto upstream = std::make_shared<CountingChunkSource>();
  permagate::FsChunkDataCache cache(kLog, upstream, tmp.path.string());

  // A directory where the chunk file should be: probe succeeds, read fails.
  fs::create_directories(cache.data_path(kDataRoot, 7));
  expect(!cache.get_chunk_data(kDataRoot, 7).has_value(), "read fault returns absent");
  auto s = cache.get_chunk_data_by_absolute_or_relative_offset(5, kDataRoot, 7);
  expect(permagate::read_stream(*s) == "chunk-bytes", "read fault falls through to upstream");

  const fs::path not_a_dir = tmp.path / "plain-file";
  {
    std::ofstream ofs(not_a_dir);
    ofs << "x";
  }
  permagate::FsChunkDataCache broken(kLog, upstream, not_a_dir.string());
  broken.set_chunk_data("payload", kDataRoot, 0);
  expect(!broken.has_chunk_data(kDataRoot, 0), "failed write is swallowed and absent");
  expect(!broken.get_chunk_data(kDataRoot, 0).has_value(), "get on broken root is absent");

  upstream->error = permagate::GatewayError(permagate::ErrorCode::not_found, "no chunk");
  expect(error_code_of([&] {
           cache.get_chunk_data_by_absolute_or_relative_offset(5, kDataRoot, 8);
         }) == permagate::ErrorCode::not_found,
         "upstream error rethrown");
}

void test_chunk_metadata_cache() {
  TempDir tmp("chunk_meta");
  auto upstream = std::make_shared<CountingChunkSource>();
  permagate::FsChunkMetadataCache cache(kLog, upstream, tmp.path.string());

  const auto built = cache.get_chunk_metadata_by_absolute_or_relative_offset(2000, kDataRoot, 256);
  expect(upstream->calls.load() == 1, "miss fetches a full chunk");
  expect(built.data_root == kDataRoot && built.offset == 256, "key fields from request");
  expect(built.data_size == upstream->chunk_bytes.size(), "size from chunk length");
  expect(built.data_path == "proof-bytes", "proof from chunk");
  expect(!cache.has_chunk_metadata(kDataRoot, 256), "read path does not write back");

  cache.set_chunk_metadata(built);
  cache.set_chunk_metadata(built);
  auto stored = cache.get_chunk_metadata(kDataRoot, 256);
  expect(stored && *stored == built, "stored metadata reads back identical");
  const auto warm = cache.get_chunk_metadata_by_absolute_or_relative_offset(2000, kDataRoot, 256);
  expect(warm == built && upstream->calls.load() == 1, "warm read does not call upstream");

  {
    std::ofstream ofs(cache.metadata_path(kDataRoot, 512), std::ios::binary);
    ofs << "xyz";
  }
  expect(!cache.get_chunk_metadata(kDataRoot, 512).has_value(), "corrupt record reads as absent");
}

// ============================================================================
// Phase 8: Contiguous data sources and local store
// ============================================================================

class FixedSource : public permagate::IContiguousDataSource {
 public:
  explicit FixedSource(std::optional<std::string> bytes, permagate::ErrorCode code =
                                                             permagate::ErrorCode::not_found)
      : bytes_(std::move(bytes)), code_(code) {}
  int calls{0};

  permagate::DataSourceResult get_data(const std::string& id) override {
    ++calls;
    if (!bytes_) throw permagate::GatewayError(code_, "source failed for " + id);
    permagate::DataSourceResult r;
    r.size = bytes_->size();
    r.stream = std::make_unique<std::istringstream>(*bytes_);
    return r;
  }

 private:
  std::optional<std::string> bytes_;
  permagate::ErrorCode code_;
};

void test_chained_data_source() {
  auto failing = std::make_shared<FixedSource>(std::nullopt, permagate::ErrorCode::http_error);
  auto good = std::make_shared<FixedSource>(std::string("bytes"));
  auto unused = std::make_shared<FixedSource>(std::string("other"));
  permagate::ChainedDataSource chain(kLog, {failing, good, unused});

  auto r = chain.get_data("id");
  expect(permagate::read_stream(*r.stream) == "bytes", "first success wins");
  expect(failing->calls == 1 && good->calls == 1 && unused->calls == 0, "each source tried once");

  auto first = std::make_shared<FixedSource>(std::nullopt, permagate::ErrorCode::http_error);
  auto last = std::make_shared<FixedSource>(std::nullopt, permagate::ErrorCode::not_found);
  permagate::ChainedDataSource all_fail(kLog, {first, last});
  expect(error_code_of([&] { all_fail.get_data("id"); }) == permagate::ErrorCode::not_found,
         "last observed error surfaces");

  permagate::ChainedDataSource empty(kLog, {});
  expect(error_code_of([&] { empty.get_data("id"); }) == permagate::ErrorCode::no_data_source,
         "empty chain reports no data source");
}

void test_gateway_data_source() {
  auto http = std::make_shared<FakeHttpClient>();
  http->responses["http://peer-a/raw/abc"] = {500, "oops"};
  http->responses["http://peer-b/raw/abc"] = {200, "payload"};
  TempDir spool("gateway_spool");
  permagate::GatewayDataSource gw(kLog, http, {"http://peer-a/", "http://peer-b"}, spool.path);

  auto r = gw.get_data("abc");
  expect(fs::is_empty(spool.path), "spooled body unlinked once the stream holds it");
  expect(r.size == 7 && permagate::read_stream(*r.stream) == "payload", "falls to next peer");
  expect(!r.cached && !r.verified, "network result flags");
  expect(http->urls.size() == 2, "each peer asked once");
  expect(error_code_of([&] { gw.get_data("zzz"); }) == permagate::ErrorCode::not_found,
         "all peers failing rethrows");
}

void test_arweave_chunk_source() {
  auto http = std::make_shared<FakeHttpClient>();
  http->responses["http://node/chunk/1000"] = {
      200, "{\"chunk\":\"" + permagate::to_b64url("chunk!") + "\",\"data_path\":\"" +
               permagate::to_b64url("proof") + "\",\"tx_path\":\"\"}"};
  http->responses["http://node/tx/tx1/offset"] = {200, R"({"size":"10","offset":"109"})"};
  http->responses["http://node/tx/tx1/data_root"] = {200, permagate::to_b64url(kDataRoot)};
  permagate::ArweaveChunkSource node(kLog, http, "http://node/");

  const auto chunk = node.get_chunk_by_absolute_or_relative_offset(1000, kDataRoot, 0);
  expect(chunk.chunk == "chunk!" && chunk.data_path == "proof", "chunk fields decoded");

  const auto info = node.get_tx_chunk_info("tx1");
  expect(info.size == 10 && info.end_offset == 109, "string numbers parsed");
  expect(info.start_offset() == 100, "start offset derived");
  expect(info.data_root == kDataRoot, "data root decoded");

  expect(error_code_of([&] { node.get_chunk_by_absolute_or_relative_offset(5, kDataRoot, 0); }) ==
             permagate::ErrorCode::not_found,
         "404 maps to not_found");
}

void test_tx_chunks_data_source() {
  auto tx_info = std::make_shared<FixedTxInfo>();
  tx_info->info = permagate::TxChunkInfo{kDataRoot, 10, 109};
  auto chunks = std::make_shared<SlicingChunkSource>("0123456789", 4);
  auto write_back = std::make_shared<MemoryChunkCache>();
  permagate::TxChunksDataSource source(kLog, tx_info, chunks, write_back);

  auto r = source.get_data("tx1");
  expect(r.size == 10, "size from tx info");
  expect(chunks->absolute_offsets.empty(), "stream is lazy");
  expect(permagate::read_stream(*r.stream) == "0123456789", "chunks reassembled");
  expect(chunks->absolute_offsets == std::vector<uint64_t>({100, 104, 108}),
         "chunks addressed at start + position");
  expect(write_back->sets == 3 && write_back->chunks[4] == "4567", "new chunks written back");

  auto again = source.get_data("tx1");
  permagate::read_stream(*again.stream);
  expect(write_back->sets == 3, "held chunks are not rewritten");

  auto failing = std::make_shared<SlicingChunkSource>("0123456789", 4);
  failing->fail_at = 4;
  permagate::TxChunksDataSource broken(kLog, tx_info, failing);
  auto b = broken.get_data("tx1");
  expect(error_code_of([&] { permagate::read_stream(*b.stream); }) ==
             permagate::ErrorCode::http_error,
         "mid-stream chunk failure surfaces from the read");
}

std::optional<std::string> put_bytes(permagate::FsDataStore& store, const std::string& data,
                                     const std::string& compression = "off") {
  std::istringstream in(data);
  return store.put(in, compression);
}

void test_data_store() {
  TempDir tmp("store");
  permagate::FsDataStore store(kLog, tmp.path.string());
  const std::string data = "artifact data for store test";

  const auto d1 = put_bytes(store, data);
  expect(d1 && d1->size() == 64, "put returns digest");
  expect(*d1 == permagate::cas_content_hash(data), "streamed digest matches one-shot hash");
  expect(put_bytes(store, data) == d1, "key is content-derived");
  auto got = store.open(*d1);
  expect(got && permagate::read_stream(*got->stream) == data, "round trip");
  expect(store.info(*d1)->original_size == data.size(), "info size");

  // Larger than one read block, so compression and decompression both stream.
  std::string compressible;
  for (int i = 0; i < 20000; ++i) compressible += "chunk-" + std::to_string(i % 7) + ";";
  const auto d2 = put_bytes(store, compressible, "zstd");
  expect(d2 && store.info(*d2)->encoding == "zstd", "zstd encoding recorded");
  expect(store.info(*d2)->stored_size < compressible.size(), "zstd shrinks the blob");
  auto z = store.open(*d2);
  expect(z && z->info.original_size == compressible.size(), "zstd object opens");
  expect(permagate::read_stream(*z->stream) == compressible, "zstd round trip");

  const auto empty = put_bytes(store, "");
  expect(empty && permagate::read_stream(*store.open(*empty)->stream).empty(), "empty object");

  {
    std::istringstream in("abc");
    expect(error_code_of([&] { store.put(in, "off", 4); }) ==
               permagate::ErrorCode::upstream_unavailable,
           "input shorter than the expected size rejected");
    expect(!store.contains(permagate::cas_content_hash("abc")), "short input not stored");
  }
  expect(fs::is_empty(tmp.path / "tmp"), "no temp files left behind");

  expect(store.link_id("someId", *d1), "id linked");
  auto by_id = store.open_by_id("someId");
  expect(by_id && permagate::read_stream(*by_id->stream) == data, "lookup by id");
  expect(!store.link_id("../escape", *d1), "path-like id rejected");
  expect(!store.resolve_id("../escape").has_value(), "path-like id never resolves");

  const fs::path obj = tmp.path / "objects" / d1->substr(0, 2) / d1->substr(2, 2) / *d1;
  {
    std::fstream file(obj, std::ios::in | std::ios::out | std::ios::binary);
    expect(file.good(), "can open object file");
    char byte;
    file.read(&byte, 1);
    byte ^= 0xFF;
    file.seekp(0);
    file.write(&byte, 1);
  }
  expect(!store.open(*d1).has_value(), "corruption detected");
  expect(!store.open_by_id("someId").has_value(), "corrupt object not served by id");
  expect(put_bytes(store, data) == d1 && store.open(*d1).has_value(),
         "storing the content again replaces the corrupt object");
}

void test_read_through_data_cache() {
  TempDir tmp("read_through");
  auto store = std::make_shared<permagate::FsDataStore>(kLog, tmp.path.string());
  auto upstream = std::make_shared<FixedSource>(std::string("bundle bytes"));
  permagate::ReadThroughDataCache cache(kLog, store, upstream, "zstd");

  auto first = cache.get_data("bundleA");
  expect(!first.cached && first.size == 12, "miss");
  expect(permagate::read_stream(*first.stream) == "bundle bytes", "miss served from the store");
  const auto digest = store->resolve_id("bundleA");
  expect(digest && store->info(*digest)->encoding == "zstd", "miss stored with compression");
  auto second = cache.get_data("bundleA");
  expect(second.cached && second.size == 12, "hit flagged cached");
  expect(permagate::read_stream(*second.stream) == "bundle bytes", "hit bytes identical");
  expect(upstream->calls == 1, "upstream consulted once");

  auto ds = std::make_shared<FakeDataSource>();
  ds->objects["shortId"] = "abc";
  ds->declared_size = 4;
  permagate::ReadThroughDataCache short_cache(kLog, store, ds);
  expect(error_code_of([&] { short_cache.get_data("shortId"); }) ==
             permagate::ErrorCode::upstream_unavailable,
         "short upstream stream rejected");
  expect(!store->resolve_id("shortId").has_value(), "short stream not stored");

  // A store rooted at a regular file cannot take objects.
  const fs::path blocked = tmp.path / "not_a_dir";
  {
    std::ofstream ofs(blocked);
    ofs << "x";
  }
  auto broken = std::make_shared<permagate::FsDataStore>(kLog, blocked.string());
  auto fallback = std::make_shared<FixedSource>(std::string("fallback bytes"));
  permagate::ReadThroughDataCache degraded(kLog, broken, fallback);
  auto r = degraded.get_data("bundleB");
  expect(!r.cached && permagate::read_stream(*r.stream) == "fallback bytes",
         "store failure still serves upstream bytes");
  expect(fallback->calls == 2, "upstream asked again once the store failed");
}

// ============================================================================
// Phase 9: Observability
// ============================================================================

void test_pipeline_stats_and_events() {
  auto& stats = permagate::global_pipeline_stats();
  stats.reset();
  stats.chunk_data_hits += 3;
  stats.chunk_data_misses += 1;
  stats.download_latency.record(1500000);
  const std::string json = stats.to_json();
  expect(json.find("\"data_hits\":3") != std::string::npos, "hits serialized");
  expect(json.find("\"data_hit_rate\":0.750000") != std::string::npos, "hit rate serialized");
  expect(stats.download_latency.count() == 1, "latency recorded");

  std::optional<permagate::jsonlite::JsonError> err;
  permagate::jsonlite::parse(json, &err);
  expect(!err, "stats JSON parses");

  TempDir tmp("events");
  const fs::path log = tmp.path / "events.jsonl";
  permagate::set_event_log_path(log.string());

  auto items = three_items();
  items[0].id_raw[0] ^= 0x01;
  auto ds = std::make_shared<FakeDataSource>();
  ds->objects["bad"] = make_bundle(items);
  auto sink = std::make_shared<RecordingSink>();
  permagate::Ans104Unbundler unbundler(kLog, ds, permagate::create_filter(std::string(R"({"always":true})")),
                                       sink, {1, 1});
  expect(error_code_of([&] { unbundler.unbundle({"bad", 0, "bad"}); }) ==
             permagate::ErrorCode::checksum_mismatch,
         "unbundle rethrows parse failure");
  permagate::set_event_log_path("");

  std::ifstream ifs(log);
  std::string line;
  expect(static_cast<bool>(std::getline(ifs, line)), "event written");
  expect(line.find("\"stage\":\"unbundle\"") != std::string::npos, "event stage");
  expect(line.find("\"ok\":false") != std::string::npos, "event outcome");
  expect(line.find("checksum_mismatch") != std::string::npos, "event error code");
}

void test_log_sink() {
  TempDir tmp("log_sink");
  const fs::path path = tmp.path / "log.jsonl";
  std::FILE* file = std::fopen(path.string().c_str(), "w");
  expect(file != nullptr, "log file opens");
  permagate::set_log_sink(file);
  permagate::set_log_level(permagate::LogLevel::warn);
  const permagate::Logger log("SinkTest");
  log.info("below threshold");
  log.warn("Queue is full", {{"queue", "download"}});
  permagate::set_log_level(permagate::LogLevel::silent);
  permagate::set_log_sink(nullptr);
  std::fclose(file);

  std::ifstream ifs(path);
  std::string line;
  expect(static_cast<bool>(std::getline(ifs, line)), "log line written to the sink");
  expect(line.find("\"level\":\"warn\"") != std::string::npos, "level field");
  expect(line.find("\"class\":\"SinkTest\"") != std::string::npos, "component field");
  expect(line.find("\"queue\":\"download\"") != std::string::npos, "structured field");
  expect(!std::getline(ifs, line), "lines below the threshold dropped");
}

void test_version_manifest() {
  const auto m = permagate::version::current_manifest("1.2.3");
  const std::string json = permagate::version::manifest_to_json(m);
  expect(json.find("\"semver\":\"1.2.3\"") != std::string::npos, "semver in manifest");
  expect(m.chunk_cache_layout == permagate::version::CHUNK_CACHE_LAYOUT_VERSION, "layout version");
}

}  // namespace

int main() {
  permagate::set_log_level(permagate::LogLevel::silent);
  std::cout << "=== permagate Test Suite ===\n";

  std::cout << "\n[Phase 1] Encoding and hashing\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("SHA-256 vectors", test_sha256_vectors);
  run_test("base64url", test_b64url);
  run_test("little-endian fields", test_little_endian_fields);
  run_test("chunk metadata msgpack", test_chunk_metadata_msgpack);

  std::cout << "\n[Phase 2] JSON and configuration\n";
  run_test("JSON parse", test_json_parse);
  run_test("config layers", test_config_layers);
  run_test("config invalid values", test_config_invalid_values);

  std::cout << "\n[Phase 3] Bounded worker queue\n";
  run_test("FIFO order", test_queue_fifo_order);
  run_test("prioritized admission bypass", test_queue_priority_bypass);
  run_test("failure isolation", test_queue_failure_isolation);
  run_test("zero workers + shutdown", test_queue_zero_workers_and_shutdown);

  std::cout << "\n[Phase 4] Bundle data importer\n";
  run_test("queues when not full", test_importer_queues_when_not_full);
  run_test("drops background item when full", test_importer_drops_when_full);
  run_test("prioritized bypasses full queue", test_importer_prioritized_bypasses_full_queue);
  run_test("download forwards item + priority", test_importer_download_forwards_item_and_priority);
  run_test("download failure not forwarded", test_importer_download_failure_not_forwarded);

  std::cout << "\n[Phase 5] ANS-104 parsing\n";
  run_test("parse items", test_ans104_parse_items);
  run_test("Avro negative block count", test_ans104_avro_negative_block);
  run_test("checksum mismatch", test_ans104_checksum_mismatch);
  run_test("truncated + malformed", test_ans104_truncated_and_malformed);

  std::cout << "\n[Phase 6] Filters and unbundling\n";
  run_test("filters", test_filters);
  run_test("emits in index order", test_unbundler_emits_in_index_order);
  run_test("failed bundle emits nothing", test_unbundler_failure_emits_nothing);
  run_test("empty filter parses only", test_unbundler_empty_filter_parses_only);
  run_test("item channel + JSONL sink", test_item_channel_and_jsonl_sink);

  std::cout << "\n[Phase 7] Chunk caches\n";
  run_test("chunk data set/get idempotent", test_chunk_data_set_get_idempotent);
  run_test("chunk data fallthrough", test_chunk_data_fallthrough);
  run_test("chunk data errors read as miss", test_chunk_data_errors_read_as_miss);
  run_test("chunk metadata cache", test_chunk_metadata_cache);

  std::cout << "\n[Phase 8] Contiguous data\n";
  run_test("chained data source", test_chained_data_source);
  run_test("gateway data source", test_gateway_data_source);
  run_test("arweave chunk source", test_arweave_chunk_source);
  run_test("tx chunks data source", test_tx_chunks_data_source);
  run_test("local data store", test_data_store);
  run_test("read-through data cache", test_read_through_data_cache);

  std::cout << "\n[Phase 9] Observability\n";
  run_test("pipeline stats + events", test_pipeline_stats_and_events);
  run_test("log sink", test_log_sink);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
