#include "permagate/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "permagate/jsonlite.hpp"

namespace permagate {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fmt(const char* spec, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), spec, v);
  return buf;
}

uint64_t load(const std::atomic<uint64_t>& a) {
  return a.load(std::memory_order_relaxed);
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":" + fmt("%.2f", mean_us());
  out += ",\"p50_ms\":" + fmt("%.3f", percentile(0.50) / 1000.0);
  out += ",\"p95_ms\":" + fmt("%.3f", percentile(0.95) / 1000.0);
  out += ",\"p99_ms\":" + fmt("%.3f", percentile(0.99) / 1000.0);
  out += '}';
  return out;
}

std::string QueueCounters::to_json() const {
  return "{\"admitted\":" + std::to_string(load(admitted)) +
         ",\"dropped\":" + std::to_string(load(dropped)) +
         ",\"completed\":" + std::to_string(load(completed)) +
         ",\"failed\":" + std::to_string(load(failed)) + "}";
}

// ---------------------------------------------------------------------------
// PipelineStats
// ---------------------------------------------------------------------------

std::string PipelineStats::to_json() const {
  const uint64_t hits = load(chunk_data_hits);
  const uint64_t misses = load(chunk_data_misses);
  const double hit_rate = (hits + misses) > 0
      ? static_cast<double>(hits) / static_cast<double>(hits + misses)
      : 0.0;

  std::string out;
  out.reserve(768);
  out += "{\"chunk_cache\":{\"data_hits\":" + std::to_string(hits);
  out += ",\"data_misses\":" + std::to_string(misses);
  out += ",\"data_hit_rate\":" + fmt("%.6f", hit_rate);
  out += ",\"data_write_failures\":" + std::to_string(load(chunk_data_write_failures));
  out += ",\"metadata_hits\":" + std::to_string(load(chunk_metadata_hits));
  out += ",\"metadata_misses\":" + std::to_string(load(chunk_metadata_misses));
  out += "}";

  out += ",\"data_cache\":{\"hits\":" + std::to_string(load(data_cache_hits));
  out += ",\"misses\":" + std::to_string(load(data_cache_misses));
  out += ",\"bytes_from_cache\":" + std::to_string(load(bytes_from_cache));
  out += ",\"bytes_from_network\":" + std::to_string(load(bytes_from_network));
  out += "}";

  out += ",\"unbundling\":{\"bundles\":" + std::to_string(load(bundles_unbundled));
  out += ",\"items_parsed\":" + std::to_string(load(data_items_parsed));
  out += ",\"items_emitted\":" + std::to_string(load(data_items_emitted));
  out += "}";

  out += ",\"queues\":{\"importer\":" + importer_queue.to_json();
  out += ",\"unbundler\":" + unbundler_queue.to_json();
  out += "}";

  out += ",\"download_latency\":" + download_latency.to_json();
  out += "}";
  return out;
}

void PipelineStats::reset() {
  for (auto* a : {&chunk_data_hits, &chunk_data_misses, &chunk_data_write_failures,
                  &chunk_metadata_hits, &chunk_metadata_misses, &data_cache_hits,
                  &data_cache_misses, &bytes_from_cache, &bytes_from_network,
                  &bundles_unbundled, &data_items_parsed, &data_items_emitted}) {
    a->store(0, std::memory_order_relaxed);
  }
  for (auto* q : {&importer_queue, &unbundler_queue}) {
    q->admitted.store(0, std::memory_order_relaxed);
    q->dropped.store(0, std::memory_order_relaxed);
    q->completed.store(0, std::memory_order_relaxed);
    q->failed.store(0, std::memory_order_relaxed);
  }
}

PipelineStats& global_pipeline_stats() {
  static PipelineStats inst;
  return inst;
}

namespace {

std::mutex g_event_log_mu;
std::string g_event_log_path;

std::string event_log_path() {
  {
    std::lock_guard<std::mutex> lk(g_event_log_mu);
    if (!g_event_log_path.empty()) return g_event_log_path;
  }
  const char* env = std::getenv("PERMAGATE_EVENT_LOG");
  return (env && env[0]) ? std::string(env) : std::string();
}

}  // namespace

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_event_log_mu);
  g_event_log_path = path;
}

// Activation: PERMAGATE_EVENT_LOG=/path/to/events.jsonl or set_event_log_path().
void emit_pipeline_event(const PipelineEvent& ev) {
  const std::string log_path = event_log_path();
  if (log_path.empty()) return;

  std::string line;
  line.reserve(256);
  line += "{\"stage\":\"" + jsonlite::escape(ev.stage);
  line += "\",\"id\":\"" + jsonlite::escape(ev.id);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"duration_ns\":" + std::to_string(ev.duration_ns);
  line += ",\"items_parsed\":" + std::to_string(ev.items_parsed);
  line += ",\"items_emitted\":" + std::to_string(ev.items_emitted);
  line += ",\"error_code\":\"" + jsonlite::escape(ev.error_code);
  line += "\",\"error_message\":\"" + jsonlite::escape(ev.error_message);
  line += "\"}\n";

  // O_APPEND writes under PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace permagate
