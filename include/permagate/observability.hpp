#pragma once

// permagate/observability.hpp — Pipeline counters and event emission.
//
// DESIGN:
//   PipelineStats is process-wide and lock-free on the hot path. Capacity
//   drops and swallowed cache errors are not exceptions, so these counters
//   (plus the log) are the only place they become visible.
//
// EXTENSION_POINT: metrics_exporter
//   Current: to_json() snapshot, rendered by `permagate stats`.
//   Upgrade path: a Prometheus text exporter reading the same atomics.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace permagate {

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0].
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// Per-pool admission and completion counters.
struct QueueCounters {
  std::atomic<uint64_t> admitted{0};
  std::atomic<uint64_t> dropped{0};
  std::atomic<uint64_t> completed{0};
  std::atomic<uint64_t> failed{0};

  std::string to_json() const;
};

class PipelineStats {
 public:
  // --- Chunk caches ---
  std::atomic<uint64_t> chunk_data_hits{0};
  std::atomic<uint64_t> chunk_data_misses{0};
  std::atomic<uint64_t> chunk_data_write_failures{0};
  std::atomic<uint64_t> chunk_metadata_hits{0};
  std::atomic<uint64_t> chunk_metadata_misses{0};

  // --- Contiguous data ---
  std::atomic<uint64_t> data_cache_hits{0};
  std::atomic<uint64_t> data_cache_misses{0};
  std::atomic<uint64_t> bytes_from_cache{0};
  std::atomic<uint64_t> bytes_from_network{0};

  // --- Unbundling ---
  std::atomic<uint64_t> bundles_unbundled{0};
  std::atomic<uint64_t> data_items_parsed{0};
  std::atomic<uint64_t> data_items_emitted{0};

  QueueCounters importer_queue;
  QueueCounters unbundler_queue;

  LatencyHistogram download_latency;

  std::string to_json() const;
  void reset();
};

PipelineStats& global_pipeline_stats();

// ---------------------------------------------------------------------------
// PipelineEvent — one line per finished (or failed) work item
// ---------------------------------------------------------------------------
struct PipelineEvent {
  std::string stage;       // "download" | "unbundle"
  std::string id;
  bool ok{false};
  std::string error_code;
  std::string error_message;
  uint64_t duration_ns{0};
  uint64_t items_parsed{0};
  uint64_t items_emitted{0};
};

// Appends the event as JSONL to the event log path, when one is configured.
// Never throws.
void emit_pipeline_event(const PipelineEvent& ev);

// Overrides $PERMAGATE_EVENT_LOG. Empty falls back to the environment.
void set_event_log_path(const std::string& path);

// RAII duration capture.
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace permagate
