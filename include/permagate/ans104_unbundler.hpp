#pragma once

// permagate/ans104_unbundler.hpp — Bundle unbundling worker pool and item sinks.
//
// FLOW (per queued bundle):
//   data source get_data(id) -> ans104::parse_bundle (whole bundle)
//   -> filter each item -> sink.on_item() for accepted items, index order.
//
// INVARIANTS:
//   - Items of one bundle reach the sink in ascending index order.
//   - A bundle that fails to fetch or parse emits nothing; the failure is
//     logged by the pool and counted. It is not retried.
//   - Filtered-out items are still parsed and verified.
//   - Items from different bundles may interleave when worker_count > 1.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include "permagate/data_source.hpp"
#include "permagate/filters.hpp"
#include "permagate/log.hpp"
#include "permagate/types.hpp"
#include "permagate/worker_pool.hpp"

namespace permagate {

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
class IDataItemSink {
 public:
  virtual ~IDataItemSink() = default;
  virtual void on_item(const DataItem& item) = 0;
};

// Bounded channel for pull-style consumers. on_item() blocks while the
// channel is full, which pushes back on the unbundler's worker.
class DataItemChannel : public IDataItemSink {
 public:
  explicit DataItemChannel(size_t capacity);

  // Returns once the item is buffered. After close() items are discarded.
  void on_item(const DataItem& item) override;

  // Blocks until an item is available; nullopt once closed and drained.
  std::optional<DataItem> pop();

  void close();
  size_t size() const;

 private:
  size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<DataItem> items_;
  bool closed_{false};
};

// One JSON object per item per line. The stream must outlive the sink.
class JsonlDataItemSink : public IDataItemSink {
 public:
  explicit JsonlDataItemSink(std::ostream& out) : out_(out) {}
  void on_item(const DataItem& item) override;

 private:
  std::mutex mu_;
  std::ostream& out_;
};

// Tag names and values are raw bytes; they are emitted as base64url.
std::string data_item_to_json(const DataItem& item);

// ---------------------------------------------------------------------------
// Unbundler
// ---------------------------------------------------------------------------
class IUnbundler {
 public:
  virtual ~IUnbundler() = default;
  virtual void queue_item(const BundleItem& item, bool prioritized) = 0;
};

struct UnbundlerOptions {
  size_t worker_count{1};
  size_t max_queue_size{1000};
};

class Ans104Unbundler : public IUnbundler {
 public:
  Ans104Unbundler(const Logger& log, std::shared_ptr<IContiguousDataSource> data_source,
                  ItemFilterPtr filter, std::shared_ptr<IDataItemSink> sink,
                  UnbundlerOptions options = {});

  void queue_item(const BundleItem& item, bool prioritized) override;

  // Worker body: fetch, parse, filter, emit. Throws on fetch or parse failure.
  void unbundle(const BundleItem& item);

  void drain() { queue_.drain(); }
  void shutdown() { queue_.shutdown(); }
  size_t queue_depth() const { return queue_.queue_depth(); }
  const QueueCounters& counters() const { return queue_.counters(); }

 private:
  Logger log_;
  std::shared_ptr<IContiguousDataSource> data_source_;
  ItemFilterPtr filter_;
  std::shared_ptr<IDataItemSink> sink_;
  // Last member: workers must stop before the collaborators above go away.
  BoundedWorkQueue<BundleItem> queue_;
};

}  // namespace permagate
