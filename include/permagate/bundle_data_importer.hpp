#pragma once

// permagate/bundle_data_importer.hpp — Bundle download worker pool.
//
// STATE (per queued bundle): Queued -> Downloading -> Dispatched | Failed
//
// ADMISSION: see BoundedWorkQueue. Background (crawl) work is dropped when
// the queue is full; prioritized (on-demand) work is always admitted.
//
// download() fetches the bundle through the data source chain and consumes
// the stream once, which fills the local store when the chain has a
// read-through cache in front. Only after the whole stream has arrived is
// (item, prioritized) handed to the unbundler, unchanged. A fetch failure
// propagates to the caller and nothing is forwarded.

#include <cstddef>
#include <memory>

#include "permagate/ans104_unbundler.hpp"
#include "permagate/data_source.hpp"
#include "permagate/log.hpp"
#include "permagate/types.hpp"
#include "permagate/worker_pool.hpp"

namespace permagate {

struct ImporterOptions {
  size_t worker_count{1};
  size_t max_queue_size{100};
};

class BundleDataImporter {
 public:
  BundleDataImporter(const Logger& log, std::shared_ptr<IContiguousDataSource> data_source,
                     std::shared_ptr<IUnbundler> unbundler, ImporterOptions options = {});

  // Returns immediately; never performs I/O.
  void queue_item(const BundleItem& item, bool prioritized);

  void download(const BundleItem& item, bool prioritized);

  void drain() { queue_.drain(); }
  void shutdown() { queue_.shutdown(); }
  size_t queue_depth() const { return queue_.queue_depth(); }
  const QueueCounters& counters() const { return queue_.counters(); }

 private:
  Logger log_;
  std::shared_ptr<IContiguousDataSource> data_source_;
  std::shared_ptr<IUnbundler> unbundler_;
  BoundedWorkQueue<BundleItem> queue_;
};

}  // namespace permagate
