#include "permagate/bundle_data_importer.hpp"

#include "permagate/fs_util.hpp"
#include "permagate/observability.hpp"

namespace permagate {

BundleDataImporter::BundleDataImporter(const Logger& log,
                                       std::shared_ptr<IContiguousDataSource> data_source,
                                       std::shared_ptr<IUnbundler> unbundler,
                                       ImporterOptions options)
    : log_(log.child("BundleDataImporter")),
      data_source_(std::move(data_source)),
      unbundler_(std::move(unbundler)),
      queue_(WorkQueueOptions{"ans104-download", options.worker_count, options.max_queue_size,
                              &global_pipeline_stats().importer_queue},
             [this](const QueueEntry<BundleItem>& e) { download(e.payload, e.prioritized); },
             log_, [](const BundleItem& item) { return item.id; }) {}

void BundleDataImporter::queue_item(const BundleItem& item, bool prioritized) {
  if (queue_.push(item, prioritized)) {
    log_.debug("Queued bundle for download",
               {{"id", item.id},
                {"index", std::to_string(item.index)},
                {"prioritized", prioritized ? "true" : "false"}});
  }
}

void BundleDataImporter::download(const BundleItem& item, bool prioritized) {
  PipelineEvent ev;
  ev.stage = "download";
  ev.id = item.id;
  try {
    ScopeTimer timer(ev.duration_ns);
    log_.info("Downloading bundle", {{"id", item.id}});

    DataSourceResult data = data_source_->get_data(item.id);
    const uint64_t received =
        consume_stream(*data.stream, [](const char*, size_t) {});
    if (received != data.size) {
      throw GatewayError(ErrorCode::upstream_unavailable,
                         "received " + std::to_string(received) + " of " +
                             std::to_string(data.size) + " bundle bytes");
    }
  } catch (const GatewayError& e) {
    ev.error_code = to_string(e.code());
    ev.error_message = e.what();
    emit_pipeline_event(ev);
    throw;
  } catch (const std::exception& e) {
    ev.error_code = "internal";
    ev.error_message = e.what();
    emit_pipeline_event(ev);
    throw;
  }
  global_pipeline_stats().download_latency.record(ev.duration_ns);
  ev.ok = true;
  emit_pipeline_event(ev);

  unbundler_->queue_item(item, prioritized);
  log_.info("Bundle dispatched for unbundling",
            {{"id", item.id}, {"prioritized", prioritized ? "true" : "false"}});
}

}  // namespace permagate
