#include "permagate/ans104_unbundler.hpp"

#include "permagate/ans104.hpp"
#include "permagate/encoding.hpp"
#include "permagate/jsonlite.hpp"
#include "permagate/observability.hpp"

namespace permagate {

// ---------------------------------------------------------------------------
// DataItemChannel
// ---------------------------------------------------------------------------

DataItemChannel::DataItemChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void DataItemChannel::on_item(const DataItem& item) {
  std::unique_lock<std::mutex> lock(mu_);
  not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
  if (closed_) return;
  items_.push_back(item);
  lock.unlock();
  not_empty_.notify_one();
}

std::optional<DataItem> DataItemChannel::pop() {
  std::unique_lock<std::mutex> lock(mu_);
  not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
  if (items_.empty()) return std::nullopt;
  DataItem item = std::move(items_.front());
  items_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return item;
}

void DataItemChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

size_t DataItemChannel::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return items_.size();
}

// ---------------------------------------------------------------------------
// JsonlDataItemSink
// ---------------------------------------------------------------------------

std::string data_item_to_json(const DataItem& item) {
  jsonlite::Array tags;
  for (const auto& [name, value] : item.tags) {
    jsonlite::Object t;
    t["name"] = to_b64url(name);
    t["value"] = to_b64url(value);
    tags.emplace_back(std::move(t));
  }

  jsonlite::Object o;
  o["id"] = item.id;
  o["index"] = item.index;
  o["parent_id"] = item.parent_id;
  o["root_tx_id"] = item.root_tx_id;
  o["offset"] = item.offset;
  o["size"] = item.size;
  o["data_offset"] = item.data_offset;
  o["data_size"] = item.data_size;
  o["signature_type"] = static_cast<std::uint64_t>(item.signature_type);
  o["owner_address"] = item.owner_address;
  o["target"] = item.target;
  o["anchor"] = item.anchor;
  o["tags"] = std::move(tags);
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

void JsonlDataItemSink::on_item(const DataItem& item) {
  const std::string line = data_item_to_json(item);
  std::lock_guard<std::mutex> lock(mu_);
  out_ << line << '\n';
  out_.flush();
}

// ---------------------------------------------------------------------------
// Ans104Unbundler
// ---------------------------------------------------------------------------

Ans104Unbundler::Ans104Unbundler(const Logger& log,
                                 std::shared_ptr<IContiguousDataSource> data_source,
                                 ItemFilterPtr filter, std::shared_ptr<IDataItemSink> sink,
                                 UnbundlerOptions options)
    : log_(log.child("Ans104Unbundler")),
      data_source_(std::move(data_source)),
      filter_(std::move(filter)),
      sink_(std::move(sink)),
      queue_(WorkQueueOptions{"ans104-unbundle", options.worker_count, options.max_queue_size,
                              &global_pipeline_stats().unbundler_queue},
             [this](const QueueEntry<BundleItem>& e) { unbundle(e.payload); }, log_,
             [](const BundleItem& item) { return item.id; }) {}

void Ans104Unbundler::queue_item(const BundleItem& item, bool prioritized) {
  if (queue_.push(item, prioritized)) {
    log_.debug("Queued bundle for unbundling",
               {{"id", item.id}, {"prioritized", prioritized ? "true" : "false"}});
  }
}

void Ans104Unbundler::unbundle(const BundleItem& item) {
  PipelineEvent ev;
  ev.stage = "unbundle";
  ev.id = item.id;
  auto& stats = global_pipeline_stats();
  try {
    ScopeTimer timer(ev.duration_ns);
    log_.info("Unbundling bundle", {{"id", item.id}});

    DataSourceResult data = data_source_->get_data(item.id);
    const std::string& root_tx_id = item.root_tx_id.empty() ? item.id : item.root_tx_id;
    const std::vector<DataItem> items =
        ans104::parse_bundle(*data.stream, data.size, item.id, root_tx_id);
    ev.items_parsed = items.size();
    stats.data_items_parsed.fetch_add(items.size(), std::memory_order_relaxed);

    for (const auto& di : items) {
      if (!filter_->match(di)) continue;
      sink_->on_item(di);
      ++ev.items_emitted;
      stats.data_items_emitted.fetch_add(1, std::memory_order_relaxed);
    }
    stats.bundles_unbundled.fetch_add(1, std::memory_order_relaxed);
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
  ev.ok = true;
  emit_pipeline_event(ev);
  log_.info("Bundle unbundled",
            {{"id", item.id},
             {"itemsParsed", std::to_string(ev.items_parsed)},
             {"itemsEmitted", std::to_string(ev.items_emitted)}});
}

}  // namespace permagate
