#pragma once

// permagate/worker_pool.hpp — Fixed-size worker pool over a bounded FIFO.
//
// ADMISSION RULE:
//   push(x, prioritized=false) is dropped when the number of WAITING entries
//   (in-flight work excluded) is >= max_queue_size. push(x, prioritized=true)
//   is always admitted, so the queue may exceed its nominal bound. A pool with
//   worker_count == 0 admits nothing. Admission never blocks on I/O.
//
// ORDERING:
//   Strict FIFO. Priority affects admission only, never dequeue order.
//
// FAILURE ISOLATION:
//   A handler that throws std::exception is logged and counted as failed; the
//   worker moves on to the next entry.
//
// LIFECYCLE:
//   shutdown() stops admission, lets workers finish what is already queued,
//   and joins them. The destructor runs shutdown().
//
// EXTENSION_POINT: priority_lanes
//   Current: FIFO with a capacity bypass for prioritized entries.
//   Upgrade path: a second deque drained first by workers. Invariant to keep:
//   entries of the same class still leave in arrival order.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "permagate/log.hpp"
#include "permagate/observability.hpp"

namespace permagate {

template <typename T>
struct QueueEntry {
  T payload;
  bool prioritized{false};
};

struct WorkQueueOptions {
  std::string name;
  size_t worker_count{1};
  size_t max_queue_size{0};
  QueueCounters* stats{nullptr};  // process-wide mirror, may be null
};

template <typename T>
class BoundedWorkQueue {
 public:
  using Handler = std::function<void(const QueueEntry<T>&)>;
  // Renders a payload for log lines (content id, usually).
  using Describe = std::function<std::string(const T&)>;

  BoundedWorkQueue(WorkQueueOptions options, Handler handler, Logger log,
                   Describe describe = {})
      : options_(std::move(options)),
        handler_(std::move(handler)),
        log_(std::move(log)),
        describe_(std::move(describe)) {
    workers_.reserve(options_.worker_count);
    for (size_t i = 0; i < options_.worker_count; ++i) {
      workers_.emplace_back([this] { worker_loop(); });
    }
  }

  ~BoundedWorkQueue() { shutdown(); }

  BoundedWorkQueue(const BoundedWorkQueue&) = delete;
  BoundedWorkQueue& operator=(const BoundedWorkQueue&) = delete;

  // Returns true if the entry was admitted.
  bool push(T payload, bool prioritized) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      const bool full = !prioritized && queue_.size() >= options_.max_queue_size;
      if (stopping_ || options_.worker_count == 0 || full) {
        bump(&QueueCounters::dropped);
        log_.debug("Skipping queue item, queue is full or closed",
                   {{"queue", options_.name},
                    {"id", describe(payload)},
                    {"queueDepth", std::to_string(queue_.size())}});
        return false;
      }
      queue_.push_back(QueueEntry<T>{std::move(payload), prioritized});
      bump(&QueueCounters::admitted);
    }
    cv_.notify_one();
    return true;
  }

  // Blocks until nothing is waiting and nothing is in flight.
  void drain() {
    std::unique_lock<std::mutex> lock(mu_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopping_ && workers_.empty()) return;
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) {
      if (w.joinable()) w.join();
    }
    workers_.clear();
  }

  size_t queue_depth() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

  size_t in_flight() const {
    std::lock_guard<std::mutex> lock(mu_);
    return in_flight_;
  }

  const QueueCounters& counters() const { return counters_; }
  const WorkQueueOptions& options() const { return options_; }

 private:
  void worker_loop() {
    while (true) {
      QueueEntry<T> entry;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (stopping_ && queue_.empty()) return;
        entry = std::move(queue_.front());
        queue_.pop_front();
        ++in_flight_;
      }

      bool ok = true;
      try {
        handler_(entry);
      } catch (const std::exception& e) {
        ok = false;
        log_.error("Work item failed",
                   {{"queue", options_.name},
                    {"id", describe(entry.payload)},
                    {"prioritized", entry.prioritized ? "true" : "false"},
                    {"error", e.what()}});
      } catch (...) {
        ok = false;
        log_.error("Work item failed",
                   {{"queue", options_.name},
                    {"id", describe(entry.payload)},
                    {"prioritized", entry.prioritized ? "true" : "false"},
                    {"error", "non-standard exception"}});
      }

      {
        std::lock_guard<std::mutex> lock(mu_);
        --in_flight_;
        bump(ok ? &QueueCounters::completed : &QueueCounters::failed);
        if (queue_.empty() && in_flight_ == 0) idle_cv_.notify_all();
      }
    }
  }

  void bump(std::atomic<uint64_t> QueueCounters::*field) {
    (counters_.*field).fetch_add(1, std::memory_order_relaxed);
    if (options_.stats) (options_.stats->*field).fetch_add(1, std::memory_order_relaxed);
  }

  std::string describe(const T& payload) const {
    return describe_ ? describe_(payload) : std::string();
  }

  WorkQueueOptions options_;
  Handler handler_;
  Logger log_;
  Describe describe_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<QueueEntry<T>> queue_;
  size_t in_flight_{0};
  bool stopping_{false};
  QueueCounters counters_;
  std::vector<std::thread> workers_;
};

}  // namespace permagate
