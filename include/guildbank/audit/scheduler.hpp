#pragma once

#include <guildbank/audit/queue.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace guildbank::audit {

/// Worker thread flushing a queue on a fixed interval.
class flush_scheduler final {
 public:
  flush_scheduler(queue& target,
                  std::chrono::milliseconds interval,
                  std::size_t batch_size);
  ~flush_scheduler();

  flush_scheduler(const flush_scheduler&) = delete;
  flush_scheduler& operator=(const flush_scheduler&) = delete;

  void start();

  /// Wake the worker, join it, then drain the queue until it is empty or a
  /// flush fails.
  void stop();

 private:
  queue& queue_;
  std::chrono::milliseconds interval_;
  std::size_t batch_size_;

  bool should_stop_{false};
  std::condition_variable stop_signal_;
  std::mutex stop_mutex_;
  std::unique_ptr<std::thread> worker_;
};

}  // namespace guildbank::audit
