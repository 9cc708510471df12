#include <spdlog/spdlog.h>
#include <guildbank/audit/scheduler.hpp>
#include <guildbank/common/critical.hpp>

namespace guildbank::audit {

flush_scheduler::flush_scheduler(queue& target,
                                 const std::chrono::milliseconds interval,
                                 const std::size_t batch_size)
    : queue_{target}, interval_{interval}, batch_size_{batch_size} {}

flush_scheduler::~flush_scheduler() {
  stop();
}

void flush_scheduler::start() {
  auto lock = std::scoped_lock{stop_mutex_};
  if (worker_ != nullptr) {
    guildbank::common::critical("audit flush scheduler started twice");
  }
  should_stop_ = false;
  worker_ = std::make_unique<std::thread>([this]() {
    while (true) {
      {
        auto wait_lock = std::unique_lock{stop_mutex_};
        stop_signal_.wait_for(wait_lock, interval_,
                              [this]() { return should_stop_; });
        if (should_stop_) {
          break;
        }
      }
      queue_.flush(batch_size_);
    }
  });
  spdlog::info("Audit flush scheduler running every {} ms, batch size {}",
               interval_.count(), batch_size_);
}

void flush_scheduler::stop() {
  {
    auto lock = std::scoped_lock{stop_mutex_};
    if (worker_ == nullptr) {
      return;
    }
    should_stop_ = true;
    stop_signal_.notify_all();
  }
  worker_->join();
  worker_.reset();

  while (queue_.size() > 0) {
    auto result = queue_.flush(batch_size_);
    if (result.written == 0) {
      spdlog::error("Audit final flush stopped with {} events pending",
                    result.backlog);
      break;
    }
  }
  spdlog::info("Audit flush scheduler stopped");
}

}  // namespace guildbank::audit
