#include <spdlog/spdlog.h>
#include <guildbank/audit/queue.hpp>
#include <algorithm>
#include <cstddef>
#include <exception>
#include <iterator>
#include <mutex>
#include <string>
#include <utility>

namespace guildbank::audit {

queue::queue(audit_sink_t sink, alert_handler_t alert_handler)
    : sink_{std::move(sink)}, alert_handler_{std::move(alert_handler)} {}

uint64_t queue::enqueue(guildbank::schema::audit_event_t event) {
  auto lock = std::scoped_lock{buffer_mutex_};
  event.event_id = next_event_id_++;
  spdlog::trace("Queued {} audit event {}",
                guildbank::schema::kind_name(event.kind), event.event_id);
  buffer_.push_back(std::move(event));
  return buffer_.back().event_id;
}

flush_result queue::flush(const std::size_t max_batch_size) {
  auto flush_lock = std::unique_lock{flush_mutex_};
  auto result = flush_result{};

  auto batch = audit_batch_t{};
  auto backlog_at_start = std::size_t{0};
  {
    auto lock = std::scoped_lock{buffer_mutex_};
    backlog_at_start = buffer_.size();
    auto count = std::min(max_batch_size, buffer_.size());
    auto end = std::next(std::begin(buffer_), static_cast<std::ptrdiff_t>(count));
    batch.assign(std::make_move_iterator(std::begin(buffer_)),
                 std::make_move_iterator(end));
    buffer_.erase(std::begin(buffer_), end);
  }
  result.attempted = batch.size();

  if (!batch.empty()) {
    auto written = false;
    try {
      written = sink_(batch);
    } catch (const std::exception& ex) {
      spdlog::error("Audit sink threw: {}", ex.what());
    }

    if (written) {
      result.written = batch.size();
      spdlog::debug("Flushed {} audit events", batch.size());
    } else {
      result.requeued = batch.size();
      auto lock = std::scoped_lock{buffer_mutex_};
      buffer_.insert(std::begin(buffer_), std::make_move_iterator(batch.begin()),
                     std::make_move_iterator(batch.end()));
      spdlog::warn("Audit flush failed, requeued {} events", result.requeued);
    }
  }

  result.backlog = size();
  flush_lock.unlock();

  // Unlocked: the handler may call flush().
  if (backlog_at_start > max_batch_size) {
    auto message = "Audit backlog of " + std::to_string(backlog_at_start) +
                   " events exceeds flush batch size " +
                   std::to_string(max_batch_size);
    spdlog::warn("{}", message);
    if (alert_handler_) {
      alert_handler_(message);
    }
    result.alerted = true;
  }

  return result;
}

std::size_t queue::size() const {
  auto lock = std::scoped_lock{buffer_mutex_};
  return buffer_.size();
}

}  // namespace guildbank::audit
