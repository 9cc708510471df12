#pragma once

#include <guildbank/audit/sink.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string_view>

namespace guildbank::audit {

/// Called after flush releases its lock, so it may flush again.
using alert_handler_t = std::function<void(std::string_view message)>;

struct flush_result final {
  std::size_t attempted{};
  std::size_t written{};
  std::size_t requeued{};
  // Buffer length once the flush finished.
  std::size_t backlog{};
  bool alerted{false};
};

/// In-memory staging buffer in front of an audit sink. The sink runs without
/// the buffer lock; a rejected batch goes back to the head of the buffer.
class queue final {
 public:
  explicit queue(audit_sink_t sink, alert_handler_t alert_handler = {});

  queue(const queue&) = delete;
  queue& operator=(const queue&) = delete;

  /// Returns the assigned event id.
  uint64_t enqueue(guildbank::schema::audit_event_t event);

  /// Hand up to max_batch_size of the oldest events to the sink. Alerts when
  /// the buffer held more than one batch when the flush started.
  flush_result flush(std::size_t max_batch_size);

  std::size_t size() const;

 private:
  audit_sink_t sink_;
  alert_handler_t alert_handler_;
  mutable std::mutex buffer_mutex_;
  std::deque<guildbank::schema::audit_event_t> buffer_;
  uint64_t next_event_id_{1};
  std::mutex flush_mutex_;
};

}  // namespace guildbank::audit
