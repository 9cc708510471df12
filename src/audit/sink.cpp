#include <spdlog/spdlog.h>
#include <guildbank/audit/sink.hpp>
#include <guildbank/blake3/hash.hpp>
#include <guildbank/schema/encoding/scale/encoder.hpp>
#include <guildbank/schema/key/keys.hpp>
#include <algorithm>

using namespace guildbank::schema;

namespace {

using encoder_t = guildbank::schema::encoding::scale_encoder_t;

}  // namespace

namespace guildbank::audit {

hash32_t natural_key(const audit_event_t& event) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(event);
  return guildbank::blake3::hash(make_bytes_view(encoded));
}

audit_sink_t make_storage_sink(
    const guildbank::storage::rocksdb_storage_t& storage) {
  return [&storage](const audit_batch_t& batch) {
    auto encoder = encoder_t{};
    auto entries = std::vector<guildbank::storage::key_value_entry_t>{};
    entries.reserve(batch.size());
    for (const auto& event : batch) {
      entries.emplace_back(key::make_audit_key(natural_key(event)),
                           encoder.encode(event));
    }
    try {
      storage.write_entries(entries);
    } catch (const guildbank::storage::storage_unavailable& ex) {
      spdlog::warn("Audit batch of {} events not persisted: {}", batch.size(),
                   ex.what());
      return false;
    }
    return true;
  };
}

std::vector<audit_event_t> stored_events(
    const guildbank::storage::rocksdb_storage_t& storage) {
  auto encoder = encoder_t{};
  auto events = std::vector<audit_event_t>{};
  for (const auto& [entry_key, value] :
       storage.list_by_prefix(make_bytes_view(key::make_audit_prefix()))) {
    events.push_back(
        encoder.decode<audit_event_t>(bytes_view_t{value.data(), value.size()}));
  }
  std::ranges::sort(events, [](const auto& lhs, const auto& rhs) {
    return lhs.event_id < rhs.event_id;
  });
  return events;
}

}  // namespace guildbank::audit
