#pragma once

#include <guildbank/schema/audit_event.hpp>
#include <guildbank/storage/rocksdb/storage.hpp>
#include <functional>
#include <vector>

namespace guildbank::audit {

using audit_batch_t = std::vector<guildbank::schema::audit_event_t>;

/// Durable destination for audit batches. Returns true only when the whole
/// batch was written; a sink may also throw, which counts as failure.
using audit_sink_t = std::function<bool(const audit_batch_t&)>;

/// BLAKE3 digest of the encoded event.
guildbank::schema::hash32_t natural_key(
    const guildbank::schema::audit_event_t& event);

/// Sink writing each batch in one RocksDB write batch under the natural key
/// of every event, so duplicate deliveries overwrite rather than append.
audit_sink_t make_storage_sink(const guildbank::storage::rocksdb_storage_t& storage);

std::vector<guildbank::schema::audit_event_t> stored_events(
    const guildbank::storage::rocksdb_storage_t& storage);

}  // namespace guildbank::audit
