#include "mcplink/client/connection_registry.h"

#include <algorithm>

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Registry
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace client {

bool ConnectionRegistry::add(const ConnectionInfo& info,
                             transport::Transport& transport) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto inserted =
      entries_.emplace(info.id, Entry{info, &transport, next_sequence_});
  if (!inserted.second) {
    MCPLINK_LOG_ERROR("connection {} is already registered", info.id);
    return false;
  }
  ++next_sequence_;
  MCPLINK_LOG_DEBUG("registered {} connection {} ({})",
                    transport::transportKindName(info.kind), info.id,
                    info.endpoint);
  return true;
}

bool ConnectionRegistry::remove(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.erase(connection_id) == 0) {
    return false;
  }
  MCPLINK_LOG_DEBUG("unregistered connection {}", connection_id);
  return true;
}

transport::Transport* ConnectionRegistry::find(
    const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(connection_id);
  return it == entries_.end() ? nullptr : it->second.transport;
}

optional<ConnectionInfo> ConnectionRegistry::info(
    const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(connection_id);
  if (it == entries_.end()) {
    return nullopt;
  }
  return it->second.info;
}

bool ConnectionRegistry::contains(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(connection_id) != 0;
}

std::vector<std::string> ConnectionRegistry::idsOf(
    transport::TransportKind kind) const {
  return collect(kind);
}

std::vector<std::string> ConnectionRegistry::allIds() const {
  return collect(nullopt);
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<std::string> ConnectionRegistry::collect(
    const optional<transport::TransportKind>& kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<const Entry*> matching;
  for (const auto& entry : entries_) {
    if (!kind || entry.second.info.kind == *kind) {
      matching.push_back(&entry.second);
    }
  }
  std::sort(matching.begin(), matching.end(),
            [](const Entry* a, const Entry* b) {
              return a->sequence < b->sequence;
            });

  std::vector<std::string> ids;
  ids.reserve(matching.size());
  for (const Entry* entry : matching) {
    ids.push_back(entry->info.id);
  }
  return ids;
}

}  // namespace client
}  // namespace mcplink
