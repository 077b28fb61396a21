#ifndef MCPLINK_CLIENT_CONNECTION_REGISTRY_H
#define MCPLINK_CLIENT_CONNECTION_REGISTRY_H

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "mcplink/core/compat.h"
#include "mcplink/transport/transport.h"

namespace mcplink {
namespace client {

struct ConnectionInfo {
  std::string id;
  transport::TransportKind kind{transport::TransportKind::Stdio};
  // Command line or URL
  std::string endpoint;
  std::chrono::system_clock::time_point opened_at;
};

/**
 * Live connections by id, each with the transport that owns it.
 *
 * Mutated on the dispatcher thread only; lookups are safe from any thread.
 * The Transport pointers must only be used on the dispatcher thread.
 */
class ConnectionRegistry {
 public:
  ConnectionRegistry() = default;
  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  // False if the id is already registered
  bool add(const ConnectionInfo& info, transport::Transport& transport);
  bool remove(const std::string& connection_id);

  transport::Transport* find(const std::string& connection_id) const;
  optional<ConnectionInfo> info(const std::string& connection_id) const;
  bool contains(const std::string& connection_id) const;

  // Ids of one transport kind, ordered by connection time
  std::vector<std::string> idsOf(transport::TransportKind kind) const;
  std::vector<std::string> allIds() const;
  size_t size() const;

 private:
  struct Entry {
    ConnectionInfo info;
    transport::Transport* transport;
    uint64_t sequence;
  };

  std::vector<std::string> collect(
      const optional<transport::TransportKind>& kind) const;

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
  uint64_t next_sequence_{0};
};

}  // namespace client
}  // namespace mcplink

#endif  // MCPLINK_CLIENT_CONNECTION_REGISTRY_H
