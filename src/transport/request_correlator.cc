#include "mcplink/transport/request_correlator.h"

#include <vector>

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Correlator
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace transport {

std::string RequestCorrelator::nextRequestId(
    const std::string& connection_id) {
  uint64_t& counter = counters_[connection_id];
  std::string id;
  do {
    id = "r" + std::to_string(++counter);
  } while (isPending(connection_id, id));
  return id;
}

bool RequestCorrelator::registerRequest(const std::string& connection_id,
                                        const std::string& request_id,
                                        PendingRequest pending) {
  Table& table = tables_[connection_id];
  auto inserted = table.emplace(request_id, std::move(pending));
  if (!inserted.second) {
    MCPLINK_LOG_WARNING("request {} already pending on connection {}",
                        request_id, connection_id);
    return false;
  }
  return true;
}

bool RequestCorrelator::take(const std::string& connection_id,
                             const std::string& request_id,
                             PendingRequest& out) {
  auto table_it = tables_.find(connection_id);
  if (table_it == tables_.end()) {
    return false;
  }
  auto it = table_it->second.find(request_id);
  if (it == table_it->second.end()) {
    return false;
  }
  out = std::move(it->second);
  table_it->second.erase(it);
  if (table_it->second.empty()) {
    tables_.erase(table_it);
  }
  return true;
}

bool RequestCorrelator::resolve(const std::string& connection_id,
                                const std::string& request_id,
                                const Result<json::JsonValue>& outcome) {
  PendingRequest pending;
  if (!take(connection_id, request_id, pending)) {
    MCPLINK_LOG_DEBUG("dropping response {} on connection {}: not pending",
                      request_id, connection_id);
    return false;
  }
  pending.deadline.reset();

  if (const Error* error = get_error(outcome)) {
    if (pending.on_error) {
      pending.on_error(*error);
    }
  } else if (pending.on_result) {
    pending.on_result(get<json::JsonValue>(outcome));
  }
  return true;
}

bool RequestCorrelator::reject(const std::string& connection_id,
                               const std::string& request_id,
                               const Error& error) {
  return resolve(connection_id, request_id, Result<json::JsonValue>(error));
}

size_t RequestCorrelator::rejectAll(const std::string& connection_id,
                                    const Error& reason) {
  counters_.erase(connection_id);

  auto table_it = tables_.find(connection_id);
  if (table_it == tables_.end()) {
    return 0;
  }
  Table table = std::move(table_it->second);
  tables_.erase(table_it);

  MCPLINK_LOG_DEBUG("rejecting {} pending request(s) on connection {}: {}",
                    table.size(), connection_id, reason.message);
  for (auto& entry : table) {
    entry.second.deadline.reset();
    if (entry.second.on_error) {
      entry.second.on_error(reason);
    }
  }
  return table.size();
}

bool RequestCorrelator::isPending(const std::string& connection_id,
                                  const std::string& request_id) const {
  auto table_it = tables_.find(connection_id);
  return table_it != tables_.end() && table_it->second.count(request_id) > 0;
}

size_t RequestCorrelator::pendingCount(const std::string& connection_id) const {
  auto table_it = tables_.find(connection_id);
  return table_it == tables_.end() ? 0 : table_it->second.size();
}

}  // namespace transport
}  // namespace mcplink
