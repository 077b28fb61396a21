#ifndef MCPLINK_TRANSPORT_REQUEST_CORRELATOR_H
#define MCPLINK_TRANSPORT_REQUEST_CORRELATOR_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

#include "mcplink/core/error.h"
#include "mcplink/event/event_loop.h"
#include "mcplink/json/json_bridge.h"

namespace mcplink {
namespace transport {

using ResultCallback = std::function<void(const json::JsonValue& result)>;
using ErrorCallback = std::function<void(const Error& error)>;

/**
 * One outstanding call. Exactly one of the callbacks runs, exactly once.
 */
struct PendingRequest {
  std::string method;
  ResultCallback on_result;
  ErrorCallback on_error;
  // Optional deadline; destroyed (and so cancelled) with the entry
  event::TimerPtr deadline;
  std::chrono::steady_clock::time_point sent_at{
      std::chrono::steady_clock::now()};
};

/**
 * Matches responses to the calls that produced them.
 *
 * Tables are keyed by connection and created on first registration;
 * a table is dropped as soon as it becomes empty. Continuations are always
 * removed from the table before they run, so they may re-enter the
 * correlator. Not thread-safe: owned and driven by the dispatcher thread.
 */
class RequestCorrelator {
 public:
  RequestCorrelator() = default;
  RequestCorrelator(const RequestCorrelator&) = delete;
  RequestCorrelator& operator=(const RequestCorrelator&) = delete;

  // "r1", "r2", ... per connection
  std::string nextRequestId(const std::string& connection_id);

  // False if (connection_id, request_id) is already pending
  bool registerRequest(const std::string& connection_id,
                       const std::string& request_id,
                       PendingRequest pending);

  // False when nothing was pending under that id; the outcome is dropped
  bool resolve(const std::string& connection_id,
               const std::string& request_id,
               const Result<json::JsonValue>& outcome);

  bool reject(const std::string& connection_id,
              const std::string& request_id,
              const Error& error);

  // Rejects every pending request of the connection and forgets the
  // connection's id counter. Returns the number rejected.
  size_t rejectAll(const std::string& connection_id, const Error& reason);

  bool isPending(const std::string& connection_id,
                 const std::string& request_id) const;
  size_t pendingCount(const std::string& connection_id) const;
  size_t tableCount() const { return tables_.size(); }

 private:
  using Table = std::unordered_map<std::string, PendingRequest>;

  bool take(const std::string& connection_id,
            const std::string& request_id,
            PendingRequest& out);

  std::unordered_map<std::string, Table> tables_;
  std::unordered_map<std::string, uint64_t> counters_;
};

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_REQUEST_CORRELATOR_H
