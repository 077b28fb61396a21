#ifndef MCPLINK_CORE_ERROR_H
#define MCPLINK_CORE_ERROR_H

#include <stdexcept>
#include <string>

#include "mcplink/core/compat.h"
#include "mcplink/json/json_bridge.h"

namespace mcplink {

// Failure categories surfaced by the connection manager
enum class ErrorKind {
  ConnectFailure,
  UnknownConnection,
  SendFailure,
  TransportTerminated,
  ProtocolError,
  HttpStatus,
  InvalidResponse,
  RequestTimeout,
  MalformedMessage,
  InvalidArgument,
};

const char* errorKindName(ErrorKind kind);

struct Error {
  ErrorKind kind{ErrorKind::InvalidArgument};
  std::string message;
  // Protocol error code or HTTP status; 0 when not applicable
  int code{0};
  optional<json::JsonValue> data;

  Error() = default;
  Error(ErrorKind k, const std::string& msg, int c = 0)
      : kind(k), message(msg), code(c) {}
  Error(ErrorKind k,
        const std::string& msg,
        int c,
        const json::JsonValue& d)
      : kind(k), message(msg), code(c), data(d) {}
};

template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& err) { return VoidResult(err); }

template <typename T>
Result<T> makeError(ErrorKind kind, const std::string& message) {
  return Result<T>(Error(kind, message));
}

template <typename T>
bool is_error(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const Error* get_error(const Result<T>& result) {
  return get_if<Error>(&result);
}

/**
 * Exception delivered through std::future when an asynchronous operation
 * fails. Carries the structured Error it was built from.
 */
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const Error& error)
      : std::runtime_error(error.message), error_(error) {}

  ErrorKind kind() const { return error_.kind; }
  int code() const { return error_.code; }
  const Error& error() const { return error_; }

 private:
  Error error_;
};

}  // namespace mcplink

#endif  // MCPLINK_CORE_ERROR_H
