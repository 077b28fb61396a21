#include "mcplink/core/error.h"

namespace mcplink {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ConnectFailure:
      return "ConnectFailure";
    case ErrorKind::UnknownConnection:
      return "UnknownConnection";
    case ErrorKind::SendFailure:
      return "SendFailure";
    case ErrorKind::TransportTerminated:
      return "TransportTerminated";
    case ErrorKind::ProtocolError:
      return "ProtocolError";
    case ErrorKind::HttpStatus:
      return "HttpStatus";
    case ErrorKind::InvalidResponse:
      return "InvalidResponse";
    case ErrorKind::RequestTimeout:
      return "RequestTimeout";
    case ErrorKind::MalformedMessage:
      return "MalformedMessage";
    case ErrorKind::InvalidArgument:
      return "InvalidArgument";
  }
  return "Unknown";
}

}  // namespace mcplink
