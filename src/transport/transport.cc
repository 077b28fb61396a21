#include "mcplink/transport/transport.h"

#include <cstdint>
#include <mutex>
#include <random>

#include <fmt/format.h>

namespace mcplink {
namespace transport {

const char* transportKindName(TransportKind kind) {
  switch (kind) {
    case TransportKind::Stdio:
      return "stdio";
    case TransportKind::Sse:
      return "sse";
  }
  return "unknown";
}

std::string generateConnectionId() {
  static std::mutex mutex;
  static std::mt19937_64 engine{std::random_device{}()};

  uint64_t high;
  uint64_t low;
  {
    std::lock_guard<std::mutex> lock(mutex);
    high = engine();
    low = engine();
  }
  high = (high & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  low = (low & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     static_cast<uint32_t>(high >> 32),
                     static_cast<uint32_t>((high >> 16) & 0xffff),
                     static_cast<uint32_t>(high & 0xffff),
                     static_cast<uint32_t>(low >> 48),
                     low & 0xffffffffffffULL);
}

}  // namespace transport
}  // namespace mcplink
