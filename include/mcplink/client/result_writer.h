#ifndef MCPLINK_CLIENT_RESULT_WRITER_H
#define MCPLINK_CLIENT_RESULT_WRITER_H

#include <string>

#include "mcplink/core/error.h"
#include "mcplink/json/json_bridge.h"

namespace mcplink {
namespace client {

// Text written for a tool result: strings verbatim, anything else as
// JSON indented by two spaces
std::string renderResult(const json::JsonValue& result);

/**
 * Saves a tool result to a file, creating missing parent directories.
 * An existing file is only replaced when overwrite is set.
 */
VoidResult writeResultToFile(const std::string& path,
                             const json::JsonValue& result,
                             bool overwrite);

}  // namespace client
}  // namespace mcplink

#endif  // MCPLINK_CLIENT_RESULT_WRITER_H
