#include "mcplink/client/result_writer.h"

#include <filesystem>
#include <fstream>
#include <system_error>

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Client
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace client {

namespace fs = std::filesystem;

std::string renderResult(const json::JsonValue& result) {
  if (result.isString()) {
    return result.getString();
  }
  return result.toString(true);
}

VoidResult writeResultToFile(const std::string& path,
                             const json::JsonValue& result,
                             bool overwrite) {
  if (path.empty()) {
    return makeVoidError(
        Error(ErrorKind::InvalidArgument, "output path must not be empty"));
  }

  const fs::path target(path);
  std::error_code ec;
  if (fs::exists(target, ec)) {
    if (!overwrite) {
      return makeVoidError(Error(
          ErrorKind::InvalidArgument,
          "File already exists: " + path + ". Use overwrite to replace it."));
    }
    if (fs::is_directory(target, ec)) {
      return makeVoidError(
          Error(ErrorKind::InvalidArgument, path + " is a directory"));
    }
  }

  const fs::path parent = target.parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return makeVoidError(Error(ErrorKind::InvalidArgument,
                                 "cannot create directory " + parent.string() +
                                     ": " + ec.message()));
    }
  }

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    return makeVoidError(
        Error(ErrorKind::InvalidArgument, "cannot open " + path + " for writing"));
  }
  const std::string text = renderResult(result);
  out << text;
  out.close();
  if (!out) {
    return makeVoidError(
        Error(ErrorKind::InvalidArgument, "failed writing " + path));
  }
  MCPLINK_LOG_INFO("wrote {} bytes to {}", text.size(), path);
  return makeVoidSuccess();
}

}  // namespace client
}  // namespace mcplink
