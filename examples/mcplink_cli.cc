/**
 * @file mcplink_cli.cc
 * @brief Command-line driver for the MCP connection manager
 *
 * Connects to one MCP server, either a child process speaking
 * line-delimited JSON on stdio or an HTTP endpoint with an SSE push
 * stream, lists its tools or calls one of them, and prints the result.
 *
 * USAGE:
 *   mcplink-cli --stdio "node server.js" --list-tools
 *   mcplink-cli --sse http://localhost:8080/mcp --call sum \
 *       --args '{"a":2,"b":3}' --output result.json --overwrite
 */

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mcplink/client/connection_manager.h"
#include "mcplink/client/result_writer.h"
#include "mcplink/config/client_config.h"
#include "mcplink/event/event_loop.h"
#include "mcplink/http/event_stream.h"
#include "mcplink/http/http_client.h"
#include "mcplink/logging/log_sink.h"
#include "mcplink/logging/logger_registry.h"
#include "mcplink/process/child_process.h"

using namespace mcplink;

namespace {

struct CliOptions {
  std::string stdio_command;
  std::string sse_url;
  bool list_tools = false;
  std::string tool_name;
  std::string tool_args = "{}";
  std::string output_path;
  bool overwrite = false;
  optional<std::string> config_path;
  optional<std::chrono::milliseconds> timeout;
  std::string log_file;
};

void printUsage(const char* program) {
  std::cerr << "USAGE: " << program
            << " (--stdio <command> | --sse <url>) (--list-tools | --call "
               "<tool> [--args <json>]) [options]\n\n";
  std::cerr << "OPTIONS:\n";
  std::cerr << "  --stdio <command>    Start an MCP server process, e.g. "
               "\"node server.js\"\n";
  std::cerr << "  --sse <url>          Connect to an MCP server over HTTP/SSE\n";
  std::cerr << "  --list-tools         Print the server's tools\n";
  std::cerr << "  --call <tool>        Call a tool\n";
  std::cerr << "  --args <json>        Tool arguments as a JSON object "
               "(default: {})\n";
  std::cerr << "  --output <file>      Write the result to a file\n";
  std::cerr << "  --overwrite          Replace an existing output file\n";
  std::cerr << "  --config <yaml>      Client configuration file\n";
  std::cerr << "  --timeout-ms <ms>    Per-call deadline (0 disables)\n";
  std::cerr << "  --log-file <path>    Append logs to a file instead of stderr\n";
  std::cerr << "  --help               Show this message\n";
}

// Splits a command line on whitespace; single and double quotes group
std::vector<std::string> splitCommand(const std::string& line) {
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  char quote = 0;
  for (char c : line) {
    if (quote) {
      if (c == quote) {
        quote = 0;
      } else {
        current += c;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
      in_word = true;
    } else if (c == ' ' || c == '\t') {
      if (in_word) {
        words.push_back(current);
        current.clear();
        in_word = false;
      }
    } else {
      current += c;
      in_word = true;
    }
  }
  if (in_word) {
    words.push_back(current);
  }
  return words;
}

bool parseArguments(int argc, char* argv[], CliOptions& options) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      exit(0);
    } else if (arg == "--stdio" && i + 1 < argc) {
      options.stdio_command = argv[++i];
    } else if (arg == "--sse" && i + 1 < argc) {
      options.sse_url = argv[++i];
    } else if (arg == "--list-tools") {
      options.list_tools = true;
    } else if (arg == "--call" && i + 1 < argc) {
      options.tool_name = argv[++i];
    } else if (arg == "--args" && i + 1 < argc) {
      options.tool_args = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      options.output_path = argv[++i];
    } else if (arg == "--overwrite") {
      options.overwrite = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = std::string(argv[++i]);
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      options.timeout = std::chrono::milliseconds(std::atoll(argv[++i]));
    } else if (arg == "--log-file" && i + 1 < argc) {
      options.log_file = argv[++i];
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      return false;
    }
  }

  if (options.stdio_command.empty() == options.sse_url.empty()) {
    std::cerr << "Exactly one of --stdio or --sse is required" << std::endl;
    return false;
  }
  if (options.list_tools == !options.tool_name.empty()) {
    std::cerr << "Exactly one of --list-tools or --call is required"
              << std::endl;
    return false;
  }
  return true;
}

json::JsonValue toolsToJson(const std::vector<protocol::ToolDefinition>& tools) {
  json::JsonArrayBuilder list;
  for (const auto& tool : tools) {
    list.add(json::JsonObjectBuilder()
                 .add("name", tool.name)
                 .add("description", tool.description)
                 .add("parametersSchema", tool.parameters_schema)
                 .build());
  }
  return list.build();
}

int runCommand(client::ConnectionManager& manager, const CliOptions& options) {
  client::ConnectParams params;
  if (!options.stdio_command.empty()) {
    std::vector<std::string> words = splitCommand(options.stdio_command);
    if (words.empty()) {
      std::cerr << "Empty --stdio command" << std::endl;
      return 2;
    }
    const std::string command = words.front();
    words.erase(words.begin());
    params = client::ConnectParams::forStdio(command, words);
  } else {
    params = client::ConnectParams::forSse(options.sse_url);
  }
  params.on_message = [](const transport::InboundMessage& message) {
    std::cerr << "[" << message.connection_id << "] " << message.raw
              << std::endl;
  };

  client::CallOptions call_options;
  call_options.timeout = options.timeout;

  try {
    const std::string id = manager.connect(params).get();

    json::JsonValue result;
    if (options.list_tools) {
      result = toolsToJson(manager.listTools(id, call_options).get());
    } else {
      json::JsonValue arguments = json::JsonValue::parse(options.tool_args);
      result =
          manager.callTool(id, options.tool_name, arguments, call_options)
              .get();
    }

    if (!options.output_path.empty()) {
      VoidResult written = client::writeResultToFile(
          options.output_path, result, options.overwrite);
      if (const Error* err = get_error(written)) {
        std::cerr << "Error: " << err->message << std::endl;
        return 1;
      }
      std::cout << "Output written to " << options.output_path << std::endl;
    } else {
      std::cout << client::renderResult(result) << std::endl;
    }
  } catch (const ConnectionError& e) {
    std::cerr << "Error (" << errorKindName(e.kind()) << "): " << e.what()
              << std::endl;
    return 1;
  } catch (const json::JsonException& e) {
    std::cerr << "Invalid --args: " << e.what() << std::endl;
    return 2;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions options;
  if (!parseArguments(argc, argv, options)) {
    printUsage(argv[0]);
    return 2;
  }

  auto loaded = config::ConfigLoader().load(options.config_path);
  if (const Error* err = get_error(loaded)) {
    std::cerr << "Configuration error: " << err->message << std::endl;
    return 2;
  }
  const config::ClientConfig cfg = get<config::ClientConfig>(loaded);
  logging::LoggerRegistry::instance().setGlobalLevel(cfg.log_level);
  if (!options.log_file.empty()) {
    try {
      logging::LoggerRegistry::instance().setSink(
          std::make_shared<logging::FileSink>(options.log_file));
    } catch (const std::runtime_error& e) {
      std::cerr << "Cannot open log file: " << e.what() << std::endl;
      return 2;
    }
  }

  auto factory = event::createLibeventDispatcherFactory();
  auto dispatcher = factory->createDispatcher("mcplink-cli");

  process::PosixProcessLauncher launcher(*dispatcher);
  http::CurlHttpClient http_client(*dispatcher, cfg);
  http::CurlEventStreamFactory streams(*dispatcher, cfg);

  int exit_code = 0;
  {
    client::ConnectionManager manager(*dispatcher, cfg, launcher, http_client,
                                      streams);
    manager.setConnectionClosedObserver(
        [](const std::string& id, const Error& reason) {
          std::cerr << "Connection " << id << " closed: " << reason.message
                    << std::endl;
        });

    std::thread loop(
        [&dispatcher]() { dispatcher->run(event::RunType::RunUntilExit); });

    exit_code = runCommand(manager, options);
    manager.closeAllConnections();

    dispatcher->exit();
    loop.join();
  }
  return exit_code;
}
