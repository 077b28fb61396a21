#include <signal.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "mcplink/client/connection_manager.h"
#include "mcplink/event/event_loop.h"
#include "mocks/transport_mocks.h"

namespace mcplink {
namespace client {
namespace {

using namespace std::chrono_literals;
using json::JsonObjectBuilder;
using json::JsonValue;

template <typename T>
bool isReady(const std::future<T>& future) {
  return future.wait_for(0ms) == std::future_status::ready;
}

// Runs future.get() and returns the ConnectionError it throws
template <typename T>
Error failureOf(std::future<T>& future) {
  try {
    future.get();
  } catch (const ConnectionError& e) {
    return e.error();
  }
  ADD_FAILURE() << "future did not fail";
  return Error();
}

class ConnectionManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ =
        event::createLibeventDispatcherFactory()->createDispatcher("client");
    // The test thread becomes the dispatcher thread
    dispatcher_->run(event::RunType::NonBlock);
    manager_ = std::make_unique<ConnectionManager>(*dispatcher_, config_,
                                                   launcher_, http_, streams_);
  }

  void TearDown() override { manager_.reset(); }

  std::string connectStdio() {
    ConnectParams params = ConnectParams::forStdio("node", {"server.js"});
    params.on_message = [this](const transport::InboundMessage& m) {
      inbound_.push_back(m);
    };
    auto future = manager_->connect(params);
    EXPECT_TRUE(isReady(future));
    return future.get();
  }

  template <typename Pred>
  bool pumpUntil(Pred pred, std::chrono::milliseconds limit = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      dispatcher_->run(event::RunType::NonBlock);
      std::this_thread::sleep_for(1ms);
    }
    return true;
  }

  static JsonValue sumArgs(int a, int b) {
    return JsonObjectBuilder().add("a", a).add("b", b).build();
  }

  event::DispatcherPtr dispatcher_;
  config::ClientConfig config_;
  test::FakeProcessLauncher launcher_;
  test::FakeHttpClient http_;
  test::FakeEventStreamFactory streams_;
  std::unique_ptr<ConnectionManager> manager_;
  std::vector<transport::InboundMessage> inbound_;
};

TEST_F(ConnectionManagerTest, ConnectStdioRegistersConnection) {
  std::string id = connectStdio();
  EXPECT_FALSE(id.empty());

  std::vector<std::string> ids = manager_->getActiveStdioConnectionIds();
  ASSERT_EQ(1u, ids.size());
  EXPECT_EQ(id, ids[0]);
  EXPECT_TRUE(manager_->getActiveSseConnectionIds().empty());

  auto info = manager_->registry().info(id);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ("node server.js", info->endpoint);
}

TEST_F(ConnectionManagerTest, SpawnFailureFailsConnect) {
  launcher_.fail_next = true;
  auto future = manager_->connect(ConnectParams::forStdio("no-such-server"));
  ASSERT_TRUE(isReady(future));
  EXPECT_EQ(ErrorKind::ConnectFailure, failureOf(future).kind);
  EXPECT_TRUE(manager_->getActiveStdioConnectionIds().empty());
}

TEST_F(ConnectionManagerTest, CallToolWritesRequestAndResolves) {
  std::string id = connectStdio();
  auto future = manager_->callTool(id, "sum", sumArgs(2, 3));

  auto record = launcher_.last();
  ASSERT_EQ(1u, record->writes.size());
  EXPECT_EQ(
      "{\"id\":\"r1\",\"method\":\"callTool\",\"params\":{\"toolName\":\"sum\","
      "\"arguments\":{\"a\":2,\"b\":3}}}\n",
      record->writes[0]);
  EXPECT_FALSE(isReady(future));

  record->emitStdout("{\"id\":\"r1\",\"result\":5}\n");
  ASSERT_TRUE(isReady(future));
  EXPECT_EQ(5, future.get().getInt());
  EXPECT_EQ(0u, manager_->correlator().pendingCount(id));
}

TEST_F(ConnectionManagerTest, ResponsesInAnyOrderReachTheirCalls) {
  std::string id = connectStdio();
  auto first = manager_->callTool(id, "sum", sumArgs(1, 1));
  auto second = manager_->callTool(id, "sum", sumArgs(2, 2));
  auto third = manager_->callTool(id, "sum", sumArgs(3, 3));

  auto record = launcher_.last();
  record->emitStdout("{\"id\":\"r3\",\"result\":6}\n{\"id\":\"r1\",");
  record->emitStdout("\"result\":2}\n{\"id\":\"r2\",\"result\":4}\n");

  EXPECT_EQ(2, first.get().getInt());
  EXPECT_EQ(4, second.get().getInt());
  EXPECT_EQ(6, third.get().getInt());
}

TEST_F(ConnectionManagerTest, ProtocolErrorFailsCall) {
  std::string id = connectStdio();
  auto future = manager_->callTool(id, "divide", sumArgs(1, 0));
  launcher_.last()->emitStdout(
      "{\"id\":\"r1\",\"error\":{\"code\":-32000,\"message\":\"division by "
      "zero\"}}\n");

  Error error = failureOf(future);
  EXPECT_EQ(ErrorKind::ProtocolError, error.kind);
  EXPECT_EQ(R"(MCP error: {"code":-32000,"message":"division by zero"})",
            error.message);
  EXPECT_EQ(-32000, error.code);
}

TEST_F(ConnectionManagerTest, ListToolsParsesDefinitions) {
  std::string id = connectStdio();
  auto future = manager_->listTools(id);
  EXPECT_EQ("{\"id\":\"r1\",\"method\":\"listTools\"}\n",
            launcher_.last()->writes[0]);

  launcher_.last()->emitStdout(
      "{\"id\":\"r1\",\"result\":[{\"name\":\"sum\",\"description\":\"Adds "
      "numbers\",\"parametersSchema\":{\"type\":\"object\"}}]}\n");
  auto tools = future.get();
  ASSERT_EQ(1u, tools.size());
  EXPECT_EQ("sum", tools[0].name);
  EXPECT_EQ("Adds numbers", tools[0].description);
}

TEST_F(ConnectionManagerTest, MalformedToolListFails) {
  std::string id = connectStdio();
  auto future = manager_->listTools(id);
  launcher_.last()->emitStdout("{\"id\":\"r1\",\"result\":42}\n");
  EXPECT_EQ(ErrorKind::InvalidResponse, failureOf(future).kind);
}

TEST_F(ConnectionManagerTest, ServerExitRejectsEveryPendingCall) {
  std::string id = connectStdio();
  std::vector<std::pair<std::string, Error>> closed;
  manager_->setConnectionClosedObserver(
      [&](const std::string& cid, const Error& e) {
        closed.emplace_back(cid, e);
      });

  std::vector<std::future<JsonValue>> calls;
  for (int i = 0; i < 3; ++i) {
    calls.push_back(manager_->callTool(id, "slow", JsonValue::object()));
  }
  launcher_.last()->exit(1);

  for (auto& call : calls) {
    ASSERT_TRUE(isReady(call));
    Error error = failureOf(call);
    EXPECT_EQ(ErrorKind::TransportTerminated, error.kind);
    EXPECT_EQ("Connection closed before response (code: 1, signal: null)",
              error.message);
  }
  EXPECT_TRUE(manager_->getActiveStdioConnectionIds().empty());
  EXPECT_EQ(0u, manager_->correlator().tableCount());
  ASSERT_EQ(1u, closed.size());
  EXPECT_EQ(id, closed[0].first);

  auto after = manager_->callTool(id, "slow", JsonValue::object());
  EXPECT_EQ(ErrorKind::UnknownConnection, failureOf(after).kind);
}

TEST_F(ConnectionManagerTest, DisconnectIsIdempotent) {
  std::string id = connectStdio();
  auto pending = manager_->callTool(id, "slow", JsonValue::object());
  auto record = launcher_.last();

  auto first = manager_->disconnect(id);
  EXPECT_TRUE(first.get());
  auto second = manager_->disconnect(id);
  EXPECT_FALSE(second.get());

  Error error = failureOf(pending);
  EXPECT_EQ(ErrorKind::TransportTerminated, error.kind);
  EXPECT_EQ("Connection closed by client", error.message);

  EXPECT_TRUE(record->stdin_closed);
  ASSERT_FALSE(record->signals.empty());
  EXPECT_EQ(SIGTERM, record->signals[0]);
  EXPECT_TRUE(manager_->getActiveStdioConnectionIds().empty());
}

TEST_F(ConnectionManagerTest, NoiseOnStdoutIsTolerated) {
  std::string id = connectStdio();
  auto future = manager_->callTool(id, "sum", sumArgs(2, 3));
  launcher_.last()->emitStdout(
      "Server ready on stdio\n{\"method\":\"log\",\"params\":{}}\n"
      "{\"id\":\"r1\",\"result\":5}\n");

  EXPECT_EQ(5, future.get().getInt());
  ASSERT_EQ(2u, inbound_.size());
  EXPECT_EQ("Server ready on stdio", inbound_[0].raw);
  EXPECT_FALSE(inbound_[0].message.has_value());
  EXPECT_EQ("log", inbound_[1].message->get("method").getString());
}

TEST_F(ConnectionManagerTest, UnknownConnectionSendsNothing) {
  auto call = manager_->callTool("missing", "sum", sumArgs(1, 2));
  auto list = manager_->listTools("missing");

  ASSERT_TRUE(isReady(call));
  Error error = failureOf(call);
  EXPECT_EQ(ErrorKind::UnknownConnection, error.kind);
  EXPECT_EQ("No connection found with ID missing", error.message);
  EXPECT_EQ(ErrorKind::UnknownConnection, failureOf(list).kind);

  EXPECT_TRUE(launcher_.records.empty());
  EXPECT_TRUE(http_.calls.empty());
  EXPECT_FALSE(manager_->disconnect("missing").get());
}

TEST_F(ConnectionManagerTest, CallTimesOut) {
  std::string id = connectStdio();
  CallOptions options;
  options.timeout = 20ms;
  auto future = manager_->callTool(id, "sleep", JsonValue::object(), options);

  ASSERT_TRUE(pumpUntil([&]() { return isReady(future); }));
  Error error = failureOf(future);
  EXPECT_EQ(ErrorKind::RequestTimeout, error.kind);
  EXPECT_EQ("Request callTool timed out after 20ms", error.message);

  // A late answer is not a response to anything any more
  launcher_.last()->emitStdout("{\"id\":\"r1\",\"result\":1}\n");
  ASSERT_EQ(1u, inbound_.size());
  EXPECT_EQ(1u, manager_->getActiveStdioConnectionIds().size());
}

TEST_F(ConnectionManagerTest, AnsweredCallDoesNotTimeOut) {
  std::string id = connectStdio();
  CallOptions options;
  options.timeout = 10ms;
  auto future = manager_->callTool(id, "sum", sumArgs(1, 2), options);
  launcher_.last()->emitStdout("{\"id\":\"r1\",\"result\":3}\n");

  std::this_thread::sleep_for(30ms);
  dispatcher_->run(event::RunType::NonBlock);
  EXPECT_EQ(3, future.get().getInt());
}

TEST_F(ConnectionManagerTest, SseConnectAndCall) {
  auto connecting = manager_->connect(ConnectParams::forSse("http://mcp.local/sse"));
  EXPECT_FALSE(isReady(connecting));
  streams_.last()->open();
  ASSERT_TRUE(isReady(connecting));
  std::string id = connecting.get();

  std::vector<std::string> ids = manager_->getActiveSseConnectionIds();
  ASSERT_EQ(1u, ids.size());
  EXPECT_EQ(id, ids[0]);

  auto future = manager_->callTool(id, "sum", sumArgs(2, 3));
  ASSERT_EQ(1u, http_.calls.size());
  EXPECT_EQ("http://mcp.local/sse", http_.calls[0].request.url);
  http_.respond(0, 200, "{\"id\":\"r1\",\"result\":5}");
  EXPECT_EQ(5, future.get().getInt());
}

TEST_F(ConnectionManagerTest, SseConnectFailure) {
  auto connecting = manager_->connect(ConnectParams::forSse("http://down.local/"));
  streams_.last()->error("Couldn't connect to server", http::ReadyState::Closed);
  Error error = failureOf(connecting);
  EXPECT_EQ(ErrorKind::ConnectFailure, error.kind);
  EXPECT_EQ(
      "Failed to establish SSE connection to http://down.local/: Couldn't "
      "connect to server",
      error.message);
  EXPECT_TRUE(manager_->getActiveSseConnectionIds().empty());
}

TEST_F(ConnectionManagerTest, CloseAllConnections) {
  std::string a = connectStdio();
  std::string b = connectStdio();
  auto sse = manager_->connect(ConnectParams::forSse("http://mcp.local/sse"));
  streams_.last()->open();
  std::string c = sse.get();

  auto pending = manager_->callTool(a, "slow", JsonValue::object());
  manager_->closeAllConnections();

  EXPECT_TRUE(manager_->getActiveStdioConnectionIds().empty());
  EXPECT_TRUE(manager_->getActiveSseConnectionIds().empty());
  EXPECT_EQ(0u, manager_->registry().size());
  EXPECT_FALSE(manager_->registry().contains(b));
  EXPECT_FALSE(manager_->registry().contains(c));
  EXPECT_TRUE(streams_.last()->closed);
  EXPECT_EQ("Connection closed by client", failureOf(pending).message);

  // Nothing left to close
  manager_->closeAllConnections();
}

TEST_F(ConnectionManagerTest, CloseAllFailsSseConnectInProgress) {
  auto connecting =
      manager_->connect(ConnectParams::forSse("http://slow.local/sse"));
  auto stream = streams_.last();
  manager_->closeAllConnections();

  EXPECT_TRUE(stream->closed);
  stream->open();
  Error error = failureOf(connecting);
  EXPECT_EQ(ErrorKind::ConnectFailure, error.kind);
  EXPECT_EQ(
      "Failed to establish SSE connection to http://slow.local/sse: "
      "connection closed by client",
      error.message);
  EXPECT_TRUE(manager_->getActiveSseConnectionIds().empty());
  EXPECT_EQ(0u, manager_->registry().size());
}

TEST_F(ConnectionManagerTest, DestroyingManagerFailsSseConnectInProgress) {
  auto connecting =
      manager_->connect(ConnectParams::forSse("http://slow.local/sse"));
  manager_.reset();
  EXPECT_EQ(ErrorKind::ConnectFailure, failureOf(connecting).kind);
}

TEST_F(ConnectionManagerTest, CallsFromOtherThreadsRunOnDispatcher) {
  std::string id = connectStdio();

  std::future<JsonValue> future;
  std::thread caller(
      [&]() { future = manager_->callTool(id, "sum", sumArgs(4, 5)); });
  caller.join();

  auto record = launcher_.last();
  EXPECT_TRUE(record->writes.empty());
  ASSERT_TRUE(pumpUntil([&]() { return !record->writes.empty(); }));
  record->emitStdout("{\"id\":\"r1\",\"result\":9}\n");
  EXPECT_EQ(9, future.get().getInt());

  std::atomic<bool> closed{false};
  std::thread closer([&]() {
    manager_->closeAllConnections();
    closed = true;
  });
  EXPECT_TRUE(pumpUntil([&]() { return closed.load(); }));
  closer.join();
  EXPECT_TRUE(manager_->getActiveStdioConnectionIds().empty());
}

}  // namespace
}  // namespace client
}  // namespace mcplink
