#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mcplink/event/event_loop.h"
#include "mcplink/transport/sse_transport.h"
#include "mocks/transport_mocks.h"

namespace mcplink {
namespace transport {
namespace {

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Eq;
using ::testing::NiceMock;
using ::testing::SaveArg;

const char* const kUrl = "http://localhost:8080/mcp";

class SseTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ =
        event::createLibeventDispatcherFactory()->createDispatcher("sse");
    dispatcher_->run(event::RunType::NonBlock);
    config_.connection_token = "secret";
    config_.sse_retry = 500ms;
    config_.sse_max_reconnect_attempts = 4;
    transport_ = std::make_unique<SseTransport>(
        *dispatcher_, http_, streams_, correlator_, lifecycle_, config_);
  }

  void TearDown() override { transport_.reset(); }

  void startConnect() {
    SseConnectParams params;
    params.url = kUrl;
    params.headers["X-Client"] = "tests";
    transport_->connect(
        params, [this](const InboundMessage& m) { inbound_.push_back(m); },
        [this](Result<std::string> outcome) {
          outcomes_.push_back(std::move(outcome));
        });
  }

  std::string connect() {
    startConnect();
    streams_.last()->open();
    EXPECT_EQ(1u, outcomes_.size());
    if (outcomes_.empty() || is_error(outcomes_.back())) {
      return std::string();
    }
    return get<std::string>(outcomes_.back());
  }

  // Registers a pending call and sends it
  void call(const std::string& id, const std::string& request_id) {
    PendingRequest pending;
    pending.method = "callTool";
    pending.on_result = [this](const json::JsonValue& v) {
      results_.push_back(v);
    };
    pending.on_error = [this](const Error& e) { errors_.push_back(e); };
    correlator_.registerRequest(id, request_id, std::move(pending));
    json::JsonValue args = json::JsonObjectBuilder().add("a", 1).build();
    ASSERT_FALSE(is_error(transport_->send(
        id, protocol::makeCallToolRequest(request_id, "sum", args))));
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

  event::DispatcherPtr dispatcher_;
  config::ClientConfig config_;
  test::FakeHttpClient http_;
  test::FakeEventStreamFactory streams_;
  RequestCorrelator correlator_;
  NiceMock<test::MockConnectionLifecycle> lifecycle_;
  std::unique_ptr<SseTransport> transport_;

  std::vector<Result<std::string>> outcomes_;
  std::vector<InboundMessage> inbound_;
  std::vector<json::JsonValue> results_;
  std::vector<Error> errors_;
};

TEST_F(SseTransportTest, ConnectCompletesWhenStreamOpens) {
  std::string endpoint;
  EXPECT_CALL(lifecycle_, onConnectionOpened(_, TransportKind::Sse, _, _))
      .WillOnce(SaveArg<2>(&endpoint));

  startConnect();
  EXPECT_TRUE(outcomes_.empty());
  EXPECT_EQ(1u, transport_->connectingCount());

  auto stream = streams_.last();
  EXPECT_EQ(kUrl, stream->options.url);
  EXPECT_EQ("Bearer secret", stream->options.headers.at("Authorization"));
  EXPECT_EQ("tests", stream->options.headers.at("X-Client"));
  EXPECT_EQ(500, stream->options.retry.count());
  EXPECT_EQ(4u, stream->options.max_reconnect_attempts);

  stream->open();
  ASSERT_EQ(1u, outcomes_.size());
  ASSERT_FALSE(is_error(outcomes_[0]));
  EXPECT_EQ(36u, get<std::string>(outcomes_[0]).size());
  EXPECT_EQ(kUrl, endpoint);
  EXPECT_EQ(0u, transport_->connectingCount());
  EXPECT_EQ(1u, transport_->connectionCount());
}

TEST_F(SseTransportTest, ErrorBeforeOpenFailsConnect) {
  EXPECT_CALL(lifecycle_, onConnectionOpened(_, _, _, _)).Times(0);
  startConnect();
  streams_.last()->error("Connection refused", http::ReadyState::Closed);

  ASSERT_EQ(1u, outcomes_.size());
  ASSERT_TRUE(is_error(outcomes_[0]));
  EXPECT_EQ(ErrorKind::ConnectFailure, get_error(outcomes_[0])->kind);
  EXPECT_EQ(
      "Failed to establish SSE connection to http://localhost:8080/mcp: "
      "Connection refused",
      get_error(outcomes_[0])->message);
  EXPECT_TRUE(streams_.last()->closed);
  EXPECT_EQ(0u, transport_->connectingCount());
}

TEST_F(SseTransportTest, ConnectTimesOut) {
  config_.connect_timeout = 20ms;
  startConnect();
  ASSERT_TRUE(pumpUntil([&]() { return !outcomes_.empty(); }));
  ASSERT_TRUE(is_error(outcomes_[0]));
  EXPECT_EQ(
      "Failed to establish SSE connection to http://localhost:8080/mcp: timed "
      "out after 20ms",
      get_error(outcomes_[0])->message);

  EXPECT_TRUE(streams_.last()->closed);
  EXPECT_EQ(0u, transport_->connectingCount());
  EXPECT_EQ(0u, transport_->connectionCount());
}

TEST_F(SseTransportTest, PostCarriesRequest) {
  std::string id = connect();
  call(id, "r1");

  ASSERT_EQ(1u, http_.calls.size());
  const http::HttpRequest& post = http_.calls[0].request;
  EXPECT_EQ(kUrl, post.url);
  EXPECT_EQ(http::HttpMethod::Post, post.method);
  EXPECT_EQ(
      R"({"id":"r1","method":"callTool","params":{"toolName":"sum","arguments":{"a":1}}})",
      post.body);
  EXPECT_EQ("application/json", post.headers.at("Content-Type"));
  EXPECT_EQ("application/json", post.headers.at("Accept"));
  EXPECT_EQ("Bearer secret", post.headers.at("Authorization"));
  EXPECT_EQ("tests", post.headers.at("X-Client"));
}

TEST_F(SseTransportTest, PostResponseResolvesRequest) {
  std::string id = connect();
  call(id, "r1");
  http_.respond(0, 200, R"({"id":"r1","result":{"sum":5}})");

  ASSERT_EQ(1u, results_.size());
  EXPECT_EQ(5, results_[0].get("sum").getInt());
  EXPECT_FALSE(correlator_.isPending(id, "r1"));
}

TEST_F(SseTransportTest, HttpErrorStatus) {
  std::string id = connect();
  call(id, "r1");
  http_.respond(0, 500, "upstream exploded");

  ASSERT_EQ(1u, errors_.size());
  EXPECT_EQ(ErrorKind::HttpStatus, errors_[0].kind);
  EXPECT_EQ("HTTP error from MCP server: 500 Internal Server Error",
            errors_[0].message);
  EXPECT_EQ(500, errors_[0].code);
  ASSERT_TRUE(errors_[0].data.has_value());
  EXPECT_EQ("upstream exploded", errors_[0].data->getString());
}

TEST_F(SseTransportTest, ServerReasonPhraseIsPreferred) {
  std::string id = connect();
  call(id, "r1");
  http_.respond(0, 503, "", "Busy");
  ASSERT_EQ(1u, errors_.size());
  EXPECT_EQ("HTTP error from MCP server: 503 Busy", errors_[0].message);
  EXPECT_FALSE(errors_[0].data.has_value());
}

TEST_F(SseTransportTest, ErrorBodyIsProtocolError) {
  std::string id = connect();
  call(id, "r1");
  http_.respond(0, 200,
                R"({"id":"r1","error":{"code":-32602,"message":"bad args"}})");
  ASSERT_EQ(1u, errors_.size());
  EXPECT_EQ(ErrorKind::ProtocolError, errors_[0].kind);
  EXPECT_EQ(R"(MCP error: {"code":-32602,"message":"bad args"})",
            errors_[0].message);
  ASSERT_TRUE(errors_[0].data.has_value());
  EXPECT_EQ("bad args", errors_[0].data->get("message").getString());
  EXPECT_EQ(-32602, errors_[0].code);
}

TEST_F(SseTransportTest, InvalidJsonBody) {
  std::string id = connect();
  call(id, "r1");
  call(id, "r2");
  http_.respond(0, 200, "<html>");
  http_.respond(1, 200, "[1,2]");

  ASSERT_EQ(2u, errors_.size());
  EXPECT_EQ(ErrorKind::InvalidResponse, errors_[0].kind);
  EXPECT_EQ(0u, errors_[0].message.find("Invalid JSON in MCP response: "));
  EXPECT_EQ(ErrorKind::InvalidResponse, errors_[1].kind);
}

TEST_F(SseTransportTest, TransportFailureIsSendFailure) {
  std::string id = connect();
  call(id, "r1");
  http_.failTransport(0, "Couldn't connect to server");
  ASSERT_EQ(1u, errors_.size());
  EXPECT_EQ(ErrorKind::SendFailure, errors_[0].kind);
  EXPECT_EQ("HTTP request failed: Couldn't connect to server",
            errors_[0].message);
}

TEST_F(SseTransportTest, PushMessagesGoToHandler) {
  std::string id = connect();
  call(id, "r1");

  auto stream = streams_.last();
  stream->message(R"({"id":"r1","result":"from push"})");
  stream->message("keepalive");
  stream->message("");

  ASSERT_EQ(2u, inbound_.size());
  ASSERT_TRUE(inbound_[0].message.has_value());
  EXPECT_EQ("from push", inbound_[0].message->get("result").getString());
  EXPECT_FALSE(inbound_[1].message.has_value());
  EXPECT_EQ("keepalive", inbound_[1].raw);
  // The push channel never resolves calls
  EXPECT_TRUE(correlator_.isPending(id, "r1"));
  EXPECT_TRUE(results_.empty());
}

TEST_F(SseTransportTest, StreamLossTerminatesConnection) {
  std::string id = connect();
  Error reason;
  EXPECT_CALL(lifecycle_, onConnectionTerminated(Eq(id), _))
      .WillOnce(SaveArg<1>(&reason));

  streams_.last()->error("server went away", http::ReadyState::Closed);
  EXPECT_EQ(ErrorKind::TransportTerminated, reason.kind);
  EXPECT_EQ("SSE connection closed: server went away", reason.message);
  EXPECT_EQ(0u, transport_->connectionCount());
}

TEST_F(SseTransportTest, TransientErrorKeepsConnection) {
  std::string id = connect();
  EXPECT_CALL(lifecycle_, onConnectionTerminated(_, _)).Times(0);
  streams_.last()->error("reconnecting", http::ReadyState::Connecting);
  EXPECT_EQ(1u, transport_->connectionCount());
}

TEST_F(SseTransportTest, DisconnectClosesStream) {
  std::string id = connect();
  EXPECT_CALL(lifecycle_, onConnectionTerminated(_, _)).Times(0);
  EXPECT_TRUE(transport_->disconnect(id));
  EXPECT_TRUE(streams_.last()->closed);
  EXPECT_FALSE(transport_->disconnect(id));

  auto sent = transport_->send(id, protocol::makeListToolsRequest("r1"));
  ASSERT_TRUE(is_error(sent));
  EXPECT_EQ(ErrorKind::UnknownConnection, get_error(sent)->kind);
  EXPECT_TRUE(http_.calls.empty());
}

TEST_F(SseTransportTest, DestroyingTransportFailsPendingConnect) {
  startConnect();
  EXPECT_EQ(1u, transport_->connectingCount());
  transport_.reset();
  EXPECT_TRUE(streams_.last()->closed);
  ASSERT_EQ(1u, outcomes_.size());
  ASSERT_TRUE(is_error(outcomes_[0]));
  EXPECT_EQ(ErrorKind::ConnectFailure, get_error(outcomes_[0])->kind);
  EXPECT_EQ(std::string("Failed to establish SSE connection to ") + kUrl +
                ": connection closed by client",
            get_error(outcomes_[0])->message);
}

TEST_F(SseTransportTest, CancelPendingConnectsLeavesOpenConnections) {
  std::string open_id = connect();
  startConnect();
  startConnect();
  auto late = streams_.last();
  EXPECT_CALL(lifecycle_, onConnectionOpened(_, _, _, _)).Times(0);

  EXPECT_EQ(2u, transport_->cancelPendingConnects());
  EXPECT_EQ(0u, transport_->connectingCount());
  EXPECT_EQ(1u, transport_->connectionCount());
  ASSERT_EQ(3u, outcomes_.size());
  for (size_t i = 1; i < outcomes_.size(); ++i) {
    ASSERT_TRUE(is_error(outcomes_[i]));
    EXPECT_EQ(ErrorKind::ConnectFailure, get_error(outcomes_[i])->kind);
  }
  EXPECT_TRUE(late->closed);

  // A stream opening after cancellation registers nothing
  late->open();
  EXPECT_EQ(3u, outcomes_.size());
  EXPECT_EQ(1u, transport_->connectionCount());
  EXPECT_EQ(0u, transport_->cancelPendingConnects());
}

TEST_F(SseTransportTest, ResponseAfterTransportDestroyedIsDropped) {
  std::string id = connect();
  call(id, "r1");
  transport_.reset();
  http_.respond(0, 200, R"({"id":"r1","result":1})");
  EXPECT_TRUE(results_.empty());
}

TEST(HttpOutcomeTest, EmptyBodyIsInvalid) {
  http::HttpResponse response;
  response.status_code = 204;
  auto outcome = httpOutcome(response);
  ASSERT_TRUE(is_error(outcome));
  EXPECT_EQ(ErrorKind::InvalidResponse, get_error(outcome)->kind);
}

}  // namespace
}  // namespace transport
}  // namespace mcplink
