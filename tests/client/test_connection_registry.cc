#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "mcplink/client/connection_registry.h"

namespace mcplink {
namespace client {
namespace {

using transport::TransportKind;

class NullTransport : public transport::Transport {
 public:
  explicit NullTransport(TransportKind kind) : kind_(kind) {}

  TransportKind kind() const override { return kind_; }
  VoidResult send(const std::string&, const protocol::McpRequest&) override {
    return makeVoidSuccess();
  }
  bool disconnect(const std::string&) override { return true; }

 private:
  TransportKind kind_;
};

ConnectionInfo makeInfo(const std::string& id,
                        TransportKind kind,
                        const std::string& endpoint = "") {
  ConnectionInfo info;
  info.id = id;
  info.kind = kind;
  info.endpoint = endpoint;
  info.opened_at = std::chrono::system_clock::now();
  return info;
}

class ConnectionRegistryTest : public ::testing::Test {
 protected:
  ConnectionRegistry registry_;
  NullTransport stdio_{TransportKind::Stdio};
  NullTransport sse_{TransportKind::Sse};
};

TEST_F(ConnectionRegistryTest, AddFindRemove) {
  EXPECT_TRUE(registry_.add(makeInfo("a", TransportKind::Stdio, "node s.js"),
                            stdio_));
  EXPECT_TRUE(registry_.contains("a"));
  EXPECT_EQ(&stdio_, registry_.find("a"));
  ASSERT_TRUE(registry_.info("a").has_value());
  EXPECT_EQ("node s.js", registry_.info("a")->endpoint);
  EXPECT_EQ(1u, registry_.size());

  EXPECT_TRUE(registry_.remove("a"));
  EXPECT_FALSE(registry_.remove("a"));
  EXPECT_EQ(nullptr, registry_.find("a"));
  EXPECT_FALSE(registry_.info("a").has_value());
  EXPECT_EQ(0u, registry_.size());
}

TEST_F(ConnectionRegistryTest, DuplicateIdIsRefused) {
  EXPECT_TRUE(registry_.add(makeInfo("a", TransportKind::Stdio), stdio_));
  EXPECT_FALSE(registry_.add(makeInfo("a", TransportKind::Sse), sse_));
  EXPECT_EQ(&stdio_, registry_.find("a"));
}

TEST_F(ConnectionRegistryTest, IdsByKindInConnectionOrder) {
  registry_.add(makeInfo("zeta", TransportKind::Stdio), stdio_);
  registry_.add(makeInfo("alpha", TransportKind::Sse), sse_);
  registry_.add(makeInfo("mid", TransportKind::Stdio), stdio_);
  registry_.add(makeInfo("beta", TransportKind::Stdio), stdio_);

  std::vector<std::string> stdio_ids = registry_.idsOf(TransportKind::Stdio);
  ASSERT_EQ(3u, stdio_ids.size());
  EXPECT_EQ("zeta", stdio_ids[0]);
  EXPECT_EQ("mid", stdio_ids[1]);
  EXPECT_EQ("beta", stdio_ids[2]);

  std::vector<std::string> sse_ids = registry_.idsOf(TransportKind::Sse);
  ASSERT_EQ(1u, sse_ids.size());
  EXPECT_EQ("alpha", sse_ids[0]);

  registry_.remove("mid");
  EXPECT_EQ(3u, registry_.allIds().size());
  EXPECT_EQ("zeta", registry_.allIds().front());
}

TEST_F(ConnectionRegistryTest, LookupsFromOtherThreads) {
  for (int i = 0; i < 50; ++i) {
    registry_.add(makeInfo("c" + std::to_string(i), TransportKind::Stdio),
                  stdio_);
  }

  std::atomic<bool> stop{false};
  std::atomic<int> bad_reads{0};
  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&]() {
      while (!stop) {
        auto ids = registry_.idsOf(TransportKind::Stdio);
        if (ids.size() > 100) {
          bad_reads++;
        }
        registry_.contains("c1");
      }
    });
  }
  for (int i = 50; i < 100; ++i) {
    registry_.add(makeInfo("c" + std::to_string(i), TransportKind::Stdio),
                  stdio_);
    registry_.remove("c" + std::to_string(i - 50));
  }
  stop = true;
  for (auto& reader : readers) {
    reader.join();
  }
  EXPECT_EQ(0, bad_reads);
  EXPECT_EQ(50u, registry_.size());
}

}  // namespace
}  // namespace client
}  // namespace mcplink
