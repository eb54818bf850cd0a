#include <regex>

#include <gtest/gtest.h>

#include "loopmux/server/sse_session_manager.h"
#include "../integration/real_io_test_base.h"

using namespace loopmux;
using namespace loopmux::server;

namespace {

TEST(SseFormatTest, EventWithType) {
  EXPECT_EQ(SseSessionManager::formatEvent(3, "/messages?sessionId=a",
                                           "endpoint"),
            "event: endpoint\nid: 3\ndata: /messages?sessionId=a\n\n");
}

TEST(SseFormatTest, EventWithoutType) {
  EXPECT_EQ(SseSessionManager::formatEvent(1, "{}", ""),
            "id: 1\ndata: {}\n\n");
}

TEST(SseFormatTest, MultiLineData) {
  EXPECT_EQ(SseSessionManager::formatEvent(2, "a\nb", ""),
            "id: 2\ndata: a\ndata: b\n\n");
}

TEST(SseFormatTest, GeneratedSessionIdIsUuidV4) {
  std::mt19937 random(42);
  std::regex uuid(
      "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  std::string first = SseSessionManager::generateSessionId(random);
  std::string second = SseSessionManager::generateSessionId(random);

  EXPECT_TRUE(std::regex_match(first, uuid)) << first;
  EXPECT_TRUE(std::regex_match(second, uuid)) << second;
  EXPECT_NE(first, second);
}

class SseSessionManagerTest : public test::RealIoTestBase {
 protected:
  void SetUp() override {
    RealIoTestBase::SetUp();
    sessions_ = std::make_unique<SseSessionManager>(sse_, responses_);
  }

  void TearDown() override {
    executeInDispatcher([this]() {
      for (auto& connection : connections_) {
        connection->close();
      }
      connections_.clear();
    });
    sessions_.reset();
    RealIoTestBase::TearDown();
  }

  // Creates a connection on the dispatcher; returns the peer fd
  int connect(uint64_t id) {
    auto pair = createSocketPair();
    auto socket = std::move(pair.first);
    executeInDispatcher([&]() {
      connections_.push_back(
          std::make_shared<Connection>(id, *dispatcher_, std::move(socket)));
    });
    return pair.second;
  }

  // Handshake plus the head write completing, as the server does it
  void connectSse(const ConnectionSharedPtr& connection,
                  const http::RequestInfo& request) {
    sessions_->handleSseConnect(connection, request);
    connection->setState(ConnectionState::Connected);
  }

  http::RequestInfo sseRequest(
      std::map<std::string, std::string> headers = {}) {
    http::RequestInfo request;
    request.method = "GET";
    request.path = "/mcp";
    request.version = "HTTP/1.1";
    request.headers = std::move(headers);
    return request;
  }

  config::SseConfig sse_;
  http::ResponseBuilder responses_;
  std::unique_ptr<SseSessionManager> sessions_;
  std::vector<ConnectionSharedPtr> connections_;
};

TEST_F(SseSessionManagerTest, ConnectGeneratesSession) {
  connect(1);

  std::string head = executeInDispatcher([this]() {
    return sessions_->handleSseConnect(connections_[0], sseRequest());
  });

  ASSERT_TRUE(sessions_->sessionId().has_value());
  EXPECT_EQ(sessions_->sessionId()->size(), 36u);
  EXPECT_EQ(connections_[0]->sessionId(), sessions_->sessionId());
  EXPECT_NE(head.find("Mcp-Session-Id: " + *sessions_->sessionId()),
            std::string::npos);
  EXPECT_EQ(sessions_->endpointUrl(),
            "/messages?sessionId=" + *sessions_->sessionId());
}

TEST_F(SseSessionManagerTest, AdoptsClientSessionAndResumes) {
  int peer_fd = connect(1);
  test::TestPeer peer(peer_fd, false);

  executeInDispatcher([this]() {
    sessions_->handleSseConnect(
        connections_[0],
        sseRequest({{"mcp-session-id", "given"}, {"last-event-id", "41"}}));
    sessions_->sendEndpointEvent(*connections_[0]);
  });

  EXPECT_EQ(*sessions_->sessionId(), "given");
  EXPECT_EQ(sessions_->eventIdCounter(), 42u);
  ASSERT_TRUE(peer.readUntil("\n\n"));
  EXPECT_EQ(peer.received(),
            "event: endpoint\nid: 42\ndata: /messages?sessionId=given\n\n");
}

TEST_F(SseSessionManagerTest, InvalidLastEventIdIgnored) {
  connect(1);

  executeInDispatcher([this]() {
    sessions_->handleSseConnect(connections_[0],
                                sseRequest({{"last-event-id", "abc"}}));
    sessions_->handleSseConnect(connections_[0],
                                sseRequest({{"last-event-id", "0"}}));
  });

  EXPECT_EQ(sessions_->eventIdCounter(), 0u);
}

TEST_F(SseSessionManagerTest, LowerLastEventIdKeepsCounter) {
  connect(1);
  int peer_fd = connect(2);
  test::TestPeer peer(peer_fd, false);

  executeInDispatcher([this]() {
    sessions_->handleSseConnect(connections_[0],
                                sseRequest({{"last-event-id", "50"}}));
    sessions_->sendEndpointEvent(*connections_[0]);
    sessions_->cleanupClient(1);

    sessions_->handleSseConnect(connections_[1],
                                sseRequest({{"last-event-id", "3"}}));
    sessions_->sendEndpointEvent(*connections_[1]);
  });

  ASSERT_TRUE(peer.readUntil("\n\n"));
  EXPECT_EQ(peer.received().rfind("event: endpoint\nid: 52\n", 0), 0u)
      << peer.received();
  EXPECT_EQ(sessions_->eventIdCounter(), 52u);
}

TEST_F(SseSessionManagerTest, NotifyWaitsForHeadToBeWritten) {
  int peer_fd = connect(1);
  test::TestPeer peer(peer_fd, false);

  bool sent = executeInDispatcher([this]() {
    sessions_->handleSseConnect(connections_[0], sseRequest());
    EXPECT_EQ(sessions_->activeClient(), nullptr);
    return sessions_->notify("tools/changed");
  });

  EXPECT_FALSE(sent);
  EXPECT_TRUE(peer.staysSilent(std::chrono::milliseconds(100)));
  EXPECT_EQ(sessions_->eventIdCounter(), 0u);

  executeInDispatcher([this]() {
    connections_[0]->setState(ConnectionState::Connected);
    EXPECT_EQ(sessions_->activeClient(), connections_[0]);
  });
}

TEST_F(SseSessionManagerTest, NotifyWithoutClient) {
  bool sent = executeInDispatcher(
      [this]() { return sessions_->notify("tools/changed"); });

  EXPECT_FALSE(sent);
  EXPECT_EQ(sessions_->eventIdCounter(), 0u);
}

TEST_F(SseSessionManagerTest, NotifyDeliversNotificationEvent) {
  int peer_fd = connect(1);
  test::TestPeer peer(peer_fd, false);

  bool sent = executeInDispatcher([this]() {
    connectSse(connections_[0], sseRequest());
    return sessions_->notify("resources/updated", {{"uri", "file:///a"}});
  });

  EXPECT_TRUE(sent);
  ASSERT_TRUE(peer.readUntil("\n\n"));
  const std::string& frame = peer.received();
  EXPECT_EQ(frame.rfind("event: notification\nid: 1\ndata: ", 0), 0u);

  std::string data = frame.substr(frame.find("data: ") + 6);
  data = data.substr(0, data.find('\n'));
  json message = json::parse(data);
  EXPECT_EQ(message["jsonrpc"], "2.0");
  EXPECT_EQ(message["method"], "resources/updated");
  EXPECT_EQ(message["params"]["uri"], "file:///a");
  EXPECT_FALSE(message.contains("id"));
}

TEST_F(SseSessionManagerTest, HeartbeatDoesNotConsumeId) {
  int peer_fd = connect(1);
  test::TestPeer peer(peer_fd, false);

  executeInDispatcher([this]() {
    sessions_->handleSseConnect(connections_[0], sseRequest());
    sessions_->sendHeartbeat(*connections_[0]);
  });

  ASSERT_TRUE(peer.readUntil(":\n\n"));
  EXPECT_EQ(peer.received(), ":\n\n");
  EXPECT_EQ(sessions_->eventIdCounter(), 0u);
}

TEST_F(SseSessionManagerTest, NewerClientReplacesOlder) {
  int first_fd = connect(1);
  int second_fd = connect(2);
  test::TestPeer first(first_fd, false);
  test::TestPeer second(second_fd, false);

  executeInDispatcher([this]() {
    connectSse(connections_[0], sseRequest());
    connectSse(connections_[1], sseRequest());
    sessions_->notify("ping");
  });

  EXPECT_TRUE(second.readUntil("\n\n"));
  EXPECT_TRUE(first.staysSilent(std::chrono::milliseconds(100)));
  EXPECT_EQ(executeInDispatcher(
                [this]() { return sessions_->activeClient()->id(); }),
            2u);
}

TEST_F(SseSessionManagerTest, CleanupKeepsCounter) {
  connect(1);
  connect(2);

  executeInDispatcher([this]() {
    sessions_->handleSseConnect(connections_[0],
                                sseRequest({{"last-event-id", "10"}}));
    sessions_->sendEvent(*connections_[0], json{{"a", 1}});

    // Not the active client
    sessions_->cleanupClient(2);
    EXPECT_TRUE(sessions_->sessionId().has_value());

    sessions_->cleanupClient(1);
  });

  EXPECT_FALSE(sessions_->sessionId().has_value());
  EXPECT_EQ(sessions_->eventIdCounter(), 11u);
  EXPECT_EQ(executeInDispatcher(
                [this]() { return sessions_->activeClient(); }),
            nullptr);
}

TEST_F(SseSessionManagerTest, ClosedClientIsNotActive) {
  connect(1);

  executeInDispatcher([this]() {
    sessions_->handleSseConnect(connections_[0], sseRequest());
    connections_[0]->close();
    EXPECT_EQ(sessions_->activeClient(), nullptr);
    EXPECT_FALSE(sessions_->notify("ping"));
  });
}

TEST_F(SseSessionManagerTest, CurrentOrNewSessionIdDoesNotStore) {
  std::string generated = sessions_->currentOrNewSessionId();
  EXPECT_EQ(generated.size(), 36u);
  EXPECT_FALSE(sessions_->sessionId().has_value());

  sessions_->adoptSessionId("kept");
  EXPECT_EQ(sessions_->currentOrNewSessionId(), "kept");
}

}  // namespace
