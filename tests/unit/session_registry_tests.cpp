#include "fake_transport.hpp"
#include "toolbridge/session/session_registry.hpp"
#include "toolbridge/utils/error.hpp"
#include <gtest/gtest.h>
#include <map>

using namespace toolbridge;
using namespace toolbridge::session;
using namespace toolbridge::types;
using namespace std::chrono_literals;
using json = nlohmann::json;
using test::FakeTransport;

namespace {

json initializeResult() {
  return {{"protocolVersion", "2024-11-05"},
          {"capabilities", {{"tools", json::object()}}},
          {"serverInfo", {{"name", "FakeServer"}, {"version", "1.0"}}}};
}

json tools(std::initializer_list<std::string> names) {
  json list = json::array();
  for (const auto &name : names) {
    list.push_back({{"name", name}});
  }
  return list;
}

FakeTransport::Responder withoutInitializeReply() {
  auto base = test::toolServer();
  return [base](const JSONRPCRequest &request)
             -> std::optional<JSONRPCMessage> {
    if (request.method == "initialize") {
      return std::nullopt;
    }
    return base(request);
  };
}

} // namespace

class SessionRegistryTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.session.handshake_timeout = 2s;
    config_.session.request_timeout = 2s;
    config_.auto_connect_delay = 0ms;
    default_responder_ = test::toolServer(tools({"mock_echo"}));
  }

  std::unique_ptr<SessionRegistry> makeRegistry() {
    auto factory = [this](const std::string &server_id,
                          const ServerDescriptor &)
        -> std::shared_ptr<transport::Transport> {
      std::lock_guard<std::mutex> lock(mutex_);
      auto responder = responders_.count(server_id) ? responders_[server_id]
                                                    : default_responder_;
      auto transport = std::make_shared<FakeTransport>(responder);
      if (connect_errors_.count(server_id)) {
        transport->connect_error = connect_errors_.at(server_id);
      }
      transports_[server_id].push_back(transport);
      launch_order_.push_back(server_id);
      return transport;
    };
    return std::make_unique<SessionRegistry>(config_, factory);
  }

  ServerDescriptor descriptor(const std::string &name) {
    ServerDescriptor result;
    result.name = name;
    result.command = "mock_tool_server";
    return result;
  }

  std::size_t transportCount(const std::string &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transports_.count(id) ? transports_[id].size() : 0;
  }

  std::shared_ptr<FakeTransport> transport(const std::string &id,
                                           std::size_t index = 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transports_.at(id).at(index);
  }

  bool initializeSent(const std::string &id) {
    return transportCount(id) == 1 &&
           transport(id)->requests("initialize").size() == 1;
  }

  void answerInitialize(const std::string &id) {
    auto request = transport(id)->requests("initialize").at(0);
    transport(id)->deliver(
        JSONRPCResponse{.id = request.id, .result = initializeResult()});
  }

  SessionRegistry::Config config_;
  FakeTransport::Responder default_responder_;
  std::map<std::string, FakeTransport::Responder> responders_;
  std::vector<std::string> launch_order_;
  std::map<std::string, TransportException> connect_errors_;

  std::mutex mutex_;
  std::map<std::string, std::vector<std::shared_ptr<FakeTransport>>>
      transports_;
};

TEST_F(SessionRegistryTest, UnknownServerIdIsRejected) {
  auto registry = makeRegistry();

  EXPECT_THROW(registry->listTools("nope"), UnknownServerException);
  EXPECT_THROW(registry->callTool("nope", "mock_echo", json::object()),
               UnknownServerException);
  EXPECT_THROW(registry->ping("nope"), UnknownServerException);
  EXPECT_THROW(registry->session("nope"), UnknownServerException);
  EXPECT_TRUE(registry->listConnectedServers().empty());
  EXPECT_FALSE(registry->cachedTools("nope").has_value());
}

TEST_F(SessionRegistryTest, ConnectListAndCall) {
  auto registry = makeRegistry();

  auto init = registry->connect("a", descriptor("A")).get();
  EXPECT_EQ(init.server_info.name, "FakeServer");
  EXPECT_EQ(registry->listConnectedServers(), std::vector<std::string>{"a"});

  auto listed = registry->listTools("a").get();
  ASSERT_EQ(listed.size(), 1u);
  ASSERT_TRUE(registry->cachedTools("a").has_value());
  EXPECT_EQ(registry->cachedTools("a")->size(), 1u);

  auto result =
      registry->callTool("a", "mock_echo", json{{"message", "x"}}).get();
  EXPECT_FALSE(result.is_error);
  EXPECT_GE(registry->ping("a").get().count(), 0);
}

TEST_F(SessionRegistryTest, ConnectWhenReadyStartsNothing) {
  auto registry = makeRegistry();
  registry->connect("a", descriptor("A")).get();

  auto again = registry->connect("a", descriptor("A")).get();

  EXPECT_EQ(again.protocol_version, "2024-11-05");
  EXPECT_EQ(transportCount("a"), 1u);
}

TEST_F(SessionRegistryTest, ConcurrentConnectSharesInFlightAttempt) {
  responders_["a"] = withoutInitializeReply();
  auto registry = makeRegistry();

  auto first = registry->connect("a", descriptor("A"));
  ASSERT_TRUE(test::waitUntil([this] { return initializeSent("a"); }));
  auto second = registry->connect("a", descriptor("A"));

  answerInitialize("a");

  EXPECT_EQ(first.get().server_info.name, "FakeServer");
  EXPECT_EQ(second.get().server_info.name, "FakeServer");
  EXPECT_EQ(transportCount("a"), 1u);
}

TEST_F(SessionRegistryTest, ConcurrentConnectRejectedByPolicy) {
  config_.connect_policy = SessionRegistry::ConnectPolicy::Reject;
  responders_["a"] = withoutInitializeReply();
  auto registry = makeRegistry();

  auto first = registry->connect("a", descriptor("A"));
  ASSERT_TRUE(test::waitUntil([this] { return initializeSent("a"); }));

  EXPECT_THROW(registry->connect("a", descriptor("A")),
               AlreadyConnectingException);

  answerInitialize("a");
  EXPECT_NO_THROW(first.get());
  EXPECT_EQ(transportCount("a"), 1u);
}

TEST_F(SessionRegistryTest, HandshakeTimeoutOverride) {
  responders_["a"] = withoutInitializeReply();
  auto registry = makeRegistry();

  auto handle = registry->connect("a", descriptor("A"), 50ms);

  EXPECT_THROW(handle.get(), TimeoutException);
  EXPECT_EQ(registry->session("a")->state(), SessionState::Error);
}

TEST_F(SessionRegistryTest, FailedConnectStaysInspectableAndCanRetry) {
  responders_["a"] = test::toolServer(tools({}), "1999-01-01");
  auto registry = makeRegistry();

  EXPECT_THROW(registry->connect("a", descriptor("A")).get(),
               UnsupportedProtocolException);

  auto failed = registry->session("a");
  EXPECT_EQ(failed->state(), SessionState::Error);
  ASSERT_TRUE(failed->lastError().has_value());
  EXPECT_EQ(failed->lastError()->code,
            static_cast<int>(ErrorCode::UnsupportedProtocol));
  EXPECT_TRUE(registry->listConnectedServers().empty());

  {
    std::lock_guard<std::mutex> lock(mutex_);
    responders_.erase("a");
  }
  EXPECT_NO_THROW(registry->connect("a", descriptor("A")).get());
  EXPECT_EQ(transportCount("a"), 2u);
  EXPECT_EQ(registry->session("a")->state(), SessionState::Ready);
}

TEST_F(SessionRegistryTest, DisconnectForgetsIdAndIsIdempotent) {
  auto registry = makeRegistry();
  registry->connect("a", descriptor("A")).get();
  registry->listTools("a").get();

  registry->disconnect("a");
  registry->disconnect("a");
  registry->disconnect("never-registered");

  EXPECT_THROW(registry->listTools("a"), UnknownServerException);
  EXPECT_FALSE(registry->cachedTools("a").has_value());
  EXPECT_EQ(transport("a")->disconnect_calls.load(), 1);
}

TEST_F(SessionRegistryTest, DisconnectAbortsInFlightConnect) {
  responders_["a"] = withoutInitializeReply();
  auto registry = makeRegistry();

  auto handle = registry->connect("a", descriptor("A"));
  ASSERT_TRUE(test::waitUntil([this] { return initializeSent("a"); }));

  registry->disconnect("a");

  EXPECT_THROW(handle.get(), ConnectionClosedException);
  EXPECT_THROW(registry->session("a"), UnknownServerException);
}

TEST_F(SessionRegistryTest, ToolLookupsFollowServerIdOrder) {
  responders_["b"] = test::toolServer(tools({"shared", "only_b"}));
  responders_["a"] = test::toolServer(tools({"shared"}));
  auto registry = makeRegistry();
  registry->connect("b", descriptor("B")).get();
  registry->connect("a", descriptor("A")).get();
  registry->listTools("b").get();
  registry->listTools("a").get();

  auto all = registry->allTools();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].server_id, "a");
  EXPECT_EQ(all[0].tool.name, "shared");
  EXPECT_EQ(all[1].server_id, "b");

  EXPECT_EQ(registry->findServerForTool("shared"), "a");
  EXPECT_EQ(registry->findServerForTool("only_b"), "b");
  EXPECT_FALSE(registry->findServerForTool("missing").has_value());
}

TEST_F(SessionRegistryTest, AutoConnectRunsSequentiallyAndSkipsOptOuts) {
  connect_errors_.emplace(
      "broken", TransportException(ErrorCode::CommandNotFound,
                                   "Command not found: nothing"));
  auto registry = makeRegistry();

  std::map<std::string, ServerDescriptor> servers = {
      {"a", descriptor("A")},
      {"broken", descriptor("Broken")},
      {"manual", descriptor("Manual")}};
  servers["manual"].auto_connect = false;

  auto outcomes = registry->autoConnect(servers);

  ASSERT_EQ(outcomes.size(), 2u);
  EXPECT_TRUE(outcomes["a"].connected);
  EXPECT_FALSE(outcomes["broken"].connected);
  ASSERT_TRUE(outcomes["broken"].error.has_value());
  EXPECT_EQ(outcomes["broken"].error->code,
            static_cast<int>(ErrorCode::CommandNotFound));
  EXPECT_EQ(outcomes.count("manual"), 0u);
  EXPECT_EQ(transportCount("manual"), 0u);
  EXPECT_EQ(registry->listConnectedServers(), std::vector<std::string>{"a"});
}

TEST_F(SessionRegistryTest, AutoConnectLaunchesInIdOrder) {
  auto registry = makeRegistry();
  std::map<std::string, ServerDescriptor> servers = {
      {"zeta", descriptor("Zeta")},
      {"alpha", descriptor("Alpha")},
      {"mid", descriptor("Mid")}};

  registry->autoConnect(servers);

  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(launch_order_,
            (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

TEST_F(SessionRegistryTest, ForwardsNotificationsAndErrorsWithServerId) {
  auto registry = makeRegistry();
  std::vector<std::pair<std::string, std::string>> notifications;
  std::vector<std::pair<std::string, int>> errors;
  registry->setNotificationHandler(
      [&notifications](const std::string &id,
                       const JSONRPCNotification &notification) {
        notifications.emplace_back(id, notification.method);
      });
  registry->setErrorHandler(
      [&errors](const std::string &id, const ToolBridgeException &error) {
        errors.emplace_back(id, error.code());
      });
  registry->connect("a", descriptor("A")).get();

  transport("a")->deliver(JSONRPCNotification{
      .method = "notifications/message", .params = json{{"level", "info"}}});
  transport("a")->crash();

  ASSERT_EQ(notifications.size(), 1u);
  EXPECT_EQ(notifications[0].first, "a");
  EXPECT_EQ(notifications[0].second, "notifications/message");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].first, "a");
  EXPECT_EQ(errors[0].second, static_cast<int>(ErrorCode::ProcessCrashed));
  EXPECT_TRUE(registry->listConnectedServers().empty());
}

TEST_F(SessionRegistryTest, ReconnectAfterCrash) {
  auto registry = makeRegistry();
  registry->connect("a", descriptor("A")).get();
  transport("a")->crash();
  EXPECT_EQ(registry->session("a")->state(), SessionState::Disconnected);

  registry->connect("a", descriptor("A")).get();

  EXPECT_EQ(transportCount("a"), 2u);
  EXPECT_EQ(registry->listConnectedServers(), std::vector<std::string>{"a"});
}

TEST_F(SessionRegistryTest, DestructionDisconnectsEverything) {
  {
    auto registry = makeRegistry();
    registry->connect("a", descriptor("A")).get();
    registry->connect("b", descriptor("B")).get();
    registry->disconnectAll();
    EXPECT_TRUE(registry->listConnectedServers().empty());
    registry->connect("c", descriptor("C")).get();
  }

  EXPECT_EQ(transport("a")->disconnect_calls.load(), 1);
  EXPECT_EQ(transport("b")->disconnect_calls.load(), 1);
  EXPECT_EQ(transport("c")->disconnect_calls.load(), 1);
}
