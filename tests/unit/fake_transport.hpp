#ifndef TOOLBRIDGE_TESTS_FAKE_TRANSPORT_HPP_
#define TOOLBRIDGE_TESTS_FAKE_TRANSPORT_HPP_

#include "toolbridge/transport/process_transport.hpp"
#include "toolbridge/transport/transport.hpp"
#include "toolbridge/utils/error.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <gmock/gmock.h>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace toolbridge {
namespace test {

/**
 * @brief In-memory transport driven by a scripted peer
 *
 * Each request handed to send() is passed to the responder; a returned
 * message is delivered back through the message callback before send()
 * returns. Requests the responder leaves unanswered can be answered later
 * with deliver().
 */
class FakeTransport : public transport::Transport {
public:
  using Responder = std::function<std::optional<types::JSONRPCMessage>(
      const types::JSONRPCRequest &)>;

  explicit FakeTransport(Responder responder = {})
      : responder_(std::move(responder)) {}

  void send(const types::JSONRPCMessage &message,
            std::function<void(const std::error_code &)> callback) override {
    std::error_code ec = send(message, std::chrono::milliseconds(0));
    if (callback) {
      callback(ec);
    }
    if (!ec) {
      respond(message);
    }
  }

  std::error_code send(const types::JSONRPCMessage &message,
                       std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
      return make_error_code(transport::ProcessTransportError::Disconnected);
    }
    sent_.push_back(message);
    return {};
  }

  void setMessageCallback(MessageCallback callback) override {
    std::lock_guard<std::mutex> lock(mutex_);
    message_callback_ = std::move(callback);
  }

  void setErrorCallback(ErrorCallback callback) override {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
  }

  void setCloseCallback(CloseCallback callback) override {
    std::lock_guard<std::mutex> lock(mutex_);
    close_callback_ = std::move(callback);
  }

  void connect() override {
    ++connect_calls;
    if (connect_error) {
      throw *connect_error;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = true;
  }

  void disconnect() override {
    ++disconnect_calls;
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
  }

  bool isConnected() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
  }

  /// Deliver a message as if the peer had written it
  void deliver(const types::JSONRPCMessage &message) {
    MessageCallback callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      callback = message_callback_;
    }
    if (callback) {
      callback(message);
    }
  }

  /// Simulate the peer process exiting
  void crash() {
    CloseCallback callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      connected_ = false;
      callback = close_callback_;
    }
    if (callback) {
      callback();
    }
  }

  void raiseError(std::error_code ec, const std::string &detail) {
    ErrorCallback callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      callback = error_callback_;
    }
    if (callback) {
      callback(ec, detail);
    }
  }

  std::vector<types::JSONRPCMessage> sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  /// Requests sent so far with the given method
  std::vector<types::JSONRPCRequest>
  requests(const std::string &method) const {
    std::vector<types::JSONRPCRequest> result;
    for (const auto &message : sent()) {
      const auto *request = std::get_if<types::JSONRPCRequest>(&message);
      if (request && request->method == method) {
        result.push_back(*request);
      }
    }
    return result;
  }

  std::vector<types::JSONRPCNotification> notifications() const {
    std::vector<types::JSONRPCNotification> result;
    for (const auto &message : sent()) {
      if (const auto *notification =
              std::get_if<types::JSONRPCNotification>(&message)) {
        result.push_back(*notification);
      }
    }
    return result;
  }

  std::optional<TransportException> connect_error;
  std::atomic<int> connect_calls{0};
  std::atomic<int> disconnect_calls{0};

private:
  void respond(const types::JSONRPCMessage &message) {
    const auto *request = std::get_if<types::JSONRPCRequest>(&message);
    if (!request || !responder_) {
      return;
    }
    if (auto reply = responder_(*request)) {
      deliver(*reply);
    }
  }

  Responder responder_;
  std::vector<types::JSONRPCMessage> sent_;
  bool connected_ = false;
  mutable std::mutex mutex_;

  MessageCallback message_callback_;
  ErrorCallback error_callback_;
  CloseCallback close_callback_;
};

/**
 * @brief A well-behaved tool server
 *
 * Answers initialize with the given version and capabilities, lists the
 * given tools on a single page, echoes tools/call arguments back as text
 * and answers ping.
 */
inline FakeTransport::Responder
toolServer(nlohmann::json tools = nlohmann::json::array(),
           std::string protocol_version = "2024-11-05",
           nlohmann::json capabilities = {{"tools", nlohmann::json::object()}}) {
  return [tools, protocol_version, capabilities](
             const types::JSONRPCRequest &request)
             -> std::optional<types::JSONRPCMessage> {
    if (request.method == "initialize") {
      return types::JSONRPCResponse{
          .id = request.id,
          .result = {{"protocolVersion", protocol_version},
                     {"capabilities", capabilities},
                     {"serverInfo",
                      {{"name", "FakeServer"}, {"version", "1.0"}}}}};
    }
    if (request.method == "tools/list") {
      return types::JSONRPCResponse{.id = request.id,
                                    .result = {{"tools", tools}}};
    }
    if (request.method == "tools/call") {
      nlohmann::json params = request.params.value_or(nlohmann::json::object());
      return types::JSONRPCResponse{
          .id = request.id,
          .result = {{"content",
                      nlohmann::json::array(
                          {{{"type", "text"},
                            {"text", params.value("arguments",
                                                  nlohmann::json::object())
                                         .dump()}}})}}};
    }
    if (request.method == "ping") {
      return types::JSONRPCResponse{.id = request.id,
                                    .result = nlohmann::json::object()};
    }
    return createErrorResponse(request.id, types::ErrorCode::MethodNotFound,
                               "Method not found");
  };
}

/**
 * @brief Poll a condition until it holds or the timeout expires
 */
template <typename Predicate>
bool waitUntil(Predicate predicate,
               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

/**
 * @brief Transport mock for checking interactions
 */
class MockTransport : public transport::Transport {
public:
  MOCK_METHOD(void, send,
              (const types::JSONRPCMessage &,
               std::function<void(const std::error_code &)>),
              (override));
  MOCK_METHOD(std::error_code, send,
              (const types::JSONRPCMessage &, std::chrono::milliseconds),
              (override));
  MOCK_METHOD(void, setMessageCallback, (MessageCallback), (override));
  MOCK_METHOD(void, setErrorCallback, (ErrorCallback), (override));
  MOCK_METHOD(void, setCloseCallback, (CloseCallback), (override));
  MOCK_METHOD(void, connect, (), (override));
  MOCK_METHOD(void, disconnect, (), (override));
  MOCK_METHOD(bool, isConnected, (), (const, override));
};

} // namespace test
} // namespace toolbridge

#endif // TOOLBRIDGE_TESTS_FAKE_TRANSPORT_HPP_
