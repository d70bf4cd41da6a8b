#include "toolbridge/session/server_session.hpp"
#include "toolbridge/utils/json_utils.hpp"
#include "toolbridge/utils/logging.hpp"
#include <algorithm>
#include <cctype>

namespace toolbridge {
namespace session {

namespace {
std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}
} // namespace

TransportFactory
makeProcessTransportFactory(transport::ProcessTransport::Config config) {
  return [config](const std::string &server_id,
                  const types::ServerDescriptor &descriptor)
             -> std::shared_ptr<transport::Transport> {
    auto transport_config = config;
    transport_config.server_id = server_id;
    return std::make_shared<transport::ProcessTransport>(descriptor,
                                                         transport_config);
  };
}

ServerSession::ServerSession(std::string server_id,
                             types::ServerDescriptor descriptor,
                             std::shared_ptr<ToolCache> cache, Config config,
                             TransportFactory factory)
    : id_(std::move(server_id)), descriptor_(std::move(descriptor)),
      cache_(cache ? std::move(cache) : std::make_shared<ToolCache>()),
      config_(std::move(config)),
      factory_(factory ? std::move(factory)
                       : makeProcessTransportFactory(config_.transport)),
      tag_(logging::serverTag(id_)),
      correlator_(
          [this](const types::JSONRPCMessage &message,
                 std::function<void(const std::error_code &)> callback) {
            sendToTransport(message, std::move(callback));
          },
          tag_) {}

ServerSession::~ServerSession() {
  try {
    disconnect();
  } catch (const std::exception &e) {
    TOOLBRIDGE_LOG_ERROR(tag_ + "error while closing session: " +
                         std::string(e.what()));
  }
}

types::InitializeResult ServerSession::connect() {
  std::unique_lock<std::mutex> lifecycle(lifecycle_mutex_);

  std::uint64_t generation;
  {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock,
                   [this] { return state_ != types::SessionState::Closing; });

    if (state_ == types::SessionState::Ready && init_result_) {
      return *init_result_;
    }
    if (state_ == types::SessionState::Connecting ||
        state_ == types::SessionState::Initializing) {
      throw AlreadyConnectingException(id_);
    }

    generation = ++generation_;
    closing_requested_ = false;
    last_error_.reset();
    init_result_.reset();
  }
  setState(types::SessionState::Connecting);

  // A server that exited on its own leaves its transport behind.
  teardownTransport();
  cache_->clear(id_);

  TOOLBRIDGE_LOG_INFO(tag_ + "connecting: " + descriptor_.command);

  try {
    auto transport = factory_(id_, descriptor_);
    if (!transport) {
      throw TransportException("Transport factory returned no transport");
    }

    transport->setMessageCallback(
        [this, generation](types::JSONRPCMessage message) {
          onMessage(generation, std::move(message));
        });
    transport->setErrorCallback(
        [this, generation](std::error_code ec, const std::string &detail) {
          onTransportError(generation, ec, detail);
        });
    transport->setCloseCallback(
        [this, generation]() { onTransportClosed(generation); });

    {
      std::lock_guard<std::mutex> lock(transport_mutex_);
      transport_ = transport;
    }
    transport->connect();
  } catch (const ToolBridgeException &e) {
    TOOLBRIDGE_LOG_ERROR(tag_ + "failed to start server: " + e.what());
    recordFailure(generation, e.error());
    throw;
  }

  setState(types::SessionState::Initializing);

  nlohmann::json params = {
      {"protocolVersion", config_.protocol_version},
      {"capabilities", nlohmann::json::object()},
      {"clientInfo",
       {{"name", config_.client_name}, {"version", config_.client_version}}}};
  auto future =
      correlator_.send("initialize", params, config_.handshake_timeout);

  // Released while waiting so disconnect() can abort the handshake.
  lifecycle.unlock();
  nlohmann::json result;
  try {
    result = future.get();
  } catch (const ToolBridgeException &e) {
    lifecycle.lock();
    types::SessionState current;
    bool same_attempt;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      current = state_;
      same_attempt = generation_ == generation;
    }

    if (same_attempt && current == types::SessionState::Initializing) {
      TOOLBRIDGE_LOG_ERROR(tag_ + "handshake failed: " + e.what());
      recordFailure(generation, e.error());
      throw;
    }
    if (same_attempt && current == types::SessionState::Error) {
      throw;
    }
    throw ConnectionClosedException("Session closed during handshake",
                                    {{"serverId", id_}});
  }
  lifecycle.lock();

  try {
    return completeHandshake(generation, result);
  } catch (const ToolBridgeException &e) {
    TOOLBRIDGE_LOG_ERROR(tag_ + "handshake failed: " + e.what());
    recordFailure(generation, e.error());
    throw;
  }
}

types::InitializeResult
ServerSession::completeHandshake(std::uint64_t generation,
                                 const nlohmann::json &result) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (generation_ != generation ||
        state_ != types::SessionState::Initializing) {
      throw ConnectionClosedException("Session closed during handshake",
                                      {{"serverId", id_}});
    }
  }

  types::InitializeResult init;
  try {
    init = result.get<types::InitializeResult>();
  } catch (const nlohmann::json::exception &e) {
    throw ProtocolException("Invalid initialize result: " +
                                std::string(e.what()),
                            result);
  }

  const auto &supported = config_.supported_protocol_versions;
  if (std::find(supported.begin(), supported.end(), init.protocol_version) ==
      supported.end()) {
    throw UnsupportedProtocolException(init.protocol_version);
  }

  // Queued ahead of any request issued once the session is Ready.
  types::JSONRPCNotification initialized;
  initialized.method = "notifications/initialized";
  sendToTransport(initialized, [this](const std::error_code &ec) {
    if (ec) {
      TOOLBRIDGE_LOG_WARNING(tag_ + "failed to send initialized: " +
                             ec.message());
    }
  });

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    init_result_ = init;
  }
  setState(types::SessionState::Ready);

  TOOLBRIDGE_LOG_INFO(tag_ + "connected to " + init.server_info.name + " " +
                      init.server_info.version + " (protocol " +
                      init.protocol_version + ")");
  return init;
}

void ServerSession::recordFailure(std::uint64_t generation,
                                  const types::ErrorData &error) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (generation_ != generation) {
      return;
    }
    closing_requested_ = true;
    last_error_ = error;
    init_result_.reset();
    state_ = types::SessionState::Error;
  }
  state_cv_.notify_all();
  TOOLBRIDGE_LOG_DEBUG(tag_ + "state -> Error");

  correlator_.failAll(std::make_exception_ptr(
      ConnectionClosedException("Connection attempt failed")));
  teardownTransport();
  cache_->clear(id_);
}

void ServerSession::disconnect() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

  bool has_transport = currentTransport() != nullptr;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == types::SessionState::Disconnected && !has_transport) {
      return;
    }
    closing_requested_ = true;
    ++generation_;
  }
  setState(types::SessionState::Closing);

  correlator_.failAll(std::make_exception_ptr(ConnectionClosedException(
      "Session disconnected", {{"serverId", id_}})));
  teardownTransport();
  cache_->clear(id_);

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    init_result_.reset();
  }
  setState(types::SessionState::Disconnected);

  TOOLBRIDGE_LOG_INFO(tag_ + "disconnected");
}

std::future<std::vector<types::Tool>>
ServerSession::listTools(std::optional<std::chrono::milliseconds> timeout) {
  auto view = requireReady("listTools");
  auto request_timeout = timeout.value_or(config_.request_timeout);

  if (!view.capabilities.tools) {
    TOOLBRIDGE_LOG_DEBUG(tag_ + "server declares no tools capability");
    storeTools(view.generation, {});
    std::promise<std::vector<types::Tool>> promise;
    promise.set_value({});
    return promise.get_future();
  }

  auto first_page = correlator_.send("tools/list", nlohmann::json::object(),
                                     request_timeout);

  return std::async(
      std::launch::deferred,
      [self = shared_from_this(), page_future = std::move(first_page),
       generation = view.generation, request_timeout]() mutable {
        std::vector<types::Tool> tools;
        std::set<std::string> seen_cursors;
        nlohmann::json page = page_future.get();

        while (true) {
          try {
            for (const auto &item :
                 page.value("tools", nlohmann::json::array())) {
              tools.push_back(item.get<types::Tool>());
            }
          } catch (const nlohmann::json::exception &e) {
            throw ProtocolException("Invalid tools/list result: " +
                                        std::string(e.what()),
                                    page);
          }

          if (!page.contains("nextCursor") || !page["nextCursor"].is_string()) {
            break;
          }
          std::string cursor = page["nextCursor"].get<std::string>();
          if (!seen_cursors.insert(cursor).second) {
            TOOLBRIDGE_LOG_WARNING(self->tag_ +
                                   "tools/list repeated cursor, stopping");
            break;
          }

          self->requireReady("listTools");
          page = self->correlator_
                     .send("tools/list", nlohmann::json{{"cursor", cursor}},
                           request_timeout)
                     .get();
        }

        self->storeTools(generation, tools);
        TOOLBRIDGE_LOG_INFO(self->tag_ + "listed " +
                            std::to_string(tools.size()) + " tool(s)");
        return tools;
      });
}

std::future<types::CallToolResult>
ServerSession::callTool(const std::string &name,
                        const nlohmann::json &arguments,
                        std::optional<std::chrono::milliseconds> timeout) {
  requireReady("callTool");
  auto request_timeout = timeout.value_or(config_.request_timeout);
  nlohmann::json args =
      arguments.is_null() ? nlohmann::json::object() : arguments;

  if (config_.validate_tool_arguments) {
    if (auto tool = cache_->find(id_, name)) {
      std::string error;
      if (!json_utils::isValidSchema(tool->input_schema, &error)) {
        TOOLBRIDGE_LOG_WARNING(tag_ + "skipping validation for " + name +
                               ", schema rejected: " + error);
      } else if (!json_utils::validate(args, tool->input_schema, &error)) {
        TOOLBRIDGE_LOG_WARNING(tag_ + "invalid arguments for " + name + ": " +
                               error);
        std::promise<types::CallToolResult> promise;
        promise.set_exception(std::make_exception_ptr(
            InvalidArgumentsException("Invalid arguments for tool '" + name +
                                          "': " + error,
                                      {{"tool", name}})));
        return promise.get_future();
      }
    }
  }

  TOOLBRIDGE_LOG_INFO(tag_ + "calling tool " + name + " with " +
                      json_utils::preview(json_utils::redactSensitive(args)));

  auto future = correlator_.send(
      "tools/call", nlohmann::json{{"name", name}, {"arguments", args}},
      request_timeout);

  return std::async(
      std::launch::deferred, [self = shared_from_this(),
                              future = std::move(future), name]() mutable {
        nlohmann::json result;
        try {
          result = future.get();
        } catch (const RemoteErrorException &e) {
          if (self->isToolNotFound(e.error())) {
            throw ToolNotFoundException(name, e.error());
          }
          throw ToolExecutionException(name, e.error());
        }

        types::CallToolResult call_result;
        try {
          call_result = result.get<types::CallToolResult>();
        } catch (const nlohmann::json::exception &e) {
          throw ProtocolException("Invalid tools/call result: " +
                                      std::string(e.what()),
                                  result);
        }

        if (call_result.is_error) {
          TOOLBRIDGE_LOG_WARNING(self->tag_ + "tool " + name +
                                 " reported an error: " +
                                 json_utils::preview(call_result.content));
        } else {
          TOOLBRIDGE_LOG_DEBUG(self->tag_ + "tool " + name + " returned " +
                               json_utils::preview(call_result.content));
        }
        return call_result;
      });
}

std::future<std::chrono::milliseconds>
ServerSession::ping(std::optional<std::chrono::milliseconds> timeout) {
  try {
    requireReady("ping");
  } catch (const NotConnectedException &e) {
    std::promise<std::chrono::milliseconds> promise;
    promise.set_exception(std::make_exception_ptr(UnreachableException(
        "Server is not reachable: " + std::string(e.what()),
        {{"cause", e.error()}})));
    return promise.get_future();
  }

  auto start = std::chrono::steady_clock::now();
  auto future = correlator_.send("ping", nlohmann::json::object(),
                                 timeout.value_or(config_.request_timeout));

  // Runs eagerly so the measured time is the actual round trip.
  return std::async(std::launch::async, [future = std::move(future), start,
                                         tag = tag_]() mutable {
    try {
      future.get();
    } catch (const ToolBridgeException &e) {
      throw UnreachableException("Server did not answer ping: " +
                                     std::string(e.what()),
                                 {{"cause", e.error()}});
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    TOOLBRIDGE_LOG_DEBUG(tag + "ping " + std::to_string(latency.count()) +
                         " ms");
    return latency;
  });
}

void ServerSession::setNotificationHandler(NotificationHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  notification_handler_ = std::move(handler);
}

void ServerSession::setErrorHandler(ErrorHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  error_handler_ = std::move(handler);
}

types::SessionState ServerSession::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::optional<types::ErrorData> ServerSession::lastError() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_error_;
}

std::optional<types::InitializeResult>
ServerSession::initializeResult() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return init_result_;
}

ServerSession::ReadyView
ServerSession::requireReady(const std::string &operation) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (state_ != types::SessionState::Ready || !init_result_) {
    throw NotConnectedException("Cannot " + operation + ": server '" + id_ +
                                "' is " + types::toString(state_));
  }
  return {generation_, init_result_->capabilities};
}

void ServerSession::setState(types::SessionState state) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
  }
  state_cv_.notify_all();
  TOOLBRIDGE_LOG_DEBUG(tag_ + "state -> " + types::toString(state));
}

void ServerSession::storeTools(std::uint64_t generation,
                               const std::vector<types::Tool> &tools) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (generation_ == generation && state_ == types::SessionState::Ready) {
    cache_->store(id_, tools);
  }
}

void ServerSession::teardownTransport() {
  std::shared_ptr<transport::Transport> transport;
  {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    transport.swap(transport_);
  }
  if (transport) {
    transport->disconnect();
  }
}

void ServerSession::onMessage(std::uint64_t generation,
                              types::JSONRPCMessage message) {
  if (std::holds_alternative<types::JSONRPCResponse>(message) ||
      std::holds_alternative<types::JSONRPCError>(message)) {
    correlator_.dispatch(message);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (generation != generation_) {
      return;
    }
  }

  if (const auto *request = std::get_if<types::JSONRPCRequest>(&message)) {
    handlePeerRequest(*request);
    return;
  }

  const auto &notification = std::get<types::JSONRPCNotification>(message);
  TOOLBRIDGE_LOG_DEBUG(tag_ + "notification " + notification.method);

  NotificationHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = notification_handler_;
  }
  if (handler) {
    handler(notification);
  }
}

void ServerSession::handlePeerRequest(const types::JSONRPCRequest &request) {
  types::JSONRPCMessage reply;
  if (request.method == "ping") {
    reply = types::JSONRPCResponse{.jsonrpc = "2.0",
                                   .id = request.id,
                                   .result = nlohmann::json::object()};
  } else {
    TOOLBRIDGE_LOG_DEBUG(tag_ + "rejecting server request " + request.method);
    reply = createErrorResponse(request.id, types::ErrorCode::MethodNotFound,
                                "Method not found");
  }

  sendToTransport(reply, [this](const std::error_code &ec) {
    if (ec) {
      TOOLBRIDGE_LOG_WARNING(tag_ + "failed to answer server request: " +
                             ec.message());
    }
  });
}

void ServerSession::onTransportError(std::uint64_t generation,
                                     std::error_code ec,
                                     const std::string &detail) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (generation != generation_) {
      return;
    }
  }

  if (ec == transport::ProcessTransportError::FramingError ||
      ec == transport::ProcessTransportError::LineTooLong) {
    TOOLBRIDGE_LOG_WARNING(tag_ + "framing error: " + ec.message());
    notifyError(FramingException(ec.message(), detail));
    return;
  }

  TOOLBRIDGE_LOG_ERROR(tag_ + "transport error: " + ec.message() +
                       (detail.empty() ? "" : " (" + detail + ")"));
  notifyError(TransportException(ec.message(), {{"detail", detail}}));
}

void ServerSession::onTransportClosed(std::uint64_t generation) {
  nlohmann::json data = {{"serverId", id_}};
  if (auto process = std::dynamic_pointer_cast<transport::ProcessTransport>(
          currentTransport())) {
    if (auto code = process->exitCode()) {
      data["exitCode"] = *code;
    }
  }
  ProcessCrashedException crash("Server process exited unexpectedly", data);

  types::SessionState previous;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (generation != generation_ || closing_requested_) {
      return;
    }
    previous = state_;
    if (previous != types::SessionState::Ready &&
        previous != types::SessionState::Connecting &&
        previous != types::SessionState::Initializing) {
      return;
    }
    state_ = types::SessionState::Error;
    last_error_ = crash.error();
    if (previous == types::SessionState::Ready) {
      state_ = types::SessionState::Closing;
    }
  }
  state_cv_.notify_all();

  TOOLBRIDGE_LOG_ERROR(tag_ + "server crashed while " +
                       types::toString(previous));

  if (previous == types::SessionState::Ready) {
    correlator_.failAll(std::make_exception_ptr(
        ConnectionClosedException("Server crashed", data)));
    cache_->clear(id_);
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (generation == generation_) {
        init_result_.reset();
        state_ = types::SessionState::Disconnected;
      }
    }
    state_cv_.notify_all();
  } else {
    correlator_.failAll(std::make_exception_ptr(crash));
  }

  notifyError(crash);
}

void ServerSession::notifyError(const ToolBridgeException &error) {
  ErrorHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = error_handler_;
  }
  if (handler) {
    handler(error);
  }
}

std::shared_ptr<transport::Transport> ServerSession::currentTransport() const {
  std::lock_guard<std::mutex> lock(transport_mutex_);
  return transport_;
}

void ServerSession::sendToTransport(
    const types::JSONRPCMessage &message,
    std::function<void(const std::error_code &)> callback) {
  auto transport = currentTransport();
  if (!transport) {
    if (callback) {
      callback(make_error_code(transport::ProcessTransportError::Disconnected));
    }
    return;
  }
  transport->send(message, std::move(callback));
}

bool ServerSession::isToolNotFound(const types::ErrorData &error) const {
  if (config_.tool_not_found_codes.count(error.code) > 0) {
    return true;
  }
  std::string message = toLower(error.message);
  return message.find("unknown tool") != std::string::npos ||
         message.find("tool not found") != std::string::npos;
}

} // namespace session
} // namespace toolbridge
