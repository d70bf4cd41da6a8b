#include "toolbridge/session/session_registry.hpp"
#include "toolbridge/utils/error.hpp"
#include "toolbridge/utils/logging.hpp"
#include <thread>

namespace toolbridge {
namespace session {

SessionRegistry::SessionRegistry() : SessionRegistry(Config()) {}

SessionRegistry::SessionRegistry(Config config, TransportFactory factory)
    : config_(std::move(config)),
      factory_(factory ? std::move(factory)
                       : makeProcessTransportFactory(config_.session.transport)),
      cache_(std::make_shared<ToolCache>()) {}

SessionRegistry::~SessionRegistry() { disconnectAll(); }

std::shared_future<types::InitializeResult>
SessionRegistry::connect(const std::string &id,
                         const types::ServerDescriptor &descriptor,
                         std::optional<std::chrono::milliseconds>
                             handshake_timeout) {
  std::shared_ptr<ServerSession> stale;
  std::shared_future<types::InitializeResult> handle;

  while (true) {
    std::unique_lock<std::mutex> lock(mutex_);

    // Never start a second process while the previous one is being stopped.
    auto closing = closing_.find(id);
    if (closing != closing_.end()) {
      auto teardown = closing->second;
      lock.unlock();
      TOOLBRIDGE_LOG_DEBUG(logging::serverTag(id) +
                           "waiting for teardown before connecting");
      teardown.wait();
      continue;
    }

    auto it = entries_.find(id);
    if (it != entries_.end()) {
      Entry &entry = it->second;
      if (entry.connecting) {
        if (config_.connect_policy == ConnectPolicy::Reject) {
          throw AlreadyConnectingException(id);
        }
        TOOLBRIDGE_LOG_DEBUG(logging::serverTag(id) +
                             "sharing in-flight connect");
        return entry.pending_connect;
      }

      if (entry.session->state() == types::SessionState::Ready) {
        if (auto init = entry.session->initializeResult()) {
          std::promise<types::InitializeResult> ready;
          ready.set_value(*init);
          return ready.get_future().share();
        }
      }

      // Left behind by a server that exited on its own.
      stale = std::move(entry.session);
      entries_.erase(it);
    }

    auto session = createSession(id, descriptor, handshake_timeout);
    handle = std::async(std::launch::async,
                        [this, id, session]() { return runConnect(id, session); })
                 .share();
    entries_[id] = Entry{session, handle, true};
    break;
  }

  // Joins the old transport's threads; done outside the lock.
  stale.reset();
  return handle;
}

types::InitializeResult
SessionRegistry::runConnect(const std::string &id,
                            std::shared_ptr<ServerSession> session) {
  auto finish = [this, &id, &session]() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end() && it->second.session == session) {
      it->second.connecting = false;
    }
  };

  // A failed session stays registered in the Error state so its last error
  // can be inspected; the entry must not be erased here, since it holds the
  // future this thread is completing.
  try {
    auto result = session->connect();
    finish();
    return result;
  } catch (const ToolBridgeException &e) {
    TOOLBRIDGE_LOG_ERROR(logging::serverTag(id) +
                         "connect failed: " + e.what());
    finish();
    throw;
  }
}

void SessionRegistry::disconnect(const std::string &id) {
  Entry entry;
  std::promise<void> done;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    auto closing = closing_.find(id);
    if (closing != closing_.end()) {
      auto teardown = closing->second;
      lock.unlock();
      teardown.wait();
      return;
    }

    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return;
    }
    entry = std::move(it->second);
    entries_.erase(it);
    closing_[id] = done.get_future().share();
  }

  TOOLBRIDGE_LOG_INFO(logging::serverTag(id) + "disconnecting");
  entry.session->disconnect();

  // The background connect, if any, fails fast once the session is closed;
  // wait for it so it never outlives the registry.
  if (entry.pending_connect.valid()) {
    entry.pending_connect.wait();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    closing_.erase(id);
  }
  done.set_value();
}

void SessionRegistry::disconnectAll() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, entry] : entries_) {
      ids.push_back(id);
    }
  }
  for (const auto &id : ids) {
    disconnect(id);
  }
}

std::future<std::vector<types::Tool>>
SessionRegistry::listTools(const std::string &id,
                           std::optional<std::chrono::milliseconds> timeout) {
  return find(id)->listTools(timeout);
}

std::future<types::CallToolResult>
SessionRegistry::callTool(const std::string &id, const std::string &name,
                          const nlohmann::json &arguments,
                          std::optional<std::chrono::milliseconds> timeout) {
  return find(id)->callTool(name, arguments, timeout);
}

std::future<std::chrono::milliseconds>
SessionRegistry::ping(const std::string &id,
                      std::optional<std::chrono::milliseconds> timeout) {
  return find(id)->ping(timeout);
}

std::vector<std::string> SessionRegistry::listConnectedServers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  for (const auto &[id, entry] : entries_) {
    if (entry.session->state() == types::SessionState::Ready) {
      ids.push_back(id);
    }
  }
  return ids;
}

std::shared_ptr<ServerSession>
SessionRegistry::session(const std::string &id) const {
  return find(id);
}

std::optional<std::vector<types::Tool>>
SessionRegistry::cachedTools(const std::string &id) const {
  return cache_->get(id);
}

std::vector<SessionRegistry::ServerTool> SessionRegistry::allTools() const {
  std::vector<ServerTool> tools;
  for (const auto &id : listConnectedServers()) {
    if (auto cached = cache_->get(id)) {
      for (auto &tool : *cached) {
        tools.push_back({id, std::move(tool)});
      }
    }
  }
  return tools;
}

std::optional<std::string>
SessionRegistry::findServerForTool(const std::string &name) const {
  for (const auto &id : listConnectedServers()) {
    if (cache_->find(id, name)) {
      return id;
    }
  }
  return std::nullopt;
}

std::map<std::string, SessionRegistry::AutoConnectOutcome>
SessionRegistry::autoConnect(
    const std::map<std::string, types::ServerDescriptor> &servers) {
  std::map<std::string, AutoConnectOutcome> outcomes;
  bool first = true;

  for (const auto &[id, descriptor] : servers) {
    if (!descriptor.auto_connect) {
      continue;
    }
    if (!first) {
      std::this_thread::sleep_for(config_.auto_connect_delay);
    }
    first = false;

    TOOLBRIDGE_LOG_INFO(logging::serverTag(id) + "auto-connecting");
    AutoConnectOutcome outcome;
    try {
      connect(id, descriptor).get();
      outcome.connected = true;
    } catch (const ToolBridgeException &e) {
      outcome.error = e.error();
    }
    outcomes[id] = std::move(outcome);
  }

  return outcomes;
}

void SessionRegistry::setNotificationHandler(NotificationHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  notification_handler_ = std::move(handler);
}

void SessionRegistry::setErrorHandler(ErrorHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  error_handler_ = std::move(handler);
}

std::shared_ptr<ServerSession>
SessionRegistry::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw UnknownServerException(id);
  }
  return it->second.session;
}

std::shared_ptr<ServerSession> SessionRegistry::createSession(
    const std::string &id, const types::ServerDescriptor &descriptor,
    std::optional<std::chrono::milliseconds> handshake_timeout) {
  auto session_config = config_.session;
  if (handshake_timeout) {
    session_config.handshake_timeout = *handshake_timeout;
  }

  auto session = std::make_shared<ServerSession>(id, descriptor, cache_,
                                                 session_config, factory_);

  session->setNotificationHandler(
      [this, id](const types::JSONRPCNotification &notification) {
        NotificationHandler handler;
        {
          std::lock_guard<std::mutex> lock(handler_mutex_);
          handler = notification_handler_;
        }
        if (handler) {
          handler(id, notification);
        }
      });
  session->setErrorHandler([this, id](const ToolBridgeException &error) {
    ErrorHandler handler;
    {
      std::lock_guard<std::mutex> lock(handler_mutex_);
      handler = error_handler_;
    }
    if (handler) {
      handler(id, error);
    }
  });

  return session;
}

} // namespace session
} // namespace toolbridge
