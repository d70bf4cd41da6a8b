#ifndef TOOLBRIDGE_SESSION_SESSION_REGISTRY_HPP_
#define TOOLBRIDGE_SESSION_SESSION_REGISTRY_HPP_

#include "toolbridge/session/server_session.hpp"
#include "toolbridge/session/tool_cache.hpp"
#include "toolbridge/types.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {
namespace session {

/**
 * @brief Owns the server sessions, keyed by caller-chosen server id
 *
 * Lifecycle operations for one id are serialized: a connect issued while the
 * id is being torn down waits for the teardown, so at most one server process
 * is alive per id. Lookups for an id that is not registered throw
 * UnknownServerException.
 */
class SessionRegistry {
public:
  /**
   * @brief What a connect does while another connect for the id is running
   */
  enum class ConnectPolicy {
    ShareInFlight, ///< Return the in-flight handle
    Reject         ///< Throw AlreadyConnectingException
  };

  struct Config {
    ServerSession::Config session;
    ConnectPolicy connect_policy = ConnectPolicy::ShareInFlight;

    /**
     * @brief Pause between consecutive connects in autoConnect()
     */
    std::chrono::milliseconds auto_connect_delay =
        std::chrono::milliseconds(500);
  };

  /**
   * @brief A tool together with the server that provides it
   */
  struct ServerTool {
    std::string server_id;
    types::Tool tool;
  };

  /**
   * @brief Outcome of one connect attempted by autoConnect()
   */
  struct AutoConnectOutcome {
    bool connected = false;
    std::optional<types::ErrorData> error;
  };

  using NotificationHandler = std::function<void(
      const std::string &server_id, const types::JSONRPCNotification &)>;
  using ErrorHandler = std::function<void(const std::string &server_id,
                                          const ToolBridgeException &)>;

  /**
   * @brief Construct a new SessionRegistry
   *
   * @param config Registry and session configuration
   * @param factory Transport factory for new sessions; empty selects
   * ProcessTransport
   */
  explicit SessionRegistry();
  explicit SessionRegistry(Config config, TransportFactory factory = {});

  /**
   * @brief Disconnects every server
   */
  ~SessionRegistry();

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  /**
   * @brief Connect to a server
   *
   * Returns at once; the handshake runs in the background. Connecting an id
   * that is already Ready yields the stored initialize result without
   * launching anything.
   *
   * @param id Server identifier
   * @param descriptor How to launch the server
   * @param handshake_timeout Overrides the configured handshake timeout
   * @return std::shared_future<types::InitializeResult> The connect handle
   * @throws AlreadyConnectingException under ConnectPolicy::Reject
   */
  std::shared_future<types::InitializeResult>
  connect(const std::string &id, const types::ServerDescriptor &descriptor,
          std::optional<std::chrono::milliseconds> handshake_timeout =
              std::nullopt);

  /**
   * @brief Disconnect a server and forget its id
   *
   * Unknown ids are ignored. Returns once the server process is gone.
   */
  void disconnect(const std::string &id);

  /**
   * @brief Disconnect every server
   */
  void disconnectAll();

  std::future<std::vector<types::Tool>>
  listTools(const std::string &id,
            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  std::future<types::CallToolResult>
  callTool(const std::string &id, const std::string &name,
           const nlohmann::json &arguments,
           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  std::future<std::chrono::milliseconds>
  ping(const std::string &id,
       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /**
   * @brief Ids of the servers in the Ready state, sorted
   */
  std::vector<std::string> listConnectedServers() const;

  /**
   * @brief The session registered under an id
   *
   * @throws UnknownServerException if the id is not registered
   */
  std::shared_ptr<ServerSession> session(const std::string &id) const;

  /// Tools last listed by a server, if any
  std::optional<std::vector<types::Tool>>
  cachedTools(const std::string &id) const;

  /**
   * @brief Cached tools of every Ready server, ordered by server id
   */
  std::vector<ServerTool> allTools() const;

  /**
   * @brief First Ready server, by id order, whose cached tools include the
   * name
   */
  std::optional<std::string> findServerForTool(const std::string &name) const;

  /**
   * @brief Connect, one after another, every server marked auto_connect
   *
   * Servers are launched in id order. Waits for each handshake before
   * starting the next and pauses for the configured delay between attempts.
   * Failures do not stop the sequence.
   */
  std::map<std::string, AutoConnectOutcome>
  autoConnect(const std::map<std::string, types::ServerDescriptor> &servers);

  void setNotificationHandler(NotificationHandler handler);
  void setErrorHandler(ErrorHandler handler);

private:
  struct Entry {
    std::shared_ptr<ServerSession> session;
    std::shared_future<types::InitializeResult> pending_connect;
    bool connecting = false;
  };

  std::shared_ptr<ServerSession> find(const std::string &id) const;
  std::shared_ptr<ServerSession>
  createSession(const std::string &id, const types::ServerDescriptor &descriptor,
                std::optional<std::chrono::milliseconds> handshake_timeout);
  types::InitializeResult runConnect(const std::string &id,
                                     std::shared_ptr<ServerSession> session);

  Config config_;
  TransportFactory factory_;
  std::shared_ptr<ToolCache> cache_;

  std::map<std::string, Entry> entries_;
  std::map<std::string, std::shared_future<void>> closing_;
  mutable std::mutex mutex_;

  NotificationHandler notification_handler_;
  ErrorHandler error_handler_;
  std::mutex handler_mutex_;
};

} // namespace session
} // namespace toolbridge

#endif // TOOLBRIDGE_SESSION_SESSION_REGISTRY_HPP_
