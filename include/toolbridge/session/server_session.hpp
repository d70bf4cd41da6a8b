#ifndef TOOLBRIDGE_SESSION_SERVER_SESSION_HPP_
#define TOOLBRIDGE_SESSION_SERVER_SESSION_HPP_

#include "toolbridge/session/request_correlator.hpp"
#include "toolbridge/session/tool_cache.hpp"
#include "toolbridge/transport/process_transport.hpp"
#include "toolbridge/transport/transport.hpp"
#include "toolbridge/types.hpp"
#include "toolbridge/utils/error.hpp"
#include "toolbridge/version.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace toolbridge {
namespace session {

/**
 * @brief Creates the transport for a server session
 *
 * Called once per connect attempt with the session's server id and
 * descriptor.
 */
using TransportFactory = std::function<std::shared_ptr<transport::Transport>(
    const std::string &server_id, const types::ServerDescriptor &descriptor)>;

using NotificationHandler =
    std::function<void(const types::JSONRPCNotification &)>;

/**
 * @brief Receives failures that are not tied to a pending call
 *
 * Framing errors and crashes of the server process are reported here.
 */
using ErrorHandler = std::function<void(const ToolBridgeException &)>;

/**
 * @brief Connection to one tool server
 *
 * The ServerSession class is responsible for:
 * - Launching the server through its transport and running the handshake
 * - Tracking the lifecycle state of the connection
 * - Listing and calling tools once the session is Ready
 * - Answering requests initiated by the server
 * - Cleaning up when the server exits on its own
 *
 * Lifecycle transitions are serialized by a per-session mutex. Sessions must
 * be owned by a std::shared_ptr; pending results keep the session alive.
 */
class ServerSession : public std::enable_shared_from_this<ServerSession> {
public:
  /**
   * @brief Configuration options for ServerSession
   */
  struct Config {
    std::string client_name = "toolbridge";
    std::string client_version = TOOLBRIDGE_VERSION;

    /**
     * @brief Version sent in the initialize request
     */
    std::string protocol_version = "2025-06-18";

    /**
     * @brief Versions accepted in the initialize response
     */
    std::vector<std::string> supported_protocol_versions = {
        "2025-06-18", "2025-03-26", "2024-11-05", "2024-10-07"};

    std::chrono::milliseconds handshake_timeout = std::chrono::seconds(30);
    std::chrono::milliseconds request_timeout = std::chrono::seconds(30);

    /**
     * @brief Peer error codes that mean the requested tool does not exist
     */
    std::set<int> tool_not_found_codes = {
        static_cast<int>(types::ErrorCode::MethodNotFound)};

    /**
     * @brief Validate tool arguments against the cached input schema
     */
    bool validate_tool_arguments = true;

    /**
     * @brief Settings for the default subprocess transport
     */
    transport::ProcessTransport::Config transport;
  };

  /**
   * @brief Construct a new ServerSession
   *
   * @param server_id Caller-chosen server identifier
   * @param descriptor How to launch the server; copied
   * @param cache Shared tool cache; the session writes only its own key
   * @param config Session configuration
   * @param factory Transport factory; empty selects ProcessTransport
   */
  ServerSession(std::string server_id, types::ServerDescriptor descriptor,
                std::shared_ptr<ToolCache> cache, Config config,
                TransportFactory factory = {});

  ~ServerSession();

  ServerSession(const ServerSession &) = delete;
  ServerSession &operator=(const ServerSession &) = delete;

  /**
   * @brief Launch the server and perform the handshake
   *
   * Blocks until the session is Ready or the attempt failed. Calling connect
   * on a Ready session returns the stored result.
   *
   * @return types::InitializeResult The server's initialize result
   * @throws AlreadyConnectingException if another connect is in progress
   * @throws TransportException if the server cannot be launched
   * @throws UnsupportedProtocolException for an unknown protocol version
   * @throws TimeoutException if the handshake times out
   * @throws ConnectionClosedException if disconnect() interrupts the attempt
   */
  types::InitializeResult connect();

  /**
   * @brief Close the session and stop the server
   *
   * Outstanding calls fail with ConnectionClosedException. Safe to call in
   * any state and repeatedly.
   */
  void disconnect();

  /**
   * @brief List the server's tools and refresh the cache
   *
   * @throws NotConnectedException unless the session is Ready
   */
  std::future<std::vector<types::Tool>>
  listTools(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /**
   * @brief Invoke a tool
   *
   * The future throws InvalidArgumentsException, ToolNotFoundException,
   * ToolExecutionException, TimeoutException or ConnectionClosedException.
   *
   * @throws NotConnectedException unless the session is Ready
   */
  std::future<types::CallToolResult>
  callTool(const std::string &name, const nlohmann::json &arguments,
           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /**
   * @brief Check that the server answers
   *
   * The future yields the round-trip time or throws UnreachableException,
   * including when the session is not Ready.
   */
  std::future<std::chrono::milliseconds>
  ping(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  void setNotificationHandler(NotificationHandler handler);
  void setErrorHandler(ErrorHandler handler);

  const std::string &id() const { return id_; }
  const types::ServerDescriptor &descriptor() const { return descriptor_; }
  types::SessionState state() const;
  std::optional<types::ErrorData> lastError() const;
  std::optional<types::InitializeResult> initializeResult() const;

  /// Number of requests awaiting a response
  std::size_t pendingRequests() const { return correlator_.pendingCount(); }

private:
  struct ReadyView {
    std::uint64_t generation;
    types::ServerCapabilities capabilities;
  };

  ReadyView requireReady(const std::string &operation) const;
  void setState(types::SessionState state);
  types::InitializeResult
  completeHandshake(std::uint64_t generation, const nlohmann::json &result);
  void recordFailure(std::uint64_t generation, const types::ErrorData &error);
  void storeTools(std::uint64_t generation,
                  const std::vector<types::Tool> &tools);
  void teardownTransport();

  void onMessage(std::uint64_t generation, types::JSONRPCMessage message);
  void onTransportError(std::uint64_t generation, std::error_code ec,
                        const std::string &detail);
  void onTransportClosed(std::uint64_t generation);
  void handlePeerRequest(const types::JSONRPCRequest &request);
  void notifyError(const ToolBridgeException &error);

  std::shared_ptr<transport::Transport> currentTransport() const;
  void sendToTransport(const types::JSONRPCMessage &message,
                       std::function<void(const std::error_code &)> callback);

  bool isToolNotFound(const types::ErrorData &error) const;

  std::string id_;
  types::ServerDescriptor descriptor_;
  std::shared_ptr<ToolCache> cache_;
  Config config_;
  TransportFactory factory_;
  std::string tag_;

  // Outlives every transport; ids are never reused across reconnects.
  RequestCorrelator correlator_;

  // Lifecycle state
  std::mutex lifecycle_mutex_;
  mutable std::mutex state_mutex_;
  std::condition_variable state_cv_;
  types::SessionState state_ = types::SessionState::Disconnected;
  std::uint64_t generation_ = 0;
  bool closing_requested_ = false;
  std::optional<types::ErrorData> last_error_;
  std::optional<types::InitializeResult> init_result_;

  std::shared_ptr<transport::Transport> transport_;
  mutable std::mutex transport_mutex_;

  // Handlers
  NotificationHandler notification_handler_;
  ErrorHandler error_handler_;
  std::mutex handler_mutex_;
};

/**
 * @brief Factory creating a ProcessTransport with the given settings
 */
TransportFactory
makeProcessTransportFactory(transport::ProcessTransport::Config config);

} // namespace session
} // namespace toolbridge

#endif // TOOLBRIDGE_SESSION_SERVER_SESSION_HPP_
