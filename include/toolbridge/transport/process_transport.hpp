#ifndef TOOLBRIDGE_TRANSPORT_PROCESS_TRANSPORT_HPP_
#define TOOLBRIDGE_TRANSPORT_PROCESS_TRANSPORT_HPP_

#include "toolbridge/process/process.hpp"
#include "toolbridge/transport/line_framer.hpp"
#include "toolbridge/transport/transport.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>

namespace toolbridge {
namespace transport {

/**
 * @brief Error conditions reported by ProcessTransport
 */
enum class ProcessTransportError {
  Timeout = 1,
  Disconnected,
  WriteError,
  ReadError,
  FramingError,
  LineTooLong
};

const std::error_category &process_transport_category();

std::error_code make_error_code(ProcessTransportError e);

/**
 * @brief Install instructions for a launch command that is not on PATH
 *
 * Covers the node/npx/npm, python/pip and uv toolchains; anything else gets
 * a generic PATH reminder.
 */
std::string installHint(const std::string &command,
                        const std::vector<std::string> &args = {});

/**
 * @brief Transport over the standard streams of a child process
 *
 * connect() spawns the server described by the descriptor. A writer thread
 * drains the send queue into the child's stdin one whole line at a time. A
 * reader thread polls the child's stdout, splits it into lines and parses
 * each one. When stderr capture is enabled a third thread logs the child's
 * stderr at debug level.
 *
 * When the child closes its stdout the reader reaps it and invokes the close
 * callback. disconnect() closes the child's stdin and reaps it, escalating
 * from a grace period to SIGTERM and then SIGKILL.
 */
class ProcessTransport : public Transport {
public:
  struct Config {
    std::string server_id; ///< Used to tag log lines
    std::chrono::milliseconds poll_interval{50};
    std::chrono::milliseconds shutdown_grace{2000};
    std::size_t max_line_length = LineFramer::kDefaultMaxLineLength;
    bool capture_stderr = true;
  };

  ProcessTransport(types::ServerDescriptor descriptor, Config config);

  ~ProcessTransport() override;

  // Transport interface implementation
  void send(const types::JSONRPCMessage &message,
            std::function<void(const std::error_code &)> callback) override;

  std::error_code send(const types::JSONRPCMessage &message,
                       std::chrono::milliseconds timeout) override;

  void setMessageCallback(MessageCallback callback) override;
  void setErrorCallback(ErrorCallback callback) override;
  void setCloseCallback(CloseCallback callback) override;

  /**
   * @brief Spawn the child process and start the I/O threads
   *
   * @throws TransportException with ErrorCode::CommandNotFound when the
   * command cannot be found, or ErrorCode::TransportError for other spawn
   * failures
   */
  void connect() override;
  void disconnect() override;
  bool isConnected() const override;

  /// Exit status of the child once it has been reaped
  std::optional<int> exitCode() const;

  /// Process id of the running child, or -1
  pid_t pid() const;

private:
  struct SendOperation {
    std::string line;
    std::function<void(const std::error_code &)> callback;
  };

  void readLoop();
  void writeLoop();
  void stderrLoop();
  void processLine(const std::string &line);
  void reportError(ProcessTransportError error, const std::string &detail);
  void reapChild();
  void joinThreads();
  void failQueuedSends();

  std::string tag() const;

  types::ServerDescriptor descriptor_;
  Config config_;

  std::unique_ptr<process::Process> process_;
  std::optional<int> exit_code_;
  mutable std::mutex exit_mutex_;

  // Thread management
  std::thread read_thread_;
  std::thread write_thread_;
  std::thread stderr_thread_;
  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;

  // Callbacks
  MessageCallback message_callback_;
  ErrorCallback error_callback_;
  CloseCallback close_callback_;
  std::mutex callback_mutex_;

  // Send queue
  std::queue<SendOperation> send_queue_;
  std::mutex send_queue_mutex_;
  std::condition_variable send_queue_cv_;
};

} // namespace transport
} // namespace toolbridge

namespace std {
template <>
struct is_error_code_enum<toolbridge::transport::ProcessTransportError>
    : true_type {};
} // namespace std

#endif // TOOLBRIDGE_TRANSPORT_PROCESS_TRANSPORT_HPP_
