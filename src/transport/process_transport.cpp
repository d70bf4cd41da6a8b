#include "toolbridge/transport/process_transport.hpp"
#include "toolbridge/utils/error.hpp"
#include "toolbridge/utils/json_utils.hpp"
#include "toolbridge/utils/logging.hpp"
#include <cerrno>
#include <csignal>
#include <future>

namespace toolbridge {
namespace transport {

namespace {
class ProcessTransportErrorCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "process_transport"; }

  std::string message(int ev) const override {
    switch (static_cast<ProcessTransportError>(ev)) {
    case ProcessTransportError::Timeout:
      return "Operation timed out";
    case ProcessTransportError::Disconnected:
      return "Transport disconnected";
    case ProcessTransportError::WriteError:
      return "Write error";
    case ProcessTransportError::ReadError:
      return "Read error";
    case ProcessTransportError::FramingError:
      return "Malformed message line";
    case ProcessTransportError::LineTooLong:
      return "Message line exceeds maximum length";
    default:
      return "Unknown error";
    }
  }
};

// A write to a child that already exited must fail with EPIPE instead of
// killing the host process.
void ignoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

bool mentionsGitServer(const std::vector<std::string> &args) {
  for (const auto &arg : args) {
    if (arg.find("mcp-server-git") != std::string::npos ||
        arg.find("mcp_server_git") != std::string::npos) {
      return true;
    }
  }
  return false;
}
} // namespace

const std::error_category &process_transport_category() {
  static ProcessTransportErrorCategory category;
  return category;
}

std::error_code make_error_code(ProcessTransportError e) {
  return {static_cast<int>(e), process_transport_category()};
}

std::string installHint(const std::string &command,
                        const std::vector<std::string> &args) {
  std::string header = "The command '" + command +
                       "' is not available on this system.";

  if (command.find("node") != std::string::npos ||
      command.find("npx") != std::string::npos ||
      command.find("npm") != std::string::npos) {
    return header + " Install Node.js using your system's package manager "
                    "(e.g. `sudo apt install nodejs npm`) or from "
                    "https://nodejs.org.";
  }
  if (command.find("python") != std::string::npos ||
      command.find("pip") != std::string::npos) {
    std::string hint =
        header + " Install Python 3 using your system's package manager "
                 "(e.g. `sudo apt install python3`); try `python3` as the "
                 "command if `python` fails.";
    if (mentionsGitServer(args)) {
      hint += " Then install the Git tool with `pip install mcp-server-git`.";
    }
    return hint;
  }
  if (command.find("uv") != std::string::npos) {
    std::string hint = header + " Install uv with `curl -LsSf "
                                "https://astral.sh/uv/install.sh | sh`.";
    if (mentionsGitServer(args)) {
      hint += " Use `uvx mcp-server-git /path/to/repo` to run without "
              "installing.";
    }
    return hint;
  }
  return header + " Ensure that '" + command +
         "' is installed and on your PATH.";
}

ProcessTransport::ProcessTransport(types::ServerDescriptor descriptor,
                                   Config config)
    : descriptor_(std::move(descriptor)), config_(std::move(config)) {}

ProcessTransport::~ProcessTransport() {
  disconnect();

  // Destroyed from inside one of our own callbacks: the thread is already on
  // its way out and cannot join itself.
  for (std::thread *thread : {&read_thread_, &write_thread_, &stderr_thread_}) {
    if (thread->joinable()) {
      thread->detach();
    }
  }
}

void ProcessTransport::send(
    const types::JSONRPCMessage &message,
    std::function<void(const std::error_code &)> callback) {
  if (!running_) {
    if (callback) {
      callback(make_error_code(ProcessTransportError::Disconnected));
    }
    return;
  }

  std::string line = LineFramer::encode(message);
  TOOLBRIDGE_LOG_TRACE(tag() + "-> " + line.substr(0, line.size() - 1));

  {
    std::lock_guard<std::mutex> lock(send_queue_mutex_);
    send_queue_.push({std::move(line), std::move(callback)});
  }

  send_queue_cv_.notify_one();
}

std::error_code ProcessTransport::send(const types::JSONRPCMessage &message,
                                       std::chrono::milliseconds timeout) {
  if (!running_) {
    return make_error_code(ProcessTransportError::Disconnected);
  }

  auto promise = std::make_shared<std::promise<std::error_code>>();
  auto future = promise->get_future();

  send(message,
       [promise](const std::error_code &ec) { promise->set_value(ec); });

  if (future.wait_for(timeout) == std::future_status::timeout) {
    return make_error_code(ProcessTransportError::Timeout);
  }

  return future.get();
}

void ProcessTransport::setMessageCallback(MessageCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  message_callback_ = std::move(callback);
}

void ProcessTransport::setErrorCallback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  error_callback_ = std::move(callback);
}

void ProcessTransport::setCloseCallback(CloseCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  close_callback_ = std::move(callback);
}

void ProcessTransport::connect() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) {
    return;
  }

  // Threads left over from a child that exited on its own.
  joinThreads();
  ignoreSigpipe();

  std::string executable = descriptor_.command;
  if (!descriptor_.working_directory.empty() &&
      executable.find('/') != std::string::npos && executable.front() != '/') {
    executable = descriptor_.working_directory + "/" + executable;
  }
  if (!process::findExecutable(executable)) {
    throw TransportException(types::ErrorCode::CommandNotFound,
                             installHint(descriptor_.command,
                                         descriptor_.args),
                             {{"command", descriptor_.command}});
  }

  process::Options options;
  options.working_directory = descriptor_.working_directory;
  options.environment = descriptor_.env;
  options.capture_stderr = config_.capture_stderr;

  std::unique_ptr<process::Process> child;
  try {
    child = process::Process::spawn(descriptor_.command, descriptor_.args,
                                    options);
  } catch (const process::ProcessError &e) {
    if (e.errorNumber() == ENOENT) {
      throw TransportException(
          types::ErrorCode::CommandNotFound,
          installHint(descriptor_.command, descriptor_.args),
          {{"command", descriptor_.command}, {"detail", e.what()}});
    }
    throw TransportException("Failed to start '" + descriptor_.command +
                                 "': " + e.what(),
                             {{"command", descriptor_.command}});
  }

  {
    std::lock_guard<std::mutex> exit_lock(exit_mutex_);
    process_ = std::move(child);
    exit_code_.reset();
  }

  running_ = true;

  read_thread_ = std::thread(&ProcessTransport::readLoop, this);
  write_thread_ = std::thread(&ProcessTransport::writeLoop, this);
  if (config_.capture_stderr) {
    stderr_thread_ = std::thread(&ProcessTransport::stderrLoop, this);
  }

  TOOLBRIDGE_LOG_INFO(tag() + "started '" + descriptor_.command +
                      "' (pid " + std::to_string(process_->pid()) + ")");
}

void ProcessTransport::disconnect() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!process_) {
    return;
  }

  running_ = false;
  send_queue_cv_.notify_all();

  reapChild();
  joinThreads();
  failQueuedSends();
}

bool ProcessTransport::isConnected() const { return running_; }

std::optional<int> ProcessTransport::exitCode() const {
  std::lock_guard<std::mutex> lock(exit_mutex_);
  return exit_code_;
}

pid_t ProcessTransport::pid() const {
  std::lock_guard<std::mutex> lock(exit_mutex_);
  return process_ && !exit_code_ ? process_->pid() : -1;
}

void ProcessTransport::readLoop() {
  LineFramer framer(config_.max_line_length);
  process::Pipe &out = process_->stdoutPipe();
  std::vector<char> buffer(64 * 1024);
  bool end_of_stream = false;

  try {
    while (running_) {
      if (!out.waitReadable(config_.poll_interval)) {
        continue;
      }

      std::size_t bytes = out.read(buffer.data(), buffer.size());
      if (bytes == 0) {
        end_of_stream = true;
        break;
      }

      std::size_t dropped = framer.droppedLines();
      auto lines = framer.feed(std::string_view(buffer.data(), bytes));
      if (framer.droppedLines() != dropped) {
        reportError(ProcessTransportError::LineTooLong,
                    "line exceeded " +
                        std::to_string(config_.max_line_length) + " bytes");
      }
      for (const auto &line : lines) {
        processLine(line);
      }
    }
  } catch (const process::ProcessError &e) {
    TOOLBRIDGE_LOG_ERROR(tag() + "error reading stdout: " + e.what());
    reportError(ProcessTransportError::ReadError, e.what());
    end_of_stream = true;
  }

  if (!end_of_stream) {
    return;
  }

  if (auto tail = framer.finish()) {
    processLine(*tail);
  }

  // Whoever clears running_ owns the close; a local disconnect won the race.
  if (!running_.exchange(false)) {
    return;
  }
  send_queue_cv_.notify_all();

  TOOLBRIDGE_LOG_WARNING(tag() + "server closed its output stream");
  reapChild();

  CloseCallback close_callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    close_callback = close_callback_;
  }

  if (close_callback) {
    try {
      close_callback();
    } catch (const std::exception &e) {
      TOOLBRIDGE_LOG_ERROR(tag() + "exception in close callback: " +
                           std::string(e.what()));
    }
  }
}

void ProcessTransport::writeLoop() {
  process::Pipe &in = process_->stdinPipe();

  while (true) {
    SendOperation op;
    {
      std::unique_lock<std::mutex> lock(send_queue_mutex_);

      send_queue_cv_.wait(lock,
                          [this] { return !running_ || !send_queue_.empty(); });

      if (!running_) {
        break;
      }

      op = std::move(send_queue_.front());
      send_queue_.pop();
    }

    std::error_code result;
    try {
      in.write(op.line);
    } catch (const process::ProcessError &e) {
      TOOLBRIDGE_LOG_ERROR(tag() + "error writing to stdin: " + e.what());
      result = make_error_code(ProcessTransportError::WriteError);
      reportError(ProcessTransportError::WriteError, e.what());
    }

    if (op.callback) {
      op.callback(result);
    }
  }

  // EOF on stdin asks the server to exit.
  in.close();
  failQueuedSends();
}

void ProcessTransport::stderrLoop() {
  LineFramer framer(config_.max_line_length);
  process::Pipe &err = process_->stderrPipe();
  std::vector<char> buffer(4096);

  try {
    while (running_) {
      if (!err.waitReadable(config_.poll_interval)) {
        continue;
      }
      std::size_t bytes = err.read(buffer.data(), buffer.size());
      if (bytes == 0) {
        break;
      }
      for (const auto &line :
           framer.feed(std::string_view(buffer.data(), bytes))) {
        TOOLBRIDGE_LOG_DEBUG(tag() + "stderr: " + line);
      }
    }
  } catch (const process::ProcessError &e) {
    TOOLBRIDGE_LOG_WARNING(tag() + "error reading stderr: " + e.what());
    return;
  }

  if (auto tail = framer.finish()) {
    TOOLBRIDGE_LOG_DEBUG(tag() + "stderr: " + *tail);
  }
}

void ProcessTransport::processLine(const std::string &line) {
  TOOLBRIDGE_LOG_TRACE(tag() + "<- " + line);

  types::JSONRPCMessage message;
  try {
    message = json_utils::parseMessage(line);
  } catch (const ToolBridgeException &e) {
    TOOLBRIDGE_LOG_WARNING(tag() + "dropping malformed line: " + e.what());
    reportError(ProcessTransportError::FramingError, line);
    return;
  }

  MessageCallback message_callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    message_callback = message_callback_;
  }

  if (message_callback) {
    try {
      message_callback(std::move(message));
    } catch (const std::exception &e) {
      TOOLBRIDGE_LOG_ERROR(tag() + "exception in message callback: " +
                           std::string(e.what()));
    }
  }
}

void ProcessTransport::reportError(ProcessTransportError error,
                                   const std::string &detail) {
  ErrorCallback error_callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    error_callback = error_callback_;
  }

  if (error_callback) {
    try {
      error_callback(make_error_code(error), detail);
    } catch (const std::exception &e) {
      TOOLBRIDGE_LOG_ERROR(tag() + "exception in error callback: " +
                           std::string(e.what()));
    }
  }
}

void ProcessTransport::reapChild() {
  if (exitCode()) {
    return;
  }

  std::optional<int> code;
  try {
    code = process_->waitFor(config_.shutdown_grace);
    if (!code) {
      TOOLBRIDGE_LOG_WARNING(tag() + "server did not exit, sending SIGTERM");
      process_->terminate();
      code = process_->waitFor(config_.shutdown_grace);
    }
    if (!code) {
      TOOLBRIDGE_LOG_WARNING(tag() + "server ignored SIGTERM, sending SIGKILL");
      process_->kill();
      code = process_->waitFor(config_.shutdown_grace);
    }
  } catch (const process::ProcessError &e) {
    TOOLBRIDGE_LOG_ERROR(tag() + "failed to reap server: " + e.what());
    return;
  }

  if (code) {
    TOOLBRIDGE_LOG_INFO(tag() + "server exited with code " +
                        std::to_string(*code));
    std::lock_guard<std::mutex> lock(exit_mutex_);
    exit_code_ = code;
  }
}

void ProcessTransport::joinThreads() {
  for (std::thread *thread : {&read_thread_, &write_thread_, &stderr_thread_}) {
    if (thread->joinable() && thread->get_id() != std::this_thread::get_id()) {
      thread->join();
    }
  }
}

void ProcessTransport::failQueuedSends() {
  std::queue<SendOperation> pending;
  {
    std::lock_guard<std::mutex> lock(send_queue_mutex_);
    std::swap(pending, send_queue_);
  }

  while (!pending.empty()) {
    auto &op = pending.front();
    if (op.callback) {
      op.callback(make_error_code(ProcessTransportError::Disconnected));
    }
    pending.pop();
  }
}

std::string ProcessTransport::tag() const {
  return logging::serverTag(config_.server_id.empty() ? descriptor_.command
                                                      : config_.server_id);
}

} // namespace transport
} // namespace toolbridge
