#ifndef TOOLBRIDGE_PROCESS_PROCESS_HPP_
#define TOOLBRIDGE_PROCESS_PROCESS_HPP_

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <vector>

namespace toolbridge {
namespace process {

/**
 * @brief Exception thrown when a process operation fails
 *
 * Carries the errno value of the failing system call, or of the failed exec
 * in the child.
 */
class ProcessError : public std::runtime_error {
public:
  explicit ProcessError(const std::string &message, int error_number = 0)
      : std::runtime_error(message), error_number_(error_number) {}

  int errorNumber() const { return error_number_; }

private:
  int error_number_;
};

/**
 * @brief Owning wrapper around one end of a pipe
 */
class Pipe {
public:
  Pipe() = default;
  explicit Pipe(int fd) : fd_(fd) {}
  ~Pipe();

  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
  Pipe(Pipe &&other) noexcept;
  Pipe &operator=(Pipe &&other) noexcept;

  /**
   * @brief Read up to size bytes
   *
   * @return std::size_t Bytes read, 0 at end of stream
   * @throws ProcessError on read failure
   */
  std::size_t read(char *buffer, std::size_t size);

  /**
   * @brief Write all of data, retrying on short writes
   *
   * @throws ProcessError on failure, including a broken pipe
   */
  void write(const std::string &data);

  /**
   * @brief Wait until the pipe is readable or the timeout expires
   *
   * End of stream counts as readable.
   */
  bool waitReadable(std::chrono::milliseconds timeout);

  void close();
  bool isOpen() const { return fd_ >= 0; }
  int fd() const { return fd_; }

private:
  int fd_ = -1;
};

/**
 * @brief Options for spawning a subprocess
 */
struct Options {
  std::string working_directory;                  ///< Empty means inherit
  std::map<std::string, std::string> environment; ///< Added to the parent's
  bool inherit_environment = true;
  bool capture_stderr = false; ///< Pipe stderr instead of inheriting it
};

/**
 * @brief A child process with piped stdin and stdout
 *
 * The destructor closes the pipes and kills a child that is still running.
 */
class Process {
public:
  ~Process();

  Process(const Process &) = delete;
  Process &operator=(const Process &) = delete;

  /**
   * @brief Spawn a child process
   *
   * The executable is resolved through PATH. Failure to exec is detected
   * synchronously and reported as ProcessError with the child's errno.
   *
   * @param executable The command to run
   * @param args Arguments, excluding argv[0]
   * @param options Spawn options
   * @throws ProcessError if the pipes, fork or exec fail
   */
  static std::unique_ptr<Process> spawn(const std::string &executable,
                                        const std::vector<std::string> &args,
                                        const Options &options = {});

  Pipe &stdinPipe() { return stdin_; }
  Pipe &stdoutPipe() { return stdout_; }
  Pipe &stderrPipe() { return stderr_; }

  /**
   * @brief Reap the child if it has exited
   *
   * @return std::optional<int> The exit code, or 128 + signal for a child
   * killed by a signal; nullopt while running
   */
  std::optional<int> tryWait();

  /**
   * @brief Poll tryWait() until the child exits or the timeout expires
   */
  std::optional<int> waitFor(std::chrono::milliseconds timeout);

  /// Send SIGTERM
  void terminate();

  /// Send SIGKILL
  void kill();

  bool isRunning();
  pid_t pid() const { return pid_; }

private:
  Process() = default;

  pid_t pid_ = -1;
  std::optional<int> exit_code_;
  std::mutex mutex_;
  Pipe stdin_;
  Pipe stdout_;
  Pipe stderr_;
};

/**
 * @brief Find an executable in the system PATH
 *
 * Names containing a slash are checked directly.
 */
std::optional<std::string> findExecutable(const std::string &name);

} // namespace process
} // namespace toolbridge

#endif // TOOLBRIDGE_PROCESS_PROCESS_HPP_
