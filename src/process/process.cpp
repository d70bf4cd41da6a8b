#include "toolbridge/process/process.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern "C" char **environ;

namespace toolbridge {
namespace process {

namespace {
std::string errnoMessage(int error_number) {
  return std::strerror(error_number);
}

void closeFd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Both ends are close-on-exec; dup2 in the child clears the flag on the
// standard descriptors only, so siblings never inherit each other's pipes.
void makePipe(int fds[2], const char *what) {
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    int error_number = errno;
    throw ProcessError(std::string("Failed to create ") + what +
                           " pipe: " + errnoMessage(error_number),
                       error_number);
  }
}

struct PipeSet {
  int in[2] = {-1, -1};
  int out[2] = {-1, -1};
  int err[2] = {-1, -1};
  int exec_status[2] = {-1, -1};

  ~PipeSet() {
    for (int *pair : {in, out, err, exec_status}) {
      closeFd(pair[0]);
      closeFd(pair[1]);
    }
  }
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void reportChildFailure(int fd) {
  int error_number = errno;
  ssize_t ignored = ::write(fd, &error_number, sizeof(error_number));
  (void)ignored;
  _exit(127);
}

std::vector<std::string> buildEnvironment(const Options &options) {
  std::map<std::string, std::string> merged;
  if (options.inherit_environment && environ != nullptr) {
    for (char **entry = environ; *entry != nullptr; ++entry) {
      std::string item(*entry);
      auto eq = item.find('=');
      if (eq != std::string::npos) {
        merged[item.substr(0, eq)] = item.substr(eq + 1);
      }
    }
  }
  for (const auto &[key, value] : options.environment) {
    merged[key] = value;
  }

  std::vector<std::string> result;
  result.reserve(merged.size());
  for (const auto &[key, value] : merged) {
    result.push_back(key + "=" + value);
  }
  return result;
}

bool isExecutableFile(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) &&
         ::access(path.c_str(), X_OK) == 0;
}
} // namespace

// Pipe

Pipe::~Pipe() { close(); }

Pipe::Pipe(Pipe &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Pipe &Pipe::operator=(Pipe &&other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

std::size_t Pipe::read(char *buffer, std::size_t size) {
  if (!isOpen()) {
    throw ProcessError("Pipe is not open", EBADF);
  }

  while (true) {
    ssize_t bytes_read = ::read(fd_, buffer, size);
    if (bytes_read >= 0) {
      return static_cast<std::size_t>(bytes_read);
    }
    if (errno != EINTR) {
      int error_number = errno;
      throw ProcessError("Read failed: " + errnoMessage(error_number),
                         error_number);
    }
  }
}

void Pipe::write(const std::string &data) {
  if (!isOpen()) {
    throw ProcessError("Pipe is not open", EBADF);
  }

  std::size_t total_written = 0;
  while (total_written < data.size()) {
    ssize_t bytes_written = ::write(fd_, data.data() + total_written,
                                    data.size() - total_written);
    if (bytes_written < 0) {
      if (errno == EINTR) {
        continue;
      }
      int error_number = errno;
      if (error_number == EPIPE) {
        throw ProcessError("Broken pipe (process closed stdin)", EPIPE);
      }
      throw ProcessError("Write failed: " + errnoMessage(error_number),
                         error_number);
    }
    total_written += static_cast<std::size_t>(bytes_written);
  }
}

bool Pipe::waitReadable(std::chrono::milliseconds timeout) {
  if (!isOpen()) {
    return false;
  }

  struct pollfd descriptor {};
  descriptor.fd = fd_;
  descriptor.events = POLLIN;

  int result = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
  if (result < 0) {
    if (errno == EINTR) {
      return false;
    }
    int error_number = errno;
    throw ProcessError("poll failed: " + errnoMessage(error_number),
                       error_number);
  }
  return result > 0 && (descriptor.revents & (POLLIN | POLLHUP | POLLERR));
}

void Pipe::close() { closeFd(fd_); }

// Process

Process::~Process() {
  stdin_.close();
  stdout_.close();
  stderr_.close();

  if (isRunning()) {
    kill();
    if (pid_ > 0) {
      ::waitpid(pid_, nullptr, 0);
    }
  }
}

std::unique_ptr<Process> Process::spawn(const std::string &executable,
                                        const std::vector<std::string> &args,
                                        const Options &options) {
  PipeSet pipes;
  makePipe(pipes.in, "stdin");
  makePipe(pipes.out, "stdout");
  if (options.capture_stderr) {
    makePipe(pipes.err, "stderr");
  }
  makePipe(pipes.exec_status, "status");

  // argv and envp are prepared before fork; the child must not allocate.
  std::vector<char *> argv;
  argv.push_back(const_cast<char *>(executable.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  bool custom_environment =
      !options.inherit_environment || !options.environment.empty();
  std::vector<std::string> environment;
  std::vector<char *> envp;
  if (custom_environment) {
    environment = buildEnvironment(options);
    for (auto &entry : environment) {
      envp.push_back(entry.data());
    }
    envp.push_back(nullptr);
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int error_number = errno;
    throw ProcessError("Failed to fork process: " + errnoMessage(error_number),
                       error_number);
  }

  if (pid == 0) {
    int status_fd = pipes.exec_status[1];

    if (::dup2(pipes.in[0], STDIN_FILENO) < 0 ||
        ::dup2(pipes.out[1], STDOUT_FILENO) < 0) {
      reportChildFailure(status_fd);
    }
    if (options.capture_stderr &&
        ::dup2(pipes.err[1], STDERR_FILENO) < 0) {
      reportChildFailure(status_fd);
    }

    if (!options.working_directory.empty() &&
        ::chdir(options.working_directory.c_str()) != 0) {
      reportChildFailure(status_fd);
    }

    // The host ignores SIGPIPE; give the child the default disposition back.
    ::signal(SIGPIPE, SIG_DFL);

    if (custom_environment) {
      ::execvpe(executable.c_str(), argv.data(), envp.data());
    } else {
      ::execvp(executable.c_str(), argv.data());
    }
    reportChildFailure(status_fd);
  }

  // Parent: the status pipe reads EOF once exec succeeds (close-on-exec).
  closeFd(pipes.exec_status[1]);
  int child_errno = 0;
  ssize_t status_bytes;
  do {
    status_bytes =
        ::read(pipes.exec_status[0], &child_errno, sizeof(child_errno));
  } while (status_bytes < 0 && errno == EINTR);

  if (status_bytes > 0) {
    ::waitpid(pid, nullptr, 0);
    throw ProcessError("Failed to execute '" + executable +
                           "': " + errnoMessage(child_errno),
                       child_errno);
  }

  std::unique_ptr<Process> process(new Process());
  process->pid_ = pid;
  process->stdin_ = Pipe(pipes.in[1]);
  pipes.in[1] = -1;
  process->stdout_ = Pipe(pipes.out[0]);
  pipes.out[0] = -1;
  if (options.capture_stderr) {
    process->stderr_ = Pipe(pipes.err[0]);
    pipes.err[0] = -1;
  }
  return process;
}

std::optional<int> Process::tryWait() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (exit_code_ || pid_ <= 0) {
    return exit_code_;
  }

  int status = 0;
  pid_t result;
  do {
    result = ::waitpid(pid_, &status, WNOHANG);
  } while (result < 0 && errno == EINTR);

  if (result == 0) {
    return std::nullopt;
  }
  if (result < 0) {
    int error_number = errno;
    throw ProcessError("waitpid failed: " + errnoMessage(error_number),
                       error_number);
  }

  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  } else {
    exit_code_ = -1;
  }
  return exit_code_;
}

std::optional<int> Process::waitFor(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (auto code = tryWait()) {
      return code;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void Process::terminate() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ > 0 && !exit_code_) {
    ::kill(pid_, SIGTERM);
  }
}

void Process::kill() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ > 0 && !exit_code_) {
    ::kill(pid_, SIGKILL);
  }
}

bool Process::isRunning() {
  std::lock_guard<std::mutex> lock(mutex_);
  return pid_ > 0 && !exit_code_;
}

std::optional<std::string> findExecutable(const std::string &name) {
  namespace fs = std::filesystem;

  if (name.empty()) {
    return std::nullopt;
  }

  if (name.find('/') != std::string::npos) {
    if (isExecutableFile(name)) {
      std::error_code ec;
      fs::path absolute = fs::absolute(name, ec);
      return ec ? name : absolute.string();
    }
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  std::string path_str = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

  std::size_t start = 0;
  while (start <= path_str.size()) {
    std::size_t end = path_str.find(':', start);
    if (end == std::string::npos) {
      end = path_str.size();
    }
    std::string dir = path_str.substr(start, end - start);
    if (!dir.empty()) {
      fs::path candidate = fs::path(dir) / name;
      if (isExecutableFile(candidate)) {
        return candidate.string();
      }
    }
    start = end + 1;
  }

  return std::nullopt;
}

} // namespace process
} // namespace toolbridge
