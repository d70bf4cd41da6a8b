#ifndef TOOLBRIDGE_SESSION_REQUEST_CORRELATOR_HPP_
#define TOOLBRIDGE_SESSION_REQUEST_CORRELATOR_HPP_

#include "toolbridge/types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace toolbridge {
namespace session {

/**
 * @brief Matches outgoing requests with the responses that answer them
 *
 * Each request gets the next value of a 64-bit counter as its id. The
 * pending call is registered before the request is written, so a response
 * that arrives immediately still finds it. A reaper thread fails calls whose
 * deadline passes; a response arriving after that is logged and dropped.
 */
class RequestCorrelator {
public:
  /**
   * @brief Writes a message and reports the outcome of the write
   *
   * The completion may run synchronously, before the function returns.
   */
  using SendFunction =
      std::function<void(const types::JSONRPCMessage &,
                         std::function<void(const std::error_code &)>)>;

  /**
   * @brief Construct a correlator
   *
   * @param send Function used to write requests
   * @param log_tag Prefix for log lines, typically the server tag
   */
  explicit RequestCorrelator(SendFunction send, std::string log_tag = "");

  /**
   * @brief Stops the reaper and fails outstanding calls with
   * ConnectionClosedException
   */
  ~RequestCorrelator();

  RequestCorrelator(const RequestCorrelator &) = delete;
  RequestCorrelator &operator=(const RequestCorrelator &) = delete;

  /**
   * @brief Send a request and return a future for its result
   *
   * The future yields the response's result, or throws RemoteErrorException
   * (peer code and message verbatim), TimeoutException,
   * ConnectionClosedException or TransportException.
   *
   * @param method The method name
   * @param params Optional parameters
   * @param timeout Deadline measured from now
   * @return std::future<nlohmann::json> The pending result
   */
  std::future<nlohmann::json> send(const std::string &method,
                                   const std::optional<nlohmann::json> &params,
                                   std::chrono::milliseconds timeout);

  /**
   * @brief Resolve the pending call a response or error answers
   *
   * @param message An incoming message
   * @return true if a pending call was resolved; false for unknown ids and
   * for requests or notifications
   */
  bool dispatch(const types::JSONRPCMessage &message);

  /**
   * @brief Fail every outstanding call with the given exception
   */
  void failAll(std::exception_ptr error);

  /// Number of calls awaiting a response
  std::size_t pendingCount() const;

private:
  struct PendingCall {
    std::string method;
    std::chrono::steady_clock::time_point expiry;
    std::promise<nlohmann::json> promise;
  };

  void reapLoop();
  void failCall(const std::string &key, std::exception_ptr error);

  SendFunction send_;
  std::string log_tag_;

  std::int64_t next_id_ = 1;
  std::unordered_map<std::string, PendingCall> pending_;
  mutable std::mutex mutex_;

  std::condition_variable reaper_cv_;
  bool stopping_ = false;
  std::thread reaper_thread_;
};

} // namespace session
} // namespace toolbridge

#endif // TOOLBRIDGE_SESSION_REQUEST_CORRELATOR_HPP_
