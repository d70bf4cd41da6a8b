#include "toolbridge/session/request_correlator.hpp"
#include "toolbridge/utils/error.hpp"
#include "toolbridge/utils/logging.hpp"
#include <algorithm>
#include <vector>

namespace toolbridge {
namespace session {

namespace {
// Longer timeouts are clamped so the deadline stays representable.
constexpr std::chrono::hours kMaxTimeout(24 * 365 * 100);

std::chrono::steady_clock::time_point
deadlineAfter(std::chrono::milliseconds timeout) {
  if (timeout > kMaxTimeout) {
    timeout = std::chrono::duration_cast<std::chrono::milliseconds>(kMaxTimeout);
  }
  return std::chrono::steady_clock::now() + timeout;
}
} // namespace

RequestCorrelator::RequestCorrelator(SendFunction send, std::string log_tag)
    : send_(std::move(send)), log_tag_(std::move(log_tag)) {
  reaper_thread_ = std::thread(&RequestCorrelator::reapLoop, this);
}

RequestCorrelator::~RequestCorrelator() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  reaper_cv_.notify_all();
  if (reaper_thread_.joinable()) {
    reaper_thread_.join();
  }

  failAll(std::make_exception_ptr(
      ConnectionClosedException("Session closed with request outstanding")));
}

std::future<nlohmann::json>
RequestCorrelator::send(const std::string &method,
                        const std::optional<nlohmann::json> &params,
                        std::chrono::milliseconds timeout) {
  types::JSONRPCRequest request;
  request.method = method;
  request.params = params;

  std::future<nlohmann::json> future;
  std::string key;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    request.id = next_id_++;
    key = types::requestIdToString(request.id);

    PendingCall call;
    call.method = method;
    call.expiry = deadlineAfter(timeout);
    future = call.promise.get_future();
    pending_.emplace(key, std::move(call));
  }
  reaper_cv_.notify_all();

  TOOLBRIDGE_LOG_DEBUG(log_tag_ + "request " + key.substr(2) + " " + method);

  send_(request, [this, key](const std::error_code &ec) {
    if (ec) {
      TOOLBRIDGE_LOG_ERROR(log_tag_ + "failed to write request " +
                           key.substr(2) + ": " + ec.message());
      failCall(key, std::make_exception_ptr(TransportException(ec)));
    }
  });

  return future;
}

bool RequestCorrelator::dispatch(const types::JSONRPCMessage &message) {
  const types::RequestId *id = nullptr;
  if (const auto *response = std::get_if<types::JSONRPCResponse>(&message)) {
    id = &response->id;
  } else if (const auto *error = std::get_if<types::JSONRPCError>(&message)) {
    id = &error->id;
  } else {
    return false;
  }

  std::string key = types::requestIdToString(*id);
  std::optional<PendingCall> call;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(key);
    if (it != pending_.end()) {
      call = std::move(it->second);
      pending_.erase(it);
    }
  }

  if (!call) {
    TOOLBRIDGE_LOG_WARNING(log_tag_ + "received response for unknown request "
                                      "ID: " +
                           key.substr(2));
    return false;
  }

  if (const auto *response = std::get_if<types::JSONRPCResponse>(&message)) {
    call->promise.set_value(response->result);
  } else {
    const auto &error = std::get<types::JSONRPCError>(message);
    TOOLBRIDGE_LOG_DEBUG(log_tag_ + call->method + " failed: [" +
                         std::to_string(error.error.code) + "] " +
                         error.error.message);
    call->promise.set_exception(
        std::make_exception_ptr(RemoteErrorException(error.error)));
  }
  return true;
}

void RequestCorrelator::failAll(std::exception_ptr error) {
  std::unordered_map<std::string, PendingCall> calls;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    calls.swap(pending_);
  }

  if (!calls.empty()) {
    TOOLBRIDGE_LOG_DEBUG(log_tag_ + "failing " + std::to_string(calls.size()) +
                         " outstanding request(s)");
  }
  for (auto &[key, call] : calls) {
    call.promise.set_exception(error);
  }
}

std::size_t RequestCorrelator::pendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

void RequestCorrelator::failCall(const std::string &key,
                                 std::exception_ptr error) {
  std::optional<PendingCall> call;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(key);
    if (it == pending_.end()) {
      return;
    }
    call = std::move(it->second);
    pending_.erase(it);
  }
  call->promise.set_exception(error);
}

void RequestCorrelator::reapLoop() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (!stopping_) {
    if (pending_.empty()) {
      reaper_cv_.wait(lock);
      continue;
    }

    auto earliest = std::min_element(
        pending_.begin(), pending_.end(), [](const auto &a, const auto &b) {
          return a.second.expiry < b.second.expiry;
        });
    auto deadline = earliest->second.expiry;
    if (std::chrono::steady_clock::now() < deadline) {
      reaper_cv_.wait_until(lock, deadline);
      continue;
    }

    // Collect every call past its deadline, resolve them unlocked.
    auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<std::string, PendingCall>> expired;
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (it->second.expiry <= now) {
        expired.emplace_back(it->first, std::move(it->second));
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }

    lock.unlock();
    for (auto &[key, call] : expired) {
      TOOLBRIDGE_LOG_WARNING(log_tag_ + "request " + key.substr(2) + " (" +
                             call.method + ") timed out");
      call.promise.set_exception(std::make_exception_ptr(TimeoutException(
          "Request timed out: " + call.method,
          {{"method", call.method}, {"id", key.substr(2)}})));
    }
    lock.lock();
  }
}

} // namespace session
} // namespace toolbridge
