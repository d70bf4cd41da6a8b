#ifndef TOOLBRIDGE_TRANSPORT_TRANSPORT_HPP_
#define TOOLBRIDGE_TRANSPORT_TRANSPORT_HPP_

#include "toolbridge/types.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <system_error>

namespace toolbridge {
namespace transport {

/**
 * @brief Abstract base class for transport implementations
 *
 * A transport moves whole JSON-RPC messages between this process and one
 * tool server. Callbacks are invoked from the transport's own threads.
 */
class Transport {
public:
  using MessageCallback = std::function<void(types::JSONRPCMessage)>;
  using ErrorCallback =
      std::function<void(std::error_code, const std::string &detail)>;
  using CloseCallback = std::function<void()>;

  virtual ~Transport() = default;

  /**
   * @brief Asynchronously send a message
   *
   * @param message The message to send
   * @param callback The callback to invoke when the operation completes
   */
  virtual void send(const types::JSONRPCMessage &message,
                    std::function<void(const std::error_code &)> callback) = 0;

  /**
   * @brief Synchronously send a message with timeout
   *
   * @param message The message to send
   * @param timeout The timeout for the operation
   * @return std::error_code An error code if the operation failed
   */
  virtual std::error_code
  send(const types::JSONRPCMessage &message,
       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) = 0;

  /**
   * @brief Set the callback for received messages
   */
  virtual void setMessageCallback(MessageCallback callback) = 0;

  /**
   * @brief Set the callback for transport errors
   *
   * The detail string carries context such as the offending line for a
   * framing error.
   */
  virtual void setErrorCallback(ErrorCallback callback) = 0;

  /**
   * @brief Set the callback for a connection closed by the peer
   *
   * Not invoked when the close was initiated through disconnect().
   */
  virtual void setCloseCallback(CloseCallback callback) = 0;

  /**
   * @brief Open the transport
   *
   * @throws TransportException if the transport cannot be opened
   */
  virtual void connect() = 0;

  /**
   * @brief Close the transport; safe to call repeatedly
   */
  virtual void disconnect() = 0;

  virtual bool isConnected() const = 0;
};

} // namespace transport
} // namespace toolbridge

#endif // TOOLBRIDGE_TRANSPORT_TRANSPORT_HPP_
