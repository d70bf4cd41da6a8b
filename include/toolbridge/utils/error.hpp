#ifndef TOOLBRIDGE_UTILS_ERROR_HPP_
#define TOOLBRIDGE_UTILS_ERROR_HPP_

#include "toolbridge/types.hpp"
#include <stdexcept>
#include <string>
#include <system_error>

namespace toolbridge {

/**
 * @brief Base exception class for toolbridge errors
 *
 * This class extends std::runtime_error and carries the JSON-RPC style error
 * data (code, message, optional data) describing the failure.
 */
class ToolBridgeException : public std::runtime_error {
public:
  /**
   * @brief Construct a new ToolBridgeException with error data
   *
   * @param error The error data
   */
  explicit ToolBridgeException(types::ErrorData error);

  /**
   * @brief Construct a new ToolBridgeException with error code and message
   *
   * @param code The error code
   * @param message The error message
   * @param data Optional additional data
   */
  explicit ToolBridgeException(types::ErrorCode code,
                               const std::string &message,
                               const nlohmann::json &data = nullptr);

  /**
   * @brief Get the error data
   *
   * @return const types::ErrorData& The error data
   */
  const types::ErrorData &error() const;

  /**
   * @brief Shorthand for error().code
   */
  int code() const { return error_.code; }

protected:
  /**
   * @brief Get mutable reference to error data for derived classes
   *
   * @return types::ErrorData& The error data
   */
  types::ErrorData &error_data();

private:
  types::ErrorData error_; ///< The error data
};

/**
 * @brief Exception for subprocess I/O and spawn failures
 */
class TransportException : public ToolBridgeException {
public:
  explicit TransportException(const std::string &message,
                              const nlohmann::json &data = nullptr);

  /**
   * @brief Construct a new TransportException with error code
   *
   * Used with ErrorCode::CommandNotFound when the launch command does not
   * resolve on PATH.
   */
  explicit TransportException(types::ErrorCode code, const std::string &message,
                              const nlohmann::json &data = nullptr);

  /**
   * @brief Construct a new TransportException from a std::error_code
   *
   * @param error The std::error_code
   */
  explicit TransportException(const std::error_code &error);
};

/**
 * @brief Exception for peers that violate the protocol
 */
class ProtocolException : public ToolBridgeException {
public:
  explicit ProtocolException(const std::string &message,
                             const nlohmann::json &data = nullptr);

  explicit ProtocolException(types::ErrorCode code, const std::string &message,
                             const nlohmann::json &data = nullptr);
};

/**
 * @brief The server answered initialize with a version we do not speak
 */
class UnsupportedProtocolException : public ToolBridgeException {
public:
  /**
   * @brief Construct a new UnsupportedProtocolException
   *
   * @param version The protocol version the server reported
   */
  explicit UnsupportedProtocolException(const std::string &version);

  const std::string &version() const { return version_; }

private:
  std::string version_;
};

/**
 * @brief A request did not complete before its deadline
 */
class TimeoutException : public ToolBridgeException {
public:
  explicit TimeoutException(const std::string &message,
                            const nlohmann::json &data = nullptr);
};

/**
 * @brief The session was torn down while the request was outstanding
 */
class ConnectionClosedException : public ToolBridgeException {
public:
  explicit ConnectionClosedException(const std::string &message,
                                     const nlohmann::json &data = nullptr);
};

/**
 * @brief No session is registered under the requested server id
 */
class UnknownServerException : public ToolBridgeException {
public:
  explicit UnknownServerException(const std::string &server_id);

  const std::string &serverId() const { return server_id_; }

private:
  std::string server_id_;
};

/**
 * @brief A connect for the server id is already in flight
 */
class AlreadyConnectingException : public ToolBridgeException {
public:
  explicit AlreadyConnectingException(const std::string &server_id);
};

/**
 * @brief The session is not in the Ready state
 */
class NotConnectedException : public ToolBridgeException {
public:
  explicit NotConnectedException(const std::string &message);
};

/**
 * @brief Error reported by the peer in a JSON-RPC error response
 *
 * The peer's code and message are kept verbatim.
 */
class RemoteErrorException : public ToolBridgeException {
public:
  explicit RemoteErrorException(types::ErrorData error);
};

/**
 * @brief The server does not know the requested tool
 */
class ToolNotFoundException : public RemoteErrorException {
public:
  ToolNotFoundException(const std::string &tool_name, types::ErrorData error);

  const std::string &toolName() const { return tool_name_; }

private:
  std::string tool_name_;
};

/**
 * @brief The tool ran and failed, as reported by the server
 */
class ToolExecutionException : public RemoteErrorException {
public:
  ToolExecutionException(const std::string &tool_name, types::ErrorData error);

  const std::string &toolName() const { return tool_name_; }

private:
  std::string tool_name_;
};

/**
 * @brief A liveness check failed
 */
class UnreachableException : public ToolBridgeException {
public:
  explicit UnreachableException(const std::string &message,
                                const nlohmann::json &data = nullptr);
};

/**
 * @brief A line from the peer could not be decoded
 *
 * The offending line is stored in error().data["line"].
 */
class FramingException : public ToolBridgeException {
public:
  FramingException(const std::string &message, const std::string &line);
};

/**
 * @brief The subprocess exited while the session was in use
 */
class ProcessCrashedException : public ToolBridgeException {
public:
  explicit ProcessCrashedException(const std::string &message,
                                   const nlohmann::json &data = nullptr);
};

/**
 * @brief Tool arguments failed validation against the tool's input schema
 */
class InvalidArgumentsException : public ToolBridgeException {
public:
  explicit InvalidArgumentsException(const std::string &message,
                                     const nlohmann::json &data = nullptr);
};

/**
 * @brief The configuration file is missing or malformed
 */
class ConfigException : public ToolBridgeException {
public:
  explicit ConfigException(const std::string &message,
                           const nlohmann::json &data = nullptr);
};

/**
 * @brief Create an error response from error data
 *
 * @param id The request ID
 * @param error The error data
 * @return types::JSONRPCError The error response
 */
types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        const types::ErrorData &error);

/**
 * @brief Create an error response from error code and message
 */
types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        types::ErrorCode code,
                                        const std::string &message,
                                        const nlohmann::json &data = nullptr);

} // namespace toolbridge

#endif // TOOLBRIDGE_UTILS_ERROR_HPP_
