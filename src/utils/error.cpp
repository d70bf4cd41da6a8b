#include "toolbridge/utils/error.hpp"

namespace toolbridge {

ToolBridgeException::ToolBridgeException(types::ErrorData error)
    : std::runtime_error(error.message), error_(std::move(error)) {}

ToolBridgeException::ToolBridgeException(types::ErrorCode code,
                                         const std::string &message,
                                         const nlohmann::json &data)
    : std::runtime_error(message),
      error_({static_cast<int>(code), message, data}) {}

const types::ErrorData &ToolBridgeException::error() const { return error_; }

types::ErrorData &ToolBridgeException::error_data() { return error_; }

TransportException::TransportException(const std::string &message,
                                       const nlohmann::json &data)
    : ToolBridgeException(types::ErrorCode::TransportError, message, data) {}

TransportException::TransportException(types::ErrorCode code,
                                       const std::string &message,
                                       const nlohmann::json &data)
    : ToolBridgeException(code, message, data) {}

TransportException::TransportException(const std::error_code &error)
    : ToolBridgeException(types::ErrorCode::TransportError, error.message(),
                          {{"category", error.category().name()},
                           {"value", error.value()}}) {}

ProtocolException::ProtocolException(const std::string &message,
                                     const nlohmann::json &data)
    : ToolBridgeException(types::ErrorCode::ProtocolError, message, data) {}

ProtocolException::ProtocolException(types::ErrorCode code,
                                     const std::string &message,
                                     const nlohmann::json &data)
    : ToolBridgeException(code, message, data) {}

UnsupportedProtocolException::UnsupportedProtocolException(
    const std::string &version)
    : ToolBridgeException(types::ErrorCode::UnsupportedProtocol,
                          "Unsupported protocol version: " + version,
                          {{"protocolVersion", version}}),
      version_(version) {}

TimeoutException::TimeoutException(const std::string &message,
                                   const nlohmann::json &data)
    : ToolBridgeException(types::ErrorCode::Timeout, message, data) {}

ConnectionClosedException::ConnectionClosedException(
    const std::string &message, const nlohmann::json &data)
    : ToolBridgeException(types::ErrorCode::ConnectionClosed, message, data) {}

UnknownServerException::UnknownServerException(const std::string &server_id)
    : ToolBridgeException(types::ErrorCode::UnknownServer,
                          "Unknown server: " + server_id,
                          {{"serverId", server_id}}),
      server_id_(server_id) {}

AlreadyConnectingException::AlreadyConnectingException(
    const std::string &server_id)
    : ToolBridgeException(types::ErrorCode::AlreadyConnecting,
                          "Connection already in progress for server: " +
                              server_id,
                          {{"serverId", server_id}}) {}

NotConnectedException::NotConnectedException(const std::string &message)
    : ToolBridgeException(types::ErrorCode::NotConnected, message) {}

RemoteErrorException::RemoteErrorException(types::ErrorData error)
    : ToolBridgeException(std::move(error)) {}

ToolNotFoundException::ToolNotFoundException(const std::string &tool_name,
                                             types::ErrorData error)
    : RemoteErrorException(std::move(error)), tool_name_(tool_name) {}

ToolExecutionException::ToolExecutionException(const std::string &tool_name,
                                               types::ErrorData error)
    : RemoteErrorException(std::move(error)), tool_name_(tool_name) {}

UnreachableException::UnreachableException(const std::string &message,
                                           const nlohmann::json &data)
    : ToolBridgeException(types::ErrorCode::Unreachable, message, data) {}

FramingException::FramingException(const std::string &message,
                                   const std::string &line)
    : ToolBridgeException(types::ErrorCode::FramingError, message,
                          {{"line", line}}) {}

ProcessCrashedException::ProcessCrashedException(const std::string &message,
                                                 const nlohmann::json &data)
    : ToolBridgeException(types::ErrorCode::ProcessCrashed, message, data) {}

InvalidArgumentsException::InvalidArgumentsException(
    const std::string &message, const nlohmann::json &data)
    : ToolBridgeException(types::ErrorCode::InvalidParams, message, data) {}

ConfigException::ConfigException(const std::string &message,
                                 const nlohmann::json &data)
    : ToolBridgeException(types::ErrorCode::ConfigError, message, data) {}

types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        const types::ErrorData &error) {
  return {.jsonrpc = "2.0", .id = id, .error = error};
}

types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        types::ErrorCode code,
                                        const std::string &message,
                                        const nlohmann::json &data) {
  return {.jsonrpc = "2.0",
          .id = id,
          .error = {.code = static_cast<int>(code),
                    .message = message,
                    .data = data}};
}

} // namespace toolbridge
