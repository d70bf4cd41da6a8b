#ifndef TOOLBRIDGE_TYPES_HPP_
#define TOOLBRIDGE_TYPES_HPP_

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolbridge {
namespace types {

/**
 * @brief JSON-RPC 2.0 error codes and the local codes used by toolbridge
 *
 * The local codes never travel over the wire; they identify failures raised
 * on the client side. Errors reported by a tool server keep the peer's code
 * verbatim, which may be any integer.
 */
enum class ErrorCode {
  // JSON-RPC 2.0 standard error codes
  ParseError = -32700,     ///< Invalid JSON was received
  InvalidRequest = -32600, ///< The JSON sent is not a valid Request object
  MethodNotFound = -32601, ///< The method does not exist / is not available
  InvalidParams = -32602,  ///< Invalid method parameter(s)
  InternalError = -32603,  ///< Internal JSON-RPC error

  // Local error codes
  ConnectionClosed = -32000,    ///< Session torn down while a call was pending
  Timeout = -32001,             ///< A call exceeded its deadline
  ProtocolError = -32002,       ///< Peer sent something the protocol forbids
  TransportError = -32003,      ///< Subprocess I/O failed
  UnsupportedProtocol = -32004, ///< Handshake version not recognized
  NotConnected = -32005,        ///< Operation requires a Ready session
  UnknownServer = -32006,       ///< No session registered under that id
  AlreadyConnecting = -32007,   ///< A connect for the id is in flight
  Unreachable = -32008,         ///< Liveness check failed
  FramingError = -32009,        ///< A line could not be decoded
  ProcessCrashed = -32010,      ///< Subprocess exited unexpectedly
  CommandNotFound = -32011,     ///< Launch command not found on PATH
  ConfigError = -32012          ///< Configuration file is malformed
};

/**
 * @brief Structure representing an error in JSON-RPC 2.0
 */
struct ErrorData {
  int code;            ///< Error code
  std::string message; ///< Error message
  nlohmann::json data; ///< Optional additional error data

  bool operator==(const ErrorData &) const = default;
};

/**
 * @brief Request identifier, a string or an integer on the wire
 */
using RequestId = std::variant<std::string, std::int64_t>;

/**
 * @brief Render a request id as the key used for correlation
 */
std::string requestIdToString(const RequestId &id);

/**
 * @brief JSON-RPC 2.0 request message
 */
struct JSONRPCRequest {
  std::string jsonrpc = "2.0";          ///< JSON-RPC version (always "2.0")
  RequestId id;                         ///< Request identifier
  std::string method;                   ///< Method name
  std::optional<nlohmann::json> params; ///< Method parameters

  bool operator==(const JSONRPCRequest &) const = default;
};

/**
 * @brief JSON-RPC 2.0 notification message (request without id)
 */
struct JSONRPCNotification {
  std::string jsonrpc = "2.0";          ///< JSON-RPC version (always "2.0")
  std::string method;                   ///< Method name
  std::optional<nlohmann::json> params; ///< Method parameters

  bool operator==(const JSONRPCNotification &) const = default;
};

/**
 * @brief JSON-RPC 2.0 success response message
 */
struct JSONRPCResponse {
  std::string jsonrpc = "2.0"; ///< JSON-RPC version (always "2.0")
  RequestId id;                ///< Request identifier
  nlohmann::json result;       ///< Result data

  bool operator==(const JSONRPCResponse &) const = default;
};

/**
 * @brief JSON-RPC 2.0 error response message
 */
struct JSONRPCError {
  std::string jsonrpc = "2.0"; ///< JSON-RPC version (always "2.0")
  RequestId id;                ///< Request identifier
  ErrorData error;             ///< Error data

  bool operator==(const JSONRPCError &) const = default;
};

/**
 * @brief Variant type that can hold any JSON-RPC 2.0 message
 */
using JSONRPCMessage = std::variant<JSONRPCRequest, JSONRPCNotification,
                                    JSONRPCResponse, JSONRPCError>;

/**
 * @brief Tool definition as listed by a tool server
 */
struct Tool {
  std::string name;            ///< Tool name, unique within a server
  std::string description;     ///< Tool description
  nlohmann::json input_schema; ///< JSON Schema for the arguments

  bool operator==(const Tool &) const = default;
};

/**
 * @brief Capabilities a server declared during the handshake
 */
struct ServerCapabilities {
  bool tools = false;              ///< Server exposes tools/list and tools/call
  bool tools_list_changed = false; ///< Server emits tools/list_changed
  bool resources = false;          ///< Server exposes resources
  bool prompts = false;            ///< Server exposes prompts
  bool logging = false;            ///< Server emits log notifications
  nlohmann::json raw = nlohmann::json::object(); ///< Capabilities as received
};

/**
 * @brief Name and version of a protocol participant
 */
struct Implementation {
  std::string name;
  std::string version;
};

/**
 * @brief Result of the initialize handshake
 */
struct InitializeResult {
  std::string protocol_version;            ///< Version the server speaks
  ServerCapabilities capabilities;         ///< Declared server capabilities
  Implementation server_info;              ///< Server identity
  std::optional<std::string> instructions; ///< Optional usage instructions
};

/**
 * @brief Result of a tools/call request
 */
struct CallToolResult {
  nlohmann::json content = nlohmann::json::array(); ///< Content items
  bool is_error = false; ///< Tool reported a failure in-band
  std::optional<nlohmann::json> structured_content;
};

/**
 * @brief Caller-supplied identity and launch recipe of a tool server
 */
struct ServerDescriptor {
  std::string name;                          ///< Display name
  std::string command;                       ///< Executable to launch
  std::vector<std::string> args;             ///< Launch arguments
  std::map<std::string, std::string> env;    ///< Extra environment variables
  std::string working_directory;             ///< Empty means inherit
  std::string description;                   ///< Free-form description
  bool auto_connect = true;                  ///< Connect on startup

  bool operator==(const ServerDescriptor &) const = default;
};

/**
 * @brief Lifecycle state of a server session
 */
enum class SessionState {
  Disconnected,
  Connecting,
  Initializing,
  Ready,
  Closing,
  Error
};

std::string toString(SessionState state);

} // namespace types
} // namespace toolbridge

// JSON serialization/deserialization functions
namespace nlohmann {

template <> struct adl_serializer<toolbridge::types::ErrorCode> {
  static void to_json(json &j, const toolbridge::types::ErrorCode &code) {
    j = static_cast<int>(code);
  }

  static void from_json(const json &j, toolbridge::types::ErrorCode &code) {
    code = static_cast<toolbridge::types::ErrorCode>(j.get<int>());
  }
};

template <> struct adl_serializer<toolbridge::types::ErrorData> {
  static void to_json(json &j, const toolbridge::types::ErrorData &error) {
    j = json{{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null()) {
      j["data"] = error.data;
    }
  }

  static void from_json(const json &j, toolbridge::types::ErrorData &error) {
    j.at("code").get_to(error.code);
    j.at("message").get_to(error.message);
    if (j.contains("data")) {
      error.data = j["data"];
    } else {
      error.data = nullptr;
    }
  }
};

template <> struct adl_serializer<toolbridge::types::RequestId> {
  static void to_json(json &j, const toolbridge::types::RequestId &id) {
    std::visit([&j](const auto &value) { j = value; }, id);
  }

  // Only strings and integers are ids. Reading any other value as a string
  // raises json::type_error, so a fractional id is never truncated.
  static void from_json(const json &j, toolbridge::types::RequestId &id) {
    if (j.is_number_integer()) {
      id = j.get<std::int64_t>();
    } else {
      id = j.get<std::string>();
    }
  }
};

template <> struct adl_serializer<toolbridge::types::JSONRPCRequest> {
  static void to_json(json &j,
                      const toolbridge::types::JSONRPCRequest &request) {
    j = json::object();
    j["jsonrpc"] = request.jsonrpc;
    j["id"] = request.id;
    j["method"] = request.method;
    if (request.params) {
      j["params"] = *request.params;
    }
  }

  static void from_json(const json &j,
                        toolbridge::types::JSONRPCRequest &request) {
    j.at("jsonrpc").get_to(request.jsonrpc);
    j.at("id").get_to(request.id);
    j.at("method").get_to(request.method);
    if (j.contains("params")) {
      request.params = j["params"];
    }
  }
};

template <> struct adl_serializer<toolbridge::types::JSONRPCResponse> {
  static void to_json(json &j,
                      const toolbridge::types::JSONRPCResponse &response) {
    j = json::object();
    j["jsonrpc"] = response.jsonrpc;
    j["id"] = response.id;
    j["result"] = response.result;
  }

  static void from_json(const json &j,
                        toolbridge::types::JSONRPCResponse &response) {
    j.at("jsonrpc").get_to(response.jsonrpc);
    j.at("id").get_to(response.id);
    response.result = j.at("result");
  }
};

template <> struct adl_serializer<toolbridge::types::JSONRPCError> {
  static void to_json(json &j, const toolbridge::types::JSONRPCError &error) {
    j = json::object();
    j["jsonrpc"] = error.jsonrpc;
    j["id"] = error.id;
    j["error"] = error.error;
  }

  static void from_json(const json &j,
                        toolbridge::types::JSONRPCError &error) {
    j.at("jsonrpc").get_to(error.jsonrpc);
    j.at("id").get_to(error.id);
    j.at("error").get_to(error.error);
  }
};

template <> struct adl_serializer<toolbridge::types::JSONRPCNotification> {
  static void
  to_json(json &j,
          const toolbridge::types::JSONRPCNotification &notification) {
    j = json::object();
    j["jsonrpc"] = notification.jsonrpc;
    j["method"] = notification.method;
    if (notification.params) {
      j["params"] = *notification.params;
    }
  }

  static void from_json(const json &j,
                        toolbridge::types::JSONRPCNotification &notification) {
    j.at("jsonrpc").get_to(notification.jsonrpc);
    j.at("method").get_to(notification.method);
    if (j.contains("params")) {
      notification.params = j["params"];
    }
  }
};

template <> struct adl_serializer<toolbridge::types::Tool> {
  static void to_json(json &j, const toolbridge::types::Tool &tool) {
    j = json::object();
    j["name"] = tool.name;
    j["description"] = tool.description;
    j["inputSchema"] = tool.input_schema.is_null() ? json::object()
                                                   : tool.input_schema;
  }

  // Servers routinely omit the description; the schema defaults to an
  // unconstrained object.
  static void from_json(const json &j, toolbridge::types::Tool &tool) {
    j.at("name").get_to(tool.name);
    tool.description = j.value("description", std::string());
    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
      tool.input_schema = j["inputSchema"];
    } else {
      tool.input_schema = json{{"type", "object"}};
    }
  }
};

template <> struct adl_serializer<toolbridge::types::ServerCapabilities> {
  static void
  to_json(json &j, const toolbridge::types::ServerCapabilities &capabilities) {
    j = capabilities.raw.is_object() ? capabilities.raw : json::object();
    if (capabilities.tools && !j.contains("tools")) {
      j["tools"] = json::object();
    }
    if (capabilities.tools_list_changed) {
      j["tools"]["listChanged"] = true;
    }
    if (capabilities.resources && !j.contains("resources")) {
      j["resources"] = json::object();
    }
    if (capabilities.prompts && !j.contains("prompts")) {
      j["prompts"] = json::object();
    }
    if (capabilities.logging && !j.contains("logging")) {
      j["logging"] = json::object();
    }
  }

  static void from_json(const json &j,
                        toolbridge::types::ServerCapabilities &capabilities) {
    capabilities.raw = j.is_object() ? j : json::object();
    capabilities.tools = j.contains("tools") && !j["tools"].is_null();
    capabilities.tools_list_changed =
        capabilities.tools && j["tools"].is_object() &&
        j["tools"].value("listChanged", false);
    capabilities.resources =
        j.contains("resources") && !j["resources"].is_null();
    capabilities.prompts = j.contains("prompts") && !j["prompts"].is_null();
    capabilities.logging = j.contains("logging") && !j["logging"].is_null();
  }
};

template <> struct adl_serializer<toolbridge::types::Implementation> {
  static void to_json(json &j, const toolbridge::types::Implementation &info) {
    j = json{{"name", info.name}, {"version", info.version}};
  }

  static void from_json(const json &j,
                        toolbridge::types::Implementation &info) {
    j.at("name").get_to(info.name);
    info.version = j.value("version", std::string());
  }
};

template <> struct adl_serializer<toolbridge::types::InitializeResult> {
  static void to_json(json &j,
                      const toolbridge::types::InitializeResult &result) {
    j = json::object();
    j["protocolVersion"] = result.protocol_version;
    j["capabilities"] = result.capabilities;
    j["serverInfo"] = result.server_info;
    if (result.instructions) {
      j["instructions"] = *result.instructions;
    }
  }

  static void from_json(const json &j,
                        toolbridge::types::InitializeResult &result) {
    j.at("protocolVersion").get_to(result.protocol_version);
    if (j.contains("capabilities")) {
      j["capabilities"].get_to(result.capabilities);
    } else {
      result.capabilities = {};
    }
    if (j.contains("serverInfo")) {
      j["serverInfo"].get_to(result.server_info);
    }
    if (j.contains("instructions") && j["instructions"].is_string()) {
      result.instructions = j["instructions"].get<std::string>();
    }
  }
};

template <> struct adl_serializer<toolbridge::types::CallToolResult> {
  static void to_json(json &j,
                      const toolbridge::types::CallToolResult &result) {
    j = json::object();
    j["content"] = result.content;
    if (result.is_error) {
      j["isError"] = true;
    }
    if (result.structured_content) {
      j["structuredContent"] = *result.structured_content;
    }
  }

  static void from_json(const json &j,
                        toolbridge::types::CallToolResult &result) {
    if (j.contains("content") && j["content"].is_array()) {
      result.content = j["content"];
    } else {
      result.content = json::array();
    }
    result.is_error = j.value("isError", false);
    if (j.contains("structuredContent")) {
      result.structured_content = j["structuredContent"];
    }
  }
};

template <> struct adl_serializer<toolbridge::types::ServerDescriptor> {
  static void to_json(json &j,
                      const toolbridge::types::ServerDescriptor &descriptor) {
    j = json::object();
    j["name"] = descriptor.name;
    j["command"] = descriptor.command;
    j["args"] = descriptor.args;
    if (!descriptor.env.empty()) {
      j["env"] = descriptor.env;
    }
    if (!descriptor.working_directory.empty()) {
      j["cwd"] = descriptor.working_directory;
    }
    if (!descriptor.description.empty()) {
      j["description"] = descriptor.description;
    }
    j["autoConnect"] = descriptor.auto_connect;
  }

  static void from_json(const json &j,
                        toolbridge::types::ServerDescriptor &descriptor) {
    j.at("command").get_to(descriptor.command);
    descriptor.name = j.value("name", std::string());
    descriptor.args =
        j.value("args", std::vector<std::string>());
    descriptor.env =
        j.value("env", std::map<std::string, std::string>());
    descriptor.working_directory = j.value("cwd", std::string());
    descriptor.description = j.value("description", std::string());
    descriptor.auto_connect = j.value("autoConnect", true);
  }
};

} // namespace nlohmann

#endif // TOOLBRIDGE_TYPES_HPP_
