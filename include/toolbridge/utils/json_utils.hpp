#ifndef TOOLBRIDGE_UTILS_JSON_UTILS_HPP_
#define TOOLBRIDGE_UTILS_JSON_UTILS_HPP_

#include "toolbridge/types.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace toolbridge {
namespace json_utils {

/**
 * @brief Validate JSON against a schema
 *
 * @param json The JSON value to validate
 * @param schema The JSON schema to validate against
 * @param error_msg Optional output parameter for error message
 * @return true if validation succeeded, false otherwise
 */
bool validate(const nlohmann::json &json, const nlohmann::json &schema,
              std::string *error_msg = nullptr);

/**
 * @brief Check that a schema can be compiled by the validator
 */
bool isValidSchema(const nlohmann::json &schema,
                   std::string *error_msg = nullptr);

/**
 * @brief Parse a JSON string
 *
 * @param json_str The JSON string to parse
 * @return nlohmann::json The parsed JSON
 * @throws FramingException if parsing fails
 */
nlohmann::json parse(const std::string &json_str);

/**
 * @brief Kind of JSON-RPC message
 */
enum class MessageType { Request, Notification, Response, Error };

/**
 * @brief Get the type of a JSON-RPC message
 *
 * @param json The JSON message
 * @return MessageType The message type
 * @throws ProtocolException if the message is not a valid JSON-RPC message
 */
MessageType getMessageType(const nlohmann::json &json);

/**
 * @brief Parse a JSON-RPC message from a single line
 *
 * @param json_str The JSON string to parse
 * @return types::JSONRPCMessage The parsed message
 * @throws FramingException if the line is not JSON
 * @throws ProtocolException if the JSON is not a valid JSON-RPC message
 */
types::JSONRPCMessage parseMessage(const std::string &json_str);

/**
 * @brief Serialize a JSON-RPC message to a compact single-line string
 */
std::string serializeMessage(const types::JSONRPCMessage &message);

/**
 * @brief Copy a JSON value with sensitive object values masked
 *
 * Any key containing password, apikey, token, secret, key or auth
 * (case-insensitive) has its value replaced by "***REDACTED***". Nested
 * objects and arrays are traversed.
 */
nlohmann::json redactSensitive(const nlohmann::json &value);

/**
 * @brief Dump a JSON value, truncated to max_length characters plus "..."
 */
std::string preview(const nlohmann::json &value,
                    std::size_t max_length = 200);

} // namespace json_utils
} // namespace toolbridge

#endif // TOOLBRIDGE_UTILS_JSON_UTILS_HPP_
