#include "toolbridge/utils/json_utils.hpp"
#include "toolbridge/utils/error.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <nlohmann/json-schema.hpp>
#include <string_view>

namespace toolbridge {
namespace json_utils {

namespace {
constexpr std::array<std::string_view, 6> kSensitiveKeys = {
    "password", "apikey", "token", "secret", "key", "auth"};

bool isSensitiveKey(const std::string &key) {
  std::string lower = key;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return std::any_of(kSensitiveKeys.begin(), kSensitiveKeys.end(),
                     [&lower](std::string_view needle) {
                       return lower.find(needle) != std::string::npos;
                     });
}
} // namespace

bool validate(const nlohmann::json &json, const nlohmann::json &schema,
              std::string *error_msg) {
  try {
    nlohmann::json_schema::json_validator validator;
    validator.set_root_schema(schema);
    validator.validate(json);
    return true;
  } catch (const std::exception &e) {
    if (error_msg) {
      *error_msg = e.what();
    }
    return false;
  }
}

bool isValidSchema(const nlohmann::json &schema, std::string *error_msg) {
  try {
    nlohmann::json_schema::json_validator validator;
    validator.set_root_schema(schema);
    return true;
  } catch (const std::exception &e) {
    if (error_msg) {
      *error_msg = e.what();
    }
    return false;
  }
}

nlohmann::json parse(const std::string &json_str) {
  try {
    return nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error &e) {
    throw FramingException("JSON parse error: " + std::string(e.what()),
                           json_str);
  }
}

MessageType getMessageType(const nlohmann::json &json) {
  // Validate it's a JSON-RPC 2.0 message
  if (!json.is_object() || !json.contains("jsonrpc") ||
      json["jsonrpc"] != "2.0") {
    throw ProtocolException(
        "Invalid JSON-RPC message: missing or invalid jsonrpc version");
  }

  if (json.contains("error") && json.contains("id")) {
    return MessageType::Error;
  }

  if (json.contains("result") && json.contains("id")) {
    return MessageType::Response;
  }

  if (json.contains("method")) {
    if (json.contains("id")) {
      return MessageType::Request;
    } else {
      return MessageType::Notification;
    }
  }

  throw ProtocolException(
      "Invalid JSON-RPC message: cannot determine message type");
}

types::JSONRPCMessage parseMessage(const std::string &json_str) {
  nlohmann::json json = parse(json_str);

  try {
    switch (getMessageType(json)) {
    case MessageType::Request:
      return json.get<types::JSONRPCRequest>();

    case MessageType::Notification:
      return json.get<types::JSONRPCNotification>();

    case MessageType::Response:
      return json.get<types::JSONRPCResponse>();

    case MessageType::Error:
      return json.get<types::JSONRPCError>();
    }
  } catch (const nlohmann::json::exception &e) {
    throw ProtocolException("JSON-RPC message parse error: " +
                                std::string(e.what()),
                            json);
  }
  throw ProtocolException("Unknown message type", json);
}

std::string serializeMessage(const types::JSONRPCMessage &message) {
  return std::visit([](const auto &msg) { return nlohmann::json(msg).dump(); },
                    message);
}

nlohmann::json redactSensitive(const nlohmann::json &value) {
  if (value.is_object()) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto &[key, item] : value.items()) {
      result[key] = isSensitiveKey(key) ? nlohmann::json("***REDACTED***")
                                        : redactSensitive(item);
    }
    return result;
  }
  if (value.is_array()) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto &item : value) {
      result.push_back(redactSensitive(item));
    }
    return result;
  }
  return value;
}

std::string preview(const nlohmann::json &value, std::size_t max_length) {
  std::string text = value.dump();
  if (text.size() <= max_length) {
    return text;
  }
  return text.substr(0, max_length) + "...";
}

} // namespace json_utils
} // namespace toolbridge
