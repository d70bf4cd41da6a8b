#include "toolbridge/utils/error.hpp"
#include "toolbridge/utils/json_utils.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <vector>

using namespace toolbridge;
using namespace toolbridge::json_utils;
using namespace toolbridge::types;
using json = nlohmann::json;

// Test fixture for JSON utilities tests
class JsonUtilsTest : public ::testing::Test {};

TEST_F(JsonUtilsTest, ParseValidJson) {
  json parsed = parse(R"({"key": "value", "number": 42})");

  EXPECT_EQ(parsed["key"], "value");
  EXPECT_EQ(parsed["number"], 42);
}

// Malformed input is a framing error carrying the offending line
TEST_F(JsonUtilsTest, ParseInvalidJson) {
  std::string json_str = R"({"key": "value", "number": 42)";

  EXPECT_THROW(
      {
        try {
          parse(json_str);
        } catch (const FramingException &e) {
          EXPECT_EQ(e.code(), static_cast<int>(ErrorCode::FramingError));
          EXPECT_EQ(e.error().data["line"], json_str);
          throw;
        }
      },
      FramingException);
}

TEST_F(JsonUtilsTest, ValidateAgainstSchema) {
  json schema = R"({
    "type": "object",
    "required": ["name", "age"],
    "properties": {
      "name": {"type": "string"},
      "age": {"type": "integer", "minimum": 0}
    }
  })"_json;

  std::string error_msg;
  EXPECT_TRUE(validate(R"({"name": "John", "age": 30})"_json, schema,
                       &error_msg));
  EXPECT_TRUE(error_msg.empty());

  EXPECT_FALSE(validate(R"({"name": "John", "age": -5})"_json, schema,
                        &error_msg));
  EXPECT_FALSE(error_msg.empty());

  EXPECT_FALSE(validate(R"({"name": "John"})"_json, schema, nullptr));
}

TEST_F(JsonUtilsTest, RejectsBrokenSchema) {
  std::string error_msg;
  EXPECT_TRUE(isValidSchema(R"({"type": "object"})"_json, &error_msg));
  EXPECT_FALSE(isValidSchema(R"({"type": 12})"_json, &error_msg));
  EXPECT_FALSE(error_msg.empty());
}

TEST_F(JsonUtilsTest, GetMessageType) {
  EXPECT_EQ(getMessageType(R"({"jsonrpc":"2.0","id":1,"method":"m"})"_json),
            MessageType::Request);
  EXPECT_EQ(getMessageType(R"({"jsonrpc":"2.0","method":"n"})"_json),
            MessageType::Notification);
  EXPECT_EQ(getMessageType(R"({"jsonrpc":"2.0","id":1,"result":{}})"_json),
            MessageType::Response);
  EXPECT_EQ(getMessageType(
                R"({"jsonrpc":"2.0","id":1,"error":{"code":1,"message":"x"}})"_json),
            MessageType::Error);

  EXPECT_THROW(getMessageType(R"({"id":1,"method":"m"})"_json),
               ProtocolException);
  EXPECT_THROW(getMessageType(R"({"jsonrpc":"2.0","id":1})"_json),
               ProtocolException);
  EXPECT_THROW(getMessageType(json::array()), ProtocolException);
}

TEST_F(JsonUtilsTest, ParseMessage) {
  JSONRPCMessage message = parseMessage(
      R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"x"}})");

  ASSERT_TRUE(std::holds_alternative<JSONRPCRequest>(message));
  const auto &request = std::get<JSONRPCRequest>(message);
  EXPECT_EQ(std::get<std::int64_t>(request.id), 1);
  EXPECT_EQ(request.method, "tools/call");
  EXPECT_EQ((*request.params)["name"], "x");
}

TEST_F(JsonUtilsTest, ParseMessageRejectsBadShapes) {
  // Valid JSON with a non-scalar id
  EXPECT_THROW(parseMessage(R"({"jsonrpc":"2.0","id":[1],"result":{}})"),
               ProtocolException);
  // Error object without a message
  EXPECT_THROW(
      parseMessage(R"({"jsonrpc":"2.0","id":1,"error":{"code":-1}})"),
      ProtocolException);
  EXPECT_THROW(parseMessage("not json"), FramingException);
  // Fractional id
  EXPECT_THROW(parseMessage(R"({"jsonrpc":"2.0","id":1.5,"result":{}})"),
               ProtocolException);
}

TEST_F(JsonUtilsTest, SerializeMessage) {
  JSONRPCNotification notification{.jsonrpc = "2.0",
                                   .method = "notifications/initialized",
                                   .params = std::nullopt};

  json j = json::parse(serializeMessage(notification));

  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["method"], "notifications/initialized");
  EXPECT_FALSE(j.contains("id"));
  EXPECT_FALSE(j.contains("params"));
}

TEST_F(JsonUtilsTest, MessagesSurviveSerializeAndParse) {
  std::vector<JSONRPCMessage> messages = {
      JSONRPCRequest{.id = std::int64_t{1},
                     .method = "tools/call",
                     .params = json{{"name", "mock_echo"},
                                    {"arguments", {{"message", "hi"}}}}},
      JSONRPCRequest{.id = std::string("req-1"),
                     .method = "ping",
                     .params = std::nullopt},
      JSONRPCNotification{.method = "notifications/message",
                          .params = json{{"level", "info"}}},
      JSONRPCNotification{.method = "notifications/initialized",
                          .params = std::nullopt},
      JSONRPCResponse{.id = std::int64_t{9007199254740993},
                      .result = json{{"tools", json::array()}}},
      JSONRPCResponse{.id = std::string("7"), .result = json::object()},
      JSONRPCError{.id = std::int64_t{3},
                   .error = {.code = -32601,
                             .message = "Method not found",
                             .data = nullptr}},
      JSONRPCError{.id = std::string("abc"),
                   .error = {.code = -32000,
                             .message = "Disk full",
                             .data = json{{"free", 0}}}},
  };

  for (const auto &message : messages) {
    std::string line = serializeMessage(message);
    EXPECT_EQ(parseMessage(line), message) << line;
  }
}

TEST_F(JsonUtilsTest, RedactSensitiveValues) {
  json arguments = R"({
    "query": "weather",
    "apiKey": "abc123",
    "nested": {"Password": "hunter2", "depth": 2},
    "items": [{"auth_token": "t"}, {"plain": "p"}]
  })"_json;

  json redacted = redactSensitive(arguments);

  EXPECT_EQ(redacted["query"], "weather");
  EXPECT_EQ(redacted["apiKey"], "***REDACTED***");
  EXPECT_EQ(redacted["nested"]["Password"], "***REDACTED***");
  EXPECT_EQ(redacted["nested"]["depth"], 2);
  EXPECT_EQ(redacted["items"][0]["auth_token"], "***REDACTED***");
  EXPECT_EQ(redacted["items"][1]["plain"], "p");

  // The input is left untouched
  EXPECT_EQ(arguments["apiKey"], "abc123");
}

TEST_F(JsonUtilsTest, PreviewTruncates) {
  json small = {{"a", 1}};
  EXPECT_EQ(preview(small), small.dump());

  json large = {{"text", std::string(500, 'x')}};
  std::string text = preview(large, 50);
  EXPECT_EQ(text.size(), 53u);
  EXPECT_EQ(text.substr(50), "...");
}
