#include "toolbridge/transport/process_transport.hpp"
#include "toolbridge/utils/error.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace toolbridge;
using namespace toolbridge::types;
using json = nlohmann::json;

// Test fixture for error handling tests
class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, ToolBridgeExceptionWithErrorData) {
  ErrorData error_data{.code = static_cast<int>(ErrorCode::InvalidParams),
                       .message = "Invalid parameters",
                       .data = json{{"param", "value"}}};

  ToolBridgeException exception(error_data);

  EXPECT_EQ(exception.what(), std::string("Invalid parameters"));
  EXPECT_EQ(exception.code(), static_cast<int>(ErrorCode::InvalidParams));
  EXPECT_EQ(exception.error(), error_data);
}

TEST_F(ErrorTest, ToolBridgeExceptionWithErrorCode) {
  ToolBridgeException exception(ErrorCode::InvalidRequest, "Invalid request");

  EXPECT_EQ(exception.what(), std::string("Invalid request"));
  EXPECT_EQ(exception.error().code,
            static_cast<int>(ErrorCode::InvalidRequest));
  EXPECT_TRUE(exception.error().data.is_null());
}

TEST_F(ErrorTest, TransportExceptionFromErrorCode) {
  TransportException exception(
      make_error_code(transport::ProcessTransportError::WriteError));

  EXPECT_EQ(exception.code(), static_cast<int>(ErrorCode::TransportError));
  EXPECT_EQ(exception.error().data["category"], "process_transport");
  EXPECT_EQ(exception.error().data["value"],
            static_cast<int>(transport::ProcessTransportError::WriteError));
}

TEST_F(ErrorTest, CommandNotFoundIsATransportException) {
  TransportException exception(ErrorCode::CommandNotFound, "npx not found",
                               json{{"command", "npx"}});

  EXPECT_EQ(exception.code(), static_cast<int>(ErrorCode::CommandNotFound));
  EXPECT_EQ(exception.error().data["command"], "npx");
}

TEST_F(ErrorTest, LocalErrorCodes) {
  EXPECT_EQ(TimeoutException("t").code(), static_cast<int>(ErrorCode::Timeout));
  EXPECT_EQ(ConnectionClosedException("c").code(),
            static_cast<int>(ErrorCode::ConnectionClosed));
  EXPECT_EQ(NotConnectedException("n").code(),
            static_cast<int>(ErrorCode::NotConnected));
  EXPECT_EQ(UnreachableException("u").code(),
            static_cast<int>(ErrorCode::Unreachable));
  EXPECT_EQ(ProcessCrashedException("p").code(),
            static_cast<int>(ErrorCode::ProcessCrashed));
  EXPECT_EQ(InvalidArgumentsException("i").code(),
            static_cast<int>(ErrorCode::InvalidParams));
  EXPECT_EQ(ConfigException("c").code(),
            static_cast<int>(ErrorCode::ConfigError));
  EXPECT_EQ(ProtocolException("p").code(),
            static_cast<int>(ErrorCode::ProtocolError));
}

TEST_F(ErrorTest, ServerScopedExceptions) {
  UnknownServerException unknown("git");
  EXPECT_EQ(unknown.serverId(), "git");
  EXPECT_EQ(unknown.code(), static_cast<int>(ErrorCode::UnknownServer));
  EXPECT_EQ(unknown.error().data["serverId"], "git");

  AlreadyConnectingException connecting("git");
  EXPECT_EQ(connecting.code(), static_cast<int>(ErrorCode::AlreadyConnecting));

  UnsupportedProtocolException unsupported("1999-01-01");
  EXPECT_EQ(unsupported.version(), "1999-01-01");
  EXPECT_EQ(unsupported.error().data["protocolVersion"], "1999-01-01");
}

TEST_F(ErrorTest, RemoteErrorsKeepPeerCode) {
  ErrorData peer{.code = -32050, .message = "disk full", .data = nullptr};

  ToolExecutionException execution("write_file", peer);
  EXPECT_EQ(execution.toolName(), "write_file");
  EXPECT_EQ(execution.code(), -32050);
  EXPECT_EQ(execution.what(), std::string("disk full"));

  ToolNotFoundException not_found(
      "missing", {.code = -32601, .message = "Tool not found", .data = nullptr});
  EXPECT_EQ(not_found.toolName(), "missing");

  const RemoteErrorException &base = not_found;
  EXPECT_EQ(base.code(), -32601);
}

TEST_F(ErrorTest, FramingExceptionKeepsLine) {
  FramingException exception("bad line", "not json {");

  EXPECT_EQ(exception.code(), static_cast<int>(ErrorCode::FramingError));
  EXPECT_EQ(exception.error().data["line"], "not json {");
}

TEST_F(ErrorTest, CreateErrorResponseFromErrorData) {
  ErrorData error_data{.code = static_cast<int>(ErrorCode::InvalidParams),
                       .message = "Invalid parameters",
                       .data = json{{"param", "value"}}};

  JSONRPCError error_response =
      createErrorResponse(std::int64_t{123}, error_data);

  EXPECT_EQ(error_response.jsonrpc, "2.0");
  EXPECT_EQ(std::get<std::int64_t>(error_response.id), 123);
  EXPECT_EQ(error_response.error, error_data);
}

TEST_F(ErrorTest, CreateErrorResponseFromErrorCodeAndMessage) {
  JSONRPCError error_response = createErrorResponse(
      std::string("request1"), ErrorCode::MethodNotFound, "Method not found");

  EXPECT_EQ(std::get<std::string>(error_response.id), "request1");
  EXPECT_EQ(error_response.error.code,
            static_cast<int>(ErrorCode::MethodNotFound));
  EXPECT_EQ(error_response.error.message, "Method not found");
  EXPECT_TRUE(error_response.error.data.is_null());
}
