#include "toolbridge/transport/line_framer.hpp"
#include "toolbridge/utils/error.hpp"
#include "toolbridge/utils/json_utils.hpp"
#include "toolbridge/utils/logging.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>

// A tool server for exercising the client over real pipes. It speaks
// line-delimited JSON-RPC on stdin/stdout and logs to stderr.
//
// Options:
//   --protocol-version V     version reported by initialize
//   --no-initialize-response never answer initialize
//   --no-tools-capability    declare no tools capability
//   --only-echo              list mock_echo and nothing else

using namespace toolbridge;
using namespace toolbridge::types;

namespace {

struct Options {
  std::string protocol_version = "2024-11-05";
  bool answer_initialize = true;
  bool tools_capability = true;
  bool only_echo = false;
};

std::mutex g_output_mutex;

void writeMessage(const JSONRPCMessage &message) {
  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::cout << transport::LineFramer::encode(message) << std::flush;
}

void writeRaw(const std::string &line) {
  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::cout << line << '\n' << std::flush;
}

nlohmann::json textContent(const std::string &text) {
  return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

nlohmann::json toolList(bool only_echo) {
  nlohmann::json tools = nlohmann::json::array(
      {{{"name", "mock_echo"},
        {"description", "Echoes back the input"},
        {"inputSchema",
         {{"type", "object"},
          {"properties", {{"message", {{"type", "string"}}}}},
          {"required", {"message"}}}}},
       {{"name", "mock_sleep"},
        {"description", "Answers after the given number of milliseconds"},
        {"inputSchema",
         {{"type", "object"},
          {"properties", {{"ms", {{"type", "integer"}, {"minimum", 0}}}}},
          {"required", {"ms"}}}}},
       {{"name", "mock_crash"},
        {"description", "Exits immediately without answering"},
        {"inputSchema", {{"type", "object"}}}},
       {{"name", "mock_garbage"},
        {"description", "Writes a malformed line before answering"},
        {"inputSchema", {{"type", "object"}}}},
       {{"name", "mock_fail"},
        {"description", "Reports a tool-level failure"},
        {"inputSchema", {{"type", "object"}}}}});
  if (only_echo) {
    return nlohmann::json::array({tools[0]});
  }
  return tools;
}

void handleToolCall(const JSONRPCRequest &request) {
  nlohmann::json params = request.params.value_or(nlohmann::json::object());
  std::string name = params.value("name", std::string());
  nlohmann::json arguments =
      params.value("arguments", nlohmann::json::object());

  TOOLBRIDGE_LOG_INFO("tools/call " + name);

  if (name == "mock_echo") {
    std::string text = arguments.value("message", std::string());
    writeMessage(JSONRPCResponse{.id = request.id,
                                 .result = {{"content",
                                             textContent("EchoResult: " +
                                                         text)}}});
  } else if (name == "mock_sleep") {
    int ms = arguments.value("ms", 0);
    std::thread([id = request.id, ms]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(ms));
      writeMessage(JSONRPCResponse{
          .id = id,
          .result = {{"content",
                      textContent("Slept " + std::to_string(ms) + "ms")}}});
    }).detach();
  } else if (name == "mock_crash") {
    TOOLBRIDGE_LOG_WARNING("crashing on request");
    std::_Exit(3);
  } else if (name == "mock_garbage") {
    writeRaw("this is not json {");
    writeMessage(JSONRPCResponse{
        .id = request.id,
        .result = {{"content", textContent("after garbage")}}});
  } else if (name == "mock_fail") {
    writeMessage(JSONRPCResponse{
        .id = request.id,
        .result = {{"content", textContent("Tool failed")},
                   {"isError", true}}});
  } else {
    writeMessage(createErrorResponse(request.id, ErrorCode::MethodNotFound,
                                     "Tool not found"));
  }
}

void handleRequest(const JSONRPCRequest &request, const Options &options) {
  if (request.method == "initialize") {
    if (!options.answer_initialize) {
      TOOLBRIDGE_LOG_INFO("ignoring initialize");
      return;
    }
    nlohmann::json capabilities = nlohmann::json::object();
    if (options.tools_capability) {
      capabilities["tools"] = nlohmann::json::object();
    }
    writeMessage(JSONRPCResponse{
        .id = request.id,
        .result = {{"protocolVersion", options.protocol_version},
                   {"capabilities", capabilities},
                   {"serverInfo",
                    {{"name", "MockServer"}, {"version", "1.0"}}}}});
  } else if (request.method == "tools/list") {
    writeMessage(
        JSONRPCResponse{.id = request.id,
                        .result = {{"tools", toolList(options.only_echo)}}});
  } else if (request.method == "tools/call") {
    handleToolCall(request);
  } else if (request.method == "ping") {
    writeMessage(JSONRPCResponse{.id = request.id,
                                 .result = nlohmann::json::object()});
  } else {
    writeMessage(createErrorResponse(request.id, ErrorCode::MethodNotFound,
                                     "Method not found"));
  }
}

} // namespace

int main(int argc, char **argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--protocol-version" && i + 1 < argc) {
      options.protocol_version = argv[++i];
    } else if (arg == "--no-initialize-response") {
      options.answer_initialize = false;
    } else if (arg == "--no-tools-capability") {
      options.tools_capability = false;
    } else if (arg == "--only-echo") {
      options.only_echo = true;
    } else {
      std::cerr << "unknown option: " << arg << std::endl;
      return 2;
    }
  }

  // stdout carries the protocol; logs go to stderr.
  logging::setLevel(logging::Level::Info);
  TOOLBRIDGE_LOG_INFO("mock tool server started (pid " +
                      std::to_string(getpid()) + ")");

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }

    JSONRPCMessage message;
    try {
      message = json_utils::parseMessage(line);
    } catch (const ToolBridgeException &e) {
      TOOLBRIDGE_LOG_ERROR("bad input: " + std::string(e.what()));
      continue;
    }

    if (const auto *request = std::get_if<JSONRPCRequest>(&message)) {
      handleRequest(*request, options);
    } else if (const auto *notification =
                   std::get_if<JSONRPCNotification>(&message)) {
      TOOLBRIDGE_LOG_INFO("notification " + notification->method);
      if (notification->method == "notifications/initialized") {
        writeMessage(JSONRPCNotification{
            .method = "notifications/message",
            .params = nlohmann::json{{"level", "info"}, {"data", "ready"}}});
      }
    }
  }

  TOOLBRIDGE_LOG_INFO("stdin closed, exiting");
  return 0;
}
