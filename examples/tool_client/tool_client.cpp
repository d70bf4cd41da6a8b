#include "toolbridge/config/config_loader.hpp"
#include "toolbridge/session/session_registry.hpp"
#include "toolbridge/utils/error.hpp"
#include "toolbridge/utils/json_utils.hpp"
#include "toolbridge/utils/logging.hpp"
#include <chrono>
#include <iostream>
#include <string>

// Usage: tool_client <config.json> [server-id tool-name [json-arguments]]
//
// Connects every auto-connect server in the configuration, prints the tools
// each one offers and optionally calls a single tool.

using namespace toolbridge;
using namespace toolbridge::types;

namespace {

void printUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " <config.json> [server-id tool-name [json-arguments]]"
            << std::endl;
}

void printResult(const CallToolResult &result) {
  if (result.is_error) {
    std::cout << "Tool reported an error:" << std::endl;
  }
  for (const auto &item : result.content) {
    if (item.value("type", std::string()) == "text") {
      std::cout << item.value("text", std::string()) << std::endl;
    } else {
      std::cout << item.dump(2) << std::endl;
    }
  }
  if (result.structured_content) {
    std::cout << result.structured_content->dump(2) << std::endl;
  }
}

} // namespace

int main(int argc, char **argv) {
  if (argc != 2 && argc != 4 && argc != 5) {
    printUsage(argv[0]);
    return 2;
  }

  config::Config settings;
  try {
    settings = config::loadConfigFile(argv[1]);
  } catch (const ToolBridgeException &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  logging::setLevel(settings.log_level);

  session::SessionRegistry registry(settings.registry);
  registry.setNotificationHandler(
      [](const std::string &server_id, const JSONRPCNotification &notification) {
        TOOLBRIDGE_LOG_INFO(logging::serverTag(server_id) +
                            "notification: " + notification.method);
      });
  registry.setErrorHandler(
      [](const std::string &server_id, const ToolBridgeException &error) {
        TOOLBRIDGE_LOG_ERROR(logging::serverTag(server_id) + error.what());
      });

  auto outcomes = registry.autoConnect(settings.servers);
  for (const auto &[id, outcome] : outcomes) {
    if (outcome.connected) {
      std::cout << "Connected: " << id << std::endl;
    } else {
      std::cout << "Failed: " << id << ": "
                << (outcome.error ? outcome.error->message : "unknown error")
                << std::endl;
    }
  }

  for (const auto &id : registry.listConnectedServers()) {
    try {
      auto tools = registry.listTools(id).get();
      std::cout << id << " offers " << tools.size() << " tool(s)" << std::endl;
      for (const auto &tool : tools) {
        std::cout << "  " << tool.name;
        if (!tool.description.empty()) {
          std::cout << " - " << tool.description;
        }
        std::cout << std::endl;
      }
    } catch (const ToolBridgeException &e) {
      std::cerr << id << ": listing tools failed: " << e.what() << std::endl;
    }
  }

  int status = 0;
  if (argc >= 4) {
    std::string server_id = argv[2];
    std::string tool_name = argv[3];
    try {
      nlohmann::json arguments = argc == 5
                                     ? json_utils::parse(argv[4])
                                     : nlohmann::json::object();
      auto result = registry.callTool(server_id, tool_name, arguments).get();
      printResult(result);
      status = result.is_error ? 1 : 0;
    } catch (const ToolBridgeException &e) {
      std::cerr << "Error: " << e.what() << " (code " << e.code() << ")"
                << std::endl;
      status = 1;
    }
  }

  registry.disconnectAll();
  TOOLBRIDGE_LOG_INFO("tool client shut down");
  return status;
}
