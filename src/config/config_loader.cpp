#include "toolbridge/config/config_loader.hpp"
#include "toolbridge/utils/error.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace toolbridge {
namespace config {

namespace {
// Keeps now() + timeout representable on the steady clock.
constexpr long long kMaxMillis = 30LL * 24 * 60 * 60 * 1000;

std::chrono::milliseconds readMillis(const nlohmann::json &json,
                                     const std::string &key,
                                     std::chrono::milliseconds fallback,
                                     long long minimum = 1) {
  if (!json.contains(key)) {
    return fallback;
  }
  const auto &value = json[key];
  if (!value.is_number_integer() || value.get<long long>() < minimum ||
      value.get<long long>() > kMaxMillis) {
    throw ConfigException("'" + key + "' must be an integer in [" +
                              std::to_string(minimum) + ", " +
                              std::to_string(kMaxMillis) + "]",
                          {{"key", key}});
  }
  return std::chrono::milliseconds(value.get<long long>());
}

bool readBool(const nlohmann::json &json, const std::string &key,
              bool fallback) {
  if (!json.contains(key)) {
    return fallback;
  }
  if (!json[key].is_boolean()) {
    throw ConfigException("'" + key + "' must be a boolean", {{"key", key}});
  }
  return json[key].get<bool>();
}

types::ServerDescriptor parseServer(const std::string &id,
                                    const nlohmann::json &json) {
  if (!json.is_object()) {
    throw ConfigException("server '" + id + "' must be an object",
                          {{"server", id}});
  }
  if (!json.contains("command") || !json["command"].is_string() ||
      json["command"].get<std::string>().empty()) {
    throw ConfigException("server '" + id + "' needs a non-empty command",
                          {{"server", id}});
  }

  types::ServerDescriptor descriptor;
  try {
    descriptor = json.get<types::ServerDescriptor>();
  } catch (const nlohmann::json::exception &e) {
    throw ConfigException("server '" + id + "': " + std::string(e.what()),
                          {{"server", id}});
  }
  if (descriptor.name.empty()) {
    descriptor.name = id;
  }
  return descriptor;
}
} // namespace

Config parseConfig(const nlohmann::json &json) {
  if (!json.is_object()) {
    throw ConfigException("configuration must be a JSON object");
  }

  Config config;
  auto &session = config.registry.session;

  if (json.contains("logLevel")) {
    if (!json["logLevel"].is_string()) {
      throw ConfigException("'logLevel' must be a string",
                            {{"key", "logLevel"}});
    }
    try {
      config.log_level =
          logging::levelFromString(json["logLevel"].get<std::string>());
    } catch (const std::invalid_argument &e) {
      throw ConfigException(e.what(), {{"key", "logLevel"}});
    }
  }

  session.request_timeout =
      readMillis(json, "requestTimeoutMs", session.request_timeout);
  session.handshake_timeout =
      readMillis(json, "handshakeTimeoutMs", session.handshake_timeout);
  config.registry.auto_connect_delay = readMillis(
      json, "autoConnectDelayMs", config.registry.auto_connect_delay, 0);
  session.validate_tool_arguments = readBool(json, "validateToolArguments",
                                             session.validate_tool_arguments);
  session.transport.capture_stderr =
      readBool(json, "captureStderr", session.transport.capture_stderr);

  if (json.contains("protocolVersion")) {
    if (!json["protocolVersion"].is_string()) {
      throw ConfigException("'protocolVersion' must be a string",
                            {{"key", "protocolVersion"}});
    }
    session.protocol_version = json["protocolVersion"].get<std::string>();
    auto &supported = session.supported_protocol_versions;
    if (std::find(supported.begin(), supported.end(),
                  session.protocol_version) == supported.end()) {
      supported.insert(supported.begin(), session.protocol_version);
    }
  }

  if (json.contains("connectPolicy")) {
    const auto &policy = json["connectPolicy"];
    if (policy == "share") {
      config.registry.connect_policy =
          session::SessionRegistry::ConnectPolicy::ShareInFlight;
    } else if (policy == "reject") {
      config.registry.connect_policy =
          session::SessionRegistry::ConnectPolicy::Reject;
    } else {
      throw ConfigException("'connectPolicy' must be \"share\" or \"reject\"",
                            {{"key", "connectPolicy"}});
    }
  }

  const char *servers_key = json.contains("servers") ? "servers"
                            : json.contains("mcpServers") ? "mcpServers"
                                                          : nullptr;
  if (servers_key) {
    const auto &servers = json[servers_key];
    if (!servers.is_object()) {
      throw ConfigException(std::string("'") + servers_key +
                                "' must be an object",
                            {{"key", servers_key}});
    }
    for (const auto &[id, server] : servers.items()) {
      config.servers[id] = parseServer(id, server);
    }
  }

  return config;
}

Config loadConfigFile(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigException("cannot open configuration file: " + path,
                          {{"path", path}});
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::parse_error &e) {
    throw ConfigException("invalid JSON in " + path + ": " + e.what(),
                          {{"path", path}});
  }
  return parseConfig(json);
}

} // namespace config
} // namespace toolbridge
