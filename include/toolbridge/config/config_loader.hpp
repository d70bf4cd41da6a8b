#ifndef TOOLBRIDGE_CONFIG_CONFIG_LOADER_HPP_
#define TOOLBRIDGE_CONFIG_CONFIG_LOADER_HPP_

#include "toolbridge/session/session_registry.hpp"
#include "toolbridge/types.hpp"
#include "toolbridge/utils/logging.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace toolbridge {
namespace config {

/**
 * @brief Settings read from a configuration file
 */
struct Config {
  logging::Level log_level = logging::Level::Info;
  session::SessionRegistry::Config registry;
  std::map<std::string, types::ServerDescriptor> servers; ///< Keyed by id
};

/**
 * @brief Build a Config from parsed JSON
 *
 * Recognized keys: logLevel, requestTimeoutMs, handshakeTimeoutMs,
 * protocolVersion, connectPolicy ("share" or "reject"), autoConnectDelayMs,
 * validateToolArguments, captureStderr and servers (also accepted as
 * mcpServers). Missing keys keep their defaults; unknown keys are ignored.
 *
 * @throws ConfigException if a value has the wrong type or is out of range
 */
Config parseConfig(const nlohmann::json &json);

/**
 * @brief Read and parse a configuration file
 *
 * @throws ConfigException if the file cannot be read or is malformed
 */
Config loadConfigFile(const std::string &path);

} // namespace config
} // namespace toolbridge

#endif // TOOLBRIDGE_CONFIG_CONFIG_LOADER_HPP_
