#ifndef TOOLBRIDGE_SESSION_TOOL_CACHE_HPP_
#define TOOLBRIDGE_SESSION_TOOL_CACHE_HPP_

#include "toolbridge/types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {
namespace session {

/**
 * @brief Last known tool list of each server, keyed by server id
 *
 * Lists keep the order in which the server returned them. Each session
 * writes only its own key.
 */
class ToolCache {
public:
  /// Replace the list for a server
  void store(const std::string &server_id, std::vector<types::Tool> tools);

  /// The cached list, or nullopt if the server has none
  std::optional<std::vector<types::Tool>>
  get(const std::string &server_id) const;

  /// Look up one tool by name in a server's list
  std::optional<types::Tool> find(const std::string &server_id,
                                  const std::string &tool_name) const;

  void clear(const std::string &server_id);

  /// Snapshot of all entries, ordered by server id
  std::map<std::string, std::vector<types::Tool>> entries() const;

private:
  std::map<std::string, std::vector<types::Tool>> tools_;
  mutable std::mutex mutex_;
};

} // namespace session
} // namespace toolbridge

#endif // TOOLBRIDGE_SESSION_TOOL_CACHE_HPP_
