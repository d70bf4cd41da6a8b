#include "toolbridge/session/tool_cache.hpp"
#include <algorithm>

namespace toolbridge {
namespace session {

void ToolCache::store(const std::string &server_id,
                      std::vector<types::Tool> tools) {
  std::lock_guard<std::mutex> lock(mutex_);
  tools_[server_id] = std::move(tools);
}

std::optional<std::vector<types::Tool>>
ToolCache::get(const std::string &server_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tools_.find(server_id);
  if (it == tools_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<types::Tool> ToolCache::find(const std::string &server_id,
                                           const std::string &tool_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tools_.find(server_id);
  if (it == tools_.end()) {
    return std::nullopt;
  }
  auto tool = std::find_if(
      it->second.begin(), it->second.end(),
      [&tool_name](const types::Tool &t) { return t.name == tool_name; });
  if (tool == it->second.end()) {
    return std::nullopt;
  }
  return *tool;
}

void ToolCache::clear(const std::string &server_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  tools_.erase(server_id);
}

std::map<std::string, std::vector<types::Tool>> ToolCache::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tools_;
}

} // namespace session
} // namespace toolbridge
