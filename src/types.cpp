#include "toolbridge/types.hpp"

namespace toolbridge {
namespace types {

std::string requestIdToString(const RequestId &id) {
  if (const auto *text = std::get_if<std::string>(&id)) {
    return "s:" + *text;
  }
  return "i:" + std::to_string(std::get<std::int64_t>(id));
}

std::string toString(SessionState state) {
  switch (state) {
  case SessionState::Disconnected:
    return "Disconnected";
  case SessionState::Connecting:
    return "Connecting";
  case SessionState::Initializing:
    return "Initializing";
  case SessionState::Ready:
    return "Ready";
  case SessionState::Closing:
    return "Closing";
  case SessionState::Error:
    return "Error";
  }
  return "Unknown";
}

} // namespace types
} // namespace toolbridge
