#include "toolbridge/transport/line_framer.hpp"
#include "toolbridge/utils/json_utils.hpp"

namespace toolbridge {
namespace transport {

namespace {
bool isBlank(const std::string &line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}
} // namespace

LineFramer::LineFramer(std::size_t max_line_length)
    : max_line_length_(max_line_length) {}

std::string LineFramer::encode(const types::JSONRPCMessage &message) {
  // nlohmann::json::dump() escapes control characters, so the output never
  // contains a raw newline.
  return json_utils::serializeMessage(message) + "\n";
}

std::vector<std::string> LineFramer::feed(std::string_view bytes) {
  std::vector<std::string> lines;

  while (!bytes.empty()) {
    auto newline = bytes.find('\n');
    std::string_view chunk =
        newline == std::string_view::npos ? bytes : bytes.substr(0, newline);

    if (discarding_) {
      if (newline != std::string_view::npos) {
        discarding_ = false;
      }
    } else if (buffer_.size() + chunk.size() > max_line_length_) {
      buffer_.clear();
      ++dropped_lines_;
      discarding_ = newline == std::string_view::npos;
    } else {
      buffer_.append(chunk);
      if (newline != std::string_view::npos) {
        emit(lines);
      }
    }

    if (newline == std::string_view::npos) {
      break;
    }
    bytes.remove_prefix(newline + 1);
  }

  return lines;
}

std::optional<std::string> LineFramer::finish() {
  discarding_ = false;
  std::vector<std::string> lines;
  emit(lines);
  if (lines.empty()) {
    return std::nullopt;
  }
  return std::move(lines.front());
}

void LineFramer::emit(std::vector<std::string> &lines) {
  std::string line;
  line.swap(buffer_);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (!isBlank(line)) {
    lines.push_back(std::move(line));
  }
}

} // namespace transport
} // namespace toolbridge
