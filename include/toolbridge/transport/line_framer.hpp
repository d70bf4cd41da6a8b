#ifndef TOOLBRIDGE_TRANSPORT_LINE_FRAMER_HPP_
#define TOOLBRIDGE_TRANSPORT_LINE_FRAMER_HPP_

#include "toolbridge/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge {
namespace transport {

/**
 * @brief Splits a byte stream into newline-delimited messages
 *
 * Each message occupies exactly one line. Partial lines are buffered across
 * calls to feed(). A trailing carriage return is stripped and blank lines are
 * skipped. A line longer than the configured maximum is discarded up to its
 * terminating newline and counted in droppedLines().
 */
class LineFramer {
public:
  static constexpr std::size_t kDefaultMaxLineLength = 16 * 1024 * 1024;

  explicit LineFramer(std::size_t max_line_length = kDefaultMaxLineLength);

  /**
   * @brief Encode a message as a single JSON line terminated by '\n'
   */
  static std::string encode(const types::JSONRPCMessage &message);

  /**
   * @brief Append bytes and return every line they complete
   *
   * @param bytes Raw bytes read from the stream
   * @return std::vector<std::string> Complete lines, without terminators
   */
  std::vector<std::string> feed(std::string_view bytes);

  /**
   * @brief Flush the unterminated tail at end of stream
   *
   * @return std::optional<std::string> The tail, if it is not blank
   */
  std::optional<std::string> finish();

  /// Number of overlong lines discarded so far
  std::size_t droppedLines() const { return dropped_lines_; }

  /// Bytes currently buffered for the incomplete line
  std::size_t buffered() const { return buffer_.size(); }

private:
  void emit(std::vector<std::string> &lines);

  std::size_t max_line_length_;
  std::string buffer_;
  bool discarding_ = false;
  std::size_t dropped_lines_ = 0;
};

} // namespace transport
} // namespace toolbridge

#endif // TOOLBRIDGE_TRANSPORT_LINE_FRAMER_HPP_
