#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace assist {

/**
 * Splits an incrementally delivered byte stream into lines.
 * Lines end at '\n'; a trailing '\r' is stripped. Bytes after the last
 * terminator are held until more data arrives and are discarded by finish().
 */
class LineReader {
public:
  std::vector<std::string> feed(const char* data, std::size_t size);

  /// Drops any unterminated remainder and returns how many bytes were dropped.
  std::size_t finish();

  [[nodiscard]] std::size_t pending() const { return buffer_.size(); }

private:
  std::string buffer_;
  std::size_t scanned_ = 0;
};

}  // namespace assist
