#include "assist/line_reader.hpp"

namespace assist {
namespace {

void trim_carriage_return(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

}  // namespace

std::vector<std::string> LineReader::feed(const char* data, std::size_t size) {
  std::vector<std::string> lines;
  if (size == 0) {
    return lines;
  }
  buffer_.append(data, size);

  std::size_t start = 0;
  // Resume the search where the previous feed stopped; earlier bytes hold no '\n'.
  std::size_t search_from = scanned_;
  while (true) {
    auto newline_pos = buffer_.find('\n', search_from);
    if (newline_pos == std::string::npos) {
      break;
    }
    std::string line = buffer_.substr(start, newline_pos - start);
    trim_carriage_return(line);
    lines.push_back(std::move(line));
    start = newline_pos + 1;
    search_from = start;
  }

  buffer_.erase(0, start);
  scanned_ = buffer_.size();
  return lines;
}

std::size_t LineReader::finish() {
  const std::size_t dropped = buffer_.size();
  buffer_.clear();
  scanned_ = 0;
  return dropped;
}

}  // namespace assist
