#include "assist/document.hpp"

#include "assist/error.hpp"

#include <algorithm>

namespace assist {

std::string BufferSnapshot::text_for_range(std::size_t start, std::size_t end) const {
  if (start > end || end > text.size()) {
    throw AssistError("snapshot range [" + std::to_string(start) + ", " + std::to_string(end) +
                      ") out of bounds for length " + std::to_string(text.size()));
  }
  return text.substr(start, end - start);
}

BufferSnapshot Buffer::snapshot() const {
  return BufferSnapshot{text_, version_};
}

std::string Buffer::text_for_range(std::size_t start, std::size_t end) const {
  check_range(start, end);
  return text_.substr(start, end - start);
}

std::size_t Buffer::trailing_count(char ch, std::size_t limit) const {
  std::size_t count = 0;
  for (auto it = text_.rbegin(); it != text_.rend() && count < limit && *it == ch; ++it) {
    ++count;
  }
  return count;
}

void Buffer::check_range(std::size_t start, std::size_t end) const {
  if (start > end || end > text_.size()) {
    throw AssistError("range [" + std::to_string(start) + ", " + std::to_string(end) +
                      ") out of bounds for length " + std::to_string(text_.size()));
  }
}

void Buffer::edit(std::vector<BufferEdit> edits) {
  if (edits.empty()) {
    return;
  }

  for (const auto& edit : edits) {
    check_range(edit.start, edit.end);
  }
  std::stable_sort(edits.begin(), edits.end(), [](const BufferEdit& lhs, const BufferEdit& rhs) {
    return lhs.start < rhs.start;
  });
  for (std::size_t i = 1; i < edits.size(); ++i) {
    if (edits[i - 1].end > edits[i].start) {
      throw AssistError("overlapping edits at offset " + std::to_string(edits[i].start));
    }
  }

  // Back to front so each edit's coordinates still refer to the original text.
  for (auto it = edits.rbegin(); it != edits.rend(); ++it) {
    const std::size_t start = it->start;
    const std::size_t end = it->end;
    const std::size_t inserted = it->text.size();

    text_.replace(start, end - start, it->text);

    for (auto& [id, state] : anchors_) {
      (void)id;
      if (state.offset < start) {
        continue;
      }
      if (state.offset > end) {
        state.offset = state.offset - (end - start) + inserted;
      } else if (state.bias == Bias::Right) {
        state.offset = start + inserted;
      } else {
        state.offset = start;
      }
    }
  }

  ++version_;
}

Anchor Buffer::create_anchor(std::size_t offset, Bias bias) {
  check_range(offset, offset);
  const std::uint64_t id = next_anchor_id_++;
  anchors_.emplace(id, AnchorState{offset, bias});
  return Anchor(id, bias);
}

Anchor Buffer::anchor_before(std::size_t offset) {
  return create_anchor(offset, Bias::Left);
}

Anchor Buffer::anchor_after(std::size_t offset) {
  return create_anchor(offset, Bias::Right);
}

std::size_t Buffer::offset_of(const Anchor& anchor) const {
  auto it = anchors_.find(anchor.id_);
  if (it == anchors_.end()) {
    throw AssistError("anchor does not belong to this buffer");
  }
  return it->second.offset;
}

void Buffer::release(const Anchor& anchor) {
  anchors_.erase(anchor.id_);
}

std::string Document::text() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.text();
}

BufferSnapshot Document::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.snapshot();
}

}  // namespace assist
