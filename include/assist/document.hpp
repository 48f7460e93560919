#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace assist {

/// Which side of an insertion at its own offset an anchor sticks to.
enum class Bias { Left, Right };

/**
 * Opaque position handle. Resolve it through the Buffer that created it.
 */
class Anchor {
public:
  Anchor() = default;

  Bias bias() const { return bias_; }
  bool valid() const { return id_ != 0; }

  friend bool operator==(const Anchor& lhs, const Anchor& rhs) { return lhs.id_ == rhs.id_; }
  friend bool operator!=(const Anchor& lhs, const Anchor& rhs) { return !(lhs == rhs); }

private:
  friend class Buffer;
  Anchor(std::uint64_t id, Bias bias) : id_(id), bias_(bias) {}

  std::uint64_t id_ = 0;
  Bias bias_ = Bias::Left;
};

struct BufferSnapshot {
  std::string text;
  std::uint64_t version = 0;

  std::size_t length() const { return text.size(); }
  std::string text_for_range(std::size_t start, std::size_t end) const;
};

struct BufferEdit {
  std::size_t start = 0;
  std::size_t end = 0;
  std::string text;
};

/**
 * In-memory text buffer with versioned snapshots and stable anchors.
 *
 * Offsets are byte offsets. An edit replacing [s, e) with n bytes maps an
 * anchor at o as follows: o before s is unchanged, o after e shifts by
 * n - (e - s), and o inside [s, e] collapses to s + n for right bias or s for
 * left bias. A left-biased anchor sitting exactly at s is "before" the edit.
 * Not thread-safe; see Document.
 */
class Buffer {
public:
  Buffer() = default;
  explicit Buffer(std::string text) : text_(std::move(text)) {}

  const std::string& text() const { return text_; }
  std::size_t length() const { return text_.size(); }
  std::uint64_t version() const { return version_; }

  BufferSnapshot snapshot() const;
  std::string text_for_range(std::size_t start, std::size_t end) const;

  /// Number of consecutive `ch` bytes ending at the buffer end, at most `limit`.
  std::size_t trailing_count(char ch, std::size_t limit) const;

  /**
   * Applies all edits as one change, interpreted against the current text.
   * Edits must be in range and non-overlapping; otherwise AssistError is thrown
   * and nothing changes.
   */
  void edit(std::vector<BufferEdit> edits);

  Anchor anchor_before(std::size_t offset);
  Anchor anchor_after(std::size_t offset);
  std::size_t offset_of(const Anchor& anchor) const;
  void release(const Anchor& anchor);
  std::size_t anchor_count() const { return anchors_.size(); }

private:
  struct AnchorState {
    std::size_t offset = 0;
    Bias bias = Bias::Left;
  };

  Anchor create_anchor(std::size_t offset, Bias bias);
  void check_range(std::size_t start, std::size_t end) const;

  std::string text_;
  std::uint64_t version_ = 0;
  std::uint64_t next_anchor_id_ = 1;
  std::unordered_map<std::uint64_t, AnchorState> anchors_;
};

/**
 * Thread-safe owner of a Buffer. All mutation goes through update(), which
 * runs one writer at a time.
 */
class Document {
public:
  Document() = default;
  explicit Document(std::string text) : buffer_(std::move(text)) {}

  Document(const Document&) = delete;
  Document& operator=(const Document&) = delete;

  template <typename Fn>
  decltype(auto) update(Fn&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::forward<Fn>(fn)(buffer_);
  }

  template <typename Fn>
  decltype(auto) read(Fn&& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::forward<Fn>(fn)(static_cast<const Buffer&>(buffer_));
  }

  std::string text() const;
  BufferSnapshot snapshot() const;

private:
  mutable std::mutex mutex_;
  Buffer buffer_;
};

}  // namespace assist
