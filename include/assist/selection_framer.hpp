#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "assist/document.hpp"

namespace assist {

constexpr const char* kSelectionStartMarker = "->->";
constexpr const char* kSelectionEndMarker = "<-<-";
constexpr std::size_t kTrailingNewlines = 4;

struct SelectionRange {
  std::size_t start = 0;
  std::size_t end = 0;
};

struct FramedPrompt {
  std::string text;
  Anchor insertion_site;
};

/**
 * Builds the user message from the buffer text with each selection wrapped in
 * markers, then pads the buffer to end in four newlines and anchors the
 * insertion site two bytes before the end.
 *
 * Selections must be sorted, non-overlapping and in range. The prompt is taken
 * before the padding edit. Padding only ever appends: a buffer already ending
 * in more than four newlines is left alone.
 */
FramedPrompt frame_selections(Buffer& buffer, const std::vector<SelectionRange>& selections);

/// Same as frame_selections, run as a single Document update.
FramedPrompt frame_selections(Document& document, const std::vector<SelectionRange>& selections);

}  // namespace assist
