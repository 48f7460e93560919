#include "assist/selection_framer.hpp"

#include "assist/error.hpp"

namespace assist {
namespace {

void validate_selections(const std::vector<SelectionRange>& selections, std::size_t length) {
  std::size_t previous_end = 0;
  for (std::size_t i = 0; i < selections.size(); ++i) {
    const auto& selection = selections[i];
    if (selection.start > selection.end || selection.end > length) {
      throw AssistError("selection " + std::to_string(i) + " [" + std::to_string(selection.start) + ", " +
                        std::to_string(selection.end) + ") out of bounds for length " + std::to_string(length));
    }
    if (selection.start < previous_end) {
      throw AssistError("selection " + std::to_string(i) + " overlaps or precedes the previous selection");
    }
    previous_end = selection.end;
  }
}

}  // namespace

FramedPrompt frame_selections(Buffer& buffer, const std::vector<SelectionRange>& selections) {
  const BufferSnapshot snapshot = buffer.snapshot();
  validate_selections(selections, snapshot.length());

  FramedPrompt framed;
  std::size_t offset = 0;
  for (const auto& selection : selections) {
    framed.text += snapshot.text_for_range(offset, selection.start);
    framed.text += kSelectionStartMarker;
    framed.text += snapshot.text_for_range(selection.start, selection.end);
    framed.text += kSelectionEndMarker;
    offset = selection.end;
  }
  if (offset < snapshot.length()) {
    framed.text += snapshot.text_for_range(offset, snapshot.length());
  }

  const std::size_t existing = buffer.trailing_count('\n', kTrailingNewlines);
  const std::size_t missing = kTrailingNewlines - existing;
  if (missing > 0) {
    buffer.edit({BufferEdit{snapshot.length(), snapshot.length(), std::string(missing, '\n')}});
  }

  const BufferSnapshot padded = buffer.snapshot();
  framed.insertion_site = buffer.anchor_after(padded.length() - 2);
  return framed;
}

FramedPrompt frame_selections(Document& document, const std::vector<SelectionRange>& selections) {
  return document.update([&selections](Buffer& buffer) { return frame_selections(buffer, selections); });
}

}  // namespace assist
