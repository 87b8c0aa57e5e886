#include "docpatch/ParagraphSweep.h"

#include "docpatch/TextNormalizer.h"
#include "text_scan/TextScan.h"

#include <string_view>
#include <unordered_set>

namespace docpatch {
namespace {

// Byte ranges covered by fenced code blocks, fence lines included. An unclosed fence
// runs to the end of the document.
std::vector<text_scan::TextSpan> fencedRanges(const std::string &document) {
  std::vector<text_scan::TextSpan> ranges;
  char openFence = '\0';
  size_t openStart = 0;
  size_t pos = 0;
  while (pos < document.size()) {
    const size_t end = text_scan::lineEnd(document, pos);
    const char fence = text_scan::fenceMarker(std::string_view(document.data() + pos, end - pos));
    if (openFence != '\0') {
      if (fence == openFence) {
        ranges.push_back({openStart, end - openStart});
        openFence = '\0';
      }
    } else if (fence != '\0') {
      openFence = fence;
      openStart = pos;
    }
    pos = text_scan::nextLineStart(document, pos);
  }
  if (openFence != '\0') {
    ranges.push_back({openStart, document.size() - openStart});
  }
  return ranges;
}

bool overlapsAny(const text_scan::TextSpan &span, const std::vector<text_scan::TextSpan> &ranges) {
  for (const auto &range : ranges) {
    if (span.offset < range.end() && range.offset < span.end()) {
      return true;
    }
  }
  return false;
}

// "---", "* * *", "___" and similar.
bool isThematicBreak(const std::string &paragraph) {
  char marker = '\0';
  size_t count = 0;
  for (char c : paragraph) {
    if (c == ' ' || c == '\t') {
      continue;
    }
    if (c != '-' && c != '*' && c != '_') {
      return false;
    }
    if (marker != '\0' && c != marker) {
      return false;
    }
    marker = c;
    ++count;
  }
  return count >= 3;
}

} // namespace

std::string sweepDuplicateParagraphs(const std::string &document,
                                     std::vector<std::string> &removedParagraphs,
                                     size_t signatureLength) {
  removedParagraphs.clear();
  const std::vector<text_scan::TextSpan> paragraphs = text_scan::splitParagraphSpans(document);
  if (paragraphs.empty()) {
    return document;
  }

  const std::vector<text_scan::TextSpan> fences = fencedRanges(document);
  std::unordered_set<std::string> signatures;
  std::string output;
  output.reserve(document.size());
  output.append(document, 0, paragraphs.front().offset);
  size_t previousEnd = paragraphs.front().offset;
  for (const auto &paragraph : paragraphs) {
    std::string text = text_scan::spanText(document, paragraph);
    const bool exempt = overlapsAny(paragraph, fences) || isThematicBreak(text);
    if (!exempt && !signatures.insert(prefixCodePoints(normalize(text), signatureLength)).second) {
      removedParagraphs.push_back(std::move(text));
    } else {
      output.append(document, previousEnd, paragraph.offset - previousEnd);
      output.append(text);
    }
    previousEnd = paragraph.end();
  }
  output.append(document, previousEnd, std::string::npos);
  return output;
}

std::string sweepDuplicateParagraphs(const std::string &document, size_t signatureLength) {
  std::vector<std::string> removed;
  return sweepDuplicateParagraphs(document, removed, signatureLength);
}

} // namespace docpatch
