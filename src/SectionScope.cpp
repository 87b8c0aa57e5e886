#include "docpatch/SectionScope.h"

#include "docpatch/TextNormalizer.h"
#include "text_scan/TextScan.h"

#include <cctype>

namespace docpatch {
namespace {

constexpr int kMaxHeadingLevel = 6;

bool isAsciiDigit(char c) {
  return c >= '0' && c <= '9';
}

bool isSpaceChar(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isNumberTerminator(std::string_view text, size_t pos) {
  if (pos >= text.size()) {
    return true;
  }
  const char c = text[pos];
  if (isSpaceChar(c) || c == '.' || c == ')' || c == ':' || c == '-') {
    return true;
  }
  // CJK titles often follow the numeral directly ("3设计").
  return static_cast<unsigned char>(c) >= 0x80;
}

std::optional<std::string> parseChapterNumber(std::string_view title) {
  size_t pos = 0;
  std::string number;
  while (true) {
    size_t start = pos;
    while (pos < title.size() && isAsciiDigit(title[pos])) {
      ++pos;
    }
    if (pos == start) {
      break;
    }
    number.append(title.substr(start, pos - start));
    if (pos + 1 < title.size() && title[pos] == '.' && isAsciiDigit(title[pos + 1])) {
      number.push_back('.');
      ++pos;
      continue;
    }
    break;
  }
  if (number.empty() || !isNumberTerminator(title, pos)) {
    return std::nullopt;
  }
  return number;
}

std::string_view firstLine(std::string_view text) {
  size_t end = text.find('\n');
  return end == std::string_view::npos ? text : text.substr(0, end);
}

} // namespace

int headingLevel(std::string_view line) {
  int level = 0;
  while (static_cast<size_t>(level) < line.size() && line[static_cast<size_t>(level)] == '#') {
    ++level;
  }
  if (level == 0 || level > kMaxHeadingLevel) {
    return 0;
  }
  if (static_cast<size_t>(level) < line.size() && !isSpaceChar(line[static_cast<size_t>(level)])) {
    return 0;
  }
  return level;
}

std::optional<HeadingInfo> parseHeading(std::string_view line) {
  std::string_view text = firstLine(line);
  const int level = headingLevel(text);
  if (level == 0) {
    return std::nullopt;
  }
  size_t pos = static_cast<size_t>(level);
  while (pos < text.size() && isSpaceChar(text[pos])) {
    ++pos;
  }
  HeadingInfo info;
  info.level = level;
  info.chapterNumber = parseChapterNumber(text.substr(pos));
  return info;
}

bool isHeadingOnlyAnchor(const std::string &text) {
  const std::string trimmed = trimWhitespace(text);
  if (trimmed.empty() || trimmed.find('\n') != std::string::npos) {
    return false;
  }
  return headingLevel(trimmed) > 0;
}

bool isStrictDescendant(const HeadingInfo &parent, const HeadingInfo &child) {
  if (!parent.chapterNumber || !child.chapterNumber) {
    return false;
  }
  if (child.level <= parent.level) {
    return false;
  }
  const std::string prefix = *parent.chapterNumber + ".";
  return child.chapterNumber->compare(0, prefix.size(), prefix) == 0;
}

bool expandSection(const std::string &document, const std::string &headingAnchor, std::string &section) {
  size_t ignored = 0;
  return expandSection(document, headingAnchor, section, ignored);
}

bool expandSection(const std::string &document,
                   const std::string &headingAnchor,
                   std::string &section,
                   size_t &sectionOffset) {
  section = headingAnchor;
  if (headingAnchor.empty()) {
    return false;
  }
  size_t start = document.find(headingAnchor);
  while (start != std::string::npos && start > 0 && document[start - 1] != '\n') {
    start = document.find(headingAnchor, start + 1);
  }
  if (start == std::string::npos) {
    return false;
  }
  const int level = headingLevel(text_scan::stripLeadingIndent(firstLine(headingAnchor), 3));
  if (level == 0) {
    return false;
  }

  const size_t anchorEnd = start + headingAnchor.size();
  size_t pos = document[anchorEnd - 1] == '\n' ? anchorEnd : text_scan::nextLineStart(document, anchorEnd);
  size_t end = document.size();
  char openFence = '\0';
  while (pos < document.size()) {
    const size_t lineEnd = text_scan::lineEnd(document, pos);
    std::string_view line(document.data() + pos, lineEnd - pos);
    const char fence = text_scan::fenceMarker(line);
    if (openFence != '\0') {
      if (fence == openFence) {
        openFence = '\0';
      }
    } else if (fence != '\0') {
      openFence = fence;
    } else {
      const int lineLevel = headingLevel(line);
      if (lineLevel > 0 && lineLevel <= level) {
        end = pos;
        break;
      }
    }
    pos = text_scan::nextLineStart(document, pos);
  }
  section = trimTrailingWhitespace(document.substr(start, end - start));
  sectionOffset = start;
  return true;
}

} // namespace docpatch
