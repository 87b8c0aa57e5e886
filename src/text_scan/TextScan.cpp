#include "TextScan.h"

#include <cctype>

namespace docpatch::text_scan {
namespace {

bool isSpaceChar(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

TextSpan trimSpan(const std::string &text, size_t start, size_t end) {
  while (start < end && isSpaceChar(text[start])) {
    ++start;
  }
  while (end > start && isSpaceChar(text[end - 1])) {
    --end;
  }
  return {start, end - start};
}

} // namespace

size_t lineEnd(const std::string &text, size_t pos) {
  size_t end = text.find('\n', pos);
  return end == std::string::npos ? text.size() : end;
}

size_t nextLineStart(const std::string &text, size_t pos) {
  size_t end = text.find('\n', pos);
  return end == std::string::npos ? text.size() : end + 1;
}

bool isBlankLine(std::string_view line) {
  for (char c : line) {
    if (!isSpaceChar(c)) {
      return false;
    }
  }
  return true;
}

std::string_view stripLeadingIndent(std::string_view line, size_t maxIndent) {
  size_t indent = 0;
  while (indent < line.size() && indent < maxIndent && line[indent] == ' ') {
    ++indent;
  }
  return line.substr(indent);
}

char fenceMarker(std::string_view line) {
  std::string_view body = stripLeadingIndent(line, 3);
  if (body.size() >= 3 && (body[0] == '`' || body[0] == '~') && body[1] == body[0] && body[2] == body[0]) {
    return body[0];
  }
  return '\0';
}

std::vector<TextSpan> splitParagraphSpans(const std::string &text) {
  std::vector<TextSpan> spans;
  size_t pos = 0;
  size_t blockStart = std::string::npos;
  size_t blockEnd = 0;
  while (pos < text.size()) {
    size_t end = lineEnd(text, pos);
    std::string_view line(text.data() + pos, end - pos);
    if (isBlankLine(line)) {
      if (blockStart != std::string::npos) {
        spans.push_back(trimSpan(text, blockStart, blockEnd));
        blockStart = std::string::npos;
      }
    } else {
      if (blockStart == std::string::npos) {
        blockStart = pos;
      }
      blockEnd = end;
    }
    pos = nextLineStart(text, pos);
  }
  if (blockStart != std::string::npos) {
    spans.push_back(trimSpan(text, blockStart, blockEnd));
  }
  return spans;
}

std::vector<TextSpan> splitLineSpans(const std::string &text) {
  std::vector<TextSpan> spans;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = lineEnd(text, pos);
    TextSpan span = trimSpan(text, pos, end);
    if (span.length > 0) {
      spans.push_back(span);
    }
    pos = nextLineStart(text, pos);
  }
  return spans;
}

std::string spanText(const std::string &text, const TextSpan &span) {
  return text.substr(span.offset, span.length);
}

} // namespace docpatch::text_scan
