#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch::text_scan {

struct TextSpan {
  size_t offset = 0;
  size_t length = 0;

  size_t end() const {
    return offset + length;
  }
};

size_t lineEnd(const std::string &text, size_t pos);
size_t nextLineStart(const std::string &text, size_t pos);
bool isBlankLine(std::string_view line);
std::string_view stripLeadingIndent(std::string_view line, size_t maxIndent);
char fenceMarker(std::string_view line);
std::vector<TextSpan> splitParagraphSpans(const std::string &text);
std::vector<TextSpan> splitLineSpans(const std::string &text);
std::string spanText(const std::string &text, const TextSpan &span);

} // namespace docpatch::text_scan
