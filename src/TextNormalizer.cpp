#include "docpatch/TextNormalizer.h"

#include <cctype>
#include <cstdint>

namespace docpatch {
namespace {

bool isSpaceChar(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Byte length of a non-ASCII Unicode space (U+00A0, U+1680, U+2000..U+200A,
// U+2028, U+2029, U+202F, U+205F, U+3000) starting at index, otherwise 0.
size_t unicodeSpaceLength(const std::string &text, size_t index) {
  const auto byteAt = [&text](size_t pos) -> unsigned char {
    return pos < text.size() ? static_cast<unsigned char>(text[pos]) : 0;
  };
  const unsigned char lead = byteAt(index);
  if (lead == 0xC2) {
    return byteAt(index + 1) == 0xA0 ? 2 : 0;
  }
  const unsigned char second = byteAt(index + 1);
  const unsigned char third = byteAt(index + 2);
  if (lead == 0xE1) {
    return second == 0x9A && third == 0x80 ? 3 : 0;
  }
  if (lead == 0xE2) {
    if (second == 0x80 && ((third >= 0x80 && third <= 0x8A) || third == 0xA8 || third == 0xA9 || third == 0xAF)) {
      return 3;
    }
    return second == 0x81 && third == 0x9F ? 3 : 0;
  }
  if (lead == 0xE3) {
    return second == 0x80 && third == 0x80 ? 3 : 0;
  }
  return 0;
}

size_t ellipsisLength(const std::string &text, size_t index) {
  if (text.compare(index, 3, "...") == 0) {
    return 3;
  }
  if (text.compare(index, 3, "\xE2\x80\xA6") == 0) {
    return 3;
  }
  return 0;
}

} // namespace

std::string normalize(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool pendingSpace = false;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t ellipsis = ellipsisLength(text, pos);
    if (ellipsis > 0) {
      pendingSpace = true;
      pos += ellipsis;
      continue;
    }
    if (isSpaceChar(text[pos])) {
      pendingSpace = true;
      ++pos;
      continue;
    }
    const size_t unicodeSpace = unicodeSpaceLength(text, pos);
    if (unicodeSpace > 0) {
      pendingSpace = true;
      pos += unicodeSpace;
      continue;
    }
    if (pendingSpace && !out.empty()) {
      out.push_back(' ');
    }
    pendingSpace = false;
    out.push_back(text[pos]);
    ++pos;
  }
  return out;
}

std::vector<std::string> splitWords(const std::string &normalized) {
  std::vector<std::string> words;
  size_t start = 0;
  while (start < normalized.size()) {
    size_t end = normalized.find(' ', start);
    if (end == std::string::npos) {
      end = normalized.size();
    }
    if (end > start) {
      words.push_back(normalized.substr(start, end - start));
    }
    start = end + 1;
  }
  return words;
}

size_t countCodePoints(const std::string &text) {
  size_t count = 0;
  for (char c : text) {
    if (!isContinuationByte(c)) {
      ++count;
    }
  }
  return count;
}

std::string prefixCodePoints(const std::string &text, size_t count) {
  size_t seen = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    if (!isContinuationByte(text[pos])) {
      if (seen == count) {
        break;
      }
      ++seen;
    }
    ++pos;
  }
  return text.substr(0, pos);
}

bool isValidUtf8(const std::string &text, size_t &errorOffset) {
  size_t pos = 0;
  while (pos < text.size()) {
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length = 0;
    uint32_t codePoint = 0;
    if (lead < 0x80) {
      ++pos;
      continue;
    }
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      codePoint = lead & 0x07;
    } else {
      errorOffset = pos;
      return false;
    }
    if (pos + length > text.size()) {
      errorOffset = pos;
      return false;
    }
    for (size_t i = 1; i < length; ++i) {
      if (!isContinuationByte(text[pos + i])) {
        errorOffset = pos;
        return false;
      }
      codePoint = (codePoint << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
    }
    const bool overlong = (length == 2 && codePoint < 0x80) || (length == 3 && codePoint < 0x800) ||
                          (length == 4 && codePoint < 0x10000);
    const bool surrogate = codePoint >= 0xD800 && codePoint <= 0xDFFF;
    if (overlong || surrogate || codePoint > 0x10FFFF) {
      errorOffset = pos;
      return false;
    }
    pos += length;
  }
  return true;
}

bool isValidUtf8(const std::string &text) {
  size_t ignored = 0;
  return isValidUtf8(text, ignored);
}

std::string trimWhitespace(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && isSpaceChar(text[start])) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && isSpaceChar(text[end - 1])) {
    --end;
  }
  return text.substr(start, end - start);
}

std::string trimTrailingWhitespace(const std::string &text) {
  size_t end = text.size();
  while (end > 0 && isSpaceChar(text[end - 1])) {
    --end;
  }
  return text.substr(0, end);
}

std::string previewText(const std::string &text, size_t maxCodePoints) {
  const std::string normalized = normalize(text);
  if (countCodePoints(normalized) <= maxCodePoints) {
    return normalized;
  }
  return prefixCodePoints(normalized, maxCodePoints) + "...";
}

} // namespace docpatch
