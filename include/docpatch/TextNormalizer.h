#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docpatch {

// Canonical comparison form: "..." and U+2026 become a space, whitespace runs
// collapse to one space (Unicode spaces such as U+00A0 and U+3000 included), both ends
// are trimmed. Never used for substitution.
std::string normalize(const std::string &text);

std::vector<std::string> splitWords(const std::string &normalized);

size_t countCodePoints(const std::string &text);
std::string prefixCodePoints(const std::string &text, size_t count);
bool isValidUtf8(const std::string &text, size_t &errorOffset);
bool isValidUtf8(const std::string &text);

std::string trimWhitespace(const std::string &text);
std::string trimTrailingWhitespace(const std::string &text);

// Normalized, single-line excerpt for diagnostics.
std::string previewText(const std::string &text, size_t maxCodePoints = 40);

} // namespace docpatch
