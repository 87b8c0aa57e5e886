#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace docpatch {

struct HeadingInfo {
  int level = 0;
  std::optional<std::string> chapterNumber;
};

// Length of the leading '#' run when the line is an ATX heading (1..6 '#'
// followed by whitespace or end of line), otherwise 0.
int headingLevel(std::string_view line);

std::optional<HeadingInfo> parseHeading(std::string_view line);

bool isHeadingOnlyAnchor(const std::string &text);

// True when child sits strictly below parent in the chapter outline, e.g. "3.1" under "3".
bool isStrictDescendant(const HeadingInfo &parent, const HeadingInfo &child);

// Extends a heading anchor, found at the start of a line, to its whole section: everything
// up to the next heading of equal or higher rank (fenced code is skipped), trailing
// whitespace trimmed. Returns false and leaves section equal to the anchor when the
// heading cannot be located.
bool expandSection(const std::string &document, const std::string &headingAnchor, std::string &section);
bool expandSection(const std::string &document,
                   const std::string &headingAnchor,
                   std::string &section,
                   size_t &sectionOffset);

} // namespace docpatch
