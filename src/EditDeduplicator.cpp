#include "docpatch/EditDeduplicator.h"

#include "docpatch/SectionScope.h"
#include "docpatch/TextNormalizer.h"

#include <optional>

namespace docpatch {

std::vector<size_t> findSubsumedEdits(const std::vector<EditRequest> &edits) {
  std::vector<std::optional<HeadingInfo>> headings;
  headings.reserve(edits.size());
  for (const auto &edit : edits) {
    headings.push_back(parseHeading(trimWhitespace(edit.originalText)));
  }

  std::vector<size_t> subsumed;
  for (size_t j = 0; j < edits.size(); ++j) {
    if (!headings[j] || !headings[j]->chapterNumber) {
      continue;
    }
    for (size_t i = 0; i < edits.size(); ++i) {
      if (i == j || !headings[i]) {
        continue;
      }
      if (isStrictDescendant(*headings[i], *headings[j])) {
        subsumed.push_back(j);
        break;
      }
    }
  }
  return subsumed;
}

std::vector<EditRequest> dedupeHierarchical(const std::vector<EditRequest> &edits) {
  const std::vector<size_t> subsumed = findSubsumedEdits(edits);
  std::vector<EditRequest> kept;
  kept.reserve(edits.size() - subsumed.size());
  size_t next = 0;
  for (size_t i = 0; i < edits.size(); ++i) {
    if (next < subsumed.size() && subsumed[next] == i) {
      ++next;
      continue;
    }
    kept.push_back(edits[i]);
  }
  return kept;
}

} // namespace docpatch
