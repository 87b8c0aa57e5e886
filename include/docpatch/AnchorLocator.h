#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "docpatch/EditTypes.h"

namespace docpatch {

constexpr size_t kDefaultMinFuzzyAnchorLength = 20;

std::optional<size_t> findExact(const std::string &anchor, const std::string &document);

// Anchors whose normalized form is shorter than minAnchorLength code points are
// too ambiguous to score and only ever match exactly.
bool isFuzzyEligible(const std::string &anchor, size_t minAnchorLength = kDefaultMinFuzzyAnchorLength);

// Fraction of anchorWords (counted with repetition) that occur as a word of region.
double wordOverlap(const std::vector<std::string> &anchorWords, const std::string &region);

// First paragraph, then first line, whose word overlap reaches threshold. The
// returned text is the region as written in the document.
std::optional<MatchResult> findFuzzy(const std::string &anchor,
                                     const std::string &document,
                                     double threshold,
                                     size_t minAnchorLength = kDefaultMinFuzzyAnchorLength);

MatchTier tierForThreshold(double threshold);

} // namespace docpatch
