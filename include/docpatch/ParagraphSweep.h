#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docpatch/PatchApplier.h"

namespace docpatch {

// Drops every paragraph whose signature (first signatureLength code points of its
// normalized text) repeats an earlier paragraph's. Paragraphs inside fenced code and
// thematic breaks are always kept. Kept paragraphs and their separators are preserved
// byte for byte.
std::string sweepDuplicateParagraphs(const std::string &document,
                                     std::vector<std::string> &removedParagraphs,
                                     size_t signatureLength = kDefaultSweepSignatureLength);

std::string sweepDuplicateParagraphs(const std::string &document,
                                     size_t signatureLength = kDefaultSweepSignatureLength);

} // namespace docpatch
