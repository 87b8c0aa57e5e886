#pragma once

#include <cstddef>
#include <vector>

#include "docpatch/EditTypes.h"

namespace docpatch {

// Indices (ascending) of heading edits whose section lies inside another heading
// edit's section, judged by heading level and dotted chapter number.
std::vector<size_t> findSubsumedEdits(const std::vector<EditRequest> &edits);

std::vector<EditRequest> dedupeHierarchical(const std::vector<EditRequest> &edits);

} // namespace docpatch
