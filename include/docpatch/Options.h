#pragma once

#include <string>
#include <vector>

#include "docpatch/PatchApplier.h"

namespace docpatch {
struct Options {
  std::string mode = "patch";
  std::string documentPath;
  std::string editsPath;
  std::string outputPath;
  std::string headingAnchor;
  std::string manifestPath;
  std::string outDir = ".";
  std::string reportFormat = "text";
  std::vector<double> fuzzyThresholds = {0.8, 0.7, 0.5};
  size_t minFuzzyAnchorLength = kDefaultMinFuzzyAnchorLength;
  size_t collisionMinLength = kDefaultCollisionMinLength;
  unsigned jobs = 0;
  bool sweepDuplicates = true;
  bool collisionGuard = true;
  bool expandHeadings = true;
  bool quiet = false;
  bool strict = false;
};
} // namespace docpatch
