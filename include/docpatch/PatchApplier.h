#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "docpatch/AnchorLocator.h"
#include "docpatch/EditTypes.h"
#include "docpatch/PatchEvents.h"

namespace docpatch {

constexpr size_t kDefaultCollisionMinLength = 20;
constexpr size_t kDefaultSweepSignatureLength = 100;

struct PatchOptions {
  std::vector<double> fuzzyThresholds = {0.8, 0.7, 0.5};
  size_t minFuzzyAnchorLength = kDefaultMinFuzzyAnchorLength;
  size_t collisionMinLength = kDefaultCollisionMinLength;
  size_t sweepSignatureLength = kDefaultSweepSignatureLength;
  bool expandHeadings = true;
  bool collisionGuard = true;
  bool sweepDuplicates = true;
  unsigned maxParallelJobs = 0;
  PatchObserver observer;
};

class PatchApplier {
public:
  explicit PatchApplier(PatchOptions options, std::string documentName = {});

  // Applies edits in order to one evolving buffer. Outcome indices refer to
  // positions in edits.
  void apply(std::string &document, const std::vector<EditRequest> &edits, PatchReport &report) const;

  std::optional<MatchResult> locate(const std::string &document,
                                    const std::string &anchor,
                                    const std::string &location) const;

  bool triggersCollisionGuard(const std::string &document,
                              const std::string &region,
                              const std::string &replacement) const;

private:
  EditOutcome applyEdit(std::string &document,
                        const EditRequest &edit,
                        size_t index,
                        std::unordered_set<std::string> &seenAnchors) const;
  void notify(PatchEventKind kind,
              const std::string &location,
              const std::string &detail,
              MatchTier tier = MatchTier::NotFound) const;

  PatchOptions options_;
  std::string documentName_;
  std::vector<double> thresholds_;
};

} // namespace docpatch
