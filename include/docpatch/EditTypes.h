#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace docpatch {

struct EditRequest {
  std::string location;
  std::string originalText;
  std::string modifiedText;
  std::string reason;
  std::string modificationType;
  bool isFullChapter = false;
};

enum class MatchTier { Exact, FuzzyHigh, FuzzyMid, FuzzyLow, NotFound };

struct MatchResult {
  std::string matchedText;
  size_t offset = 0;
  MatchTier tier = MatchTier::NotFound;
};

enum class EditStatus {
  Applied,
  SkippedNoop,
  SkippedDuplicate,
  SubsumedBySection,
  MissingAnchor,
  AnchorNotFound,
  CollisionGuard
};

struct EditOutcome {
  size_t index = 0;
  std::string location;
  EditStatus status = EditStatus::AnchorNotFound;
  MatchTier tier = MatchTier::NotFound;
  bool expanded = false;
  bool expansionFailed = false;
  std::string reason;
};

struct PatchReport {
  std::vector<std::string> applied;
  std::vector<std::string> skippedDuplicate;
  std::vector<std::string> skippedNoop;
  std::vector<std::pair<std::string, std::string>> failed;
  std::vector<EditOutcome> outcomes;
  size_t sweptParagraphs = 0;

  size_t lowConfidenceCount() const {
    size_t count = 0;
    for (const auto &outcome : outcomes) {
      if (outcome.status == EditStatus::Applied &&
          (outcome.tier == MatchTier::FuzzyMid || outcome.tier == MatchTier::FuzzyLow)) {
        ++count;
      }
    }
    return count;
  }
};

const char *matchTierName(MatchTier tier);
const char *editStatusName(EditStatus status);
bool isFailureStatus(EditStatus status);

// Stores the outcome and files its location under the matching report list.
void appendOutcome(PatchReport &report, EditOutcome outcome);

} // namespace docpatch
