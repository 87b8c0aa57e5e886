#include "docpatch/EditTypes.h"

namespace docpatch {

const char *matchTierName(MatchTier tier) {
  switch (tier) {
    case MatchTier::Exact:
      return "exact";
    case MatchTier::FuzzyHigh:
      return "fuzzy-high";
    case MatchTier::FuzzyMid:
      return "fuzzy-mid";
    case MatchTier::FuzzyLow:
      return "fuzzy-low";
    case MatchTier::NotFound:
      return "not-found";
  }
  return "not-found";
}

const char *editStatusName(EditStatus status) {
  switch (status) {
    case EditStatus::Applied:
      return "applied";
    case EditStatus::SkippedNoop:
      return "skipped-noop";
    case EditStatus::SkippedDuplicate:
      return "skipped-duplicate";
    case EditStatus::SubsumedBySection:
      return "subsumed-by-section";
    case EditStatus::MissingAnchor:
      return "missing-anchor";
    case EditStatus::AnchorNotFound:
      return "anchor-not-found";
    case EditStatus::CollisionGuard:
      return "collision-guard";
  }
  return "anchor-not-found";
}

bool isFailureStatus(EditStatus status) {
  return status == EditStatus::MissingAnchor || status == EditStatus::AnchorNotFound ||
         status == EditStatus::CollisionGuard;
}

void appendOutcome(PatchReport &report, EditOutcome outcome) {
  switch (outcome.status) {
    case EditStatus::Applied:
      report.applied.push_back(outcome.location);
      break;
    case EditStatus::SkippedNoop:
      report.skippedNoop.push_back(outcome.location);
      break;
    case EditStatus::SkippedDuplicate:
    case EditStatus::SubsumedBySection:
      report.skippedDuplicate.push_back(outcome.location);
      break;
    case EditStatus::MissingAnchor:
    case EditStatus::AnchorNotFound:
    case EditStatus::CollisionGuard:
      report.failed.emplace_back(outcome.location, outcome.reason);
      break;
  }
  report.outcomes.push_back(std::move(outcome));
}

} // namespace docpatch
