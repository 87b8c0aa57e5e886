#include "docpatch/PatchEvents.h"

namespace docpatch {

const char *patchEventKindName(PatchEventKind kind) {
  switch (kind) {
    case PatchEventKind::ExactMatch:
      return "exact-match";
    case PatchEventKind::FuzzyMatch:
      return "fuzzy-match";
    case PatchEventKind::TierEscalated:
      return "tier-escalated";
    case PatchEventKind::CollisionGuard:
      return "collision-guard";
    case PatchEventKind::ExpansionApplied:
      return "expansion-applied";
    case PatchEventKind::ExpansionFailed:
      return "expansion-failed";
    case PatchEventKind::Applied:
      return "applied";
    case PatchEventKind::SkippedNoop:
      return "skipped-noop";
    case PatchEventKind::SkippedDuplicate:
      return "skipped-duplicate";
    case PatchEventKind::Failed:
      return "failed";
    case PatchEventKind::ParagraphSwept:
      return "paragraph-swept";
  }
  return "unknown";
}

EventSeverity eventSeverity(const PatchEvent &event) {
  switch (event.kind) {
    case PatchEventKind::FuzzyMatch:
      if (event.tier == MatchTier::FuzzyLow) {
        return EventSeverity::Error;
      }
      return event.tier == MatchTier::FuzzyMid ? EventSeverity::Warning : EventSeverity::Info;
    case PatchEventKind::CollisionGuard:
    case PatchEventKind::ExpansionFailed:
    case PatchEventKind::ParagraphSwept:
      return EventSeverity::Warning;
    case PatchEventKind::Failed:
      return EventSeverity::Error;
    case PatchEventKind::ExactMatch:
    case PatchEventKind::TierEscalated:
    case PatchEventKind::ExpansionApplied:
    case PatchEventKind::Applied:
    case PatchEventKind::SkippedNoop:
    case PatchEventKind::SkippedDuplicate:
      return EventSeverity::Info;
  }
  return EventSeverity::Info;
}

std::string formatPatchEvent(const PatchEvent &event) {
  std::string line;
  if (!event.document.empty()) {
    line += event.document + ": ";
  }
  line += patchEventKindName(event.kind);
  if (!event.location.empty()) {
    line += " [" + event.location + "]";
  }
  if (event.tier != MatchTier::NotFound) {
    line += " (";
    line += matchTierName(event.tier);
    line += ")";
  }
  if (!event.detail.empty()) {
    line += ": " + event.detail;
  }
  return line;
}

} // namespace docpatch
