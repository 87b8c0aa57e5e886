#pragma once

#include <functional>
#include <string>

#include "docpatch/EditTypes.h"

namespace docpatch {

enum class PatchEventKind {
  ExactMatch,
  FuzzyMatch,
  TierEscalated,
  CollisionGuard,
  ExpansionApplied,
  ExpansionFailed,
  Applied,
  SkippedNoop,
  SkippedDuplicate,
  Failed,
  ParagraphSwept
};

enum class EventSeverity { Info, Warning, Error };

struct PatchEvent {
  PatchEventKind kind = PatchEventKind::Applied;
  std::string document;
  std::string location;
  MatchTier tier = MatchTier::NotFound;
  std::string detail;
};

using PatchObserver = std::function<void(const PatchEvent &)>;

const char *patchEventKindName(PatchEventKind kind);
EventSeverity eventSeverity(const PatchEvent &event);
std::string formatPatchEvent(const PatchEvent &event);

} // namespace docpatch
