#include "docpatch/PatchApplier.h"

#include "docpatch/SectionScope.h"
#include "docpatch/TextNormalizer.h"

#include <algorithm>
#include <functional>
#include <sstream>

namespace docpatch {
namespace {

std::string formatThreshold(double threshold) {
  std::ostringstream out;
  out << threshold;
  return out.str();
}

std::vector<double> sortedThresholds(const std::vector<double> &thresholds) {
  std::vector<double> sorted;
  for (double threshold : thresholds) {
    if (threshold > 0.0 && threshold <= 1.0) {
      sorted.push_back(threshold);
    }
  }
  std::sort(sorted.begin(), sorted.end(), std::greater<double>());
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
  return sorted;
}

} // namespace

PatchApplier::PatchApplier(PatchOptions options, std::string documentName)
    : options_(std::move(options)),
      documentName_(std::move(documentName)),
      thresholds_(sortedThresholds(options_.fuzzyThresholds)) {}

void PatchApplier::apply(std::string &document,
                         const std::vector<EditRequest> &edits,
                         PatchReport &report) const {
  std::unordered_set<std::string> seenAnchors;
  for (size_t i = 0; i < edits.size(); ++i) {
    appendOutcome(report, applyEdit(document, edits[i], i, seenAnchors));
  }
}

std::optional<MatchResult> PatchApplier::locate(const std::string &document,
                                                const std::string &anchor,
                                                const std::string &location) const {
  if (auto offset = findExact(anchor, document)) {
    notify(PatchEventKind::ExactMatch, location, "offset " + std::to_string(*offset), MatchTier::Exact);
    return MatchResult{anchor, *offset, MatchTier::Exact};
  }
  if (!isFuzzyEligible(anchor, options_.minFuzzyAnchorLength)) {
    return std::nullopt;
  }
  for (size_t i = 0; i < thresholds_.size(); ++i) {
    const double threshold = thresholds_[i];
    if (auto match = findFuzzy(anchor, document, threshold, options_.minFuzzyAnchorLength)) {
      notify(PatchEventKind::FuzzyMatch,
             location,
             "threshold " + formatThreshold(threshold) + " matched \"" + previewText(match->matchedText) + "\"",
             match->tier);
      return match;
    }
    if (i + 1 < thresholds_.size()) {
      notify(PatchEventKind::TierEscalated,
             location,
             "threshold " + formatThreshold(threshold) + " -> " + formatThreshold(thresholds_[i + 1]));
    }
  }
  return std::nullopt;
}

bool PatchApplier::triggersCollisionGuard(const std::string &document,
                                          const std::string &region,
                                          const std::string &replacement) const {
  if (replacement.empty() || countCodePoints(normalize(replacement)) < options_.collisionMinLength) {
    return false;
  }
  if (region.find(replacement) != std::string::npos) {
    return false;
  }
  return document.find(replacement) != std::string::npos;
}

EditOutcome PatchApplier::applyEdit(std::string &document,
                                    const EditRequest &edit,
                                    size_t index,
                                    std::unordered_set<std::string> &seenAnchors) const {
  EditOutcome outcome;
  outcome.index = index;
  outcome.location = edit.location;

  const std::string normalizedOriginal = normalize(edit.originalText);
  if (normalizedOriginal.empty()) {
    outcome.status = EditStatus::MissingAnchor;
    outcome.reason = "missing original text";
    notify(PatchEventKind::Failed, edit.location, outcome.reason);
    return outcome;
  }
  if (!seenAnchors.insert(normalizedOriginal).second) {
    outcome.status = EditStatus::SkippedDuplicate;
    outcome.reason = "duplicate anchor";
    notify(PatchEventKind::SkippedDuplicate, edit.location, outcome.reason);
    return outcome;
  }
  if (normalizedOriginal == normalize(edit.modifiedText)) {
    outcome.status = EditStatus::SkippedNoop;
    outcome.reason = "replacement equals original";
    notify(PatchEventKind::SkippedNoop, edit.location, outcome.reason);
    return outcome;
  }

  std::string anchor = edit.originalText;
  std::optional<MatchResult> match;
  if (options_.expandHeadings && edit.isFullChapter && isHeadingOnlyAnchor(anchor)) {
    std::string section;
    size_t sectionOffset = 0;
    if (expandSection(document, trimWhitespace(anchor), section, sectionOffset)) {
      outcome.expanded = true;
      notify(PatchEventKind::ExpansionApplied,
             edit.location,
             "section spans " + std::to_string(section.size()) + " bytes");
      notify(PatchEventKind::ExactMatch, edit.location, "offset " + std::to_string(sectionOffset), MatchTier::Exact);
      match = MatchResult{section, sectionOffset, MatchTier::Exact};
      anchor = std::move(section);
    } else {
      outcome.expansionFailed = true;
      notify(PatchEventKind::ExpansionFailed, edit.location, "heading not found, using anchor as given");
    }
  }

  if (!match) {
    match = locate(document, anchor, edit.location);
  }
  if (!match) {
    outcome.status = EditStatus::AnchorNotFound;
    outcome.reason = isFuzzyEligible(anchor, options_.minFuzzyAnchorLength)
                         ? "anchor not found"
                         : "anchor not found (too short for fuzzy matching)";
    notify(PatchEventKind::Failed, edit.location, outcome.reason + ": \"" + previewText(anchor, 100) + "\"");
    return outcome;
  }
  outcome.tier = match->tier;

  if (options_.collisionGuard && triggersCollisionGuard(document, match->matchedText, edit.modifiedText)) {
    outcome.status = EditStatus::CollisionGuard;
    outcome.reason = "collision guard: replacement text already present";
    notify(PatchEventKind::CollisionGuard,
           edit.location,
           "\"" + previewText(edit.modifiedText) + "\" already in document",
           match->tier);
    return outcome;
  }

  document.replace(match->offset, match->matchedText.size(), edit.modifiedText);
  outcome.status = EditStatus::Applied;
  std::string detail = "\"" + previewText(match->matchedText) + "\" -> \"" + previewText(edit.modifiedText) + "\"";
  if (!edit.reason.empty()) {
    detail += " (" + edit.reason + ")";
  }
  notify(PatchEventKind::Applied, edit.location, detail, match->tier);
  return outcome;
}

void PatchApplier::notify(PatchEventKind kind,
                          const std::string &location,
                          const std::string &detail,
                          MatchTier tier) const {
  if (!options_.observer) {
    return;
  }
  PatchEvent event;
  event.kind = kind;
  event.document = documentName_;
  event.location = location;
  event.tier = tier;
  event.detail = detail;
  options_.observer(event);
}

} // namespace docpatch
