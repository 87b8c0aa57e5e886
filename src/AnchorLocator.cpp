#include "docpatch/AnchorLocator.h"

#include "docpatch/TextNormalizer.h"
#include "text_scan/TextScan.h"

#include <unordered_set>

namespace docpatch {
namespace {

constexpr double kThresholdEpsilon = 1e-9;

std::optional<MatchResult> firstQualifyingRegion(const std::vector<std::string> &anchorWords,
                                                 const std::string &document,
                                                 const std::vector<text_scan::TextSpan> &regions,
                                                 double threshold) {
  for (const auto &region : regions) {
    std::string regionText = text_scan::spanText(document, region);
    if (wordOverlap(anchorWords, regionText) + kThresholdEpsilon >= threshold) {
      MatchResult result;
      result.matchedText = std::move(regionText);
      result.offset = region.offset;
      result.tier = tierForThreshold(threshold);
      return result;
    }
  }
  return std::nullopt;
}

} // namespace

std::optional<size_t> findExact(const std::string &anchor, const std::string &document) {
  if (anchor.empty()) {
    return std::nullopt;
  }
  size_t pos = document.find(anchor);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  return pos;
}

bool isFuzzyEligible(const std::string &anchor, size_t minAnchorLength) {
  return countCodePoints(normalize(anchor)) >= minAnchorLength;
}

double wordOverlap(const std::vector<std::string> &anchorWords, const std::string &region) {
  if (anchorWords.empty()) {
    return 0.0;
  }
  std::unordered_set<std::string> regionWords;
  for (auto &word : splitWords(normalize(region))) {
    regionWords.insert(std::move(word));
  }
  size_t matched = 0;
  for (const auto &word : anchorWords) {
    if (regionWords.count(word) > 0) {
      ++matched;
    }
  }
  return static_cast<double>(matched) / static_cast<double>(anchorWords.size());
}

std::optional<MatchResult> findFuzzy(const std::string &anchor,
                                     const std::string &document,
                                     double threshold,
                                     size_t minAnchorLength) {
  const std::string normalizedAnchor = normalize(anchor);
  if (countCodePoints(normalizedAnchor) < minAnchorLength) {
    return std::nullopt;
  }
  const std::vector<std::string> anchorWords = splitWords(normalizedAnchor);
  if (anchorWords.empty()) {
    return std::nullopt;
  }
  if (auto paragraph =
          firstQualifyingRegion(anchorWords, document, text_scan::splitParagraphSpans(document), threshold)) {
    return paragraph;
  }
  return firstQualifyingRegion(anchorWords, document, text_scan::splitLineSpans(document), threshold);
}

MatchTier tierForThreshold(double threshold) {
  if (threshold + kThresholdEpsilon >= 0.8) {
    return MatchTier::FuzzyHigh;
  }
  if (threshold + kThresholdEpsilon >= 0.7) {
    return MatchTier::FuzzyMid;
  }
  return MatchTier::FuzzyLow;
}

} // namespace docpatch
