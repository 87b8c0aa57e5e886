#include "docpatch/DocumentPatcher.h"

#include "docpatch/EditDeduplicator.h"
#include "docpatch/ParagraphSweep.h"
#include "docpatch/SectionScope.h"
#include "docpatch/TextNormalizer.h"

#include <algorithm>
#include <atomic>
#include <thread>

namespace docpatch {
namespace {

// Pieces between '\n' separators, so "a\n" is two lines and "" is one.
size_t countLines(const std::string &text) {
  return static_cast<size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
}

unsigned workerCount(unsigned requested, size_t jobCount) {
  unsigned workers = requested;
  if (workers == 0) {
    workers = std::thread::hardware_concurrency();
  }
  if (workers == 0) {
    workers = 1;
  }
  return static_cast<unsigned>(std::min<size_t>(workers, jobCount));
}

} // namespace

DocumentPatcher::DocumentPatcher(PatchOptions options) : options_(std::move(options)) {}

bool DocumentPatcher::patch(const std::string &document,
                            const std::vector<EditRequest> &edits,
                            PatchResult &out,
                            std::string &error) const {
  return patchNamed({}, document, edits, out, error);
}

bool DocumentPatcher::patchNamed(const std::string &name,
                                 const std::string &document,
                                 const std::vector<EditRequest> &edits,
                                 PatchResult &out,
                                 std::string &error) const {
  size_t badOffset = 0;
  if (!isValidUtf8(document, badOffset)) {
    error = "document is not valid UTF-8 (byte offset " + std::to_string(badOffset) + ")";
    return false;
  }

  out = PatchResult{};
  out.document = document;
  std::vector<EditOutcome> outcomes;

  const std::vector<size_t> subsumed = findSubsumedEdits(edits);
  std::vector<EditRequest> survivors;
  std::vector<size_t> survivorIndices;
  survivors.reserve(edits.size());
  size_t next = 0;
  for (size_t i = 0; i < edits.size(); ++i) {
    if (next < subsumed.size() && subsumed[next] == i) {
      ++next;
      EditOutcome outcome;
      outcome.index = i;
      outcome.location = edits[i].location;
      outcome.status = EditStatus::SubsumedBySection;
      outcome.reason = "section already covered by a parent heading edit";
      if (options_.observer) {
        options_.observer({PatchEventKind::SkippedDuplicate, name, edits[i].location, MatchTier::NotFound,
                           outcome.reason});
      }
      outcomes.push_back(std::move(outcome));
      continue;
    }
    survivors.push_back(edits[i]);
    survivorIndices.push_back(i);
  }

  PatchApplier applier(options_, name);
  PatchReport applied;
  applier.apply(out.document, survivors, applied);
  for (auto &outcome : applied.outcomes) {
    outcome.index = survivorIndices[outcome.index];
    outcomes.push_back(std::move(outcome));
  }
  std::sort(outcomes.begin(), outcomes.end(), [](const EditOutcome &left, const EditOutcome &right) {
    return left.index < right.index;
  });
  for (auto &outcome : outcomes) {
    appendOutcome(out.report, std::move(outcome));
  }

  if (options_.sweepDuplicates) {
    std::vector<std::string> removed;
    out.document = sweepDuplicateParagraphs(out.document, removed, options_.sweepSignatureLength);
    out.report.sweptParagraphs = removed.size();
    if (options_.observer) {
      for (const auto &paragraph : removed) {
        options_.observer(
            {PatchEventKind::ParagraphSwept, name, {}, MatchTier::NotFound, "\"" + previewText(paragraph) + "\""});
      }
    }
  }
  return true;
}

std::string DocumentPatcher::expandHeading(const std::string &document, const std::string &headingAnchor) const {
  std::string section;
  if (!expandSection(document, headingAnchor, section) && options_.observer) {
    options_.observer({PatchEventKind::ExpansionFailed, {}, {}, MatchTier::NotFound,
                       "heading not found: \"" + previewText(headingAnchor) + "\""});
  }
  return section;
}

std::vector<PatchJobResult> DocumentPatcher::patchAll(const std::vector<PatchJob> &jobs) const {
  std::vector<PatchJobResult> results(jobs.size());
  if (jobs.empty()) {
    return results;
  }
  std::atomic<size_t> nextJob{0};
  auto worker = [&]() {
    while (true) {
      const size_t index = nextJob.fetch_add(1);
      if (index >= jobs.size()) {
        return;
      }
      const PatchJob &job = jobs[index];
      PatchJobResult &result = results[index];
      result.name = job.name;
      result.ok = patchNamed(job.name, job.document, job.edits, result.result, result.error);
    }
  };

  const unsigned workers = workerCount(options_.maxParallelJobs, jobs.size());
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (unsigned i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto &thread : threads) {
    thread.join();
  }
  return results;
}

std::string summarizeLineDelta(const std::string &before, const std::string &after) {
  const size_t beforeLines = countLines(before);
  const size_t afterLines = countLines(after);
  const long long delta = static_cast<long long>(afterLines) - static_cast<long long>(beforeLines);
  std::string summary = "lines: ";
  summary += delta >= 0 ? "+" : "";
  summary += std::to_string(delta);
  summary += " (" + std::to_string(beforeLines) + " -> " + std::to_string(afterLines) + ")";
  return summary;
}

} // namespace docpatch
