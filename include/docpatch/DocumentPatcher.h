#pragma once

#include <string>
#include <vector>

#include "docpatch/EditTypes.h"
#include "docpatch/PatchApplier.h"

namespace docpatch {

struct PatchResult {
  std::string document;
  PatchReport report;
};

struct PatchJob {
  std::string name;
  std::string document;
  std::vector<EditRequest> edits;
};

struct PatchJobResult {
  std::string name;
  bool ok = false;
  std::string error;
  PatchResult result;
};

class DocumentPatcher {
public:
  explicit DocumentPatcher(PatchOptions options = {});

  // Hierarchical dedup, expansion, location and substitution, then the paragraph
  // sweep. Fails only when document is not valid UTF-8; individual edit failures
  // are reported in out.report.
  bool patch(const std::string &document,
             const std::vector<EditRequest> &edits,
             PatchResult &out,
             std::string &error) const;

  std::string expandHeading(const std::string &document, const std::string &headingAnchor) const;

  // Documents are independent, so each job runs on its own worker thread.
  // Results come back in job order.
  std::vector<PatchJobResult> patchAll(const std::vector<PatchJob> &jobs) const;

  const PatchOptions &options() const {
    return options_;
  }

private:
  bool patchNamed(const std::string &name,
                  const std::string &document,
                  const std::vector<EditRequest> &edits,
                  PatchResult &out,
                  std::string &error) const;

  PatchOptions options_;
};

std::string summarizeLineDelta(const std::string &before, const std::string &after);

} // namespace docpatch
