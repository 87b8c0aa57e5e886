#include "docpatch/DocumentPatcher.h"

#include <doctest/doctest.h>

#include <string>
#include <vector>

namespace {
docpatch::EditRequest makeEdit(const std::string &location,
                               const std::string &original,
                               const std::string &modified,
                               bool fullChapter = false) {
  docpatch::EditRequest edit;
  edit.location = location;
  edit.originalText = original;
  edit.modifiedText = modified;
  edit.isFullChapter = fullChapter;
  return edit;
}
} // namespace

TEST_SUITE_BEGIN("docpatch.document_patcher");

TEST_CASE("patches a document end to end") {
  const std::string document = "# Report\n\nWe trained an LSTM model on the corpus.\n\nResults follow.\n";
  docpatch::DocumentPatcher patcher;
  docpatch::PatchResult result;
  std::string error;
  REQUIRE(patcher.patch(document, {makeEdit("method", "LSTM model", "Transformer model")}, result, error));
  CHECK(result.document == "# Report\n\nWe trained an Transformer model on the corpus.\n\nResults follow.\n");
  REQUIRE(result.report.applied.size() == 1);
  CHECK(result.report.failed.empty());
  CHECK(result.report.sweptParagraphs == 0);
}

TEST_CASE("only the first copy of a repeated paragraph is rewritten") {
  const std::string document = "System X uses LSTM for classification.\n\nMiddle.\n\n"
                               "System X uses LSTM for classification.\n";
  docpatch::DocumentPatcher patcher;
  docpatch::PatchResult result;
  std::string error;
  REQUIRE(patcher.patch(document,
                        {makeEdit("section 2",
                                  "System X uses LSTM for classification.",
                                  "System X uses Transformer for classification.")},
                        result,
                        error));
  CHECK(result.document == "System X uses Transformer for classification.\n\nMiddle.\n\n"
                           "System X uses LSTM for classification.\n");
  REQUIRE(result.report.applied.size() == 1);
  CHECK(result.report.applied[0] == "section 2");
  CHECK(result.report.outcomes[0].tier == docpatch::MatchTier::Exact);
  CHECK(result.report.sweptParagraphs == 0);
}

TEST_CASE("rejects invalid utf8 documents") {
  docpatch::DocumentPatcher patcher;
  docpatch::PatchResult result;
  std::string error;
  CHECK_FALSE(patcher.patch("ok \xFF", {}, result, error));
  CHECK(error == "document is not valid UTF-8 (byte offset 3)");
}

TEST_CASE("subsection edits under a chapter edit are skipped") {
  const std::string document = "# 3 Methods\nintro\n## 3.1 Data\nold\n# 4 End\n";
  const std::vector<docpatch::EditRequest> edits = {
      makeEdit("chapter 3", "# 3 Methods", "# 3 Methods\nrewritten", true),
      makeEdit("section 3.1", "## 3.1 Data", "## 3.1 Data\nnew", true),
  };
  docpatch::DocumentPatcher patcher;
  docpatch::PatchResult result;
  std::string error;
  REQUIRE(patcher.patch(document, edits, result, error));
  CHECK(result.document == "# 3 Methods\nrewritten\n# 4 End\n");
  REQUIRE(result.report.outcomes.size() == 2);
  CHECK(result.report.outcomes[0].index == 0);
  CHECK(result.report.outcomes[0].status == docpatch::EditStatus::Applied);
  CHECK(result.report.outcomes[1].index == 1);
  CHECK(result.report.outcomes[1].status == docpatch::EditStatus::SubsumedBySection);
  REQUIRE(result.report.skippedDuplicate.size() == 1);
  CHECK(result.report.skippedDuplicate[0] == "section 3.1");
}

TEST_CASE("outcome indices follow the input order") {
  const std::string document = "# 2 Setup\nold setup\n## 2.1 Tools\nhammer\n\nplain words\n";
  const std::vector<docpatch::EditRequest> edits = {
      makeEdit("tools", "## 2.1 Tools", "## 2.1 Tools\nsaw", true),
      makeEdit("setup", "# 2 Setup", "# 2 Setup\nnew setup", true),
      makeEdit("plain", "missing words", "other"),
  };
  docpatch::DocumentPatcher patcher;
  docpatch::PatchResult result;
  std::string error;
  REQUIRE(patcher.patch(document, edits, result, error));
  REQUIRE(result.report.outcomes.size() == 3);
  CHECK(result.report.outcomes[0].location == "tools");
  CHECK(result.report.outcomes[0].status == docpatch::EditStatus::SubsumedBySection);
  CHECK(result.report.outcomes[1].location == "setup");
  CHECK(result.report.outcomes[1].status == docpatch::EditStatus::Applied);
  CHECK(result.report.outcomes[2].location == "plain");
  CHECK(result.report.outcomes[2].status == docpatch::EditStatus::AnchorNotFound);
}

TEST_CASE("duplicate paragraphs produced by edits are swept") {
  const std::string document = "Alpha paragraph.\n\nBeta paragraph.\n";
  const std::vector<docpatch::EditRequest> edits = {makeEdit("beta", "Beta paragraph.", "Alpha paragraph.")};
  docpatch::PatchResult result;
  std::string error;

  docpatch::DocumentPatcher patcher;
  REQUIRE(patcher.patch(document, edits, result, error));
  CHECK(result.document == "Alpha paragraph.\n");
  CHECK(result.report.sweptParagraphs == 1);

  docpatch::PatchOptions options;
  options.sweepDuplicates = false;
  docpatch::DocumentPatcher unswept(options);
  REQUIRE(unswept.patch(document, edits, result, error));
  CHECK(result.document == "Alpha paragraph.\n\nAlpha paragraph.\n");
  CHECK(result.report.sweptParagraphs == 0);
}

TEST_CASE("expandHeading returns the section or the heading itself") {
  docpatch::DocumentPatcher patcher;
  const std::string document = "# 1 A\nbody\n# 2 B\nmore\n";
  CHECK(patcher.expandHeading(document, "# 1 A") == "# 1 A\nbody");
  CHECK(patcher.expandHeading(document, "# 7 Z") == "# 7 Z");
}

TEST_CASE("patchAll keeps job order and isolates failures") {
  docpatch::PatchOptions options;
  options.maxParallelJobs = 2;
  docpatch::DocumentPatcher patcher(options);
  std::vector<docpatch::PatchJob> jobs;
  for (int i = 0; i < 5; ++i) {
    docpatch::PatchJob job;
    job.name = "doc" + std::to_string(i) + ".md";
    job.document = "value " + std::to_string(i) + "\n";
    job.edits = {makeEdit("value", "value", "number")};
    jobs.push_back(job);
  }
  jobs[3].document = "bad \xC0\xAF";

  const auto results = patcher.patchAll(jobs);
  REQUIRE(results.size() == jobs.size());
  for (size_t i = 0; i < results.size(); ++i) {
    CHECK(results[i].name == jobs[i].name);
    if (i == 3) {
      CHECK_FALSE(results[i].ok);
      CHECK(results[i].error == "document is not valid UTF-8 (byte offset 4)");
    } else {
      CHECK(results[i].ok);
      CHECK(results[i].result.document == "number " + std::to_string(i) + "\n");
    }
  }
  CHECK(patcher.patchAll({}).empty());
}

TEST_CASE("line delta summary counts newline separated pieces") {
  CHECK(docpatch::summarizeLineDelta("a\nb\n", "a\nb\nc\n") == "lines: +1 (3 -> 4)");
  CHECK(docpatch::summarizeLineDelta("a\nb", "a") == "lines: -1 (2 -> 1)");
  CHECK(docpatch::summarizeLineDelta("a\n", "a") == "lines: -1 (2 -> 1)");
  CHECK(docpatch::summarizeLineDelta("", "") == "lines: +0 (1 -> 1)");
}

TEST_SUITE_END();
