#include "docpatch/PatchApplier.h"

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

docpatch::PatchReport applyAll(std::string &document,
                               const std::vector<docpatch::EditRequest> &edits,
                               docpatch::PatchOptions options = {}) {
  docpatch::PatchApplier applier(std::move(options));
  docpatch::PatchReport report;
  applier.apply(document, edits, report);
  return report;
}
} // namespace

TEST_SUITE_BEGIN("docpatch.patch_applier");

TEST_CASE("replaces an exact anchor") {
  std::string document = "Intro.\n\nThe model uses LSTM layers.\n";
  const auto report = applyAll(document, {makeEdit("model", "LSTM layers", "Transformer layers")});
  CHECK(document == "Intro.\n\nThe model uses Transformer layers.\n");
  REQUIRE(report.applied.size() == 1);
  CHECK(report.applied[0] == "model");
  REQUIRE(report.outcomes.size() == 1);
  CHECK(report.outcomes[0].tier == docpatch::MatchTier::Exact);
  CHECK(report.outcomes[0].status == docpatch::EditStatus::Applied);
}

TEST_CASE("only the first occurrence is replaced") {
  std::string document = "cat and cat";
  applyAll(document, {makeEdit("pets", "cat", "dog")});
  CHECK(document == "dog and cat");
}

TEST_CASE("edits see the output of earlier edits") {
  std::string document = "alpha\n";
  const auto report = applyAll(document, {makeEdit("one", "alpha", "beta"), makeEdit("two", "beta", "gamma")});
  CHECK(document == "gamma\n");
  CHECK(report.applied.size() == 2);
}

TEST_CASE("whitespace-only differences are a no-op") {
  std::string document = "X marks the spot";
  const auto report = applyAll(document, {makeEdit("noop", "X", "X  ")});
  CHECK(document == "X marks the spot");
  REQUIRE(report.skippedNoop.size() == 1);
  CHECK(report.skippedNoop[0] == "noop");
  CHECK(report.applied.empty());
}

TEST_CASE("ideographic space differences are a no-op") {
  std::string document = "alpha beta here\n";
  const auto report = applyAll(document, {makeEdit("cjk", "alpha beta", "alpha\xE3\x80\x80" "beta")});
  CHECK(document == "alpha beta here\n");
  REQUIRE(report.skippedNoop.size() == 1);
  CHECK(report.applied.empty());
}

TEST_CASE("blank anchors fail as missing") {
  std::string document = "text";
  const auto report = applyAll(document, {makeEdit("blank", "  \n ", "new")});
  REQUIRE(report.failed.size() == 1);
  CHECK(report.failed[0].first == "blank");
  CHECK(report.failed[0].second == "missing original text");
  CHECK(report.outcomes[0].status == docpatch::EditStatus::MissingAnchor);
}

TEST_CASE("repeated anchors are skipped after the first") {
  std::string document = "alpha beta";
  const auto report =
      applyAll(document, {makeEdit("first", "alpha", "gamma"), makeEdit("second", "alpha ", "delta")});
  CHECK(document == "gamma beta");
  REQUIRE(report.skippedDuplicate.size() == 1);
  CHECK(report.skippedDuplicate[0] == "second");
  CHECK(report.outcomes[1].status == docpatch::EditStatus::SkippedDuplicate);
}

TEST_CASE("short anchors that are absent fail without fuzzy search") {
  std::string document = "alpha beta";
  const auto report = applyAll(document, {makeEdit("short", "zzz", "yyy")});
  REQUIRE(report.failed.size() == 1);
  CHECK(report.failed[0].second == "anchor not found (too short for fuzzy matching)");
  CHECK(document == "alpha beta");
}

TEST_CASE("fuzzy match escalates through tiers") {
  std::string document = "First paragraph here.\n\nThe quick brown fox jumps over the lazy dog today\n";
  std::vector<docpatch::PatchEvent> events;
  docpatch::PatchOptions options;
  options.observer = [&events](const docpatch::PatchEvent &event) { events.push_back(event); };
  const auto report = applyAll(
      document, {makeEdit("fox", "The quick brown fox leaps over the lazy cat", "A replacement sentence.")}, options);
  CHECK(document == "First paragraph here.\n\nA replacement sentence.\n");
  REQUIRE(report.outcomes.size() == 1);
  CHECK(report.outcomes[0].tier == docpatch::MatchTier::FuzzyMid);
  CHECK(report.lowConfidenceCount() == 1);

  bool escalated = false;
  bool fuzzy = false;
  for (const auto &event : events) {
    escalated = escalated || event.kind == docpatch::PatchEventKind::TierEscalated;
    fuzzy = fuzzy || event.kind == docpatch::PatchEventKind::FuzzyMatch;
  }
  CHECK(escalated);
  CHECK(fuzzy);
}

TEST_CASE("unmatched long anchors fail after every tier") {
  std::string document = "Completely unrelated content lives here.\n";
  const auto report =
      applyAll(document, {makeEdit("missing", "nothing in this sentence appears anywhere", "replacement")});
  REQUIRE(report.failed.size() == 1);
  CHECK(report.failed[0].second == "anchor not found");
}

TEST_CASE("collision guard blocks replacements already in the document") {
  const std::string original = "Old sentence to replace.\n\nThis brand new sentence already exists here.\n";
  const auto edit =
      makeEdit("dup", "Old sentence to replace.", "This brand new sentence already exists here.");

  std::string document = original;
  auto report = applyAll(document, {edit});
  CHECK(document == original);
  REQUIRE(report.failed.size() == 1);
  CHECK(report.failed[0].second == "collision guard: replacement text already present");
  CHECK(report.outcomes[0].status == docpatch::EditStatus::CollisionGuard);

  docpatch::PatchOptions options;
  options.collisionGuard = false;
  document = original;
  report = applyAll(document, {edit}, options);
  CHECK(report.applied.size() == 1);
  CHECK(document.find("Old sentence") == std::string::npos);
}

TEST_CASE("short replacements are never guarded") {
  std::string document = "Replace me please. Keep here.";
  const auto report = applyAll(document, {makeEdit("short", "Replace me please.", "here")});
  CHECK(report.applied.size() == 1);
  CHECK(document == "here Keep here.");
}

TEST_CASE("replacement inside the matched region is not a collision") {
  std::string document = "Intro.\n\nThis long sentence stays and loses a tail. Extra words.\n";
  const auto report = applyAll(document,
                               {makeEdit("trim",
                                         "This long sentence stays and loses a tail. Extra words.",
                                         "This long sentence stays and loses a tail.")});
  CHECK(report.applied.size() == 1);
  CHECK(document == "Intro.\n\nThis long sentence stays and loses a tail.\n");
}

TEST_CASE("full chapter heading edits replace the whole section") {
  std::string document = "# 1 Intro\ntext\n# 2 Methods\nold method body\n# 3 Results\nres\n";
  const auto report =
      applyAll(document, {makeEdit("methods", "# 2 Methods", "# 2 Methods\nnew body", true)});
  CHECK(document == "# 1 Intro\ntext\n# 2 Methods\nnew body\n# 3 Results\nres\n");
  REQUIRE(report.outcomes.size() == 1);
  CHECK(report.outcomes[0].expanded);
  CHECK_FALSE(report.outcomes[0].expansionFailed);
}

TEST_CASE("chapter edits skip deeper headings with the same title") {
  std::string document = "## 3 Data\nsub\n# 3 Data\nbody\n# 4 End\n";
  const auto report = applyAll(document, {makeEdit("data", "# 3 Data", "# 3 Data\nnew chapter body", true)});
  CHECK(document == "## 3 Data\nsub\n# 3 Data\nnew chapter body\n# 4 End\n");
  REQUIRE(report.outcomes.size() == 1);
  CHECK(report.outcomes[0].expanded);
}

TEST_CASE("empty chapter sections are replaced at their own heading") {
  std::string document = "## 3 Data\nsub\n# 3 Data\n# 4 End\n";
  const auto report = applyAll(document, {makeEdit("data", "# 3 Data", "# 3 Data\nfilled", true)});
  CHECK(document == "## 3 Data\nsub\n# 3 Data\nfilled\n# 4 End\n");
  CHECK(report.applied.size() == 1);
}

TEST_CASE("expansion can be disabled") {
  std::string document = "# 2 Methods\nold method body\n";
  docpatch::PatchOptions options;
  options.expandHeadings = false;
  const auto report =
      applyAll(document, {makeEdit("methods", "# 2 Methods", "# 2 Methods\nnew body", true)}, options);
  CHECK(document == "# 2 Methods\nnew body\nold method body\n");
  CHECK_FALSE(report.outcomes[0].expanded);
}

TEST_CASE("failed expansion falls back to the given anchor") {
  std::string document = "# 1 Intro\ntext\n";
  const auto report = applyAll(document, {makeEdit("missing", "# 9 Missing", "# 9 Found", true)});
  REQUIRE(report.outcomes.size() == 1);
  CHECK(report.outcomes[0].expansionFailed);
  CHECK(report.outcomes[0].status == docpatch::EditStatus::AnchorNotFound);
  CHECK(document == "# 1 Intro\ntext\n");
}

TEST_CASE("locate reports exact offsets") {
  docpatch::PatchApplier applier(docpatch::PatchOptions{});
  auto match = applier.locate("one two three", "two", "loc");
  REQUIRE(match.has_value());
  CHECK(match->offset == 4);
  CHECK(match->tier == docpatch::MatchTier::Exact);
  CHECK_FALSE(applier.locate("one two three", "four", "loc").has_value());
}

TEST_CASE("observer events carry the document name") {
  std::vector<docpatch::PatchEvent> events;
  docpatch::PatchOptions options;
  options.observer = [&events](const docpatch::PatchEvent &event) { events.push_back(event); };
  docpatch::PatchApplier applier(options, "notes.md");
  std::string document = "alpha";
  docpatch::PatchReport report;
  applier.apply(document, {makeEdit("a", "alpha", "beta")}, report);
  REQUIRE_FALSE(events.empty());
  CHECK(events.back().kind == docpatch::PatchEventKind::Applied);
  CHECK(events.back().document == "notes.md");
  CHECK(events.back().location == "a");
}

TEST_SUITE_END();
