#include "docpatch/DocumentPatcher.h"
#include "docpatch/DocumentSource.h"
#include "docpatch/EditListReader.h"
#include "docpatch/Options.h"
#include "docpatch/PatchEvents.h"
#include "docpatch/TextNormalizer.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace {
bool parseUnsigned(const std::string &text, size_t &out) {
  std::string trimmed = docpatch::trimWhitespace(text);
  if (trimmed.empty()) {
    return false;
  }
  char *end = nullptr;
  unsigned long long value = std::strtoull(trimmed.c_str(), &end, 10);
  if (end == nullptr || *end != '\0' || trimmed[0] == '-') {
    return false;
  }
  out = static_cast<size_t>(value);
  return true;
}

bool parseThresholdList(const std::string &text, std::vector<double> &out, std::string &error) {
  out.clear();
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find(',', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string token = docpatch::trimWhitespace(text.substr(start, end - start));
    if (!token.empty()) {
      char *tail = nullptr;
      double value = std::strtod(token.c_str(), &tail);
      if (tail == nullptr || *tail != '\0' || value <= 0.0 || value > 1.0) {
        error = "fuzzy threshold must be in (0, 1]: " + token;
        return false;
      }
      out.push_back(value);
    }
    if (end == text.size()) {
      break;
    }
    start = end + 1;
  }
  return true;
}

bool takeValue(const std::string &arg,
               const std::string &flag,
               int argc,
               char **argv,
               int &i,
               std::string &value) {
  if (arg == flag && i + 1 < argc) {
    value = argv[++i];
    return true;
  }
  const std::string prefix = flag + "=";
  if (arg.rfind(prefix, 0) == 0) {
    value = arg.substr(prefix.size());
    return true;
  }
  return false;
}

bool parseArgs(int argc, char **argv, docpatch::Options &out, std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (takeValue(arg, "--edits", argc, argv, i, value)) {
      out.editsPath = value;
    } else if (arg == "-o" && i + 1 < argc) {
      out.outputPath = argv[++i];
    } else if (takeValue(arg, "--output", argc, argv, i, value)) {
      out.outputPath = value;
    } else if (takeValue(arg, "--expand-heading", argc, argv, i, value)) {
      out.mode = "expand";
      out.headingAnchor = value;
    } else if (takeValue(arg, "--batch", argc, argv, i, value)) {
      out.mode = "batch";
      out.manifestPath = value;
    } else if (takeValue(arg, "--out-dir", argc, argv, i, value)) {
      out.outDir = value;
    } else if (takeValue(arg, "--jobs", argc, argv, i, value)) {
      size_t jobs = 0;
      if (!parseUnsigned(value, jobs)) {
        error = "invalid job count: " + value;
        return false;
      }
      out.jobs = static_cast<unsigned>(jobs);
    } else if (takeValue(arg, "--report", argc, argv, i, value)) {
      if (value != "text" && value != "json") {
        error = "unsupported report format: " + value;
        return false;
      }
      out.reportFormat = value;
    } else if (takeValue(arg, "--fuzzy-tiers", argc, argv, i, value)) {
      if (!parseThresholdList(value, out.fuzzyThresholds, error)) {
        return false;
      }
    } else if (takeValue(arg, "--min-fuzzy-length", argc, argv, i, value)) {
      if (!parseUnsigned(value, out.minFuzzyAnchorLength)) {
        error = "invalid fuzzy anchor length: " + value;
        return false;
      }
    } else if (takeValue(arg, "--collision-min-length", argc, argv, i, value)) {
      if (!parseUnsigned(value, out.collisionMinLength)) {
        error = "invalid collision length: " + value;
        return false;
      }
    } else if (arg == "--no-sweep") {
      out.sweepDuplicates = false;
    } else if (arg == "--no-collision-guard") {
      out.collisionGuard = false;
    } else if (arg == "--no-expand") {
      out.expandHeadings = false;
    } else if (arg == "--quiet") {
      out.quiet = true;
    } else if (arg == "--strict") {
      out.strict = true;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "unknown option: " + arg;
      return false;
    } else {
      if (!out.documentPath.empty()) {
        return false;
      }
      out.documentPath = arg;
    }
  }
  if (out.mode == "batch") {
    return !out.manifestPath.empty();
  }
  if (out.documentPath.empty()) {
    return false;
  }
  if (out.mode == "patch" && out.editsPath.empty()) {
    error = "--edits is required";
    return false;
  }
  return true;
}

docpatch::PatchOptions makePatchOptions(const docpatch::Options &options, std::mutex &logMutex) {
  docpatch::PatchOptions patchOptions;
  patchOptions.fuzzyThresholds = options.fuzzyThresholds;
  patchOptions.minFuzzyAnchorLength = options.minFuzzyAnchorLength;
  patchOptions.collisionMinLength = options.collisionMinLength;
  patchOptions.sweepDuplicates = options.sweepDuplicates;
  patchOptions.collisionGuard = options.collisionGuard;
  patchOptions.expandHeadings = options.expandHeadings;
  patchOptions.maxParallelJobs = options.jobs;
  const bool quiet = options.quiet;
  patchOptions.observer = [quiet, &logMutex](const docpatch::PatchEvent &event) {
    const docpatch::EventSeverity severity = docpatch::eventSeverity(event);
    if (quiet && severity != docpatch::EventSeverity::Error) {
      return;
    }
    const char *label = severity == docpatch::EventSeverity::Error
                            ? "Patch error: "
                            : (severity == docpatch::EventSeverity::Warning ? "Patch warning: " : "Patch info: ");
    std::lock_guard<std::mutex> lock(logMutex);
    std::cerr << label << docpatch::formatPatchEvent(event) << "\n";
  };
  return patchOptions;
}

void printTextReport(std::ostream &out, const docpatch::PatchReport &report, size_t editCount) {
  out << "applied: " << report.applied.size() << "/" << editCount;
  const size_t lowConfidence = report.lowConfidenceCount();
  if (lowConfidence > 0) {
    out << " (" << lowConfidence << " low confidence)";
  }
  out << "\n";
  for (const auto &location : report.skippedDuplicate) {
    out << "skipped (duplicate): " << location << "\n";
  }
  for (const auto &location : report.skippedNoop) {
    out << "skipped (no-op): " << location << "\n";
  }
  for (const auto &entry : report.failed) {
    out << "failed: " << entry.first << " - " << entry.second << "\n";
  }
  if (report.sweptParagraphs > 0) {
    out << "swept paragraphs: " << report.sweptParagraphs << "\n";
  }
}

bool readEdits(const std::string &path, std::vector<docpatch::EditRequest> &edits, std::string &error) {
  docpatch::FileDocumentSource source;
  std::string text;
  if (!source.fetch(path, text, error)) {
    return false;
  }
  if (!docpatch::parseEditList(text, edits, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

int runExpand(const docpatch::Options &options) {
  docpatch::FileDocumentSource source;
  std::string document;
  std::string error;
  if (!source.fetch(options.documentPath, document, error)) {
    std::cerr << "Fetch error: " << error << "\n";
    return 2;
  }
  docpatch::DocumentPatcher patcher;
  std::string section = patcher.expandHeading(document, options.headingAnchor);
  if (section == options.headingAnchor && !options.quiet) {
    std::cerr << "Expansion warning: heading not found, returning it unchanged\n";
  }
  if (options.outputPath.empty()) {
    std::cout << section << "\n";
    return 0;
  }
  if (!docpatch::writeDocument(options.outputPath, section + "\n", error)) {
    std::cerr << "Output error: " << error << "\n";
    return 2;
  }
  return 0;
}

int runPatch(const docpatch::Options &options) {
  docpatch::FileDocumentSource source;
  std::string document;
  std::string error;
  if (!source.fetch(options.documentPath, document, error)) {
    std::cerr << "Fetch error: " << error << "\n";
    return 2;
  }
  std::vector<docpatch::EditRequest> edits;
  if (!readEdits(options.editsPath, edits, error)) {
    std::cerr << "Edit list error: " << error << "\n";
    return 2;
  }

  std::mutex logMutex;
  docpatch::DocumentPatcher patcher(makePatchOptions(options, logMutex));
  docpatch::PatchResult result;
  if (!patcher.patch(document, edits, result, error)) {
    std::cerr << "Patch error: " << error << "\n";
    return 2;
  }

  std::ostream *reportOut = &std::cerr;
  if (options.outputPath.empty()) {
    std::cout << result.document;
  } else {
    if (!docpatch::writeDocument(options.outputPath, result.document, error)) {
      std::cerr << "Output error: " << error << "\n";
      return 2;
    }
    reportOut = &std::cout;
  }
  if (options.reportFormat == "json") {
    nlohmann::json report = docpatch::reportToJson(result.report);
    report["line_delta"] = docpatch::summarizeLineDelta(document, result.document);
    *reportOut << report.dump(2) << "\n";
  } else {
    printTextReport(*reportOut, result.report, edits.size());
    *reportOut << docpatch::summarizeLineDelta(document, result.document) << "\n";
  }
  if (options.strict && !result.report.failed.empty()) {
    return 3;
  }
  return 0;
}

int runBatch(const docpatch::Options &options) {
  docpatch::FileDocumentSource manifestSource;
  std::string manifestText;
  std::string error;
  if (!manifestSource.fetch(options.manifestPath, manifestText, error)) {
    std::cerr << "Fetch error: " << error << "\n";
    return 2;
  }
  std::vector<docpatch::ManifestEntry> entries;
  if (!docpatch::parseBatchManifest(manifestText, entries, error)) {
    std::cerr << "Manifest error: " << error << "\n";
    return 2;
  }

  docpatch::FileDocumentSource source(std::filesystem::path(options.manifestPath).parent_path());
  std::vector<docpatch::PatchJob> jobs;
  jobs.reserve(entries.size());
  for (auto &entry : entries) {
    docpatch::PatchJob job;
    job.name = entry.identifier;
    if (!source.fetch(entry.identifier, job.document, error)) {
      std::cerr << "Fetch error: " << error << "\n";
      return 2;
    }
    if (!entry.editsFile.empty()) {
      if (!readEdits(source.resolve(entry.editsFile).string(), job.edits, error)) {
        std::cerr << "Edit list error: " << error << "\n";
        return 2;
      }
    } else {
      job.edits = std::move(entry.edits);
    }
    jobs.push_back(std::move(job));
  }

  std::mutex logMutex;
  docpatch::DocumentPatcher patcher(makePatchOptions(options, logMutex));
  std::vector<docpatch::PatchJobResult> results = patcher.patchAll(jobs);

  int status = 0;
  nlohmann::json summary = nlohmann::json::array();
  const std::filesystem::path outDir(options.outDir);
  for (size_t i = 0; i < results.size(); ++i) {
    const auto &result = results[i];
    if (!result.ok) {
      std::cerr << "Patch error: " << result.name << ": " << result.error << "\n";
      status = 2;
    } else {
      const std::filesystem::path outputPath = docpatch::outputPathFor(outDir, result.name);
      if (!docpatch::writeDocument(outputPath, result.result.document, error)) {
        std::cerr << "Output error: " << error << "\n";
        return 2;
      }
      if (options.strict && !result.result.report.failed.empty() && status == 0) {
        status = 3;
      }
    }
    if (options.reportFormat == "json") {
      nlohmann::json item = docpatch::jobResultToJson(result);
      if (result.ok) {
        item["line_delta"] = docpatch::summarizeLineDelta(jobs[i].document, result.result.document);
      }
      summary.push_back(std::move(item));
    } else if (result.ok) {
      std::cout << "== " << result.name << "\n";
      printTextReport(std::cout, result.result.report, jobs[i].edits.size());
      std::cout << docpatch::summarizeLineDelta(jobs[i].document, result.result.document) << "\n";
    }
  }
  if (options.reportFormat == "json") {
    std::cout << summary.dump(2) << "\n";
  }
  return status;
}
} // namespace

int main(int argc, char **argv) {
  docpatch::Options options;
  std::string argError;
  if (!parseArgs(argc, argv, options, argError)) {
    if (!argError.empty()) {
      std::cerr << "Argument error: " << argError << "\n";
    }
    std::cerr << "Usage: docpatch <document.md> --edits <edits.json> [-o <output>] [--report=text|json] "
                 "[--fuzzy-tiers <list>] [--min-fuzzy-length <n>] [--collision-min-length <n>] "
                 "[--no-sweep] [--no-collision-guard] [--no-expand] [--quiet] [--strict]\n"
                 "       docpatch --expand-heading <heading line> <document.md> [-o <output>]\n"
                 "       docpatch --batch <manifest.json> [--out-dir <dir>] [--jobs <n>] [--report=text|json]\n";
    return 2;
  }

  if (options.mode == "expand") {
    return runExpand(options);
  }
  if (options.mode == "batch") {
    return runBatch(options);
  }
  return runPatch(options);
}
