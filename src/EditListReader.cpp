#include "docpatch/EditListReader.h"

#include "docpatch/DocumentSource.h"
#include "docpatch/TextNormalizer.h"

#include <string_view>
#include <unordered_set>

namespace docpatch {
namespace {

const char *const kUnspecifiedLocation = "unspecified location";

bool readStringField(const nlohmann::json &value, const char *key, std::string &field, std::string &error) {
  auto it = value.find(key);
  if (it == value.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string("field '") + key + "' must be a string";
    return false;
  }
  field = it->get<std::string>();
  return true;
}

bool parseJsonText(const std::string &text, nlohmann::json &out, std::string &error) {
  try {
    out = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    error = std::string("invalid JSON: ") + e.what();
    return false;
  }
  return true;
}

} // namespace

std::string stripJsonFence(const std::string &text) {
  constexpr std::string_view jsonFence = "```json";
  constexpr std::string_view plainFence = "```";
  size_t bodyStart = std::string::npos;
  size_t start = text.find(jsonFence);
  if (start != std::string::npos) {
    bodyStart = start + jsonFence.size();
  } else {
    start = text.find(plainFence);
    if (start == std::string::npos) {
      return trimWhitespace(text);
    }
    bodyStart = start + plainFence.size();
  }
  const size_t end = text.find(plainFence, bodyStart);
  return trimWhitespace(text.substr(bodyStart, end == std::string::npos ? std::string::npos : end - bodyStart));
}

bool editFromJson(const nlohmann::json &value, EditRequest &out, std::string &error) {
  if (!value.is_object()) {
    error = "edit must be a JSON object";
    return false;
  }
  out = EditRequest{};
  if (!readStringField(value, "location", out.location, error) ||
      !readStringField(value, "original_text", out.originalText, error) ||
      !readStringField(value, "modified_text", out.modifiedText, error) ||
      !readStringField(value, "reason", out.reason, error) ||
      !readStringField(value, "modification_type", out.modificationType, error)) {
    return false;
  }
  auto chapter = value.find("is_full_chapter");
  if (chapter != value.end() && !chapter->is_null()) {
    if (!chapter->is_boolean()) {
      error = "field 'is_full_chapter' must be a boolean";
      return false;
    }
    out.isFullChapter = chapter->get<bool>();
  }
  if (trimWhitespace(out.location).empty()) {
    out.location = kUnspecifiedLocation;
  }
  return true;
}

bool editListFromJson(const nlohmann::json &value, std::vector<EditRequest> &out, std::string &error) {
  const nlohmann::json *list = &value;
  if (value.is_object()) {
    auto it = value.find("modifications");
    if (it == value.end()) {
      error = "edit list object requires a 'modifications' array";
      return false;
    }
    list = &*it;
  }
  if (!list->is_array()) {
    error = "edit list must be a JSON array";
    return false;
  }
  out.clear();
  out.reserve(list->size());
  size_t index = 0;
  for (const auto &entry : *list) {
    ++index;
    EditRequest edit;
    std::string editError;
    if (!editFromJson(entry, edit, editError)) {
      error = "edit #" + std::to_string(index) + ": " + editError;
      return false;
    }
    out.push_back(std::move(edit));
  }
  return true;
}

bool parseEditList(const std::string &text, std::vector<EditRequest> &out, std::string &error) {
  nlohmann::json value;
  if (!parseJsonText(stripJsonFence(text), value, error)) {
    return false;
  }
  return editListFromJson(value, out, error);
}

bool parseBatchManifest(const std::string &text, std::vector<ManifestEntry> &out, std::string &error) {
  nlohmann::json value;
  if (!parseJsonText(text, value, error)) {
    return false;
  }
  const nlohmann::json *list = &value;
  if (value.is_object() && value.contains("documents")) {
    list = &value["documents"];
  }
  if (!list->is_array()) {
    error = "manifest must be an array of documents";
    return false;
  }
  out.clear();
  std::unordered_set<std::string> outputs;
  size_t index = 0;
  for (const auto &entry : *list) {
    ++index;
    const std::string prefix = "manifest entry #" + std::to_string(index) + ": ";
    if (!entry.is_object()) {
      error = prefix + "must be a JSON object";
      return false;
    }
    ManifestEntry item;
    item.identifier = resolveDocumentIdentifier(entry);
    if (item.identifier.empty()) {
      error = prefix + "no document identifier";
      return false;
    }
    if (!outputs.insert(outputPathFor({}, item.identifier).generic_string()).second) {
      error = prefix + "output for '" + item.identifier + "' collides with an earlier entry";
      return false;
    }
    auto edits = entry.find("edits");
    if (edits != entry.end()) {
      std::string editsError;
      if (!editListFromJson(*edits, item.edits, editsError)) {
        error = prefix + editsError;
        return false;
      }
    } else {
      std::string fieldError;
      if (!readStringField(entry, "edits_file", item.editsFile, fieldError)) {
        error = prefix + fieldError;
        return false;
      }
      if (item.editsFile.empty()) {
        error = prefix + "requires 'edits' or 'edits_file'";
        return false;
      }
    }
    out.push_back(std::move(item));
  }
  return true;
}

nlohmann::json editToJson(const EditRequest &edit) {
  return nlohmann::json{{"location", edit.location},
                        {"original_text", edit.originalText},
                        {"modified_text", edit.modifiedText},
                        {"reason", edit.reason},
                        {"modification_type", edit.modificationType},
                        {"is_full_chapter", edit.isFullChapter}};
}

nlohmann::json reportToJson(const PatchReport &report) {
  nlohmann::json failed = nlohmann::json::array();
  for (const auto &entry : report.failed) {
    failed.push_back({{"location", entry.first}, {"reason", entry.second}});
  }
  nlohmann::json outcomes = nlohmann::json::array();
  for (const auto &outcome : report.outcomes) {
    outcomes.push_back({{"index", outcome.index},
                        {"location", outcome.location},
                        {"status", editStatusName(outcome.status)},
                        {"tier", matchTierName(outcome.tier)},
                        {"expanded", outcome.expanded},
                        {"expansion_failed", outcome.expansionFailed},
                        {"reason", outcome.reason}});
  }
  return nlohmann::json{{"applied", report.applied},
                        {"skipped_duplicate", report.skippedDuplicate},
                        {"skipped_noop", report.skippedNoop},
                        {"failed", failed},
                        {"low_confidence", report.lowConfidenceCount()},
                        {"swept_paragraphs", report.sweptParagraphs},
                        {"outcomes", outcomes}};
}

nlohmann::json jobResultToJson(const PatchJobResult &result) {
  nlohmann::json value{{"name", result.name}, {"ok", result.ok}};
  if (result.ok) {
    value["report"] = reportToJson(result.result.report);
  } else {
    value["error"] = result.error;
  }
  return value;
}

} // namespace docpatch
