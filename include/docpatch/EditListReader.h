#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docpatch/DocumentPatcher.h"
#include "docpatch/EditTypes.h"

namespace docpatch {

struct ManifestEntry {
  std::string identifier;
  std::vector<EditRequest> edits;
  std::string editsFile;
};

// Model output usually arrives wrapped in a ```json fence; returns the fenced body,
// or the trimmed input when there is no fence.
std::string stripJsonFence(const std::string &text);

bool editFromJson(const nlohmann::json &value, EditRequest &out, std::string &error);
bool editListFromJson(const nlohmann::json &value, std::vector<EditRequest> &out, std::string &error);
bool parseEditList(const std::string &text, std::vector<EditRequest> &out, std::string &error);

bool parseBatchManifest(const std::string &text, std::vector<ManifestEntry> &out, std::string &error);

nlohmann::json editToJson(const EditRequest &edit);
nlohmann::json reportToJson(const PatchReport &report);
nlohmann::json jobResultToJson(const PatchJobResult &result);

} // namespace docpatch
