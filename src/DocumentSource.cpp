#include "docpatch/DocumentSource.h"

#include <array>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>
#include <utility>

namespace docpatch {
namespace {

using IdentifierStrategy = std::function<std::string(const nlohmann::json &)>;

IdentifierStrategy stringField(const char *key) {
  return [key](const nlohmann::json &value) -> std::string {
    auto it = value.find(key);
    if (it == value.end() || !it->is_string()) {
      return {};
    }
    return it->get<std::string>();
  };
}

const std::array<IdentifierStrategy, 5> &identifierStrategies() {
  static const std::array<IdentifierStrategy, 5> strategies = {
      stringField("file_path"),
      stringField("source_identifier"),
      stringField("minio_url"),
      stringField("source"),
      stringField("document"),
  };
  return strategies;
}

bool isRemoteIdentifier(const std::string &identifier) {
  return identifier.rfind("http://", 0) == 0 || identifier.rfind("https://", 0) == 0;
}

} // namespace

FileDocumentSource::FileDocumentSource(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FileDocumentSource::resolve(const std::string &identifier) const {
  std::filesystem::path path(identifier);
  if (path.is_absolute() || root_.empty()) {
    return path;
  }
  return root_ / path;
}

bool FileDocumentSource::fetch(const std::string &identifier, std::string &out, std::string &error) const {
  if (identifier.empty()) {
    error = "empty document identifier";
    return false;
  }
  if (isRemoteIdentifier(identifier)) {
    error = "remote document identifiers are not supported: " + identifier;
    return false;
  }
  const std::filesystem::path path = resolve(identifier);
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    error = "document path is a directory: " + path.string();
    return false;
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "failed to read document: " + path.string();
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

bool writeDocument(const std::filesystem::path &path, const std::string &contents, std::string &error) {
  std::filesystem::path parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      error = "failed to create output directory: " + parent.string();
      return false;
    }
  }
  std::ofstream file(path, std::ios::binary);
  if (!file) {
    error = "failed to write output: " + path.string();
    return false;
  }
  file << contents;
  if (!file.good()) {
    error = "failed to write output: " + path.string();
    return false;
  }
  return true;
}

std::filesystem::path outputPathFor(const std::filesystem::path &outDir, const std::string &identifier) {
  const std::filesystem::path normal = std::filesystem::path(identifier).lexically_normal().relative_path();
  std::filesystem::path relative;
  bool leading = true;
  for (const auto &part : normal) {
    if (leading && (part == ".." || part == ".")) {
      continue;
    }
    leading = false;
    relative /= part;
  }
  if (relative.empty()) {
    relative = normal.filename();
  }
  return outDir / relative;
}

std::string resolveDocumentIdentifier(const nlohmann::json &entry) {
  if (!entry.is_object()) {
    return {};
  }
  auto metadata = entry.find("metadata");
  if (metadata != entry.end() && metadata->is_object()) {
    for (const auto &strategy : identifierStrategies()) {
      std::string identifier = strategy(*metadata);
      if (!identifier.empty()) {
        return identifier;
      }
    }
  }
  for (const auto &strategy : identifierStrategies()) {
    std::string identifier = strategy(entry);
    if (!identifier.empty()) {
      return identifier;
    }
  }
  return {};
}

} // namespace docpatch
