#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace docpatch {

// Reads documents from the local filesystem. Relative identifiers resolve against
// root. Remote (http/https) identifiers belong to the object-store layer and are
// rejected with an error.
class FileDocumentSource {
public:
  explicit FileDocumentSource(std::filesystem::path root = {});

  bool fetch(const std::string &identifier, std::string &out, std::string &error) const;
  std::filesystem::path resolve(const std::string &identifier) const;

private:
  std::filesystem::path root_;
};

bool writeDocument(const std::filesystem::path &path, const std::string &contents, std::string &error);

// Where a batch writes the patched copy of identifier: its normalized relative path under
// outDir, with any root and leading ".." components removed.
std::filesystem::path outputPathFor(const std::filesystem::path &outDir, const std::string &identifier);

// Document identifiers come under different keys depending on who produced the
// metadata. Tries file_path, source_identifier, minio_url, source and document, in
// that order, first in a nested "metadata" object and then on the entry itself.
std::string resolveDocumentIdentifier(const nlohmann::json &entry);

} // namespace docpatch
