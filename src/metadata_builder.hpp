#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "file_item.hpp"
#include "naming.hpp"

struct MetadataOptions {
  NameRules rules;
  // Merged over every sidecar. A null value removes the key.
  nlohmann::json overrides = nlohmann::json::object();
  // Source-name prefix -> extra fields, first matching prefix wins.
  nlohmann::json stage_overrides = nlohmann::json::object();
  std::vector<std::string> unsupported_prefixes;
};

// Produces the catalog record for one file: sidecar contents, configured
// overrides, public file name, size and checksums. Virtual files get size 0
// and no checksum since they carry no payload.
//
// Throws MetadataNotFoundError, InvalidMetadataError, SourceFileMissingError
// for per-item problems and UnsupportedFileError for names we never handle.
class MetadataBuilder {
public:
  explicit MetadataBuilder(MetadataOptions options);

  nlohmann::json build(const FileItem& item) const;

  const MetadataOptions& options() const { return options_; }

private:
  nlohmann::json load_sidecar(const FileItem& item) const;
  static void apply_fields(nlohmann::json& target, const nlohmann::json& fields);

  MetadataOptions options_;
};
