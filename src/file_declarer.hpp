#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "catalog_client.hpp"
#include "file_item.hpp"
#include "log.hpp"
#include "metadata_builder.hpp"

enum class DeclareOutcome {
  declared,
  already_declared,
  metadata_missing,
  metadata_invalid,
  source_missing
};

const char* to_string(DeclareOutcome outcome);

// declared and already_declared both mean the file may still need moving.
inline bool should_forward(DeclareOutcome outcome) {
  return outcome == DeclareOutcome::declared || outcome == DeclareOutcome::already_declared;
}

struct DeclareReport {
  DeclareOutcome outcome = DeclareOutcome::declared;
  std::string detail;
};

// One registration attempt: build metadata, optionally validate, declare,
// then record the destination location for files with a payload.
// Exceptions other than the per-item ones listed in MetadataBuilder pass
// straight through.
class FileDeclarer {
public:
  FileDeclarer(std::shared_ptr<CatalogClient> catalog,
               MetadataBuilder metadata,
               bool validate,
               std::shared_ptr<Logger> logger = nullptr);

  DeclareReport declare(FileItem& item, const std::filesystem::path& location) const;

private:
  std::shared_ptr<CatalogClient> catalog_;
  MetadataBuilder metadata_;
  bool validate_;
  std::shared_ptr<Logger> logger_;
};
