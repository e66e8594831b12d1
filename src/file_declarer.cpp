#include "file_declarer.hpp"

#include <stdexcept>

#include "errors.hpp"

const char* to_string(DeclareOutcome outcome) {
  switch(outcome) {
    case DeclareOutcome::declared: return "declared";
    case DeclareOutcome::already_declared: return "already declared";
    case DeclareOutcome::metadata_missing: return "metadata not found";
    case DeclareOutcome::metadata_invalid: return "metadata invalid";
    case DeclareOutcome::source_missing: return "file not found";
  }
  return "unknown";
}

FileDeclarer::FileDeclarer(std::shared_ptr<CatalogClient> catalog,
                           MetadataBuilder metadata,
                           bool validate,
                           std::shared_ptr<Logger> logger)
  : catalog_(std::move(catalog)),
    metadata_(std::move(metadata)),
    validate_(validate),
    logger_(std::move(logger)) {
  if(!catalog_) throw std::invalid_argument("FileDeclarer requires a catalog client");
}

DeclareReport FileDeclarer::declare(FileItem& item, const std::filesystem::path& location) const {
  try {
    item.metadata = metadata_.build(item);
  } catch(const MetadataNotFoundError& e) {
    return {DeclareOutcome::metadata_missing, e.what()};
  } catch(const InvalidMetadataError& e) {
    return {DeclareOutcome::metadata_invalid, e.what()};
  } catch(const SourceFileMissingError& e) {
    return {DeclareOutcome::source_missing, e.what()};
  }

  if(validate_) {
    auto checked = catalog_->validate_metadata(*item.metadata);
    if(checked.status == DeclareStatus::invalid_metadata) {
      return {DeclareOutcome::metadata_invalid, checked.message};
    }
  }

  auto result = catalog_->declare_file(*item.metadata);
  switch(result.status) {
    case DeclareStatus::already_exists:
      return {DeclareOutcome::already_declared, result.message};
    case DeclareStatus::invalid_metadata:
      return {DeclareOutcome::metadata_invalid, result.message};
    case DeclareStatus::ok:
      break;
  }

  if(item.is_virtual) {
    log_info(logger_.get(), "NOT adding file location for virtual file {}", item.source.string());
  } else {
    catalog_->add_file_location(item.public_name, location);
  }
  return {DeclareOutcome::declared, result.message};
}
