#include "metadata_builder.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "checksum.hpp"
#include "errors.hpp"

MetadataBuilder::MetadataBuilder(MetadataOptions options)
  : options_(std::move(options)) {}

void MetadataBuilder::apply_fields(nlohmann::json& target, const nlohmann::json& fields) {
  if(!fields.is_object()) return;
  for(const auto& field : fields.items()) {
    if(field.value().is_null()) {
      target.erase(field.key());
    } else {
      target[field.key()] = field.value();
    }
  }
}

nlohmann::json MetadataBuilder::load_sidecar(const FileItem& item) const {
  std::error_code ec;
  if(std::filesystem::is_directory(item.source, ec)) {
    throw SourceFileMissingError(item.source.string() + " is a directory.");
  }
  auto sidecar = metadata_path(item.source, options_.rules);
  if(!std::filesystem::is_regular_file(sidecar, ec)) {
    throw MetadataNotFoundError("Tried to declare " + item.source.string() +
                                " but " + sidecar.string() + " was not found!");
  }
  std::ifstream in(sidecar);
  if(!in) {
    throw MetadataNotFoundError("Unable to open " + sidecar.string());
  }
  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) {
    throw InvalidMetadataError(sidecar.string() + " is not a JSON object");
  }
  return doc;
}

nlohmann::json MetadataBuilder::build(const FileItem& item) const {
  const auto source_name = item.source.filename().string();
  for(const auto& prefix : options_.unsupported_prefixes) {
    if(!prefix.empty() && starts_with(source_name, prefix)) {
      throw UnsupportedFileError("Metadata generation for file with name " +
                                 source_name + " is not supported.");
    }
  }

  nlohmann::json result = load_sidecar(item);
  apply_fields(result, options_.overrides);
  if(options_.stage_overrides.is_object()) {
    for(const auto& stage : options_.stage_overrides.items()) {
      if(starts_with(source_name, stage.key())) {
        apply_fields(result, stage.value());
        break;
      }
    }
  }

  result["file_name"] = item.public_name;
  if(item.is_virtual) {
    result["file_size"] = 0;
    return result;
  }

  std::error_code ec;
  auto size = std::filesystem::file_size(item.source, ec);
  if(ec) {
    throw SourceFileMissingError("Cannot stat " + item.source.string() + ": " + ec.message());
  }
  result["file_size"] = size;
  result["checksum"] = compute_file_checksums(item.source).as_catalog_strings();
  return result;
}
