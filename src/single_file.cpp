#include "single_file.hpp"

#include "errors.hpp"
#include "file_declarer.hpp"
#include "file_item.hpp"
#include "file_transferer.hpp"

int run_single_file(const PipelineOptions& options,
                    std::shared_ptr<CatalogClient> catalog,
                    std::shared_ptr<CopyClient> copier,
                    std::shared_ptr<Logger> logger) {
  namespace fs = std::filesystem;
  if(!logger) logger = std::make_shared<Logger>("single");

  std::error_code ec;
  if(fs::is_directory(options.source_root, ec)) {
    throw ConfigError(options.source_root.string() + " is a directory; use -R to process it recursively.");
  }
  const auto source = fs::absolute(options.source_root);
  auto item = FileItem::from_path(source, options.rules);

  MetadataOptions metadata = options.metadata;
  metadata.rules = options.rules;
  const FileDeclarer declarer(catalog, MetadataBuilder(std::move(metadata)), options.validate,
                              logger->child("declare"));
  auto report = declarer.declare(item, options.destination);
  if(!should_forward(report.outcome)) {
    logger->error("Not transferring {}: {} {}", source.string(), to_string(report.outcome), report.detail);
    return 1;
  }
  if(report.outcome == DeclareOutcome::already_declared) {
    logger->warn("{} already declared", item.public_name);
  } else {
    logger->info("Declared {}", item.public_name);
  }

  if(item.is_virtual) {
    logger->info("NOT transferring virtual file {}", source.string());
    return 0;
  }

  TransferOptions transfer_options;
  transfer_options.destination = options.destination;
  transfer_options.relative_to = source.parent_path();
  transfer_options.rules = options.rules;
  transfer_options.delete_after = options.delete_after;
  transfer_options.already_present_code = options.already_present_code;
  const FileTransferer transferer(std::move(copier), transfer_options, logger->child("transfer"));

  auto result = transferer.transfer(item);
  if(result.outcome == TransferOutcome::failed) {
    logger->error("Copy of {} to {} failed with status {}",
                  source.string(), result.destination.string(), result.status);
    return 1;
  }
  logger->info("Copied {} to {}", source.string(), result.destination.string());
  return 0;
}
