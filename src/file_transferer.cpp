#include "file_transferer.hpp"

#include <stdexcept>
#include <system_error>

FileTransferer::FileTransferer(std::shared_ptr<CopyClient> copier,
                               TransferOptions options,
                               std::shared_ptr<Logger> logger)
  : copier_(std::move(copier)),
    options_(std::move(options)),
    logger_(std::move(logger)) {
  if(!copier_) throw std::invalid_argument("FileTransferer requires a copy client");
}

std::filesystem::path FileTransferer::destination_for(const FileItem& item) const {
  return destination_dir(item.source, options_.destination, options_.relative_to) / item.public_name;
}

bool FileTransferer::accepted(int status) const {
  return status == 0 || status == options_.already_present_code;
}

TransferReport FileTransferer::transfer(const FileItem& item) const {
  TransferReport report;
  report.destination = destination_for(item);
  report.status = copier_->copy(item.source, report.destination);
  if(!accepted(report.status)) {
    report.outcome = TransferOutcome::failed;
    return report;
  }
  report.outcome = (report.status == 0) ? TransferOutcome::copied : TransferOutcome::already_present;
  if(options_.delete_after) {
    cleanup(item, report);
  }
  return report;
}

void FileTransferer::cleanup(const FileItem& item, TransferReport& report) const {
  const auto sidecar = metadata_path(item.source, options_.rules);
  log_info(logger_.get(), "Removing {} and metadata file {}", item.source.string(), sidecar.string());

  std::error_code ec;
  report.source_removed = std::filesystem::remove(item.source, ec);
  if(ec == std::errc::permission_denied) {
    log_warn(logger_.get(), "Removing {} failed: Permission denied", item.source.string());
  } else if(ec) {
    log_warn(logger_.get(), "Removing {} failed: {}", item.source.string(), ec.message());
  } else if(!report.source_removed) {
    log_warn(logger_.get(), "Could not remove {}, not found", item.source.string());
  }

  ec.clear();
  report.sidecar_removed = std::filesystem::remove(sidecar, ec);
  if(ec == std::errc::permission_denied) {
    log_warn(logger_.get(), "Removing {} failed: Permission denied", sidecar.string());
  } else if(ec) {
    log_warn(logger_.get(), "Removing {} failed: {}", sidecar.string(), ec.message());
  } else if(!report.sidecar_removed) {
    log_warn(logger_.get(), "Could not remove metadata file {}, not found", sidecar.string());
  }
}
