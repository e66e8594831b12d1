#pragma once

#include <filesystem>
#include <memory>

#include "copy_client.hpp"
#include "file_item.hpp"
#include "log.hpp"
#include "naming.hpp"

struct TransferOptions {
  std::filesystem::path destination;
  std::filesystem::path relative_to;
  NameRules rules;
  bool delete_after = false;
  // EEXIST from ifdh: the destination already holds the file.
  int already_present_code = 17;
};

enum class TransferOutcome {
  copied,
  already_present,
  failed
};

struct TransferReport {
  TransferOutcome outcome = TransferOutcome::failed;
  int status = -1;
  std::filesystem::path destination;
  bool source_removed = false;
  bool sidecar_removed = false;
};

// Copies one item and, when asked to, removes the local file and its sidecar
// after an accepted status. Cleanup problems are logged, never thrown.
class FileTransferer {
public:
  FileTransferer(std::shared_ptr<CopyClient> copier,
                 TransferOptions options,
                 std::shared_ptr<Logger> logger = nullptr);

  TransferReport transfer(const FileItem& item) const;

  std::filesystem::path destination_for(const FileItem& item) const;
  bool accepted(int status) const;

  const TransferOptions& options() const { return options_; }

private:
  void cleanup(const FileItem& item, TransferReport& report) const;

  std::shared_ptr<CopyClient> copier_;
  TransferOptions options_;
  std::shared_ptr<Logger> logger_;
};
