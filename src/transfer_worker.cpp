#include "transfer_worker.hpp"

#include <thread>

TransferWorker::TransferWorker(std::string name,
                               WorkQueue<TransferItem>& input,
                               const FileTransferer& transferer,
                               TransferWorkerOptions options,
                               PipelineCounters& counters,
                               std::shared_ptr<Logger> logger)
  : name_(std::move(name)),
    input_(input),
    transferer_(transferer),
    options_(options),
    counters_(counters),
    logger_(std::move(logger)) {}

void TransferWorker::run() {
  if(options_.start_delay.count() > 0) {
    std::this_thread::sleep_for(options_.start_delay);
  }
  log_info(logger_.get(), "Transfer worker {} start", name_);

  std::size_t transferred = 0;
  while(auto next = input_.pop(options_.idle_timeout)) {
    if(is_heartbeat(*next)) {
      log_debug(logger_.get(), "{} got heartbeat", name_);
      counters_.heartbeats_received++;
      continue;
    }

    const auto& item = std::get<FileItem>(*next);
    auto report = transferer_.transfer(item);
    if(report.outcome == TransferOutcome::failed) {
      log_warn(logger_.get(), "{} transfer of {} to {} failed (result={})",
               name_, item.source.string(), report.destination.string(), report.status);
      counters_.transfer_failures++;
      continue;
    }

    log_info(logger_.get(), "{} transfer of {} finished (result={})",
             name_, item.source.string(), report.status);
    counters_.transferred++;
    ++transferred;
    if(report.source_removed) counters_.files_deleted++;
  }

  log_info(logger_.get(), "Transfer worker {} end (transferred={})", name_, transferred);
}
