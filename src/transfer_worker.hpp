#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "file_item.hpp"
#include "file_transferer.hpp"
#include "log.hpp"
#include "pipeline_stats.hpp"
#include "work_queue.hpp"

struct TransferWorkerOptions {
  std::chrono::milliseconds idle_timeout{30000};
  // Gives stage 1 a head start so the first pops do not all time out.
  std::chrono::milliseconds start_delay{5000};
};

// Stage 2. Copies declared items; heartbeats only keep it waiting. A failed
// copy drops the item. Returns after idle_timeout without input.
class TransferWorker {
public:
  TransferWorker(std::string name,
                 WorkQueue<TransferItem>& input,
                 const FileTransferer& transferer,
                 TransferWorkerOptions options,
                 PipelineCounters& counters,
                 std::shared_ptr<Logger> logger);

  void run();

private:
  std::string name_;
  WorkQueue<TransferItem>& input_;
  const FileTransferer& transferer_;
  TransferWorkerOptions options_;
  PipelineCounters& counters_;
  std::shared_ptr<Logger> logger_;
};
