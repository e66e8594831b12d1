#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "file_declarer.hpp"
#include "file_item.hpp"
#include "log.hpp"
#include "pipeline_stats.hpp"
#include "work_queue.hpp"

struct DeclareWorkerOptions {
  std::filesystem::path destination;
  std::filesystem::path relative_to;
  std::chrono::milliseconds idle_timeout{10000};
  // Each worker waits a random time in [0, start_jitter] before its first pop.
  std::chrono::milliseconds start_jitter{5000};
  double max_requests_per_second = 5.0;
  double request_smear = 1.1;
};

// Stage 1. Pops discovered files, declares them and forwards whatever still
// has to be copied. Items that cannot be declared are replaced downstream by
// a Heartbeat. Returns once the input queue stays empty for idle_timeout;
// an unexpected catalog error escapes run().
class DeclareWorker {
public:
  DeclareWorker(std::string name,
                WorkQueue<FileItem>& input,
                WorkQueue<TransferItem>& output,
                const FileDeclarer& declarer,
                DeclareWorkerOptions options,
                PipelineCounters& counters,
                std::shared_ptr<Logger> logger);

  void run();

private:
  void forward(FileItem item);
  void send_heartbeat();

  std::string name_;
  WorkQueue<FileItem>& input_;
  WorkQueue<TransferItem>& output_;
  const FileDeclarer& declarer_;
  DeclareWorkerOptions options_;
  PipelineCounters& counters_;
  std::shared_ptr<Logger> logger_;
};
