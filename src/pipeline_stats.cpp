#include "pipeline_stats.hpp"

#include <spdlog/fmt/fmt.h>

std::string PipelineStats::summary() const {
  const std::size_t handled = declared + already_declared + skipped;
  const double rate = elapsed_seconds > 0.0 ? static_cast<double>(handled) / elapsed_seconds : 0.0;
  return fmt::format("Processed {} files (declared={}, skip={}) in {:.2f} seconds ({:.2f} files per second); "
                     "transferred={}, transfer_failures={}, stranded={}, deleted={}, worker_failures={}",
                     discovered, declared, already_declared + skipped, elapsed_seconds, rate,
                     transferred, transfer_failures, stranded, files_deleted, worker_failures);
}

PipelineStats PipelineCounters::snapshot() const {
  PipelineStats out;
  out.discovered = discovered.load();
  out.declared = declared.load();
  out.already_declared = already_declared.load();
  out.skipped = skipped.load();
  out.virtual_files = virtual_files.load();
  out.heartbeats_sent = heartbeats_sent.load();
  out.heartbeats_received = heartbeats_received.load();
  out.transferred = transferred.load();
  out.transfer_failures = transfer_failures.load();
  out.files_deleted = files_deleted.load();
  out.declare_workers_spawned = declare_workers_spawned.load();
  out.transfer_workers_spawned = transfer_workers_spawned.load();
  out.worker_failures = worker_failures.load();
  out.worker_restarts = worker_restarts.load();
  out.stranded = stranded.load();
  return out;
}
