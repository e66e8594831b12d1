#pragma once

#include <atomic>
#include <cstddef>
#include <string>

struct PipelineStats {
  std::size_t discovered = 0;
  std::size_t declared = 0;
  std::size_t already_declared = 0;
  std::size_t skipped = 0;
  std::size_t virtual_files = 0;
  std::size_t heartbeats_sent = 0;
  std::size_t heartbeats_received = 0;
  std::size_t transferred = 0;
  std::size_t transfer_failures = 0;
  std::size_t files_deleted = 0;
  std::size_t declare_workers_spawned = 0;
  std::size_t transfer_workers_spawned = 0;
  std::size_t worker_failures = 0;
  std::size_t worker_restarts = 0;
  // declared but left in the transfer queue after every transfer worker exited
  std::size_t stranded = 0;
  double elapsed_seconds = 0.0;

  std::string summary() const;
};

// Shared by every worker of one pipeline run; the only state the workers
// have in common besides the queues.
struct PipelineCounters {
  std::atomic<std::size_t> discovered{0};
  std::atomic<std::size_t> declared{0};
  std::atomic<std::size_t> already_declared{0};
  std::atomic<std::size_t> skipped{0};
  std::atomic<std::size_t> virtual_files{0};
  std::atomic<std::size_t> heartbeats_sent{0};
  std::atomic<std::size_t> heartbeats_received{0};
  std::atomic<std::size_t> transferred{0};
  std::atomic<std::size_t> transfer_failures{0};
  std::atomic<std::size_t> files_deleted{0};
  std::atomic<std::size_t> declare_workers_spawned{0};
  std::atomic<std::size_t> transfer_workers_spawned{0};
  std::atomic<std::size_t> worker_failures{0};
  std::atomic<std::size_t> worker_restarts{0};
  std::atomic<std::size_t> stranded{0};

  PipelineStats snapshot() const;
};
