#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "catalog_client.hpp"
#include "copy_client.hpp"
#include "file_discoverer.hpp"
#include "log.hpp"
#include "metadata_builder.hpp"
#include "naming.hpp"
#include "pipeline_stats.hpp"

struct PipelineOptions {
  std::filesystem::path source_root;
  std::filesystem::path destination;
  bool validate = false;
  bool delete_after = false;

  std::size_t max_declare_workers = 4;
  std::size_t max_transfer_workers = 10;
  std::size_t spawn_batch_size = 10;

  double max_requests_per_second = 5.0;
  double request_smear = 1.1;

  std::chrono::milliseconds declare_idle_timeout{10000};
  std::chrono::milliseconds transfer_idle_timeout{30000};
  std::chrono::milliseconds declare_start_jitter{5000};
  std::chrono::milliseconds transfer_start_delay{5000};

  int already_present_code = 17;
  // Times a worker killed by an unexpected error is started again.
  std::size_t max_worker_restarts = 0;

  NameRules rules;
  std::string exclude_prefix = "Supplemental";
  MetadataOptions metadata;  // rules inside are replaced by the ones above
};

// Discover -> declare -> transfer over one directory tree.
//
// Enumeration runs on the calling thread and feeds the declare queue while
// workers are already draining it. run() returns after every declare worker
// and then every transfer worker has gone idle and exited.
class Pipeline {
public:
  Pipeline(PipelineOptions options,
           std::shared_ptr<CatalogClient> catalog,
           std::shared_ptr<CopyClient> copier,
           std::shared_ptr<Logger> logger = nullptr);

  PipelineStats run();

  const PipelineOptions& options() const { return options_; }

private:
  void supervise(const std::string& name, const std::function<void()>& body);
  void join_all();

  PipelineOptions options_;
  std::shared_ptr<CatalogClient> catalog_;
  std::shared_ptr<CopyClient> copier_;
  std::shared_ptr<Logger> logger_;
  PipelineCounters counters_;
  std::vector<std::thread> declare_threads_;
  std::vector<std::thread> transfer_threads_;
};
