#include "pipeline.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>

#include "declare_worker.hpp"
#include "errors.hpp"
#include "file_declarer.hpp"
#include "file_item.hpp"
#include "file_transferer.hpp"
#include "pool_scheduler.hpp"
#include "transfer_worker.hpp"
#include "work_queue.hpp"

Pipeline::Pipeline(PipelineOptions options,
                   std::shared_ptr<CatalogClient> catalog,
                   std::shared_ptr<CopyClient> copier,
                   std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    catalog_(std::move(catalog)),
    copier_(std::move(copier)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("pipeline")) {
  if(!catalog_ || !copier_) {
    throw std::invalid_argument("Pipeline requires catalog and copy clients");
  }
  options_.metadata.rules = options_.rules;
}

void Pipeline::supervise(const std::string& name, const std::function<void()>& body) {
  std::size_t restarts = 0;
  for(;;) {
    try {
      body();
      return;
    } catch(const std::exception& e) {
      counters_.worker_failures++;
      logger_->error("{} terminated by unexpected error: {}", name, e.what());
      if(restarts >= options_.max_worker_restarts) return;
      ++restarts;
      counters_.worker_restarts++;
      logger_->warn("Restarting {} ({}/{})", name, restarts, options_.max_worker_restarts);
    }
  }
}

void Pipeline::join_all() {
  for(auto& t : declare_threads_) {
    if(t.joinable()) t.join();
  }
  for(auto& t : transfer_threads_) {
    if(t.joinable()) t.join();
  }
}

PipelineStats Pipeline::run() {
  namespace fs = std::filesystem;
  std::error_code ec;
  if(!fs::is_directory(options_.source_root, ec)) {
    throw ConfigError("Recursive mode requested but " + options_.source_root.string() +
                      " is not a directory.");
  }
  const auto root = fs::absolute(options_.source_root);
  const auto started = std::chrono::steady_clock::now();

  WorkQueue<FileItem> declare_queue;
  WorkQueue<TransferItem> transfer_queue;

  const FileDeclarer declarer(catalog_, MetadataBuilder(options_.metadata), options_.validate,
                              logger_->child("declare"));

  TransferOptions transfer_options;
  transfer_options.destination = options_.destination;
  transfer_options.relative_to = root;
  transfer_options.rules = options_.rules;
  transfer_options.delete_after = options_.delete_after;
  transfer_options.already_present_code = options_.already_present_code;
  const FileTransferer transferer(copier_, transfer_options, logger_->child("transfer"));

  DeclareWorkerOptions declare_options;
  declare_options.destination = options_.destination;
  declare_options.relative_to = root;
  declare_options.idle_timeout = options_.declare_idle_timeout;
  declare_options.start_jitter = options_.declare_start_jitter;
  declare_options.max_requests_per_second = options_.max_requests_per_second;
  declare_options.request_smear = options_.request_smear;

  TransferWorkerOptions transfer_worker_options;
  transfer_worker_options.idle_timeout = options_.transfer_idle_timeout;
  transfer_worker_options.start_delay = options_.transfer_start_delay;

  auto spawn_declare = [&]{
    auto name = "declare-" + std::to_string(declare_threads_.size() + 1);
    logger_->info("spawning declaration worker {}", name);
    counters_.declare_workers_spawned++;
    declare_threads_.emplace_back([this, name, &declare_queue, &transfer_queue, &declarer, declare_options]{
      supervise(name, [&]{
        DeclareWorker worker(name, declare_queue, transfer_queue, declarer, declare_options,
                             counters_, logger_->child(name));
        worker.run();
      });
    });
  };

  auto spawn_transfer = [&]{
    auto name = "transfer-" + std::to_string(transfer_threads_.size() + 1);
    logger_->info("spawning transfer worker {}", name);
    counters_.transfer_workers_spawned++;
    transfer_threads_.emplace_back([this, name, &transfer_queue, &transferer, transfer_worker_options]{
      supervise(name, [&]{
        TransferWorker worker(name, transfer_queue, transferer, transfer_worker_options,
                              counters_, logger_->child(name));
        worker.run();
      });
    });
  };

  PoolScheduler scheduler(options_.spawn_batch_size,
                          options_.max_declare_workers,
                          options_.max_transfer_workers);
  FileDiscoverer discoverer(DiscoveryOptions{options_.rules, options_.exclude_prefix},
                            logger_->child("discover"));

  try {
    discoverer.run(root, [&](FileItem item){
      counters_.discovered++;
      declare_queue.push(std::move(item));
      auto decision = scheduler.on_file();
      if(decision.spawn_declare) spawn_declare();
      if(decision.spawn_transfer) spawn_transfer();
    });
  } catch(const std::exception& e) {
    logger_->error("Discovery under {} aborted: {}", root.string(), e.what());
    join_all();
    throw;
  }

  // Declare workers first: transfer workers must still be around to drain
  // whatever the last declarations pushed.
  for(auto& t : declare_threads_) {
    if(t.joinable()) t.join();
  }
  logger_->info("All declare workers finished, waiting for transfers");
  for(auto& t : transfer_threads_) {
    if(t.joinable()) t.join();
  }

  // Transfer workers can time out while stage 1 is stuck in a slow catalog
  // call; whatever it pushed afterwards has no consumer.
  while(auto left = transfer_queue.try_pop()) {
    if(is_heartbeat(*left)) continue;
    const auto& item = std::get<FileItem>(*left);
    logger_->error("{} was declared but never transferred: no transfer worker left", item.source.string());
    counters_.stranded++;
  }

  auto stats = counters_.snapshot();
  stats.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  logger_->info("{}", stats.summary());
  return stats;
}
