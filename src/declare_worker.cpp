#include "declare_worker.hpp"

#include <random>
#include <thread>

#include "rate_limiter.hpp"

DeclareWorker::DeclareWorker(std::string name,
                             WorkQueue<FileItem>& input,
                             WorkQueue<TransferItem>& output,
                             const FileDeclarer& declarer,
                             DeclareWorkerOptions options,
                             PipelineCounters& counters,
                             std::shared_ptr<Logger> logger)
  : name_(std::move(name)),
    input_(input),
    output_(output),
    declarer_(declarer),
    options_(std::move(options)),
    counters_(counters),
    logger_(std::move(logger)) {}

void DeclareWorker::forward(FileItem item) {
  if(item.is_virtual) {
    // nothing to copy, but stage 2 must still see that stage 1 is alive
    log_info(logger_.get(), "NOT transferring virtual file {}", item.source.string());
    counters_.virtual_files++;
    send_heartbeat();
    return;
  }
  output_.push(TransferItem(std::move(item)));
}

void DeclareWorker::send_heartbeat() {
  output_.push(TransferItem(Heartbeat{}));
  counters_.heartbeats_sent++;
}

void DeclareWorker::run() {
  if(options_.start_jitter.count() > 0) {
    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<long long> dist(0, options_.start_jitter.count());
    std::this_thread::sleep_for(std::chrono::milliseconds(dist(rng)));
  }
  log_info(logger_.get(), "Declare worker {} start", name_);

  RateLimiter limiter(options_.max_requests_per_second, options_.request_smear);
  std::size_t declared = 0;
  std::size_t skipped = 0;

  while(auto item = input_.pop(options_.idle_timeout)) {
    log_debug(logger_.get(), "{} got {}", name_, item->source.string());
    auto location = destination_dir(item->source, options_.destination, options_.relative_to);
    auto report = declarer_.declare(*item, location);

    switch(report.outcome) {
      case DeclareOutcome::declared:
        log_info(logger_.get(), "{} declared {}", name_, item->source.string());
        counters_.declared++;
        ++declared;
        forward(std::move(*item));
        break;
      case DeclareOutcome::already_declared:
        // may never have been copied, so it still goes downstream
        log_warn(logger_.get(), "{} skipping {}, already declared.", name_, item->source.string());
        counters_.already_declared++;
        ++skipped;
        forward(std::move(*item));
        break;
      case DeclareOutcome::metadata_missing:
        log_warn(logger_.get(), "{} skipping {}, metadata not found.", name_, item->source.string());
        counters_.skipped++;
        ++skipped;
        send_heartbeat();
        break;
      case DeclareOutcome::metadata_invalid:
      case DeclareOutcome::source_missing:
        log_warn(logger_.get(), "{} skipping {}, {} ({}).",
                 name_, item->source.string(), to_string(report.outcome), report.detail);
        counters_.skipped++;
        ++skipped;
        send_heartbeat();
        break;
    }

    auto slept = limiter.gate();
    if(slept.count() > 0.0) {
      log_debug(logger_.get(), "{} sleeping {:.4f}s", name_, slept.count());
    }
  }

  log_info(logger_.get(), "Declare worker {} end (declared={}, skipped={})", name_, declared, skipped);
}
