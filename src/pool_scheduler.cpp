#include "pool_scheduler.hpp"

#include <algorithm>

PoolScheduler::PoolScheduler(std::size_t batch_size,
                             std::size_t max_declare_workers,
                             std::size_t max_transfer_workers)
  : batch_size_(std::max<std::size_t>(1, batch_size)),
    max_declare_(std::max<std::size_t>(1, max_declare_workers)),
    max_transfer_(std::max<std::size_t>(1, max_transfer_workers)) {}

PoolScheduler::Decision PoolScheduler::on_file() {
  Decision decision;
  ++files_since_spawn_;
  bool first = (declare_workers_ == 0);
  if(!first && files_since_spawn_ < batch_size_) return decision;

  if(declare_workers_ < max_declare_) {
    decision.spawn_declare = true;
    ++declare_workers_;
  }
  if(transfer_workers_ < max_transfer_) {
    decision.spawn_transfer = true;
    ++transfer_workers_;
  }
  files_since_spawn_ = 0;
  return decision;
}
