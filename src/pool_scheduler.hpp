#pragma once

#include <cstddef>

// Decides, file by file, whether another declare and/or transfer worker
// should be started. The first file always gets one of each; after that a
// new pair is considered every batch_size files until each pool reaches its
// ceiling. Small batches therefore run on a single worker per stage.
class PoolScheduler {
public:
  struct Decision {
    bool spawn_declare = false;
    bool spawn_transfer = false;
  };

  PoolScheduler(std::size_t batch_size,
                std::size_t max_declare_workers,
                std::size_t max_transfer_workers);

  Decision on_file();

  std::size_t declare_workers() const { return declare_workers_; }
  std::size_t transfer_workers() const { return transfer_workers_; }

private:
  std::size_t batch_size_;
  std::size_t max_declare_;
  std::size_t max_transfer_;
  std::size_t files_since_spawn_ = 0;
  std::size_t declare_workers_ = 0;
  std::size_t transfer_workers_ = 0;
};
