#include "rate_limiter.hpp"

#include <stdexcept>
#include <thread>

RateLimiter::RateLimiter(double max_requests_per_second, double smear)
  : min_interval_(0.0),
    smear_(smear),
    last_(Clock::now()),
    rng_(std::random_device{}()) {
  if(!(max_requests_per_second > 0.0)) {
    throw std::invalid_argument("max_requests_per_second must be positive");
  }
  if(!(smear >= 1.0)) {
    throw std::invalid_argument("smear factor must be >= 1");
  }
  min_interval_ = std::chrono::duration<double>(1.0 / max_requests_per_second);
}

std::chrono::duration<double> RateLimiter::gate() {
  auto now = Clock::now();
  std::chrono::duration<double> elapsed = now - last_;
  std::chrono::duration<double> wait{0.0};
  if(elapsed < min_interval_) {
    double factor = 1.0;
    if(smear_ > 1.0) {
      std::uniform_real_distribution<double> dist(1.0, smear_);
      factor = dist(rng_);
    }
    wait = (min_interval_ - elapsed) * factor;
    std::this_thread::sleep_for(wait);
  }
  last_ = Clock::now();
  return wait;
}
