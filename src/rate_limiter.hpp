#pragma once

#include <chrono>
#include <random>

// Per-worker request-rate ceiling. Each gate() sleeps just long enough that
// consecutive gates are at least 1/R apart, stretched by a random factor in
// [1, smear] so that workers drift out of phase with each other.
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  RateLimiter(double max_requests_per_second, double smear = 1.0);

  // Returns how long the caller was suspended.
  std::chrono::duration<double> gate();

  std::chrono::duration<double> min_interval() const { return min_interval_; }
  double smear() const { return smear_; }

private:
  std::chrono::duration<double> min_interval_;
  double smear_;
  Clock::time_point last_;
  std::mt19937 rng_;
};
