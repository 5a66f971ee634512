#include "mcpguard/security/rate_limiter.hpp"

namespace mcpguard::security {

std::string admission_to_string(const Admission admission) {
  switch (admission) {
  case Admission::Admitted:
    return "admitted";
  case Admission::ThroughputExceeded:
    return "throughput_exceeded";
  case Admission::ConcurrencyExceeded:
    return "concurrency_exceeded";
  }
  return "unknown";
}

RateLimiter::RateLimiter(const RateLimits limits) : limits_(limits) {}

void RateLimiter::prune_locked(const std::chrono::steady_clock::time_point now) {
  const auto cutoff = now - kWindow;
  while (!calls_.empty() && calls_.front() < cutoff) {
    calls_.pop_front();
  }
}

bool RateLimiter::acquire() { return try_acquire() == Admission::Admitted; }

Admission RateLimiter::try_acquire() { return try_acquire_at(std::chrono::steady_clock::now()); }

Admission RateLimiter::try_acquire_at(const std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  prune_locked(now);

  if (static_cast<std::int64_t>(calls_.size()) >= limits_.max_calls_per_minute) {
    return Admission::ThroughputExceeded;
  }
  if (static_cast<std::int64_t>(in_flight_) >= limits_.max_concurrent_calls) {
    return Admission::ConcurrencyExceeded;
  }

  calls_.push_back(now);
  ++in_flight_;
  return Admission::Admitted;
}

void RateLimiter::release() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_flight_ > 0) {
    --in_flight_;
  }
}

void RateLimiter::reconfigure(const RateLimits limits) {
  std::lock_guard<std::mutex> lock(mutex_);
  limits_ = limits;
}

RateLimits RateLimiter::limits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return limits_;
}

std::size_t RateLimiter::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}

std::size_t RateLimiter::window_count_at(const std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  prune_locked(now);
  return calls_.size();
}

} // namespace mcpguard::security
