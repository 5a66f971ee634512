#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace mcpguard::security {

enum class Admission { Admitted, ThroughputExceeded, ConcurrencyExceeded };

[[nodiscard]] std::string admission_to_string(Admission admission);

struct RateLimits {
  std::int64_t max_calls_per_minute = 100;
  std::int64_t max_concurrent_calls = 10;
};

/// Sliding one-minute window plus a concurrency counter for one server. Both must pass for
/// admission. acquire never blocks; callers that want to wait must back off themselves.
class RateLimiter {
public:
  static constexpr std::chrono::seconds kWindow{60};

  explicit RateLimiter(RateLimits limits);

  RateLimiter(const RateLimiter &) = delete;
  RateLimiter &operator=(const RateLimiter &) = delete;

  [[nodiscard]] bool acquire();
  [[nodiscard]] Admission try_acquire();
  [[nodiscard]] Admission try_acquire_at(std::chrono::steady_clock::time_point now);

  /// Floors at zero, so an unmatched release is harmless.
  void release();

  /// Replace the limits, keeping recorded calls and in-flight slots.
  void reconfigure(RateLimits limits);

  [[nodiscard]] RateLimits limits() const;
  [[nodiscard]] std::size_t in_flight() const;
  [[nodiscard]] std::size_t window_count_at(std::chrono::steady_clock::time_point now);

private:
  void prune_locked(std::chrono::steady_clock::time_point now);

  mutable std::mutex mutex_;
  std::deque<std::chrono::steady_clock::time_point> calls_;
  std::size_t in_flight_ = 0;
  RateLimits limits_;
};

} // namespace mcpguard::security
