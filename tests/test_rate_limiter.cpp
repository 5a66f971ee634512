#include "test_framework.hpp"

#include "mcpguard/security/rate_limiter.hpp"

#include <atomic>
#include <thread>

void register_rate_limiter_tests(std::vector<mcpguard::tests::TestCase> &tests) {
  using mcpguard::tests::require;
  namespace sec = mcpguard::security;
  using std::chrono::seconds;

  tests.push_back({"rate_limiter_throughput_cap_blocks_third_call", [] {
                     sec::RateLimiter limiter({.max_calls_per_minute = 2, .max_concurrent_calls = 10});
                     std::vector<bool> results;
                     for (int i = 0; i < 3; ++i) {
                       results.push_back(limiter.acquire());
                       limiter.release();
                     }
                     require(results == std::vector<bool>({true, true, false}),
                             "expected [true, true, false]");
                   }});

  tests.push_back({"rate_limiter_throughput_rejection_leaves_concurrency_alone", [] {
                     sec::RateLimiter limiter({.max_calls_per_minute = 1, .max_concurrent_calls = 5});
                     const auto now = std::chrono::steady_clock::now();
                     require(limiter.try_acquire_at(now) == sec::Admission::Admitted, "first admitted");
                     require(limiter.try_acquire_at(now) == sec::Admission::ThroughputExceeded,
                             "second hits throughput");
                     require(limiter.in_flight() == 1, "rejection must not take a slot");
                   }});

  tests.push_back({"rate_limiter_concurrency_cap_and_release", [] {
                     sec::RateLimiter limiter({.max_calls_per_minute = 100, .max_concurrent_calls = 1});
                     require(limiter.try_acquire() == sec::Admission::Admitted, "first admitted");
                     require(limiter.try_acquire() == sec::Admission::ConcurrencyExceeded,
                             "second exceeds concurrency");
                     limiter.release();
                     require(limiter.try_acquire() == sec::Admission::Admitted,
                             "release should free the slot");
                     require(limiter.window_count_at(std::chrono::steady_clock::now()) == 2,
                             "concurrency rejection must not be counted in the window");
                   }});

  tests.push_back({"rate_limiter_window_slides_after_sixty_seconds", [] {
                     sec::RateLimiter limiter({.max_calls_per_minute = 2, .max_concurrent_calls = 10});
                     const auto start = std::chrono::steady_clock::now();
                     require(limiter.try_acquire_at(start) == sec::Admission::Admitted, "call 1");
                     limiter.release();
                     require(limiter.try_acquire_at(start + seconds(10)) == sec::Admission::Admitted,
                             "call 2");
                     limiter.release();
                     require(limiter.try_acquire_at(start + seconds(59)) ==
                                 sec::Admission::ThroughputExceeded,
                             "window still full at 59s");
                     require(limiter.try_acquire_at(start + seconds(61)) == sec::Admission::Admitted,
                             "first call aged out at 61s");
                     require(limiter.window_count_at(start + seconds(61)) == 2,
                             "window holds calls 2 and 3");
                   }});

  tests.push_back({"rate_limiter_release_floors_at_zero", [] {
                     sec::RateLimiter limiter({.max_calls_per_minute = 10, .max_concurrent_calls = 1});
                     limiter.release();
                     limiter.release();
                     require(limiter.in_flight() == 0, "in flight should stay at zero");
                     require(limiter.acquire(), "acquire should still work");
                     require(!limiter.acquire(), "extra releases must not inflate capacity");
                   }});

  tests.push_back({"rate_limiter_reconfigure_keeps_counters", [] {
                     sec::RateLimiter limiter({.max_calls_per_minute = 10, .max_concurrent_calls = 3});
                     require(limiter.acquire(), "acquire 1");
                     require(limiter.acquire(), "acquire 2");
                     limiter.reconfigure({.max_calls_per_minute = 10, .max_concurrent_calls = 2});
                     require(limiter.in_flight() == 2, "in flight survives reconfigure");
                     require(limiter.limits().max_concurrent_calls == 2, "limits replaced");
                     require(!limiter.acquire(), "new concurrency limit applies to held slots");
                   }});

  tests.push_back({"rate_limiter_concurrent_acquire_never_exceeds_limit", [] {
                     sec::RateLimiter limiter({.max_calls_per_minute = 1000, .max_concurrent_calls = 4});
                     std::atomic<int> admitted{0};
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 32; ++i) {
                       threads.emplace_back([&limiter, &admitted] {
                         if (limiter.acquire()) {
                           admitted.fetch_add(1);
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(admitted.load() == 4, "exactly the concurrency limit is admitted");
                     require(limiter.in_flight() == 4, "in flight equals admissions");
                   }});

  tests.push_back({"admission_names", [] {
                     require(sec::admission_to_string(sec::Admission::ThroughputExceeded) ==
                                 "throughput_exceeded",
                             "throughput name");
                     require(sec::admission_to_string(sec::Admission::ConcurrencyExceeded) ==
                                 "concurrency_exceeded",
                             "concurrency name");
                   }});
}
