#pragma once

#include "mcpguard/security/violation.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpguard::security {

struct ViolationFilter {
  std::optional<std::string> server_id;
  std::optional<ViolationType> type;
};

struct LedgerStats {
  std::size_t size = 0;
  std::uint64_t evicted = 0;
  std::map<ViolationType, std::size_t> by_type;
};

/// Append-only, capacity-bounded record of violations. Past capacity the oldest entry is
/// evicted. Readers get copies in append order (most recent last).
class ViolationLedger {
public:
  static constexpr std::size_t kDefaultCapacity = 1000;

  explicit ViolationLedger(std::size_t capacity = kDefaultCapacity);

  void append(SecurityViolation violation);

  [[nodiscard]] std::vector<SecurityViolation> snapshot(const ViolationFilter &filter = {}) const;
  [[nodiscard]] LedgerStats stats() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::uint64_t evicted() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<SecurityViolation> entries_;
  std::uint64_t evicted_ = 0;
};

} // namespace mcpguard::security
