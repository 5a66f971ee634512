#include "mcpguard/security/violation_ledger.hpp"

#include <algorithm>

namespace mcpguard::security {

ViolationLedger::ViolationLedger(const std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void ViolationLedger::append(SecurityViolation violation) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(std::move(violation));
  while (entries_.size() > capacity_) {
    entries_.pop_front();
    ++evicted_;
  }
}

std::vector<SecurityViolation> ViolationLedger::snapshot(const ViolationFilter &filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SecurityViolation> out;
  out.reserve(entries_.size());
  for (const auto &entry : entries_) {
    if (filter.server_id.has_value() && entry.server_id != *filter.server_id) {
      continue;
    }
    if (filter.type.has_value() && entry.type != *filter.type) {
      continue;
    }
    out.push_back(entry);
  }
  return out;
}

LedgerStats ViolationLedger::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  LedgerStats stats;
  stats.size = entries_.size();
  stats.evicted = evicted_;
  for (const auto &entry : entries_) {
    ++stats.by_type[entry.type];
  }
  return stats;
}

std::size_t ViolationLedger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::uint64_t ViolationLedger::evicted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return evicted_;
}

} // namespace mcpguard::security
