#pragma once

#include "mcpguard/observability/observer.hpp"
#include "mcpguard/security/policy.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpguard::testing {

/// Sets (or unsets) an environment variable for the lifetime of the guard.
class EnvGuard {
public:
  EnvGuard(std::string key, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

private:
  std::string key_;
  std::optional<std::string> old_value_;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::filesystem::path create_file(const std::string &name,
                                                  const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Observer that keeps every event and metric for later inspection.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

  template <typename T> [[nodiscard]] std::vector<T> events_of() const {
    std::vector<T> out;
    for (const auto &event : events()) {
      if (const auto *typed = std::get_if<T>(&event); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  template <typename T> [[nodiscard]] std::vector<T> metrics_of() const {
    std::vector<T> out;
    for (const auto &metric : metrics()) {
      if (const auto *typed = std::get_if<T>(&metric); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a RecordingObserver as the global observer and clears it again on destruction.
class ScopedRecordingObserver {
public:
  ScopedRecordingObserver();
  ~ScopedRecordingObserver();

  ScopedRecordingObserver(const ScopedRecordingObserver &) = delete;
  ScopedRecordingObserver &operator=(const ScopedRecordingObserver &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_;
};

/// Policy with small limits so tests can hit them quickly.
security::SecurityPolicy tight_policy(std::int64_t calls_per_minute, std::int64_t concurrent);

} // namespace mcpguard::testing
