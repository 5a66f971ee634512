#pragma once

#include "mcpguard/common/result.hpp"
#include "mcpguard/config/schema.hpp"
#include "mcpguard/security/input_validator.hpp"
#include "mcpguard/security/policy.hpp"
#include "mcpguard/security/rate_limiter.hpp"
#include "mcpguard/security/registration.hpp"
#include "mcpguard/security/violation.hpp"
#include "mcpguard/security/violation_ledger.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpguard::security {

struct Decision {
  bool allowed = true;
  std::optional<SecurityViolation> violation;

  [[nodiscard]] static Decision allow() { return Decision{}; }
  [[nodiscard]] static Decision deny(SecurityViolation violation) {
    return Decision{.allowed = false, .violation = std::move(violation)};
  }
};

struct SecurityMetrics {
  std::size_t total_violations = 0;
  std::size_t servers_monitored = 0;
  std::map<ViolationType, std::size_t> violations_by_type;
  std::uint64_t violations_evicted = 0;
};

/// Thrown when a server id that was never registered (or was unregistered) is used. This is an
/// integration bug, not a security event, so it never reaches the ledger.
class UnregisteredServerError : public std::logic_error {
public:
  explicit UnregisteredServerError(const std::string &server_id);

  [[nodiscard]] const std::string &server_id() const { return server_id_; }

private:
  std::string server_id_;
};

/// Single entry point for server-facing checks. Wrap each tool call as
///   check_tool_access -> check_rate_limit -> validate_input -> call -> validate_output
///   -> release_rate_limit
/// and release on every exit path (see RateLimitLease). Policy violations come back as
/// Decisions and are appended to the ledger; they are never thrown.
class SecurityManager {
public:
  SecurityManager();
  explicit SecurityManager(SecurityPolicy default_policy,
                           std::size_t ledger_capacity = ViolationLedger::kDefaultCapacity);

  SecurityManager(const SecurityManager &) = delete;
  SecurityManager &operator=(const SecurityManager &) = delete;

  /// Builds the default policy from [policy] and registers every [servers.*] table.
  [[nodiscard]] static common::Result<std::unique_ptr<SecurityManager>>
  from_config(const config::Config &config);

  /// Idempotent upsert. Rejects invalid policies. Rate limiter counters survive
  /// re-registration; only the limits change.
  [[nodiscard]] common::Status register_server(ServerRegistration registration);
  bool unregister_server(const std::string &server_id);

  [[nodiscard]] Decision check_tool_access(const std::string &server_id,
                                           const std::string &tool_name,
                                           const std::string &tool_description);
  [[nodiscard]] Decision check_rate_limit(const std::string &server_id);
  void release_rate_limit(const std::string &server_id);
  [[nodiscard]] Decision validate_input(const std::string &server_id,
                                        const std::string &tool_name, const Payload &payload);
  [[nodiscard]] Decision validate_output(const std::string &server_id,
                                         const std::string &tool_name, const Payload &payload);

  [[nodiscard]] std::vector<SecurityViolation>
  get_violations(const std::optional<std::string> &server_id = std::nullopt,
                 const std::optional<ViolationType> &type = std::nullopt) const;
  [[nodiscard]] SecurityMetrics get_security_metrics() const;

  /// Registration with its effective policy filled in.
  [[nodiscard]] std::optional<ServerRegistration> registration(const std::string &server_id) const;
  [[nodiscard]] std::vector<std::string> registered_servers() const;
  [[nodiscard]] const SecurityPolicy &default_policy() const { return default_policy_; }

private:
  struct ServerState {
    ServerRegistration registration;
    InputValidator validator;
    std::shared_ptr<RateLimiter> limiter;
  };

  friend class RateLimitLease;

  [[nodiscard]] std::shared_ptr<const ServerState> state_for(const std::string &server_id) const;
  [[nodiscard]] std::shared_ptr<RateLimiter> limiter_for(const std::string &server_id) const;
  Decision admit(const std::string &server_id, RateLimiter &limiter);
  Decision deny(SecurityViolation violation);

  const SecurityPolicy default_policy_;
  mutable std::shared_mutex servers_mutex_;
  std::unordered_map<std::string, std::shared_ptr<const ServerState>> servers_;
  ViolationLedger ledger_;
};

/// Scoped slot acquisition: admits against the server's current limiter on construction and
/// returns the slot to that same limiter in the destructor, even if the server was
/// unregistered or re-registered in between.
class RateLimitLease {
public:
  RateLimitLease(SecurityManager &manager, std::string server_id);
  ~RateLimitLease();

  RateLimitLease(const RateLimitLease &) = delete;
  RateLimitLease &operator=(const RateLimitLease &) = delete;
  RateLimitLease(RateLimitLease &&other) noexcept;
  RateLimitLease &operator=(RateLimitLease &&other) = delete;

  [[nodiscard]] bool admitted() const { return decision_.allowed; }
  [[nodiscard]] const Decision &decision() const { return decision_; }

  /// Return the slot early. Safe to call more than once.
  void release();

private:
  std::string server_id_;
  std::shared_ptr<RateLimiter> limiter_;
  Decision decision_;
  bool held_ = false;
};

} // namespace mcpguard::security
