#include "mcpguard/security/security_manager.hpp"

#include "mcpguard/common/strings.hpp"
#include "mcpguard/observability/global.hpp"

#include <algorithm>
#include <mutex>

namespace mcpguard::security {

namespace {

std::string categories_detail(const ScanVerdict &verdict) {
  std::vector<std::string> names;
  names.reserve(verdict.categories.size());
  for (const auto category : verdict.categories) {
    names.push_back(scan_category_to_string(category));
  }
  return "categories=" + common::join(names, ",");
}

std::string size_detail(const SizeCheck &check) {
  std::string detail = "bytes=" + std::to_string(check.measured_bytes) +
                       " limit=" + std::to_string(check.limit_bytes);
  if (check.payload_digest.has_value()) {
    detail += " sha256=" + *check.payload_digest;
  }
  return detail;
}

} // namespace

UnregisteredServerError::UnregisteredServerError(const std::string &server_id)
    : std::logic_error("server '" + server_id + "' is not registered with the security manager"),
      server_id_(server_id) {}

SecurityManager::SecurityManager() : SecurityManager(SecurityPolicy{}) {}

SecurityManager::SecurityManager(SecurityPolicy default_policy, const std::size_t ledger_capacity)
    : default_policy_(std::move(default_policy)), ledger_(ledger_capacity) {}

common::Result<std::unique_ptr<SecurityManager>>
SecurityManager::from_config(const config::Config &config) {
  using ManagerResult = common::Result<std::unique_ptr<SecurityManager>>;

  auto default_policy = SecurityPolicy::from_config(config.policy);
  if (!default_policy.ok()) {
    return ManagerResult::failure("policy: " + default_policy.error());
  }
  if (config.ledger.capacity <= 0) {
    return ManagerResult::failure("ledger.capacity must be > 0");
  }

  auto manager = std::make_unique<SecurityManager>(
      std::move(default_policy.value()), static_cast<std::size_t>(config.ledger.capacity));

  for (const auto &server : config.servers) {
    auto policy = SecurityPolicy::from_config(server.policy);
    if (!policy.ok()) {
      return ManagerResult::failure("servers." + server.id + ": " + policy.error());
    }
    auto buses = bus_bindings_from_strings(server.buses);
    if (!buses.ok()) {
      return ManagerResult::failure("servers." + server.id + ": " + buses.error());
    }

    ServerRegistration registration{.server_id = server.id,
                                    .bus_bindings = std::move(buses.value()),
                                    .policy = std::move(policy.value())};
    if (const auto status = manager->register_server(std::move(registration)); !status.ok()) {
      return ManagerResult::failure(status.error());
    }
  }

  return ManagerResult::success(std::move(manager));
}

common::Status SecurityManager::register_server(ServerRegistration registration) {
  const std::string server_id = registration.server_id;
  if (common::trim(server_id).empty()) {
    return common::Status::error("server_id must not be empty");
  }

  SecurityPolicy policy = registration.policy.value_or(default_policy_);
  if (const auto status = policy.validate(); !status.ok()) {
    return common::Status::error("server '" + server_id + "' rejected: " + status.error());
  }

  const RateLimits limits{.max_calls_per_minute = policy.max_calls_per_minute,
                          .max_concurrent_calls = policy.max_concurrent_calls};
  InputValidator validator(policy);
  registration.policy = std::move(policy);
  const std::string buses = format_bus_bindings(registration.bus_bindings);

  bool updated = false;
  {
    std::unique_lock<std::shared_mutex> lock(servers_mutex_);
    std::shared_ptr<RateLimiter> limiter;
    if (const auto it = servers_.find(server_id); it != servers_.end()) {
      limiter = it->second->limiter;
      limiter->reconfigure(limits);
      updated = true;
    } else {
      limiter = std::make_shared<RateLimiter>(limits);
    }

    servers_[server_id] = std::make_shared<ServerState>(
        ServerState{.registration = std::move(registration),
                    .validator = std::move(validator),
                    .limiter = std::move(limiter)});
  }

  observability::record_server_registered(server_id, buses, updated);
  return common::Status::success();
}

bool SecurityManager::unregister_server(const std::string &server_id) {
  std::size_t erased = 0;
  {
    std::unique_lock<std::shared_mutex> lock(servers_mutex_);
    erased = servers_.erase(server_id);
  }
  if (erased > 0) {
    observability::record_server_unregistered(server_id);
  }
  return erased > 0;
}

std::shared_ptr<const SecurityManager::ServerState>
SecurityManager::state_for(const std::string &server_id) const {
  std::shared_lock<std::shared_mutex> lock(servers_mutex_);
  const auto it = servers_.find(server_id);
  if (it == servers_.end()) {
    throw UnregisteredServerError(server_id);
  }
  return it->second;
}

Decision SecurityManager::deny(SecurityViolation violation) {
  observability::record_violation(violation_type_to_string(violation.type), violation.server_id,
                                  violation.tool_name, violation.message, violation.raw_detail,
                                  violation_to_json(violation));
  ledger_.append(violation);
  observability::record_ledger_size(ledger_.size(), ledger_.evicted());
  return Decision::deny(std::move(violation));
}

Decision SecurityManager::check_tool_access(const std::string &server_id,
                                            const std::string &tool_name,
                                            const std::string &tool_description) {
  const auto state = state_for(server_id);
  const SecurityPolicy &policy = *state->registration.policy;

  if (policy.is_blocked(tool_name)) {
    return deny(make_violation(ViolationType::BlockedTool, server_id, tool_name,
                               "Tool '" + tool_name + "' is blocked for server '" + server_id +
                                   "'",
                               "rule=blocked_tools"));
  }

  if (!policy.is_allowlisted(tool_name)) {
    return deny(make_violation(ViolationType::BlockedTool, server_id, tool_name,
                               "Tool '" + tool_name + "' is not in the allowlist for server '" +
                                   server_id + "'",
                               "rule=allowed_tools"));
  }

  const auto verdict = state->validator.validate_tool_description(tool_description);
  if (!verdict.safe) {
    return deny(make_violation(ViolationType::ToolPoisoning, server_id, tool_name,
                               "Tool '" + tool_name +
                                   "' description contains hidden instructions: " +
                                   common::join(verdict.reasons, "; "),
                               categories_detail(verdict)));
  }

  return Decision::allow();
}

std::shared_ptr<RateLimiter> SecurityManager::limiter_for(const std::string &server_id) const {
  return state_for(server_id)->limiter;
}

Decision SecurityManager::check_rate_limit(const std::string &server_id) {
  return admit(server_id, *limiter_for(server_id));
}

Decision SecurityManager::admit(const std::string &server_id, RateLimiter &limiter) {
  const auto admission = limiter.try_acquire();
  if (admission == Admission::Admitted) {
    observability::record_in_flight(server_id, limiter.in_flight());
    return Decision::allow();
  }

  const auto limits = limiter.limits();
  if (admission == Admission::ThroughputExceeded) {
    return deny(make_violation(
        ViolationType::RateLimitExceeded, server_id, std::nullopt,
        "Rate limit exceeded for server '" + server_id + "': " +
            std::to_string(limits.max_calls_per_minute) + " calls per minute",
        "reason=" + admission_to_string(admission) +
            " limit=" + std::to_string(limits.max_calls_per_minute) +
            " window_seconds=" + std::to_string(RateLimiter::kWindow.count())));
  }

  return deny(make_violation(
      ViolationType::RateLimitExceeded, server_id, std::nullopt,
      "Concurrent call limit exceeded for server '" + server_id + "': " +
          std::to_string(limits.max_concurrent_calls) + " calls already in flight",
      "reason=" + admission_to_string(admission) +
          " limit=" + std::to_string(limits.max_concurrent_calls)));
}

void SecurityManager::release_rate_limit(const std::string &server_id) {
  const auto limiter = limiter_for(server_id);
  limiter->release();
  observability::record_in_flight(server_id, limiter->in_flight());
}

Decision SecurityManager::validate_input(const std::string &server_id,
                                         const std::string &tool_name, const Payload &payload) {
  const auto state = state_for(server_id);
  const auto check = state->validator.validate_input_size(payload);
  if (check.ok) {
    return Decision::allow();
  }
  return deny(make_violation(ViolationType::InputTooLarge, server_id, tool_name,
                             check.message.value_or("Input too large"), size_detail(check)));
}

Decision SecurityManager::validate_output(const std::string &server_id,
                                          const std::string &tool_name, const Payload &payload) {
  const auto state = state_for(server_id);
  const auto check = state->validator.validate_output_size(payload);
  if (check.ok) {
    return Decision::allow();
  }
  return deny(make_violation(ViolationType::OutputTooLarge, server_id, tool_name,
                             check.message.value_or("Output too large"), size_detail(check)));
}

std::vector<SecurityViolation>
SecurityManager::get_violations(const std::optional<std::string> &server_id,
                                const std::optional<ViolationType> &type) const {
  return ledger_.snapshot(ViolationFilter{.server_id = server_id, .type = type});
}

SecurityMetrics SecurityManager::get_security_metrics() const {
  const auto stats = ledger_.stats();

  SecurityMetrics metrics;
  metrics.total_violations = stats.size;
  metrics.violations_by_type = stats.by_type;
  metrics.violations_evicted = stats.evicted;
  {
    std::shared_lock<std::shared_mutex> lock(servers_mutex_);
    metrics.servers_monitored = servers_.size();
  }
  return metrics;
}

std::optional<ServerRegistration>
SecurityManager::registration(const std::string &server_id) const {
  std::shared_lock<std::shared_mutex> lock(servers_mutex_);
  const auto it = servers_.find(server_id);
  if (it == servers_.end()) {
    return std::nullopt;
  }
  return it->second->registration;
}

std::vector<std::string> SecurityManager::registered_servers() const {
  std::vector<std::string> ids;
  {
    std::shared_lock<std::shared_mutex> lock(servers_mutex_);
    ids.reserve(servers_.size());
    for (const auto &[id, state] : servers_) {
      ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

RateLimitLease::RateLimitLease(SecurityManager &manager, std::string server_id)
    : server_id_(std::move(server_id)), limiter_(manager.limiter_for(server_id_)),
      decision_(manager.admit(server_id_, *limiter_)), held_(decision_.allowed) {}

RateLimitLease::~RateLimitLease() { release(); }

RateLimitLease::RateLimitLease(RateLimitLease &&other) noexcept
    : server_id_(std::move(other.server_id_)), limiter_(std::move(other.limiter_)),
      decision_(std::move(other.decision_)), held_(other.held_) {
  other.held_ = false;
}

void RateLimitLease::release() {
  if (!held_) {
    return;
  }
  held_ = false;
  limiter_->release();
  observability::record_in_flight(server_id_, limiter_->in_flight());
}

} // namespace mcpguard::security
