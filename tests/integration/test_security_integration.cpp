#include "test_framework.hpp"

#include "mcpguard/config/config.hpp"
#include "mcpguard/security/security_manager.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

namespace sec = mcpguard::security;

// One guarded tool call the way a runtime adapter wires it up.
sec::Decision guarded_call(sec::SecurityManager &manager, const std::string &server_id,
                           const std::string &tool, const std::string &description,
                           const sec::Payload &args, const sec::Payload &result) {
  if (auto access = manager.check_tool_access(server_id, tool, description); !access.allowed) {
    return access;
  }
  sec::RateLimitLease lease(manager, server_id);
  if (!lease.admitted()) {
    return lease.decision();
  }
  if (auto input = manager.validate_input(server_id, tool, args); !input.allowed) {
    return input;
  }
  return manager.validate_output(server_id, tool, result);
}

} // namespace

void register_security_integration_tests(std::vector<mcpguard::tests::TestCase> &tests) {
  using mcpguard::tests::require;
  using mcpguard::testing::tight_policy;

  tests.push_back({"security_integration_srv1_wipe_disk_scenario", [] {
                     sec::SecurityPolicy policy;
                     policy.blocked_tools = {"wipe_disk"};
                     sec::SecurityManager manager(policy);
                     require(manager
                                 .register_server(sec::ServerRegistration{
                                     .server_id = "srv1", .bus_bindings = {sec::BusKind::Tool}})
                                 .ok(),
                             "registration should succeed");

                     const auto denied = guarded_call(manager, "srv1", "wipe_disk", "Wipes the disk",
                                                      {{"device", "/dev/sda"}}, {});
                     require(!denied.allowed, "wipe_disk must be denied");

                     const auto allowed = guarded_call(manager, "srv1", "weather", "Current weather",
                                                       {{"city", "Oslo"}}, {{"temp", "4C"}});
                     require(allowed.allowed, "weather must be allowed");

                     const auto violations = manager.get_violations();
                     require(violations.size() == 1, "one violation expected");
                     require(violations[0].type == sec::ViolationType::BlockedTool, "blocked tool");
                     require(violations[0].server_id == "srv1", "server srv1");
                     require(manager.get_security_metrics().total_violations == violations.size(),
                             "metrics agree with the ledger");
                   }});

  tests.push_back({"security_integration_lease_releases_on_every_exit_path", [] {
                     sec::SecurityManager manager(tight_policy(100, 1));
                     require(manager.register_server(sec::ServerRegistration{.server_id = "srv1"}).ok(),
                             "registration should succeed");

                     {
                       sec::RateLimitLease lease(manager, "srv1");
                       require(lease.admitted(), "first lease admitted");
                       sec::RateLimitLease second(manager, "srv1");
                       require(!second.admitted(), "second lease exceeds concurrency");
                       require(second.decision().violation->type ==
                                   sec::ViolationType::RateLimitExceeded,
                               "denied lease carries the violation");
                     }

                     bool caught = false;
                     try {
                       sec::RateLimitLease lease(manager, "srv1");
                       require(lease.admitted(), "slot should be free again");
                       throw std::runtime_error("tool call failed");
                     } catch (const std::runtime_error &error) {
                       caught = std::string(error.what()) == "tool call failed";
                     }
                     require(caught, "tool failure should propagate");

                     sec::RateLimitLease after(manager, "srv1");
                     require(after.admitted(), "exception path should have released the slot");
                     after.release();
                     after.release();
                     sec::RateLimitLease again(manager, "srv1");
                     require(again.admitted(), "early release frees the slot once");
                   }});

  tests.push_back({"security_integration_lease_moves_and_survives_unregister", [] {
                     sec::SecurityManager manager(tight_policy(100, 1));
                     require(manager.register_server(sec::ServerRegistration{.server_id = "srv1"}).ok(),
                             "registration should succeed");
                     {
                       sec::RateLimitLease original(manager, "srv1");
                       sec::RateLimitLease moved(std::move(original));
                       require(moved.admitted(), "moved lease keeps the slot");
                     }
                     require(manager.check_rate_limit("srv1").allowed,
                             "moved-from lease must not double release or leak");
                     manager.release_rate_limit("srv1");

                     mcpguard::testing::ScopedRecordingObserver scoped;
                     {
                       sec::RateLimitLease lease(manager, "srv1");
                       require(lease.admitted(), "lease admitted");
                       require(manager.unregister_server("srv1"), "unregister while held");
                     }
                     require(scoped.observer()
                                 .events_of<mcpguard::observability::ErrorEvent>()
                                 .empty(),
                             "releasing against the old limiter is not an error");
                   }});

  tests.push_back({"security_integration_stale_lease_cannot_free_new_registration_slot", [] {
                     sec::SecurityManager manager(tight_policy(100, 1));
                     const sec::ServerRegistration registration{.server_id = "srv1"};
                     require(manager.register_server(registration).ok(), "first registration");

                     auto stale = std::make_unique<sec::RateLimitLease>(manager, "srv1");
                     require(stale->admitted(), "stale lease admitted");
                     require(manager.unregister_server("srv1"), "unregister while held");
                     require(manager.register_server(registration).ok(), "registered again");

                     sec::RateLimitLease fresh(manager, "srv1");
                     require(fresh.admitted(), "new registration starts with a free slot");
                     stale.reset();

                     sec::RateLimitLease third(manager, "srv1");
                     require(!third.admitted(), "cap of one must hold while fresh is in flight");
                     require(third.decision().violation.has_value() &&
                                 third.decision().violation->type ==
                                     sec::ViolationType::RateLimitExceeded,
                             "denied with a rate limit violation");
                   }});

  tests.push_back({"security_integration_concurrent_callers_respect_limits", [] {
                     sec::SecurityManager manager(tight_policy(1000, 3));
                     for (const auto *id : {"a", "b"}) {
                       require(manager.register_server(sec::ServerRegistration{.server_id = id}).ok(),
                               "registration should succeed");
                     }

                     std::atomic<int> admitted_a{0};
                     std::atomic<int> admitted_b{0};
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 40; ++i) {
                       threads.emplace_back([&manager, &admitted_a, &admitted_b, i] {
                         const std::string id = (i % 2 == 0) ? "a" : "b";
                         if (manager.check_rate_limit(id).allowed) {
                           (id == "a" ? admitted_a : admitted_b).fetch_add(1);
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }

                     require(admitted_a.load() == 3, "server a admits exactly its limit");
                     require(admitted_b.load() == 3, "server b is independent of a");
                     const auto metrics = manager.get_security_metrics();
                     require(metrics.total_violations == 34, "every rejection is recorded");
                     require(metrics.total_violations == manager.get_violations().size(),
                             "metrics agree with the ledger");
                   }});

  tests.push_back({"security_integration_config_file_to_decisions", [] {
                     const mcpguard::testing::EnvGuard calls("MCPGUARD_MAX_CALLS_PER_MINUTE",
                                                             std::nullopt);
                     const mcpguard::testing::EnvGuard concurrent("MCPGUARD_MAX_CONCURRENT_CALLS",
                                                                  std::nullopt);
                     const mcpguard::testing::EnvGuard detect("MCPGUARD_DETECT_TOOL_POISONING",
                                                              std::nullopt);
                     mcpguard::testing::TempWorkspace workspace;
                     const auto path = workspace.create_file("config.toml", R"(
[policy]
blocked_tools = ["wipe_disk"]
max_input_size_bytes = 64

[servers.files]
buses = ["tool"]
allowed_tools = ["read_file"]
max_calls_per_minute = 1
)");
                     const auto loaded = mcpguard::config::load_config_file(path);
                     require(loaded.ok(), loaded.error());
                     const auto warnings = mcpguard::config::validate_config(loaded.value());
                     require(warnings.ok(), warnings.error());

                     auto built = sec::SecurityManager::from_config(loaded.value());
                     require(built.ok(), built.error());
                     auto &manager = *built.value();

                     require(!manager.check_tool_access("files", "write_file", "Writes").allowed,
                             "allowlist from the server table");
                     require(manager.check_tool_access("files", "read_file", "Reads").allowed,
                             "allowlisted tool passes");
                     require(!manager
                                  .validate_input("files", "read_file",
                                                  {{"path", std::string(100, 'x')}})
                                  .allowed,
                             "inherited input limit applies");
                     require(manager.check_rate_limit("files").allowed, "first call admitted");
                     manager.release_rate_limit("files");
                     require(!manager.check_rate_limit("files").allowed, "server override of 1/min");
                   }});
}
