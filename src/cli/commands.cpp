#include "mcpguard/cli/commands.hpp"

#include "mcpguard/common/strings.hpp"
#include "mcpguard/config/config.hpp"
#include "mcpguard/observability/factory.hpp"
#include "mcpguard/observability/global.hpp"
#include "mcpguard/security/content_scanner.hpp"
#include "mcpguard/security/registration.hpp"
#include "mcpguard/security/security_manager.hpp"

#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace mcpguard::cli {

namespace {

constexpr int kExitFindings = 2;
constexpr std::size_t kExcerptWidth = 80;

std::string version_string() {
#ifdef MCPGUARD_VERSION
  std::string version = MCPGUARD_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef MCPGUARD_GIT_COMMIT
  const std::string commit = MCPGUARD_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "mcpguard " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

common::Result<std::string> read_file_all(const std::string &path) {
  std::ifstream in(common::expand_path(path), std::ios::binary);
  if (!in) {
    return common::Result<std::string>::failure("cannot open " + path);
  }
  std::ostringstream out;
  out << in.rdbuf();
  return common::Result<std::string>::success(out.str());
}

int run_scan(std::vector<std::string> args) {
  std::vector<std::string> patterns;
  std::string pattern;
  while (take_option(args, "--pattern", "-p", pattern)) {
    patterns.push_back(pattern);
  }
  std::string file;
  const bool from_file = take_option(args, "--file", "-f", file);

  for (const auto &arg : args) {
    if (common::starts_with(arg, "--")) {
      std::cerr << "unknown or incomplete option: " << arg << "\n";
      return 1;
    }
  }
  for (const auto &custom : patterns) {
    if (const auto status = security::ContentScanner::validate_pattern(custom); !status.ok()) {
      std::cerr << status.error() << "\n";
      return 1;
    }
  }

  std::string text;
  if (from_file) {
    auto content = read_file_all(file);
    if (!content.ok()) {
      std::cerr << content.error() << "\n";
      return 1;
    }
    text = std::move(content.value());
  } else if (!args.empty()) {
    text = common::join(args, " ");
  } else {
    text = read_stdin_all();
  }

  const security::ContentScanner scanner(patterns);
  const auto findings = scanner.detect(text);
  if (findings.empty()) {
    std::cout << "safe: no hidden instructions found\n";
    return 0;
  }

  std::cout << findings.size() << (findings.size() == 1 ? " finding" : " findings") << ":\n";
  for (const auto &finding : findings) {
    std::cout << "  " << security::scan_category_to_string(finding.category) << "  "
              << finding.label << "  \""
              << common::truncate_for_display(finding.excerpt, kExcerptWidth) << "\"\n";
  }
  return kExitFindings;
}

std::string join_names(const std::set<std::string> &names) {
  return common::join(std::vector<std::string>(names.begin(), names.end()), ", ");
}

void print_policy(const security::SecurityPolicy &policy) {
  std::cout << "    max_calls_per_minute  = " << policy.max_calls_per_minute << "\n";
  std::cout << "    max_concurrent_calls  = " << policy.max_concurrent_calls << "\n";
  std::cout << "    max_input_size_bytes  = " << policy.max_input_size_bytes << "\n";
  std::cout << "    max_output_size_bytes = " << policy.max_output_size_bytes << "\n";
  std::cout << "    detect_tool_poisoning = " << (policy.detect_tool_poisoning ? "true" : "false")
            << "\n";
  if (!policy.blocked_tools.empty()) {
    std::cout << "    blocked_tools         = " << join_names(policy.blocked_tools) << "\n";
  }
  if (!policy.allowed_tools.empty()) {
    std::cout << "    allowed_tools         = " << join_names(policy.allowed_tools) << "\n";
  }
  if (!policy.custom_detection_patterns.empty()) {
    std::cout << "    custom patterns       = " << policy.custom_detection_patterns.size() << "\n";
  }
}

int run_check_config() {
  const auto path = config::config_path();
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << path.value().string() << ": " << cfg.error() << "\n";
    return 1;
  }

  const auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    std::cerr << path.value().string() << ": " << warnings.error() << "\n";
    return 1;
  }

  observability::set_global_observer(observability::create_observer(cfg.value()));

  auto manager = security::SecurityManager::from_config(cfg.value());
  if (!manager.ok()) {
    std::cerr << path.value().string() << ": " << manager.error() << "\n";
    return 1;
  }

  std::cout << "config: " << path.value().string() << "\n";
  for (const auto &warning : warnings.value()) {
    std::cout << "warning: " << warning << "\n";
  }

  std::cout << "default policy:\n";
  print_policy(manager.value()->default_policy());

  const auto servers = manager.value()->registered_servers();
  std::cout << "servers: " << servers.size() << "\n";
  for (const auto &id : servers) {
    const auto registration = manager.value()->registration(id);
    if (!registration.has_value()) {
      continue;
    }
    std::cout << "  " << id << " [" << security::format_bus_bindings(registration->bus_bindings)
              << "]\n";
    print_policy(*registration->policy);
  }
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  mcpguard" << RESET << DIM << "  policy enforcement for MCP tool servers"
            << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "mcpguard [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "scan" << RESET << " [--file PATH] [--pattern REGEX]... [TEXT...]\n";
  std::cout << DIM << "                 Scan text (or a file, or stdin) for hidden instructions."
            << RESET << "\n";
  std::cout << DIM << "                 Exit status 2 when findings exist." << RESET << "\n";
  std::cout << "  " << GREEN << "check-config" << RESET << DIM
            << "   Validate configuration and show effective server limits" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n";
  std::cout << "  " << GREEN << "help" << RESET << DIM << "           Show this help" << RESET
            << "\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "scan") {
    return run_scan(std::move(args));
  }
  if (subcommand == "check-config") {
    return run_check_config();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace mcpguard::cli
