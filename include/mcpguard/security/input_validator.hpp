#pragma once

#include "mcpguard/security/content_scanner.hpp"
#include "mcpguard/security/policy.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace mcpguard::security {

/// Tool arguments or tool results as they cross the trust boundary. Ordered keys keep the
/// canonical serialization deterministic.
using Payload = std::map<std::string, std::string>;

struct SizeCheck {
  bool ok = true;
  std::optional<std::string> message;
  std::size_t measured_bytes = 0;
  std::size_t limit_bytes = 0;
  // SHA-256 of the serialized payload, only filled in when the check fails.
  std::optional<std::string> payload_digest;
};

class InputValidator {
public:
  explicit InputValidator(const SecurityPolicy &policy);

  /// Compact JSON object, keys sorted.
  [[nodiscard]] static std::string serialize_payload(const Payload &payload);

  [[nodiscard]] SizeCheck validate_input_size(const Payload &payload) const;
  [[nodiscard]] SizeCheck validate_output_size(const Payload &payload) const;

  /// With poisoning detection disabled this returns a safe verdict with `scanned == false`
  /// and never touches the scanner.
  [[nodiscard]] ScanVerdict validate_tool_description(const std::string &text) const;

  [[nodiscard]] bool detects_tool_poisoning() const { return detect_tool_poisoning_; }
  [[nodiscard]] const ContentScanner &scanner() const { return scanner_; }

private:
  [[nodiscard]] SizeCheck check_size(const Payload &payload, std::int64_t limit,
                                     const char *label) const;

  std::int64_t max_input_size_bytes_;
  std::int64_t max_output_size_bytes_;
  bool detect_tool_poisoning_;
  ContentScanner scanner_;
};

} // namespace mcpguard::security
