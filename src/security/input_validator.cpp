#include "mcpguard/security/input_validator.hpp"

#include "mcpguard/common/digest.hpp"
#include "mcpguard/common/json_util.hpp"
#include "mcpguard/common/strings.hpp"
#include "mcpguard/observability/global.hpp"

namespace mcpguard::security {

InputValidator::InputValidator(const SecurityPolicy &policy)
    : max_input_size_bytes_(policy.max_input_size_bytes),
      max_output_size_bytes_(policy.max_output_size_bytes),
      detect_tool_poisoning_(policy.detect_tool_poisoning),
      scanner_(policy.custom_detection_patterns) {}

std::string InputValidator::serialize_payload(const Payload &payload) {
  return common::json_object(payload);
}

SizeCheck InputValidator::check_size(const Payload &payload, const std::int64_t limit,
                                     const char *label) const {
  const std::string serialized = serialize_payload(payload);

  SizeCheck check;
  check.measured_bytes = serialized.size();
  check.limit_bytes = limit < 0 ? 0 : static_cast<std::size_t>(limit);
  if (check.measured_bytes <= check.limit_bytes) {
    return check;
  }

  check.ok = false;
  check.message = std::string(label) + " size " + std::to_string(check.measured_bytes) +
                  " bytes exceeds limit of " + std::to_string(check.limit_bytes) + " bytes";
  check.payload_digest = common::sha256_hex(serialized);
  return check;
}

SizeCheck InputValidator::validate_input_size(const Payload &payload) const {
  return check_size(payload, max_input_size_bytes_, "Input");
}

SizeCheck InputValidator::validate_output_size(const Payload &payload) const {
  return check_size(payload, max_output_size_bytes_, "Output");
}

ScanVerdict InputValidator::validate_tool_description(const std::string &text) const {
  if (!detect_tool_poisoning_) {
    observability::record_scan_bypassed(common::truncate_for_display(text, 40));
    ScanVerdict verdict;
    verdict.scanned = false;
    return verdict;
  }
  return scanner_.is_safe(text);
}

} // namespace mcpguard::security
