#pragma once

#include "mcpguard/common/result.hpp"

#include <regex>
#include <string>
#include <vector>

namespace mcpguard::security {

enum class ScanCategory {
  HiddenTag,
  HiddenComment,
  PromptInjection,
  InvisibleCharacter,
  CustomPattern,
};

[[nodiscard]] std::string scan_category_to_string(ScanCategory category);

struct ScanFinding {
  ScanCategory category = ScanCategory::HiddenTag;
  std::string label;
  std::string excerpt;
};

struct ScanVerdict {
  bool safe = true;
  // False when poisoning detection was switched off and the text was never inspected.
  bool scanned = true;
  std::vector<std::string> reasons;
  std::vector<ScanCategory> categories;
};

/// Syntactic detector for hidden instructions in server-supplied text (tool names,
/// descriptions, results). Each category fails open on its own: an engine error in one
/// category drops that category's findings and is reported, the others still run.
class ContentScanner {
public:
  ContentScanner();
  explicit ContentScanner(const std::vector<std::string> &custom_patterns);

  [[nodiscard]] std::vector<ScanFinding> detect(const std::string &text) const;
  [[nodiscard]] ScanVerdict is_safe(const std::string &text) const;

  /// Custom patterns that failed to compile and are therefore not applied.
  [[nodiscard]] const std::vector<std::string> &rejected_patterns() const { return rejected_; }

  [[nodiscard]] static common::Status validate_pattern(const std::string &pattern);
  [[nodiscard]] static ScanVerdict verdict_from(const std::vector<ScanFinding> &findings);

private:
  struct CompiledPattern {
    std::string source;
    std::regex regex;
  };

  std::vector<CompiledPattern> custom_;
  std::vector<std::string> rejected_;
};

} // namespace mcpguard::security
