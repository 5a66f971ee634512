#include "mcpguard/security/content_scanner.hpp"

#include "mcpguard/common/strings.hpp"
#include "mcpguard/common/utf8.hpp"
#include "mcpguard/observability/global.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace mcpguard::security {

namespace {

constexpr std::size_t kExcerptChars = 80;
constexpr std::size_t kWindowBytes = 4096;
constexpr std::size_t kWindowOverlap = 1024;

struct PatternEntry {
  const char *label;
  std::regex regex;
};

// Repetitions are bounded: std::regex backtracks recursively, so an unbounded `\s+` over a
// long whitespace run can exhaust the stack.
const std::regex kHiddenTag(
    R"(<\s{0,8}/?\s{0,8}(hidden|system|secret|instructions?|important|admin|private|internal|invisible)\b[^>]{0,256}>)",
    std::regex::icase);

const std::array<PatternEntry, 8> kInjectionPhrases = {
    PatternEntry{"ignore previous instructions",
                 std::regex(R"(ignore\s{1,8}(all\s{1,8})?(the\s{1,8})?(previous|prior|above|earlier)\s{1,8}(instructions?|prompts?|rules?))",
                            std::regex::icase)},
    PatternEntry{"disregard previous",
                 std::regex(R"(disregard\s{1,8}(all\s{1,8})?(the\s{1,8})?(previous|prior|above|earlier))",
                            std::regex::icase)},
    PatternEntry{"forget instructions",
                 std::regex(R"(forget\s{1,8}(all\s{1,8}|everything\s{1,8})?(your|previous|prior|the)\s{1,8}(instructions?|rules?|guidelines?))",
                            std::regex::icase)},
    PatternEntry{"you are now",
                 std::regex(R"(you\s{1,8}are\s{1,8}now\s{1,8}(a|an|in)\s)", std::regex::icase)},
    PatternEntry{"new instructions",
                 std::regex(R"(new\s{1,8}instructions?\s{0,8}:)", std::regex::icase)},
    PatternEntry{"override instructions",
                 std::regex(R"(override\s{1,8}(your|all|any|previous|the)\s{1,8}(instructions?|rules?|guidelines?|safety))",
                            std::regex::icase)},
    PatternEntry{"conceal from user",
                 std::regex(R"((do\s{1,8}not|don't|never)\s{1,8}(tell|inform|notify|mention\s{1,8}this\s{1,8}to|reveal\s{1,8}this\s{1,8}to)\s{1,8}the\s{1,8}user)",
                            std::regex::icase)},
    PatternEntry{"system directive",
                 std::regex(R"((^|\n)[ \t]{0,16}system[ \t]{0,8}:[ \t]{0,16}[a-z])", std::regex::icase)},
};

bool is_invisible_codepoint(const std::uint32_t cp) {
  return (cp >= 0x200BU && cp <= 0x200FU) || // zero-width space/non-joiner/joiner, LRM, RLM
         (cp >= 0x202AU && cp <= 0x202EU) || // directional embeddings and overrides
         (cp >= 0x2060U && cp <= 0x2064U) || // word joiner, invisible operators
         (cp >= 0x2066U && cp <= 0x2069U) || // directional isolates
         cp == 0xFEFFU;                      // zero-width no-break space
}

std::string excerpt_of(const std::smatch &match) {
  return common::truncate_for_display(match.str(), kExcerptChars);
}

void report_engine_error(const char *category, const std::regex_error &error) {
  observability::record_error("content_scanner",
                              std::string(category) + " check skipped: " + error.what());
}

std::size_t utf8_boundary(const std::string &text, std::size_t pos) {
  while (pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0U) == 0x80U) {
    ++pos;
  }
  return pos;
}

// Caller-supplied patterns may contain unbounded repetition, and std::regex recursion depth
// grows with the match length. Searching overlapping windows keeps that depth bounded; a
// match no longer than kWindowOverlap bytes is always fully inside some window.
std::optional<std::string> search_windowed(const std::string &text, const std::regex &regex) {
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = std::min(text.size(), start + kWindowBytes);
    if (end < text.size()) {
      end = utf8_boundary(text, end);
    }
    std::smatch match;
    const auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
    const auto last = text.begin() + static_cast<std::ptrdiff_t>(end);
    const auto flags = start > 0 ? std::regex_constants::match_prev_avail
                                 : std::regex_constants::match_default;
    if (std::regex_search(first, last, match, regex, flags)) {
      return excerpt_of(match);
    }
    if (end >= text.size()) {
      break;
    }
    start = utf8_boundary(text, end - kWindowOverlap);
  }
  return std::nullopt;
}

void detect_hidden_tags(const std::string &text, std::vector<ScanFinding> &findings) {
  try {
    std::smatch match;
    if (std::regex_search(text, match, kHiddenTag)) {
      findings.push_back(ScanFinding{.category = ScanCategory::HiddenTag,
                                     .label = "<" + common::to_lower(match[1].str()) + ">",
                                     .excerpt = excerpt_of(match)});
    }
  } catch (const std::regex_error &error) {
    report_engine_error("hidden_tag", error);
  }
}

// Reports the first comment with a non-blank body; empty comments are skipped, not terminal.
void detect_hidden_comments(const std::string &text, std::vector<ScanFinding> &findings) {
  std::size_t pos = 0;
  while (true) {
    const auto open = text.find("<!--", pos);
    if (open == std::string::npos) {
      return;
    }
    const auto close = text.find("-->", open + 4);
    if (close == std::string::npos) {
      return;
    }
    const std::string body = common::trim(text.substr(open + 4, close - open - 4));
    if (!body.empty()) {
      findings.push_back(ScanFinding{.category = ScanCategory::HiddenComment,
                                     .label = "html comment",
                                     .excerpt = common::truncate_for_display(body, kExcerptChars)});
      return;
    }
    pos = close + 3;
  }
}

void detect_injection_phrases(const std::string &text, std::vector<ScanFinding> &findings) {
  for (const auto &entry : kInjectionPhrases) {
    try {
      std::smatch match;
      if (std::regex_search(text, match, entry.regex)) {
        findings.push_back(ScanFinding{.category = ScanCategory::PromptInjection,
                                       .label = entry.label,
                                       .excerpt = common::trim(excerpt_of(match))});
      }
    } catch (const std::regex_error &error) {
      report_engine_error("prompt_injection", error);
    }
  }
}

void detect_invisible_characters(const std::string &text, std::vector<ScanFinding> &findings) {
  std::vector<std::uint32_t> seen;
  std::size_t index = 0;
  std::uint32_t cp = 0;
  while (common::next_codepoint(text, index, cp)) {
    if (is_invisible_codepoint(cp) && std::find(seen.begin(), seen.end(), cp) == seen.end()) {
      seen.push_back(cp);
    }
  }
  if (seen.empty()) {
    return;
  }

  std::vector<std::string> rendered;
  rendered.reserve(seen.size());
  for (const auto value : seen) {
    rendered.push_back(common::format_codepoint(value));
  }
  findings.push_back(ScanFinding{.category = ScanCategory::InvisibleCharacter,
                                 .label = "invisible characters",
                                 .excerpt = common::join(rendered, ",")});
}

} // namespace

std::string scan_category_to_string(const ScanCategory category) {
  switch (category) {
  case ScanCategory::HiddenTag:
    return "hidden_tag";
  case ScanCategory::HiddenComment:
    return "hidden_comment";
  case ScanCategory::PromptInjection:
    return "prompt_injection";
  case ScanCategory::InvisibleCharacter:
    return "invisible_character";
  case ScanCategory::CustomPattern:
    return "custom_pattern";
  }
  return "unknown";
}

ContentScanner::ContentScanner() = default;

ContentScanner::ContentScanner(const std::vector<std::string> &custom_patterns) {
  custom_.reserve(custom_patterns.size());
  for (const auto &pattern : custom_patterns) {
    try {
      custom_.push_back(CompiledPattern{.source = pattern,
                                        .regex = std::regex(pattern, std::regex::icase)});
    } catch (const std::regex_error &error) {
      rejected_.push_back(pattern);
      observability::record_error("content_scanner", "custom pattern '" + pattern +
                                                         "' ignored: " + error.what());
    }
  }
}

common::Status ContentScanner::validate_pattern(const std::string &pattern) {
  if (pattern.empty()) {
    return common::Status::error("custom detection pattern must not be empty");
  }
  try {
    const std::regex compiled(pattern, std::regex::icase);
    (void)compiled;
  } catch (const std::regex_error &error) {
    return common::Status::error("invalid custom detection pattern '" + pattern +
                                 "': " + error.what());
  }
  return common::Status::success();
}

std::vector<ScanFinding> ContentScanner::detect(const std::string &text) const {
  std::vector<ScanFinding> findings;
  if (text.empty()) {
    return findings;
  }

  detect_hidden_tags(text, findings);
  detect_hidden_comments(text, findings);
  detect_injection_phrases(text, findings);
  detect_invisible_characters(text, findings);

  for (const auto &pattern : custom_) {
    try {
      if (auto excerpt = search_windowed(text, pattern.regex); excerpt.has_value()) {
        findings.push_back(ScanFinding{.category = ScanCategory::CustomPattern,
                                       .label = pattern.source,
                                       .excerpt = std::move(*excerpt)});
      }
    } catch (const std::regex_error &error) {
      report_engine_error("custom_pattern", error);
    }
  }

  return findings;
}

ScanVerdict ContentScanner::is_safe(const std::string &text) const {
  return verdict_from(detect(text));
}

ScanVerdict ContentScanner::verdict_from(const std::vector<ScanFinding> &findings) {
  ScanVerdict verdict;
  verdict.safe = findings.empty();
  for (const auto &finding : findings) {
    verdict.reasons.push_back(scan_category_to_string(finding.category) + ": " + finding.label);
    if (std::find(verdict.categories.begin(), verdict.categories.end(), finding.category) ==
        verdict.categories.end()) {
      verdict.categories.push_back(finding.category);
    }
  }
  return verdict;
}

} // namespace mcpguard::security
