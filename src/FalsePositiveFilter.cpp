#include "FalsePositiveFilter.hpp"
#include "TextUtils.hpp"

namespace redact {

FalsePositiveFilter::FalsePositiveFilter(const PatternLibrary &library)
    : m_library(library) {}

bool FalsePositiveFilter::matchesStructuralPattern(
    const std::string &text) const {
  for (const auto &pattern : m_library.falsePositivePatterns()) {
    if (std::regex_search(text, pattern.regex)) {
      return true;
    }
  }
  return false;
}

bool FalsePositiveFilter::hasBlacklistedContext(
    const std::string &context) const {
  std::string lower = toLowerAscii(context);
  for (const auto &keyword : m_library.keywordBlacklist()) {
    if (lower.find(keyword) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool FalsePositiveFilter::isFalsePositive(const std::string &text,
                                          const std::string &context) const {
  return matchesStructuralPattern(text) || hasBlacklistedContext(context);
}

std::vector<RawMatch>
FalsePositiveFilter::apply(const std::vector<RawMatch> &matches) const {
  std::vector<RawMatch> kept;
  kept.reserve(matches.size());
  for (const auto &match : matches) {
    if (match.contextFiltered && isFalsePositive(match.text, match.context)) {
      continue;
    }
    kept.push_back(match);
  }
  return kept;
}

} // namespace redact
