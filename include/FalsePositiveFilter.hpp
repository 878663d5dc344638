#ifndef REDACT_FALSE_POSITIVE_FILTER_HPP
#define REDACT_FALSE_POSITIVE_FILTER_HPP

#include "PatternLibrary.hpp"
#include "SpanScanner.hpp"

#include <string>
#include <vector>

namespace redact {

/**
 * @brief Rejects matches that are structurally or contextually not PII
 *
 * Each verdict depends only on the match's own text and context window.
 */
class FalsePositiveFilter {
public:
  explicit FalsePositiveFilter(const PatternLibrary &library);

  /**
   * @brief True if the literal resembles a part number, date, ...
   */
  bool matchesStructuralPattern(const std::string &text) const;

  /**
   * @brief True if the lower-cased context contains a blacklisted keyword
   */
  bool hasBlacklistedContext(const std::string &context) const;

  /**
   * @brief Verdict for a single match, ignoring its type rule flag
   */
  bool isFalsePositive(const std::string &text,
                       const std::string &context) const;

  /**
   * @brief Drop rejected matches of context-filtered types
   *
   * Matches whose type rule is not context-filtered pass unchanged.
   */
  std::vector<RawMatch> apply(const std::vector<RawMatch> &matches) const;

private:
  const PatternLibrary &m_library;
};

} // namespace redact

#endif // REDACT_FALSE_POSITIVE_FILTER_HPP
