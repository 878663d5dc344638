#ifndef REDACT_MATCH_DEDUPLICATOR_HPP
#define REDACT_MATCH_DEDUPLICATOR_HPP

#include "PIITypes.hpp"

#include <vector>

namespace redact {

/**
 * @brief Collapses duplicate and overlapping matches
 *
 * Mapped matches are ordered by confidence (descending), page and left edge,
 * then accepted greedily unless their lower-cased text was already accepted
 * on any page, or their bbox overlaps an accepted bbox on the same page.
 * Unmapped matches are appended unchanged in input order.
 *
 * Quadratic in the accepted set, which stays small per document.
 */
class MatchDeduplicator {
public:
  static std::vector<PIIMatch> deduplicate(const std::vector<PIIMatch> &matches);
};

} // namespace redact

#endif // REDACT_MATCH_DEDUPLICATOR_HPP
