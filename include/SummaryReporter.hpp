#ifndef REDACT_SUMMARY_REPORTER_HPP
#define REDACT_SUMMARY_REPORTER_HPP

#include "PIITypes.hpp"

#include <vector>

namespace redact {

/**
 * @brief Aggregates statistics over matches; performs no I/O
 */
class SummaryReporter {
public:
  /**
   * @brief Summary over the mapped matches; unmapped ones are ignored
   */
  static RedactionSummary summarize(const std::vector<PIIMatch> &matches);

  /**
   * @brief Detection metadata over every match, mapped or not
   */
  static DetectionMetadata metadata(const std::vector<PIIMatch> &matches,
                                    int totalPages);
};

} // namespace redact

#endif // REDACT_SUMMARY_REPORTER_HPP
