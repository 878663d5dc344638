#ifndef REDACT_REDACTION_PLANNER_HPP
#define REDACT_REDACTION_PLANNER_HPP

#include "PIITypes.hpp"

#include <string>
#include <vector>

namespace redact {

class RedactionPlanner {
public:
  /// Default margin added around each match, in points
  static constexpr double kDefaultMargin = 2.0;

  explicit RedactionPlanner(double margin = kDefaultMargin);

  /**
   * @brief Label stamped over a redacted region of the given type
   */
  static std::string replacementText(PIIType type);

  /**
   * @brief Turn retained matches into redaction rectangles
   *
   * Unmapped matches are skipped. The result is ordered by page, then by the
   * order of the matches within that page.
   */
  std::vector<RedactionRectangle>
  plan(const std::vector<PIIMatch> &matches) const;

  double margin() const { return m_margin; }

private:
  double m_margin;
};

} // namespace redact

#endif // REDACT_REDACTION_PLANNER_HPP
