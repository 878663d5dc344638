#ifndef REDACT_COORDINATE_MAPPER_HPP
#define REDACT_COORDINATE_MAPPER_HPP

#include "PIITypes.hpp"
#include "SpanScanner.hpp"

#include <cstddef>
#include <vector>

namespace redact {

/**
 * @brief Converts character offsets within a span into page coordinates
 *
 * Every glyph in a span is assumed to have the same advance width:
 * @code
 *   charWidth = span.width / max(L, 1)
 *   x0 = span.x0 + start * charWidth
 *   x1 = span.x0 + end * charWidth
 * @endcode
 * with the full span height used vertically. This is exact for monospaced
 * text and approximate for proportional fonts. Coordinate-dependent tests rely
 * on this formula.
 */
class CoordinateMapper {
public:
  /**
   * @brief Map [charStart, charEnd) of a span of @p spanLength code points
   * @param out Receives the rectangle on success
   * @return false if the offsets fall outside the span or the rectangle is
   * degenerate or non-finite
   */
  static bool mapRange(const BBox &spanBox, size_t spanLength,
                       size_t charStart, size_t charEnd, BBox &out);

  /**
   * @brief Build PIIMatch records for filtered raw matches
   *
   * Matches that cannot be mapped are kept with mapped = false so they stay
   * counted; they are never redacted.
   *
   * @param spans Span sequence the raw matches were scanned from
   */
  static std::vector<PIIMatch> map(const std::vector<RawMatch> &matches,
                                   const std::vector<TextSpan> &spans);
};

} // namespace redact

#endif // REDACT_COORDINATE_MAPPER_HPP
