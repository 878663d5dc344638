#ifndef REDACT_SPAN_SCANNER_HPP
#define REDACT_SPAN_SCANNER_HPP

#include "PIITypes.hpp"
#include "PatternLibrary.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief A pattern hit before filtering and geometry mapping
 *
 * Offsets are code-point offsets into the originating span's text, half-open.
 */
struct RawMatch {
  PIIType type = PIIType::Email;
  std::string text;
  double confidence = 0.0;
  int pageNumber = 0;
  size_t spanIndex = 0; ///< Index into the scanned span sequence
  size_t charStart = 0;
  size_t charEnd = 0;
  std::string context;  ///< Span text clipped around the hit
  bool contextFiltered = false; ///< Copied from the type rule
};

/**
 * @brief Applies the pattern library to positioned text spans
 *
 * Stateless apart from the library reference; identical input yields identical
 * output, in span order, then type order, then pattern order, then position.
 *
 * Spans longer than kWindowBytes are matched in overlapping windows so that
 * the regex engine never sees an unbounded run of characters. Each hit is
 * reported by exactly one window; literals longer than kMaxLiteralBytes are
 * not guaranteed to be found.
 */
class SpanScanner {
public:
  static constexpr size_t kWindowBytes = 2048;    ///< Bytes per regex window
  static constexpr size_t kMaxLiteralBytes = 256; ///< Window overlap

  /**
   * @param library Patterns to apply; must outlive the scanner
   * @param contextChars Code points kept on each side of a hit as context
   */
  explicit SpanScanner(const PatternLibrary &library, size_t contextChars = 20);

  /**
   * @brief Scan a single span
   * @param span Span to scan
   * @param spanIndex Index recorded in each produced match
   */
  std::vector<RawMatch> scanSpan(const TextSpan &span,
                                 size_t spanIndex = 0) const;

  /**
   * @brief Scan an ordered span sequence
   */
  std::vector<RawMatch> scan(const std::vector<TextSpan> &spans) const;

  /**
   * @brief Context window around [charStart, charEnd) clipped to the text
   */
  static std::string contextWindow(const std::string &text, size_t charStart,
                                   size_t charEnd, size_t contextChars);

private:
  const PatternLibrary &m_library;
  size_t m_contextChars;
};

} // namespace redact

#endif // REDACT_SPAN_SCANNER_HPP
