#ifndef REDACT_PATTERN_LIBRARY_HPP
#define REDACT_PATTERN_LIBRARY_HPP

#include "PIITypes.hpp"

#include <regex>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief Source form of the pattern table
 *
 * Plain strings so that a table can be declared as data, swapped in tests, or
 * extended with new PII types without touching the pipeline.
 */
struct PatternTable {
  struct TypeEntry {
    PIIType type;
    double confidence;                 ///< Base confidence for every pattern
    std::vector<std::string> patterns; ///< ECMAScript regular expressions
    bool contextFiltered = false;      ///< Run the false-positive filter
  };

  std::vector<TypeEntry> types;                   ///< Scan order
  std::vector<std::string> falsePositivePatterns; ///< Structural rejections
  std::vector<std::string> keywordBlacklist;      ///< Lower-case keywords
};

/**
 * @brief Compiled, immutable table of PII and false-positive patterns
 *
 * All accessors are const; a constructed library is safe to share between
 * threads for reading.
 */
class PatternLibrary {
public:
  struct Pattern {
    std::string source;
    std::regex regex;
    double confidence;
  };

  struct TypeRule {
    PIIType type;
    bool contextFiltered;
    std::vector<Pattern> patterns;
  };

  /**
   * @brief Compile a pattern table
   * @throws std::invalid_argument if any expression fails to compile
   */
  explicit PatternLibrary(const PatternTable &table);

  /**
   * @brief Table shipped with the engine (email, SSN, phone, credit card)
   */
  static PatternTable defaultTable();

  /**
   * @brief Shared read-only instance compiled from defaultTable()
   */
  static const PatternLibrary &defaultLibrary();

  const std::vector<TypeRule> &rules() const { return m_rules; }
  const std::vector<Pattern> &falsePositivePatterns() const {
    return m_falsePositives;
  }
  const std::vector<std::string> &keywordBlacklist() const {
    return m_keywords;
  }

  /**
   * @brief Rule for @p type, or nullptr if the table does not cover it
   */
  const TypeRule *ruleFor(PIIType type) const;

private:
  std::vector<TypeRule> m_rules;
  std::vector<Pattern> m_falsePositives;
  std::vector<std::string> m_keywords;
};

} // namespace redact

#endif // REDACT_PATTERN_LIBRARY_HPP
