#include "PatternLibrary.hpp"
#include "TextUtils.hpp"

#include <stdexcept>

namespace redact {

namespace {

PatternLibrary::Pattern compilePattern(const std::string &source,
                                       double confidence) {
  try {
    return PatternLibrary::Pattern{source, std::regex(source), confidence};
  } catch (const std::regex_error &e) {
    throw std::invalid_argument("Invalid pattern \"" + source +
                                "\": " + e.what());
  }
}

} // anonymous namespace

PatternLibrary::PatternLibrary(const PatternTable &table) {
  for (const auto &entry : table.types) {
    if (entry.confidence < 0.0 || entry.confidence > 1.0) {
      throw std::invalid_argument("Confidence out of range for type " +
                                  piiTypeName(entry.type));
    }
    TypeRule rule{entry.type, entry.contextFiltered, {}};
    for (const auto &source : entry.patterns) {
      rule.patterns.push_back(compilePattern(source, entry.confidence));
    }
    m_rules.push_back(std::move(rule));
  }

  for (const auto &source : table.falsePositivePatterns) {
    m_falsePositives.push_back(compilePattern(source, 0.0));
  }

  // Keywords are compared against lower-cased context
  for (const auto &keyword : table.keywordBlacklist) {
    std::string lower = toLowerAscii(keyword);
    if (!lower.empty()) {
      m_keywords.push_back(lower);
    }
  }
}

PatternTable PatternLibrary::defaultTable() {
  PatternTable table;

  table.types.push_back(
      {PIIType::Email,
       1.0,
       {R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"},
       false});

  table.types.push_back({PIIType::SSN,
                         0.95,
                         {
                             R"(\b\d{3}-\d{2}-\d{4}\b)", // XXX-XX-XXXX
                             R"(\b\d{9}\b)",             // XXXXXXXXX
                             R"(\b\d{3}\s\d{2}\s\d{4}\b)" // XXX XX XXXX
                         },
                         true});

  table.types.push_back({PIIType::Phone,
                         0.9,
                         {
                             R"(\b\d{3}-\d{3}-\d{4}\b)",   // XXX-XXX-XXXX
                             // No leading \b: a boundary before '(' never
                             // holds after a space, so "call (555) 123-4567"
                             // would otherwise be missed
                             R"(\(\d{3}\)\s\d{3}-\d{4}\b)", // (XXX) XXX-XXXX
                             R"(\b\d{10}\b)"                // XXXXXXXXXX
                         },
                         false});

  table.types.push_back(
      {PIIType::CreditCard,
       0.85,
       {
           R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)",
           R"(\b\d{4}\s\d{4}\s\d{4}\s\d{4}\b)",
       },
       false});

  table.falsePositivePatterns = {
      R"(\b\d{3}-\d{2}-\d{3}\b)",     // part numbers, 3-2-3 grouping
      R"(\b\d{1,2}-\d{1,2}-\d{4}\b)", // dates
  };

  table.keywordBlacklist = {"part number",      "part #",    "serial number",
                            "serial #",         "model number", "model #",
                            "reference number", "ref #",     "phone",
                            "tel",              "fax",       "date",
                            "birth",            "dob"};

  return table;
}

const PatternLibrary &PatternLibrary::defaultLibrary() {
  static const PatternLibrary library(defaultTable());
  return library;
}

const PatternLibrary::TypeRule *PatternLibrary::ruleFor(PIIType type) const {
  for (const auto &rule : m_rules) {
    if (rule.type == type) {
      return &rule;
    }
  }
  return nullptr;
}

} // namespace redact
