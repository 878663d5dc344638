#include "RedactionPlanner.hpp"

#include <algorithm>

namespace redact {

constexpr double RedactionPlanner::kDefaultMargin;

RedactionPlanner::RedactionPlanner(double margin)
    : m_margin(margin < 0.0 ? 0.0 : margin) {}

std::string RedactionPlanner::replacementText(PIIType type) {
  switch (type) {
  case PIIType::Email:
    return "[EMAIL REDACTED]";
  case PIIType::SSN:
    return "[SSN REDACTED]";
  case PIIType::Phone:
    return "[PHONE REDACTED]";
  case PIIType::CreditCard:
    return "[CREDIT CARD REDACTED]";
  }
  return "[REDACTED]";
}

std::vector<RedactionRectangle>
RedactionPlanner::plan(const std::vector<PIIMatch> &matches) const {
  std::vector<RedactionRectangle> rectangles;
  rectangles.reserve(matches.size());

  for (const auto &match : matches) {
    if (!match.mapped || !match.bbox.isValid()) {
      continue;
    }

    RedactionRectangle rect;
    rect.pageNumber = match.pageNumber;
    rect.bbox = match.bbox.expanded(m_margin);
    rect.piiType = match.type;
    rect.originalText = match.text;
    rect.replacementText = replacementText(match.type);
    rectangles.push_back(std::move(rect));
  }

  std::stable_sort(rectangles.begin(), rectangles.end(),
                   [](const RedactionRectangle &a, const RedactionRectangle &b) {
                     return a.pageNumber < b.pageNumber;
                   });

  return rectangles;
}

} // namespace redact
