#include "SummaryReporter.hpp"

namespace redact {

RedactionSummary
SummaryReporter::summarize(const std::vector<PIIMatch> &matches) {
  RedactionSummary summary;

  for (const auto &match : matches) {
    if (!match.mapped) {
      continue;
    }

    summary.totalRedactions++;
    summary.redactionsByType[match.type]++;
    summary.redactionsByPage[match.pageNumber]++;

    if (match.confidence > 0.9) {
      summary.confidenceTiers.high++;
    } else if (match.confidence > 0.7) {
      summary.confidenceTiers.medium++;
    } else {
      summary.confidenceTiers.low++;
    }
  }

  return summary;
}

DetectionMetadata
SummaryReporter::metadata(const std::vector<PIIMatch> &matches,
                          int totalPages) {
  DetectionMetadata metadata;
  metadata.totalPages = totalPages;
  metadata.totalMatches = static_cast<int>(matches.size());
  for (const auto &match : matches) {
    metadata.matchesByType[match.type]++;
    if (!match.mapped) {
      metadata.unmappedMatches++;
    }
  }
  return metadata;
}

} // namespace redact
