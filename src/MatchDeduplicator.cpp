#include "MatchDeduplicator.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace redact {

std::vector<PIIMatch>
MatchDeduplicator::deduplicate(const std::vector<PIIMatch> &matches) {
  std::vector<PIIMatch> candidates;
  std::vector<PIIMatch> unmapped;
  for (const auto &match : matches) {
    if (match.mapped && match.bbox.isValid()) {
      candidates.push_back(match);
    } else {
      unmapped.push_back(match);
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const PIIMatch &a, const PIIMatch &b) {
                     if (a.confidence != b.confidence) {
                       return a.confidence > b.confidence;
                     }
                     if (a.pageNumber != b.pageNumber) {
                       return a.pageNumber < b.pageNumber;
                     }
                     return a.bbox.x0 < b.bbox.x0;
                   });

  std::vector<PIIMatch> accepted;
  std::set<std::string> seenTexts;

  for (const auto &candidate : candidates) {
    std::string key = toLowerAscii(candidate.text);
    if (seenTexts.count(key) > 0) {
      continue;
    }

    bool overlaps = false;
    for (const auto &existing : accepted) {
      if (existing.pageNumber == candidate.pageNumber &&
          existing.bbox.intersects(candidate.bbox)) {
        overlaps = true;
        break;
      }
    }
    if (overlaps) {
      continue;
    }

    accepted.push_back(candidate);
    seenTexts.insert(key);
  }

  accepted.insert(accepted.end(), unmapped.begin(), unmapped.end());
  return accepted;
}

} // namespace redact
