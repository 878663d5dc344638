#include "CoordinateMapper.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace redact {

bool CoordinateMapper::mapRange(const BBox &spanBox, size_t spanLength,
                                size_t charStart, size_t charEnd, BBox &out) {
  if (charStart >= spanLength || charEnd > spanLength) {
    return false;
  }

  double charWidth =
      spanBox.width() / static_cast<double>(std::max<size_t>(spanLength, 1));

  BBox box(spanBox.x0 + static_cast<double>(charStart) * charWidth, spanBox.y0,
           spanBox.x0 + static_cast<double>(charEnd) * charWidth, spanBox.y1);

  if (!box.isValid()) {
    return false;
  }

  out = box;
  return true;
}

std::vector<PIIMatch>
CoordinateMapper::map(const std::vector<RawMatch> &matches,
                      const std::vector<TextSpan> &spans) {
  std::vector<PIIMatch> mapped;
  mapped.reserve(matches.size());

  for (const auto &raw : matches) {
    PIIMatch match;
    match.text = raw.text;
    match.type = raw.type;
    match.pageNumber = raw.pageNumber;
    match.confidence = raw.confidence;
    match.context = raw.context;
    match.mapped = false;

    if (raw.spanIndex < spans.size()) {
      const TextSpan &span = spans[raw.spanIndex];
      BBox box;
      if (mapRange(span.bbox, utf8Length(span.text), raw.charStart,
                   raw.charEnd, box)) {
        match.bbox = box;
        match.mapped = true;
      }
    }

    mapped.push_back(std::move(match));
  }

  return mapped;
}

} // namespace redact
