#include "SpanScanner.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <iterator>

namespace redact {

constexpr size_t SpanScanner::kWindowBytes;
constexpr size_t SpanScanner::kMaxLiteralBytes;

SpanScanner::SpanScanner(const PatternLibrary &library, size_t contextChars)
    : m_library(library), m_contextChars(contextChars) {}

std::vector<RawMatch> SpanScanner::scanSpan(const TextSpan &span,
                                            size_t spanIndex) const {
  std::vector<RawMatch> matches;
  const std::string &text = span.text;
  if (text.empty()) {
    return matches;
  }

  const size_t length = text.size();
  const size_t step = kWindowBytes - 2 * kMaxLiteralBytes;

  for (const auto &rule : m_library.rules()) {
    for (const auto &pattern : rule.patterns) {
      size_t windowStart = 0;
      while (true) {
        size_t windowEnd = std::min(length, windowStart + kWindowBytes);

        // Hits are owned by the window whose inner region holds their start;
        // the margins give the neighbouring window enough lead-in
        size_t acceptBegin = windowStart == 0 ? 0 : windowStart + kMaxLiteralBytes;
        size_t acceptEnd =
            windowEnd == length ? length : windowEnd - kMaxLiteralBytes;

        auto flags = std::regex_constants::match_default;
        if (windowStart > 0) {
          flags |= std::regex_constants::match_prev_avail;
        }
        if (windowEnd < length) {
          flags |= std::regex_constants::match_not_eol |
                   std::regex_constants::match_not_eow;
        }

        for (auto it = std::sregex_iterator(text.begin() + windowStart,
                                            text.begin() + windowEnd,
                                            pattern.regex, flags);
             it != std::sregex_iterator(); ++it) {
          if (it->length() == 0) {
            continue;
          }

          size_t bytePos = static_cast<size_t>((*it)[0].first - text.begin());
          if (bytePos >= acceptEnd) {
            break;
          }
          if (bytePos < acceptBegin) {
            continue;
          }
          size_t byteEnd = bytePos + static_cast<size_t>(it->length());

          RawMatch match;
          match.type = rule.type;
          match.text = it->str();
          match.confidence = pattern.confidence;
          match.pageNumber = span.pageNumber;
          match.spanIndex = spanIndex;
          match.charStart = utf8Length(text, bytePos);
          match.charEnd = utf8Length(text, byteEnd);
          match.context = contextWindow(text, match.charStart, match.charEnd,
                                        m_contextChars);
          match.contextFiltered = rule.contextFiltered;
          matches.push_back(std::move(match));
        }

        if (windowEnd == length) {
          break;
        }
        windowStart += step;
      }
    }
  }

  return matches;
}

std::vector<RawMatch>
SpanScanner::scan(const std::vector<TextSpan> &spans) const {
  std::vector<RawMatch> matches;
  for (size_t i = 0; i < spans.size(); ++i) {
    std::vector<RawMatch> spanMatches = scanSpan(spans[i], i);
    matches.insert(matches.end(),
                   std::make_move_iterator(spanMatches.begin()),
                   std::make_move_iterator(spanMatches.end()));
  }
  return matches;
}

std::string SpanScanner::contextWindow(const std::string &text,
                                       size_t charStart, size_t charEnd,
                                       size_t contextChars) {
  size_t length = utf8Length(text);
  size_t windowStart = charStart > contextChars ? charStart - contextChars : 0;
  size_t windowEnd = std::min(length, charEnd + contextChars);
  if (windowStart >= windowEnd) {
    return "";
  }

  size_t byteStart = utf8ByteOffset(text, windowStart);
  size_t byteEnd = utf8ByteOffset(text, windowEnd);
  return text.substr(byteStart, byteEnd - byteStart);
}

} // namespace redact
