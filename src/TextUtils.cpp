#include "TextUtils.hpp"

#include <algorithm>
#include <cctype>

namespace redact {

namespace {

inline bool isContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

} // anonymous namespace

size_t utf8Length(const std::string &text, size_t byteCount) {
  byteCount = std::min(byteCount, text.size());
  size_t count = 0;
  for (size_t i = 0; i < byteCount; ++i) {
    if (!isContinuationByte(static_cast<unsigned char>(text[i]))) {
      ++count;
    }
  }
  return count;
}

size_t utf8ByteOffset(const std::string &text, size_t codepointIndex) {
  size_t seen = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (isContinuationByte(static_cast<unsigned char>(text[i]))) {
      continue;
    }
    if (seen == codepointIndex) {
      return i;
    }
    ++seen;
  }
  return text.size();
}

std::vector<unsigned int> utf8CodePoints(const std::string &text) {
  std::vector<unsigned int> codePoints;
  size_t i = 0;
  while (i < text.size()) {
    unsigned char lead = static_cast<unsigned char>(text[i]);
    if (isContinuationByte(lead)) {
      // Stray continuation bytes belong to the previous code point
      ++i;
      continue;
    }

    size_t length = 1;
    unsigned int value = lead;
    if (lead >= 0xF0) {
      length = 4;
      value = lead & 0x07;
    } else if (lead >= 0xE0) {
      length = 3;
      value = lead & 0x0F;
    } else if (lead >= 0xC0) {
      length = 2;
      value = lead & 0x1F;
    }

    size_t next = i + 1;
    while (next < text.size() && next < i + length &&
           isContinuationByte(static_cast<unsigned char>(text[next]))) {
      value = (value << 6) | (static_cast<unsigned char>(text[next]) & 0x3F);
      ++next;
    }
    if (next - i != length) {
      value = 0xFFFD;
    }
    codePoints.push_back(value);

    // Skip any trailing continuation bytes of an over-long sequence
    while (next < text.size() &&
           isContinuationByte(static_cast<unsigned char>(text[next]))) {
      ++next;
    }
    i = next;
  }
  return codePoints;
}

std::string toLowerAscii(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) {
                   return c < 0x80 ? static_cast<char>(std::tolower(c))
                                   : static_cast<char>(c);
                 });
  return lower;
}

} // namespace redact
