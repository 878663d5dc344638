#ifndef REDACT_TEXT_UTILS_HPP
#define REDACT_TEXT_UTILS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief Number of UTF-8 code points in the first @p byteCount bytes of text
 *
 * Continuation bytes are not counted, so a truncated sequence still counts as
 * one code point.
 */
size_t utf8Length(const std::string &text, size_t byteCount);

inline size_t utf8Length(const std::string &text) {
  return utf8Length(text, text.size());
}

/**
 * @brief Byte offset at which code point @p codepointIndex starts
 *
 * Returns text.size() when the index is past the end.
 */
size_t utf8ByteOffset(const std::string &text, size_t codepointIndex);

/**
 * @brief Code points of UTF-8 text, one per non-continuation byte
 *
 * The result has utf8Length(text) entries; malformed sequences decode to
 * U+FFFD.
 */
std::vector<unsigned int> utf8CodePoints(const std::string &text);

/**
 * @brief ASCII lower-case copy; non-ASCII bytes are left untouched
 */
std::string toLowerAscii(const std::string &text);

} // namespace redact

#endif // REDACT_TEXT_UTILS_HPP
