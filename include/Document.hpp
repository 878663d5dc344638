#ifndef REDACT_DOCUMENT_HPP
#define REDACT_DOCUMENT_HPP

#include "PIITypes.hpp"

#include <string>
#include <vector>

namespace redact {

/**
 * @brief Capabilities the engine needs from a document backend
 *
 * A backend owns one open document. Detection only reads through it;
 * redaction mutates it in place and then saves a new artifact, after which
 * the handle must not be reused. Implementations are not required to be
 * thread-safe; the engine never calls one document from two threads.
 */
class Document {
public:
  virtual ~Document() = default;

  /**
   * @brief Number of pages, or -1 if the document could not be read
   */
  virtual int pageCount() const = 0;

  /**
   * @brief Positioned text runs of a page in visual order
   *
   * A page without extractable text yields an empty list and returns true.
   *
   * @param page 0-indexed page number
   * @param spans Receives the spans; pageNumber is set on each
   * @return false if the page could not be read
   */
  virtual bool textSpans(int page, std::vector<TextSpan> &spans) = 0;

  /**
   * @brief True if the document is encrypted and needs a password
   */
  virtual bool needsPassword() const = 0;

  /**
   * @brief Opaquely fill each rectangle, stamp its label and irrecoverably
   * remove the underlying content
   * @return false if the burn-in could not be completed for this page
   */
  virtual bool stampAndApply(int page,
                             const std::vector<RedactionRectangle> &rects) = 0;

  /**
   * @brief Persist the modified document to a new artifact
   * @return false if nothing usable was written
   */
  virtual bool saveAs(const std::string &path) = 0;
};

} // namespace redact

#endif // REDACT_DOCUMENT_HPP
