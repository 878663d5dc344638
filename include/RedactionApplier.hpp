#ifndef REDACT_REDACTION_APPLIER_HPP
#define REDACT_REDACTION_APPLIER_HPP

#include "Document.hpp"
#include "PIITypes.hpp"
#include "RunControl.hpp"

#include <string>
#include <vector>

namespace redact {

/**
 * @brief Outcome of burning a redaction plan into a document
 */
struct ApplyResult {
  bool success = false;     ///< True only if every page burned and the save succeeded
  ErrorKind error = ErrorKind::None;
  std::string errorMessage; ///< Error message if failed
  std::string outputPath;   ///< Set only when an artifact was written
  int pagesStamped = 0;     ///< Pages passed to the burn-in primitive
};

/**
 * @brief Drives the destructive redaction primitive page by page
 *
 * All-or-nothing: if any page fails to burn in, nothing is saved; if the save
 * fails, a file the attempt created at the output path is removed.
 */
class RedactionApplier {
public:
  explicit RedactionApplier(bool verbose = false);

  /**
   * @brief Burn @p rectangles into @p document and save to @p outputPath
   *
   * An empty plan is a no-op that succeeds without writing anything.
   */
  ApplyResult apply(Document &document,
                    const std::vector<RedactionRectangle> &rectangles,
                    const std::string &outputPath,
                    const RunControl &control) const;

private:
  bool m_verbose;
};

} // namespace redact

#endif // REDACT_REDACTION_APPLIER_HPP
