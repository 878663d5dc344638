#ifndef REDACT_REDACTION_CONFIG_HPP
#define REDACT_REDACTION_CONFIG_HPP

#include <cstddef>
#include <string>

namespace redact {

/**
 * @brief Configuration options for detection and redaction
 */
struct RedactionConfig {
  double marginPt = 2.0;       ///< Margin added around each match (points)
  size_t contextChars = 20;    ///< Context kept on each side of a match
  double labelFontSize = 10.0; ///< Font size of replacement labels (points)
  double renderDpi = 150.0;    ///< Raster resolution of rebuilt pages
  long timeoutMs = 0;          ///< Per-invocation budget (0 = unbounded)
  bool verifyBurnIn = false;   ///< OCR burned regions before accepting a page
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX/default)
  std::string ocrLanguage = "eng"; ///< Tesseract language for verification
  bool verbose = false;            ///< Write DEBUG diagnostics to stderr
};

} // namespace redact

#endif // REDACT_REDACTION_CONFIG_HPP
