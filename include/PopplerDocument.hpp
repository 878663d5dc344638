#ifndef REDACT_POPPLER_DOCUMENT_HPP
#define REDACT_POPPLER_DOCUMENT_HPP

#include "BurnInVerifier.hpp"
#include "Document.hpp"
#include "RedactionConfig.hpp"

#include <opencv2/opencv.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace poppler {
class document;
class page;
} // namespace poppler

namespace redact {

/**
 * @brief PDF backend built on Poppler (reading), OpenCV (burn-in) and qpdf
 * (writing)
 *
 * Text is read with Poppler's word list and grouped into line spans. Redaction
 * renders the page, paints the rectangles opaque white into the raster and
 * replaces the page content with that raster, so the original content of the
 * region cannot be recovered from the artifact. A rebuilt page also carries an
 * invisible text layer holding the text outside the rectangles, and the
 * replacement labels as vector text. Pages without redactions are copied
 * unchanged.
 *
 * The source file is never modified. After saveAs() the handle is closed and
 * all mutating calls fail.
 */
class PopplerDocument : public Document {
public:
  /**
   * @param pdfPath Path to the source PDF
   * @param config Rendering, labelling and verification options
   */
  explicit PopplerDocument(const std::string &pdfPath,
                           const RedactionConfig &config = RedactionConfig());
  ~PopplerDocument() override;

  // Owns an open document handle
  PopplerDocument(const PopplerDocument &) = delete;
  PopplerDocument &operator=(const PopplerDocument &) = delete;

  int pageCount() const override;
  bool textSpans(int page, std::vector<TextSpan> &spans) override;
  bool needsPassword() const override;
  bool stampAndApply(int page,
                     const std::vector<RedactionRectangle> &rects) override;
  bool saveAs(const std::string &path) override;

  /**
   * @brief Whether the source file was loaded
   */
  bool isLoaded() const;

  /**
   * @brief Whether the handle was consumed by saveAs()
   */
  bool isClosed() const;

  /**
   * @brief Reason for the last failure, empty if none
   */
  const std::string &errorMessage() const;

  /**
   * @brief Render a page at the configured DPI
   * @param image Receives a BGR raster
   * @return false if the page could not be rendered
   */
  bool renderPage(int page, cv::Mat &image);

private:
  struct BurnedPage {
    cv::Mat image;                               ///< Raster with regions filled
    std::vector<RedactionRectangle> rectangles;  ///< Labels to stamp on save
    std::vector<TextSpan> spans;                 ///< Text before burn-in
  };

  struct Word {
    std::string text;
    double x = 0, y = 0, width = 0, height = 0; ///< Top-left origin, points
    bool spaceAfter = false;
    bool rotated = false;
  };

  std::vector<TextSpan> groupWordsIntoLines(const std::vector<Word> &words,
                                            int page) const;
  double scale() const;

  std::string m_path;
  RedactionConfig m_config;
  std::unique_ptr<poppler::document> m_document;
  std::map<int, BurnedPage> m_burned;
  std::unique_ptr<BurnInVerifier> m_verifier;
  bool m_closed;
  std::string m_errorMessage;
};

} // namespace redact

#endif // REDACT_POPPLER_DOCUMENT_HPP
