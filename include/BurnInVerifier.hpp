#ifndef REDACT_BURN_IN_VERIFIER_HPP
#define REDACT_BURN_IN_VERIFIER_HPP

#include "PIITypes.hpp"

#include <opencv2/opencv.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief OCR check that burned regions no longer show their original text
 *
 * Rectangles are placed by a uniform glyph-width estimate, so with
 * proportional fonts the literal can sit beside its rectangle. The check
 * therefore recognises the whole line band around each rectangle (every span
 * the rectangle touches, widened by the rectangle height) and fails if the
 * recognised text contains the original literal once whitespace is removed
 * and case is folded.
 */
class BurnInVerifier {
public:
  /**
   * @param tessDataPath tessdata directory (empty = TESSDATA_PREFIX, then the
   * library default)
   * @param language Tesseract language code
   */
  BurnInVerifier(const std::string &tessDataPath = "",
                 const std::string &language = "eng");
  ~BurnInVerifier();

  // Tesseract API is not copyable
  BurnInVerifier(const BurnInVerifier &) = delete;
  BurnInVerifier &operator=(const BurnInVerifier &) = delete;

  /**
   * @brief Initialize the OCR engine
   * @return true if initialization was successful
   */
  bool initialize();

  bool isInitialized() const;

  /**
   * @brief Verify every rectangle of one page
   * @param pageImage Burned page raster (BGR)
   * @param scale Pixels per PDF point
   * @param spans Text spans of the page before burn-in
   * @param failedText Receives the first literal still readable, if any
   * @return true if no original literal could be recovered
   */
  bool verify(const cv::Mat &pageImage, double scale,
              const std::vector<RedactionRectangle> &rects,
              const std::vector<TextSpan> &spans, std::string &failedText);

  /**
   * @brief Region of the page, in points, recognised for one rectangle
   *
   * The union of the rectangle and every span it intersects, widened by the
   * rectangle height on both sides. Without an intersecting span the
   * rectangle is widened by its own width instead.
   */
  static BBox lineBand(const RedactionRectangle &rect,
                       const std::vector<TextSpan> &spans);

  /**
   * @brief Recognise the text inside a region of an image
   */
  std::string recognizeRegion(const cv::Mat &image, const cv::Rect &roi);

  /**
   * @brief Whitespace-free lower-case form used to compare OCR output
   */
  static std::string normalizeForComparison(const std::string &text);

private:
  cv::Mat preprocessImage(const cv::Mat &image);
  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  std::string m_tessDataPath;
  std::string m_language;
  bool m_initialized;
};

} // namespace redact

#endif // REDACT_BURN_IN_VERIFIER_HPP
