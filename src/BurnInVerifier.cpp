#include "BurnInVerifier.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace redact {

BurnInVerifier::BurnInVerifier(const std::string &tessDataPath,
                               const std::string &language)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()),
      m_tessDataPath(tessDataPath), m_language(language),
      m_initialized(false) {}

BurnInVerifier::~BurnInVerifier() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

bool BurnInVerifier::initialize() {
  if (m_initialized) {
    return true;
  }

  const char *tessDataPath = nullptr;

  // Priority 1: Use configured path if provided
  if (!m_tessDataPath.empty()) {
    tessDataPath = m_tessDataPath.c_str();
  }
  // Priority 2: TESSDATA_PREFIX; otherwise Tesseract's compiled-in default
  else {
    tessDataPath = std::getenv("TESSDATA_PREFIX");
  }

  int result = m_tesseract->Init(tessDataPath, m_language.c_str());

  if (result != 0) {
    std::cerr << "Failed to initialize Tesseract with language: " << m_language
              << std::endl;
    return false;
  }

  // Bands carry no resolution of their own
  m_tesseract->SetPageSegMode(tesseract::PSM_SINGLE_BLOCK);
  m_tesseract->SetVariable("user_defined_dpi", "300");
  m_initialized = true;
  return true;
}

bool BurnInVerifier::isInitialized() const { return m_initialized; }

bool BurnInVerifier::verify(const cv::Mat &pageImage, double scale,
                            const std::vector<RedactionRectangle> &rects,
                            const std::vector<TextSpan> &spans,
                            std::string &failedText) {
  failedText.clear();
  if (!m_initialized || pageImage.empty()) {
    return false;
  }

  for (const auto &rect : rects) {
    std::string expected = normalizeForComparison(rect.originalText);
    if (expected.empty()) {
      continue;
    }

    BBox band = lineBand(rect, spans);
    int x0 = static_cast<int>(std::floor(band.x0 * scale));
    int y0 = static_cast<int>(std::floor(band.y0 * scale));
    int x1 = static_cast<int>(std::ceil(band.x1 * scale));
    int y1 = static_cast<int>(std::ceil(band.y1 * scale));

    std::string recognised = normalizeForComparison(
        recognizeRegion(pageImage, cv::Rect(x0, y0, x1 - x0, y1 - y0)));
    if (recognised.find(expected) != std::string::npos) {
      failedText = rect.originalText;
      return false;
    }
  }

  return true;
}

BBox BurnInVerifier::lineBand(const RedactionRectangle &rect,
                              const std::vector<TextSpan> &spans) {
  BBox band = rect.bbox;
  bool touched = false;
  for (const auto &span : spans) {
    if (span.pageNumber != rect.pageNumber || !span.bbox.intersects(rect.bbox)) {
      continue;
    }
    band.x0 = std::min(band.x0, span.bbox.x0);
    band.y0 = std::min(band.y0, span.bbox.y0);
    band.x1 = std::max(band.x1, span.bbox.x1);
    band.y1 = std::max(band.y1, span.bbox.y1);
    touched = true;
  }

  double grow = touched ? rect.bbox.height() : rect.bbox.width();
  band.x0 -= grow;
  band.x1 += grow;
  return band;
}

std::string BurnInVerifier::recognizeRegion(const cv::Mat &image,
                                            const cv::Rect &roi) {
  if (!m_initialized || image.empty()) {
    return "";
  }

  // Validate and clamp ROI to image bounds
  cv::Rect validRoi = roi & cv::Rect(0, 0, image.cols, image.rows);
  if (validRoi.empty()) {
    return "";
  }

  cv::Mat regionImage = image(validRoi);
  setImage(preprocessImage(regionImage));

  char *outText = m_tesseract->GetUTF8Text();
  std::string result;
  if (outText) {
    result = outText;
    delete[] outText;
  }

  return result;
}

std::string BurnInVerifier::normalizeForComparison(const std::string &text) {
  std::string out;
  for (char c : toLowerAscii(text)) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      out.push_back(c);
    }
  }
  return out;
}

cv::Mat BurnInVerifier::preprocessImage(const cv::Mat &image) {
  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.clone();
  }

  // Tesseract needs glyphs of roughly 30 px; small bands are enlarged
  const int minHeight = 64;
  if (gray.rows < minHeight) {
    double factor = static_cast<double>(minHeight) / gray.rows;
    cv::resize(gray, gray, cv::Size(), factor, factor, cv::INTER_CUBIC);
  }

  // Rendered text on white: a global Otsu threshold keeps thin strokes that
  // adaptive thresholding would erode
  cv::Mat binary;
  cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);

  // White border so glyphs never touch the image edge
  cv::copyMakeBorder(binary, binary, 16, 16, 16, 16, cv::BORDER_CONSTANT,
                     cv::Scalar(255));
  return binary;
}

void BurnInVerifier::setImage(const cv::Mat &image) {
  cv::Mat grayImage;
  if (image.channels() == 1) {
    grayImage = image.isContinuous() ? image : image.clone();
  } else if (image.channels() == 4) {
    cv::cvtColor(image, grayImage, cv::COLOR_BGRA2GRAY);
  } else {
    cv::cvtColor(image, grayImage, cv::COLOR_BGR2GRAY);
  }

  m_tesseract->SetImage(grayImage.data, grayImage.cols, grayImage.rows, 1,
                        static_cast<int>(grayImage.step));
}

} // namespace redact
