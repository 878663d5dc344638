#include "PopplerDocument.hpp"

#include "TextUtils.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <locale>
#include <sstream>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace redact {

namespace {

// Width of a Courier glyph in text space units
constexpr double kCourierAdvance = 0.6;

std::string formatNumber(double value) {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

/**
 * @brief PDF string literal in WinAnsi encoding
 *
 * Code points outside Latin-1 are written as '?'.
 */
std::string pdfString(const std::vector<unsigned int> &codePoints, size_t begin,
                      size_t end) {
  std::string out = "(";
  for (size_t i = begin; i < end; ++i) {
    unsigned int c = codePoints[i];
    if (c == '(' || c == ')' || c == '\\') {
      out.push_back('\\');
      out.push_back(static_cast<char>(c));
    } else if ((c >= 0x20 && c < 0x7F) || (c >= 0xA0 && c <= 0xFF)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back(c == '\t' ? ' ' : '?');
    }
  }
  out.push_back(')');
  return out;
}

/**
 * @brief Invisible text for every character cell clear of the rectangles
 *
 * Cells follow the same uniform-width model as the redaction rectangles, so a
 * redacted literal never reaches the text layer. Each run of kept cells is set
 * in Courier and scaled horizontally to the width of the run.
 */
std::string textLayer(const std::vector<TextSpan> &spans,
                      const std::vector<RedactionRectangle> &rects,
                      double pageHeight) {
  std::string ops;
  for (const auto &span : spans) {
    std::vector<unsigned int> codePoints = utf8CodePoints(span.text);
    if (codePoints.empty() || !span.bbox.isValid()) {
      continue;
    }

    double cellWidth = span.bbox.width() / static_cast<double>(codePoints.size());
    double fontSize = span.bbox.height();
    auto covered = [&](size_t index) {
      BBox cell(span.bbox.x0 + cellWidth * static_cast<double>(index),
                span.bbox.y0,
                span.bbox.x0 + cellWidth * static_cast<double>(index + 1),
                span.bbox.y1);
      for (const auto &rect : rects) {
        if (cell.intersects(rect.bbox)) {
          return true;
        }
      }
      return false;
    };

    size_t begin = 0;
    while (begin < codePoints.size()) {
      if (covered(begin)) {
        ++begin;
        continue;
      }
      size_t end = begin;
      bool blank = true;
      while (end < codePoints.size() && !covered(end)) {
        blank = blank && (codePoints[end] == ' ' || codePoints[end] == '\t');
        ++end;
      }

      if (!blank) {
        double x = span.bbox.x0 + cellWidth * static_cast<double>(begin);
        // Baseline sits about a fifth of the box height above its bottom
        double baseline = pageHeight - span.bbox.y1 + 0.2 * fontSize;
        double horizontalScale = 100.0 * cellWidth / (kCourierAdvance * fontSize);

        ops += "BT 3 Tr /FT " + formatNumber(fontSize) + " Tf " +
               formatNumber(horizontalScale) + " Tz 1 0 0 1 " + formatNumber(x) +
               " " + formatNumber(baseline) + " Tm " +
               pdfString(codePoints, begin, end) + " Tj ET\n";
      }
      begin = end;
    }
  }
  return ops;
}

/**
 * @brief Replacement labels, each clipped to its rectangle
 */
std::string labelLayer(const std::vector<RedactionRectangle> &rects,
                       double pageHeight, double fontSize) {
  std::string ops;
  for (const auto &rect : rects) {
    if (rect.replacementText.empty()) {
      continue;
    }
    double bottom = pageHeight - rect.bbox.y1;
    double baseline = bottom + (rect.bbox.height() - 0.7 * fontSize) / 2.0;

    ops += "q " + formatNumber(rect.bbox.x0) + " " + formatNumber(bottom) + " " +
           formatNumber(rect.bbox.width()) + " " +
           formatNumber(rect.bbox.height()) + " re W n BT 0 g /FL " +
           formatNumber(fontSize) + " Tf 1 0 0 1 " +
           formatNumber(rect.bbox.x0 + 1.0) + " " + formatNumber(baseline) +
           " Tm " + pdfString(utf8CodePoints(rect.replacementText), 0,
                              utf8Length(rect.replacementText)) +
           " Tj ET Q\n";
  }
  return ops;
}

} // anonymous namespace

PopplerDocument::PopplerDocument(const std::string &pdfPath,
                                 const RedactionConfig &config)
    : m_path(pdfPath), m_config(config), m_closed(false) {
  try {
    m_document.reset(poppler::document::load_from_file(pdfPath));
    if (!m_document) {
      m_errorMessage = "Failed to load PDF file: " + pdfPath;
    }
  } catch (const std::exception &e) {
    m_errorMessage = std::string("Failed to load PDF file: ") + e.what();
  }

  if (m_config.verifyBurnIn) {
    m_verifier = std::make_unique<BurnInVerifier>(m_config.tessDataPath,
                                                  m_config.ocrLanguage);
  }
}

PopplerDocument::~PopplerDocument() = default;

bool PopplerDocument::isLoaded() const { return m_document != nullptr; }

bool PopplerDocument::isClosed() const { return m_closed; }

const std::string &PopplerDocument::errorMessage() const {
  return m_errorMessage;
}

int PopplerDocument::pageCount() const {
  if (!m_document) {
    return -1;
  }
  return m_document->pages();
}

bool PopplerDocument::needsPassword() const {
  return m_document && m_document->is_locked();
}

double PopplerDocument::scale() const { return m_config.renderDpi / 72.0; }

bool PopplerDocument::textSpans(int page, std::vector<TextSpan> &spans) {
  spans.clear();

  if (!m_document || m_document->is_locked()) {
    m_errorMessage = "Document is not readable";
    return false;
  }
  if (page < 0 || page >= m_document->pages()) {
    m_errorMessage = "Page out of range: " + std::to_string(page + 1);
    return false;
  }

  try {
    std::unique_ptr<poppler::page> p(m_document->create_page(page));
    if (!p) {
      m_errorMessage = "Failed to create page " + std::to_string(page + 1);
      return false;
    }

    // Word boxes come in reading order with a top-left origin
    std::vector<poppler::text_box> textBoxes = p->text_list();

    if (m_config.verbose) {
      std::cerr << "DEBUG: Found " << textBoxes.size()
                << " text boxes on page " << (page + 1) << std::endl;
    }

    std::vector<Word> words;
    words.reserve(textBoxes.size());
    for (auto &textBox : textBoxes) {
      poppler::byte_array textBytes = textBox.text().to_utf8();
      std::string text(textBytes.begin(), textBytes.end());
      if (text.empty()) {
        continue;
      }

      poppler::rectf bbox = textBox.bbox();

      Word word;
      word.text = text;
      word.x = bbox.x();
      word.y = bbox.y();
      word.width = bbox.width();
      word.height = bbox.height();
      word.spaceAfter = textBox.has_space_after();
      word.rotated = textBox.rotation() != 0;
      words.push_back(word);
    }

    spans = groupWordsIntoLines(words, page);
  } catch (const std::exception &e) {
    m_errorMessage = "Exception reading page " + std::to_string(page + 1) +
                     ": " + e.what();
    spans.clear();
    return false;
  }

  return true;
}

std::vector<TextSpan>
PopplerDocument::groupWordsIntoLines(const std::vector<Word> &words,
                                     int page) const {
  std::vector<TextSpan> lines;
  std::vector<bool> used(words.size(), false);

  for (size_t i = 0; i < words.size(); i++) {
    if (used[i])
      continue;

    used[i] = true;
    const Word &first = words[i];

    double left = first.x;
    double top = first.y;
    double right = first.x + first.width;
    double bottom = first.y + first.height;
    std::string text = first.text;
    bool spaceAfter = first.spaceAfter;

    // Rotated words are kept as single-word spans; the uniform-width mapping
    // only holds along a horizontal baseline
    if (!first.rotated) {
      for (size_t j = i + 1; j < words.size(); j++) {
        if (used[j])
          continue;

        const Word &candidate = words[j];
        if (candidate.rotated)
          continue;

        // Same line if the vertical centers are within half a line height
        double lineHeight = bottom - top;
        double yCenter1 = top + lineHeight / 2.0;
        double yCenter2 = candidate.y + candidate.height / 2.0;
        double tolerance = std::max(1.0, lineHeight / 2.0);
        if (std::abs(yCenter1 - yCenter2) > tolerance)
          continue;

        // Only extend to the right, and only across a word gap; wider gaps
        // separate columns
        double gap = candidate.x - right;
        if (gap < -0.5 || gap > lineHeight * 1.5)
          continue;

        used[j] = true;
        if (spaceAfter || gap > lineHeight * 0.1) {
          text += " ";
        }
        text += candidate.text;
        spaceAfter = candidate.spaceAfter;

        left = std::min(left, candidate.x);
        top = std::min(top, candidate.y);
        right = std::max(right, candidate.x + candidate.width);
        bottom = std::max(bottom, candidate.y + candidate.height);
      }
    }

    TextSpan span;
    span.text = text;
    span.bbox = BBox(left, top, right, bottom);
    span.pageNumber = page;
    // Bounding box height stands in for the font size
    span.fontSize = bottom - top;
    lines.push_back(span);
  }

  return lines;
}

bool PopplerDocument::renderPage(int page, cv::Mat &image) {
  if (!m_document || m_document->is_locked() || page < 0 ||
      page >= m_document->pages()) {
    m_errorMessage = "Cannot render page " + std::to_string(page + 1);
    return false;
  }

  try {
    std::unique_ptr<poppler::page> p(m_document->create_page(page));
    if (!p) {
      m_errorMessage = "Failed to create page " + std::to_string(page + 1);
      return false;
    }

    // Create page renderer with antialiasing
    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    poppler::image popplerImage = renderer.render_page(
        p.get(), m_config.renderDpi, m_config.renderDpi);

    if (!popplerImage.is_valid()) {
      m_errorMessage = "Failed to render page " + std::to_string(page + 1);
      return false;
    }

    int width = popplerImage.width();
    int height = popplerImage.height();

    // Convert Poppler image to a BGR OpenCV Mat
    switch (popplerImage.format()) {
    case poppler::image::format_argb32: {
      cv::Mat bgra(height, width, CV_8UC4,
                   const_cast<char *>(popplerImage.const_data()),
                   popplerImage.bytes_per_row());
      cv::cvtColor(bgra, image, cv::COLOR_BGRA2BGR);
      break;
    }
    case poppler::image::format_rgb24: {
      cv::Mat rgb(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row());
      cv::cvtColor(rgb, image, cv::COLOR_RGB2BGR);
      break;
    }
    case poppler::image::format_bgr24: {
      image = cv::Mat(height, width, CV_8UC3,
                      const_cast<char *>(popplerImage.const_data()),
                      popplerImage.bytes_per_row())
                  .clone();
      break;
    }
    case poppler::image::format_gray8: {
      cv::Mat gray(height, width, CV_8UC1,
                   const_cast<char *>(popplerImage.const_data()),
                   popplerImage.bytes_per_row());
      cv::cvtColor(gray, image, cv::COLOR_GRAY2BGR);
      break;
    }
    default:
      m_errorMessage = "Unsupported image format";
      return false;
    }
  } catch (const std::exception &e) {
    m_errorMessage = "Exception rendering page " + std::to_string(page + 1) +
                     ": " + e.what();
    return false;
  }

  return !image.empty();
}

bool PopplerDocument::stampAndApply(
    int page, const std::vector<RedactionRectangle> &rects) {
  if (m_closed) {
    m_errorMessage = "Document handle already closed";
    return false;
  }

  auto existing = m_burned.find(page);
  cv::Mat image;
  std::vector<TextSpan> spans;
  if (existing != m_burned.end()) {
    image = existing->second.image.clone();
    spans = existing->second.spans;
  } else if (!renderPage(page, image) || !textSpans(page, spans)) {
    return false;
  }

  double s = scale();
  for (const auto &rect : rects) {
    if (rect.pageNumber != page || !rect.bbox.isValid()) {
      m_errorMessage = "Invalid redaction rectangle for page " +
                       std::to_string(page + 1);
      return false;
    }

    int x0 = static_cast<int>(std::floor(rect.bbox.x0 * s));
    int y0 = static_cast<int>(std::floor(rect.bbox.y0 * s));
    int x1 = static_cast<int>(std::ceil(rect.bbox.x1 * s));
    int y1 = static_cast<int>(std::ceil(rect.bbox.y1 * s));

    cv::Rect region =
        cv::Rect(x0, y0, x1 - x0, y1 - y0) & cv::Rect(0, 0, image.cols, image.rows);
    if (region.empty()) {
      m_errorMessage = "Redaction rectangle for \"" + rect.originalText +
                       "\" lies outside page " + std::to_string(page + 1);
      return false;
    }

    // Burn-in: the pixels of the region are replaced, not overlaid
    cv::rectangle(image, region, cv::Scalar(255, 255, 255), cv::FILLED);
  }

  if (m_verifier) {
    if (!m_verifier->isInitialized() && !m_verifier->initialize()) {
      m_errorMessage = "Burn-in verification requested but OCR is unavailable";
      return false;
    }
    std::string leaked;
    if (!m_verifier->verify(image, s, rects, spans, leaked)) {
      m_errorMessage = "Redacted text still readable after burn-in on page " +
                       std::to_string(page + 1);
      return false;
    }
  }

  BurnedPage &burned = m_burned[page];
  burned.image = image;
  burned.spans = spans;
  burned.rectangles.insert(burned.rectangles.end(), rects.begin(), rects.end());

  if (m_config.verbose) {
    std::cerr << "DEBUG: Burned " << rects.size() << " region(s) into page "
              << (page + 1) << std::endl;
  }

  return true;
}

bool PopplerDocument::saveAs(const std::string &path) {
  if (m_closed || !m_document || m_document->is_locked()) {
    m_errorMessage = "Document handle is not available for saving";
    return false;
  }

  std::error_code ec;
  if (path == m_path || (std::filesystem::exists(path, ec) &&
                         std::filesystem::equivalent(path, m_path, ec))) {
    m_errorMessage = "Refusing to overwrite the source document";
    return false;
  }

  // The handle is consumed by any save attempt
  m_closed = true;

  int pages = m_document->pages();
  if (pages < 1) {
    m_errorMessage = "Document has no pages to save";
    return false;
  }

  // Written beside the destination and renamed once complete
  std::string partialPath = path + ".partial";
  double s = scale();
  bool ok = true;

  try {
    QPDF pdf;
    pdf.setSuppressWarnings(true);
    pdf.processFile(m_path.c_str());
    // Page boxes, resources and /Rotate may be inherited from the page tree
    pdf.pushInheritedAttributesToPage();

    std::vector<QPDFPageObjectHelper> pdfPages =
        QPDFPageDocumentHelper(pdf).getAllPages();
    if (static_cast<int>(pdfPages.size()) != pages) {
      m_errorMessage = "Page tree does not match the loaded document";
      ok = false;
    }

    for (auto it = m_burned.begin(); ok && it != m_burned.end(); ++it) {
      const BurnedPage &burned = it->second;
      QPDFObjectHandle pageObject =
          pdfPages.at(static_cast<size_t>(it->first)).getObjectHandle();

      // The raster is already in the rotated, cropped view Poppler renders
      double widthPt = burned.image.cols / s;
      double heightPt = burned.image.rows / s;

      cv::Mat rgb;
      cv::cvtColor(burned.image, rgb, cv::COLOR_BGR2RGB);
      if (!rgb.isContinuous()) {
        rgb = rgb.clone();
      }
      std::string pixels(reinterpret_cast<const char *>(rgb.data),
                         rgb.total() * rgb.elemSize());

      QPDFObjectHandle image = QPDFObjectHandle::newStream(&pdf, pixels);
      QPDFObjectHandle imageDict = image.getDict();
      imageDict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
      imageDict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
      imageDict.replaceKey("/Width", QPDFObjectHandle::newInteger(rgb.cols));
      imageDict.replaceKey("/Height", QPDFObjectHandle::newInteger(rgb.rows));
      imageDict.replaceKey("/ColorSpace",
                           QPDFObjectHandle::newName("/DeviceRGB"));
      imageDict.replaceKey("/BitsPerComponent",
                           QPDFObjectHandle::newInteger(8));

      std::string ops = "q " + formatNumber(widthPt) + " 0 0 " +
                        formatNumber(heightPt) + " 0 0 cm /Im0 Do Q\n";
      ops += textLayer(burned.spans, burned.rectangles, heightPt);
      ops += labelLayer(burned.rectangles, heightPt, m_config.labelFontSize);

      QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
      xobjects.replaceKey("/Im0", image);
      QPDFObjectHandle resources = QPDFObjectHandle::parse(
          "<< /Font << "
          "/FT << /Type /Font /Subtype /Type1 /BaseFont /Courier "
          "/Encoding /WinAnsiEncoding >> "
          "/FL << /Type /Font /Subtype /Type1 /BaseFont /Helvetica "
          "/Encoding /WinAnsiEncoding >> >> >>");
      resources.replaceKey("/XObject", xobjects);

      std::string box = "[0 0 " + formatNumber(widthPt) + " " +
                        formatNumber(heightPt) + "]";
      pageObject.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, ops));
      pageObject.replaceKey("/Resources", resources);
      pageObject.replaceKey("/MediaBox", QPDFObjectHandle::parse(box));
      pageObject.replaceKey("/CropBox", QPDFObjectHandle::parse(box));
      pageObject.replaceKey("/Rotate", QPDFObjectHandle::newInteger(0));

      // Annotations and alternate boxes refer to the replaced content
      for (const char *key :
           {"/Annots", "/Thumb", "/BleedBox", "/TrimBox", "/ArtBox"}) {
        pageObject.removeKey(key);
      }

      if (m_config.verbose) {
        std::cerr << "DEBUG: Rebuilt page " << (it->first + 1) << " ("
                  << formatNumber(widthPt) << " x " << formatNumber(heightPt)
                  << " pt) with " << burned.rectangles.size()
                  << " redaction(s)" << std::endl;
      }
    }

    if (ok) {
      // Objects only the replaced content referred to are not written
      QPDFWriter writer(pdf, partialPath.c_str());
      writer.write();
    }
  } catch (const std::exception &e) {
    m_errorMessage = std::string("Failed to write PDF: ") + e.what();
    ok = false;
  }

  // Release the burned rasters; the handle cannot be reused
  size_t rebuilt = m_burned.size();
  m_burned.clear();

  ec.clear();
  if (ok) {
    std::filesystem::rename(partialPath, path, ec);
    if (ec) {
      m_errorMessage = "Failed to move redacted document into place: " +
                       ec.message();
      ok = false;
    }
  }
  if (!ok) {
    std::error_code removeError;
    std::filesystem::remove(partialPath, removeError);
  }

  if (ok && m_config.verbose) {
    std::cerr << "DEBUG: Wrote " << pages << " page(s) to " << path << ", "
              << rebuilt << " rebuilt" << std::endl;
  }

  return ok;
}

} // namespace redact
