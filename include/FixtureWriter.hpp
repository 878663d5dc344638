#ifndef REDACT_FIXTURE_WRITER_HPP
#define REDACT_FIXTURE_WRITER_HPP

#include <string>
#include <vector>

namespace redact {

/**
 * @brief A line of text placed on a fixture page
 */
struct FixtureLine {
  double x = 72.0;        ///< Left edge of the baseline (points)
  double y = 90.0;        ///< Baseline position, top-left origin (points)
  std::string text;       ///< UTF-8 text
  double fontSize = 12.0; ///< Font size in points
  std::string fontFamily = "Courier"; ///< Cairo toy font family
};

/**
 * @brief Content of one fixture page
 */
struct FixturePage {
  std::vector<FixtureLine> lines;
  bool drawImageBlock = false; ///< Grey block mimicking a scanned image
  int rotate = 0; ///< Page /Rotate (0, 90, 180 or 270); lines are placed in
                  ///< the rotated view so they read upright
};

/**
 * @brief A named document of the test corpus with its expected PII
 */
struct FixtureCase {
  std::string directory;             ///< Corpus subdirectory
  std::string fileName;              ///< PDF file name
  std::vector<FixturePage> pages;    ///< Empty for a corrupt file
  bool corrupt = false;              ///< Write invalid bytes instead of a PDF
  std::vector<std::string> emails;   ///< Expected email literals
  std::vector<std::string> ssns;     ///< Expected SSN literals
  bool expectFailure = false;        ///< Detection is expected to fail
};

/**
 * @brief Writes PDF test fixtures with Cairo
 *
 * Text is set in a monospaced face by default so that the uniform glyph-width
 * mapping is exact on generated documents. Page rotation, which Cairo cannot
 * express, is set afterwards with qpdf.
 */
class FixtureWriter {
public:
  static constexpr double kPageWidth = 595.0;  ///< A4 width in points
  static constexpr double kPageHeight = 842.0; ///< A4 height in points

  /**
   * @brief Write a PDF with the given pages
   * @param errorMessage Receives the reason on failure
   * @return true if the file was written
   */
  static bool writePdf(const std::string &path,
                       const std::vector<FixturePage> &pages,
                       std::string &errorMessage);

  /**
   * @brief Write bytes that are not a PDF
   */
  static bool writeCorrupt(const std::string &path, std::string &errorMessage);

  /**
   * @brief Pages laid out as "Page N" at (72, 72) and the text at (72, 90)
   */
  static std::vector<FixturePage>
  simplePages(const std::vector<std::string> &texts,
              bool drawImageBlock = false);

  /**
   * @brief Letters and spaces only, reproducible for a given seed
   */
  static std::string randomText(size_t length, unsigned int seed);

  /**
   * @brief The reference corpus (clean, happy path, multipage, ...)
   */
  static std::vector<FixtureCase> corpus();

  /**
   * @brief Write every corpus case below @p baseDir
   * @return Number of files written; -1 if any write failed
   */
  static int writeCorpus(const std::string &baseDir, std::string &errorMessage);
};

} // namespace redact

#endif // REDACT_FIXTURE_WRITER_HPP
