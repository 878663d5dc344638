#ifndef REDACT_PII_TYPES_HPP
#define REDACT_PII_TYPES_HPP

#include <map>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief Category of personally identifiable information
 */
enum class PIIType {
  Email,     ///< Email address
  SSN,       ///< US social security number
  Phone,     ///< Telephone number
  CreditCard ///< Payment card number
};

/**
 * @brief Stable lower-case name of a PII type ("email", "ssn", ...)
 */
std::string piiTypeName(PIIType type);

/**
 * @brief Axis-aligned rectangle in PDF points, origin at the top-left corner
 */
struct BBox {
  double x0 = 0.0; ///< Left edge
  double y0 = 0.0; ///< Top edge
  double x1 = 0.0; ///< Right edge
  double y1 = 0.0; ///< Bottom edge

  BBox() = default;
  BBox(double left, double top, double right, double bottom)
      : x0(left), y0(top), x1(right), y1(bottom) {}

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }

  /**
   * @brief True if all coordinates are finite and the box has positive area
   */
  bool isValid() const;

  /**
   * @brief True if the intersection with @p other has non-zero area
   *
   * Boxes that only share an edge do not intersect.
   */
  bool intersects(const BBox &other) const;

  /**
   * @brief True if @p other lies entirely inside this box (edges inclusive)
   */
  bool contains(const BBox &other) const;

  /**
   * @brief Copy grown by @p margin points on every side
   */
  BBox expanded(double margin) const;

  bool operator==(const BBox &other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 &&
           y1 == other.y1;
  }
  bool operator!=(const BBox &other) const { return !(*this == other); }
};

/**
 * @brief A positioned run of text as emitted by page layout
 */
struct TextSpan {
  std::string text;      ///< UTF-8 text content
  BBox bbox;             ///< Bounding box of the whole run
  int pageNumber = 0;    ///< 0-indexed page number
  double fontSize = 0.0; ///< Font size in points
};

/**
 * @brief A detected PII value with its location on the page
 */
struct PIIMatch {
  std::string text;         ///< Matched literal
  PIIType type = PIIType::Email; ///< Classification
  int pageNumber = 0;       ///< 0-indexed page number
  BBox bbox;                ///< Location; meaningful only when mapped
  double confidence = 0.0;  ///< Base confidence of the matching pattern
  std::string context;      ///< Surrounding span text
  bool mapped = true;       ///< False if the bbox could not be computed

  bool operator==(const PIIMatch &other) const {
    return text == other.text && type == other.type &&
           pageNumber == other.pageNumber && bbox == other.bbox &&
           confidence == other.confidence && context == other.context &&
           mapped == other.mapped;
  }
};

/**
 * @brief A region to be destructively obscured
 */
struct RedactionRectangle {
  int pageNumber = 0;          ///< 0-indexed page number
  BBox bbox;                   ///< Match bbox grown by the redaction margin
  PIIType piiType = PIIType::Email; ///< Type of the originating match
  std::string originalText;    ///< Literal being removed
  std::string replacementText; ///< Label stamped over the region
};

struct DetectionMetadata {
  int totalPages = 0;
  int totalMatches = 0;
  std::map<PIIType, int> matchesByType;
  int unmappedMatches = 0; ///< Matches counted but not redactable
};

struct ConfidenceTiers {
  int high = 0;   ///< confidence > 0.9
  int medium = 0; ///< 0.7 < confidence <= 0.9
  int low = 0;    ///< confidence <= 0.7
};

struct RedactionSummary {
  int totalRedactions = 0;
  std::map<PIIType, int> redactionsByType;
  std::map<int, int> redactionsByPage;
  ConfidenceTiers confidenceTiers;
};

/**
 * @brief Failure categories reported by the engine
 */
enum class ErrorKind {
  None,
  DocumentUnreadable,    ///< Malformed bytes or unreadable page
  DocumentEncrypted,     ///< Password required
  RedactionApplyFailure, ///< Burn-in failed on at least one page
  SaveFailure,           ///< Output artifact could not be written
  InvalidState,          ///< Redact called without a matching detection
  TimedOut,              ///< Deadline passed before commit
  Cancelled              ///< Caller requested cancellation before commit
};

std::string errorKindName(ErrorKind kind);

/**
 * @brief Result of the read-only detection phase
 */
struct DetectResult {
  bool success = false;          ///< Whether detection completed
  ErrorKind error = ErrorKind::None;
  std::string errorMessage;      ///< Error message if failed
  std::vector<PIIMatch> matches; ///< Retained matches, canonical order
  DetectionMetadata metadata;
  double processingTimeMs = 0;   ///< Processing time in milliseconds
};

/**
 * @brief Result of the write-only redaction phase
 */
struct RedactResult {
  bool success = false;        ///< Whether a complete artifact was produced
  ErrorKind error = ErrorKind::None;
  std::string errorMessage;    ///< Error message if failed
  std::string outputPath;      ///< Empty unless an artifact was written
  std::vector<RedactionRectangle> rectangles; ///< Applied plan
  RedactionSummary summary;
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

} // namespace redact

#endif // REDACT_PII_TYPES_HPP
