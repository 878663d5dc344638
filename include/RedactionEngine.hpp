#ifndef REDACT_REDACTION_ENGINE_HPP
#define REDACT_REDACTION_ENGINE_HPP

#include "Document.hpp"
#include "PIITypes.hpp"
#include "PatternLibrary.hpp"
#include "RedactionConfig.hpp"

#include <atomic>
#include <string>

namespace redact {

/**
 * @brief Detect followed by redact, as run by process()
 */
struct PipelineResult {
  DetectResult detection;
  RedactResult redaction;

  bool success() const { return detection.success && redaction.success; }
};

/**
 * @brief Detection and redaction engine
 *
 * Holds only the immutable pattern library and its configuration, so one
 * engine may serve several documents concurrently as long as each document is
 * used by a single call at a time. Cancellation flags are passed per call and
 * only affect that call.
 *
 * Example usage:
 * @code
 * redact::RedactionEngine engine(redact::PatternLibrary::defaultLibrary());
 * redact::PopplerDocument document("input.pdf");
 * auto detection = engine.detect(document);
 * if (detection.success) {
 *     auto redaction = engine.redact(document, detection, "output.pdf");
 * }
 * @endcode
 */
class RedactionEngine {
public:
  /**
   * @param library Pattern table; must outlive the engine
   */
  explicit RedactionEngine(const PatternLibrary &library,
                           const RedactionConfig &config = RedactionConfig());

  /**
   * @brief Read-only phase: find, filter, map and deduplicate PII
   *
   * Encrypted or unreadable documents abort with an error before any span is
   * scanned. Pages without text contribute no matches.
   *
   * @param cancelFlag Optional caller-owned flag polled between pages
   */
  DetectResult detect(Document &document,
                      const std::atomic<bool> *cancelFlag = nullptr) const;

  /**
   * @brief Write-only phase: burn the detected matches into a new artifact
   *
   * @param detection Successful result of detect() on the same document
   * @param outputPath Path of the artifact; must differ from the source
   * @param cancelFlag Optional caller-owned flag polled between pages and
   *                   before the save
   */
  RedactResult redact(Document &document, const DetectResult &detection,
                      const std::string &outputPath,
                      const std::atomic<bool> *cancelFlag = nullptr) const;

  /**
   * @brief Run detect() then redact() on one document
   */
  PipelineResult process(Document &document, const std::string &outputPath,
                         const std::atomic<bool> *cancelFlag = nullptr) const;

  const RedactionConfig &getConfig() const;

private:
  const PatternLibrary &m_library;
  RedactionConfig m_config;
};

} // namespace redact

#endif // REDACT_REDACTION_ENGINE_HPP
