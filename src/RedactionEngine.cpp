#include "RedactionEngine.hpp"
#include "CoordinateMapper.hpp"
#include "FalsePositiveFilter.hpp"
#include "MatchDeduplicator.hpp"
#include "RedactionApplier.hpp"
#include "RedactionPlanner.hpp"
#include "RunControl.hpp"
#include "SpanScanner.hpp"
#include "SummaryReporter.hpp"

#include <chrono>
#include <iostream>

namespace redact {

RedactionEngine::RedactionEngine(const PatternLibrary &library,
                                 const RedactionConfig &config)
    : m_library(library), m_config(config) {}

DetectResult RedactionEngine::detect(Document &document,
                                     const std::atomic<bool> *cancelFlag) const {
  DetectResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();
  RunControl control(m_config.timeoutMs, cancelFlag);

  auto finish = [&startTime](DetectResult &r) {
    auto endTime = std::chrono::high_resolution_clock::now();
    r.processingTimeMs =
        std::chrono::duration<double, std::milli>(endTime - startTime).count();
  };

  try {
    int pageCount = document.pageCount();
    if (pageCount < 0) {
      result.error = ErrorKind::DocumentUnreadable;
      result.errorMessage = "Document could not be read";
      finish(result);
      return result;
    }

    if (document.needsPassword()) {
      result.error = ErrorKind::DocumentEncrypted;
      result.errorMessage = "Document is encrypted and cannot be processed";
      finish(result);
      return result;
    }

    if (m_config.verbose) {
      std::cerr << "DEBUG: Detecting PII in " << pageCount << " page(s)"
                << std::endl;
    }

    std::vector<TextSpan> spans;
    for (int page = 0; page < pageCount; ++page) {
      ErrorKind interrupted = control.check();
      if (interrupted != ErrorKind::None) {
        result.error = interrupted;
        result.errorMessage = "Detection interrupted at page " +
                              std::to_string(page + 1) + ": " +
                              errorKindName(interrupted);
        finish(result);
        return result;
      }

      std::vector<TextSpan> pageSpans;
      if (!document.textSpans(page, pageSpans)) {
        result.error = ErrorKind::DocumentUnreadable;
        result.errorMessage =
            "Failed to read text of page " + std::to_string(page + 1);
        finish(result);
        return result;
      }

      if (m_config.verbose && pageSpans.empty()) {
        std::cerr << "DEBUG: Page " << (page + 1) << " has no extractable text"
                  << std::endl;
      }

      for (auto &span : pageSpans) {
        span.pageNumber = page;
        spans.push_back(std::move(span));
      }
    }

    SpanScanner scanner(m_library, m_config.contextChars);
    FalsePositiveFilter filter(m_library);

    std::vector<RawMatch> raw = scanner.scan(spans);
    std::vector<RawMatch> filtered = filter.apply(raw);
    std::vector<PIIMatch> mapped = CoordinateMapper::map(filtered, spans);
    result.matches = MatchDeduplicator::deduplicate(mapped);
    result.metadata = SummaryReporter::metadata(result.matches, pageCount);

    if (m_config.verbose) {
      std::cerr << "DEBUG: " << spans.size() << " spans, " << raw.size()
                << " raw matches, " << (raw.size() - filtered.size())
                << " false positives, " << result.matches.size()
                << " retained (" << result.metadata.unmappedMatches
                << " unmapped)" << std::endl;
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.matches.clear();
    result.error = ErrorKind::DocumentUnreadable;
    result.errorMessage = std::string("PII detection failed: ") + e.what();
  }

  finish(result);
  return result;
}

RedactResult RedactionEngine::redact(Document &document,
                                     const DetectResult &detection,
                                     const std::string &outputPath,
                                     const std::atomic<bool> *cancelFlag) const {
  RedactResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();
  RunControl control(m_config.timeoutMs, cancelFlag);

  auto finish = [&startTime](RedactResult &r) {
    auto endTime = std::chrono::high_resolution_clock::now();
    r.processingTimeMs =
        std::chrono::duration<double, std::milli>(endTime - startTime).count();
  };

  if (!detection.success) {
    result.error = ErrorKind::InvalidState;
    result.errorMessage = "Cannot redact without a successful detection";
    finish(result);
    return result;
  }

  int pageCount = -1;
  try {
    pageCount = document.pageCount();
  } catch (const std::exception &e) {
    result.error = ErrorKind::DocumentUnreadable;
    result.errorMessage = std::string("Document could not be read: ") + e.what();
    finish(result);
    return result;
  }
  if (pageCount != detection.metadata.totalPages) {
    result.error = ErrorKind::InvalidState;
    result.errorMessage =
        "Detection result does not belong to this document (page count " +
        std::to_string(detection.metadata.totalPages) + " vs " +
        std::to_string(pageCount) + ")";
    finish(result);
    return result;
  }

  RedactionPlanner planner(m_config.marginPt);
  std::vector<RedactionRectangle> rectangles = planner.plan(detection.matches);

  for (const auto &rect : rectangles) {
    if (rect.pageNumber < 0 || rect.pageNumber >= pageCount) {
      result.error = ErrorKind::InvalidState;
      result.errorMessage = "Match on page " +
                            std::to_string(rect.pageNumber + 1) +
                            " is outside the document";
      finish(result);
      return result;
    }
  }

  if (m_config.verbose) {
    std::cerr << "DEBUG: Planned " << rectangles.size()
              << " redaction rectangle(s)" << std::endl;
  }

  RedactionApplier applier(m_config.verbose);
  ApplyResult applied =
      applier.apply(document, rectangles, outputPath, control);

  if (!applied.success) {
    result.error = applied.error;
    result.errorMessage = applied.errorMessage;
    finish(result);
    return result;
  }

  result.outputPath = applied.outputPath;
  result.rectangles = std::move(rectangles);
  result.summary = SummaryReporter::summarize(detection.matches);
  result.success = true;

  finish(result);
  return result;
}

PipelineResult
RedactionEngine::process(Document &document, const std::string &outputPath,
                         const std::atomic<bool> *cancelFlag) const {
  PipelineResult result;
  result.detection = detect(document, cancelFlag);
  if (!result.detection.success) {
    result.redaction.error = ErrorKind::InvalidState;
    result.redaction.errorMessage = "Detection failed: " +
                                    result.detection.errorMessage;
    return result;
  }
  result.redaction =
      redact(document, result.detection, outputPath, cancelFlag);
  return result;
}

const RedactionConfig &RedactionEngine::getConfig() const { return m_config; }

} // namespace redact
