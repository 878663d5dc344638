#include "RedactionApplier.hpp"

#include <filesystem>
#include <iostream>
#include <map>

namespace redact {

RedactionApplier::RedactionApplier(bool verbose) : m_verbose(verbose) {}

ApplyResult
RedactionApplier::apply(Document &document,
                        const std::vector<RedactionRectangle> &rectangles,
                        const std::string &outputPath,
                        const RunControl &control) const {
  ApplyResult result;

  if (rectangles.empty()) {
    result.success = true;
    return result;
  }

  if (outputPath.empty()) {
    result.error = ErrorKind::SaveFailure;
    result.errorMessage = "No output path given for redacted document";
    return result;
  }

  // Group by page, keeping plan order within each page
  std::map<int, std::vector<RedactionRectangle>> byPage;
  for (const auto &rect : rectangles) {
    byPage[rect.pageNumber].push_back(rect);
  }

  for (const auto &entry : byPage) {
    ErrorKind interrupted = control.check();
    if (interrupted != ErrorKind::None) {
      result.error = interrupted;
      result.errorMessage = "Redaction interrupted before page " +
                            std::to_string(entry.first + 1) + ": " +
                            errorKindName(interrupted);
      return result;
    }

    if (m_verbose) {
      std::cerr << "DEBUG: Burning " << entry.second.size()
                << " redaction(s) into page " << (entry.first + 1)
                << std::endl;
    }

    bool burned = false;
    try {
      burned = document.stampAndApply(entry.first, entry.second);
    } catch (const std::exception &e) {
      result.errorMessage = "Exception while redacting page " +
                            std::to_string(entry.first + 1) + ": " + e.what();
    }

    if (!burned) {
      result.error = ErrorKind::RedactionApplyFailure;
      if (result.errorMessage.empty()) {
        result.errorMessage =
            "Failed to redact page " + std::to_string(entry.first + 1);
      }
      return result;
    }
    result.pagesStamped++;
  }

  ErrorKind interrupted = control.check();
  if (interrupted != ErrorKind::None) {
    result.error = interrupted;
    result.errorMessage =
        "Redaction interrupted before save: " + errorKindName(interrupted);
    return result;
  }

  std::error_code ec;
  bool existedBefore = std::filesystem::exists(outputPath, ec);

  bool saved = false;
  try {
    saved = document.saveAs(outputPath);
  } catch (const std::exception &e) {
    result.errorMessage =
        std::string("Exception while saving redacted document: ") + e.what();
  }

  if (!saved) {
    // Only clean up what this save attempt created
    if (!existedBefore) {
      std::filesystem::remove(outputPath, ec);
    }
    result.error = ErrorKind::SaveFailure;
    if (result.errorMessage.empty()) {
      result.errorMessage = "Failed to save redacted document: " + outputPath;
    }
    return result;
  }

  if (m_verbose) {
    std::cerr << "DEBUG: Redacted document saved to " << outputPath
              << std::endl;
  }

  result.outputPath = outputPath;
  result.success = true;
  return result;
}

} // namespace redact
