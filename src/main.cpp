#include "PopplerDocument.hpp"
#include "RedactionEngine.hpp"

#include <tesseract/baseapi.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <input.pdf> [options]\n"
      << "\nOptions:\n"
      << "  -o, --output <path>     Redacted PDF (default: <input>_redacted.pdf)\n"
      << "  -d, --detect-only       Report PII without writing a redacted file\n"
      << "      --dpi <val>         Rasterisation resolution (default: 150)\n"
      << "      --margin <pt>       Margin around each redaction (default: 2)\n"
      << "      --timeout <ms>      Abort if not committed within this time\n"
      << "      --verify            OCR each redacted region after burn-in\n"
      << "      --tessdata <path>   Tesseract data directory for --verify\n"
      << "  -v, --verbose           Print diagnostic output\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " statement.pdf\n"
      << "  " << programName << " statement.pdf -d\n"
      << "  " << programName << " statement.pdf -o clean.pdf --verify\n";
}

std::string defaultOutputPath(const std::string &inputPath) {
  std::filesystem::path input(inputPath);
  std::filesystem::path output = input.parent_path() /
                                 (input.stem().string() + "_redacted.pdf");
  return output.string();
}

void printMatches(const redact::DetectResult &detection) {
  std::cout << "\n[Detected PII]\n";
  std::cout << std::setw(6) << "No." << std::setw(6) << "Page" << std::setw(13)
            << "Type" << std::setw(7) << "Conf" << std::setw(34)
            << "Bounding Box"
            << "  Text\n";
  std::cout << std::string(90, '-') << "\n";

  for (size_t i = 0; i < detection.matches.size(); ++i) {
    const auto &match = detection.matches[i];
    std::ostringstream bbox;
    if (match.mapped) {
      bbox << std::fixed << std::setprecision(1) << "(" << match.bbox.x0 << ","
           << match.bbox.y0 << "," << match.bbox.x1 << "," << match.bbox.y1
           << ")";
    } else {
      bbox << "(unmapped)";
    }

    std::cout << std::setw(6) << (i + 1) << std::setw(6)
              << (match.pageNumber + 1) << std::setw(13)
              << redact::piiTypeName(match.type) << std::setw(7) << std::fixed
              << std::setprecision(2) << match.confidence << std::setw(34)
              << bbox.str() << "  " << match.text << "\n";
  }
}

void printSummary(const redact::RedactionSummary &summary) {
  std::cout << "\n[Redaction Summary]\n";
  std::cout << "Total redactions: " << summary.totalRedactions << "\n";
  for (const auto &entry : summary.redactionsByType) {
    std::cout << "  " << std::left << std::setw(12)
              << redact::piiTypeName(entry.first) << std::right << entry.second
              << "\n";
  }
  for (const auto &entry : summary.redactionsByPage) {
    std::cout << "  Page " << (entry.first + 1) << ": " << entry.second
              << "\n";
  }
  std::cout << "Confidence: high " << summary.confidenceTiers.high
            << ", medium " << summary.confidenceTiers.medium << ", low "
            << summary.confidenceTiers.low << "\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string inputPath;
  std::string outputPath;
  bool detectOnly = false;
  redact::RedactionConfig config;

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-o" || arg == "--output") {
        if (i + 1 < argc) {
          outputPath = argv[++i];
        } else {
          std::cerr << "Error: --output requires an argument\n";
          return 1;
        }
      } else if (arg == "-d" || arg == "--detect-only") {
        detectOnly = true;
      } else if (arg == "--dpi") {
        if (i + 1 < argc) {
          config.renderDpi = std::stod(argv[++i]);
        } else {
          std::cerr << "Error: --dpi requires an argument\n";
          return 1;
        }
      } else if (arg == "--margin") {
        if (i + 1 < argc) {
          config.marginPt = std::stod(argv[++i]);
        } else {
          std::cerr << "Error: --margin requires an argument\n";
          return 1;
        }
      } else if (arg == "--timeout") {
        if (i + 1 < argc) {
          config.timeoutMs = std::stol(argv[++i]);
        } else {
          std::cerr << "Error: --timeout requires an argument\n";
          return 1;
        }
      } else if (arg == "--verify") {
        config.verifyBurnIn = true;
      } else if (arg == "--tessdata") {
        if (i + 1 < argc) {
          config.tessDataPath = argv[++i];
        } else {
          std::cerr << "Error: --tessdata requires an argument\n";
          return 1;
        }
      } else if (arg == "-v" || arg == "--verbose") {
        config.verbose = true;
      } else if (arg[0] != '-') {
        inputPath = arg;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
    return 1;
  }

  if (inputPath.empty()) {
    std::cerr << "Error: No input PDF provided\n";
    printUsage(argv[0]);
    return 1;
  }

  if (config.renderDpi <= 0) {
    std::cerr << "Error: --dpi must be positive\n";
    return 1;
  }

  if (outputPath.empty()) {
    outputPath = defaultOutputPath(inputPath);
  }

  // Display version info
  std::cout << "=== PDF PII Redaction ===\n"
            << "Input: " << inputPath << "\n";
  if (!detectOnly) {
    std::cout << "Output: " << outputPath << "\n";
  }
  if (config.verifyBurnIn) {
    std::cout << "Tesseract version: " << tesseract::TessBaseAPI::Version()
              << "\n";
  }
  std::cout << "OpenCV version: " << CV_VERSION << "\n"
            << "Render DPI: " << config.renderDpi << "\n"
            << "=========================\n";

  redact::PopplerDocument document(inputPath, config);
  if (!document.isLoaded() && config.verbose) {
    std::cerr << "DEBUG: " << document.errorMessage() << std::endl;
  }

  redact::RedactionEngine engine(redact::PatternLibrary::defaultLibrary(),
                                 config);

  auto detection = engine.detect(document);
  if (!detection.success) {
    std::cerr << "Detection failed ["
              << redact::errorKindName(detection.error)
              << "]: " << detection.errorMessage << "\n";
    return 1;
  }

  printMatches(detection);

  std::cout << "\nPages: " << detection.metadata.totalPages << "\n";
  std::cout << "Total matches: " << detection.metadata.totalMatches << "\n";
  for (const auto &entry : detection.metadata.matchesByType) {
    std::cout << "  " << std::left << std::setw(12)
              << redact::piiTypeName(entry.first) << std::right << entry.second
              << "\n";
  }
  if (detection.metadata.unmappedMatches > 0) {
    std::cout << "Unmapped (not redactable): "
              << detection.metadata.unmappedMatches << "\n";
  }
  std::cout << "Detection time: " << std::fixed << std::setprecision(2)
            << detection.processingTimeMs << " ms\n";

  if (detectOnly) {
    return 0;
  }

  auto redaction = engine.redact(document, detection, outputPath);
  if (!redaction.success) {
    std::cerr << "Redaction failed [" << redact::errorKindName(redaction.error)
              << "]: " << redaction.errorMessage << "\n";
    return 1;
  }

  printSummary(redaction.summary);

  if (redaction.outputPath.empty()) {
    std::cout << "\nNo PII found; no redacted file written.\n";
  } else {
    std::cout << "\nRedacted file: " << redaction.outputPath << "\n";
  }
  std::cout << "Redaction time: " << std::fixed << std::setprecision(2)
            << redaction.processingTimeMs << " ms\n";

  return 0;
}
