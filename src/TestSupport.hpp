#ifndef REDACT_TEST_SUPPORT_HPP
#define REDACT_TEST_SUPPORT_HPP

#include "Document.hpp"
#include "TextUtils.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace redact {
namespace test {

/**
 * @brief Counts and prints check outcomes for a test program
 */
class Checker {
public:
  void check(bool condition, const std::string &description) {
    if (condition) {
      std::cout << "  [PASS] " << description << std::endl;
      m_passed++;
    } else {
      std::cout << "  [FAIL] " << description << std::endl;
      m_failed++;
    }
  }

  void section(const std::string &title) {
    std::cout << std::endl << title << std::endl;
    std::cout << std::string(50, '-') << std::endl;
  }

  /// Prints the totals and returns the process exit code
  int finish() const {
    std::cout << std::endl
              << "Passed: " << m_passed << ", Failed: " << m_failed
              << std::endl;
    return m_failed == 0 ? 0 : 1;
  }

private:
  int m_passed = 0;
  int m_failed = 0;
};

/**
 * @brief Single-line span laid out at 7.2 pt per character (12 pt Courier)
 */
inline TextSpan makeSpan(const std::string &text, double x = 72.0,
                         double y = 80.0) {
  TextSpan span;
  span.text = text;
  span.bbox = BBox(x, y, x + 7.2 * static_cast<double>(utf8Length(text)),
                   y + 12.0);
  span.fontSize = 12.0;
  return span;
}

/**
 * @brief In-memory document backend with injectable failures
 */
class StubDocument : public Document {
public:
  StubDocument() = default;

  /// One page per entry, each holding one span with the given text
  explicit StubDocument(const std::vector<std::string> &pageTexts) {
    for (const auto &text : pageTexts) {
      std::vector<TextSpan> spans;
      if (!text.empty()) {
        spans.push_back(makeSpan(text));
      }
      pages.push_back(spans);
    }
  }

  int pageCount() const override {
    if (unreadable) {
      return -1;
    }
    return static_cast<int>(pages.size());
  }

  bool textSpans(int page, std::vector<TextSpan> &spans) override {
    textSpansCalls++;
    if (sleepPerPageMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(sleepPerPageMs));
    }
    if (page == throwOnPage) {
      throw std::runtime_error("content stream damaged");
    }
    if (page == failReadPage) {
      return false;
    }
    spans = pages[static_cast<size_t>(page)];
    return true;
  }

  bool needsPassword() const override { return encrypted; }

  bool stampAndApply(int page,
                     const std::vector<RedactionRectangle> &rects) override {
    if (page == failStampPage) {
      return false;
    }
    stampedPages.push_back(page);
    stamped.insert(stamped.end(), rects.begin(), rects.end());
    if (cancelOnStamp) {
      cancelOnStamp->store(true);
    }
    return true;
  }

  bool saveAs(const std::string &path) override {
    saveCalls++;
    std::ofstream out(path);
    out << "%PDF-stub\n";
    if (failSave) {
      // Leave a truncated file behind as a real writer might
      return false;
    }
    for (const auto &rect : stamped) {
      out << rect.pageNumber << " " << rect.replacementText << "\n";
    }
    return static_cast<bool>(out);
  }

  std::vector<std::vector<TextSpan>> pages;
  bool unreadable = false;
  bool encrypted = false;
  bool failSave = false;
  int failReadPage = -1;
  int throwOnPage = -1;
  int failStampPage = -1;
  int sleepPerPageMs = 0;
  std::atomic<bool> *cancelOnStamp = nullptr;

  int textSpansCalls = 0;
  int saveCalls = 0;
  std::vector<int> stampedPages;
  std::vector<RedactionRectangle> stamped;
};

/**
 * @brief Fresh scratch directory below the system temp directory
 */
inline std::filesystem::path scratchDirectory(const std::string &name) {
  std::filesystem::path dir = std::filesystem::temp_directory_path() / name;
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir);
  return dir;
}

} // namespace test
} // namespace redact

#endif // REDACT_TEST_SUPPORT_HPP
