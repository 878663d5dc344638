#include "RedactionEngine.hpp"
#include "TestSupport.hpp"

#include <atomic>
#include <filesystem>
#include <iostream>
#include <thread>

using redact::ErrorKind;
using redact::PIIType;
using redact::RedactionConfig;
using redact::RedactionEngine;
using redact::test::StubDocument;

namespace fs = std::filesystem;

int main() {
  std::cout << "=== Test RedactionEngine ===" << std::endl;
  redact::test::Checker checker;

  fs::path workDir = redact::test::scratchDirectory("redact_engine_test");
  const redact::PatternLibrary &library =
      redact::PatternLibrary::defaultLibrary();
  RedactionEngine engine(library);

  checker.section("Scenario: email and ssn on one page");
  {
    StubDocument document(
        {"Contact us at help@example.com and SSN 123-45-6789"});
    std::string output = (workDir / "scenario1.pdf").string();

    auto detection = engine.detect(document);
    checker.check(detection.success, "detection succeeds");
    checker.check(detection.matches.size() == 2, "two matches retained");
    if (detection.matches.size() == 2) {
      checker.check(detection.matches[0].type == PIIType::Email &&
                        detection.matches[0].text == "help@example.com",
                    "email match");
      checker.check(detection.matches[1].type == PIIType::SSN &&
                        detection.matches[1].text == "123-45-6789",
                    "ssn match");
      checker.check(detection.matches[0].bbox.x0 < detection.matches[1].bbox.x0,
                    "matches located left to right");
    }
    checker.check(detection.metadata.totalPages == 1 &&
                      detection.metadata.totalMatches == 2,
                  "metadata counts");

    auto redaction = engine.redact(document, detection, output);
    checker.check(redaction.success, "redaction succeeds");
    checker.check(redaction.outputPath == output && fs::exists(output),
                  "artifact written");
    checker.check(redaction.rectangles.size() == 2, "two rectangles");
    if (redaction.rectangles.size() == 2) {
      checker.check(redaction.rectangles[0].replacementText ==
                            "[EMAIL REDACTED]" &&
                        redaction.rectangles[1].replacementText ==
                            "[SSN REDACTED]",
                    "labels");
      checker.check(
          redaction.rectangles[0].bbox.contains(detection.matches[0].bbox) &&
              redaction.rectangles[1].bbox.contains(detection.matches[1].bbox),
          "rectangles contain their matches");
    }
    checker.check(redaction.summary.totalRedactions == 2 &&
                      redaction.summary.confidenceTiers.high == 2,
                  "summary");
    checker.check(document.stampedPages.size() == 1 && document.saveCalls == 1,
                  "one page stamped, one save");
  }

  checker.section("Scenario: part number bait");
  {
    StubDocument document({"Part number 123-45-678, not SSN"});
    auto detection = engine.detect(document);
    int ssns = 0;
    for (const auto &m : detection.matches) {
      if (m.type == PIIType::SSN) {
        ssns++;
      }
    }
    checker.check(detection.success && ssns == 0, "zero ssn matches");
  }
  {
    StubDocument document({"DOB 123-45-6789, Tel 555-123-4567"});
    auto detection = engine.detect(document);
    checker.check(detection.success && detection.matches.size() == 1 &&
                      detection.matches[0].type == PIIType::Phone,
                  "ssn near a blacklisted word dropped, phone kept");
  }

  checker.section("Scenario: seven pages, PII on the third");
  {
    std::vector<std::string> pages(7, "Lorem ipsum dolor sit amet");
    pages[2] = "Reach bob@company.org for details.";
    StubDocument document(pages);
    auto detection = engine.detect(document);
    checker.check(detection.success && detection.metadata.totalMatches == 1,
                  "one match");
    checker.check(detection.matches.size() == 1 &&
                      detection.matches[0].pageNumber == 2,
                  "page index 2");
    checker.check(detection.metadata.totalPages == 7, "seven pages");
  }

  checker.section("No PII");
  {
    StubDocument document({"Nothing sensitive", ""});
    std::string output = (workDir / "clean.pdf").string();
    auto detection = engine.detect(document);
    checker.check(detection.success && detection.matches.empty() &&
                      detection.metadata.totalMatches == 0,
                  "no matches");
    auto redaction = engine.redact(document, detection, output);
    checker.check(redaction.success && redaction.summary.totalRedactions == 0,
                  "redact is a successful no-op");
    checker.check(redaction.outputPath.empty() && !fs::exists(output) &&
                      document.saveCalls == 0,
                  "nothing written");
  }

  checker.section("Determinism and duplicates");
  {
    StubDocument document({"Card 4111 1111 1111 1111 and a@b.com",
                           "again A@B.com here"});
    auto first = engine.detect(document);
    auto second = engine.detect(document);
    checker.check(first.matches == second.matches, "same input, same matches");
    checker.check(first.matches.size() == 2,
                  "card patterns collapse and repeated email dropped");
  }

  checker.section("Unmapped matches");
  {
    StubDocument document({"x"});
    redact::TextSpan span;
    span.text = "mail bob@company.org";
    span.bbox = redact::BBox(72, 80, 72, 92);
    document.pages[0] = {span};

    auto detection = engine.detect(document);
    checker.check(detection.success && detection.matches.size() == 1 &&
                      !detection.matches[0].mapped,
                  "match kept but flagged unmapped");
    checker.check(detection.metadata.unmappedMatches == 1, "counted");
    auto redaction =
        engine.redact(document, detection, (workDir / "unmapped.pdf").string());
    checker.check(redaction.success && redaction.rectangles.empty() &&
                      redaction.summary.totalRedactions == 0,
                  "not redacted");
  }

  checker.section("Unreadable and encrypted documents");
  {
    StubDocument document({"a@b.com"});
    document.encrypted = true;
    auto detection = engine.detect(document);
    checker.check(!detection.success &&
                      detection.error == ErrorKind::DocumentEncrypted,
                  "encrypted");
    checker.check(document.textSpansCalls == 0, "no page read");
  }
  {
    StubDocument document({"a@b.com"});
    document.unreadable = true;
    auto detection = engine.detect(document);
    checker.check(detection.error == ErrorKind::DocumentUnreadable,
                  "unreadable document");
  }
  {
    StubDocument document({"a@b.com", "c@d.com"});
    document.failReadPage = 1;
    auto detection = engine.detect(document);
    checker.check(!detection.success &&
                      detection.error == ErrorKind::DocumentUnreadable &&
                      detection.matches.empty(),
                  "unreadable page aborts detection");
  }
  {
    StubDocument document({"a@b.com"});
    document.throwOnPage = 0;
    auto detection = engine.detect(document);
    checker.check(detection.error == ErrorKind::DocumentUnreadable,
                  "backend exception becomes DocumentUnreadable");
  }

  checker.section("Redaction failures");
  {
    StubDocument document({"a@b.com", "c@d.com"});
    document.failStampPage = 1;
    std::string output = (workDir / "stamp_failure.pdf").string();
    auto detection = engine.detect(document);
    auto redaction = engine.redact(document, detection, output);
    checker.check(!redaction.success &&
                      redaction.error == ErrorKind::RedactionApplyFailure,
                  "burn-in failure reported");
    checker.check(document.saveCalls == 0 && !fs::exists(output),
                  "nothing saved");
    checker.check(redaction.outputPath.empty() && redaction.rectangles.empty(),
                  "no partial result");
  }
  {
    StubDocument document({"a@b.com"});
    document.failSave = true;
    std::string output = (workDir / "save_failure.pdf").string();
    auto detection = engine.detect(document);
    auto redaction = engine.redact(document, detection, output);
    checker.check(redaction.error == ErrorKind::SaveFailure,
                  "save failure reported");
    checker.check(document.saveCalls == 1 && !fs::exists(output),
                  "partial file removed");
  }
  {
    StubDocument document({"a@b.com"});
    auto detection = engine.detect(document);
    auto redaction = engine.redact(document, detection, "");
    checker.check(redaction.error == ErrorKind::SaveFailure,
                  "empty output path rejected");
  }

  checker.section("Invalid state");
  {
    StubDocument document({"a@b.com"});
    redact::DetectResult failed;
    auto redaction =
        engine.redact(document, failed, (workDir / "invalid.pdf").string());
    checker.check(redaction.error == ErrorKind::InvalidState,
                  "failed detection cannot be redacted");
  }
  {
    StubDocument sevenPages(std::vector<std::string>(7, "a@b.com"));
    StubDocument onePage({"a@b.com"});
    auto detection = engine.detect(sevenPages);
    auto redaction =
        engine.redact(onePage, detection, (workDir / "mismatch.pdf").string());
    checker.check(redaction.error == ErrorKind::InvalidState &&
                      onePage.stampedPages.empty(),
                  "detection from another document rejected");
  }

  checker.section("Cancellation and timeout");
  {
    std::atomic<bool> cancel(true);
    StubDocument document({"a@b.com"});
    auto detection = engine.detect(document, &cancel);
    checker.check(detection.error == ErrorKind::Cancelled &&
                      document.textSpansCalls == 0,
                  "cancelled before the first page");
  }
  {
    std::atomic<bool> cancel(false);
    StubDocument document({"a@b.com", "c@d.com"});
    document.cancelOnStamp = &cancel;
    std::string output = (workDir / "cancelled.pdf").string();
    auto detection = engine.detect(document, &cancel);
    auto redaction = engine.redact(document, detection, output, &cancel);
    checker.check(redaction.error == ErrorKind::Cancelled,
                  "cancelled between pages");
    checker.check(document.saveCalls == 0 && !fs::exists(output),
                  "no artifact after cancellation");
  }
  {
    RedactionConfig config;
    config.timeoutMs = 1;
    RedactionEngine bounded(library, config);
    StubDocument document({"a@b.com", "c@d.com", "e@f.com"});
    document.sleepPerPageMs = 20;
    auto detection = bounded.detect(document);
    checker.check(detection.error == ErrorKind::TimedOut,
                  "deadline checked between pages");
    checker.check(document.textSpansCalls < 3, "remaining pages skipped");
  }
  {
    // One engine shared by two threads; only the cancelled call stops
    std::atomic<bool> cancel(true);
    StubDocument cancelledDoc(std::vector<std::string>(4, "a@b.com"));
    StubDocument runningDoc(std::vector<std::string>(4, "c@d.com"));
    cancelledDoc.sleepPerPageMs = 5;
    runningDoc.sleepPerPageMs = 5;

    redact::DetectResult cancelledResult;
    redact::DetectResult runningResult;
    std::thread first([&]() {
      cancelledResult = engine.detect(cancelledDoc, &cancel);
    });
    std::thread second([&]() { runningResult = engine.detect(runningDoc); });
    first.join();
    second.join();

    checker.check(cancelledResult.error == ErrorKind::Cancelled,
                  "flagged call cancelled");
    checker.check(runningResult.success &&
                      runningResult.metadata.totalPages == 4 &&
                      runningDoc.textSpansCalls == 4,
                  "concurrent call on the same engine unaffected");
  }

  checker.section("Long tokens");
  {
    StubDocument document({std::string(100000, 'a') + " help@example.com"});
    auto detection = engine.detect(document);
    checker.check(detection.success && detection.matches.size() == 1 &&
                      detection.matches[0].text == "help@example.com",
                  "100000 character token scanned without failure");
  }

  checker.section("Pipeline");
  {
    StubDocument document({"Write to help@example.com"});
    std::string output = (workDir / "pipeline.pdf").string();
    auto result = engine.process(document, output);
    checker.check(result.success() && result.redaction.rectangles.size() == 1,
                  "detect then redact");
  }
  {
    std::atomic<bool> cancel(true);
    StubDocument document({"a@b.com"});
    auto result =
        engine.process(document, (workDir / "p1.pdf").string(), &cancel);
    checker.check(result.detection.error == ErrorKind::Cancelled &&
                      document.saveCalls == 0,
                  "cancel flag reaches the pipeline");
  }
  {
    StubDocument document({"a@b.com"});
    document.encrypted = true;
    auto result = engine.process(document, (workDir / "p2.pdf").string());
    checker.check(!result.success() &&
                      result.detection.error == ErrorKind::DocumentEncrypted &&
                      document.saveCalls == 0,
                  "failed detection stops the pipeline");
  }

  std::error_code ec;
  fs::remove_all(workDir, ec);

  return checker.finish();
}
