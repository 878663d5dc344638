#include "FixtureWriter.hpp"
#include "PopplerDocument.hpp"
#include "RedactionEngine.hpp"
#include "TestSupport.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>

#include <poppler-document.h>
#include <poppler-page.h>

using redact::ErrorKind;
using redact::FixtureCase;
using redact::FixtureWriter;
using redact::PIIType;
using redact::PopplerDocument;
using redact::RedactionEngine;

namespace fs = std::filesystem;

namespace {

const FixtureCase *findCase(const std::vector<FixtureCase> &cases,
                            const std::string &directory) {
  for (const auto &c : cases) {
    if (c.directory == directory) {
      return &c;
    }
  }
  return nullptr;
}

std::vector<std::string> texts(const redact::DetectResult &detection,
                               PIIType type) {
  std::vector<std::string> out;
  for (const auto &m : detection.matches) {
    if (m.type == type) {
      out.push_back(m.text);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::string> sorted(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  return values;
}

/// All text Poppler can extract from the document
std::string allText(PopplerDocument &document) {
  std::string text;
  for (int page = 0; page < document.pageCount(); ++page) {
    std::vector<redact::TextSpan> spans;
    if (document.textSpans(page, spans)) {
      for (const auto &span : spans) {
        text += span.text + "\n";
      }
    }
  }
  return text;
}

/// Span texts of one page, empty if the page cannot be read
std::vector<std::string> pageLines(PopplerDocument &document, int page) {
  std::vector<std::string> lines;
  std::vector<redact::TextSpan> spans;
  if (document.textSpans(page, spans)) {
    for (const auto &span : spans) {
      lines.push_back(span.text);
    }
  }
  return lines;
}

} // namespace

int main(int argc, char *argv[]) {
  std::cout << "=== Test PDF redaction round trip ===" << std::endl;
  redact::test::Checker checker;

  fs::path workDir = argc > 1 ? fs::path(argv[1])
                              : redact::test::scratchDirectory(
                                    "redact_pdf_test");
  std::string errorMessage;
  int written = FixtureWriter::writeCorpus(workDir.string(), errorMessage);
  checker.check(written > 0, "fixture corpus written");
  if (written <= 0) {
    std::cerr << "Fixture error: " << errorMessage << std::endl;
    return checker.finish();
  }

  const std::vector<FixtureCase> cases = FixtureWriter::corpus();
  RedactionEngine engine(redact::PatternLibrary::defaultLibrary());

  auto pathOf = [&workDir](const FixtureCase &c) {
    return (workDir / c.directory / c.fileName).string();
  };

  checker.section("Detection over the corpus");
  for (const auto &c : cases) {
    if (c.corrupt) {
      continue;
    }
    PopplerDocument document(pathOf(c));
    auto detection = engine.detect(document);
    checker.check(detection.success, c.directory + ": detection succeeds");
    checker.check(detection.metadata.totalPages ==
                      static_cast<int>(c.pages.size()),
                  c.directory + ": page count");
    checker.check(texts(detection, PIIType::Email) == sorted(c.emails),
                  c.directory + ": expected emails");
    checker.check(texts(detection, PIIType::SSN) == sorted(c.ssns),
                  c.directory + ": expected ssns");
    checker.check(detection.metadata.unmappedMatches == 0,
                  c.directory + ": every match located");
  }

  checker.section("Corrupt input");
  {
    const FixtureCase *corrupt = findCase(cases, "corrupt");
    PopplerDocument document(pathOf(*corrupt));
    auto detection = engine.detect(document);
    checker.check(!document.isLoaded(), "not loaded");
    checker.check(!detection.success &&
                      detection.error == ErrorKind::DocumentUnreadable,
                  "DocumentUnreadable");
  }

  checker.section("Match positions");
  {
    const FixtureCase *multipage = findCase(cases, "multipage");
    PopplerDocument document(pathOf(*multipage));
    auto detection = engine.detect(document);
    bool pagesOk = detection.matches.size() == 2;
    for (const auto &m : detection.matches) {
      if (m.type == PIIType::Email) {
        pagesOk = pagesOk && m.pageNumber == 2;
      } else {
        pagesOk = pagesOk && m.pageNumber == 6;
      }
    }
    checker.check(pagesOk, "email on page index 2, ssn on page index 6");

    bool onPage = !detection.matches.empty();
    for (const auto &m : detection.matches) {
      // Content line baseline is 90 pt from the top of an A4 page
      onPage = onPage && m.bbox.x0 >= 72.0 - 1.0 && m.bbox.y0 < 90.0 &&
               m.bbox.y1 > 80.0 && m.bbox.x1 < FixtureWriter::kPageWidth;
    }
    checker.check(onPage, "bboxes sit on the content line");
  }

  checker.section("Redaction removes the literals");
  for (const char *name : {"happy-path", "multipage", "multi-pii",
                           "complex-email", "ssn-nodash", "rotated"}) {
    const FixtureCase *c = findCase(cases, name);
    std::string source = pathOf(*c);
    std::string output =
        (workDir / c->directory / ("redacted-" + c->fileName)).string();
    auto sourceSize = fs::file_size(source);

    PopplerDocument document(source);
    auto detection = engine.detect(document);
    auto redaction = engine.redact(document, detection, output);
    checker.check(redaction.success, std::string(name) + ": redaction succeeds");
    checker.check(redaction.outputPath == output && fs::exists(output),
                  std::string(name) + ": artifact written");
    checker.check(document.isClosed(), std::string(name) + ": handle closed");
    checker.check(fs::file_size(source) == sourceSize,
                  std::string(name) + ": source untouched");
    checker.check(redaction.summary.totalRedactions ==
                      static_cast<int>(c->emails.size() + c->ssns.size()),
                  std::string(name) + ": summary counts every literal");

    PopplerDocument redacted(output);
    auto again = engine.detect(redacted);
    checker.check(again.success && again.matches.empty(),
                  std::string(name) + ": no PII detected after redaction");
    checker.check(again.metadata.totalPages ==
                      static_cast<int>(c->pages.size()),
                  std::string(name) + ": page count preserved");

    std::string remaining = allText(redacted);
    bool literalsGone = true;
    for (const auto &literal : c->emails) {
      literalsGone = literalsGone && remaining.find(literal) == std::string::npos;
    }
    for (const auto &literal : c->ssns) {
      literalsGone = literalsGone && remaining.find(literal) == std::string::npos;
    }
    checker.check(literalsGone,
                  std::string(name) + ": literals absent from extracted text");
    checker.check(c->emails.empty() ||
                      remaining.find("[EMAIL REDACTED]") != std::string::npos,
                  std::string(name) + ": label stamped");
  }

  checker.section("Text outside redactions survives");
  {
    const FixtureCase *c = findCase(cases, "happy-path");
    PopplerDocument redacted(
        (workDir / c->directory / ("redacted-" + c->fileName)).string());
    std::string remaining = allText(redacted);
    checker.check(remaining.find("Contact us at") != std::string::npos,
                  "text before the email still extractable");
    checker.check(remaining.find("Page 1") != std::string::npos,
                  "header line of the redacted page still extractable");
    checker.check(remaining.find("and SSN") != std::string::npos,
                  "text between the redactions still extractable");
  }
  {
    const FixtureCase *c = findCase(cases, "multipage");
    PopplerDocument source(pathOf(*c));
    PopplerDocument redacted(
        (workDir / c->directory / ("redacted-" + c->fileName)).string());
    bool cleanPagesEqual = true;
    for (int page : {0, 1, 3, 4, 5}) {
      std::vector<std::string> before = pageLines(source, page);
      cleanPagesEqual = cleanPagesEqual && !before.empty() &&
                        before == pageLines(redacted, page);
    }
    checker.check(cleanPagesEqual, "pages without PII copied unchanged");

    std::vector<std::string> rebuilt = pageLines(redacted, 2);
    bool readable = false;
    for (const auto &line : rebuilt) {
      readable = readable || line.find("for details.") != std::string::npos;
    }
    checker.check(readable, "rebuilt page keeps its other text");
  }

  checker.section("Rotated pages");
  {
    const FixtureCase *c = findCase(cases, "rotated");
    std::string output =
        (workDir / c->directory / ("redacted-" + c->fileName)).string();

    std::unique_ptr<poppler::document> source(
        poppler::document::load_from_file(pathOf(*c)));
    std::unique_ptr<poppler::document> redacted(
        poppler::document::load_from_file(output));
    checker.check(source && redacted, "both documents load");
    if (source && redacted) {
      std::unique_ptr<poppler::page> before(source->create_page(0));
      std::unique_ptr<poppler::page> after(redacted->create_page(0));
      checker.check(before && before->orientation() ==
                                  poppler::page::landscape,
                    "source page is shown as landscape");
      poppler::rectf box = after ? after->page_rect() : poppler::rectf();
      checker.check(after && after->orientation() == poppler::page::portrait &&
                        std::abs(box.width() - FixtureWriter::kPageHeight) < 2.0 &&
                        std::abs(box.height() - FixtureWriter::kPageWidth) < 2.0,
                    "rebuilt page is upright with landscape dimensions");
    }

    PopplerDocument document(output);
    std::string remaining = allText(document);
    checker.check(remaining.find("Archive") != std::string::npos &&
                      remaining.find("Landscape ledger") != std::string::npos,
                  "text beyond the portrait width kept");
  }

  checker.section("Documents without PII");
  for (const char *name : {"clean", "scanned-image", "false-positive"}) {
    const FixtureCase *c = findCase(cases, name);
    std::string output =
        (workDir / c->directory / ("redacted-" + c->fileName)).string();
    PopplerDocument document(pathOf(*c));
    auto detection = engine.detect(document);
    auto redaction = engine.redact(document, detection, output);
    checker.check(redaction.success && redaction.outputPath.empty() &&
                      !fs::exists(output),
                  std::string(name) + ": no-op without artifact");
  }

  checker.section("Source is never overwritten");
  {
    const FixtureCase *c = findCase(cases, "happy-path");
    std::string source =
        (workDir / c->directory / ("copy-" + c->fileName)).string();
    fs::copy_file(pathOf(*c), source, fs::copy_options::overwrite_existing);

    PopplerDocument document(source);
    auto detection = engine.detect(document);
    auto redaction = engine.redact(document, detection, source);
    checker.check(redaction.error == ErrorKind::SaveFailure,
                  "saving over the source fails");
    checker.check(fs::exists(source), "source still present");

    PopplerDocument reopened(source);
    auto again = engine.detect(reopened);
    checker.check(again.success && again.matches.size() == 2,
                  "source still holds its PII");
  }

  if (argc <= 1) {
    std::error_code ec;
    fs::remove_all(workDir, ec);
  }

  return checker.finish();
}
