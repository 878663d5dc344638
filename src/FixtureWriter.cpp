#include "FixtureWriter.hpp"

#include <filesystem>
#include <fstream>
#include <random>

#include <cairo-pdf.h>
#include <cairo.h>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

namespace redact {

namespace {

constexpr double kPi = 3.14159265358979323846;

/**
 * @brief Maps the upright view of a page with the given /Rotate onto the
 * unrotated page
 */
void applyViewTransform(cairo_t *cr, int rotate) {
  const double w = FixtureWriter::kPageWidth;
  const double h = FixtureWriter::kPageHeight;
  switch (rotate) {
  case 90:
    cairo_translate(cr, 0, h);
    cairo_rotate(cr, -kPi / 2.0);
    break;
  case 180:
    cairo_translate(cr, w, h);
    cairo_rotate(cr, kPi);
    break;
  case 270:
    cairo_translate(cr, w, 0);
    cairo_rotate(cr, kPi / 2.0);
    break;
  default:
    break;
  }
}

/**
 * @brief Rewrite @p path with /Rotate set on every rotated page
 */
bool setPageRotation(const std::string &path,
                     const std::vector<FixturePage> &pages,
                     std::string &errorMessage) {
  std::string rotatedPath = path + ".rotated";
  try {
    QPDF pdf;
    pdf.processFile(path.c_str());
    std::vector<QPDFPageObjectHelper> pdfPages =
        QPDFPageDocumentHelper(pdf).getAllPages();
    if (pdfPages.size() != pages.size()) {
      errorMessage = "Unexpected page count in " + path;
      return false;
    }
    for (size_t i = 0; i < pages.size(); ++i) {
      if (pages[i].rotate != 0) {
        pdfPages[i].getObjectHandle().replaceKey(
            "/Rotate", QPDFObjectHandle::newInteger(pages[i].rotate));
      }
    }
    QPDFWriter writer(pdf, rotatedPath.c_str());
    writer.write();
  } catch (const std::exception &e) {
    errorMessage = std::string("Failed to rotate pages of ") + path + ": " +
                   e.what();
    std::error_code removeError;
    std::filesystem::remove(rotatedPath, removeError);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(rotatedPath, path, ec);
  if (ec) {
    errorMessage = "Failed to replace " + path + ": " + ec.message();
    return false;
  }
  return true;
}

} // anonymous namespace

constexpr double FixtureWriter::kPageWidth;
constexpr double FixtureWriter::kPageHeight;

bool FixtureWriter::writePdf(const std::string &path,
                             const std::vector<FixturePage> &pages,
                             std::string &errorMessage) {
  if (pages.empty()) {
    errorMessage = "A PDF needs at least one page";
    return false;
  }
  bool rotated = false;
  for (const auto &page : pages) {
    if (page.rotate % 90 != 0 || page.rotate < 0 || page.rotate >= 360) {
      errorMessage = "Unsupported page rotation: " + std::to_string(page.rotate);
      return false;
    }
    rotated = rotated || page.rotate != 0;
  }

  std::error_code ec;
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }

  cairo_surface_t *surface =
      cairo_pdf_surface_create(path.c_str(), kPageWidth, kPageHeight);
  if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
    errorMessage = "Failed to create PDF surface: " + path;
    cairo_surface_destroy(surface);
    return false;
  }

  cairo_t *cr = cairo_create(surface);

  for (const auto &page : pages) {
    // White background
    cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
    cairo_paint(cr);

    cairo_save(cr);
    applyViewTransform(cr, page.rotate);

    if (page.drawImageBlock) {
      // 5x6 inch grey block standing in for a scanned image
      cairo_set_source_rgb(cr, 0.8, 0.8, 0.8);
      cairo_rectangle(cr, 72, 144, 360, 432);
      cairo_fill(cr);
    }

    cairo_set_source_rgb(cr, 0.0, 0.0, 0.0);
    for (const auto &line : page.lines) {
      cairo_select_font_face(cr, line.fontFamily.c_str(),
                             CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
      cairo_set_font_size(cr, line.fontSize);
      cairo_move_to(cr, line.x, line.y);
      cairo_show_text(cr, line.text.c_str());
    }

    cairo_restore(cr);
    cairo_show_page(cr);
  }

  cairo_status_t drawStatus = cairo_status(cr);
  cairo_destroy(cr);
  cairo_surface_finish(surface);
  cairo_status_t surfaceStatus = cairo_surface_status(surface);
  cairo_surface_destroy(surface);

  if (drawStatus != CAIRO_STATUS_SUCCESS ||
      surfaceStatus != CAIRO_STATUS_SUCCESS) {
    errorMessage = std::string("Failed to write PDF ") + path + ": " +
                   cairo_status_to_string(drawStatus != CAIRO_STATUS_SUCCESS
                                              ? drawStatus
                                              : surfaceStatus);
    return false;
  }

  return !rotated || setPageRotation(path, pages, errorMessage);
}

bool FixtureWriter::writeCorrupt(const std::string &path,
                                 std::string &errorMessage) {
  std::error_code ec;
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }

  std::ofstream out(path, std::ios::binary);
  if (!out) {
    errorMessage = "Failed to open " + path;
    return false;
  }
  out << "This is not a valid PDF file content";
  return static_cast<bool>(out);
}

std::vector<FixturePage>
FixtureWriter::simplePages(const std::vector<std::string> &texts,
                           bool drawImageBlock) {
  std::vector<FixturePage> pages;
  for (size_t i = 0; i < texts.size(); ++i) {
    FixturePage page;
    page.lines.push_back({72.0, 72.0, "Page " + std::to_string(i + 1), 12.0});
    page.lines.push_back({72.0, 90.0, texts[i], 12.0});
    page.drawImageBlock = drawImageBlock;
    pages.push_back(page);
  }
  return pages;
}

std::string FixtureWriter::randomText(size_t length, unsigned int seed) {
  static const std::string alphabet =
      "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ ";
  std::mt19937 rng(seed);
  std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);

  std::string text;
  text.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    text.push_back(alphabet[pick(rng)]);
  }
  return text;
}

std::vector<FixtureCase> FixtureWriter::corpus() {
  std::vector<FixtureCase> cases;

  {
    FixtureCase c;
    c.directory = "clean";
    c.fileName = "clean-single-page.pdf";
    c.pages = simplePages({randomText(80, 1)});
    cases.push_back(c);
  }
  {
    FixtureCase c;
    c.directory = "happy-path";
    c.fileName = "simple-pii.pdf";
    c.pages =
        simplePages({"Contact us at help@example.com and SSN 123-45-6789"});
    c.emails = {"help@example.com"};
    c.ssns = {"123-45-6789"};
    cases.push_back(c);
  }
  {
    std::vector<std::string> texts;
    for (unsigned int i = 0; i < 7; ++i) {
      texts.push_back(randomText(80, 100 + i));
    }
    texts[2] = "Reach bob@company.org for details.";
    texts[6] = "Employee SSN is 987-65-4321.";

    FixtureCase c;
    c.directory = "multipage";
    c.fileName = "multipage-pii.pdf";
    c.pages = simplePages(texts);
    c.emails = {"bob@company.org"};
    c.ssns = {"987-65-4321"};
    cases.push_back(c);
  }
  {
    FixtureCase c;
    c.directory = "ssn-nodash";
    c.fileName = "ssn-nodash.pdf";
    c.pages = simplePages({"Alternate SSN format 111223333"});
    c.ssns = {"111223333"};
    cases.push_back(c);
  }
  {
    FixtureCase c;
    c.directory = "email-edgecases";
    c.fileName = "email-edgecases.pdf";
    c.pages = simplePages({"Contact first.last+alias@sub.domain.co.uk ASAP"});
    c.emails = {"first.last+alias@sub.domain.co.uk"};
    cases.push_back(c);
  }
  {
    std::vector<std::string> texts = {"Oversize doc with foo@bar.com on page 1"};
    for (unsigned int i = 0; i < 99; ++i) {
      texts.push_back(randomText(80, 1000 + i));
    }

    FixtureCase c;
    c.directory = "oversize";
    c.fileName = "oversize-pii.pdf";
    c.pages = simplePages(texts);
    c.emails = {"foo@bar.com"};
    cases.push_back(c);
  }
  {
    FixtureCase c;
    c.directory = "corrupt";
    c.fileName = "corrupt.pdf";
    c.corrupt = true;
    c.expectFailure = true;
    cases.push_back(c);
  }
  {
    FixtureCase c;
    c.directory = "scanned-image";
    c.fileName = "scanned-image.pdf";
    c.pages = simplePages({"Scanned page placeholder"}, true);
    cases.push_back(c);
  }
  {
    FixtureCase c;
    c.directory = "false-positive";
    c.fileName = "false-positive-bait.pdf";
    c.pages = simplePages({"Part number 123-45-678, not SSN"});
    cases.push_back(c);
  }
  {
    FixtureCase c;
    c.directory = "multi-pii";
    c.fileName = "multi-pii.pdf";
    c.pages = simplePages({"Contact: john.doe@company.com", "SSN: 555-12-3456",
                           "Email: jane.smith@example.org",
                           "SSN: 987-65-4321"});
    c.emails = {"john.doe@company.com", "jane.smith@example.org"};
    c.ssns = {"555-12-3456", "987-65-4321"};
    cases.push_back(c);
  }
  {
    FixtureCase c;
    c.directory = "complex-email";
    c.fileName = "complex-email.pdf";
    c.pages = simplePages(
        {"Emails: test@domain.com, user+tag@subdomain.org, admin@company.co.uk"});
    c.emails = {"test@domain.com", "user+tag@subdomain.org",
                "admin@company.co.uk"};
    cases.push_back(c);
  }
  {
    // Portrait page shown as landscape; the second line lies beyond the
    // portrait width
    FixturePage page;
    page.rotate = 90;
    page.lines.push_back({72.0, 72.0, "Page 1", 12.0});
    page.lines.push_back(
        {72.0, 90.0, "Landscape ledger, contact help@example.com", 12.0});
    page.lines.push_back({520.0, 300.0, "Archive ops@example.org", 12.0});

    FixtureCase c;
    c.directory = "rotated";
    c.fileName = "rotated-landscape.pdf";
    c.pages = {page};
    c.emails = {"help@example.com", "ops@example.org"};
    cases.push_back(c);
  }

  return cases;
}

int FixtureWriter::writeCorpus(const std::string &baseDir,
                               std::string &errorMessage) {
  int written = 0;
  for (const auto &c : corpus()) {
    std::string path =
        (std::filesystem::path(baseDir) / c.directory / c.fileName).string();
    bool ok = c.corrupt ? writeCorrupt(path, errorMessage)
                        : writePdf(path, c.pages, errorMessage);
    if (!ok) {
      return -1;
    }
    written++;
  }
  return written;
}

} // namespace redact
