#include "FixtureWriter.hpp"

#include <iostream>

int main(int argc, char *argv[]) {
  if (argc < 2 || std::string(argv[1]) == "-h" ||
      std::string(argv[1]) == "--help") {
    std::cout << "Usage: " << argv[0] << " <output_dir>\n"
              << "\nWrites the PDF test corpus into <output_dir>/<case>/.\n";
    return argc < 2 ? 1 : 0;
  }

  std::string outputDir = argv[1];
  std::string errorMessage;

  std::cout << "=== Fixture Generator ===\n";
  for (const auto &fixture : redact::FixtureWriter::corpus()) {
    std::cout << "  " << fixture.directory << "/" << fixture.fileName << " ("
              << (fixture.corrupt ? std::string("corrupt")
                                  : std::to_string(fixture.pages.size()) +
                                        " page(s)")
              << ")\n";
  }

  int written = redact::FixtureWriter::writeCorpus(outputDir, errorMessage);
  if (written < 0) {
    std::cerr << "Error: " << errorMessage << "\n";
    return 1;
  }

  std::cout << "Wrote " << written << " file(s) to " << outputDir << "\n";
  return 0;
}
