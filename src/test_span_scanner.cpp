#include "SpanScanner.hpp"
#include "TestSupport.hpp"

#include <iostream>

using redact::PIIType;
using redact::RawMatch;
using redact::SpanScanner;
using redact::TextSpan;

int main() {
  std::cout << "=== Test SpanScanner ===" << std::endl;
  redact::test::Checker checker;

  SpanScanner scanner(redact::PatternLibrary::defaultLibrary());

  checker.section("Scenario: email and ssn on one line");
  {
    TextSpan span = redact::test::makeSpan(
        "Contact us at help@example.com and SSN 123-45-6789");
    span.pageNumber = 4;
    std::vector<RawMatch> matches = scanner.scanSpan(span, 3);

    checker.check(matches.size() == 2, "two raw matches");
    if (matches.size() == 2) {
      checker.check(matches[0].type == PIIType::Email &&
                        matches[0].text == "help@example.com",
                    "email found first");
      checker.check(matches[0].charStart == 14 && matches[0].charEnd == 30,
                    "email offsets are [14, 30)");
      checker.check(matches[1].type == PIIType::SSN &&
                        matches[1].text == "123-45-6789",
                    "ssn found second");
      checker.check(matches[1].charStart == 39 && matches[1].charEnd == 50,
                    "ssn offsets are [39, 50)");
      checker.check(matches[1].contextFiltered && !matches[0].contextFiltered,
                    "filter flag copied from the type rule");
      checker.check(matches[0].pageNumber == 4 && matches[0].spanIndex == 3,
                    "page and span index recorded");
      checker.check(matches[0].confidence == 1.0 &&
                        matches[1].confidence == 0.95,
                    "base confidences attached");
    }
  }

  checker.section("Phone and card shapes");
  {
    std::vector<RawMatch> matches = scanner.scanSpan(
        redact::test::makeSpan("Tel (555) 123-4567 or 555-987-6543"));
    int phones = 0;
    for (const auto &m : matches) {
      if (m.type == PIIType::Phone) {
        phones++;
      }
    }
    checker.check(phones == 2, "both phone shapes found");
    checker.check(matches.size() == 2, "no other types reported");
  }
  {
    std::vector<RawMatch> matches =
        scanner.scanSpan(redact::test::makeSpan("Card 4111 1111 1111 1111"));
    checker.check(matches.size() == 2,
                  "overlapping card patterns both report the hit");
    checker.check(!matches.empty() && matches[0].type == PIIType::CreditCard,
                  "card typed as credit_card");
  }

  checker.section("Context window");
  {
    std::string text = "0123456789abcdefghij a@b.com klmnopqrstuvwxyz0123";
    std::vector<RawMatch> matches =
        SpanScanner(redact::PatternLibrary::defaultLibrary(), 5)
            .scanSpan(redact::test::makeSpan(text));
    checker.check(matches.size() == 1 && matches[0].context == "ghij a@b.com klmn",
                  "context clipped to five characters either side");
  }
  checker.check(SpanScanner::contextWindow("a@b.com", 0, 7, 20) == "a@b.com",
                "context clipped at span edges");

  checker.section("UTF-8 offsets");
  {
    std::vector<RawMatch> matches =
        SpanScanner(redact::PatternLibrary::defaultLibrary(), 5)
            .scanSpan(redact::test::makeSpan("Cr\xC3\xA8me br\xC3\xBBl\xC3\xA9"
                                             "e a@b.com"));
    checker.check(matches.size() == 1, "email after accented text");
    if (matches.size() == 1) {
      checker.check(matches[0].charStart == 13 && matches[0].charEnd == 20,
                    "offsets counted in code points");
      checker.check(matches[0].context ==
                        "\xC3\xBBl\xC3\xA9"
                        "e a@b.com",
                    "context never splits a multi-byte character");
    }
  }

  checker.section("Span sequence");
  {
    std::vector<TextSpan> spans;
    spans.push_back(redact::test::makeSpan("nothing to see here"));
    spans.push_back(redact::test::makeSpan(""));
    spans.push_back(redact::test::makeSpan("mail bob@company.org"));
    spans[2].pageNumber = 2;
    std::vector<RawMatch> matches = scanner.scan(spans);
    checker.check(matches.size() == 1, "one match over three spans");
    checker.check(!matches.empty() && matches[0].spanIndex == 2 &&
                      matches[0].pageNumber == 2,
                  "match points back to its span");
  }

  checker.section("Long spans");
  {
    std::string token(100000, 'a');
    TextSpan span = redact::test::makeSpan(token + " help@example.com");
    std::vector<RawMatch> matches = scanner.scanSpan(span);
    checker.check(matches.size() == 1 && matches[0].text == "help@example.com",
                  "email after a 100000 character token");
    checker.check(!matches.empty() && matches[0].charStart == 100001,
                  "offset counted from the start of the span");
  }
  {
    TextSpan span =
        redact::test::makeSpan(std::string(5000, 'a') + ",123-45-6789");
    std::vector<RawMatch> matches = scanner.scanSpan(span);
    checker.check(matches.size() == 1 && matches[0].type == PIIType::SSN &&
                      matches[0].charStart == 5001,
                  "ssn right after a long run");
  }
  {
    // Addresses every 37 bytes cross many window boundaries
    std::string text;
    std::vector<std::string> expected;
    for (int i = 0; i < 300; ++i) {
      std::string address = "user" + std::to_string(i) + "@example.com";
      text += "see " + address + " and more ";
      expected.push_back(address);
    }
    TextSpan span = redact::test::makeSpan(text);
    std::vector<RawMatch> matches = scanner.scanSpan(span);
    bool allFound = matches.size() == expected.size();
    for (size_t i = 0; allFound && i < matches.size(); ++i) {
      allFound = matches[i].text == expected[i] &&
                 text.substr(matches[i].charStart,
                             matches[i].charEnd - matches[i].charStart) ==
                     expected[i];
    }
    checker.check(allFound, "each address reported once, in order, at its offsets");
  }
  {
    std::string text = std::string(4000, 'x') + " 4111 1111 1111 1111 " +
                       std::string(4000, 'y');
    TextSpan span = redact::test::makeSpan(text);
    std::vector<RawMatch> matches = scanner.scanSpan(span);
    int cards = 0;
    for (const auto &m : matches) {
      if (m.type == PIIType::CreditCard && m.text == "4111 1111 1111 1111") {
        cards++;
      }
    }
    checker.check(cards == 2, "each card pattern reports the number once");
  }

  return checker.finish();
}
