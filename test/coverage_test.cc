#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "coverage.h"
#include "fake_font.h"

using fontsieve::category_bucket;
using fontsieve::range_set;
using fontsieve_test::fake_font;

TEST_CASE("Coverage of a small Latin font", "[coverage]") {
    fontsieve::config conf;
    fake_font font;
    font.addChars("ABC12");

    auto r = fontsieve::checkCoverage(font, "abc.ttf",
                                      range_set::parse("U+0041-0043,U+0030-0039"),
                                      conf);
    CHECK(r.font == "abc.ttf");
    CHECK_FALSE(r.emptyRequest);
    CHECK(r.requestedTotal == 13);
    CHECK(r.coveredTotal == 5);
    CHECK(r.missingTotal == 8);
    CHECK(r.coveragePercent == Approx(38.46));
    CHECK(r.fontCmapSize == 5);

    auto &cv = r.covered[category_bucket::visible];
    CHECK(cv.count == 5);
    CHECK(cv.all == std::vector<std::string>{
        "U+0031: DIGIT ONE", "U+0032: DIGIT TWO",
        "U+0041: LATIN CAPITAL LETTER A", "U+0042: LATIN CAPITAL LETTER B",
        "U+0043: LATIN CAPITAL LETTER C"});
    auto &mv = r.missing[category_bucket::visible];
    CHECK(mv.count == 8);
    CHECK(mv.sample.front() == "U+0030: DIGIT ZERO");
    CHECK(mv.sample.back() == "U+0039: DIGIT NINE");
    CHECK(r.missing[category_bucket::combining].count == 0);
    CHECK(r.missing[category_bucket::control_or_format].count == 0);
}

TEST_CASE("Full coverage is exactly 100 percent", "[coverage]") {
    fontsieve::config conf;
    fake_font font;
    font.addChars("ABCDEF");

    auto r = fontsieve::checkCoverage(font, "f.ttf",
                                      range_set::parse("U+0041-0046"), conf);
    CHECK(r.missingTotal == 0);
    CHECK(r.coveragePercent == 100.0);

    auto r2 = fontsieve::checkCoverage(font, "f.ttf",
                                       range_set::parse("U+0041-0047"), conf);
    CHECK(r2.missingTotal == 1);
    CHECK(r2.coveragePercent < 100.0);
}

TEST_CASE("Every requested codepoint lands in exactly one bucket", "[coverage]") {
    fontsieve::config conf;
    fake_font font;
    font.addChars("Hello, World");
    font.addChar(0x0301);

    auto r = fontsieve::checkCoverage(font, "f.ttf",
                                      range_set::parse("U+0000-00FF, U+0300-036F"),
                                      conf);
    uint64_t covered = 0, missing = 0;
    for (auto &[b, s]: r.covered) {
        covered += s.count;
        CHECK(s.all.size() == s.count);
        CHECK(s.sample.size() == std::min<size_t>(s.count, 20));
    }
    for (auto &[b, s]: r.missing)
        missing += s.count;
    CHECK(covered == r.coveredTotal);
    CHECK(missing == r.missingTotal);
    CHECK(r.requestedTotal == 256 + 0x70);
    CHECK(r.covered[category_bucket::combining].all ==
          std::vector<std::string>{"U+0301: COMBINING ACUTE ACCENT"});
    CHECK(r.missing[category_bucket::combining].count == 0x70 - 1);
}

TEST_CASE("Latin-1 control characters are bucketed apart", "[coverage]") {
    fontsieve::config conf;
    fake_font font;

    auto r = fontsieve::checkCoverage(font, "f.ttf",
                                      range_set::parse("U+0000-00FF"), conf);
    auto &ctl = r.missing[category_bucket::control_or_format];
    // C0, DEL plus C1, and the soft hyphen
    CHECK(ctl.count == 32 + 33 + 1);
    CHECK(ctl.sample.size() == 20);
    CHECK(ctl.all.size() == ctl.count);
    // controls have no character name
    CHECK(ctl.sample.front() == "U+0000: <UNASSIGNED>");
    CHECK(ctl.all.back() == "U+00AD: SOFT HYPHEN");
    CHECK(r.missing[category_bucket::visible].count == 256 - 66);
    CHECK(r.coveragePercent == 0.0);
}

TEST_CASE("Empty request is reported, not failed", "[coverage]") {
    fontsieve::config conf;
    fake_font font;
    font.addChars("ABC");

    auto r = fontsieve::checkCoverage(font, "f.ttf", range_set::parse("nonsense"),
                                      conf);
    CHECK(r.emptyRequest);
    CHECK(r.requestedTotal == 0);
    CHECK(r.coveredTotal == 0);
    CHECK(r.coveragePercent == 0.0);
    CHECK(r.fontCmapSize == 3);
    CHECK(r.covered.size() == 3);
}

TEST_CASE("Percent rounds to two decimals", "[coverage]") {
    CHECK(fontsieve::round2(100.0 * 1 / 3) == Approx(33.33));
    CHECK(fontsieve::round2(100.0 * 2 / 3) == Approx(66.67));
    CHECK(fontsieve::coveragePercent(5, 13) == Approx(38.46));
    CHECK(fontsieve::coveragePercent(0, 0) == 0.0);
    CHECK(fontsieve::coveragePercent(7, 7) == 100.0);
}

TEST_CASE("A single missing codepoint never rounds up to 100", "[coverage]") {
    CHECK(fontsieve::coveragePercent(99999, 100000) == Approx(99.99));
    CHECK(fontsieve::coveragePercent(0x10FFFF, 0x110000) < 100.0);
    CHECK(fontsieve::coveragePercent(99989, 100000) == Approx(99.99));
    CHECK(fontsieve::coveragePercent(9998, 10000) == Approx(99.98));
}

TEST_CASE("Character names", "[coverage]") {
    CHECK(fontsieve::characterName(0x41) == "LATIN CAPITAL LETTER A");
    CHECK(fontsieve::characterName(0x4E00) == "CJK UNIFIED IDEOGRAPH-4E00");
    CHECK(fontsieve::characterName(0x1F600) == "GRINNING FACE");
    CHECK(fontsieve::characterName(0x0378) == "<UNASSIGNED>");
    CHECK(fontsieve::characterName(0xE000) == "<UNASSIGNED>");
    CHECK(fontsieve::describeCodepoint(0xE9) ==
          "U+00E9: LATIN SMALL LETTER E WITH ACUTE");
}
