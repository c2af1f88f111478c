#include <string>

#include <catch2/catch.hpp>

#include "classifier.h"
#include "fake_font.h"

using fontsieve_test::fake_font;

static const std::string code39 = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-. $/+%";

static void textRepertoire(fake_font &f) {
    uint32_t adv = 400;
    for (uint32_t cp = 0x20; cp <= 0x7E; cp++)
        f.addChar(cp, adv += 7);
}

TEST_CASE("Code 39 alphabet membership", "[classify]") {
    CHECK(code39.size() == 43);
    for (auto c: code39)
        CHECK(fontsieve::isCode39Char((unsigned char) c));
    CHECK_FALSE(fontsieve::isCode39Char('a'));
    CHECK_FALSE(fontsieve::isCode39Char('*'));
    CHECK_FALSE(fontsieve::isCode39Char(0));
    CHECK_FALSE(fontsieve::isCode39Char(0x100));
}

TEST_CASE("Uniform Code 39 font without x-height is a barcode", "[classify]") {
    fontsieve::config conf;
    fake_font f;
    f.addChars(code39, 600);
    f.xh = 0;

    auto c = fontsieve::classify(f, conf);
    CHECK(c.isBarcode);
    CHECK_FALSE(c.isEmoji);
    CHECK_FALSE(c.isSymbol);
    CHECK_FALSE(c.isNonTextual);
}

TEST_CASE("Tall boxes stand in for a missing x-height hint", "[classify]") {
    fontsieve::config conf;
    fake_font f;
    for (auto c: code39)
        f.addChar((unsigned char) c, 600, std::make_pair(-100, 800));
    f.xh = 500;
    CHECK(fontsieve::detectBarcode(f, conf));

    fake_font shortBoxes;
    shortBoxes.addChars(code39, 600);
    shortBoxes.xh = 500;
    CHECK_FALSE(fontsieve::detectBarcode(shortBoxes, conf));
}

TEST_CASE("Glyphs without outlines are left out of the box sample", "[classify]") {
    fontsieve::config conf;
    fake_font f;
    for (auto c: code39) {
        if (c == ' ')
            f.addChar(' ', 600, std::nullopt);
        else
            f.addChar((unsigned char) c, 600, std::make_pair(0, 900));
    }
    f.xh = 480;
    CHECK(fontsieve::detectBarcode(f, conf));
}

TEST_CASE("Varying advances rule out a barcode", "[classify]") {
    fontsieve::config conf;
    fake_font f;
    uint32_t adv = 500;
    for (auto c: code39)
        f.addChar((unsigned char) c, adv += 25);
    f.xh = 0;
    CHECK_FALSE(fontsieve::detectBarcode(f, conf));
}

TEST_CASE("Too few advances cannot show uniformity", "[classify]") {
    fontsieve::config conf;
    fake_font f;
    int n = 0;
    for (auto c: code39)
        f.addChar((unsigned char) c, n++ < 4 ? std::optional<uint32_t>(600)
                                              : std::nullopt);
    f.xh = 0;
    CHECK_FALSE(fontsieve::detectBarcode(f, conf));
}

TEST_CASE("Barcode names win on their own", "[classify]") {
    fontsieve::config conf;
    fake_font f;
    textRepertoire(f);
    f.names.emplace_back(1, 3, 1, "Libre Barcode 39");
    CHECK(fontsieve::classify(f, conf).isBarcode);

    fake_font mac;
    textRepertoire(mac);
    mac.names.emplace_back(4, 1, 0, "Free 3 of 9 CODE-128 Regular");
    CHECK(fontsieve::detectBarcode(mac, conf));

    fake_font other;
    textRepertoire(other);
    // only (3,1) and (1,0) records are consulted
    other.names.emplace_back(1, 0, 3, "Barcode");
    other.names.emplace_back(1, 3, 1, "Source Serif");
    CHECK_FALSE(fontsieve::detectBarcode(other, conf));
}

TEST_CASE("An ordinary text font is textual and not a barcode", "[classify]") {
    fontsieve::config conf;
    fake_font f;
    textRepertoire(f);
    f.names.emplace_back(1, 3, 1, "Source Serif");

    auto c = fontsieve::classify(f, conf);
    CHECK_FALSE(c.isBarcode);
    CHECK_FALSE(c.isNonTextual);
    CHECK_FALSE(c.isEmoji);
    CHECK_FALSE(c.isSymbol);
}

TEST_CASE("Color tables mark an emoji font", "[classify]") {
    fontsieve::config conf;
    for (auto t: {T_COLR, T_CBDT, T_SBIX, T_SVG}) {
        fake_font f;
        f.addChars(code39, 600);
        f.xh = 0;
        f.tableSet.insert(t);
        auto c = fontsieve::classify(f, conf);
        CHECK(c.isEmoji);
        // barcode detection is skipped for emoji fonts
        CHECK_FALSE(c.isBarcode);
    }

    fake_font pair;
    pair.tableSet.insert(T_COLR);
    pair.tableSet.insert(T_CPAL);
    pair.addChar(0x1F600);
    CHECK(fontsieve::classify(pair, conf).isEmoji);
}

TEST_CASE("PANOSE family type 5 or a format 13 cmap marks a symbol font",
          "[classify]") {
    fontsieve::config conf;
    fake_font p;
    textRepertoire(p);
    p.panose = 5;
    auto c = fontsieve::classify(p, conf);
    CHECK(c.isSymbol);
    CHECK_FALSE(c.isBarcode);

    fake_font f13;
    textRepertoire(f13);
    f13.panose = 2;
    f13.cmapFormats = {4, 13};
    CHECK(fontsieve::classify(f13, conf).isSymbol);

    fake_font plain;
    textRepertoire(plain);
    plain.panose = 2;
    CHECK_FALSE(fontsieve::classify(plain, conf).isSymbol);
}

TEST_CASE("Sparse ASCII coverage is non-textual", "[classify]") {
    fontsieve::config conf;
    fake_font empty;
    auto c = fontsieve::classify(empty, conf);
    CHECK(c.isNonTextual);
    CHECK_FALSE(c.isBarcode);

    fake_font dingbats;
    for (uint32_t cp = 0x2700; cp < 0x2760; cp++)
        dingbats.addChar(cp);
    dingbats.addChars("ABC123");
    CHECK(fontsieve::classify(dingbats, conf).isNonTextual);

    fake_font digits;
    digits.addChars("0123456789");
    CHECK_FALSE(fontsieve::classify(digits, conf).isNonTextual);
}
