#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>

#include <catch2/catch.hpp>

#include "error.h"
#include "fake_font.h"
#include "hb_font_handle.h"
#include "sfnt_builder.h"

using fontsieve::error_kind;
using fontsieve::font_flavor;
using fontsieve::hb_font_handle;
using namespace fontsieve_test;

static std::string slurp(const std::filesystem::path &p) {
    std::ifstream ifs(p, std::ios::binary);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static error_kind openError(const std::filesystem::path &p,
                            const fontsieve::config &conf) {
    try {
        hb_font_handle::open(p, conf);
    } catch (const fontsieve::error &e) {
        return e.kind();
    }
    FAIL("font opened");
    return error_kind::input_not_found;
}

TEST_CASE("Unreadable and non-font files fail to open", "[hbfont]") {
    scratch_dir dir;
    fontsieve::config conf;
    CHECK(openError(dir / "missing.ttf", conf) == error_kind::font_open_failure);

    dir.touch("notes.ttf", "These are not the glyphs you are looking for.");
    CHECK(openError(dir / "notes.ttf", conf) == error_kind::font_open_failure);

    dir.touch("short.otf", "OTTO");
    CHECK(openError(dir / "short.otf", conf) == error_kind::font_open_failure);
}

TEST_CASE("sfnt input is read directly", "[hbfont]") {
    scratch_dir dir;
    fontsieve::config conf;
    dir.touch("a.ttf", sampleSfnt());

    auto f = hb_font_handle::open(dir / "a.ttf", conf);
    CHECK(f->nativeFlavor() == font_flavor::ttf);
    CHECK(f->tables() == std::set<uint32_t>{tag("ZERO"), tag("maxp")});
    CHECK(f->glyphCount() == 3);
    CHECK(f->glyphOrder().size() == 3);
    CHECK(f->bestCmap().empty());
    CHECK(f->unitsPerEm() == 1000);
    CHECK_FALSE(f->advanceWidth(0));
    CHECK_FALSE(f->panoseFamilyType());
    CHECK(f->cmapSubtableFormats().empty());
}

TEST_CASE("WOFF input is unpacked and can be written back", "[hbfont][woff]") {
    scratch_dir dir;
    fontsieve::config conf;
    std::string sfnt = sampleSfnt();
    std::string woff;
    REQUIRE(fontsieve::encodeWOFF(sfnt, woff));
    dir.touch("a.woff", woff);

    auto f = hb_font_handle::open(dir / "a.woff", conf);
    CHECK(f->nativeFlavor() == font_flavor::woff);
    CHECK(f->tables() == std::set<uint32_t>{tag("ZERO"), tag("maxp")});
    CHECK(f->glyphCount() == 3);

    REQUIRE(f->save(dir / "b.ttf", font_flavor::ttf));
    CHECK(slurp(dir / "b.ttf") == sfnt);

    REQUIRE(f->save(dir / "c.woff", font_flavor::woff));
    auto g = hb_font_handle::open(dir / "c.woff", conf);
    CHECK(g->nativeFlavor() == font_flavor::woff);
    CHECK(g->tables() == f->tables());

    f->close();
    f->close();
    CHECK_FALSE(f->save(dir / "d.ttf", font_flavor::ttf));
}

TEST_CASE("Corrupt WOFF input fails to open", "[hbfont][woff]") {
    scratch_dir dir;
    fontsieve::config conf;
    std::string woff;
    REQUIRE(fontsieve::encodeWOFF(sampleSfnt(), woff));
    dir.touch("cut.woff", woff.substr(0, 50));
    CHECK(openError(dir / "cut.woff", conf) == error_kind::font_open_failure);
}
