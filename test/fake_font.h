/* In-memory font_handle for driving the analysis and subsetting code
   without font binaries. save() writes a small text form that load()
   reads back, so an output can be fed to a second run. */

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include "font_handle.h"
#include "tag.h"

#pragma once

namespace fontsieve_test {
    class fake_font;
    class scratch_dir;
}

class fontsieve_test::fake_font : public fontsieve::font_handle {
 public:
    struct glyph {
        std::string name;
        std::optional<uint32_t> advance;
        std::optional<std::pair<int32_t, int32_t>> bounds;
    };
    typedef std::tuple<uint16_t, uint16_t, uint16_t, std::string> name_entry;

    fake_font() {
        tableSet = {T_HEAD, T_CMAP, T_HMTX, T_NAME, T_OS2, tag("glyf"),
                    tag("loca"), tag("maxp"), tag("post")};
        glyphs.push_back({".notdef", 500, std::make_pair(0, 700)});
    }
    fake_font(const fake_font &) = default;
    ~fake_font() override { close(); }

    // Maps cp to a new glyph with the given advance and bounds
    uint32_t addChar(uint32_t cp, std::optional<uint32_t> advance = 600,
                     std::optional<std::pair<int32_t, int32_t>> bounds =
                         std::make_pair(0, 700)) {
        uint32_t gid = glyphs.size();
        char buf[16];
        snprintf(buf, sizeof(buf), "uni%04X", cp);
        glyphs.push_back({buf, advance, bounds});
        cmap[cp] = gid;
        return gid;
    }
    void addChars(const std::string &s, std::optional<uint32_t> advance = 600) {
        for (auto c: s)
            addChar((unsigned char) c, advance);
    }

    const std::map<uint32_t, uint32_t> &bestCmap() override { return cmap; }
    std::set<uint32_t> tables() override { return tableSet; }
    uint32_t glyphCount() override { return glyphs.size(); }
    std::vector<std::string> glyphOrder() override {
        std::vector<std::string> v;
        for (auto &g: glyphs)
            v.push_back(g.name);
        return v;
    }
    std::optional<std::pair<uint32_t, int32_t>> advanceWidth(uint32_t gid) override {
        if (!tableSet.count(T_HMTX) || gid >= glyphs.size() ||
            !glyphs[gid].advance)
            return std::nullopt;
        return std::make_pair(*glyphs[gid].advance, 0);
    }
    std::optional<std::pair<int32_t, int32_t>> glyphBounds(uint32_t gid) override {
        if (gid >= glyphs.size())
            return std::nullopt;
        return glyphs[gid].bounds;
    }
    std::optional<std::string> nameRecord(uint16_t nameID, uint16_t platformID,
                                          uint16_t encodingID) override {
        for (auto &[n, p, e, s]: names)
            if (n == nameID && p == platformID && e == encodingID)
                return s;
        return std::nullopt;
    }
    std::optional<std::string> firstNameRecord(uint16_t nameID) override {
        for (auto &[n, p, e, s]: names)
            if (n == nameID)
                return s;
        return std::nullopt;
    }
    uint32_t unitsPerEm() override { return upem; }
    std::optional<uint8_t> panoseFamilyType() override { return panose; }
    std::optional<int16_t> xHeight() override { return xh; }
    std::vector<uint16_t> cmapSubtableFormats() override { return cmapFormats; }

    bool subset(const fontsieve::wr_set &unicodes,
                const fontsieve::subset_options &o) override {
        if (failSubset)
            return false;
        std::set<uint32_t> keep;
        for (uint32_t g = 0; g < 4 && g < glyphs.size(); g++)
            keep.insert(g);
        for (auto &[cp, gid]: cmap)
            if (unicodes.has(cp))
                keep.insert(gid);

        std::map<uint32_t, uint32_t> remap;
        std::vector<glyph> ng;
        for (auto g: keep) {
            remap[g] = ng.size();
            ng.push_back(glyphs[g]);
        }
        std::map<uint32_t, uint32_t> nc;
        for (auto &[cp, gid]: cmap)
            if (unicodes.has(cp))
                nc[cp] = remap[gid];
        glyphs.swap(ng);
        cmap.swap(nc);
        for (auto t: dropOnSubset)
            tableSet.erase(t);
        if (!o.preserveNames) {
            names.clear();
            tableSet.erase(T_NAME);
        }
        subsetCalls++;
        return true;
    }

    bool save(const std::filesystem::path &p, fontsieve::font_flavor f) override {
        if (f == fontsieve::font_flavor::woff2 && failWoff2)
            return false;
        std::ofstream os(p, std::ios::out | std::ios::trunc);
        if (!os.is_open())
            return false;
        os << "fakefont " << fontsieve::flavorName(f) << "\n";
        os << "upem " << upem << "\n";
        for (auto t: tableSet)
            os << "table " << t << "\n";
        for (auto t: dropOnSubset)
            os << "drop " << t << "\n";
        for (auto &g: glyphs) {
            os << "glyph " << (g.advance ? (long) *g.advance : -1L) << " ";
            if (g.bounds)
                os << "1 " << g.bounds->first << " " << g.bounds->second;
            else
                os << "0 0 0";
            os << " " << g.name << "\n";
        }
        for (auto &[cp, gid]: cmap)
            os << "cmap " << cp << " " << gid << "\n";
        for (auto &[n, pl, e, s]: names)
            os << "name " << n << " " << pl << " " << e << " " << s << "\n";
        os.close();
        return !os.fail();
    }

    static std::unique_ptr<fake_font> load(const std::filesystem::path &p) {
        std::ifstream is(p);
        std::string line, kw;
        auto f = std::make_unique<fake_font>();
        f->tableSet.clear();
        f->glyphs.clear();
        while (std::getline(is, line)) {
            std::istringstream ls(line);
            ls >> kw;
            if (kw == "fakefont") {
                std::string fl;
                ls >> fl;
                f->flavor = fl == "otf" ? fontsieve::font_flavor::otf
                          : fl == "woff" ? fontsieve::font_flavor::woff
                          : fl == "woff2" ? fontsieve::font_flavor::woff2
                          : fontsieve::font_flavor::ttf;
            } else if (kw == "upem") {
                ls >> f->upem;
            } else if (kw == "table") {
                uint32_t t;
                ls >> t;
                f->tableSet.insert(t);
            } else if (kw == "drop") {
                uint32_t t;
                ls >> t;
                f->dropOnSubset.insert(t);
            } else if (kw == "glyph") {
                long adv;
                int hb;
                int32_t lo, hi;
                glyph g;
                ls >> adv >> hb >> lo >> hi >> g.name;
                if (adv >= 0)
                    g.advance = (uint32_t) adv;
                if (hb)
                    g.bounds = std::make_pair(lo, hi);
                f->glyphs.push_back(g);
            } else if (kw == "cmap") {
                uint32_t cp, gid;
                ls >> cp >> gid;
                f->cmap[cp] = gid;
            } else if (kw == "name") {
                uint16_t n, pl, e;
                std::string s;
                ls >> n >> pl >> e;
                std::getline(ls >> std::ws, s);
                f->names.emplace_back(n, pl, e, s);
            }
        }
        return f;
    }

    void close() override {
        if (!closed && closeCount)
            ++*closeCount;
        closed = true;
    }
    fontsieve::font_flavor nativeFlavor() const override { return flavor; }

    std::map<uint32_t, uint32_t> cmap;
    std::set<uint32_t> tableSet;
    std::set<uint32_t> dropOnSubset;
    std::vector<glyph> glyphs;
    std::vector<name_entry> names;
    uint32_t upem {1000};
    std::optional<uint8_t> panose;
    std::optional<int16_t> xh {500};
    std::vector<uint16_t> cmapFormats {4};
    fontsieve::font_flavor flavor {fontsieve::font_flavor::ttf};
    bool failSubset {false};
    bool failWoff2 {false};
    bool closed {false};
    int *closeCount {nullptr};
    int subsetCalls {0};
};

/* Fresh directory under the system temp directory, removed with its
   contents on destruction */
class fontsieve_test::scratch_dir {
 public:
    scratch_dir() {
        static std::atomic<int> serial {0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        p = std::filesystem::temp_directory_path() /
            ("fontsieve_test_" + std::to_string(stamp) + "_" +
             std::to_string(serial++));
        std::filesystem::create_directories(p);
    }
    scratch_dir(const scratch_dir &) = delete;
    ~scratch_dir() {
        std::error_code ec;
        std::filesystem::remove_all(p, ec);
    }
    std::filesystem::path operator / (const std::string &n) const { return p / n; }
    const std::filesystem::path &path() const { return p; }
    void touch(const std::string &n, const std::string &content = "x") const {
        std::ofstream os(p / n);
        os << content;
    }
 private:
    std::filesystem::path p;
};
