/*
Copyright 2023 Adobe
All Rights Reserved.

NOTICE: Adobe permits you to use, modify, and distribute this file in
accordance with the terms of the Adobe license agreement accompanying
it.
*/

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <woff2/decode.h>
#include <woff2/encode.h>

#include "error.h"
#include "hb_font_handle.h"
#include "streamhelp.h"
#include "tag.h"
#include "woff.h"

bool fontsieve::convertToWOFF2(std::string &s) {
    size_t woff2_size = woff2::MaxWOFF2CompressedSize((uint8_t *)s.data(),
                                                      s.size());
    std::string woff2_out(woff2_size, 0);
    woff2::WOFF2Params params;
    params.preserve_table_order = true;
    if (!woff2::ConvertTTFToWOFF2((uint8_t *)s.data(), s.size(),
                                  (uint8_t *)woff2_out.data(),
                                  &woff2_size, params))
        return false;
    woff2_out.resize(woff2_size);
    s.swap(woff2_out);
    return true;
}

std::unique_ptr<fontsieve::font_handle>
fontsieve::hb_font_handle::open(const std::filesystem::path &p,
                                const config &conf) {
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs.is_open())
        throw fontsieve::error(error_kind::font_open_failure,
                               "Could not open font file: " + p.string());
    std::stringstream ss;
    ss << ifs.rdbuf();
    std::string s = ss.str();
    ifs.close();

    auto h = std::make_unique<hb_font_handle>(conf);
    if (!h->loadFont(s))
        throw fontsieve::error(error_kind::font_open_failure,
                               "Could not load font: " + p.string());
    if (conf.verbosity() > 0) {
        std::cerr << "Opened " << p << " (" << flavorName(h->flavor);
        std::cerr << ", " << h->glyphCount() << " glyphs)" << std::endl;
    }
    return h;
}

/* WOFF and WOFF2 input is unpacked to sfnt; the flavor records which
   it was */
bool fontsieve::hb_font_handle::loadFont(std::string &s) {
    close();
    if (s.size() < 12)
        return error("File too short to be a font");

    uint32_t tg = tag(s.data());
    if (tg == tag("wOF2")) {
        const uint8_t *iptr = reinterpret_cast<const uint8_t*>(s.data());
        size_t sz = std::min(woff2::ComputeWOFF2FinalSize(iptr, s.size()),
                             woff2::kDefaultMaxSize);
        std::string t;
        t.resize(sz);
        woff2::WOFF2StringOut o(&t);
        if (!woff2::ConvertWOFF2ToTTF(iptr, s.size(), &o))
            return error("WOFF2 decoding failed");
        t.resize(o.Size());
        fontData.swap(t);
        flavor = font_flavor::woff2;
    } else if (tg == tag("wOFF")) {
        std::string t;
        if (!decodeWOFF(s, t))
            return error("WOFF decoding failed");
        fontData.swap(t);
        flavor = font_flavor::woff;
    } else if (tg == 0x00010000 || tg == tag("true")) {
        fontData.swap(s);
        flavor = font_flavor::ttf;
    } else if (tg == tag("OTTO")) {
        fontData.swap(s);
        flavor = font_flavor::otf;
    } else
        return error("Unrecognized font type");

    return rebuild();
}

bool fontsieve::hb_font_handle::rebuild() {
    clearCaches();
    font.reset();
    face.reset(nullptr);
    blob.from_string(fontData, true);
    if (blob.b == nullptr)
        return error("Could not create blob for font data");
    face.create(blob);
    std::vector<uint32_t> tags;
    face.get_table_tags(tags);
    if (tags.empty())
        return error("Font has no tables");
    font.create(face);
    return true;
}

void fontsieve::hb_font_handle::clearCaches() {
    cmapCache.reset();
    nameCache.reset();
    os2Cache.reset();
}

void fontsieve::hb_font_handle::close() {
    clearCaches();
    font.reset();
    face.reset(nullptr);
    blob.reset(nullptr);
    fontData.clear();
}

const std::map<uint32_t, uint32_t> &fontsieve::hb_font_handle::bestCmap() {
    if (!cmapCache) {
        wr_map mapping;
        wr_set unicodes;
        std::map<uint32_t, uint32_t> m;
        face.collect_nominal_mapping(mapping, unicodes);
        hb_codepoint_t cp = HB_SET_VALUE_INVALID;
        while (unicodes.next(cp))
            m.emplace(cp, mapping.get(cp));
        cmapCache = std::move(m);
    }
    return *cmapCache;
}

std::set<uint32_t> fontsieve::hb_font_handle::tables() {
    std::vector<uint32_t> tags;
    face.get_table_tags(tags);
    return std::set<uint32_t>(tags.begin(), tags.end());
}

std::vector<std::string> fontsieve::hb_font_handle::glyphOrder() {
    uint32_t count = glyphCount();
    std::vector<std::string> order;
    char buf[128];
    order.reserve(count);
    for (uint32_t gid = 0; gid < count; gid++) {
        if (hb_font_get_glyph_name(font.f, gid, buf, sizeof(buf)) && buf[0]) {
            order.emplace_back(buf);
        } else {
            snprintf(buf, sizeof(buf), "glyph%05u", gid);
            order.emplace_back(buf);
        }
    }
    return order;
}

std::optional<std::pair<uint32_t, int32_t>>
fontsieve::hb_font_handle::advanceWidth(uint32_t gid) {
    if (gid >= glyphCount())
        return std::nullopt;
    wr_blob hmtx(face.reference_table(T_HMTX));
    if (hmtx.length() == 0)
        return std::nullopt;

    hb_position_t adv = hb_font_get_glyph_h_advance(font.f, gid);
    hb_glyph_extents_t ext;
    int32_t lsb = 0;
    if (hb_font_get_glyph_extents(font.f, gid, &ext))
        lsb = ext.x_bearing;
    return std::make_pair((uint32_t) std::max(adv, 0), lsb);
}

std::optional<std::pair<int32_t, int32_t>>
fontsieve::hb_font_handle::glyphBounds(uint32_t gid) {
    hb_glyph_extents_t ext;
    if (gid >= glyphCount() || !hb_font_get_glyph_extents(font.f, gid, &ext))
        return std::nullopt;
    if (ext.width == 0 && ext.height == 0)
        return std::nullopt;
    // y_bearing is the top, height is negative going down
    return std::make_pair((int32_t) (ext.y_bearing + ext.height),
                          (int32_t) ext.y_bearing);
}

const std::vector<fontsieve::name_record> &fontsieve::hb_font_handle::names() {
    if (!nameCache) {
        std::vector<name_record> recs;
        wr_blob nb(face.reference_table(T_NAME));
        unsigned int l;
        const char *d = nb.data(l);
        if (l > 0) {
            simpleistream is(d, l);
            if (!readname(is, recs)) {
                error("Could not read name table");
                recs.clear();
            }
        }
        nameCache = std::move(recs);
    }
    return *nameCache;
}

std::optional<std::string>
fontsieve::hb_font_handle::nameRecord(uint16_t nameID, uint16_t platformID,
                                      uint16_t encodingID) {
    for (auto &r: names()) {
        if (r.nameID != nameID || r.platformID != platformID ||
            r.encodingID != encodingID)
            continue;
        if (auto s = decodeName(r))
            return s;
    }
    return std::nullopt;
}

std::optional<std::string>
fontsieve::hb_font_handle::firstNameRecord(uint16_t nameID) {
    for (auto &r: names()) {
        if (r.nameID != nameID)
            continue;
        if (auto s = decodeName(r))
            return s;
    }
    return std::nullopt;
}

uint32_t fontsieve::hb_font_handle::unitsPerEm() {
    wr_blob hb(face.reference_table(T_HEAD));
    if (hb.length() == 0)
        return 1000;
    return face.get_upem();
}

const fontsieve::os2_fields &fontsieve::hb_font_handle::os2() {
    if (!os2Cache) {
        os2_fields f;
        wr_blob ob(face.reference_table(T_OS2));
        unsigned int l;
        const char *d = ob.data(l);
        if (l > 0) {
            simpleistream is(d, l);
            if (!readOS2(is, f)) {
                error("Could not read OS/2 table");
                f = os2_fields();
            }
        }
        os2Cache = f;
    }
    return *os2Cache;
}

std::optional<uint8_t> fontsieve::hb_font_handle::panoseFamilyType() {
    return os2().panoseFamilyType;
}

std::optional<int16_t> fontsieve::hb_font_handle::xHeight() {
    return os2().xHeight;
}

std::vector<uint16_t> fontsieve::hb_font_handle::cmapSubtableFormats() {
    std::vector<uint16_t> formats;
    wr_blob cb(face.reference_table(T_CMAP));
    unsigned int l;
    const char *d = cb.data(l);
    if (l > 0) {
        simpleistream is(d, l);
        if (!readcmapFormats(is, formats)) {
            error("Could not read cmap encoding records");
            formats.clear();
        }
    }
    return formats;
}

bool fontsieve::hb_font_handle::subset(const wr_set &unicodes,
                                       const subset_options &o) {
    wr_subset_input input;
    hb_set_t *t;

    if (!input.valid())
        return error("Could not create subset input");

    unsigned flags = HB_SUBSET_FLAGS_DEFAULT;
    flags |= HB_SUBSET_FLAGS_GLYPH_NAMES
             | HB_SUBSET_FLAGS_NOTDEF_OUTLINE
             | HB_SUBSET_FLAGS_NAME_LEGACY
             | HB_SUBSET_FLAGS_PASSTHROUGH_UNRECOGNIZED
             | HB_SUBSET_FLAGS_NO_PRUNE_UNICODE_RANGES
             ;
    input.set_flags(flags);

    t = input.unicode_set();
    hb_set_set(t, unicodes.s);
    t = input.set(HB_SUBSET_SETS_LAYOUT_FEATURE_TAG);
    hb_set_clear(t);
    hb_set_invert(t);
    t = input.set(HB_SUBSET_SETS_LAYOUT_SCRIPT_TAG);
    hb_set_clear(t);
    hb_set_invert(t);
    t = input.set(HB_SUBSET_SETS_NAME_ID);
    hb_set_clear(t);
    if (o.preserveNames) {
        hb_set_invert(t);
        t = input.set(HB_SUBSET_SETS_NAME_LANG_ID);
        hb_set_clear(t);
        hb_set_invert(t);
    }
    // .notdef plus the glyphs conventionally at 1..3
    t = input.gid_set();
    uint32_t count = glyphCount();
    for (uint32_t gid = 0; gid < 4 && gid < count; gid++)
        hb_set_add(t, gid);

    std::string subData;
    {
        wr_face subface(input.subset(face));
        if (subface.is_empty())
            return error("HarfBuzz subsetting failed");
        wr_blob subblob(subface.reference_blob());
        unsigned int l;
        const char *d = subblob.data(l);
        if (l == 0)
            return error("Subset font serialized to nothing");
        subData.assign(d, l);
    }

    font.reset();
    face.reset(nullptr);
    blob.reset(nullptr);
    fontData.swap(subData);
    if (conf.verbosity() > 0)
        std::cerr << "Subset glyph count: " << count << " -> ";
    if (!rebuild())
        return false;
    if (conf.verbosity() > 0)
        std::cerr << glyphCount() << std::endl;
    return true;
}

bool fontsieve::hb_font_handle::save(const std::filesystem::path &p,
                                     font_flavor f) {
    if (fontData.empty())
        return error("No font loaded");
    std::string out = fontData;
    if (f == font_flavor::woff2 && !convertToWOFF2(out))
        return error("Could not WOFF2 compress font");
    if (f == font_flavor::woff) {
        std::string w;
        if (!encodeWOFF(out, w))
            return error("Could not WOFF compress font");
        out.swap(w);
    }

    std::ofstream os;
    os.open(p, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!os.is_open())
        return error("Could not open output file");
    os.write(out.data(), out.size());
    os.close();
    if (os.fail())
        return error("Could not write output file");
    if (conf.verbosity() > 0)
        std::cerr << "Wrote output file " << p << std::endl;
    return true;
}
