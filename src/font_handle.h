/*
Copyright 2023 Adobe
All Rights Reserved.

NOTICE: Adobe permits you to use, modify, and distribute this file in
accordance with the terms of the Adobe license agreement accompanying
it.
*/

/* The operations the analysis and subsetting code needs from a loaded
   font. hb_font_handle implements them over HarfBuzz and woff2; tests
   substitute an in-memory font.
 */

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "wrappers.h"

#pragma once

namespace fontsieve {
    class font_handle;
    struct subset_options;
    enum class font_flavor { ttf, otf, woff, woff2 };
    const char *flavorName(font_flavor f);
}

struct fontsieve::subset_options {
    bool preserveNames {true};
};

class fontsieve::font_handle {
 public:
    virtual ~font_handle() {}

    // codepoint -> glyph id
    virtual const std::map<uint32_t, uint32_t> &bestCmap() = 0;
    virtual std::set<uint32_t> tables() = 0;
    virtual uint32_t glyphCount() = 0;
    virtual std::vector<std::string> glyphOrder() = 0;
    // (advance, left side bearing)
    virtual std::optional<std::pair<uint32_t, int32_t>> advanceWidth(uint32_t gid) = 0;
    // (yMin, yMax), absent for glyphs without an outline
    virtual std::optional<std::pair<int32_t, int32_t>> glyphBounds(uint32_t gid) = 0;
    virtual std::optional<std::string> nameRecord(uint16_t nameID,
                                                  uint16_t platformID,
                                                  uint16_t encodingID) = 0;
    virtual std::optional<std::string> firstNameRecord(uint16_t nameID) = 0;
    virtual uint32_t unitsPerEm() = 0;
    virtual std::optional<uint8_t> panoseFamilyType() = 0;
    virtual std::optional<int16_t> xHeight() = 0;
    virtual std::vector<uint16_t> cmapSubtableFormats() = 0;

    /* Replaces the font's contents with the subset closure of unicodes.
       Returns false, leaving the font unchanged, on failure. */
    virtual bool subset(const wr_set &unicodes, const subset_options &o) = 0;
    virtual bool save(const std::filesystem::path &p, font_flavor f) = 0;
    virtual void close() = 0;
    virtual font_flavor nativeFlavor() const = 0;
};

inline const char *fontsieve::flavorName(font_flavor f) {
    switch (f) {
        case font_flavor::otf: return "otf";
        case font_flavor::woff: return "woff";
        case font_flavor::woff2: return "woff2";
        default: return "ttf";
    }
}
