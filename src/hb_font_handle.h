/*
Copyright 2023 Adobe
All Rights Reserved.

NOTICE: Adobe permits you to use, modify, and distribute this file in
accordance with the terms of the Adobe license agreement accompanying
it.
*/

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "font_handle.h"
#include "sfnt_tables.h"
#include "wrappers.h"

#pragma once

namespace fontsieve {
    class hb_font_handle;
    bool convertToWOFF2(std::string &s);
}

class fontsieve::hb_font_handle : public fontsieve::font_handle {
 public:
    /* Throws fontsieve::error (font_open_failure) when the file cannot be
       read or is not a TrueType, OpenType or WOFF2 font */
    static std::unique_ptr<font_handle> open(const std::filesystem::path &p,
                                             const config &conf);
    explicit hb_font_handle(const config &conf) : conf(conf) {}
    hb_font_handle(const hb_font_handle &) = delete;
    ~hb_font_handle() override { close(); }

    bool loadFont(std::string &s);

    const std::map<uint32_t, uint32_t> &bestCmap() override;
    std::set<uint32_t> tables() override;
    uint32_t glyphCount() override { return face.get_glyph_count(); }
    std::vector<std::string> glyphOrder() override;
    std::optional<std::pair<uint32_t, int32_t>> advanceWidth(uint32_t gid) override;
    std::optional<std::pair<int32_t, int32_t>> glyphBounds(uint32_t gid) override;
    std::optional<std::string> nameRecord(uint16_t nameID, uint16_t platformID,
                                          uint16_t encodingID) override;
    std::optional<std::string> firstNameRecord(uint16_t nameID) override;
    uint32_t unitsPerEm() override;
    std::optional<uint8_t> panoseFamilyType() override;
    std::optional<int16_t> xHeight() override;
    std::vector<uint16_t> cmapSubtableFormats() override;
    bool subset(const wr_set &unicodes, const subset_options &o) override;
    bool save(const std::filesystem::path &p, font_flavor f) override;
    void close() override;
    font_flavor nativeFlavor() const override { return flavor; }
 private:
    bool error(const char *m) {
        if (conf.verbosity() > 0)
            std::cerr << "Font Error: " << m << std::endl;
        return false;
    }
    bool rebuild();
    void clearCaches();
    const std::vector<name_record> &names();
    const os2_fields &os2();

    const config &conf;
    std::string fontData;
    font_flavor flavor {font_flavor::ttf};
    wr_blob blob;
    wr_face face;
    wr_font font;
    std::optional<std::map<uint32_t, uint32_t>> cmapCache;
    std::optional<std::vector<name_record>> nameCache;
    std::optional<os2_fields> os2Cache;
};
