/*
Copyright 2023 Adobe
All Rights Reserved.

NOTICE: Adobe permits you to use, modify, and distribute this file in
accordance with the terms of the Adobe license agreement accompanying
it.
*/

/* Readers for the few table fields HarfBuzz does not hand out directly:
   name records, two OS/2 fields and the cmap encoding record formats.
   Each reader takes a stream over the raw table data and returns false
   when the data is truncated or inconsistent.
 */

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#pragma once

namespace fontsieve {
    struct name_record;
    struct os2_fields;

    bool readname(std::istream &is, std::vector<name_record> &records);
    bool readOS2(std::istream &is, os2_fields &f);
    bool readcmapFormats(std::istream &is, std::vector<uint16_t> &formats);

    /* Returns the record's string as UTF-8, or nothing when the
       platform/encoding pair is not one we can decode */
    std::optional<std::string> decodeName(const name_record &r);
    std::string decodeUTF16BE(const std::string &raw);
    std::string decodeMacRoman(const std::string &raw);
    void appendUTF8(std::string &s, uint32_t cp);
}

struct fontsieve::name_record {
    uint16_t platformID {0}, encodingID {0}, languageID {0}, nameID {0};
    std::string raw;
};

struct fontsieve::os2_fields {
    uint16_t version {0};
    std::optional<uint8_t> panoseFamilyType;
    std::optional<int16_t> xHeight;  // version 2 and up
};
