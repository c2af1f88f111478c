/*
Copyright 2023 Adobe
All Rights Reserved.

NOTICE: Adobe permits you to use, modify, and distribute this file in
accordance with the terms of the Adobe license agreement accompanying
it.
*/

#include "sfnt_tables.h"
#include "streamhelp.h"

static const uint16_t macRomanHigh[128] = {
    0x00C4, 0x00C5, 0x00C7, 0x00C9, 0x00D1, 0x00D6, 0x00DC, 0x00E1,
    0x00E0, 0x00E2, 0x00E4, 0x00E3, 0x00E5, 0x00E7, 0x00E9, 0x00E8,
    0x00EA, 0x00EB, 0x00ED, 0x00EC, 0x00EE, 0x00EF, 0x00F1, 0x00F3,
    0x00F2, 0x00F4, 0x00F6, 0x00F5, 0x00FA, 0x00F9, 0x00FB, 0x00FC,
    0x2020, 0x00B0, 0x00A2, 0x00A3, 0x00A7, 0x2022, 0x00B6, 0x00DF,
    0x00AE, 0x00A9, 0x2122, 0x00B4, 0x00A8, 0x2260, 0x00C6, 0x00D8,
    0x221E, 0x00B1, 0x2264, 0x2265, 0x00A5, 0x00B5, 0x2202, 0x2211,
    0x220F, 0x03C0, 0x222B, 0x00AA, 0x00BA, 0x03A9, 0x00E6, 0x00F8,
    0x00BF, 0x00A1, 0x00AC, 0x221A, 0x0192, 0x2248, 0x2206, 0x00AB,
    0x00BB, 0x2026, 0x00A0, 0x00C0, 0x00C3, 0x00D5, 0x0152, 0x0153,
    0x2013, 0x2014, 0x201C, 0x201D, 0x2018, 0x2019, 0x00F7, 0x25CA,
    0x00FF, 0x0178, 0x2044, 0x20AC, 0x2039, 0x203A, 0xFB01, 0xFB02,
    0x2021, 0x00B7, 0x201A, 0x201E, 0x2030, 0x00C2, 0x00CA, 0x00C1,
    0x00CB, 0x00C8, 0x00CD, 0x00CE, 0x00CF, 0x00CC, 0x00D3, 0x00D4,
    0xF8FF, 0x00D2, 0x00DA, 0x00DB, 0x00D9, 0x0131, 0x02C6, 0x02DC,
    0x00AF, 0x02D8, 0x02D9, 0x02DA, 0x00B8, 0x02DD, 0x02DB, 0x02C7
};

void fontsieve::appendUTF8(std::string &s, uint32_t cp) {
    if (cp < 0x80) {
        s.push_back((char) cp);
    } else if (cp < 0x800) {
        s.push_back((char) (0xC0 | cp >> 6));
        s.push_back((char) (0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        s.push_back((char) (0xE0 | cp >> 12));
        s.push_back((char) (0x80 | (cp >> 6 & 0x3F)));
        s.push_back((char) (0x80 | (cp & 0x3F)));
    } else {
        s.push_back((char) (0xF0 | cp >> 18));
        s.push_back((char) (0x80 | (cp >> 12 & 0x3F)));
        s.push_back((char) (0x80 | (cp >> 6 & 0x3F)));
        s.push_back((char) (0x80 | (cp & 0x3F)));
    }
}

std::string fontsieve::decodeUTF16BE(const std::string &raw) {
    std::string s;
    size_t n = raw.size() / 2;
    s.reserve(n);
    for (size_t i = 0; i < n; i++) {
        uint32_t u = (uint8_t) raw[2*i] << 8 | (uint8_t) raw[2*i+1];
        if (u >= 0xD800 && u < 0xDC00 && i + 1 < n) {
            uint32_t l = (uint8_t) raw[2*i+2] << 8 | (uint8_t) raw[2*i+3];
            if (l >= 0xDC00 && l < 0xE000) {
                appendUTF8(s, 0x10000 + ((u - 0xD800) << 10) + (l - 0xDC00));
                i++;
                continue;
            }
        }
        if (u >= 0xD800 && u < 0xE000)
            u = 0xFFFD;  // unpaired surrogate
        appendUTF8(s, u);
    }
    return s;
}

std::string fontsieve::decodeMacRoman(const std::string &raw) {
    std::string s;
    s.reserve(raw.size());
    for (auto c: raw) {
        uint8_t b = (uint8_t) c;
        if (b < 0x80)
            s.push_back(c);
        else
            appendUTF8(s, macRomanHigh[b - 0x80]);
    }
    return s;
}

std::optional<std::string> fontsieve::decodeName(const name_record &r) {
    if (r.platformID == 0)
        return decodeUTF16BE(r.raw);
    if (r.platformID == 3 && (r.encodingID == 0 || r.encodingID == 1 ||
                              r.encodingID == 10))
        return decodeUTF16BE(r.raw);
    if (r.platformID == 1 && r.encodingID == 0)
        return decodeMacRoman(r.raw);
    return std::nullopt;
}

bool fontsieve::readname(std::istream &is, std::vector<name_record> &records) {
    uint16_t count, storageOffset;
    std::vector<std::pair<uint16_t, uint16_t>> spans;

    is.seekg(0, std::ios::end);
    uint64_t tableLength = is.tellg();
    is.seekg(0);

    readObject<uint16_t>(is);  // version
    readObject(is, count);
    readObject(is, storageOffset);
    if (is.fail()) {
        std::cerr << "name error: Truncated header" << std::endl;
        return false;
    }
    records.resize(count);
    spans.reserve(count);
    for (auto &r: records) {
        uint16_t length, offset;
        readObject(is, r.platformID);
        readObject(is, r.encodingID);
        readObject(is, r.languageID);
        readObject(is, r.nameID);
        readObject(is, length);
        readObject(is, offset);
        spans.emplace_back(length, offset);
    }
    if (is.fail()) {
        std::cerr << "name error: Truncated record array" << std::endl;
        return false;
    }
    for (size_t i = 0; i < records.size(); i++) {
        auto [length, offset] = spans[i];
        uint64_t start = (uint64_t) storageOffset + offset;
        if (start + length > tableLength) {
            std::cerr << "name error: String " << i;
            std::cerr << " extends past end of table" << std::endl;
            return false;
        }
        records[i].raw.resize(length);
        is.seekg(start);
        is.read(records[i].raw.data(), length);
    }
    if (is.fail()) {
        std::cerr << "name error: Stream read failure" << std::endl;
        return false;
    }
    return true;
}

bool fontsieve::readOS2(std::istream &is, os2_fields &f) {
    uint8_t panose[10];

    is.seekg(0, std::ios::end);
    uint64_t tableLength = is.tellg();
    is.seekg(0);

    readObject(is, f.version);
    if (is.fail() || tableLength < 42) {
        std::cerr << "OS/2 error: Table too short for PANOSE" << std::endl;
        return false;
    }
    is.seekg(32);
    for (int i = 0; i < 10; i++)
        readObject(is, panose[i]);
    f.panoseFamilyType = panose[0];

    if (f.version >= 2 && tableLength >= 88) {
        int16_t xh;
        is.seekg(86);
        readObject(is, xh);
        f.xHeight = xh;
    }
    if (is.fail()) {
        std::cerr << "OS/2 error: Stream read failure" << std::endl;
        return false;
    }
    return true;
}

bool fontsieve::readcmapFormats(std::istream &is,
                                std::vector<uint16_t> &formats) {
    uint16_t numTables, platformID, encodingID;
    uint32_t subtableOffset;
    std::vector<uint32_t> offsets;

    readObject<uint16_t>(is);  // version
    readObject(is, numTables);
    offsets.reserve(numTables);
    for (int i = 0; i < numTables; i++) {
        readObject(is, platformID);
        readObject(is, encodingID);
        readObject(is, subtableOffset);
        offsets.push_back(subtableOffset);
    }
    if (is.fail()) {
        std::cerr << "cmap error: Truncated encoding records" << std::endl;
        return false;
    }
    formats.clear();
    formats.reserve(offsets.size());
    for (auto o: offsets) {
        is.seekg(o);
        uint16_t format;
        readObject(is, format);
        if (is.fail()) {
            std::cerr << "cmap error: Subtable offset " << o;
            std::cerr << " out of range" << std::endl;
            return false;
        }
        formats.push_back(format);
    }
    return true;
}
