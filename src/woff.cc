/* Copyright 2014 Adobe Systems Incorporated (http://www.adobe.com/). All Rights Reserved.
   This software is licensed as OpenSource, under the Apache License, Version 2.0.
   This license is available at: http://opensource.org/licenses/Apache-2.0. */

#include <iostream>
#include <sstream>

#include <zlib.h>

#include "streamhelp.h"
#include "tag.h"
#include "woff.h"

static const uint32_t sfnt_header_size = sizeof(uint32_t) +
                                         sizeof(uint16_t) * 4;
static const uint32_t woff_header_size = 44;
static const uint32_t woff_entry_size = sizeof(uint32_t) * 5;

static bool error(const char *m) {
    std::cerr << "WOFF error: " << m << std::endl;
    return false;
}

static uint32_t pad4(uint32_t l) {
    return (l + 3) & ~3u;
}

uint32_t fontsieve::tableChecksum(const char *data, uint32_t length) {
    uint32_t sum = 0;
    for (uint32_t i = 0; i < length; i += 4) {
        uint32_t v = 0;
        for (uint32_t j = 0; j < 4; j++)
            v = v << 8 | (i + j < length ? (uint8_t) data[i + j] : 0);
        sum += v;
    }
    return sum;
}

bool fontsieve::readSfntDirectory(const std::string &sfnt, uint32_t &flavor,
                                  std::vector<sfnt_table> &tables) {
    uint16_t numTables;
    simpleistream ss(sfnt.data(), sfnt.size());

    tables.clear();
    if (sfnt.size() < sfnt_header_size)
        return error("sfnt header truncated");
    readObject(ss, flavor);
    readObject(ss, numTables);
    if (sfnt.size() < sfnt_header_size +
                      (uint64_t) numTables * sfnt_table::entry_size)
        return error("sfnt table directory truncated");

    ss.seekg(sfnt_header_size);
    for (int i = 0; i < numTables; i++) {
        sfnt_table t;
        readObject(ss, t.tag);
        readObject(ss, t.checksum);
        readObject(ss, t.offset);
        readObject(ss, t.length);
        if ((uint64_t) t.offset + t.length > sfnt.size())
            return error("sfnt table extends past the end of the file");
        tables.push_back(t);
    }
    if (ss.fail())
        return error("Stream read failure");
    return true;
}

/* Writes an sfnt header and directory for tables whose data follows in
   the given order, each padded to four bytes */
static void writeSfntHeader(std::ostream &os, uint32_t flavor,
                            std::vector<fontsieve::sfnt_table> &tables) {
    uint16_t numTables = tables.size();
    uint16_t entrySelector = 0, searchRange = 1;
    while (searchRange * 2 <= numTables) {
        searchRange *= 2;
        entrySelector++;
    }
    searchRange *= 16;
    uint16_t rangeShift = numTables * 16 - searchRange;

    writeObject(os, flavor);
    writeObject(os, numTables);
    writeObject(os, searchRange);
    writeObject(os, entrySelector);
    writeObject(os, rangeShift);

    uint32_t offset = sfnt_header_size +
                      numTables * fontsieve::sfnt_table::entry_size;
    for (auto &t: tables) {
        t.offset = offset;
        writeObject(os, t.tag);
        writeObject(os, t.checksum);
        writeObject(os, t.offset);
        writeObject(os, t.length);
        offset += pad4(t.length);
    }
}

bool fontsieve::decodeWOFF(const std::string &woff, std::string &sfnt) {
    uint32_t signature, flavor, length, totalSfntSize;
    uint16_t numTables, reserved;
    simpleistream ss(woff.data(), woff.size());

    if (woff.size() < woff_header_size)
        return error("WOFF header truncated");
    readObject(ss, signature);
    if (signature != tag("wOFF"))
        return error("Not a WOFF file");
    readObject(ss, flavor);
    readObject(ss, length);
    readObject(ss, numTables);
    readObject(ss, reserved);
    readObject(ss, totalSfntSize);
    if (length > woff.size())
        return error("WOFF length field exceeds file size");
    if (numTables == 0)
        return error("WOFF file has no tables");
    if (woff.size() < woff_header_size +
                      (uint64_t) numTables * woff_entry_size)
        return error("WOFF table directory truncated");

    std::vector<sfnt_table> tables;
    std::vector<std::string> data;
    ss.seekg(woff_header_size);
    for (int i = 0; i < numTables; i++) {
        sfnt_table t;
        uint32_t offset, compLength, origLength;
        readObject(ss, t.tag);
        readObject(ss, offset);
        readObject(ss, compLength);
        readObject(ss, origLength);
        readObject(ss, t.checksum);
        if (ss.fail())
            return error("Stream read failure");
        if ((uint64_t) offset + compLength > woff.size())
            return error("WOFF table extends past the end of the file");
        if (compLength > origLength)
            return error("WOFF table larger compressed than original");
        t.length = origLength;

        std::string d;
        if (compLength == origLength) {
            d.assign(woff.data() + offset, origLength);
        } else {
            d.resize(origLength);
            uLongf destLen = origLength;
            int r = uncompress((Bytef *) d.data(), &destLen,
                               (const Bytef *) woff.data() + offset,
                               compLength);
            if (r != Z_OK || destLen != origLength)
                return error("Could not inflate WOFF table");
        }
        tables.push_back(t);
        data.push_back(std::move(d));
    }

    std::ostringstream os;
    writeSfntHeader(os, flavor, tables);
    for (auto &d: data) {
        os.write(d.data(), d.size());
        for (uint32_t p = d.size(); p < pad4(d.size()); p++)
            os.put(0);
    }
    if (os.fail())
        return error("Stream write failure");
    sfnt = os.str();
    return true;
}

bool fontsieve::encodeWOFF(const std::string &sfnt, std::string &woff) {
    uint32_t flavor;
    std::vector<sfnt_table> tables;
    if (!readSfntDirectory(sfnt, flavor, tables))
        return false;
    if (tables.empty())
        return error("sfnt has no tables");

    uint32_t numTables = tables.size();
    uint32_t totalSfntSize = sfnt_header_size +
                             numTables * sfnt_table::entry_size;
    std::vector<std::string> data;
    for (auto &t: tables) {
        totalSfntSize += pad4(t.length);
        const char *src = sfnt.data() + t.offset;
        uLongf compLength = compressBound(t.length);
        std::string c(compLength, 0);
        int r = compress2((Bytef *) c.data(), &compLength,
                          (const Bytef *) src, t.length, Z_BEST_COMPRESSION);
        if (r != Z_OK)
            return error("Could not deflate table");
        // Stored uncompressed unless that saves space
        if (compLength < t.length)
            c.resize(compLength);
        else
            c.assign(src, t.length);
        data.push_back(std::move(c));
    }

    uint32_t offset = woff_header_size + numTables * woff_entry_size;
    std::ostringstream dir;
    for (size_t i = 0; i < tables.size(); i++) {
        writeObject(dir, tables[i].tag);
        writeObject(dir, offset);
        writeObject(dir, (uint32_t) data[i].size());
        writeObject(dir, tables[i].length);
        writeObject(dir, tables[i].checksum);
        offset += pad4(data[i].size());
    }

    std::ostringstream os;
    writeObject(os, tag("wOFF"));
    writeObject(os, flavor);
    writeObject(os, offset);            // length
    writeObject(os, (uint16_t) numTables);
    writeObject(os, (uint16_t) 0);      // reserved
    writeObject(os, totalSfntSize);
    writeObject(os, (uint16_t) 1);      // majorVersion
    writeObject(os, (uint16_t) 0);      // minorVersion
    for (int i = 0; i < 5; i++)         // metadata and private blocks
        writeObject(os, (uint32_t) 0);
    os << dir.str();
    for (auto &d: data) {
        os.write(d.data(), d.size());
        for (uint32_t p = d.size(); p < pad4(d.size()); p++)
            os.put(0);
    }
    if (os.fail())
        return error("Stream write failure");
    woff = os.str();
    return true;
}
