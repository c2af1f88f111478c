/* Copyright 2014 Adobe Systems Incorporated (http://www.adobe.com/). All Rights Reserved.
   This software is licensed as OpenSource, under the Apache License, Version 2.0.
   This license is available at: http://opensource.org/licenses/Apache-2.0. */

/* WOFF 1.0 container packing and unpacking. Tables are deflated with zlib
   when that makes them smaller; metadata and private blocks are neither
   read nor written.
 */

#include <cstdint>
#include <string>
#include <vector>

#pragma once

namespace fontsieve {
    struct sfnt_table;

    /* The table directory of an sfnt, in file order */
    bool readSfntDirectory(const std::string &sfnt,
                           uint32_t &flavor, std::vector<sfnt_table> &tables);
    uint32_t tableChecksum(const char *data, uint32_t length);

    bool decodeWOFF(const std::string &woff, std::string &sfnt);
    bool encodeWOFF(const std::string &sfnt, std::string &woff);
}

struct fontsieve::sfnt_table {
    uint32_t tag = 0;
    uint32_t checksum = 0;
    uint32_t offset = 0;
    uint32_t length = 0;
    // Size of entry in the sfnt table directory
    static const uint32_t entry_size = sizeof(uint32_t) * 4;
};
