#include <cstdint>

#include "config.h"
#include "font_handle.h"

#pragma once

namespace fontsieve {
    struct classification;

    classification classify(font_handle &font, const config &conf);

    /* True on a barcode-ish name, or when the printable ASCII repertoire
       looks like Code 39 with uniform advances and tall boxes */
    bool detectBarcode(font_handle &font, const config &conf);

    bool isCode39Char(uint32_t cp);
}

struct fontsieve::classification {
    bool isEmoji {false};
    bool isSymbol {false};
    bool isBarcode {false};
    bool isNonTextual {false};
};
