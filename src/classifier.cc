#include <cmath>
#include <cstring>
#include <iostream>
#include <regex>
#include <string>
#include <vector>

#include "classifier.h"
#include "tag.h"

static const char *barcodeNamePattern =
    "(barcode|code[\\s\\-]?39|code[\\s\\-]?128|ean|upc|itf|interleaved|msi"
    "|plessey|codabar|pdf417|datamatrix|qr|aztec)";

bool fontsieve::isCode39Char(uint32_t cp) {
    if (cp > 0x7F || cp == 0)
        return false;
    return std::strchr("ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789- .$/+%",
                       (int) cp) != nullptr;
}

static bool isUpper(uint32_t cp) { return cp >= 0x41 && cp <= 0x5A; }
static bool isLower(uint32_t cp) { return cp >= 0x61 && cp <= 0x7A; }
static bool isDigit(uint32_t cp) { return cp >= 0x30 && cp <= 0x39; }

static std::string barcodeNameBlob(fontsieve::font_handle &font) {
    std::string blob;
    for (uint16_t nid: {1, 4, 6}) {
        auto n = font.nameRecord(nid, 3, 1);
        if (!n)
            n = font.nameRecord(nid, 1, 0);
        if (!n || n->empty())
            continue;
        if (!blob.empty())
            blob += " ";
        blob += *n;
    }
    return blob;
}

bool fontsieve::detectBarcode(font_handle &font, const config &conf) {
    const auto &bc = conf.barcode();
    bool verbose = conf.verbosity() > 1;

    std::string names = barcodeNameBlob(font);
    std::regex re(barcodeNamePattern, std::regex::ECMAScript | std::regex::icase);
    if (std::regex_search(names, re)) {
        if (verbose)
            std::cerr << "Barcode: name match in \"" << names << "\"" << std::endl;
        return true;
    }

    const auto &cmap = font.bestCmap();
    if (cmap.empty())
        return false;

    std::vector<uint32_t> latin;
    uint32_t uppers = 0, lowers = 0, digits = 0, code39 = 0;
    for (auto i = cmap.lower_bound(0x20); i != cmap.end() && i->first <= 0x7E; i++) {
        uint32_t cp = i->first;
        latin.push_back(cp);
        if (isUpper(cp))
            uppers++;
        else if (isLower(cp))
            lowers++;
        else if (isDigit(cp))
            digits++;
        if (isCode39Char(cp))
            code39++;
    }
    if (latin.size() < bc.min_latin) {
        if (verbose)
            std::cerr << "Barcode: only " << latin.size() << " ASCII characters" << std::endl;
        return false;
    }

    double overlap = (double) code39 / latin.size();
    bool coverageLike = overlap >= bc.code39_ratio && lowers <= bc.max_lowercase &&
                        uppers + digits >= bc.min_upper_digits;

    std::vector<double> widths;
    for (size_t k = 0; k < latin.size() && k < bc.width_sample; k++) {
        auto aw = font.advanceWidth(cmap.at(latin[k]));
        if (aw)
            widths.push_back(aw->first);
    }
    bool widthUniform = false;
    double cv = 0.0;
    if (widths.size() >= bc.min_width_samples) {
        double mean = 0.0, var = 0.0;
        for (auto w: widths)
            mean += w;
        mean /= widths.size();
        if (mean > 0) {
            for (auto w: widths)
                var += (w - mean) * (w - mean);
            var /= widths.size();
            cv = std::sqrt(var) / mean;
            widthUniform = cv < bc.max_width_cv;
        }
    }

    int16_t xh = font.xHeight().value_or(0);
    uint32_t upem = font.unitsPerEm();
    uint32_t tall = 0, sampled = 0;
    double tallRatio = 0.0;
    for (size_t k = 0; k < latin.size() && k < bc.bbox_sample; k++) {
        auto b = font.glyphBounds(cmap.at(latin[k]));
        if (!b)
            continue;
        sampled++;
        if (upem && (double) (b->second - b->first) / upem > bc.tall_height_ratio)
            tall++;
    }
    if (sampled > 0)
        tallRatio = (double) tall / sampled;
    bool verticalHint = xh == 0 || tallRatio >= bc.tall_fraction;

    if (verbose) {
        std::cerr << "Barcode: code39 overlap " << overlap;
        std::cerr << (coverageLike ? " (like)" : " (unlike)");
        std::cerr << ", width cv " << cv << " over " << widths.size();
        std::cerr << (widthUniform ? " (uniform)" : " (varied)");
        std::cerr << ", xHeight " << xh << ", tall boxes " << tall;
        std::cerr << "/" << sampled << std::endl;
    }
    return coverageLike && widthUniform && verticalHint;
}

fontsieve::classification fontsieve::classify(font_handle &font,
                                              const config &conf) {
    classification c;
    auto tables = font.tables();
    bool verbose = conf.verbosity() > 1;

    // CPAL and CBLC only ever come paired with COLR and CBDT
    c.isEmoji = tables.count(T_COLR) || tables.count(T_CBDT) ||
                tables.count(T_SBIX) || tables.count(T_SVG);

    auto ft = font.panoseFamilyType();
    if (ft && *ft == 5) {
        c.isSymbol = true;
        if (verbose)
            std::cerr << "Symbol: PANOSE family type 5" << std::endl;
    } else {
        for (auto f: font.cmapSubtableFormats()) {
            if (f == 13) {
                c.isSymbol = true;
                if (verbose)
                    std::cerr << "Symbol: cmap format 13 subtable" << std::endl;
                break;
            }
        }
    }

    const auto &cmap = font.bestCmap();
    if (cmap.empty()) {
        c.isNonTextual = true;
        c.isBarcode = false;
        return c;
    }

    uint32_t letters = 0, digits = 0;
    for (auto i = cmap.lower_bound(0x20); i != cmap.end() && i->first <= 0x7E; i++) {
        if (isUpper(i->first) || isLower(i->first))
            letters++;
        else if (isDigit(i->first))
            digits++;
    }
    const auto &nt = conf.nonTextual();
    c.isNonTextual = letters < nt.min_letters && digits < nt.min_digits;
    if (verbose) {
        std::cerr << "ASCII letters " << letters << ", digits " << digits;
        std::cerr << std::endl;
    }

    if (!c.isEmoji && !c.isSymbol)
        c.isBarcode = detectBarcode(font, conf);
    return c;
}
