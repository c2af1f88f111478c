#include <algorithm>
#include <cmath>
#include <iostream>

#include "coverage.h"

double fontsieve::round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

double fontsieve::coveragePercent(uint64_t covered, uint64_t requested) {
    double p = round2(100.0 * covered / std::max<uint64_t>(1, requested));
    if (covered < requested && p > 99.99)
        p = 99.99;
    return p;
}

static void initBreakdown(fontsieve::coverage_breakdown &b) {
    b[fontsieve::category_bucket::visible];
    b[fontsieve::category_bucket::combining];
    b[fontsieve::category_bucket::control_or_format];
}

static void fileCodepoint(fontsieve::coverage_breakdown &b, uint32_t cp,
                          size_t sampleSize) {
    auto &s = b[fontsieve::bucketFor(cp)];
    std::string e = fontsieve::describeCodepoint(cp);
    s.count++;
    if (s.sample.size() < sampleSize)
        s.sample.push_back(e);
    s.all.push_back(std::move(e));
}

fontsieve::coverage_report
fontsieve::checkCoverage(font_handle &font, const std::string &fontPath,
                         const range_set &requested, const config &conf) {
    coverage_report r;
    const auto &cmap = font.bestCmap();

    r.font = fontPath;
    r.fontCmapSize = cmap.size();
    initBreakdown(r.covered);
    initBreakdown(r.missing);

    if (requested.empty()) {
        r.emptyRequest = true;
        if (conf.verbosity() > 0)
            std::cerr << "No valid codepoints requested" << std::endl;
        return r;
    }

    // Ranges are sorted, so each bucket list comes out in codepoint order
    for (auto &cr: requested.ranges()) {
        auto i = cmap.lower_bound(cr.start);
        for (uint32_t cp = cr.start; ; cp++) {
            while (i != cmap.end() && i->first < cp)
                i++;
            if (i != cmap.end() && i->first == cp) {
                r.coveredTotal++;
                fileCodepoint(r.covered, cp, conf.sampleSize());
            } else {
                r.missingTotal++;
                fileCodepoint(r.missing, cp, conf.sampleSize());
            }
            if (cp == cr.end)
                break;
        }
    }
    r.requestedTotal = r.coveredTotal + r.missingTotal;
    r.coveragePercent = coveragePercent(r.coveredTotal, r.requestedTotal);

    if (conf.verbosity() > 0) {
        std::cerr << "Coverage: " << r.coveredTotal << " of ";
        std::cerr << r.requestedTotal << " requested codepoints" << std::endl;
    }
    return r;
}
