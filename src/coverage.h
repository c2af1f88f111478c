#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "config.h"
#include "font_handle.h"
#include "unicode_range.h"

#pragma once

namespace fontsieve {
    struct bucket_summary;
    struct coverage_report;
    typedef std::map<category_bucket, bucket_summary> coverage_breakdown;

    /* Every requested codepoint is looked up in the font's best cmap and
       filed under its general category bucket, in the covered or the
       missing breakdown */
    coverage_report checkCoverage(font_handle &font,
                                  const std::string &fontPath,
                                  const range_set &requested,
                                  const config &conf);

    double round2(double v);
    /* Rounded to two decimals; 100.0 only when nothing is missing */
    double coveragePercent(uint64_t covered, uint64_t requested);
}

struct fontsieve::bucket_summary {
    uint64_t count {0};
    std::vector<std::string> sample;
    std::vector<std::string> all;
};

struct fontsieve::coverage_report {
    std::string font;
    bool emptyRequest {false};
    uint64_t requestedTotal {0};
    uint64_t coveredTotal {0};
    uint64_t missingTotal {0};
    double coveragePercent {0.0};
    uint64_t fontCmapSize {0};
    coverage_breakdown covered;
    coverage_breakdown missing;
};
