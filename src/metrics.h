#include <cstdint>
#include <string>
#include <vector>

#include "config.h"
#include "font_handle.h"
#include "unicode_range.h"

#pragma once

namespace fontsieve {
    struct metrics_report;

    /* Advance width statistics over the cmap entries that fall in the
       requested range. Throws fontsieve::error (invalid_range_spec) when
       the range set is empty. */
    metrics_report computeMetrics(font_handle &font, const range_set &requested,
                                  const config &conf);

    double median(std::vector<double> v);
}

struct fontsieve::metrics_report {
    std::string postscriptName {"Unknown"};
    std::string familyName {"Unknown"};
    uint32_t unitsPerEm {1000};
    uint64_t processed {0};
    uint64_t attempted {0};
    double coverageRatio {0.0};
    double avgWidth {0.0};
    double medianWidth {0.0};
    double stdWidth {0.0};
    bool empty() const { return processed == 0; }
    const char *method() const {
        return empty() ? "no_glyphs_in_subset" : "cmap+hmtx_mean";
    }
};
