#include <algorithm>
#include <cmath>
#include <iostream>

#include "error.h"
#include "metrics.h"

double fontsieve::median(std::vector<double> v) {
    if (v.empty())
        return 0.0;
    std::sort(v.begin(), v.end());
    size_t h = v.size() / 2;
    if (v.size() % 2)
        return v[h];
    return (v[h - 1] + v[h]) / 2.0;
}

fontsieve::metrics_report
fontsieve::computeMetrics(font_handle &font, const range_set &requested,
                          const config &conf) {
    metrics_report r;

    if (auto n = font.firstNameRecord(1))
        r.familyName = *n;
    if (auto n = font.firstNameRecord(6))
        r.postscriptName = *n;
    r.unitsPerEm = font.unitsPerEm();

    if (requested.empty())
        throw error(error_kind::invalid_range_spec,
                    "empty_or_invalid_unicode_range");

    wr_set target;
    requested.addTo(target);

    std::vector<double> widths;
    for (auto &[cp, gid]: font.bestCmap()) {
        if (!target.has(cp))
            continue;
        r.attempted++;
        if (auto aw = font.advanceWidth(gid))
            widths.push_back(aw->first);
    }
    r.processed = widths.size();
    r.coverageRatio = r.attempted ? (double) r.processed / r.attempted : 0.0;

    if (!widths.empty()) {
        double sum = 0.0, var = 0.0;
        for (auto w: widths)
            sum += w;
        r.avgWidth = sum / widths.size();
        r.medianWidth = median(widths);
        if (widths.size() > 1) {
            for (auto w: widths)
                var += (w - r.avgWidth) * (w - r.avgWidth);
            r.stdWidth = std::sqrt(var / widths.size());
        }
    }

    if (conf.verbosity() > 0) {
        std::cerr << "Metrics: " << r.processed << " of " << r.attempted;
        std::cerr << " mapped glyphs have advances" << std::endl;
    }
    return r;
}
