#include "json_report.h"

void fontsieve::to_json(json &j, const bucket_summary &b) {
    j = json{{"count", b.count}, {"sample", b.sample}, {"all", b.all}};
}

static fontsieve::json breakdown(const fontsieve::coverage_breakdown &b) {
    fontsieve::json j = fontsieve::json::object();
    for (auto k: {fontsieve::category_bucket::visible,
                  fontsieve::category_bucket::combining,
                  fontsieve::category_bucket::control_or_format}) {
        auto i = b.find(k);
        j[fontsieve::bucketName(k)] = i == b.end() ? fontsieve::bucket_summary()
                                                   : i->second;
    }
    return j;
}

void fontsieve::to_json(json &j, const coverage_report &r) {
    j = json::object();
    j["font"] = r.font;
    if (r.emptyRequest)
        j["empty_request"] = true;
    j["requested_total"] = r.requestedTotal;
    j["covered_total"] = r.coveredTotal;
    j["missing_total"] = r.missingTotal;
    j["coverage_percent"] = r.coveragePercent;
    j["covered_breakdown"] = breakdown(r.covered);
    j["missing_breakdown"] = breakdown(r.missing);
    j["font_cmap_size"] = r.fontCmapSize;
}

void fontsieve::to_json(json &j, const classification &c) {
    j = json{{"is_emoji", c.isEmoji},
             {"is_symbol", c.isSymbol},
             {"is_barcode", c.isBarcode},
             {"is_non_textual", c.isNonTextual}};
}

void fontsieve::to_json(json &j, const subset_report &r) {
    j = json::object();
    j["success"] = r.success;
    j["output_path"] = r.outputPath;
    j["format"] = r.format;
    j["unicodes_requested"] = r.unicodesRequested;
    j["unicodes_kept"] = r.unicodesKept;
    j["normalized_ranges"] = r.normalizedRanges;
    j["glyphs_before"] = r.glyphsBefore;
    j["glyphs_after"] = r.glyphsAfter;
    j["kept_tables"] = r.keptTables;
    j["removed_metadata"] = r.removedMetadata;
    j["removed_shaping"] = r.removedShaping;
    j["dropped_tables"] = r.droppedTables;
    j["lossless_ops"] = r.losslessOps;
    j["fe_safe"] = r.feSafe;
    j["file_size"] = r.fileSize;
}

void fontsieve::to_json(json &j, const metrics_report &r) {
    j = json::object();
    j["postscriptName"] = r.postscriptName;
    j["familyName"] = r.familyName;
    j["unitsPerEm"] = r.unitsPerEm;
    j["processed"] = r.processed;
    j["attempted"] = r.attempted;
    j["coverage_ratio"] = r.coverageRatio;
    if (r.empty()) {
        j["xAvgCharWidth"] = 0;
        j["xMedianCharWidth"] = 0;
        j["xStdCharWidth"] = 0;
    } else {
        j["xAvgCharWidth"] = r.avgWidth;
        j["xMedianCharWidth"] = r.medianWidth;
        j["xStdCharWidth"] = r.stdWidth;
    }
    j["method"] = r.method();
}

fontsieve::json fontsieve::errorDocument(const std::string &message) {
    return json{{"error", message}};
}

std::string fontsieve::dumpDocument(const json &j, int indent) {
    // Name strings come from the font and may not be valid UTF-8
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}
