#include <string>

#include <nlohmann/json.hpp>

#include "classifier.h"
#include "coverage.h"
#include "metrics.h"
#include "subsetter.h"

#pragma once

/* JSON documents written to stdout. Key order follows insertion. */
namespace fontsieve {
    typedef nlohmann::ordered_json json;

    void to_json(json &j, const bucket_summary &b);
    void to_json(json &j, const coverage_report &r);
    void to_json(json &j, const classification &c);
    void to_json(json &j, const subset_report &r);
    void to_json(json &j, const metrics_report &r);

    json errorDocument(const std::string &message);
    // indent < 0 gives the compact form
    std::string dumpDocument(const json &j, int indent);
}
