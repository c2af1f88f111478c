#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "font_handle.h"
#include "unicode_range.h"

#pragma once

namespace fontsieve {
    class subsetter;
    class temp_file;
    struct subset_policy;
    struct subset_report;
    struct tool_result;
    enum class woff2_state { init, direct_attempted, external_attempted,
                             done, failed };
    typedef std::function<std::unique_ptr<font_handle>(const std::filesystem::path &)> font_loader;

    /* Runs argv[0] (searched in PATH) synchronously with stdout and
       stderr discarded */
    tool_result runTool(const std::vector<std::string> &argv);
}

struct fontsieve::subset_policy {
    bool preserveNames {true};
    bool allowDirectWoff2 {true};
};

struct fontsieve::subset_report {
    bool success {false};
    std::string outputPath;
    std::string format;
    uint64_t unicodesRequested {0};
    uint64_t unicodesKept {0};
    std::vector<std::string> normalizedRanges;
    uint32_t glyphsBefore {0};
    uint32_t glyphsAfter {0};
    std::vector<std::string> keptTables;
    std::vector<std::string> droppedTables;
    bool removedMetadata {false};
    bool removedShaping {false};
    std::vector<std::string> losslessOps;
    bool feSafe {false};
    uint64_t fileSize {0};
};

struct fontsieve::tool_result {
    bool found {false};
    bool spawned {false};
    int exitStatus {-1};
    std::string message;
    bool ok() const { return spawned && exitStatus == 0; }
};

/* Removes the file when it goes out of scope, if it exists */
class fontsieve::temp_file {
 public:
    explicit temp_file(std::filesystem::path p) : p(std::move(p)) {}
    temp_file(const temp_file &) = delete;
    ~temp_file() {
        std::error_code ec;
        std::filesystem::remove(p, ec);
    }
    const std::filesystem::path &path() const { return p; }
 private:
    std::filesystem::path p;
};

class fontsieve::subsetter {
 public:
    subsetter(const config &conf, range_parser &parser, font_loader loader)
        : conf(conf), parser(parser), loader(std::move(loader)) {}

    /* Throws fontsieve::error for a missing input, an output directory
       that cannot be created, an empty range, a failed subset or write,
       and an exhausted WOFF2 fallback chain */
    subset_report run(const std::filesystem::path &input,
                      const std::filesystem::path &output,
                      const std::string &rangeSpec,
                      const subset_policy &policy);

    woff2_state lastWoff2State() const { return state; }

    static font_flavor outputFlavor(const std::filesystem::path &output,
                                    font_flavor native);
 private:
    void repackWoff2(font_handle &font, const std::filesystem::path &output,
                     bool allowDirect, subset_report &r);
    void runExternal(font_handle &font, const std::filesystem::path &output,
                     bool directTried, subset_report &r);

    const config &conf;
    range_parser &parser;
    font_loader loader;
    woff2_state state {woff2_state::init};
};
