#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "argparse.hpp"

#include "classifier.h"
#include "config.h"
#include "coverage.h"
#include "error.h"
#include "hb_font_handle.h"
#include "json_report.h"
#include "metrics.h"
#include "subsetter.h"
#include "unicode_range.h"

static std::unique_ptr<fontsieve::font_handle>
openFont(const std::filesystem::path &p, const fontsieve::config &conf) {
    if (!std::filesystem::exists(p))
        throw fontsieve::error(fontsieve::error_kind::input_not_found,
                               "Input font not found: " + p.string());
    return fontsieve::hb_font_handle::open(p, conf);
}

static int outputIndent(argparse::ArgumentParser &program) {
    if (program.is_subcommand_used("coverage"))
        return program.at<argparse::ArgumentParser>("coverage")["--pretty"] == true ? 2 : -1;
    if (program.is_subcommand_used("identify"))
        return program.at<argparse::ArgumentParser>("identify")["--pretty"] == true ? 2 : -1;
    if (program.is_subcommand_used("subset"))
        return program.at<argparse::ArgumentParser>("subset")["--quiet"] == true ? -1 : 2;
    if (program.is_subcommand_used("metrics"))
        return program.at<argparse::ArgumentParser>("metrics")["--quiet"] == true ? -1 : 2;
    return -1;
}

fontsieve::json dispatch(argparse::ArgumentParser &program,
                         fontsieve::config &conf) {
    fontsieve::json doc;

    if (program.is_used("-c"))
        conf.load(program.get<std::string>("-c"));
    fontsieve::range_parser parser(conf.rangeCacheCapacity());

    if (program.is_subcommand_used("coverage")) {
        auto &coverage = program.at<argparse::ArgumentParser>("coverage");
        std::string fpath = coverage.get<std::string>("font");
        auto rs = parser.parse(coverage.get<std::string>("unicode_range"));
        auto font = openFont(fpath, conf);
        doc = fontsieve::checkCoverage(*font, fpath, rs, conf);
    } else if (program.is_subcommand_used("identify")) {
        auto &identify = program.at<argparse::ArgumentParser>("identify");
        auto font = openFont(identify.get<std::string>("font"), conf);
        doc = fontsieve::classify(*font, conf);
    } else if (program.is_subcommand_used("subset")) {
        auto &subset = program.at<argparse::ArgumentParser>("subset");
        fontsieve::subset_policy policy;
        policy.preserveNames = subset["--no-preserve-names"] == false;
        policy.allowDirectWoff2 = subset["--no-direct-woff2"] == false;

        fontsieve::subsetter ss(conf, parser,
                                [&conf](const std::filesystem::path &p) {
                                    return fontsieve::hb_font_handle::open(p, conf);
                                });
        doc = ss.run(subset.get<std::string>("input_font"),
                     subset.get<std::string>("output_font"),
                     subset.get<std::string>("unicode_range"), policy);
    } else if (program.is_subcommand_used("metrics")) {
        auto &metrics = program.at<argparse::ArgumentParser>("metrics");
        auto rs = parser.parse(metrics.get<std::string>("unicode_range"));
        auto font = openFont(metrics.get<std::string>("font_path"), conf);
        doc = fontsieve::computeMetrics(*font, rs, conf);
    } else {
        throw std::runtime_error("No command specified");
    }
    return doc;
}

int main(int argc, char **argv) {
    fontsieve::config conf;

    argparse::ArgumentParser program("fontsieve");

    program.add_argument("-c", "--config-file")
           .help("Path of YAML configuration file");
    program.add_argument("-V", "--verbose")
           .help("Provide verbose messages on stderr "
                 "(repeat up to 3 times for more info)")
           .action([&](const auto &) { conf.increaseVerbosity(); })
           .append()
           .default_value(false)
           .implicit_value(true)
           .nargs(0);
    program.add_argument("--no-catch")
           .help("Don't catch exceptions (for debugging)")
           .default_value(false)
           .implicit_value(true);

    argparse::ArgumentParser coverage("coverage");
    coverage.add_description("Check font coverage against a unicode-range "
                             "specification");
    coverage.add_argument("font")
            .help("Path to font (ttf/otf/woff2)");
    coverage.add_argument("unicode_range")
            .help("e.g. \"U+0000-00FF, U+0131, U+0152-0153\"");
    coverage.add_argument("--pretty")
            .help("Pretty-print JSON")
            .default_value(false)
            .implicit_value(true);

    argparse::ArgumentParser identify("identify");
    identify.add_description("Classify a font as emoji, symbol, barcode "
                             "or non-textual");
    identify.add_argument("font")
            .help("Path to font (ttf/otf/woff2)");
    identify.add_argument("--pretty")
            .help("Pretty-print JSON")
            .default_value(false)
            .implicit_value(true);

    argparse::ArgumentParser subset("subset");
    subset.add_description("Subset a font and optionally convert to WOFF2");
    subset.add_argument("input_font")
          .help("Path to input font file");
    subset.add_argument("output_font")
          .help("Path to output font file (.ttf/.otf or .woff2)");
    subset.add_argument("unicode_range")
          .help("Unicode range (e.g., 'U+0000-00FF,U+0131')");
    subset.add_argument("--preserve-names")
          .help("Preserve font name records (the default)")
          .default_value(true)
          .implicit_value(true);
    subset.add_argument("--no-preserve-names")
          .help("Drop name records")
          .default_value(false)
          .implicit_value(true);
    subset.add_argument("--no-direct-woff2")
          .help("Skip the in-process WOFF2 encoder and use the external "
                "compressor")
          .default_value(false)
          .implicit_value(true);
    subset.add_argument("--quiet")
          .help("Compact JSON output")
          .default_value(false)
          .implicit_value(true);

    argparse::ArgumentParser metrics("metrics");
    metrics.add_description("Advance width statistics over a unicode range");
    metrics.add_argument("font_path")
           .help("Path to font (ttf/otf/woff2)");
    metrics.add_argument("unicode_range")
           .help("Unicode range (e.g., 'U+0000-00FF,U+0131')");
    metrics.add_argument("--quiet")
           .help("Compact JSON output")
           .default_value(false)
           .implicit_value(true);

    program.add_subparser(coverage);
    program.add_subparser(identify);
    program.add_subparser(subset);
    program.add_subparser(metrics);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception &ex) {
        std::cerr << ex.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    fontsieve::json doc;
    if (program["--no-catch"] == true) {
        doc = dispatch(program, conf);
    } else {
        try {
            doc = dispatch(program, conf);
        } catch (const fontsieve::error &ex) {
            if (conf.verbosity() > 0) {
                std::cerr << fontsieve::error_kind_name(ex.kind()) << ": ";
                std::cerr << ex.what() << std::endl;
            }
            doc = fontsieve::errorDocument(ex.what());
        } catch (const std::exception &ex) {
            if (conf.verbosity() > 0)
                std::cerr << "Exception thrown: " << ex.what() << std::endl;
            doc = fontsieve::errorDocument(ex.what());
        }
    }

    std::cout << fontsieve::dumpDocument(doc, outputIndent(program));
    std::cout << std::endl;
    return doc.contains("error") ? 1 : 0;
}
