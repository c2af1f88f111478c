#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <iterator>
#include <set>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>

#include "error.h"
#include "subsetter.h"
#include "tag.h"

extern char **environ;

fontsieve::tool_result fontsieve::runTool(const std::vector<std::string> &argv) {
    tool_result tr;
    if (argv.empty()) {
        tr.message = "Empty command";
        return tr;
    }

    std::vector<char *> args;
    for (auto &a: argv)
        args.push_back(const_cast<char *>(a.c_str()));
    args.push_back(nullptr);

    posix_spawn_file_actions_t fa;
    posix_spawn_file_actions_init(&fa);
    posix_spawn_file_actions_addopen(&fa, STDOUT_FILENO, "/dev/null",
                                     O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&fa, STDERR_FILENO, "/dev/null",
                                     O_WRONLY, 0);

    pid_t pid;
    int e = posix_spawnp(&pid, args[0], &fa, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&fa);
    if (e != 0) {
        tr.found = (e != ENOENT);
        tr.message = std::string("Could not run ") + argv[0] + ": " +
                     std::strerror(e);
        return tr;
    }
    tr.found = tr.spawned = true;

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            tr.message = std::string("Could not wait for ") + argv[0] + ": " +
                         std::strerror(errno);
            return tr;
        }
    }
    if (WIFEXITED(status)) {
        tr.exitStatus = WEXITSTATUS(status);
        // the shell reports an exec failure as 127
        if (tr.exitStatus == 127)
            tr.found = false;
    } else {
        tr.message = std::string(argv[0]) + " terminated by a signal";
    }
    return tr;
}

fontsieve::font_flavor
fontsieve::subsetter::outputFlavor(const std::filesystem::path &output,
                                   font_flavor native) {
    std::string ext = output.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (ext == ".ttf")
        return font_flavor::ttf;
    else if (ext == ".otf")
        return font_flavor::otf;
    else if (ext == ".woff")
        return font_flavor::woff;
    else if (ext == ".woff2")
        return font_flavor::woff2;
    return native;
}

void fontsieve::subsetter::runExternal(font_handle &font,
                                       const std::filesystem::path &output,
                                       bool directTried,
                                       subset_report &r) {
    std::filesystem::path dir = output.parent_path();
    std::string stem = output.stem().string();
    temp_file tmp(dir / (stem + "_temp.ttf"));
    temp_file generated(dir / (stem + "_temp.woff2"));

    state = woff2_state::external_attempted;
    if (!font.save(tmp.path(), font_flavor::ttf)) {
        state = woff2_state::failed;
        throw error(error_kind::write_failure,
                    "Could not write temporary font " + tmp.path().string());
    }

    std::vector<std::string> cmd = conf.woff2Compressor();
    if (cmd.empty()) {
        state = woff2_state::failed;
        throw error(error_kind::external_tool_missing,
                    "No WOFF2 compressor configured");
    }
    const std::string tool = cmd.front();
    cmd.push_back(tmp.path().string());
    if (conf.verbosity() > 1)
        std::cerr << "Running " << tool << " on " << tmp.path() << std::endl;

    tool_result tr = runTool(cmd);
    if (!tr.found) {
        state = woff2_state::failed;
        std::string m = tool + " not found in PATH";
        if (directTried)
            m = "Direct WOFF2 failed and " + m;
        throw error(error_kind::external_tool_missing, m);
    }
    if (!tr.ok()) {
        state = woff2_state::failed;
        std::string m = tr.message;
        if (m.empty())
            m = tool + " exited with status " + std::to_string(tr.exitStatus);
        throw error(error_kind::external_tool_failed, m);
    }
    if (!std::filesystem::exists(generated.path())) {
        state = woff2_state::failed;
        throw error(error_kind::external_tool_failed,
                    "WOFF2 file was not generated by " + tool);
    }

    std::error_code ec;
    std::filesystem::rename(generated.path(), output, ec);
    if (ec) {
        state = woff2_state::failed;
        throw error(error_kind::write_failure,
                    "Could not move " + generated.path().string() + " to " +
                    output.string() + ": " + ec.message());
    }
    r.losslessOps.push_back("repack:woff2(cli)");
    state = woff2_state::done;
}

void fontsieve::subsetter::repackWoff2(font_handle &font,
                                       const std::filesystem::path &output,
                                       bool allowDirect, subset_report &r) {
    state = woff2_state::init;
    if (allowDirect) {
        state = woff2_state::direct_attempted;
        if (font.save(output, font_flavor::woff2)) {
            r.losslessOps.push_back("repack:woff2");
            state = woff2_state::done;
            return;
        }
        if (conf.verbosity() > 1)
            std::cerr << "Direct WOFF2 save failed, trying external "
                         "compressor" << std::endl;
    }
    runExternal(font, output, state == woff2_state::direct_attempted, r);
}

static std::vector<std::string> tagStrings(const std::set<uint32_t> &tags) {
    std::vector<std::string> v;
    for (auto t: tags)
        v.push_back(otag(t).str());
    std::sort(v.begin(), v.end());
    return v;
}

fontsieve::subset_report
fontsieve::subsetter::run(const std::filesystem::path &input,
                          const std::filesystem::path &output,
                          const std::string &rangeSpec,
                          const subset_policy &policy) {
    subset_report r;
    std::error_code ec;

    if (!std::filesystem::exists(input, ec))
        throw error(error_kind::input_not_found,
                    "Input font not found: " + input.string());

    std::filesystem::path outDir = output.parent_path();
    if (outDir.empty())
        outDir = ".";
    std::filesystem::create_directories(outDir, ec);
    if (ec)
        throw error(error_kind::output_dir_failure,
                    "Could not create output directory " + outDir.string() +
                    ": " + ec.message());

    range_set requested = parser.parse(rangeSpec);
    if (requested.empty())
        throw error(error_kind::empty_range, "No valid unicode codepoints found");

    std::unique_ptr<font_handle> font = loader(input);

    r.glyphsBefore = font->glyphCount();
    std::set<uint32_t> before = font->tables();

    wr_set unicodes;
    requested.addTo(unicodes);
    subset_options so;
    so.preserveNames = policy.preserveNames;
    if (!font->subset(unicodes, so))
        throw error(error_kind::subset_failure,
                    "Subsetting failed: could not subset " + input.string());

    r.glyphsAfter = font->glyphCount();
    std::set<uint32_t> after = font->tables();
    std::set<uint32_t> dropped;
    std::set_difference(before.begin(), before.end(), after.begin(),
                        after.end(), std::inserter(dropped, dropped.end()));
    r.keptTables = tagStrings(after);
    r.droppedTables = tagStrings(dropped);

    font_flavor f = outputFlavor(output, font->nativeFlavor());
    if (conf.verbosity() > 0) {
        std::cerr << "Writing " << flavorName(f) << " to " << output;
        std::cerr << std::endl;
    }
    if (f == font_flavor::woff2) {
        repackWoff2(*font, output, policy.allowDirectWoff2, r);
    } else if (!font->save(output, f)) {
        throw error(error_kind::write_failure,
                    "Could not write output font " + output.string());
    }

    r.format = flavorName(f);
    r.outputPath = output.string();
    r.unicodesRequested = requested.size();
    for (auto &[cp, gid]: font->bestCmap())
        if (requested.contains(cp))
            r.unicodesKept++;
    r.normalizedRanges = requested.normalized();
    r.removedMetadata = after.count(T_NAME) == 0;
    r.removedShaping = !after.count(T_GSUB) && !after.count(T_GPOS) &&
                       !after.count(T_GDEF);

    bool lostShaping = false;
    for (auto t: {T_GSUB, T_GPOS, T_GDEF})
        if (before.count(t) && !after.count(t))
            lostShaping = true;
    static const std::set<std::string> feFormats = {"ttf", "otf", "woff",
                                                    "woff2"};
    r.feSafe = feFormats.count(r.format) && policy.preserveNames &&
               !lostShaping;

    r.fileSize = std::filesystem::file_size(output, ec);
    if (ec)
        throw error(error_kind::write_failure,
                    "Could not stat output font " + output.string());

    font->close();
    r.success = true;
    return r;
}
