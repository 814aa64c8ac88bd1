//
//  main.cpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <iostream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "subtitle_reader.hpp"
#include "titleparser_version.hpp"
#include <nlohmann/json.hpp>

titleparser::LogVerbosity parse_level(const std::string &s) {
    if (s == "debug") return titleparser::LogVerbosity::Debug;
    if (s == "info") return titleparser::LogVerbosity::Info;
    if (s == "warn" || s == "warning") return titleparser::LogVerbosity::Warn;
    return titleparser::LogVerbosity::Error;
}

nlohmann::json cue_to_json(const titleparser::Cue &cue) {
    nlohmann::json c;
    c["start"] = cue.start.string;
    c["end"] = cue.end.string;
    c["start_ms"] = cue.start.to_milliseconds();
    c["end_ms"] = cue.end.to_milliseconds();
    c["text"] = cue.text;
    return c;
}

void emit_json(const titleparser::ReadResult &res, bool pretty) {
    nlohmann::json j;
    nlohmann::json cues = nlohmann::json::array();
    for (const auto &cue : res.cues) {
        cues.push_back(cue_to_json(cue));
    }
    j["cues"] = cues;
    j["skipped"] = res.skipped_blocks;
    // Cue text is not guaranteed to be valid UTF-8; replace bad sequences rather than throw.
    std::cout << j.dump(pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace)
              << "\n";
}

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "TitleParser " << TITLEPARSER_VERSION_DISPLAY << "\n";
        return 0;
    }

    std::vector<std::string> positional;
    bool pretty = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--pretty") {
            pretty = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            titleparser::set_log_verbosity(parse_level(argv[i + 1]));
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() != 1) {
        std::cerr << "TitleParser " << TITLEPARSER_VERSION_DISPLAY << "\n"
                  << "Copyright (c) 2025 Till Toenshoff\n\n"
                  << "usage:\n"
                  << "  titleparser <input.srt|input.vtt> [--pretty] "
                  << "[--log-level error|warn|info|debug]\n"
                  << "Options:\n"
                  << "  --pretty            Indent the JSON written to stdout.\n"
                  << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
                  << "  --version, -v       Print the version and exit.\n";
        return 2;
    }

    auto res = titleparser::read_subtitle_file(positional[0]);
    if (!res.status.ok) {
        TP_LOG("error", "titleparser: failed to read subtitles: " << res.status.message);
        return 1;
    }
    emit_json(res, pretty);
    return 0;
}
