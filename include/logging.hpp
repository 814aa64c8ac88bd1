//
//  logging.hpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace titleparser {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Text-preview helper used in debug logs to show the head of a cue block on one line.
inline constexpr size_t kTextPreviewChars = 32;
inline std::string text_preview(std::string_view text, size_t max_len = kTextPreviewChars) {
    std::string out;
    size_t limit = std::min(max_len, text.size());
    // Never cut inside a UTF-8 sequence.
    while (limit > 0 && limit < text.size() &&
           (static_cast<unsigned char>(text[limit]) & 0xC0) == 0x80) {
        --limit;
    }
    out.reserve(limit + 3);
    for (size_t i = 0; i < limit; ++i) {
        const char c = text[i];
        if (c == '\n') {
            out += "\\n";
        } else if (c != '\r') {
            out += c;
        }
    }
    if (limit < text.size()) {
        out += "...";
    }
    return out;
}

}  // namespace titleparser

inline constexpr titleparser::LogVerbosity tp_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return titleparser::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return titleparser::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return titleparser::LogVerbosity::Info;
    }
    // Everything else (cue/timecode/reader/etc.) treated as debug-level.
    return titleparser::LogVerbosity::Debug;
}

inline bool tp_should_log(const char* level) {
    const auto current = titleparser::get_log_verbosity();
    const auto sev = tp_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void tp_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[TitleParser][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[TitleParser][" << level << "] " << msg << std::endl;
    }
}

#define TP_LOG(level, message)                                              \
    do {                                                                    \
        if (tp_should_log(level)) {                                         \
            std::ostringstream _tp_log_ss;                                  \
            _tp_log_ss << message;                                          \
            tp_log_impl(level, _tp_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
