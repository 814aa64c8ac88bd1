//
//  cue.cpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "cue.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "logging.hpp"
#include "text_sanitizer.hpp"

namespace titleparser {

namespace {

constexpr std::string_view kArrow = " --> ";
constexpr std::string_view kTimecodeChars = "0123456789:.,";
constexpr size_t kMinTimecodeChars = 9;

// ASCII whitespace plus the UTF-8 encoded Unicode White_Space characters.
constexpr std::string_view kUnicodeSpaces[] = {
    "\xC2\x85",     "\xC2\xA0",     "\xE1\x9A\x80", "\xE2\x80\x80", "\xE2\x80\x81",
    "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86",
    "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", "\xE2\x80\xA8",
    "\xE2\x80\xA9", "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80"};

constexpr std::string_view kAsciiSpaces = " \t\n\v\f\r";

size_t leading_space_len(std::string_view s) {
    if (s.empty()) {
        return 0;
    }
    if (kAsciiSpaces.find(s.front()) != std::string_view::npos) {
        return 1;
    }
    for (const auto &sp : kUnicodeSpaces) {
        if (s.compare(0, sp.size(), sp) == 0) {
            return sp.size();
        }
    }
    return 0;
}

size_t trailing_space_len(std::string_view s) {
    if (s.empty()) {
        return 0;
    }
    if (kAsciiSpaces.find(s.back()) != std::string_view::npos) {
        return 1;
    }
    for (const auto &sp : kUnicodeSpaces) {
        if (s.size() >= sp.size() && s.compare(s.size() - sp.size(), sp.size(), sp) == 0) {
            return sp.size();
        }
    }
    return 0;
}

std::string_view trim(std::string_view s) {
    for (size_t n = leading_space_len(s); n != 0; n = leading_space_len(s)) {
        s.remove_prefix(n);
    }
    for (size_t n = trailing_space_len(s); n != 0; n = trailing_space_len(s)) {
        s.remove_suffix(n);
    }
    return s;
}

std::vector<std::string> split_lines(std::string_view block) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (true) {
        const size_t nl = block.find('\n', pos);
        std::string line(block.substr(pos, nl == std::string_view::npos ? nl : nl - pos));
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.emplace_back(std::move(line));
        if (nl == std::string_view::npos) {
            break;
        }
        pos = nl + 1;
    }
    return lines;
}

struct TimingMatch {
    std::string start;
    std::string end;
};

// Loose shape of a timing line: `<timecode-ish> --> <timecode-ish>[ settings]`, each side at
// least nine of [0-9:.,]. Both sides are validated by parse_timecode afterwards.
std::optional<TimingMatch> match_timing_line(std::string_view line) {
    const size_t start_len = std::min(line.find_first_not_of(kTimecodeChars), line.size());
    if (start_len < kMinTimecodeChars || line.compare(start_len, kArrow.size(), kArrow) != 0) {
        return std::nullopt;
    }
    const size_t end_pos = start_len + kArrow.size();
    const size_t end_stop = std::min(line.find_first_not_of(kTimecodeChars, end_pos), line.size());
    if (end_stop - end_pos < kMinTimecodeChars) {
        return std::nullopt;
    }
    if (end_stop != line.size()) {
        if (line[end_stop] != ' ') {
            return std::nullopt;
        }
        TP_LOG("cue", "discarding cue settings '" << text_preview(line.substr(end_stop)) << "'");
    }
    return TimingMatch{std::string(line.substr(0, start_len)),
                       std::string(line.substr(end_pos, end_stop - end_pos))};
}

CueResult malformed(std::string message) {
    CueResult result;
    result.status = make_error_status(ParseError::MalformedCue, std::move(message));
    return result;
}

}  // namespace

CueResult parse_cue(std::string_view block) {
    const auto lines = split_lines(trim(block));

    size_t timing_index = lines.size();
    std::optional<TimingMatch> timing;
    for (size_t i = 0; i < lines.size(); ++i) {
        auto match = match_timing_line(lines[i]);
        if (!match) {
            continue;
        }
        if (timing) {
            TP_LOG("cue", "second timing line at line " << i + 1 << " in '"
                                                        << text_preview(block) << "'");
            return malformed("ambiguous cue: more than one timing line");
        }
        timing = std::move(match);
        timing_index = i;
    }
    if (!timing) {
        TP_LOG("cue", "no timing line in '" << text_preview(block) << "'");
        return malformed("not a valid cue: no timing line");
    }
    // Only a single identifier line may precede the timing line.
    if (timing_index > 1) {
        TP_LOG("cue", "timing line at line " << timing_index + 1 << " in '"
                                             << text_preview(block) << "'");
        return malformed("not a valid cue: more than one line before timing line");
    }

    auto start = parse_timecode(timing->start);
    if (!start.status.ok) {
        return malformed("invalid start timecode '" + timing->start + "'");
    }
    auto end = parse_timecode(timing->end);
    if (!end.status.ok) {
        return malformed("invalid end timecode '" + timing->end + "'");
    }

    std::string text;
    for (size_t i = timing_index + 1; i < lines.size(); ++i) {
        if (i != timing_index + 1) {
            text += '\n';
        }
        text += sanitize_text(lines[i]);
    }

    CueResult result;
    result.cue = Cue{std::move(*start.timecode), std::move(*end.timecode), std::move(text)};
    result.status = make_ok_status();
    return result;
}

}  // namespace titleparser

#ifdef TITLEPARSER_TESTING
std::optional<std::pair<titleparser::TimeCode, titleparser::TimeCode>>
parse_timing_line_for_test(std::string_view line) {
    auto match = titleparser::match_timing_line(line);
    if (!match) {
        return std::nullopt;
    }
    auto start = titleparser::parse_timecode(match->start);
    auto end = titleparser::parse_timecode(match->end);
    if (!start.status.ok || !end.status.ok) {
        return std::nullopt;
    }
    return std::make_pair(std::move(*start.timecode), std::move(*end.timecode));
}
#endif
