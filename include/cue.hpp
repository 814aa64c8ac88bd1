//
//  cue.hpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "parse_status.hpp"
#include "timecode.hpp"

namespace titleparser {

/// @ingroup api
/// One SRT / WebVTT cue:
///
///     14
///     00:01:14.815 --> 00:01:18.114
///     - This line belongs to a subtitle cue.
///     - This line is also a member of the same cue.
struct Cue {
    TimeCode start;    ///< Cue appears
    TimeCode end;      ///< Cue disappears (not checked against start)
    std::string text;  ///< Sanitized lines joined with '\n'
};

struct CueResult {
    ParseStatus status;
    std::optional<Cue> cue;
};

/**
 * @brief Parse one cue block (identifier line optional, timing line, text lines).
 *
 * Exactly one line must look like `<timecode> --> <timecode>[ settings]` and at most one line may
 * precede it. Cue settings are discarded. Lines after the timing line are sanitized and become
 * the cue text. Fails with `ParseError::MalformedCue`; no partial cue is returned.
 */
CueResult parse_cue(std::string_view block);  ///< @ingroup api

}  // namespace titleparser

#ifdef TITLEPARSER_TESTING
// Test-only wrapper that exposes timing-line matching on a single line.
std::optional<std::pair<titleparser::TimeCode, titleparser::TimeCode>>
parse_timing_line_for_test(std::string_view line);
#endif
