//
//  timecode.hpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "parse_status.hpp"

namespace titleparser {

/// @ingroup api
/// One SRT / WebVTT timestamp such as `00:01:14.815`, `01:14.815` or `00:01:14,815`.
struct TimeCode {
    std::string string;         ///< Source text, kept verbatim
    uint32_t hours = 0;         ///< 0 when the hour field is absent; may exceed 24
    uint32_t minutes = 0;       ///< 0..59
    uint32_t seconds = 0;       ///< 0..59
    uint32_t milliseconds = 0;  ///< 0..999

    /// Whole seconds; the millisecond field is truncated, never rounded.
    uint32_t to_seconds() const;
    /// Absolute position in milliseconds.
    uint64_t to_milliseconds() const;

    bool operator==(const TimeCode &other) const;
    bool operator!=(const TimeCode &other) const { return !(*this == other); }
};

struct TimeCodeResult {
    ParseStatus status;
    std::optional<TimeCode> timecode;
};

/**
 * @brief Parse a single timestamp.
 *
 * Accepts `[HH:]MM:SS.mmm` where the hour field has 2 to 4 digits, minutes and seconds are two
 * digits in 00..59, and the fraction is exactly three digits separated by `.` or `,`.
 * Anything else fails with `ParseError::InvalidTimeCode`.
 */
TimeCodeResult parse_timecode(std::string_view text);  ///< @ingroup api

}  // namespace titleparser
