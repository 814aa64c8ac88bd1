//
//  timecode.cpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timecode.hpp"

#include <string>

#include "logging.hpp"

namespace titleparser {

namespace {

// `MM:SS.mmm` tail shared by both forms; an hour field adds 2-4 digits and a colon.
constexpr size_t kTailLen = 9;
constexpr size_t kMinHourDigits = 2;
constexpr size_t kMaxHourDigits = 4;

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Parses `len` digits at `pos` into `out`; false on any non-digit.
bool read_digits(std::string_view s, size_t pos, size_t len, uint32_t &out) {
    uint32_t v = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!is_digit(s[i])) {
            return false;
        }
        v = v * 10 + static_cast<uint32_t>(s[i] - '0');
    }
    out = v;
    return true;
}

// Two digits in 00..59.
bool read_sexagesimal(std::string_view s, size_t pos, uint32_t &out) {
    return s[pos] >= '0' && s[pos] <= '5' && read_digits(s, pos, 2, out);
}

bool scan_timecode(std::string_view s, TimeCode &tc) {
    size_t tail = 0;
    tc.hours = 0;
    if (s.size() != kTailLen) {
        if (s.size() < kTailLen + 1 + kMinHourDigits || s.size() > kTailLen + 1 + kMaxHourDigits) {
            return false;
        }
        const size_t hour_digits = s.size() - kTailLen - 1;
        if (!read_digits(s, 0, hour_digits, tc.hours) || s[hour_digits] != ':') {
            return false;
        }
        tail = hour_digits + 1;
    }
    return read_sexagesimal(s, tail, tc.minutes) && s[tail + 2] == ':' &&
           read_sexagesimal(s, tail + 3, tc.seconds) &&
           (s[tail + 5] == '.' || s[tail + 5] == ',') &&
           read_digits(s, tail + 6, 3, tc.milliseconds);
}

}  // namespace

uint32_t TimeCode::to_seconds() const { return hours * 60 * 60 + minutes * 60 + seconds; }

uint64_t TimeCode::to_milliseconds() const {
    return static_cast<uint64_t>(to_seconds()) * 1000 + milliseconds;
}

bool TimeCode::operator==(const TimeCode &other) const {
    return string == other.string && hours == other.hours && minutes == other.minutes &&
           seconds == other.seconds && milliseconds == other.milliseconds;
}

TimeCodeResult parse_timecode(std::string_view text) {
    TimeCodeResult result;
    TimeCode tc{};
    if (!scan_timecode(text, tc)) {
        TP_LOG("timecode", "rejected timecode '" << text_preview(text) << "'");
        result.status = make_error_status(ParseError::InvalidTimeCode, "invalid timecode");
        return result;
    }
    tc.string = std::string(text);
    result.timecode = std::move(tc);
    result.status = make_ok_status();
    return result;
}

}  // namespace titleparser
