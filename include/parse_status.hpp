//
//  parse_status.hpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace titleparser {

/// @ingroup api
/// Failure categories reported by the parsers and the subtitle reader.
enum class ParseError {
    None = 0,
    InvalidTimeCode,  ///< timestamp does not match the timecode grammar
    MalformedCue,     ///< block lacks exactly one well-formed timing line
    Io,               ///< subtitle file could not be read
};

/**
 * @brief Result status with success flag, error kind and optional message.
 *
 * When `ok == true`, `error` is `ParseError::None` and `message` is empty. On failure, `message`
 * contains a short description of what went wrong.
 */
struct ParseStatus {
    bool ok{false};
    ParseError error{ParseError::None};
    std::string message;
};

/// Short stable name for an error kind ("InvalidTimeCode", ...).
const char *parse_error_name(ParseError error);

inline ParseStatus make_ok_status() { return ParseStatus{true, ParseError::None, {}}; }

inline ParseStatus make_error_status(ParseError error, std::string message) {
    return ParseStatus{false, error, std::move(message)};
}

}  // namespace titleparser
