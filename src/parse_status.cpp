//
//  parse_status.cpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "parse_status.hpp"

namespace titleparser {

const char *parse_error_name(ParseError error) {
    switch (error) {
        case ParseError::None:
            return "None";
        case ParseError::InvalidTimeCode:
            return "InvalidTimeCode";
        case ParseError::MalformedCue:
            return "MalformedCue";
        case ParseError::Io:
            return "Io";
    }
    return "Unknown";
}

}  // namespace titleparser
