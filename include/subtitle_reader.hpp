//
//  subtitle_reader.hpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "cue.hpp"
#include "parse_status.hpp"

namespace titleparser {

/// @ingroup api
/// Cues collected from a whole SRT / WebVTT document.
struct ReadResult {
    ParseStatus status;
    std::vector<Cue> cues;      ///< Parsed cues in document order
    size_t skipped_blocks = 0;  ///< Blocks that failed parse_cue (headers/notes not counted)
};

/**
 * @brief Split document text into cue blocks.
 *
 * Drops a UTF-8 BOM, normalizes CRLF to LF and splits on runs of blank (or whitespace-only)
 * lines. Empty blocks are never returned.
 */
std::vector<std::string> split_cue_blocks(std::string_view content);  ///< @ingroup api

/// Parse every block of an in-memory document; failed blocks are logged and counted.
ReadResult parse_cues(std::string_view content);  ///< @ingroup api

/// Load a subtitle file and parse it; fails with `ParseError::Io` if it cannot be opened.
ReadResult read_subtitle_file(const std::string &path);  ///< @ingroup api

}  // namespace titleparser
