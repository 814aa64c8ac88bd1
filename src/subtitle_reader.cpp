//
//  subtitle_reader.cpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subtitle_reader.hpp"

#include <fstream>
#include <iterator>

#include "logging.hpp"

namespace titleparser {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool is_blank(std::string_view line) {
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

bool starts_with_word(std::string_view block, std::string_view word) {
    if (block.compare(0, word.size(), word) != 0) {
        return false;
    }
    if (block.size() == word.size()) {
        return true;
    }
    const char next = block[word.size()];
    return next == ' ' || next == '\t' || next == '\n';
}

// WebVTT blocks that carry no cue.
bool is_non_cue_block(std::string_view block, size_t index) {
    if (index == 0 && starts_with_word(block, "WEBVTT")) {
        return true;
    }
    return starts_with_word(block, "NOTE") || starts_with_word(block, "STYLE") ||
           starts_with_word(block, "REGION");
}

bool read_file(const std::string &path, std::string &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        TP_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    if (f.bad()) {
        TP_LOG("error", "read failed for " << path);
        return false;
    }
    return true;
}

}  // namespace

std::vector<std::string> split_cue_blocks(std::string_view content) {
    if (content.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
        content.remove_prefix(kUtf8Bom.size());
    }

    std::vector<std::string> blocks;
    std::string current;
    size_t pos = 0;
    while (pos <= content.size()) {
        const size_t nl = content.find('\n', pos);
        std::string_view line =
            content.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (is_blank(line)) {
            if (!current.empty()) {
                blocks.emplace_back(std::move(current));
                current.clear();
            }
        } else {
            if (!current.empty()) {
                current += '\n';
            }
            current.append(line.data(), line.size());
        }
        if (nl == std::string_view::npos) {
            break;
        }
        pos = nl + 1;
    }
    if (!current.empty()) {
        blocks.emplace_back(std::move(current));
    }
    return blocks;
}

ReadResult parse_cues(std::string_view content) {
    ReadResult result;
    const auto blocks = split_cue_blocks(content);
    TP_LOG("reader", "split document into " << blocks.size() << " blocks");
    result.cues.reserve(blocks.size());
    for (size_t i = 0; i < blocks.size(); ++i) {
        const auto &block = blocks[i];
        if (is_non_cue_block(block, i)) {
            TP_LOG("reader", "skipping non-cue block " << i << " '" << text_preview(block) << "'");
            continue;
        }
        auto parsed = parse_cue(block);
        if (!parsed.status.ok) {
            TP_LOG("warn", "skipping block " << i << " (" << parse_error_name(parsed.status.error)
                                             << ": " << parsed.status.message << ") '"
                                             << text_preview(block) << "'");
            ++result.skipped_blocks;
            continue;
        }
        result.cues.emplace_back(std::move(*parsed.cue));
    }
    TP_LOG("info", "parsed " << result.cues.size() << " cues, skipped " << result.skipped_blocks
                             << " blocks");
    result.status = make_ok_status();
    return result;
}

ReadResult read_subtitle_file(const std::string &path) {
    TP_LOG("debug", "read_subtitle_file input=" << path);
    std::string content;
    if (!read_file(path, content)) {
        ReadResult result;
        result.status = make_error_status(ParseError::Io, "Failed to read subtitle file: " + path);
        return result;
    }
    return parse_cues(content);
}

}  // namespace titleparser
