//
//  text_sanitizer.cpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "text_sanitizer.hpp"

#include <array>
#include <string>

namespace titleparser {

namespace {

constexpr std::string_view kDialogueDash = "- ";

constexpr std::array<std::string_view, 6> kEscapesToPrune = {
    "&amp;", "&lt;", "&gt;", "&lrm;", "&rlm;", "&nbsp;"};

constexpr std::string_view kTagTokenChars =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ.,:_-";

// Drop every `<token>` (or `</token>` when closing) in one left-to-right pass.
std::string strip_tags(const std::string &text, bool closing) {
    const size_t prefix = closing ? 2 : 1;
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t lt = text.find('<', pos);
        if (lt == std::string::npos) {
            break;
        }
        out.append(text, pos, lt - pos);
        const size_t token = lt + prefix;
        if (closing && (token > text.size() || text[lt + 1] != '/')) {
            out += '<';
            pos = lt + 1;
            continue;
        }
        const size_t stop = text.find_first_not_of(kTagTokenChars, token);
        if (stop != std::string::npos && stop > token && text[stop] == '>') {
            pos = stop + 1;
        } else {
            out += '<';
            pos = lt + 1;
        }
    }
    if (pos < text.size()) {
        out.append(text, pos, std::string::npos);
    }
    return out;
}

void erase_all(std::string &text, std::string_view needle) {
    size_t pos = text.find(needle);
    while (pos != std::string::npos) {
        text.erase(pos, needle.size());
        pos = text.find(needle, pos);
    }
}

}  // namespace

std::string sanitize_text(std::string_view line) {
    std::string text(line);
    text = strip_tags(text, false);
    text = strip_tags(text, true);
    if (text.compare(0, kDialogueDash.size(), kDialogueDash) == 0) {
        text.erase(0, kDialogueDash.size());
    }
    for (const auto &es : kEscapesToPrune) {
        erase_all(text, es);
    }
    return text;
}

}  // namespace titleparser
