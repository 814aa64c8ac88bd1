//
//  text_sanitizer.hpp
//  TitleParser
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>

namespace titleparser {

/**
 * @brief Clean one line of cue text for display.
 *
 * Rules run in order, each over the whole line:
 *  1. drop VTT opening tags such as `<c.japanese>` or `<v.Bob>`
 *  2. drop the matching closing tags `</c.japanese>`
 *  3. drop a single leading dialogue dash `"- "`
 *  4. delete `&amp;`, `&lt;`, `&gt;`, `&lrm;`, `&rlm;` and `&nbsp;`
 *
 * Escapes are deleted, not decoded. Never fails.
 */
std::string sanitize_text(std::string_view line);  ///< @ingroup api

}  // namespace titleparser
