//
//  chapter_marker.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

namespace narrateforge {

/// @ingroup api
/// Chapter title at an absolute position of the rendered book.
struct ChapterMarker {
    std::string title;      ///< UTF-8 text
    uint32_t start_ms = 0;  ///< Absolute start time in ms
};

}  // namespace narrateforge
