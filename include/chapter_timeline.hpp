//
//  chapter_timeline.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace narrateforge {

// Placement of one delivered chunk on the book timeline, in seconds.
struct TimelineSegment {
    uint32_t chunk_index = 0;
    double start_s = 0.0;
    double end_s = 0.0;
};

/**
 * @brief Timing of one chapter.
 *
 * `end_s` includes the trailing chapter gap so consecutive chapters are contiguous;
 * `total_duration_s == end_s - start_s`. Chapters without chunks have zero length.
 */
struct ChapterTimeline {
    uint32_t chapter_id = 0;
    std::string title;
    double start_s = 0.0;
    double end_s = 0.0;
    std::vector<TimelineSegment> segments;
    double total_duration_s = 0.0;
};

}  // namespace narrateforge
