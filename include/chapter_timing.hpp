//
//  chapter_timing.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include "chapter_marker.hpp"
#include "chapter_timeline.hpp"
#include "logging.hpp"

namespace narrateforge {

inline uint32_t seconds_to_ms(double seconds) {
    if (seconds <= 0.0) {
        return 0;
    }
    return static_cast<uint32_t>(std::llround(seconds * 1000.0));
}

// Derive durations (ms) from sorted start times. If total_ms > 0, the final
// duration is clamped to fill the remaining time up to total_ms (min 1).
template <typename Sample>
inline std::vector<uint32_t> derive_durations_ms_from_starts(const std::vector<Sample> &samples,
                                                             uint32_t total_ms = 0) {
    std::vector<uint32_t> durations;
    durations.reserve(samples.size());
    if (samples.empty()) {
        return durations;
    }
    if (samples.front().start_ms != 0) {
        NF_LOG("warn", "first chapter start_ms is " << samples.front().start_ms
                                                    << "ms; players expect 0ms");
    }
    for (size_t i = 0; i < samples.size(); ++i) {
        if (i + 1 < samples.size()) {
            uint32_t cur = samples[i].start_ms;
            uint32_t next = samples[i + 1].start_ms;
            durations.push_back(next > cur ? (next - cur) : 1);
        } else {
            if (total_ms > 0 && samples[i].start_ms < total_ms) {
                durations.push_back(std::max<uint32_t>(1, total_ms - samples[i].start_ms));
            } else {
                durations.push_back(1);  // pad final sample with minimum duration
            }
        }
    }
    return durations;
}

// Chapter markers for the timelines, in order. Zero-length chapters are kept so titles stay
// aligned with the input chapter list.
inline std::vector<ChapterMarker> markers_from_timelines(
    const std::vector<ChapterTimeline> &timelines) {
    std::vector<ChapterMarker> markers;
    markers.reserve(timelines.size());
    for (const auto &t : timelines) {
        markers.push_back(ChapterMarker{t.title, seconds_to_ms(t.start_s)});
    }
    return markers;
}

}  // namespace narrateforge
