//
//  export_sink.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "chapter_timeline.hpp"

namespace narrateforge {

/**
 * @brief Downstream consumer of assembled audio.
 *
 * Receives `begin()` with the sample rate of the audio to come, then samples incrementally in
 * book order and one final `finalize()` call with the full chapter timeline. All calls return
 * false on failure.
 */
class ExportSink {
public:
    virtual ~ExportSink() = default;

    // Called once before the first write; rejecting the rate aborts the job.
    virtual bool begin(uint32_t sample_rate) = 0;

    virtual bool write(uint32_t chapter_id, const std::vector<float> &samples) = 0;
    virtual bool finalize(const std::vector<ChapterTimeline> &timelines,
                          double total_duration_s) = 0;

    // Files (or other handles) produced so far.
    virtual std::vector<std::string> output_handles() const { return {}; }
};

}  // namespace narrateforge
