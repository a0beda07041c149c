//
//  chapter_assembler.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chapter_timeline.hpp"
#include "chunk_synthesizer.hpp"
#include "export_sink.hpp"
#include "pipeline_config.hpp"

namespace narrateforge {

/**
 * @brief Streams ordered synthesis results into an ExportSink and tracks chapter timing.
 *
 * Samples are forwarded as they arrive; only the timeline is kept in memory. Between two chunks
 * of one chapter a `chunk_gap_s` silence is written; a chapter that produced audio and is
 * followed by another chapter ends with a `chapter_gap_s` silence. Positions are counted in
 * samples at `sample_rate` and converted to seconds for the timeline.
 *
 * Results must arrive in non-decreasing chapter order. Chapters that receive no chunk get a
 * zero-length entry. Degraded chunks and chunks with a foreign sample rate are written anyway
 * and reported through failed_chunks().
 */
class ChapterAssembler {
public:
    ChapterAssembler(ExportSink &sink, AssemblerConfig config, std::vector<std::string> titles);

    ChapterAssembler(const ChapterAssembler &) = delete;
    ChapterAssembler &operator=(const ChapterAssembler &) = delete;

    // Returns false when the sink rejected a write or the result is out of order.
    bool consume(SynthesisResult &&result);

    // Closes the open chapter and calls finalize() on the sink. With `complete` the remaining
    // chapters are appended as empty entries. Returns false on sink failure or a second call.
    bool finish(bool complete);

    const std::vector<ChapterTimeline> &timelines() const { return timelines_; }
    const std::vector<uint32_t> &failed_chunks() const { return failed_; }
    uint64_t total_samples() const { return cursor_; }
    double total_duration_s() const;
    bool finished() const { return finished_; }

private:
    double to_seconds(uint64_t samples) const;
    std::string title_for(uint32_t chapter_id) const;
    bool write_silence(uint32_t chapter_id, uint64_t samples);
    void open_chapter(uint32_t chapter_id);
    bool close_chapter(bool trailing_gap);
    void append_empty_chapter(uint32_t chapter_id);

    ExportSink &sink_;
    AssemblerConfig config_;
    std::vector<std::string> titles_;
    uint64_t chunk_gap_samples_;
    uint64_t chapter_gap_samples_;

    std::vector<ChapterTimeline> timelines_;
    std::optional<ChapterTimeline> current_;
    uint64_t current_start_ = 0;
    uint32_t next_chapter_ = 0;  // first chapter id not yet opened
    uint64_t cursor_ = 0;        // samples written so far
    std::vector<uint32_t> failed_;
    bool sink_failed_ = false;
    bool finished_ = false;
};

}  // namespace narrateforge
