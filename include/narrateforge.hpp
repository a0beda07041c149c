//
//  narrateforge.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "chapter_timeline.hpp"
#include "engine_handles.hpp"
#include "export_sink.hpp"
#include "pipeline_config.hpp"
#include "progress_tracker.hpp"
#include "status.hpp"
#include "synthesis_coordinator.hpp"
#include "text_chunker.hpp"

namespace narrateforge {

/// @defgroup api NarrateForge Public API
/// Public, supported C++ interfaces for rendering chapter text into audio.
/// @{

/**
 * @brief Return the NarrateForge library version string (e.g. `v0.1`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Outcome of one book conversion.
 *
 * `status.ok` is false for Failed and Aborted jobs. A Cancelled job is not an error: its
 * timelines describe the delivered prefix and the sink has been finalized with it.
 */
struct JobResult {
    Status status;
    JobState state = JobState::Running;
    std::vector<std::string> output_handles;
    std::vector<uint32_t> failed_chunk_indices;  ///< degraded chunks, kept in the output
    std::vector<ChapterTimeline> timelines;
    double total_duration_s = 0.0;
    uint32_t delivered = 0;
    uint32_t total = 0;
};

/**
 * @brief Chunk -> synthesize -> assemble -> export for a list of chapters.
 *
 * The handles and the sink are owned by the caller and must outlive the pipeline. `run()`
 * initialises both handles first; if either fails (or the engine cannot reset its state) the
 * job is Aborted before any text is chunked or any sample reaches the sink.
 */
class BookPipeline {
public:
    using ProgressFn = SynthesisCoordinator::ProgressFn;

    BookPipeline(PipelineConfig config, InferenceHandle &inference, WaveformHandle &waveform,
                 ExportSink &sink);

    BookPipeline(const BookPipeline &) = delete;
    BookPipeline &operator=(const BookPipeline &) = delete;

    JobResult run(const std::vector<ChapterText> &chapters, const ProgressFn &progress = {});

    // Cooperative; safe to call from another thread or from the progress callback.
    void cancel() { coordinator_.cancel(); }

    // Throughput of the current (or last) run.
    ProgressStats progress_stats() const;

    const PipelineConfig &config() const { return config_; }

private:
    JobResult abort(std::string message) const;

    PipelineConfig config_;
    InferenceHandle &inference_;
    WaveformHandle &waveform_;
    ExportSink &sink_;
    SynthesisCoordinator coordinator_;
    mutable std::mutex stats_mutex_;
    ProgressStats stats_;
};

/// @}

}  // namespace narrateforge
