//
//  synthesis_coordinator.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/16/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chunk_synthesizer.hpp"

namespace narrateforge {

enum class JobState { Running, Completed, Cancelled, Failed, Aborted };

const char *to_string(JobState state);

// Scheduling slot of a chunk inside one job.
enum class SlotState { Pending, InFlight, Done };

struct ChunkStatus {
    SlotState slot = SlotState::Pending;
    ChunkPhase phase = ChunkPhase::Queued;
    uint32_t attempt = 0;
    bool delivered = false;
};

struct CoordinatorOutcome {
    JobState state = JobState::Running;
    uint32_t delivered = 0;
    uint32_t total = 0;
    std::vector<uint32_t> failed_chunks;  // global indices delivered with quality_ok == false
    std::string message;
};

/**
 * @brief Runs the ChunkSynthesizer over a book with a bounded worker pool.
 *
 * Workers take chunks in index order; finished results land in a reorder buffer and the calling
 * thread hands them downstream strictly by index. The pool has `max_workers` threads when the
 * inference engine is concurrency-safe and a single thread otherwise.
 *
 * Workers never run more than `buffer_window()` chunks ahead of delivery, so at most that many
 * finished results (with their samples) are held while the head chunk or the sink is slow.
 *
 * `cancel()` may be called from any thread (including the callbacks). It is checked before each
 * dispatch; chunks already in flight finish and are still delivered. A delivery callback that
 * returns false stops dispatching and fails the job.
 */
class SynthesisCoordinator {
public:
    using DeliverFn = std::function<bool(SynthesisResult &&)>;
    using ProgressFn =
        std::function<void(uint32_t completed, uint32_t total, const std::string &preview)>;

    SynthesisCoordinator(InferenceHandle &inference, WaveformHandle &waveform,
                         SynthesizerConfig synth_config, CoordinatorConfig config);

    SynthesisCoordinator(const SynthesisCoordinator &) = delete;
    SynthesisCoordinator &operator=(const SynthesisCoordinator &) = delete;

    // Pool size for the next run; requires an initialised inference handle.
    uint32_t worker_count() const;

    // Upper bound on dispatched-but-undelivered chunks for the next run.
    uint32_t buffer_window() const;

    CoordinatorOutcome run(const std::vector<TextChunk> &chunks, const VoiceParams &voice,
                           const DeliverFn &deliver, const ProgressFn &progress = {});

    void cancel();
    bool cancelled() const { return cancel_.load(); }

    // Snapshot of the per-chunk job state of the current (or last) run.
    std::vector<ChunkStatus> chunk_status() const;

private:
    void worker_loop(const ChunkSynthesizer &synth, const std::vector<TextChunk> &chunks,
                     const VoiceParams &voice);

    InferenceHandle &inference_;
    WaveformHandle &waveform_;
    SynthesizerConfig synth_config_;
    CoordinatorConfig config_;

    std::atomic<bool> cancel_{false};

    // Job state, guarded by mutex_.
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<ChunkStatus> status_;
    std::vector<std::optional<SynthesisResult>> reorder_;
    size_t next_dispatch_ = 0;
    size_t delivered_ = 0;
    size_t window_ = 1;
    uint32_t active_workers_ = 0;
    bool stop_ = false;
    std::string worker_error_;
};

}  // namespace narrateforge
