//
//  progress_tracker.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace narrateforge {

struct ProgressStats {
    uint32_t total_chunks = 0;
    uint32_t completed_chunks = 0;  // delivered with quality_ok
    uint32_t failed_chunks = 0;     // delivered degraded
    uint64_t total_chars = 0;
    uint64_t processed_chars = 0;

    double elapsed_s = 0.0;
    double chunks_per_second = 0.0;
    double chars_per_second = 0.0;
    double avg_chunk_s = 0.0;
    double eta_s = 0.0;  // 0 until the first chunk is recorded

    uint32_t processed() const { return completed_chunks + failed_chunks; }
    double percent() const;
};

/**
 * @brief Throughput and ETA over delivered chunks.
 *
 * Degraded chunks count as processed, so the percentage reaches 100 for a finished book.
 * The clock is injectable for tests.
 */
class ProgressTracker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    ProgressTracker(uint32_t total_chunks, uint64_t total_chars, Clock clock = {});

    void record(uint64_t chars, bool success);
    ProgressStats stats() const;

    // One-line summary, e.g. "12/40 (30.0%) 3 failed, 0.8 chunks/s, ETA 35s".
    std::string summary() const;

private:
    std::chrono::steady_clock::time_point now() const;

    Clock clock_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_;
    ProgressStats stats_;
};

// "1h 2m 3s", "2m 3s" or "3s"; negative input yields "0s".
std::string format_duration(double seconds);

}  // namespace narrateforge
