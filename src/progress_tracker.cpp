//
//  progress_tracker.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "progress_tracker.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace narrateforge {

double ProgressStats::percent() const {
    if (total_chunks == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(processed()) / static_cast<double>(total_chunks);
}

ProgressTracker::ProgressTracker(uint32_t total_chunks, uint64_t total_chars, Clock clock)
    : clock_(std::move(clock)) {
    start_ = now();
    last_ = start_;
    stats_.total_chunks = total_chunks;
    stats_.total_chars = total_chars;
}

std::chrono::steady_clock::time_point ProgressTracker::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

void ProgressTracker::record(uint64_t chars, bool success) {
    if (success) {
        ++stats_.completed_chunks;
    } else {
        ++stats_.failed_chunks;
    }
    stats_.processed_chars += chars;
    last_ = now();

    const double elapsed = std::chrono::duration<double>(last_ - start_).count();
    stats_.elapsed_s = elapsed;
    const uint32_t done = stats_.processed();
    if (elapsed > 0.0 && done > 0) {
        stats_.chunks_per_second = done / elapsed;
        stats_.chars_per_second = static_cast<double>(stats_.processed_chars) / elapsed;
        stats_.avg_chunk_s = elapsed / done;
        const uint32_t remaining = stats_.total_chunks > done ? stats_.total_chunks - done : 0;
        stats_.eta_s = remaining / stats_.chunks_per_second;
    }
}

ProgressStats ProgressTracker::stats() const { return stats_; }

std::string ProgressTracker::summary() const {
    std::ostringstream os;
    os << stats_.processed() << "/" << stats_.total_chunks << " (" << std::fixed
       << std::setprecision(1) << stats_.percent() << "%)";
    if (stats_.failed_chunks > 0) {
        os << " " << stats_.failed_chunks << " failed";
    }
    if (stats_.chunks_per_second > 0.0) {
        os << ", " << stats_.chunks_per_second << " chunks/s";
    }
    if (stats_.eta_s > 0.0) {
        os << ", ETA " << format_duration(stats_.eta_s);
    }
    return os.str();
}

std::string format_duration(double seconds) {
    const long total = seconds > 0.0 ? static_cast<long>(seconds) : 0;
    const long h = total / 3600;
    const long m = (total % 3600) / 60;
    const long s = total % 60;
    std::ostringstream os;
    if (h > 0) {
        os << h << "h " << m << "m " << s << "s";
    } else if (m > 0) {
        os << m << "m " << s << "s";
    } else {
        os << s << "s";
    }
    return os.str();
}

}  // namespace narrateforge
