//
//  audio_utils.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace narrateforge {

// Root-mean-square amplitude; 0 for an empty buffer.
double compute_rms(const std::vector<float> &samples);

// Largest absolute sample value; 0 for an empty buffer.
float peak_level(const std::vector<float> &samples);

// Drop `trim_samples` leading samples (codec warm-up) when the buffer is longer than that.
void drop_warmup(std::vector<float> &samples, size_t trim_samples);

// Linear fade-in/out over min(fade_samples, size/4) samples.
void apply_edge_fades(std::vector<float> &samples, size_t fade_samples);

/**
 * @brief Remove leading and trailing silence.
 *
 * A sample is silent when its level is below `threshold_db` dBFS. An edge run of silence is only
 * trimmed when it lasts at least `min_silence_s`; `pad_s` of it is kept next to the sound.
 * Buffers that are silent throughout are left untouched.
 * @return Number of samples removed.
 */
size_t trim_silence(std::vector<float> &samples, uint32_t sample_rate, double threshold_db,
                    double min_silence_s, double pad_s);

// Scale so the peak lands on `target_peak_db` dBFS, clipping to [-1, 1]. Silent buffers are left
// unchanged. Returns the gain applied.
double normalize_peak(std::vector<float> &samples, double target_peak_db);

// Number of samples covering `seconds` at `sample_rate` (truncated).
uint64_t samples_for_seconds(double seconds, uint32_t sample_rate);

}  // namespace narrateforge
