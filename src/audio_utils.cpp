//
//  audio_utils.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "audio_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace narrateforge {

double compute_rms(const std::vector<float> &samples) {
    if (samples.empty()) {
        return 0.0;
    }
    double acc = 0.0;
    for (float s : samples) {
        acc += static_cast<double>(s) * static_cast<double>(s);
    }
    return std::sqrt(acc / static_cast<double>(samples.size()));
}

float peak_level(const std::vector<float> &samples) {
    float peak = 0.0f;
    for (float s : samples) {
        peak = std::max(peak, std::fabs(s));
    }
    return peak;
}

void drop_warmup(std::vector<float> &samples, size_t trim_samples) {
    if (trim_samples > 0 && samples.size() > trim_samples) {
        samples.erase(samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(trim_samples));
    }
}

void apply_edge_fades(std::vector<float> &samples, size_t fade_samples) {
    const size_t fade = std::min(fade_samples, samples.size() / 4);
    if (fade < 2) {
        return;
    }
    const size_t n = samples.size();
    for (size_t i = 0; i < fade; ++i) {
        const float gain = static_cast<float>(i) / static_cast<float>(fade - 1);
        samples[i] *= gain;
        samples[n - 1 - i] *= gain;
    }
}

size_t trim_silence(std::vector<float> &samples, uint32_t sample_rate, double threshold_db,
                    double min_silence_s, double pad_s) {
    const float threshold = static_cast<float>(std::pow(10.0, threshold_db / 20.0));
    const auto loud = [threshold](float s) { return std::fabs(s) >= threshold; };

    const auto first = std::find_if(samples.begin(), samples.end(), loud);
    if (first == samples.end()) {
        return 0;
    }
    const auto last = std::find_if(samples.rbegin(), samples.rend(), loud);

    const size_t n = samples.size();
    const size_t lead = static_cast<size_t>(first - samples.begin());
    const size_t trail = static_cast<size_t>(last - samples.rbegin());
    const size_t min_run = static_cast<size_t>(samples_for_seconds(min_silence_s, sample_rate));
    const size_t pad = static_cast<size_t>(samples_for_seconds(pad_s, sample_rate));

    size_t begin = 0;
    size_t end = n;
    if (lead > 0 && lead >= min_run) {
        begin = lead - std::min(pad, lead);
    }
    if (trail > 0 && trail >= min_run) {
        end = n - trail + std::min(pad, trail);
    }
    samples.erase(samples.begin() + static_cast<std::ptrdiff_t>(end), samples.end());
    samples.erase(samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(begin));
    return n - samples.size();
}

double normalize_peak(std::vector<float> &samples, double target_peak_db) {
    const float peak = peak_level(samples);
    if (peak <= 0.0f) {
        return 1.0;
    }
    const double gain = std::pow(10.0, target_peak_db / 20.0) / static_cast<double>(peak);
    for (float &s : samples) {
        s = static_cast<float>(std::clamp(static_cast<double>(s) * gain, -1.0, 1.0));
    }
    return gain;
}

uint64_t samples_for_seconds(double seconds, uint32_t sample_rate) {
    if (seconds <= 0.0 || sample_rate == 0) {
        return 0;
    }
    return static_cast<uint64_t>(seconds * static_cast<double>(sample_rate));
}

}  // namespace narrateforge
