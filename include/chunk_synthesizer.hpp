//
//  chunk_synthesizer.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "chunk_state.hpp"
#include "engine_handles.hpp"
#include "pipeline_config.hpp"
#include "text_chunker.hpp"

namespace narrateforge {

/// Outcome of synthesizing one chunk; degraded results (`quality_ok == false`) still carry the
/// samples of the last attempt.
struct SynthesisResult {
    uint32_t chunk_index = 0;  // global index within the book
    uint32_t chapter_id = 0;
    std::vector<float> samples;
    uint32_t sample_rate = 0;
    double rms = 0.0;
    uint32_t attempts_used = 0;
    bool quality_ok = false;
    std::optional<std::string> engine_error;
    size_t codec_anomalies = 0;
    uint32_t seed = 0;
    ChunkPhase phase = ChunkPhase::Queued;
};

// Deterministic seed of an attempt (1-based) for a voice/text pair.
uint32_t seed_for_attempt(const VoiceParams &voice, const std::string &text, uint32_t attempt);

/**
 * @brief Turns one TextChunk into audio with bounded retries.
 *
 * Each attempt: prompt -> reset+generate -> extract code stream -> unpack -> decode ->
 * warm-up trim, optional silence trim, fades -> RMS check. An attempt passes when no error
 * occurred and `rms >= min_rms`; passing audio is then peak-normalized when configured.
 * Engine and codec exceptions are caught and count as failed attempts. The synthesizer holds
 * no per-chunk state, so one instance may be shared by several workers.
 */
class ChunkSynthesizer {
public:
    using AttemptFn = std::function<void(uint32_t attempt)>;

    ChunkSynthesizer(InferenceHandle &inference, WaveformHandle &waveform,
                     SynthesizerConfig config);

    SynthesisResult synthesize(const TextChunk &chunk, const VoiceParams &voice,
                               uint32_t max_attempts, const AttemptFn &on_attempt = {}) const;
    SynthesisResult synthesize(const TextChunk &chunk, const VoiceParams &voice) const {
        return synthesize(chunk, voice, config_.max_attempts);
    }

    const SynthesizerConfig &config() const { return config_; }

private:
    InferenceHandle &inference_;
    WaveformHandle &waveform_;
    SynthesizerConfig config_;
};

}  // namespace narrateforge
