//
//  chunk_synthesizer.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "chunk_synthesizer.hpp"

#include <chrono>
#include <exception>
#include <thread>

#include "audio_utils.hpp"
#include "logging.hpp"
#include "seed_hash.hpp"
#include "token_codec.hpp"

namespace narrateforge {

namespace {

void shape_chunk(std::vector<float> &samples, uint32_t sample_rate, const SynthesizerConfig &c) {
    drop_warmup(samples, c.trim_samples);
    if (c.post.trim_silence) {
        trim_silence(samples, sample_rate, c.post.silence_threshold_db, c.post.min_silence_s,
                     c.post.silence_pad_s);
    }
    apply_edge_fades(samples, c.fade_samples);
}

}  // namespace

uint32_t seed_for_attempt(const VoiceParams &voice, const std::string &text, uint32_t attempt) {
    std::string key = voice.description + "\n" + text;
    if (attempt > 1) {
        key += "\n#" + std::to_string(attempt);
    }
    return to_seed(crc32(key));
}

ChunkSynthesizer::ChunkSynthesizer(InferenceHandle &inference, WaveformHandle &waveform,
                                   SynthesizerConfig config)
    : inference_(inference), waveform_(waveform), config_(std::move(config)) {}

SynthesisResult ChunkSynthesizer::synthesize(const TextChunk &chunk, const VoiceParams &voice,
                                             uint32_t max_attempts,
                                             const AttemptFn &on_attempt) const {
    SynthesisResult result;
    result.chunk_index = chunk.global_index;
    result.chapter_id = chunk.chapter_id;

    ChunkStateMachine state(max_attempts);
    while (state.begin_attempt()) {
        const uint32_t attempt = state.attempt();
        if (on_attempt) {
            on_attempt(attempt);
        }
        result.samples.clear();
        result.rms = 0.0;
        result.engine_error.reset();
        result.codec_anomalies = 0;
        result.seed = seed_for_attempt(voice, chunk.text, attempt);

        try {
            SamplingParams params = config_.sampling;
            params.seed = result.seed;
            const std::string prompt = inference_.build_prompt(voice, chunk.text);
            const auto tokens = inference_.generate_isolated(prompt, params);
            const auto stream = extract_code_stream(tokens, config_.codec.start_token,
                                                    config_.codec.end_token);
            UnpackResult unpacked =
                unpack_frames(stream, config_.codec.base, config_.codec.alphabet_size);
            result.codec_anomalies = unpacked.anomalies;
            if (!stream.empty() && unpacked.anomalies * 2 > stream.size()) {
                NF_LOG("warn", "chunk " << chunk.global_index << ": " << unpacked.anomalies << "/"
                                        << stream.size()
                                        << " tokens outside the code range (engine degenerate?)");
            }
            if (unpacked.code.empty()) {
                result.sample_rate = waveform_.sample_rate();
            } else {
                DecodedAudio audio = waveform_.decode(unpacked.code);
                result.sample_rate = audio.sample_rate;
                result.samples = std::move(audio.samples);
                shape_chunk(result.samples, result.sample_rate, config_);
            }
            result.rms = compute_rms(result.samples);
        } catch (const std::exception &e) {
            result.engine_error = e.what();
        }

        const bool passed = !result.engine_error && result.rms >= config_.min_rms;
        state.finish_attempt(passed);
        if (passed) {
            // RMS gating above uses the un-normalized level.
            if (config_.post.normalize) {
                normalize_peak(result.samples, config_.post.target_peak_db);
            }
            break;
        }
        if (result.engine_error) {
            NF_LOG("warn", "chunk " << chunk.global_index << " attempt " << attempt << "/"
                                    << state.max_attempts()
                                    << " failed: " << *result.engine_error);
            if (config_.retry_backoff_ms > 0 && !state.terminal()) {
                std::this_thread::sleep_for(
                    std::chrono::milliseconds(config_.retry_backoff_ms * attempt));
            }
        } else {
            NF_LOG("warn", "chunk " << chunk.global_index << " attempt " << attempt << "/"
                                    << state.max_attempts() << " below quality threshold (rms="
                                    << result.rms << ")");
        }
    }

    result.attempts_used = state.attempt();
    result.phase = state.phase();
    result.quality_ok = state.phase() == ChunkPhase::Delivered;
    if (!result.quality_ok) {
        NF_LOG("error", "chunk " << chunk.global_index << " exhausted " << result.attempts_used
                                 << " attempts; keeping degraded audio (\""
                                 << text_preview(chunk.text) << "\")");
    } else {
        NF_LOG("debug", "chunk " << chunk.global_index << " ok after " << result.attempts_used
                                 << " attempt(s), " << result.samples.size() << " samples");
    }
    return result;
}

}  // namespace narrateforge
