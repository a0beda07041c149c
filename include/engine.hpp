//
//  engine.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "status.hpp"
#include "token_codec.hpp"

namespace narrateforge {

/// @defgroup collaborators External collaborators
/// Interfaces implemented outside the library: the token-generating model, the neural waveform
/// decoder and the container export.
/// @{

/// Natural-language voice prompt shared by every chunk of a book.
struct VoiceParams {
    std::string description;
};

struct SamplingParams {
    float temperature = 0.45f;
    float top_p = 0.92f;
    int32_t max_tokens = 2500;
    float repetition_penalty = 1.1f;
    uint32_t seed = 0;
};

struct EngineCapabilities {
    bool concurrency_safe = false;      ///< generate() may run on several threads at once
    bool supports_state_reset = false;  ///< reset_state() clears recurrent/KV state (required)
};

/**
 * @brief Token-generating model.
 *
 * The library calls `reset_state()` immediately before every `generate()`. For engines that are
 * not concurrency-safe both calls run under one lock so no other caller can interleave.
 * Engine failures (e.g. out of memory) are reported by throwing a std::exception.
 */
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    virtual Status init() = 0;
    virtual void shutdown() = 0;
    virtual EngineCapabilities capabilities() const = 0;
    virtual void reset_state() = 0;

    // Prompt envelope; the default is `<description="VOICE"> TEXT`.
    virtual std::string build_prompt(const VoiceParams &voice, const std::string &text) const;

    virtual std::vector<int32_t> generate(const std::string &prompt,
                                          const SamplingParams &params) = 0;
};

struct DecodedAudio {
    std::vector<float> samples;  ///< mono float32
    uint32_t sample_rate = 0;
};

/// Neural decoder turning hierarchical codes into a waveform.
class WaveformCodec {
public:
    virtual ~WaveformCodec() = default;

    virtual Status init() = 0;
    virtual void shutdown() = 0;
    virtual bool concurrency_safe() const = 0;
    virtual uint32_t sample_rate() const = 0;
    virtual DecodedAudio decode(const HierarchicalCode &code) = 0;
};

/// @}

}  // namespace narrateforge
