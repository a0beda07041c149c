//
//  pipeline_config.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/16/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "engine.hpp"
#include "status.hpp"
#include "token_codec.hpp"

namespace narrateforge {

struct ChunkingConfig {
    uint32_t max_words = 70;
    uint32_t max_chars = 300;
};

struct CodecConfig {
    int32_t base = kDefaultCodeBase;
    int32_t alphabet_size = kDefaultAlphabetSize;
    int32_t start_token = kDefaultStartOfSpeechToken;
    int32_t end_token = kDefaultEndOfSpeechToken;
};

// Optional shaping of every decoded chunk; both steps are off by default.
struct PostProcessConfig {
    bool trim_silence = false;
    double silence_threshold_db = -40.0;
    double min_silence_s = 0.05;
    double silence_pad_s = 0.1;
    bool normalize = false;
    double target_peak_db = -3.0;  // applied to passing attempts only
};

struct SynthesizerConfig {
    uint32_t max_attempts = 3;
    double min_rms = 1e-3;
    uint32_t trim_samples = 512;   // codec warm-up dropped from each chunk
    uint32_t fade_samples = 320;   // linear fade at both chunk edges
    uint32_t retry_backoff_ms = 0; // multiplied by the attempt number, after engine errors only
    SamplingParams sampling;
    CodecConfig codec;
    PostProcessConfig post;
};

struct CoordinatorConfig {
    uint32_t max_workers = 2;
    // Chunks dispatched but not yet delivered downstream; 0 means twice the worker count.
    uint32_t max_buffered = 0;
};

struct AssemblerConfig {
    uint32_t sample_rate = 24000;
    double chunk_gap_s = 0.25;
    double chapter_gap_s = 2.0;
};

struct PronunciationConfig {
    bool use_defaults = false;
    std::string csv_path;  // empty: no file
    std::vector<std::pair<std::string, std::string>> entries;
};

struct PipelineConfig {
    ChunkingConfig chunking;
    SynthesizerConfig synthesis;
    CoordinatorConfig coordinator;
    AssemblerConfig assembler;
    VoiceParams voice;
    PronunciationConfig pronunciation;
    std::string log_level = "warn";
};

/**
 * @brief Parse a JSON document into a PipelineConfig.
 *
 * Sections: "chunking", "codec", "synthesis" (with nested "sampling" and "postprocess"),
 * "coordinator", "assembler", "voice" (string or {"preset": ..., "description": ...}),
 * "pronunciation" ({"defaults": bool, "csv": path, "entries": {word: spoken}}) and "log_level".
 * A voice preset supplies the description unless one is given explicitly; unknown presets are
 * rejected. Missing keys keep their defaults. Malformed JSON, wrongly typed values and out-of-range values yield a failed
 * status; `out` is only modified on success.
 */
Status parse_pipeline_config(const std::string &json_text, PipelineConfig &out);

// Reads `path` and parses it with parse_pipeline_config().
Status load_pipeline_config(const std::string &path, PipelineConfig &out);

// Range checks shared by the loader and BookPipeline.
Status validate_pipeline_config(const PipelineConfig &config);

}  // namespace narrateforge
