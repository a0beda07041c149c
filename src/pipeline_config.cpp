//
//  pipeline_config.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/16/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "pipeline_config.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "voice_presets.hpp"

using json = nlohmann::json;

namespace narrateforge {

namespace {

const json *section(const json &j, const char *name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("\"") + name + "\" must be an object");
    }
    return &*it;
}

void read_chunking(const json &j, ChunkingConfig &c) {
    c.max_words = j.value("max_words", c.max_words);
    c.max_chars = j.value("max_chars", c.max_chars);
}

void read_codec(const json &j, CodecConfig &c) {
    c.base = j.value("base", c.base);
    c.alphabet_size = j.value("alphabet_size", c.alphabet_size);
    c.start_token = j.value("start_token", c.start_token);
    c.end_token = j.value("end_token", c.end_token);
}

void read_sampling(const json &j, SamplingParams &s) {
    s.temperature = j.value("temperature", s.temperature);
    s.top_p = j.value("top_p", s.top_p);
    s.max_tokens = j.value("max_tokens", s.max_tokens);
    s.repetition_penalty = j.value("repetition_penalty", s.repetition_penalty);
}

void read_postprocess(const json &j, PostProcessConfig &c) {
    c.trim_silence = j.value("trim_silence", c.trim_silence);
    c.silence_threshold_db = j.value("silence_threshold_db", c.silence_threshold_db);
    c.min_silence_s = j.value("min_silence_s", c.min_silence_s);
    c.silence_pad_s = j.value("silence_pad_s", c.silence_pad_s);
    c.normalize = j.value("normalize", c.normalize);
    c.target_peak_db = j.value("target_peak_db", c.target_peak_db);
}

void read_synthesis(const json &j, SynthesizerConfig &c) {
    c.max_attempts = j.value("max_attempts", c.max_attempts);
    c.min_rms = j.value("min_rms", c.min_rms);
    c.trim_samples = j.value("trim_samples", c.trim_samples);
    c.fade_samples = j.value("fade_samples", c.fade_samples);
    c.retry_backoff_ms = j.value("retry_backoff_ms", c.retry_backoff_ms);
    if (const json *s = section(j, "sampling")) {
        read_sampling(*s, c.sampling);
    }
    if (const json *p = section(j, "postprocess")) {
        read_postprocess(*p, c.post);
    }
}

void read_voice(const json &v, VoiceParams &voice) {
    if (v.is_string()) {
        voice.description = v.get<std::string>();
        return;
    }
    if (!v.is_object()) {
        throw std::invalid_argument("\"voice\" must be a string or an object");
    }
    if (v.contains("preset")) {
        const std::string name = v.at("preset").get<std::string>();
        const VoicePreset *preset = find_voice_preset(name);
        if (!preset) {
            throw std::invalid_argument("unknown voice preset \"" + name + "\"");
        }
        voice.description = preset->description;
    }
    voice.description = v.value("description", voice.description);
}

void read_pronunciation(const json &j, PronunciationConfig &c) {
    c.use_defaults = j.value("defaults", c.use_defaults);
    c.csv_path = j.value("csv", c.csv_path);
    if (const json *entries = section(j, "entries")) {
        for (const auto &item : entries->items()) {
            c.entries.emplace_back(item.key(), item.value().get<std::string>());
        }
    }
}

void read_assembler(const json &j, AssemblerConfig &c) {
    c.sample_rate = j.value("sample_rate", c.sample_rate);
    c.chunk_gap_s = j.value("chunk_gap_s", c.chunk_gap_s);
    c.chapter_gap_s = j.value("chapter_gap_s", c.chapter_gap_s);
}

}  // namespace

Status validate_pipeline_config(const PipelineConfig &config) {
    if (config.chunking.max_words == 0 || config.chunking.max_chars == 0) {
        return make_status(false, "chunking limits must be positive");
    }
    if (config.synthesis.codec.alphabet_size <= 0) {
        return make_status(false, "codec alphabet_size must be positive");
    }
    if (config.synthesis.max_attempts == 0) {
        return make_status(false, "synthesis max_attempts must be at least 1");
    }
    if (config.synthesis.min_rms < 0.0) {
        return make_status(false, "synthesis min_rms must not be negative");
    }
    const auto &post = config.synthesis.post;
    if (post.silence_threshold_db >= 0.0 || post.min_silence_s < 0.0 || post.silence_pad_s < 0.0) {
        return make_status(false, "silence trimming parameters out of range");
    }
    if (post.target_peak_db > 0.0) {
        return make_status(false, "postprocess target_peak_db must not exceed 0 dBFS");
    }
    const auto &s = config.synthesis.sampling;
    if (s.temperature < 0.0f || s.top_p <= 0.0f || s.top_p > 1.0f || s.max_tokens <= 0 ||
        s.repetition_penalty <= 0.0f) {
        return make_status(false, "sampling parameters out of range");
    }
    if (config.coordinator.max_workers == 0) {
        return make_status(false, "coordinator max_workers must be at least 1");
    }
    if (config.assembler.sample_rate == 0) {
        return make_status(false, "assembler sample_rate must be positive");
    }
    if (config.assembler.chunk_gap_s < 0.0 || config.assembler.chapter_gap_s < 0.0) {
        return make_status(false, "assembler gaps must not be negative");
    }
    return make_status(true);
}

Status parse_pipeline_config(const std::string &json_text, PipelineConfig &out) {
    PipelineConfig cfg = out;
    try {
        const json j = json::parse(json_text);
        if (!j.is_object()) {
            return make_status(false, "config root must be an object");
        }
        if (const json *c = section(j, "chunking")) {
            read_chunking(*c, cfg.chunking);
        }
        if (const json *c = section(j, "codec")) {
            read_codec(*c, cfg.synthesis.codec);
        }
        if (const json *c = section(j, "synthesis")) {
            read_synthesis(*c, cfg.synthesis);
        }
        if (const json *c = section(j, "coordinator")) {
            cfg.coordinator.max_workers = c->value("max_workers", cfg.coordinator.max_workers);
            cfg.coordinator.max_buffered =
                c->value("max_buffered", cfg.coordinator.max_buffered);
        }
        if (const json *c = section(j, "assembler")) {
            read_assembler(*c, cfg.assembler);
        }
        if (j.contains("voice")) {
            read_voice(j["voice"], cfg.voice);
        }
        if (const json *c = section(j, "pronunciation")) {
            read_pronunciation(*c, cfg.pronunciation);
        }
        cfg.log_level = j.value("log_level", cfg.log_level);
    } catch (const std::exception &e) {
        NF_LOG("error", "config parse failed: " << e.what());
        return make_status(false, std::string("invalid config: ") + e.what());
    }
    Status st = validate_pipeline_config(cfg);
    if (!st.ok) {
        NF_LOG("error", "config rejected: " << st.message);
        return st;
    }
    out = std::move(cfg);
    return make_status(true);
}

Status load_pipeline_config(const std::string &path, PipelineConfig &out) {
    std::ifstream f(path);
    if (!f.is_open()) {
        NF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return make_status(false, "Failed to open config " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    NF_LOG("debug", "loading config " << path);
    return parse_pipeline_config(buffer.str(), out);
}

}  // namespace narrateforge
