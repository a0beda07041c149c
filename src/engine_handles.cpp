//
//  engine_handles.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "engine_handles.hpp"

#include <exception>
#include <stdexcept>

#include "logging.hpp"

namespace narrateforge {

namespace {

std::string trim_copy(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

std::string InferenceEngine::build_prompt(const VoiceParams &voice, const std::string &text) const {
    return "<description=\"" + trim_copy(voice.description) + "\"> " + trim_copy(text);
}

// ---------------------------------------------------------------------------
// InferenceHandle
// ---------------------------------------------------------------------------

InferenceHandle::InferenceHandle(std::unique_ptr<InferenceEngine> engine)
    : engine_(std::move(engine)) {}

InferenceHandle::~InferenceHandle() {
    try {
        shutdown();
    } catch (const std::exception &e) {
        NF_LOG("error", "inference engine shutdown threw: " << e.what());
    }
}

Status InferenceHandle::init() {
    if (ready_) {
        return make_status(true);
    }
    if (!engine_) {
        return make_status(false, "no inference engine");
    }
    try {
        Status st = engine_->init();
        if (!st.ok) {
            NF_LOG("error", "inference engine init failed: " << st.message);
            return st;
        }
        caps_ = engine_->capabilities();
    } catch (const std::exception &e) {
        NF_LOG("error", "inference engine init threw: " << e.what());
        return make_status(false, std::string("inference engine init failed: ") + e.what());
    }
    if (!caps_.supports_state_reset) {
        NF_LOG("error", "inference engine cannot reset state between chunks");
        engine_->shutdown();
        return make_status(false, "inference engine does not support state reset");
    }
    ready_ = true;
    NF_LOG("info", "inference engine ready (concurrency_safe="
                       << (caps_.concurrency_safe ? "yes" : "no") << ")");
    return make_status(true);
}

void InferenceHandle::shutdown() {
    if (!ready_) {
        return;
    }
    ready_ = false;
    engine_->shutdown();
    NF_LOG("debug", "inference engine shut down");
}

std::string InferenceHandle::build_prompt(const VoiceParams &voice,
                                          const std::string &text) const {
    if (!engine_) {
        throw std::logic_error("inference handle has no engine");
    }
    return engine_->build_prompt(voice, text);
}

std::vector<int32_t> InferenceHandle::generate_isolated(const std::string &prompt,
                                                        const SamplingParams &params) {
    if (!ready_) {
        throw std::logic_error("inference handle used before init()");
    }
    if (caps_.concurrency_safe) {
        engine_->reset_state();
        return engine_->generate(prompt, params);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    engine_->reset_state();
    return engine_->generate(prompt, params);
}

// ---------------------------------------------------------------------------
// WaveformHandle
// ---------------------------------------------------------------------------

WaveformHandle::WaveformHandle(std::unique_ptr<WaveformCodec> codec) : codec_(std::move(codec)) {}

WaveformHandle::~WaveformHandle() {
    try {
        shutdown();
    } catch (const std::exception &e) {
        NF_LOG("error", "waveform codec shutdown threw: " << e.what());
    }
}

Status WaveformHandle::init() {
    if (ready_) {
        return make_status(true);
    }
    if (!codec_) {
        return make_status(false, "no waveform codec");
    }
    try {
        Status st = codec_->init();
        if (!st.ok) {
            NF_LOG("error", "waveform codec init failed: " << st.message);
            return st;
        }
        concurrency_safe_ = codec_->concurrency_safe();
    } catch (const std::exception &e) {
        NF_LOG("error", "waveform codec init threw: " << e.what());
        return make_status(false, std::string("waveform codec init failed: ") + e.what());
    }
    ready_ = true;
    NF_LOG("info", "waveform codec ready (" << codec_->sample_rate() << " Hz)");
    return make_status(true);
}

void WaveformHandle::shutdown() {
    if (!ready_) {
        return;
    }
    ready_ = false;
    codec_->shutdown();
    NF_LOG("debug", "waveform codec shut down");
}

uint32_t WaveformHandle::sample_rate() const { return codec_ ? codec_->sample_rate() : 0; }

DecodedAudio WaveformHandle::decode(const HierarchicalCode &code) {
    if (!ready_) {
        throw std::logic_error("waveform handle used before init()");
    }
    if (concurrency_safe_) {
        return codec_->decode(code);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return codec_->decode(code);
}

}  // namespace narrateforge
