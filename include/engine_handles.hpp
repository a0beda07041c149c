//
//  engine_handles.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "engine.hpp"

namespace narrateforge {

/**
 * @brief Owned inference engine with an explicit init/shutdown lifecycle.
 *
 * Constructed once per process (or per book) and passed by reference to the synthesizer and
 * coordinator. `init()` fails when the engine cannot reset its state between chunks.
 */
class InferenceHandle {
public:
    explicit InferenceHandle(std::unique_ptr<InferenceEngine> engine);
    ~InferenceHandle();

    InferenceHandle(const InferenceHandle &) = delete;
    InferenceHandle &operator=(const InferenceHandle &) = delete;

    Status init();
    void shutdown();
    bool ready() const { return ready_; }

    // Valid after a successful init().
    EngineCapabilities capabilities() const { return caps_; }

    std::string build_prompt(const VoiceParams &voice, const std::string &text) const;

    // reset_state() followed by generate(), atomic with respect to other callers unless the
    // engine is concurrency-safe. Throws std::logic_error when not initialised; engine
    // exceptions propagate.
    std::vector<int32_t> generate_isolated(const std::string &prompt, const SamplingParams &params);

private:
    std::unique_ptr<InferenceEngine> engine_;
    EngineCapabilities caps_;
    bool ready_ = false;
    std::mutex mutex_;
};

/// Owned waveform codec; decode() is serialised unless the codec is concurrency-safe.
class WaveformHandle {
public:
    explicit WaveformHandle(std::unique_ptr<WaveformCodec> codec);
    ~WaveformHandle();

    WaveformHandle(const WaveformHandle &) = delete;
    WaveformHandle &operator=(const WaveformHandle &) = delete;

    Status init();
    void shutdown();
    bool ready() const { return ready_; }
    uint32_t sample_rate() const;

    DecodedAudio decode(const HierarchicalCode &code);

private:
    std::unique_ptr<WaveformCodec> codec_;
    bool concurrency_safe_ = false;
    bool ready_ = false;
    std::mutex mutex_;
};

}  // namespace narrateforge
