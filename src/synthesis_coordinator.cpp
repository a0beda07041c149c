//
//  synthesis_coordinator.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/16/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "synthesis_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <thread>

#include "logging.hpp"

namespace narrateforge {

namespace {

// Stops and joins the pool when run() leaves early (delivery callback threw).
class WorkerPoolGuard {
public:
    WorkerPoolGuard(std::vector<std::thread> &threads, std::mutex &mutex,
                    std::condition_variable &cv, bool &stop)
        : threads_(threads), mutex_(mutex), cv_(cv), stop_(stop) {}

    ~WorkerPoolGuard() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (std::any_of(threads_.begin(), threads_.end(),
                            [](const std::thread &t) { return t.joinable(); })) {
                stop_ = true;
            }
        }
        cv_.notify_all();
        join();
    }

    void join() {
        for (auto &t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

private:
    std::vector<std::thread> &threads_;
    std::mutex &mutex_;
    std::condition_variable &cv_;
    bool &stop_;
};

}  // namespace

const char *to_string(JobState state) {
    switch (state) {
    case JobState::Running:
        return "running";
    case JobState::Completed:
        return "completed";
    case JobState::Cancelled:
        return "cancelled";
    case JobState::Failed:
        return "failed";
    case JobState::Aborted:
        return "aborted";
    }
    return "unknown";
}

SynthesisCoordinator::SynthesisCoordinator(InferenceHandle &inference, WaveformHandle &waveform,
                                           SynthesizerConfig synth_config,
                                           CoordinatorConfig config)
    : inference_(inference), waveform_(waveform), synth_config_(std::move(synth_config)),
      config_(config) {}

uint32_t SynthesisCoordinator::worker_count() const {
    if (!inference_.capabilities().concurrency_safe) {
        return 1;
    }
    return std::max<uint32_t>(1, config_.max_workers);
}

uint32_t SynthesisCoordinator::buffer_window() const {
    if (config_.max_buffered > 0) {
        return config_.max_buffered;
    }
    return 2 * worker_count();
}

void SynthesisCoordinator::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_ = true;
    }
    NF_LOG("info", "cancellation requested");
    cv_.notify_all();
}

std::vector<ChunkStatus> SynthesisCoordinator::chunk_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void SynthesisCoordinator::worker_loop(const ChunkSynthesizer &synth,
                                       const std::vector<TextChunk> &chunks,
                                       const VoiceParams &voice) {
    for (;;) {
        size_t idx = 0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] {
                return cancel_ || stop_ || next_dispatch_ >= chunks.size() ||
                       next_dispatch_ < delivered_ + window_;
            });
            if (cancel_ || stop_ || next_dispatch_ >= chunks.size()) {
                break;
            }
            idx = next_dispatch_++;
            status_[idx].slot = SlotState::InFlight;
        }
        try {
            SynthesisResult result =
                synth.synthesize(chunks[idx], voice, synth_config_.max_attempts,
                                 [this, idx](uint32_t attempt) {
                                     std::lock_guard<std::mutex> lock(mutex_);
                                     status_[idx].phase = ChunkPhase::Attempting;
                                     status_[idx].attempt = attempt;
                                 });
            {
                std::lock_guard<std::mutex> lock(mutex_);
                status_[idx].slot = SlotState::Done;
                status_[idx].phase = result.phase;
                reorder_[idx] = std::move(result);
            }
        } catch (const std::exception &e) {
            NF_LOG("error", "worker failed on chunk " << idx << ": " << e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            if (worker_error_.empty()) {
                worker_error_ = e.what();
            }
            stop_ = true;
        }
        cv_.notify_all();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_workers_;
    }
    cv_.notify_all();
}

CoordinatorOutcome SynthesisCoordinator::run(const std::vector<TextChunk> &chunks,
                                             const VoiceParams &voice, const DeliverFn &deliver,
                                             const ProgressFn &progress) {
    CoordinatorOutcome outcome;
    outcome.total = static_cast<uint32_t>(chunks.size());

    const uint32_t workers =
        std::min<uint32_t>(worker_count(), std::max<uint32_t>(1, outcome.total));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.assign(chunks.size(), ChunkStatus{});
        reorder_.clear();
        reorder_.resize(chunks.size());
        next_dispatch_ = 0;
        delivered_ = 0;
        window_ = std::max<uint32_t>(1, buffer_window());
        active_workers_ = workers;
        stop_ = false;
        worker_error_.clear();
    }
    NF_LOG("info", "synthesizing " << outcome.total << " chunks with " << workers
                                    << " worker(s), at most " << window_ << " buffered");

    ChunkSynthesizer synth(inference_, waveform_, synth_config_);
    std::vector<std::thread> threads;
    threads.reserve(workers);
    WorkerPoolGuard guard(threads, mutex_, cv_, stop_);
    for (uint32_t w = 0; w < workers; ++w) {
        threads.emplace_back([this, &synth, &chunks, &voice] { worker_loop(synth, chunks, voice); });
    }

    bool downstream_failed = false;
    for (size_t next = 0; next < chunks.size(); ++next) {
        SynthesisResult result;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return reorder_[next].has_value() || active_workers_ == 0; });
            if (!reorder_[next]) {
                break;
            }
            result = std::move(*reorder_[next]);
            reorder_[next].reset();
        }
        const bool degraded = !result.quality_ok;
        const uint32_t chunk_index = result.chunk_index;
        if (!deliver(std::move(result))) {
            NF_LOG("error", "downstream rejected chunk " << next << "; stopping dispatch");
            downstream_failed = true;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stop_ = true;
            }
            cv_.notify_all();
            break;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_[next].delivered = true;
            ++delivered_;
        }
        cv_.notify_all();
        if (degraded) {
            outcome.failed_chunks.push_back(chunk_index);
        }
        ++outcome.delivered;
        if (progress) {
            progress(outcome.delivered, outcome.total, text_preview(chunks[next].text));
        }
    }
    guard.join();

    std::string worker_error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker_error = worker_error_;
    }
    if (downstream_failed) {
        outcome.state = JobState::Failed;
        outcome.message = "export sink write failed";
    } else if (!worker_error.empty()) {
        outcome.state = JobState::Failed;
        outcome.message = worker_error;
    } else if (outcome.delivered == outcome.total) {
        outcome.state = JobState::Completed;
    } else {
        outcome.state = JobState::Cancelled;
        outcome.message = "cancelled after " + std::to_string(outcome.delivered) + " of " +
                          std::to_string(outcome.total) + " chunks";
    }
    NF_LOG("info", "job " << to_string(outcome.state) << ": " << outcome.delivered << "/"
                          << outcome.total << " delivered, " << outcome.failed_chunks.size()
                          << " degraded");
    return outcome;
}

}  // namespace narrateforge
