// Coordinator coverage: in-order delivery under any completion order, progress order,
// cancellation, downstream failure, degraded chunk reporting and the buffer window.
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "engine_handles.hpp"
#include "logging.hpp"
#include "synthesis_coordinator.hpp"
#include "test_utils.hpp"

using namespace narrateforge;
using test_utils::FakeInferenceEngine;
using test_utils::ToneCodec;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[coordinator_ordering] FAIL: " << msg << "\n";
    }
    return cond;
}

std::vector<TextChunk> make_chunks(size_t n) {
    std::vector<TextChunk> chunks;
    for (size_t i = 0; i < n; ++i) {
        TextChunk c;
        c.index = static_cast<uint32_t>(i);
        c.global_index = static_cast<uint32_t>(i);
        c.text = "Chunk " + std::to_string(i) + ".";
        chunks.push_back(c);
    }
    return chunks;
}

uint32_t chunk_number(const std::string &text) {
    return static_cast<uint32_t>(std::stoul(text.substr(6)));
}

struct Rig {
    FakeInferenceEngine::Counters counters;
    std::unique_ptr<InferenceHandle> inference;
    std::unique_ptr<WaveformHandle> waveform;

    Rig(bool concurrency_safe, FakeInferenceEngine::ProduceFn produce,
        FakeInferenceEngine::DelayFn delay) {
        FakeInferenceEngine::Options options;
        options.concurrency_safe = concurrency_safe;
        inference = std::make_unique<InferenceHandle>(std::make_unique<FakeInferenceEngine>(
            options, counters, std::move(produce), std::move(delay)));
        waveform = std::make_unique<WaveformHandle>(std::make_unique<ToneCodec>());
    }

    bool init() { return inference->init().ok && waveform->init().ok; }
};

SynthesizerConfig fast_config() {
    SynthesizerConfig cfg;
    cfg.max_attempts = 2;
    return cfg;
}

bool test_single_worker_slow_middle_chunk() {
    Rig rig(false, {}, [](const std::string &text) { return chunk_number(text) == 2 ? 80 : 5; });
    bool ok = check(rig.init(), "init");
    SynthesisCoordinator coord(*rig.inference, *rig.waveform, fast_config(), CoordinatorConfig{4});
    ok &= check(coord.worker_count() == 1, "unsafe engine -> one worker");
    std::vector<uint32_t> delivered;
    const auto outcome = coord.run(make_chunks(5), VoiceParams{"v"}, [&](SynthesisResult &&r) {
        delivered.push_back(r.chunk_index);
        return true;
    });
    ok &= check(outcome.state == JobState::Completed, "job completed");
    ok &= check(delivered == std::vector<uint32_t>({0, 1, 2, 3, 4}), "delivered 1,2,3,4,5 in order");
    ok &= check(rig.counters.overlaps == 0, "no concurrent generate on an unsafe engine");
    ok &= check(rig.counters.contaminated == 0, "reset before every generate");
    return ok;
}

bool test_parallel_random_delays() {
    uint32_t state = 99;
    std::vector<int> delays;
    for (int i = 0; i < 24; ++i) {
        state = state * 1103515245u + 12345u;
        delays.push_back(static_cast<int>((state >> 16) % 25));
    }
    std::mutex completion_mutex;
    std::vector<uint32_t> completion;
    Rig rig(
        true,
        [&](const std::string &text, uint32_t) {
            std::lock_guard<std::mutex> lock(completion_mutex);
            completion.push_back(chunk_number(text));
            return test_utils::speech_tokens(2);
        },
        [&delays](const std::string &text) { return delays[chunk_number(text)]; });
    bool ok = check(rig.init(), "init");
    SynthesisCoordinator coord(*rig.inference, *rig.waveform, fast_config(), CoordinatorConfig{4});
    ok &= check(coord.worker_count() == 4, "safe engine -> max_workers");

    const auto chunks = make_chunks(delays.size());
    std::vector<uint32_t> delivered;
    std::vector<uint32_t> progress_counts;
    bool previews_match = true;
    const auto outcome = coord.run(
        chunks, VoiceParams{"v"},
        [&](SynthesisResult &&r) {
            delivered.push_back(r.chunk_index);
            return true;
        },
        [&](uint32_t completed, uint32_t total, const std::string &preview) {
            progress_counts.push_back(completed);
            previews_match &= total == chunks.size() && preview == chunks[completed - 1].text;
        });
    std::vector<uint32_t> expected(chunks.size());
    for (uint32_t i = 0; i < expected.size(); ++i) {
        expected[i] = i;
    }
    ok &= check(outcome.state == JobState::Completed && outcome.delivered == chunks.size(),
                "all chunks delivered");
    ok &= check(delivered == expected, "delivery order equals index order");
    std::vector<uint32_t> expected_counts(chunks.size());
    for (uint32_t i = 0; i < expected_counts.size(); ++i) {
        expected_counts[i] = i + 1;
    }
    ok &= check(progress_counts == expected_counts, "progress fires once per chunk in order");
    ok &= check(previews_match, "progress preview names the delivered chunk");
    ok &= check(completion.size() == chunks.size(), "every chunk synthesized once");
    ok &= check(outcome.failed_chunks.empty(), "no degraded chunks");
    return ok;
}

bool test_slow_head_is_held_back() {
    std::mutex completion_mutex;
    std::vector<uint32_t> completion;
    Rig rig(
        true,
        [&](const std::string &text, uint32_t) {
            std::lock_guard<std::mutex> lock(completion_mutex);
            completion.push_back(chunk_number(text));
            return test_utils::speech_tokens(2);
        },
        [](const std::string &text) { return chunk_number(text) == 0 ? 150 : 1; });
    bool ok = check(rig.init(), "init");
    SynthesisCoordinator coord(*rig.inference, *rig.waveform, fast_config(), CoordinatorConfig{3});
    std::vector<uint32_t> delivered;
    coord.run(make_chunks(6), VoiceParams{"v"}, [&](SynthesisResult &&r) {
        delivered.push_back(r.chunk_index);
        return true;
    });
    ok &= check(!completion.empty() && completion.front() != 0,
                "later chunks finished before chunk 0");
    ok &= check(delivered == std::vector<uint32_t>({0, 1, 2, 3, 4, 5}),
                "reorder buffer restores index order");
    return ok;
}

bool test_cancel_keeps_prefix() {
    Rig rig(false, {}, [](const std::string &) { return 10; });
    bool ok = check(rig.init(), "init");
    SynthesisCoordinator coord(*rig.inference, *rig.waveform, fast_config(), CoordinatorConfig{});
    std::vector<uint32_t> delivered;
    const auto outcome = coord.run(
        make_chunks(10), VoiceParams{"v"},
        [&](SynthesisResult &&r) {
            delivered.push_back(r.chunk_index);
            return true;
        },
        [&](uint32_t completed, uint32_t, const std::string &) {
            if (completed == 3) {
                coord.cancel();
            }
        });
    ok &= check(outcome.state == JobState::Cancelled, "job cancelled");
    ok &= check(outcome.delivered >= 3 && outcome.delivered < 10, "partial delivery");
    bool prefix = true;
    for (uint32_t i = 0; i < delivered.size(); ++i) {
        prefix &= delivered[i] == i;
    }
    ok &= check(prefix && delivered.size() == outcome.delivered, "delivered a contiguous prefix");
    ok &= check(rig.counters.generates == static_cast<int>(outcome.delivered),
                "in-flight work finished and nothing else was dispatched");
    const auto status = coord.chunk_status();
    for (uint32_t i = 0; i < status.size(); ++i) {
        const bool was_delivered = i < outcome.delivered;
        ok &= check(status[i].delivered == was_delivered, "chunk status tracks delivery");
        if (!was_delivered) {
            ok &= check(status[i].slot == SlotState::Pending, "undelivered chunks never started");
        }
    }

    // A cancelled coordinator dispatches nothing further.
    std::vector<uint32_t> again;
    const auto second = coord.run(make_chunks(2), VoiceParams{"v"}, [&](SynthesisResult &&r) {
        again.push_back(r.chunk_index);
        return true;
    });
    ok &= check(second.state == JobState::Cancelled && again.empty(), "cancel is sticky");
    return ok;
}

bool test_downstream_failure_stops_job() {
    Rig rig(false, {}, [](const std::string &) { return 5; });
    bool ok = check(rig.init(), "init");
    SynthesisCoordinator coord(*rig.inference, *rig.waveform, fast_config(), CoordinatorConfig{});
    int calls = 0;
    const auto outcome = coord.run(make_chunks(8), VoiceParams{"v"}, [&](SynthesisResult &&) {
        return ++calls <= 2;
    });
    ok &= check(outcome.state == JobState::Failed, "sink failure fails the job");
    ok &= check(outcome.delivered == 2, "delivered prefix before the failure");
    ok &= check(rig.counters.generates < 8, "dispatch stopped");
    return ok;
}

bool test_degraded_chunks_reported() {
    Rig rig(
        false,
        [](const std::string &text, uint32_t) {
            return test_utils::speech_tokens(2, chunk_number(text) == 1 ? 0 : 1);
        },
        {});
    bool ok = check(rig.init(), "init");
    SynthesisCoordinator coord(*rig.inference, *rig.waveform, fast_config(), CoordinatorConfig{});
    std::vector<bool> quality;
    const auto outcome = coord.run(make_chunks(3), VoiceParams{"v"}, [&](SynthesisResult &&r) {
        quality.push_back(r.quality_ok);
        return true;
    });
    ok &= check(outcome.state == JobState::Completed, "degraded chunk does not abort the job");
    ok &= check(quality == std::vector<bool>({true, false, true}), "degraded chunk still delivered");
    ok &= check(outcome.failed_chunks == std::vector<uint32_t>({1}), "failed index reported");
    const auto status = coord.chunk_status();
    ok &= check(status.size() == 3 && status[1].phase == ChunkPhase::Exhausted &&
                    status[1].attempt == 2,
                "exhausted phase recorded");
    return ok;
}

// Dispatched chunks not yet handed downstream (in flight or parked in the reorder buffer).
size_t undelivered_backlog(const std::vector<ChunkStatus> &status) {
    return static_cast<size_t>(std::count_if(status.begin(), status.end(), [](const ChunkStatus &s) {
        return s.slot != SlotState::Pending && !s.delivered;
    }));
}

bool test_slow_sink_bounds_backlog() {
    Rig rig(false, {}, {});
    bool ok = check(rig.init(), "init");
    SynthesisCoordinator coord(*rig.inference, *rig.waveform, fast_config(), CoordinatorConfig{});
    ok &= check(coord.buffer_window() == 2, "default window is twice the worker count");
    size_t max_backlog = 0;
    const auto outcome = coord.run(make_chunks(60), VoiceParams{"v"}, [&](SynthesisResult &&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        max_backlog = std::max(max_backlog, undelivered_backlog(coord.chunk_status()));
        return true;
    });
    ok &= check(outcome.state == JobState::Completed && outcome.delivered == 60,
                "slow sink still receives every chunk");
    ok &= check(max_backlog >= 1 && max_backlog <= 2,
                "backlog stays within the window, saw " + std::to_string(max_backlog));
    return ok;
}

bool test_stalled_head_bounds_backlog() {
    Rig rig(true, {}, [](const std::string &text) { return chunk_number(text) == 0 ? 120 : 1; });
    bool ok = check(rig.init(), "init");
    CoordinatorConfig config;
    config.max_workers = 4;
    config.max_buffered = 3;
    SynthesisCoordinator coord(*rig.inference, *rig.waveform, fast_config(), config);
    ok &= check(coord.buffer_window() == 3, "configured window");
    std::vector<uint32_t> delivered;
    size_t max_backlog = 0;
    const auto outcome = coord.run(make_chunks(12), VoiceParams{"v"}, [&](SynthesisResult &&r) {
        max_backlog = std::max(max_backlog, undelivered_backlog(coord.chunk_status()));
        delivered.push_back(r.chunk_index);
        return true;
    });
    ok &= check(outcome.state == JobState::Completed, "job completed");
    ok &= check(max_backlog <= 3, "stalled head holds at most the window, saw " +
                                      std::to_string(max_backlog));
    bool in_order = delivered.size() == 12;
    for (uint32_t i = 0; in_order && i < delivered.size(); ++i) {
        in_order = delivered[i] == i;
    }
    ok &= check(in_order, "delivery order unaffected by the window");
    return ok;
}

bool test_empty_job() {
    Rig rig(false, {}, {});
    bool ok = check(rig.init(), "init");
    SynthesisCoordinator coord(*rig.inference, *rig.waveform, fast_config(), CoordinatorConfig{});
    const auto outcome =
        coord.run({}, VoiceParams{"v"}, [](SynthesisResult &&) { return true; });
    ok &= check(outcome.state == JobState::Completed && outcome.total == 0, "empty job completes");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_single_worker_slow_middle_chunk();
    ok &= test_parallel_random_delays();
    ok &= test_slow_head_is_held_back();
    ok &= test_cancel_keeps_prefix();
    ok &= test_downstream_failure_stops_job();
    ok &= test_degraded_chunks_reported();
    ok &= test_slow_sink_bounds_backlog();
    ok &= test_stalled_head_bounds_backlog();
    ok &= test_empty_job();
    if (ok) {
        std::cout << "coordinator_ordering OK\n";
    }
    return ok ? 0 : 1;
}
