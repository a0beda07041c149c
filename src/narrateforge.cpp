//
//  narrateforge.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//
#include "narrateforge.hpp"
#include "narrateforge_version.hpp"

#include <chrono>
#include <utility>

#include "chapter_assembler.hpp"
#include "logging.hpp"
#include "pronunciation_dictionary.hpp"

namespace narrateforge {

namespace {

Status build_dictionary(const PronunciationConfig &config, PronunciationDictionary &dict) {
    if (config.use_defaults) {
        dict.load_defaults();
    }
    if (!config.csv_path.empty()) {
        Status st = dict.load_csv(config.csv_path);
        if (!st.ok) {
            return st;
        }
    }
    for (const auto &[word, spoken] : config.entries) {
        dict.add(word, spoken);
    }
    return make_status(true);
}

}  // namespace

std::string version_string() { return NARRATEFORGE_VERSION_DISPLAY; }

BookPipeline::BookPipeline(PipelineConfig config, InferenceHandle &inference,
                           WaveformHandle &waveform, ExportSink &sink)
    : config_(std::move(config)), inference_(inference), waveform_(waveform), sink_(sink),
      coordinator_(inference, waveform, config_.synthesis, config_.coordinator) {}

ProgressStats BookPipeline::progress_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

JobResult BookPipeline::abort(std::string message) const {
    NF_LOG("error", "job aborted: " << message);
    JobResult r;
    r.state = JobState::Aborted;
    r.status = make_status(false, std::move(message));
    return r;
}

JobResult BookPipeline::run(const std::vector<ChapterText> &chapters,
                            const ProgressFn &progress) {
    const auto t0 = std::chrono::steady_clock::now();
    if (!config_.log_level.empty()) {
        set_log_verbosity(parse_log_verbosity(config_.log_level));
    }
    Status st = validate_pipeline_config(config_);
    if (!st.ok) {
        return abort("invalid configuration: " + st.message);
    }
    PronunciationDictionary dictionary;
    st = build_dictionary(config_.pronunciation, dictionary);
    if (!st.ok) {
        return abort(st.message);
    }
    st = inference_.init();
    if (!st.ok) {
        return abort("Failed to initialise inference engine: " + st.message);
    }
    st = waveform_.init();
    if (!st.ok) {
        return abort("Failed to initialise waveform codec: " + st.message);
    }
    const auto t_init = std::chrono::steady_clock::now();

    AssemblerConfig assembler_config = config_.assembler;
    const uint32_t codec_rate = waveform_.sample_rate();
    if (codec_rate != 0 && codec_rate != assembler_config.sample_rate) {
        NF_LOG("warn", "configured sample rate " << assembler_config.sample_rate
                                                 << " Hz differs from codec rate " << codec_rate
                                                 << " Hz; using the codec rate");
        assembler_config.sample_rate = codec_rate;
    }
    if (!sink_.begin(assembler_config.sample_rate)) {
        return abort("export sink rejected " + std::to_string(assembler_config.sample_rate) +
                     " Hz audio");
    }

    std::vector<ChapterText> spoken = chapters;
    if (!dictionary.empty()) {
        for (auto &c : spoken) {
            c.text = dictionary.apply(c.text);
        }
        NF_LOG("debug", "applied " << dictionary.size() << " pronunciation overrides");
    }
    const auto chunks =
        chunk_chapters(spoken, config_.chunking.max_words, config_.chunking.max_chars);
    std::vector<std::string> titles;
    titles.reserve(chapters.size());
    uint64_t total_chars = 0;
    for (const auto &c : chapters) {
        titles.push_back(c.title);
    }
    for (const auto &c : chunks) {
        total_chars += c.char_count;
    }
    NF_LOG("info", "book: " << chapters.size() << " chapters, " << chunks.size() << " chunks, "
                            << total_chars << " chars");

    ProgressTracker tracker(static_cast<uint32_t>(chunks.size()), total_chars);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_ = tracker.stats();
    }
    ChapterAssembler assembler(sink_, assembler_config, std::move(titles));

    auto deliver = [&](SynthesisResult &&result) {
        const uint64_t chars =
            result.chunk_index < chunks.size() ? chunks[result.chunk_index].char_count : 0;
        const bool ok = result.quality_ok;
        if (!assembler.consume(std::move(result))) {
            return false;
        }
        tracker.record(chars, ok);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_ = tracker.stats();
        return true;
    };
    auto report = [&](uint32_t completed, uint32_t total, const std::string &preview) {
        NF_LOG("info", "progress " << tracker.summary() << " \"" << preview << "\"");
        if (progress) {
            progress(completed, total, preview);
        }
    };

    CoordinatorOutcome outcome = coordinator_.run(chunks, config_.voice, deliver, report);
    const bool finished = assembler.finish(outcome.state == JobState::Completed);

    JobResult result;
    result.state = outcome.state;
    result.delivered = outcome.delivered;
    result.total = outcome.total;
    result.failed_chunk_indices = assembler.failed_chunks();
    result.timelines = assembler.timelines();
    result.total_duration_s = assembler.total_duration_s();
    result.output_handles = sink_.output_handles();
    if (!finished && outcome.state != JobState::Failed) {
        result.state = JobState::Failed;
        outcome.message = "export sink finalize failed";
    }
    switch (result.state) {
    case JobState::Completed:
    case JobState::Cancelled:
        result.status = make_status(true, outcome.message);
        break;
    default:
        result.status = make_status(false, outcome.message);
        break;
    }

    const auto t1 = std::chrono::steady_clock::now();
    const auto init_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t_init - t0).count();
    const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
    NF_LOG("info", "book " << to_string(result.state) << " in " << total_ms << " ms (init "
                           << init_ms << " ms), " << result.total_duration_s << "s audio, "
                           << result.failed_chunk_indices.size() << " degraded chunks");
    return result;
}

}  // namespace narrateforge
