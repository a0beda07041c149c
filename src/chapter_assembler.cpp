//
//  chapter_assembler.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "chapter_assembler.hpp"

#include <algorithm>
#include <utility>

#include "audio_utils.hpp"
#include "logging.hpp"

namespace narrateforge {

namespace {
// Silence is written in bounded blocks.
constexpr uint64_t kSilenceBlockSamples = 1 << 16;
}  // namespace

ChapterAssembler::ChapterAssembler(ExportSink &sink, AssemblerConfig config,
                                   std::vector<std::string> titles)
    : sink_(sink), config_(config), titles_(std::move(titles)),
      chunk_gap_samples_(samples_for_seconds(config.chunk_gap_s, config.sample_rate)),
      chapter_gap_samples_(samples_for_seconds(config.chapter_gap_s, config.sample_rate)) {}

double ChapterAssembler::to_seconds(uint64_t samples) const {
    if (config_.sample_rate == 0) {
        return 0.0;
    }
    return static_cast<double>(samples) / static_cast<double>(config_.sample_rate);
}

double ChapterAssembler::total_duration_s() const { return to_seconds(cursor_); }

std::string ChapterAssembler::title_for(uint32_t chapter_id) const {
    if (chapter_id < titles_.size() && !titles_[chapter_id].empty()) {
        return titles_[chapter_id];
    }
    return "Chapter " + std::to_string(chapter_id + 1);
}

bool ChapterAssembler::write_silence(uint32_t chapter_id, uint64_t samples) {
    while (samples > 0) {
        const uint64_t n = std::min(samples, kSilenceBlockSamples);
        if (!sink_.write(chapter_id, std::vector<float>(static_cast<size_t>(n), 0.0f))) {
            return false;
        }
        cursor_ += n;
        samples -= n;
    }
    return true;
}

void ChapterAssembler::open_chapter(uint32_t chapter_id) {
    ChapterTimeline t;
    t.chapter_id = chapter_id;
    t.title = title_for(chapter_id);
    t.start_s = to_seconds(cursor_);
    current_ = std::move(t);
    current_start_ = cursor_;
    next_chapter_ = chapter_id + 1;
    NF_LOG("debug", "assembler: chapter " << chapter_id << " opens at " << current_->start_s
                                          << "s");
}

bool ChapterAssembler::close_chapter(bool trailing_gap) {
    if (!current_) {
        return true;
    }
    if (trailing_gap && !current_->segments.empty()) {
        if (!write_silence(current_->chapter_id, chapter_gap_samples_)) {
            return false;
        }
    }
    current_->end_s = to_seconds(cursor_);
    current_->total_duration_s = to_seconds(cursor_ - current_start_);
    NF_LOG("info", "chapter " << current_->chapter_id << " \"" << current_->title << "\" closed: "
                              << current_->segments.size() << " chunks, "
                              << current_->total_duration_s << "s");
    timelines_.push_back(std::move(*current_));
    current_.reset();
    return true;
}

void ChapterAssembler::append_empty_chapter(uint32_t chapter_id) {
    ChapterTimeline t;
    t.chapter_id = chapter_id;
    t.title = title_for(chapter_id);
    t.start_s = to_seconds(cursor_);
    t.end_s = t.start_s;
    NF_LOG("debug", "assembler: chapter " << chapter_id << " has no audio");
    timelines_.push_back(std::move(t));
    next_chapter_ = chapter_id + 1;
}

bool ChapterAssembler::consume(SynthesisResult &&result) {
    if (finished_ || sink_failed_) {
        NF_LOG("error", "assembler: chunk " << result.chunk_index << " after "
                                            << (finished_ ? "finish" : "sink failure"));
        return false;
    }
    const uint32_t chapter = result.chapter_id;
    if (current_ ? chapter < current_->chapter_id : chapter < next_chapter_) {
        NF_LOG("error", "assembler: chunk " << result.chunk_index << " of chapter " << chapter
                                            << " arrived after a later chapter");
        return false;
    }
    if (!current_ || current_->chapter_id != chapter) {
        if (!close_chapter(true)) {
            sink_failed_ = true;
            return false;
        }
        while (next_chapter_ < chapter) {
            append_empty_chapter(next_chapter_);
        }
        open_chapter(chapter);
    }

    if (!result.quality_ok) {
        failed_.push_back(result.chunk_index);
    } else if (!result.samples.empty() && result.sample_rate != config_.sample_rate) {
        NF_LOG("warn", "chunk " << result.chunk_index << " has sample rate " << result.sample_rate
                                << " Hz, expected " << config_.sample_rate << " Hz");
        failed_.push_back(result.chunk_index);
    }

    if (!current_->segments.empty() && !write_silence(chapter, chunk_gap_samples_)) {
        sink_failed_ = true;
        return false;
    }
    TimelineSegment seg;
    seg.chunk_index = result.chunk_index;
    seg.start_s = to_seconds(cursor_);
    if (!result.samples.empty()) {
        if (!sink_.write(chapter, result.samples)) {
            NF_LOG("error", "assembler: sink write failed for chunk " << result.chunk_index);
            sink_failed_ = true;
            return false;
        }
        cursor_ += result.samples.size();
    }
    seg.end_s = to_seconds(cursor_);
    current_->segments.push_back(seg);
    return true;
}

bool ChapterAssembler::finish(bool complete) {
    if (finished_) {
        NF_LOG("error", "assembler: finish() called twice");
        return false;
    }
    finished_ = true;
    bool ok = !sink_failed_;
    if (ok) {
        ok = close_chapter(false);
    } else if (current_) {
        // Keep the partial chapter on the timeline even though the sink failed.
        current_->end_s = to_seconds(cursor_);
        current_->total_duration_s = to_seconds(cursor_ - current_start_);
        timelines_.push_back(std::move(*current_));
        current_.reset();
    }
    if (complete) {
        while (next_chapter_ < titles_.size()) {
            append_empty_chapter(next_chapter_);
        }
    }
    if (!ok) {
        return false;
    }
    if (!sink_.finalize(timelines_, total_duration_s())) {
        NF_LOG("error", "assembler: sink finalize failed");
        return false;
    }
    NF_LOG("info", "assembled " << timelines_.size() << " chapters, " << total_duration_s()
                                << "s total, " << failed_.size() << " degraded chunks");
    return true;
}

}  // namespace narrateforge
