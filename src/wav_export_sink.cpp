//
//  wav_export_sink.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "wav_export_sink.hpp"

#include <cerrno>
#include <exception>
#include <filesystem>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "chapter_timing.hpp"
#include "logging.hpp"
#include "wav_writer.hpp"

using json = nlohmann::json;

namespace narrateforge {

namespace {

std::string sidecar_path(const std::string &path, const char *extension) {
    std::filesystem::path p(path);
    p.replace_extension(extension);
    return p.string();
}

// FFMETADATA reserves '=', ';', '#', '\' and newlines.
std::string escape_ffmetadata(const std::string &value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '=' || c == ';' || c == '#' || c == '\\' || c == '\n') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

bool write_text_file(const std::string &path, const std::string &text) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        NF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    f << text;
    return f.good();
}

}  // namespace

std::string render_chapters_json(const std::vector<ChapterTimeline> &timelines,
                                 const MetadataSet &metadata) {
    json j;
    j["title"] = metadata.title;
    j["artist"] = metadata.artist;
    j["album"] = metadata.album;
    j["genre"] = metadata.genre;
    j["year"] = metadata.year;
    j["comment"] = metadata.comment;

    json chapters = json::array();
    for (const auto &marker : markers_from_timelines(timelines)) {
        json c;
        c["title"] = marker.title;
        c["start_ms"] = marker.start_ms;
        chapters.push_back(c);
    }
    j["chapters"] = chapters;
    return j.dump(2) + "\n";
}

std::string render_ffmetadata(const std::vector<ChapterTimeline> &timelines,
                              double total_duration_s, const MetadataSet &metadata) {
    std::ostringstream os;
    os << ";FFMETADATA1\n";
    auto tag = [&os](const char *key, const std::string &value) {
        if (!value.empty()) {
            os << key << "=" << escape_ffmetadata(value) << "\n";
        }
    };
    tag("title", metadata.title);
    tag("artist", metadata.artist);
    tag("album", metadata.album);
    tag("genre", metadata.genre);
    tag("date", metadata.year);
    tag("comment", metadata.comment);

    const auto markers = markers_from_timelines(timelines);
    const auto durations = derive_durations_ms_from_starts(markers, seconds_to_ms(total_duration_s));
    for (size_t i = 0; i < markers.size(); ++i) {
        os << "\n[CHAPTER]\n";
        os << "TIMEBASE=1/1000\n";
        os << "START=" << markers[i].start_ms << "\n";
        os << "END=" << (static_cast<uint64_t>(markers[i].start_ms) + durations[i]) << "\n";
        os << "title=" << escape_ffmetadata(markers[i].title) << "\n";
    }
    return os.str();
}

WavExportSink::WavExportSink(std::string path, uint32_t sample_rate, MetadataSet metadata)
    : path_(std::move(path)), json_path_(sidecar_path(path_, ".chapters.json")),
      ffmetadata_path_(sidecar_path(path_, ".ffmetadata")), sample_rate_(sample_rate),
      metadata_(std::move(metadata)) {}

bool WavExportSink::open() {
    if (opened_) {
        return out_.good();
    }
    out_.open(path_, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        NF_LOG("error", "open failed for " << path_ << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    opened_ = true;
    header_pos_ = write_wav_header(out_, sample_rate_);
    NF_LOG("debug", "wav: writing " << path_ << " at " << sample_rate_ << " Hz");
    return out_.good();
}

bool WavExportSink::begin(uint32_t sample_rate) {
    if (sample_rate == 0) {
        NF_LOG("error", "wav: invalid sample rate 0 for " << path_);
        return false;
    }
    if (opened_ && sample_rate != sample_rate_) {
        NF_LOG("error", "wav: " << path_ << " already written at " << sample_rate_
                                << " Hz, cannot switch to " << sample_rate << " Hz");
        return false;
    }
    if (sample_rate != sample_rate_) {
        NF_LOG("info", "wav: " << path_ << " uses " << sample_rate << " Hz (constructed with "
                               << sample_rate_ << " Hz)");
        sample_rate_ = sample_rate;
    }
    return true;
}

bool WavExportSink::write(uint32_t chapter_id, const std::vector<float> &samples) {
    if (finalized_) {
        NF_LOG("error", "wav: write after finalize (chapter " << chapter_id << ")");
        return false;
    }
    if (!open()) {
        return false;
    }
    write_wav_samples(out_, samples);
    samples_written_ += samples.size();
    return out_.good();
}

bool WavExportSink::finalize(const std::vector<ChapterTimeline> &timelines,
                             double total_duration_s) {
    if (finalized_) {
        NF_LOG("error", "wav: finalize called twice for " << path_);
        return false;
    }
    if (!open()) {
        return false;
    }
    try {
        patch_wav_sizes(out_, header_pos_, samples_written_);
    } catch (const std::exception &e) {
        NF_LOG("error", "wav: " << e.what() << " for " << path_);
        return false;
    }
    out_.close();
    if (out_.fail()) {
        NF_LOG("error", "wav: closing " << path_ << " failed");
        return false;
    }
    if (!write_text_file(json_path_, render_chapters_json(timelines, metadata_)) ||
        !write_text_file(ffmetadata_path_,
                         render_ffmetadata(timelines, total_duration_s, metadata_))) {
        return false;
    }
    finalized_ = true;
    NF_LOG("info", "wrote " << path_ << " (" << samples_written_ << " samples, "
                            << timelines.size() << " chapters)");
    return true;
}

std::vector<std::string> WavExportSink::output_handles() const {
    if (!finalized_) {
        return {};
    }
    return {path_, json_path_, ffmetadata_path_};
}

}  // namespace narrateforge
