//
//  wav_export_sink.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "chapter_timeline.hpp"
#include "export_sink.hpp"
#include "metadata_set.hpp"

namespace narrateforge {

/**
 * @brief ExportSink writing one mono float WAV file plus chapter sidecars.
 *
 * The WAV file is opened on the first write (or at finalize for an empty book) and grows as
 * samples arrive; sizes are patched in finalize(). Next to it, finalize() writes
 * `<stem>.chapters.json` (title/artist/album/genre/year/comment plus `chapters[{title,
 * start_ms}]`, the layout a chapter muxer reads) and `<stem>.ffmetadata` (FFMETADATA1).
 */
class WavExportSink : public ExportSink {
public:
    WavExportSink(std::string path, uint32_t sample_rate, MetadataSet metadata = {});

    // Adopts the rate of the synthesized audio; fails once samples have been written.
    bool begin(uint32_t sample_rate) override;
    bool write(uint32_t chapter_id, const std::vector<float> &samples) override;
    bool finalize(const std::vector<ChapterTimeline> &timelines, double total_duration_s) override;
    std::vector<std::string> output_handles() const override;

    uint64_t samples_written() const { return samples_written_; }
    uint32_t sample_rate() const { return sample_rate_; }
    const std::string &chapters_json_path() const { return json_path_; }
    const std::string &ffmetadata_path() const { return ffmetadata_path_; }

private:
    bool open();

    std::string path_;
    std::string json_path_;
    std::string ffmetadata_path_;
    uint32_t sample_rate_;
    MetadataSet metadata_;

    std::ofstream out_;
    uint64_t header_pos_ = 0;
    uint64_t samples_written_ = 0;
    bool opened_ = false;
    bool finalized_ = false;
};

// Chapter JSON document (pretty-printed).
std::string render_chapters_json(const std::vector<ChapterTimeline> &timelines,
                                 const MetadataSet &metadata);

// FFMETADATA1 document with millisecond chapter ranges.
std::string render_ffmetadata(const std::vector<ChapterTimeline> &timelines,
                              double total_duration_s, const MetadataSet &metadata);

}  // namespace narrateforge
