//
//  wav_writer.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "wav_writer.hpp"

#include <cstring>
#include <stdexcept>

namespace narrateforge {

namespace {

constexpr uint16_t kFormatIeeeFloat = 3;
constexpr uint16_t kBitsPerSample = 32;
constexpr uint16_t kChannels = 1;

// Offsets of the size fields relative to the header start.
constexpr uint64_t kRiffSizeOffset = 4;
constexpr uint64_t kFactSampleCountOffset = 46;
constexpr uint64_t kDataSizeOffset = 54;

void put_le16(std::vector<uint8_t> &v, uint16_t x) {
    v.push_back(static_cast<uint8_t>(x & 0xFF));
    v.push_back(static_cast<uint8_t>((x >> 8) & 0xFF));
}

void put_le32(std::vector<uint8_t> &v, uint32_t x) {
    v.push_back(static_cast<uint8_t>(x & 0xFF));
    v.push_back(static_cast<uint8_t>((x >> 8) & 0xFF));
    v.push_back(static_cast<uint8_t>((x >> 16) & 0xFF));
    v.push_back(static_cast<uint8_t>((x >> 24) & 0xFF));
}

void put_tag(std::vector<uint8_t> &v, const char *tag) {
    v.insert(v.end(), tag, tag + 4);
}

void patch_le32(std::ofstream &out, uint64_t pos, uint32_t value) {
    uint8_t bytes[4] = {static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>((value >> 8) & 0xFF),
                        static_cast<uint8_t>((value >> 16) & 0xFF),
                        static_cast<uint8_t>((value >> 24) & 0xFF)};
    out.seekp(static_cast<std::streamoff>(pos));
    out.write(reinterpret_cast<char *>(bytes), 4);
}

}  // namespace

// -----------------------------------------------------------------------------
// Header with placeholder sizes.
// -----------------------------------------------------------------------------
uint64_t write_wav_header(std::ofstream &out, uint32_t sample_rate) {
    const uint64_t header_pos = static_cast<uint64_t>(out.tellp());
    const uint16_t block_align = kChannels * (kBitsPerSample / 8);

    std::vector<uint8_t> h;
    h.reserve(kWavHeaderSize);
    put_tag(h, "RIFF");
    put_le32(h, 0);
    put_tag(h, "WAVE");

    put_tag(h, "fmt ");
    put_le32(h, 18);
    put_le16(h, kFormatIeeeFloat);
    put_le16(h, kChannels);
    put_le32(h, sample_rate);
    put_le32(h, sample_rate * block_align);
    put_le16(h, block_align);
    put_le16(h, kBitsPerSample);
    put_le16(h, 0);  // cbSize

    // Non-PCM formats carry a fact chunk with the sample count.
    put_tag(h, "fact");
    put_le32(h, 4);
    put_le32(h, 0);

    put_tag(h, "data");
    put_le32(h, 0);

    out.write(reinterpret_cast<const char *>(h.data()), static_cast<std::streamsize>(h.size()));
    return header_pos;
}

void write_wav_samples(std::ofstream &out, const std::vector<float> &samples) {
    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * 4);
    for (float s : samples) {
        uint32_t bits = 0;
        std::memcpy(&bits, &s, sizeof(bits));
        put_le32(bytes, bits);
    }
    out.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
}

// -----------------------------------------------------------------------------
// Patch sizes after the last sample.
// -----------------------------------------------------------------------------
void patch_wav_sizes(std::ofstream &out, uint64_t header_pos, uint64_t sample_count) {
    const uint64_t data_bytes = sample_count * (kBitsPerSample / 8) * kChannels;
    const uint64_t riff_size = kWavHeaderSize - 8 + data_bytes;
    if (riff_size > 0xFFFFFFFFULL) {
        throw std::runtime_error("wav data too large ( > 4 GB )");
    }
    const uint64_t end_pos = static_cast<uint64_t>(out.tellp());

    patch_le32(out, header_pos + kRiffSizeOffset, static_cast<uint32_t>(riff_size));
    patch_le32(out, header_pos + kFactSampleCountOffset, static_cast<uint32_t>(sample_count));
    patch_le32(out, header_pos + kDataSizeOffset, static_cast<uint32_t>(data_bytes));

    out.seekp(static_cast<std::streamoff>(end_pos));
}

}  // namespace narrateforge
