//
//  wav_writer.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/17/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <fstream>
#include <vector>

namespace narrateforge {

// RIFF + fmt (18) + fact + data header of a mono IEEE-float WAV file.
inline constexpr uint64_t kWavHeaderSize = 58;

// Write a 32-bit float mono WAV header with zero sizes at the current position.
// Returns the header position for patch_wav_sizes().
uint64_t write_wav_header(std::ofstream &out, uint32_t sample_rate);

// Append samples as little-endian float32.
void write_wav_samples(std::ofstream &out, const std::vector<float> &samples);

// Patch RIFF, fact and data sizes once all samples are written. Throws std::runtime_error when
// the data no longer fits the 32-bit RIFF size fields.
void patch_wav_sizes(std::ofstream &out, uint64_t header_pos, uint64_t sample_count);

}  // namespace narrateforge
