//
//  token_codec.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace narrateforge {

inline constexpr size_t kTokensPerFrame = 7;
inline constexpr int32_t kDefaultCodeBase = 128266;
inline constexpr int32_t kDefaultAlphabetSize = 4096;
inline constexpr int32_t kDefaultStartOfSpeechToken = 128257;
inline constexpr int32_t kDefaultEndOfSpeechToken = 128258;

/// Three-level code consumed by the waveform codec: |l2| = 2|l1|, |l3| = 4|l1|.
struct HierarchicalCode {
    std::vector<int32_t> l1;
    std::vector<int32_t> l2;
    std::vector<int32_t> l3;

    size_t frames() const { return l1.size(); }
    bool empty() const { return l1.empty(); }
    // Level lengths agree and every value lies in [0, alphabet_size).
    bool is_consistent(int32_t alphabet_size) const;
};

struct UnpackResult {
    HierarchicalCode code;
    size_t anomalies = 0;         // tokens outside the valid range (excluded)
    size_t discarded_tokens = 0;  // trailing partial frame (dropped, never padded)
};

/**
 * @brief Unpack a flat model token stream into hierarchical codes.
 *
 * Every 7 valid tokens form one frame mapped as
 * slot0->L1[i], slot1->L2[2i], slot2->L3[4i], slot3->L3[4i+1],
 * slot4->L2[2i+1], slot5->L3[4i+2], slot6->L3[4i+3], each value being
 * (token - base) mod alphabet_size. Tokens outside [base, base + 7*alphabet_size) are counted
 * as anomalies and skipped. Throws std::invalid_argument when alphabet_size <= 0.
 */
UnpackResult unpack_frames(const std::vector<int32_t> &tokens, int32_t base,
                           int32_t alphabet_size);

// Cut engine output to the span after the first start-of-speech marker and before the first
// end-of-speech marker. Missing markers leave that side of the stream untouched.
std::vector<int32_t> extract_code_stream(const std::vector<int32_t> &tokens, int32_t start_token,
                                         int32_t end_token);

}  // namespace narrateforge
