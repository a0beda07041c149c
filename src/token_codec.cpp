//
//  token_codec.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "token_codec.hpp"

#include <algorithm>
#include <stdexcept>

#include "logging.hpp"

namespace narrateforge {

namespace {

// Frame slot -> (level, offset within the frame's share of that level).
struct SlotTarget {
    uint8_t level;
    uint8_t offset;
};

constexpr SlotTarget kSlotMap[kTokensPerFrame] = {
    {1, 0}, {2, 0}, {3, 0}, {3, 1}, {2, 1}, {3, 2}, {3, 3},
};

bool in_alphabet(const std::vector<int32_t> &level, int32_t alphabet_size) {
    return std::all_of(level.begin(), level.end(),
                       [&](int32_t v) { return v >= 0 && v < alphabet_size; });
}

}  // namespace

bool HierarchicalCode::is_consistent(int32_t alphabet_size) const {
    if (l2.size() != 2 * l1.size() || l3.size() != 4 * l1.size()) {
        return false;
    }
    return in_alphabet(l1, alphabet_size) && in_alphabet(l2, alphabet_size) &&
           in_alphabet(l3, alphabet_size);
}

UnpackResult unpack_frames(const std::vector<int32_t> &tokens, int32_t base,
                           int32_t alphabet_size) {
    if (alphabet_size <= 0) {
        throw std::invalid_argument("alphabet_size must be positive");
    }
    UnpackResult result;
    const int64_t lo = base;
    const int64_t hi = static_cast<int64_t>(base) + 7LL * alphabet_size;  // exclusive

    std::vector<int32_t> valid;
    valid.reserve(tokens.size());
    for (int32_t t : tokens) {
        if (t < lo || t >= hi) {
            ++result.anomalies;
            continue;
        }
        valid.push_back(static_cast<int32_t>((static_cast<int64_t>(t) - lo) % alphabet_size));
    }

    const size_t frames = valid.size() / kTokensPerFrame;
    result.discarded_tokens = valid.size() % kTokensPerFrame;

    auto &code = result.code;
    code.l1.resize(frames);
    code.l2.resize(frames * 2);
    code.l3.resize(frames * 4);
    for (size_t i = 0; i < frames; ++i) {
        const int32_t *frame = valid.data() + i * kTokensPerFrame;
        for (size_t slot = 0; slot < kTokensPerFrame; ++slot) {
            const SlotTarget target = kSlotMap[slot];
            switch (target.level) {
            case 1:
                code.l1[i] = frame[slot];
                break;
            case 2:
                code.l2[2 * i + target.offset] = frame[slot];
                break;
            default:
                code.l3[4 * i + target.offset] = frame[slot];
                break;
            }
        }
    }

    if (result.anomalies > 0 || result.discarded_tokens > 0) {
        NF_LOG("debug", "codec: " << tokens.size() << " tokens -> " << frames << " frames, anomalies="
                                  << result.anomalies << " discarded=" << result.discarded_tokens);
    }
    return result;
}

std::vector<int32_t> extract_code_stream(const std::vector<int32_t> &tokens, int32_t start_token,
                                         int32_t end_token) {
    auto first = tokens.begin();
    auto start_it = std::find(tokens.begin(), tokens.end(), start_token);
    if (start_it != tokens.end()) {
        first = start_it + 1;
    }
    auto last = std::find(first, tokens.end(), end_token);
    return std::vector<int32_t>(first, last);
}

}  // namespace narrateforge
