//
//  chunk_state.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "chunk_state.hpp"

#include <algorithm>
#include <stdexcept>

namespace narrateforge {

const char *to_string(ChunkPhase phase) {
    switch (phase) {
    case ChunkPhase::Queued:
        return "queued";
    case ChunkPhase::Attempting:
        return "attempting";
    case ChunkPhase::Delivered:
        return "delivered";
    case ChunkPhase::Exhausted:
        return "exhausted";
    }
    return "unknown";
}

ChunkStateMachine::ChunkStateMachine(uint32_t max_attempts)
    : max_attempts_(std::max<uint32_t>(1, max_attempts)) {}

bool ChunkStateMachine::begin_attempt() {
    if (terminal() || in_attempt_ || attempt_ >= max_attempts_) {
        return false;
    }
    ++attempt_;
    in_attempt_ = true;
    phase_ = ChunkPhase::Attempting;
    return true;
}

ChunkPhase ChunkStateMachine::finish_attempt(bool passed) {
    if (!in_attempt_) {
        throw std::logic_error("finish_attempt without a running attempt");
    }
    in_attempt_ = false;
    if (passed) {
        phase_ = ChunkPhase::Delivered;
    } else if (attempt_ >= max_attempts_) {
        phase_ = ChunkPhase::Exhausted;
    }
    return phase_;
}

}  // namespace narrateforge
