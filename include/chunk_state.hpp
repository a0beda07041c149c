//
//  chunk_state.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>

namespace narrateforge {

// Per-chunk lifecycle: Queued -> Attempting(n) -> {Delivered | Exhausted}.
enum class ChunkPhase { Queued, Attempting, Delivered, Exhausted };

const char *to_string(ChunkPhase phase);

/**
 * @brief Retry bookkeeping for one chunk.
 *
 * `begin_attempt()` moves Queued (or Attempting with a retry pending) to Attempting(n+1).
 * `finish_attempt(passed)` moves to Delivered on success, to Exhausted when the last allowed
 * attempt failed, and otherwise leaves the chunk in Attempting with a retry pending.
 */
class ChunkStateMachine {
public:
    explicit ChunkStateMachine(uint32_t max_attempts);

    ChunkPhase phase() const { return phase_; }
    uint32_t attempt() const { return attempt_; }
    uint32_t max_attempts() const { return max_attempts_; }
    bool retry_pending() const { return phase_ == ChunkPhase::Attempting && !in_attempt_; }
    bool terminal() const {
        return phase_ == ChunkPhase::Delivered || phase_ == ChunkPhase::Exhausted;
    }

    // Returns false when no further attempt may start.
    bool begin_attempt();
    // Throws std::logic_error when no attempt is running.
    ChunkPhase finish_attempt(bool passed);

private:
    uint32_t max_attempts_;
    uint32_t attempt_ = 0;
    ChunkPhase phase_ = ChunkPhase::Queued;
    bool in_attempt_ = false;
};

}  // namespace narrateforge
