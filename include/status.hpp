//
//  status.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace narrateforge {

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is usually empty. On failure, `message` contains a short
 * description of what went wrong (e.g., a collaborator failed to load or a config was invalid).
 */
struct Status {
    bool ok{false};
    std::string message;
};

inline Status make_status(bool ok, std::string msg = {}) { return Status{ok, std::move(msg)}; }

}  // namespace narrateforge
