//
//  logging.hpp
//  NarrateForge
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace narrateforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a level name ("error", "warn", "info", "debug"); unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Serialises log lines emitted from synthesis workers.
std::mutex &log_mutex();

// Text-preview helper used in progress and debug logs to show the head of a chunk.
inline constexpr size_t kTextPreviewChars = 48;
inline std::string text_preview(std::string_view text, size_t max_len = kTextPreviewChars) {
    std::string out;
    out.reserve(std::min(max_len, text.size()) + 3);
    for (char c : text) {
        if (out.size() >= max_len) {
            out += "...";
            break;
        }
        out.push_back((c == '\n' || c == '\r' || c == '\t') ? ' ' : c);
    }
    return out;
}

}  // namespace narrateforge

inline constexpr narrateforge::LogVerbosity nf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return narrateforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return narrateforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return narrateforge::LogVerbosity::Info;
    }
    // Everything else (chunker/codec/engine/etc.) treated as debug-level.
    return narrateforge::LogVerbosity::Debug;
}

inline bool nf_should_log(const char *level) {
    const auto current = narrateforge::get_log_verbosity();
    const auto sev = nf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void nf_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    std::lock_guard<std::mutex> lock(narrateforge::log_mutex());
    if (lvl == "error") {
        std::cerr << "[NarrateForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[NarrateForge][" << level << "] " << msg << std::endl;
    }
}

#define NF_LOG(level, message)                                              \
    do {                                                                    \
        if (nf_should_log(level)) {                                         \
            std::ostringstream _nf_log_ss;                                  \
            _nf_log_ss << message;                                          \
            nf_log_impl(level, _nf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
