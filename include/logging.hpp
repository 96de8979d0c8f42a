//
//  logging.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace slidesync {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI/config level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Short, single-line preview of free text (transcripts, slide text) for debug logs.
inline constexpr size_t kTextPreviewChars = 80;
inline std::string text_preview(const std::string &text, size_t max_len = kTextPreviewChars) {
    std::string out;
    out.reserve(std::min(max_len, text.size()) + 3);
    for (char c : text) {
        if (out.size() >= max_len) {
            // Do not cut a UTF-8 sequence in half.
            while (!out.empty() && (static_cast<unsigned char>(out.back()) & 0xC0) == 0x80) {
                out.pop_back();
            }
            if (!out.empty() && (static_cast<unsigned char>(out.back()) & 0x80) != 0) {
                out.pop_back();
            }
            out += "...";
            return out;
        }
        out.push_back(c == '\n' || c == '\r' ? ' ' : c);
    }
    return out;
}

// Seconds formatted with one decimal, as used in progress and placeholder text.
inline std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << seconds << "s";
    return oss.str();
}

}  // namespace slidesync

inline constexpr slidesync::LogVerbosity ss_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return slidesync::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return slidesync::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return slidesync::LogVerbosity::Info;
    }
    // Everything else (align/corpus/report/etc.) treated as debug-level.
    return slidesync::LogVerbosity::Debug;
}

inline bool ss_should_log(const char *level) {
    const auto current = slidesync::get_log_verbosity();
    const auto sev = ss_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void ss_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[SlideSync][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[SlideSync][" << level << "] " << msg << std::endl;
    }
}

#define SS_LOG(level, message)                                              \
    do {                                                                    \
        if (ss_should_log(level)) {                                         \
            std::ostringstream _ss_log_ss;                                  \
            _ss_log_ss << message;                                          \
            ss_log_impl(level, _ss_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
