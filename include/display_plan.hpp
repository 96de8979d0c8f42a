//
//  display_plan.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "timeline_entry.hpp"

inline constexpr double kDefaultMinDisplaySeconds = 1.0;

/// One image clip as handed to the video compositor.
struct DisplayClip {
    size_t slide_index = 0;
    std::string slide_path;
    double start_time = 0.0;
    double display_duration = 0.0;  ///< Entry duration, raised to the minimum display time
    uint32_t start_ms = 0;          ///< start_time in whole milliseconds
};

// Freeze the merged timeline into clips. This is the only place the minimum display time is
// applied.
std::vector<DisplayClip> make_display_plan(const Timeline &timeline,
                                           double min_display_seconds = kDefaultMinDisplaySeconds);

// JSON array of {slide_index, slide_path, start_time, display_duration}.
bool write_display_plan(const std::string &path, const std::vector<DisplayClip> &clips);

// ffmpeg concat demuxer script playing the slides back to back over total_seconds of audio.
bool write_ffconcat(const std::string &path, const std::vector<DisplayClip> &clips,
                    double total_seconds, double min_display_seconds = kDefaultMinDisplaySeconds);
