//
//  timeline_entry.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

/// @ingroup api
/// A validated slide-display interval.
struct TimelineEntry {
    double start_time = 0.0;
    double end_time = 0.0;
    double duration = 0.0;  ///< end_time - start_time
    size_t slide_index = 0;
    std::string slide_name;
    std::string slide_path;
    std::string speech_text;
    double confidence = 0.0;

    bool operator==(const TimelineEntry &) const = default;
};

using Timeline = std::vector<TimelineEntry>;
