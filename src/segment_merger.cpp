//
//  segment_merger.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "segment_merger.hpp"

#include <cmath>
#include <utility>

#include "logging.hpp"

Timeline merge_consecutive_slides(const Timeline &timeline, double max_gap_seconds) {
    Timeline merged;
    if (timeline.empty()) {
        return merged;
    }

    TimelineEntry current = timeline.front();
    for (size_t i = 1; i < timeline.size(); ++i) {
        const auto &next = timeline[i];
        if (next.slide_index == current.slide_index &&
            std::fabs(current.end_time - next.start_time) < max_gap_seconds) {
            current.end_time = next.end_time;
            current.duration = current.end_time - current.start_time;
            current.speech_text += ' ';
            current.speech_text += next.speech_text;
        } else {
            merged.push_back(std::move(current));
            current = next;
        }
    }
    merged.push_back(std::move(current));

    SS_LOG("debug", "merge: " << timeline.size() << " entries -> " << merged.size());
    return merged;
}
