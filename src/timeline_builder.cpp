//
//  timeline_builder.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "timeline_builder.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "logging.hpp"

using slidesync::ErrorKind;

Timeline build_timeline(const std::vector<MatchCandidate> &candidates, const SlideCorpus &corpus,
                        slidesync::Diagnostics &diagnostics) {
    Timeline timeline;
    timeline.reserve(candidates.size());
    const auto slide_count = static_cast<int64_t>(corpus.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto &m = candidates[i];
        if (m.slide_index < 0 || m.slide_index >= slide_count) {
            slidesync::record(diagnostics, ErrorKind::Validation,
                              "slide index " + std::to_string(m.slide_index) +
                                  " outside corpus of " + std::to_string(slide_count),
                              i);
            continue;
        }
        if (!std::isfinite(m.start_time) || !std::isfinite(m.end_time) || m.start_time < 0.0) {
            slidesync::record(diagnostics, ErrorKind::Validation,
                              "invalid start time " + std::to_string(m.start_time), i);
            continue;
        }
        if (m.end_time <= m.start_time) {
            slidesync::record(diagnostics, ErrorKind::Validation,
                              "empty range " + slidesync::format_seconds(m.start_time) + " - " +
                                  slidesync::format_seconds(m.end_time) + " after clamping",
                              i);
            continue;
        }
        if (!timeline.empty() && m.start_time < timeline.back().start_time) {
            slidesync::record(diagnostics, ErrorKind::Validation,
                              "range starting at " + slidesync::format_seconds(m.start_time) +
                                  " is out of order",
                              i);
            continue;
        }

        const auto &slide = corpus[static_cast<size_t>(m.slide_index)];
        TimelineEntry e{};
        e.start_time = m.start_time;
        e.end_time = m.end_time;
        e.duration = m.end_time - m.start_time;
        e.slide_index = slide.index;
        e.slide_name = slide.name;
        e.slide_path = slide.path;
        e.speech_text = m.segment_text;
        e.confidence = m.confidence;
        timeline.push_back(std::move(e));
    }
    SS_LOG("debug", "timeline: candidates=" << candidates.size() << " entries="
                                            << timeline.size());
    return timeline;
}
