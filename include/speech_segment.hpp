//
//  speech_segment.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

/// @ingroup api
/// One time-stamped span of transcribed speech.
struct SpeechSegment {
    double start = 0.0;  ///< Start time in seconds
    double end = 0.0;    ///< End time in seconds (> start)
    std::string text;    ///< UTF-8 text, trimmed
};

/// @ingroup api
/// Ordered, non-overlapping speech segments plus the total audio duration.
/// Built through load_transcript()/make_transcript(), which enforce the ordering invariants.
struct Transcript {
    std::vector<SpeechSegment> segments;
    double duration = 0.0;  ///< Total audio duration in seconds (>= last segment end)
};
