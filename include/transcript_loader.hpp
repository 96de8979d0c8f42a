//
//  transcript_loader.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "speech_segment.hpp"
#include "sync_errors.hpp"

// Build a validated transcript from raw segments. Segments with an empty/inverted range, a
// negative or non-finite time, or a start before the previous segment's end are dropped with a
// Validation diagnostic. Text is trimmed. The duration is raised to the last kept segment's end
// when it falls short.
Transcript make_transcript(std::vector<SpeechSegment> segments, double duration,
                           slidesync::Diagnostics &diagnostics);

// Parse a Whisper-style transcript document:
//   {"duration": 93.5, "segments": [{"start": 0.0, "end": 4.2, "text": "..."}, ...]}
// `duration` is optional. Returns nullopt when the text is not JSON or has no segment array.
std::optional<Transcript> parse_transcript_json(const std::string &text,
                                                slidesync::Diagnostics &diagnostics);

// File variant of parse_transcript_json().
std::optional<Transcript> load_transcript(const std::string &path,
                                          slidesync::Diagnostics &diagnostics);
