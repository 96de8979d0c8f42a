//
//  content_aligner.hpp
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

#include "match_candidate.hpp"
#include "reasoning_service.hpp"
#include "slide_descriptor.hpp"
#include "speech_segment.hpp"

inline constexpr double kGuidedConfidence = 0.9;
inline constexpr double kFallbackConfidence = 0.6;
inline constexpr const char *kFallbackReason = "assigned by proportional position in the audio";
inline constexpr const char *kDefaultGuidedReason = "presented in slide order";

enum class AlignmentStrategy { Guided, Fallback };

const char *to_string(AlignmentStrategy strategy);

/// One slide timing as proposed by the reasoning service, before clamping.
struct GuidedTiming {
    int64_t slide_index = 0;
    double start_time = 0.0;
    double end_time = 0.0;
    std::string reason;
};

// System + user prompt: the presentation rules, then the condensed slides
// ({index, name, content} with content cut to slide_text_chars) and segments ({start, end, text}).
slidesync::ReasoningRequest build_guided_request(const Transcript &transcript,
                                                 const SlideCorpus &corpus,
                                                 size_t slide_text_chars);

// The JSON text inside the first ```json (or bare ```) fence, else the trimmed response.
std::string extract_json_payload(const std::string &response);

// Parse {"slide_timings": [...]}; `end` is accepted when `end_time` is absent.
// Throws MalformedResponseError on any structural problem.
std::vector<GuidedTiming> parse_guided_response(const std::string &response);

// Clamp end times to the transcript duration and gather the speech inside each range.
std::vector<MatchCandidate> candidates_from_timings(const std::vector<GuidedTiming> &timings,
                                                    const Transcript &transcript);

// Ask the service for timings. Never falls back; MalformedResponseError propagates.
std::vector<MatchCandidate> align_guided(const Transcript &transcript, const SlideCorpus &corpus,
                                         slidesync::ReasoningService &service,
                                         size_t slide_text_chars);

// Pure proportional assignment: slide = min(floor(start / duration * N), N - 1) per segment.
std::vector<MatchCandidate> align_fallback(const Transcript &transcript,
                                           const SlideCorpus &corpus);

// Guided when a service is given, fallback otherwise. Empty transcript or corpus yields no
// candidates without contacting the service.
std::vector<MatchCandidate> align_content(const Transcript &transcript, const SlideCorpus &corpus,
                                          slidesync::ReasoningService *service,
                                          size_t slide_text_chars);
