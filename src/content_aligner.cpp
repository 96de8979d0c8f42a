//
//  content_aligner.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "content_aligner.hpp"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>
#include <utility>

#include "logging.hpp"
#include "text_utils.hpp"

using json = nlohmann::json;
using slidesync::MalformedResponseError;

namespace {

constexpr const char *kSystemPrompt =
    R"(You help produce narrated lecture videos.
The slides were designed to be shown in order, each one covering a passage of the narration.
Analyse the speech and the slide content and decide when each slide should be on screen.

## Switching rules
- Slides are shown strictly in order (0, 1, 2, ...). Never skip a slide and never repeat one.
- Switch only when the speech clearly starts on the topic of the next slide.
- Keep the current slide while the speech continues its topic.
- Look for explicit section titles, numbering and topic changes.
- The last slide stays until the end of the audio.
- Give every slide enough time on screen; avoid very short intervals.

## Output format
Answer with JSON holding the time range of every slide:
{
  "slide_timings": [
    {
      "slide_index": 1,
      "start_time": 60.0,
      "end_time": 120.0,
      "reason": "the speech introduces the concept shown on slide 1"
    }
  ]
})";

// Field lookup shared by the required numeric keys.
double required_number(const json &timing, const char *key, size_t item) {
    if (!timing.contains(key)) {
        throw MalformedResponseError("slide_timings[" + std::to_string(item) + "] lacks \"" +
                                     key + "\"");
    }
    const auto &v = timing[key];
    if (!v.is_number()) {
        throw MalformedResponseError("slide_timings[" + std::to_string(item) + "]." + key +
                                     " is not a number");
    }
    return v.get<double>();
}

}  // namespace

const char *to_string(AlignmentStrategy strategy) {
    return strategy == AlignmentStrategy::Guided ? "guided" : "fallback";
}

slidesync::ReasoningRequest build_guided_request(const Transcript &transcript,
                                                 const SlideCorpus &corpus,
                                                 size_t slide_text_chars) {
    json slides = json::array();
    for (const auto &s : corpus) {
        slides.push_back({{"index", s.index},
                          {"name", s.name},
                          {"content", truncate_utf8(s.extracted_text, slide_text_chars)}});
    }
    json segments = json::array();
    for (const auto &seg : transcript.segments) {
        segments.push_back({{"start", seg.start}, {"end", seg.end}, {"text", seg.text}});
    }

    slidesync::ReasoningRequest req;
    req.system_prompt = kSystemPrompt;
    // Slide and speech text stays unescaped UTF-8; broken sequences become U+FFFD.
    constexpr auto kReplace = json::error_handler_t::replace;
    req.user_prompt = "Slide content:\n" + slides.dump(2, ' ', false, kReplace) +
                      "\n\nSpeech content:\n" + segments.dump(2, ' ', false, kReplace) + "\n";
    return req;
}

std::string extract_json_payload(const std::string &response) {
    auto fenced = [&](const std::string &opener) -> std::optional<std::string> {
        const auto open = response.find(opener);
        if (open == std::string::npos) {
            return std::nullopt;
        }
        const auto body = open + opener.size();
        const auto close = response.find("```", body);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        return trim_copy(std::string_view(response).substr(body, close - body));
    };
    if (auto payload = fenced("```json")) {
        return *payload;
    }
    if (auto payload = fenced("```")) {
        return *payload;
    }
    return trim_copy(response);
}

std::vector<GuidedTiming> parse_guided_response(const std::string &response) {
    const std::string payload = extract_json_payload(response);
    SS_LOG("debug", "guided payload: " << slidesync::text_preview(payload, 400));
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error &e) {
        throw MalformedResponseError(std::string("reasoning response is not JSON: ") + e.what());
    }
    if (!j.is_object() || !j.contains("slide_timings")) {
        throw MalformedResponseError("reasoning response lacks \"slide_timings\"");
    }
    const auto &list = j["slide_timings"];
    if (!list.is_array()) {
        throw MalformedResponseError("\"slide_timings\" is not an array");
    }

    std::vector<GuidedTiming> timings;
    timings.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        const auto &t = list[i];
        if (!t.is_object()) {
            throw MalformedResponseError("slide_timings[" + std::to_string(i) +
                                         "] is not an object");
        }
        GuidedTiming g{};
        const double index = required_number(t, "slide_index", i);
        if (std::floor(index) != index || std::fabs(index) > 9.0e15) {
            throw MalformedResponseError("slide_timings[" + std::to_string(i) +
                                         "].slide_index is not an integer");
        }
        g.slide_index = static_cast<int64_t>(index);
        g.start_time = required_number(t, "start_time", i);
        // Some responses name the boundary `end`; that one alias is accepted.
        g.end_time = t.contains("end_time") ? required_number(t, "end_time", i)
                                            : required_number(t, "end", i);
        g.reason = (t.contains("reason") && t["reason"].is_string())
                       ? t["reason"].get<std::string>()
                       : std::string(kDefaultGuidedReason);
        timings.push_back(std::move(g));
    }
    return timings;
}

std::vector<MatchCandidate> candidates_from_timings(const std::vector<GuidedTiming> &timings,
                                                    const Transcript &transcript) {
    std::vector<MatchCandidate> out;
    out.reserve(timings.size());
    for (const auto &t : timings) {
        MatchCandidate m{};
        m.slide_index = t.slide_index;
        m.start_time = t.start_time;
        m.end_time = std::min(t.end_time, transcript.duration);
        m.confidence = kGuidedConfidence;
        m.reason = t.reason;

        std::vector<std::string> texts;
        for (const auto &seg : transcript.segments) {
            if (seg.start >= m.start_time && seg.end <= m.end_time) {
                texts.push_back(seg.text);
            }
        }
        m.segment_text = texts.empty() ? "time range " + slidesync::format_seconds(m.start_time) +
                                             " - " + slidesync::format_seconds(m.end_time)
                                       : join_with_space(texts);
        out.push_back(std::move(m));
    }
    return out;
}

std::vector<MatchCandidate> align_guided(const Transcript &transcript, const SlideCorpus &corpus,
                                         slidesync::ReasoningService &service,
                                         size_t slide_text_chars) {
    const auto request = build_guided_request(transcript, corpus, slide_text_chars);
    const std::string response = service.complete(request);
    SS_LOG("debug", "reasoning response (" << response.size() << " bytes): "
                                           << slidesync::text_preview(response, 400));
    auto candidates = candidates_from_timings(parse_guided_response(response), transcript);
    SS_LOG("debug", "guided alignment: " << candidates.size() << " slide timings");
    return candidates;
}

std::vector<MatchCandidate> align_fallback(const Transcript &transcript,
                                           const SlideCorpus &corpus) {
    std::vector<MatchCandidate> out;
    if (transcript.segments.empty() || corpus.empty() || transcript.duration <= 0.0) {
        return out;
    }
    const auto slide_count = static_cast<int64_t>(corpus.size());
    out.reserve(transcript.segments.size());
    for (const auto &seg : transcript.segments) {
        const double progress = seg.start / transcript.duration;
        const auto index =
            static_cast<int64_t>(std::floor(progress * static_cast<double>(slide_count)));
        MatchCandidate m{};
        m.slide_index = std::min(index, slide_count - 1);
        m.start_time = seg.start;
        m.end_time = seg.end;
        m.confidence = kFallbackConfidence;
        m.reason = kFallbackReason;
        m.segment_text = seg.text;
        out.push_back(std::move(m));
    }
    return out;
}

std::vector<MatchCandidate> align_content(const Transcript &transcript, const SlideCorpus &corpus,
                                          slidesync::ReasoningService *service,
                                          size_t slide_text_chars) {
    if (transcript.segments.empty() || corpus.empty()) {
        SS_LOG("debug", "nothing to align: segments=" << transcript.segments.size()
                                                      << " slides=" << corpus.size());
        return {};
    }
    if (service) {
        return align_guided(transcript, corpus, *service, slide_text_chars);
    }
    return align_fallback(transcript, corpus);
}
