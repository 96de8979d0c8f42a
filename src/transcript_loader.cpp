//
//  transcript_loader.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "transcript_loader.hpp"

#include <cerrno>
#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>
#include <utility>

#include "logging.hpp"
#include "text_utils.hpp"

using json = nlohmann::json;
using slidesync::Diagnostics;
using slidesync::ErrorKind;

Transcript make_transcript(std::vector<SpeechSegment> segments, double duration,
                           Diagnostics &diagnostics) {
    Transcript out;
    out.segments.reserve(segments.size());
    for (size_t i = 0; i < segments.size(); ++i) {
        auto &seg = segments[i];
        if (!std::isfinite(seg.start) || !std::isfinite(seg.end) || seg.start < 0.0) {
            slidesync::record(diagnostics, ErrorKind::Validation,
                              "speech segment has an invalid time", i);
            continue;
        }
        if (seg.end <= seg.start) {
            slidesync::record(diagnostics, ErrorKind::Validation,
                              "speech segment ends at " + slidesync::format_seconds(seg.end) +
                                  " before it starts at " + slidesync::format_seconds(seg.start),
                              i);
            continue;
        }
        if (!out.segments.empty() && seg.start < out.segments.back().end) {
            slidesync::record(diagnostics, ErrorKind::Validation,
                              "speech segment at " + slidesync::format_seconds(seg.start) +
                                  " overlaps the previous one",
                              i);
            continue;
        }
        seg.text = trim_copy(seg.text);
        out.segments.push_back(std::move(seg));
    }

    out.duration = std::isfinite(duration) && duration > 0.0 ? duration : 0.0;
    if (!out.segments.empty() && out.duration < out.segments.back().end) {
        if (out.duration > 0.0) {
            SS_LOG("warn", "transcript duration " << out.duration
                                                  << "s is shorter than the last segment end "
                                                  << out.segments.back().end << "s; extending");
        }
        out.duration = out.segments.back().end;
    }
    SS_LOG("debug", "transcript: segments=" << out.segments.size() << " duration="
                                            << out.duration);
    return out;
}

std::optional<Transcript> parse_transcript_json(const std::string &text,
                                                Diagnostics &diagnostics) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error &e) {
        SS_LOG("error", "transcript is not valid JSON: " << e.what());
        return std::nullopt;
    }
    if (!j.is_object() || !j.contains("segments") || !j["segments"].is_array()) {
        SS_LOG("error", "transcript has no \"segments\" array");
        return std::nullopt;
    }

    std::vector<SpeechSegment> segments;
    segments.reserve(j["segments"].size());
    size_t i = 0;
    for (const auto &s : j["segments"]) {
        const size_t item = i++;
        if (!s.is_object() || !s.contains("start") || !s.contains("end") ||
            !s["start"].is_number() || !s["end"].is_number()) {
            slidesync::record(diagnostics, ErrorKind::Validation,
                              "speech segment lacks numeric start/end", item);
            continue;
        }
        SpeechSegment seg{};
        seg.start = s["start"].get<double>();
        seg.end = s["end"].get<double>();
        if (s.contains("text") && s["text"].is_string()) {
            seg.text = s["text"].get<std::string>();
        }
        segments.push_back(std::move(seg));
    }

    double duration = 0.0;
    if (j.contains("duration") && j["duration"].is_number()) {
        duration = j["duration"].get<double>();
    }
    return make_transcript(std::move(segments), duration, diagnostics);
}

std::optional<Transcript> load_transcript(const std::string &path, Diagnostics &diagnostics) {
    std::ifstream f(path);
    if (!f.is_open()) {
        SS_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return std::nullopt;
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    return parse_transcript_json(buf.str(), diagnostics);
}
