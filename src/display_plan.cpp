//
//  display_plan.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "display_plan.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <utility>

#include "logging.hpp"
#include "slide_timing.hpp"

using json = nlohmann::json;

namespace {

uint32_t to_ms(double seconds) {
    if (!(seconds > 0.0)) {
        return 0;
    }
    return static_cast<uint32_t>(std::llround(std::min(seconds * 1000.0, 4294967295.0)));
}

// ffconcat quoting: single quotes, with embedded quotes closed/escaped/reopened.
std::string concat_quote(const std::string &path) {
    std::string out = "'";
    for (char c : path) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

}  // namespace

std::vector<DisplayClip> make_display_plan(const Timeline &timeline, double min_display_seconds) {
    std::vector<DisplayClip> clips;
    clips.reserve(timeline.size());
    for (const auto &e : timeline) {
        DisplayClip c{};
        c.slide_index = e.slide_index;
        c.slide_path = e.slide_path;
        c.start_time = e.start_time;
        c.display_duration = std::max(e.duration, min_display_seconds);
        c.start_ms = to_ms(e.start_time);
        if (c.display_duration != e.duration) {
            SS_LOG("debug", "clip " << clips.size() << " (" << e.slide_name << ") raised from "
                                    << e.duration << "s to " << c.display_duration << "s");
        }
        clips.push_back(std::move(c));
    }
    return clips;
}

bool write_display_plan(const std::string &path, const std::vector<DisplayClip> &clips) {
    json j = json::array();
    for (const auto &c : clips) {
        j.push_back({{"slide_index", c.slide_index},
                     {"slide_path", c.slide_path},
                     {"start_time", c.start_time},
                     {"display_duration", c.display_duration}});
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        SS_LOG("error", "cannot write display plan " << path);
        return false;
    }
    out << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    return out.good();
}

bool write_ffconcat(const std::string &path, const std::vector<DisplayClip> &clips,
                    double total_seconds, double min_display_seconds) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        SS_LOG("error", "cannot write concat script " << path);
        return false;
    }
    out << "ffconcat version 1.0\n";
    if (!clips.empty()) {
        auto durations = derive_durations_ms_from_starts(clips, to_ms(total_seconds));
        // The concat demuxer starts at 0; the first slide also covers any lead-in.
        durations.front() += clips.front().start_ms;
        const uint32_t min_ms = to_ms(min_display_seconds);
        out << std::fixed << std::setprecision(3);
        for (size_t i = 0; i < clips.size(); ++i) {
            const uint32_t ms = std::max(durations[i], min_ms);
            out << "file " << concat_quote(clips[i].slide_path) << "\n"
                << "duration " << (static_cast<double>(ms) / 1000.0) << "\n";
        }
        // The demuxer ignores the last duration unless the final file is listed again.
        out << "file " << concat_quote(clips.back().slide_path) << "\n";
    }
    return out.good();
}
