//
//  matching_report.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "matching_report.hpp"

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "logging.hpp"
#include "timestamp_utils.hpp"

using json = nlohmann::json;

namespace {

json match_to_json(const MatchCandidate &m) {
    return {{"slide_index", m.slide_index}, {"start_time", m.start_time},
            {"end_time", m.end_time},       {"confidence", m.confidence},
            {"reason", m.reason},           {"segment_text", m.segment_text}};
}

json entry_to_json(const TimelineEntry &e) {
    return {{"start_time", e.start_time},   {"end_time", e.end_time},
            {"duration", e.duration},       {"slide_index", e.slide_index},
            {"slide_name", e.slide_name},   {"slide_path", e.slide_path},
            {"speech_text", e.speech_text}, {"confidence", e.confidence}};
}

}  // namespace

json report_to_json(const MatchingReport &report) {
    json j;
    j["generation_time"] = report.generation_time;
    j["total_matches"] = report.matches.size();
    j["total_timeline_segments"] = report.timeline.size();
    json matches = json::array();
    for (const auto &m : report.matches) {
        matches.push_back(match_to_json(m));
    }
    j["matches"] = matches;
    json timeline = json::array();
    for (const auto &e : report.timeline) {
        timeline.push_back(entry_to_json(e));
    }
    j["timeline"] = timeline;
    return j;
}

std::optional<MatchingReport> report_from_json(const json &j) {
    MatchingReport report;
    try {
        report.generation_time = j.at("generation_time").get<std::string>();
        for (const auto &m : j.at("matches")) {
            MatchCandidate c{};
            c.slide_index = m.at("slide_index").get<int64_t>();
            c.start_time = m.at("start_time").get<double>();
            c.end_time = m.at("end_time").get<double>();
            c.confidence = m.at("confidence").get<double>();
            c.reason = m.at("reason").get<std::string>();
            c.segment_text = m.at("segment_text").get<std::string>();
            report.matches.push_back(std::move(c));
        }
        for (const auto &t : j.at("timeline")) {
            TimelineEntry e{};
            e.start_time = t.at("start_time").get<double>();
            e.end_time = t.at("end_time").get<double>();
            e.duration = t.at("duration").get<double>();
            e.slide_index = t.at("slide_index").get<size_t>();
            e.slide_name = t.at("slide_name").get<std::string>();
            e.slide_path = t.value("slide_path", "");
            e.speech_text = t.at("speech_text").get<std::string>();
            e.confidence = t.at("confidence").get<double>();
            report.timeline.push_back(std::move(e));
        }
    } catch (const json::exception &e) {
        SS_LOG("error", "malformed matching report: " << e.what());
        return std::nullopt;
    }
    if (j.value("total_matches", report.matches.size()) != report.matches.size() ||
        j.value("total_timeline_segments", report.timeline.size()) != report.timeline.size()) {
        SS_LOG("warn", "matching report totals disagree with its lists");
    }
    return report;
}

std::optional<std::string> write_matching_report(const std::string &dir,
                                                 const std::vector<MatchCandidate> &matches,
                                                 const Timeline &timeline) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        SS_LOG("error", "cannot create report directory " << dir << ": " << ec.message());
        return std::nullopt;
    }
    const auto now = std::chrono::system_clock::now();
    const std::string stem = "matching_report_" + file_timestamp(now);
    std::filesystem::path path = std::filesystem::path(dir) / (stem + ".json");
    // Two runs inside the same second must not overwrite each other.
    for (int n = 2; std::filesystem::exists(path, ec); ++n) {
        path = std::filesystem::path(dir) / (stem + "_" + std::to_string(n) + ".json");
    }

    MatchingReport report{iso_timestamp(now), matches, timeline};
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        SS_LOG("error", "open failed for " << path.string() << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return std::nullopt;
    }
    out << report_to_json(report).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        SS_LOG("error", "short write on " << path.string());
        return std::nullopt;
    }
    SS_LOG("debug", "report written: " << path.string() << " matches=" << matches.size()
                                       << " timeline=" << timeline.size());
    return path.string();
}

std::optional<MatchingReport> read_matching_report(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        SS_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return std::nullopt;
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception &e) {
        SS_LOG("error", "report parse error in " << path << ": " << e.what());
        return std::nullopt;
    }
    return report_from_json(j);
}
