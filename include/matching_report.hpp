//
//  matching_report.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "match_candidate.hpp"
#include "timeline_entry.hpp"

/// Audit record of one run: every raw candidate plus the merged timeline.
struct MatchingReport {
    std::string generation_time;  ///< ISO-8601 local time
    std::vector<MatchCandidate> matches;
    Timeline timeline;
};

nlohmann::json report_to_json(const MatchingReport &report);

// Returns nullopt when a match or timeline element lacks a field or has the wrong type.
std::optional<MatchingReport> report_from_json(const nlohmann::json &j);

// Write matching_report_YYYYMMDD_HHMMSS.json into dir (created when missing). Returns the path.
std::optional<std::string> write_matching_report(const std::string &dir,
                                                 const std::vector<MatchCandidate> &matches,
                                                 const Timeline &timeline);

std::optional<MatchingReport> read_matching_report(const std::string &path);
