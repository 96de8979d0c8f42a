//
//  match_candidate.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

/// @ingroup api
/// Raw aligner output: one proposed slide for one time range.
struct MatchCandidate {
    int64_t slide_index = 0;   ///< Unvalidated; may point outside the corpus
    double start_time = 0.0;   ///< Seconds
    double end_time = 0.0;     ///< Seconds, clamped to the transcript duration
    double confidence = 0.0;   ///< 0.9 guided, 0.6 fallback
    std::string reason;        ///< Free text explaining the choice
    std::string segment_text;  ///< Speech text inside the range

    bool operator==(const MatchCandidate &) const = default;
};
