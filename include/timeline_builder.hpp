//
//  timeline_builder.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <vector>

#include "match_candidate.hpp"
#include "slide_descriptor.hpp"
#include "sync_errors.hpp"
#include "timeline_entry.hpp"

// Turn candidates into timeline entries 1:1, in order. A candidate is dropped with a Validation
// diagnostic when its slide index is outside the corpus, its range is empty, inverted or starts
// before 0, or it starts before the previously accepted entry.
Timeline build_timeline(const std::vector<MatchCandidate> &candidates, const SlideCorpus &corpus,
                        slidesync::Diagnostics &diagnostics);
