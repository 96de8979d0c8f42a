//
//  segment_merger.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include "timeline_entry.hpp"

inline constexpr double kDefaultMergeGapSeconds = 1.0;

// Coalesce neighbouring entries showing the same slide when the gap between them is below
// max_gap_seconds. The merged entry keeps the first entry's confidence; speech text is joined
// with a single space. Applying it twice gives the same result as applying it once.
Timeline merge_consecutive_slides(const Timeline &timeline,
                                  double max_gap_seconds = kDefaultMergeGapSeconds);
