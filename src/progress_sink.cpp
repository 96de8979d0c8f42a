//
//  progress_sink.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "progress_sink.hpp"

#include "logging.hpp"

namespace slidesync {

const char *to_string(Stage stage) {
    switch (stage) {
    case Stage::Ingest:
        return "ingest";
    case Stage::Corpus:
        return "corpus";
    case Stage::Align:
        return "align";
    case Stage::Validate:
        return "validate";
    case Stage::Merge:
        return "merge";
    case Stage::Emit:
        return "emit";
    }
    return "unknown";
}

void LogProgressSink::on_progress(const ProgressEvent &event) {
    if (event.total > 0) {
        SS_LOG("info", to_string(event.stage) << " " << event.current << "/" << event.total
                                              << ": " << event.message);
    } else {
        SS_LOG("info", to_string(event.stage) << ": " << event.message);
    }
}

}  // namespace slidesync
