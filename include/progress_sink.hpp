//
//  progress_sink.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace slidesync {

enum class Stage { Ingest, Corpus, Align, Validate, Merge, Emit };

const char *to_string(Stage stage);

/// One progress notification. `total` is 0 when the stage has no unit count.
struct ProgressEvent {
    Stage stage = Stage::Ingest;
    std::string message;
    size_t current = 0;
    size_t total = 0;
};

/// Observer for run progress; keeps narration out of the stage code.
class ProgressSink {
  public:
    virtual ~ProgressSink() = default;
    virtual void on_progress(const ProgressEvent &event) = 0;
};

class NullProgressSink : public ProgressSink {
  public:
    void on_progress(const ProgressEvent &) override {}
};

/// Forwards events to SS_LOG at info level.
class LogProgressSink : public ProgressSink {
  public:
    void on_progress(const ProgressEvent &event) override;
};

// Convenience for stage code that holds an optional sink.
inline void notify(ProgressSink *sink, Stage stage, std::string message, size_t current = 0,
                   size_t total = 0) {
    if (sink) {
        sink->on_progress(ProgressEvent{stage, std::move(message), current, total});
    }
}

}  // namespace slidesync
