//
//  slidesync.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once
#include <memory>
#include <string>
#include <vector>

#include "content_aligner.hpp"
#include "match_candidate.hpp"
#include "progress_sink.hpp"
#include "reasoning_service.hpp"
#include "resource_guard.hpp"
#include "slide_corpus.hpp"
#include "slide_descriptor.hpp"
#include "speech_segment.hpp"
#include "sync_config.hpp"
#include "sync_errors.hpp"
#include "timeline_entry.hpp"

namespace slidesync {

/// @defgroup api SlideSync Public API
/// Public, supported C++ interfaces for timing slides against a narration transcript.
/// @{

/**
 * @brief Return the SlideSync library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/// Output of the Align, Validate and Merge stages.
struct PipelineResult {
    AlignmentStrategy strategy = AlignmentStrategy::Fallback;
    std::vector<MatchCandidate> matches;  ///< Raw aligner output, for the report
    Timeline timeline;                    ///< Validated and merged
    Diagnostics diagnostics;              ///< Recovered per-item problems
};

/**
 * @brief Timing-reconciliation pipeline: Align -> Validate -> Merge.
 *
 * With a reasoning service the run is guided and all-or-nothing: a malformed answer throws
 * MalformedResponseError and nothing is produced. Without one the proportional fallback is used.
 * Runs synchronously on the calling thread.
 */
class Pipeline {
  public:
    Pipeline(SlideSyncConfig config, std::unique_ptr<ReasoningService> service,
             ProgressSink *progress = nullptr);

    PipelineResult run(const Transcript &transcript, const SlideCorpus &corpus);

    AlignmentStrategy strategy() const {
        return service_ ? AlignmentStrategy::Guided : AlignmentStrategy::Fallback;
    }
    const SlideSyncConfig &config() const { return config_; }

  private:
    SlideSyncConfig config_;
    std::unique_ptr<ReasoningService> service_;
    ProgressSink *progress_;
};

/**
 * @brief Result object of a file-driven run.
 *
 * When `ok == false`, `error` names the fatal error kind and `message` describes it; no report
 * is written in that case. Recovered problems are listed in `diagnostics` either way.
 */
struct SyncStatus {
    bool ok{false};
    ErrorKind error{ErrorKind::None};
    std::string message;
    std::string report_path;
    std::string display_plan_path;
    std::string concat_path;
    size_t timeline_entries = 0;
    Diagnostics diagnostics;
};

/**
 * @brief Full run: ingest transcript, build slide corpus, align, validate, merge, emit.
 *
 * @param transcript_path Whisper-style transcript JSON.
 * @param slides_dir Folder of slide images, shown in file name order.
 * @param output_dir Receives display_plan.json, slides.ffconcat, the corpus checkpoint (unless
 *        configured elsewhere) and, for a relative `report_dir`, the matching report.
 * @param config Run configuration.
 * @param extractor Text extraction engine for slide images.
 * @param guard Checked between slides while building the corpus.
 * @param service Reasoning service, or nullptr for fallback alignment.
 * @param progress Optional progress observer.
 */
SyncStatus sync_slides(const std::string &transcript_path, const std::string &slides_dir,
                       const std::string &output_dir, const SlideSyncConfig &config,
                       TextExtractor &extractor, ResourceGuard &guard,
                       std::unique_ptr<ReasoningService> service,
                       ProgressSink *progress = nullptr);  ///< @ingroup api

/// @overload Sidecar text, guard and reasoning service derived from config, logged progress.
SyncStatus sync_slides(const std::string &transcript_path, const std::string &slides_dir,
                       const std::string &output_dir,
                       const SlideSyncConfig &config);  ///< @ingroup api

/// @}

}  // namespace slidesync
