//
//  slidesync.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//
#include "slidesync.hpp"
#include "slidesync_version.hpp"

#include <chrono>
#include <filesystem>
#include <iterator>
#include <system_error>
#include <utility>

#include "display_plan.hpp"
#include "logging.hpp"
#include "matching_report.hpp"
#include "segment_merger.hpp"
#include "timeline_builder.hpp"
#include "transcript_loader.hpp"

namespace slidesync {

std::string version_string() { return SLIDESYNC_VERSION_DISPLAY; }

Pipeline::Pipeline(SlideSyncConfig config, std::unique_ptr<ReasoningService> service,
                   ProgressSink *progress)
    : config_(std::move(config)), service_(std::move(service)), progress_(progress) {}

PipelineResult Pipeline::run(const Transcript &transcript, const SlideCorpus &corpus) {
    PipelineResult result;
    result.strategy = strategy();

    notify(progress_, Stage::Align,
           std::string(::to_string(result.strategy)) + " alignment of " +
               std::to_string(transcript.segments.size()) + " segments against " +
               std::to_string(corpus.size()) + " slides");
    result.matches =
        align_content(transcript, corpus, service_.get(), config_.slide_text_chars);

    notify(progress_, Stage::Validate,
           std::to_string(result.matches.size()) + " match candidates");
    Timeline validated = build_timeline(result.matches, corpus, result.diagnostics);

    result.timeline = merge_consecutive_slides(validated, config_.merge_gap_seconds);
    notify(progress_, Stage::Merge,
           std::to_string(validated.size()) + " entries merged into " +
               std::to_string(result.timeline.size()));
    return result;
}

namespace {

SyncStatus make_status(ErrorKind error, std::string msg, Diagnostics diagnostics) {
    SS_LOG("error", msg);
    SyncStatus status{};
    status.ok = false;
    status.error = error;
    status.message = std::move(msg);
    status.diagnostics = std::move(diagnostics);
    return status;
}

void append(Diagnostics &into, Diagnostics from) {
    into.insert(into.end(), std::make_move_iterator(from.begin()),
                std::make_move_iterator(from.end()));
}

}  // namespace

SyncStatus sync_slides(const std::string &transcript_path, const std::string &slides_dir,
                       const std::string &output_dir, const SlideSyncConfig &config,
                       TextExtractor &extractor, ResourceGuard &guard,
                       std::unique_ptr<ReasoningService> service, ProgressSink *progress) {
    const auto t0 = std::chrono::steady_clock::now();
    SS_LOG("debug", "sync_slides transcript=" << transcript_path << " slides=" << slides_dir
                                              << " output=" << output_dir
                                              << " guided=" << (service != nullptr));
    Diagnostics diagnostics;

    // Ingest.
    auto transcript = load_transcript(transcript_path, diagnostics);
    if (!transcript) {
        return make_status(ErrorKind::Io, "Failed to load transcript from " + transcript_path,
                           std::move(diagnostics));
    }
    notify(progress, Stage::Ingest,
           std::to_string(transcript->segments.size()) + " speech segments, " +
               format_seconds(transcript->duration));

    std::error_code ec;
    if (!std::filesystem::is_directory(slides_dir, ec)) {
        return make_status(ErrorKind::Io, "Slide folder not found: " + slides_dir,
                           std::move(diagnostics));
    }
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        return make_status(ErrorKind::Io,
                           "Cannot create output folder " + output_dir + ": " + ec.message(),
                           std::move(diagnostics));
    }
    const auto slides = list_slide_images(slides_dir);
    if (slides.empty()) {
        SS_LOG("warn", "no slide images in " << slides_dir);
    }

    const std::filesystem::path out_dir(output_dir);
    const std::string checkpoint_path = config.checkpoint_path.empty()
                                            ? (out_dir / "corpus_checkpoint.json").string()
                                            : config.checkpoint_path;
    const std::filesystem::path configured_report_dir(config.report_dir);
    const std::filesystem::path report_dir = configured_report_dir.is_absolute()
                                                 ? configured_report_dir
                                                 : out_dir / configured_report_dir;

    try {
        // Corpus.
        auto built = build_slide_corpus(slides, extractor, guard, checkpoint_path, progress);
        append(diagnostics, std::move(built.diagnostics));

        // Align, Validate, Merge.
        Pipeline pipeline(config, std::move(service), progress);
        auto result = pipeline.run(*transcript, built.corpus);
        append(diagnostics, std::move(result.diagnostics));

        // Emit.
        auto report = write_matching_report(report_dir.string(), result.matches, result.timeline);
        if (!report) {
            throw IoError("Failed to write matching report to " + report_dir.string());
        }
        const auto clips = make_display_plan(result.timeline, config.min_display_seconds);
        const std::string plan_path = (out_dir / "display_plan.json").string();
        const std::string concat_path = (out_dir / "slides.ffconcat").string();
        if (!write_display_plan(plan_path, clips) ||
            !write_ffconcat(concat_path, clips, transcript->duration,
                            config.min_display_seconds)) {
            throw IoError("Failed to write compositor handoff to " + output_dir);
        }
        notify(progress, Stage::Emit,
               std::to_string(clips.size()) + " clips, report " + *report);

        SyncStatus status{};
        status.ok = true;
        status.report_path = *report;
        status.display_plan_path = plan_path;
        status.concat_path = concat_path;
        status.timeline_entries = result.timeline.size();
        status.diagnostics = std::move(diagnostics);
        const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - t0)
                                  .count();
        SS_LOG("debug", "sync_slides done in " << total_ms << "ms; diagnostics="
                                               << status.diagnostics.size());
        return status;
    } catch (const SlideSyncError &e) {
        return make_status(e.kind(), e.what(), std::move(diagnostics));
    }
}

SyncStatus sync_slides(const std::string &transcript_path, const std::string &slides_dir,
                       const std::string &output_dir, const SlideSyncConfig &config) {
    Diagnostics config_diagnostics;
    auto service = make_reasoning_service(config, config_diagnostics);
    auto guard = make_resource_guard(config);
    SidecarTextExtractor extractor;
    LogProgressSink progress;
    auto status = sync_slides(transcript_path, slides_dir, output_dir, config, extractor, *guard,
                              std::move(service), &progress);
    status.diagnostics.insert(status.diagnostics.begin(), config_diagnostics.begin(),
                              config_diagnostics.end());
    return status;
}

}  // namespace slidesync
