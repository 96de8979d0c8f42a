// End-to-end runs: guided pipeline, all-or-nothing failure, fallback selection and file output.
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "matching_report.hpp"
#include "reasoning_service.hpp"
#include "slidesync.hpp"
#include "test_utils.hpp"

using namespace test_utils;
using slidesync::ErrorKind;

namespace {

const char *kTranscriptJson = R"({
  "duration": 30.0,
  "segments": [
    {"start": 0.0, "end": 6.0, "text": " Welcome everyone."},
    {"start": 6.0, "end": 12.0, "text": " Today we cover the agenda."},
    {"start": 12.0, "end": 19.0, "text": " First the architecture."},
    {"start": 19.0, "end": 25.0, "text": " Then the results."},
    {"start": 25.0, "end": 30.0, "text": " Thank you."}
  ]
})";

// Slides plus sidecar text as the default extractor expects them.
std::filesystem::path make_slides_dir(const std::filesystem::path &root, size_t count) {
    const auto dir = root / "slides";
    std::filesystem::create_directories(dir);
    for (size_t i = 0; i < count; ++i) {
        const std::string stem = "slide0" + std::to_string(i + 1);
        write_text_file(dir / (stem + ".png"), "");
        write_text_file(dir / (stem + ".txt"), "Slide " + std::to_string(i + 1) + " text");
    }
    write_text_file(dir / "notes.md", "not a slide");
    return dir;
}

class RecordingSink : public slidesync::ProgressSink {
  public:
    void on_progress(const slidesync::ProgressEvent &event) override {
        stages.push_back(event.stage);
    }
    std::vector<slidesync::Stage> stages;
};

bool test_guided_pipeline() {
    auto transcript = make_transcript_of({{0.0, 5.0, "intro"},
                                          {5.0, 8.0, "overview"},
                                          {8.0, 10.0, "detail one"},
                                          {10.5, 12.0, "detail two"},
                                          {12.0, 20.0, "summary"}},
                                         20.0);
    auto corpus = make_corpus(3);
    const std::string answer = R"({"slide_timings": [
        {"slide_index": 0, "start_time": 0.0, "end_time": 8.0, "reason": "intro"},
        {"slide_index": 1, "start_time": 8.0, "end_time": 10.0},
        {"slide_index": 1, "start_time": 10.5, "end_time": 12.0},
        {"slide_index": 2, "start_time": 12.0, "end_time": 25.0}
    ]})";
    int calls = 0;
    RecordingSink sink;
    slidesync::Pipeline pipeline(slidesync::SlideSyncConfig{},
                                 std::make_unique<FakeReasoningService>(answer, &calls), &sink);
    bool ok = check(pipeline.strategy() == AlignmentStrategy::Guided, "service selects guided");
    auto result = pipeline.run(transcript, corpus);
    ok &= check(calls == 1, "service asked exactly once");
    ok &= check(result.strategy == AlignmentStrategy::Guided, "result records guided");
    ok &= check(result.matches.size() == 4, "raw candidates kept for the report");
    ok &= check(result.timeline.size() == 3, "slide 1 entries merged");
    if (result.timeline.size() == 3) {
        ok &= check(near(result.timeline[1].start_time, 8.0) &&
                        near(result.timeline[1].end_time, 12.0),
                    "merged range");
        ok &= check(result.timeline[1].speech_text == "detail one detail two", "merged text");
        ok &= check(near(result.timeline[2].end_time, 20.0), "end clamped to duration");
        for (const auto &e : result.timeline) {
            ok &= check(near(e.confidence, kGuidedConfidence), "guided confidence");
        }
    }
    ok &= check(result.diagnostics.empty(), "no diagnostics on a clean run");
    ok &= check(sink.stages.size() == 3 && sink.stages[0] == slidesync::Stage::Align &&
                    sink.stages[2] == slidesync::Stage::Merge,
                "progress reported per stage");
    return ok;
}

bool test_malformed_response_aborts_run() {
    const auto root = make_temp_dir("pipeline_malformed");
    const auto slides = make_slides_dir(root, 3);
    const auto transcript = root / "transcript.json";
    write_text_file(transcript, kTranscriptJson);
    const auto out = root / "out";

    int calls = 0;
    slidesync::SidecarTextExtractor extractor;
    slidesync::NullResourceGuard guard;
    auto status = slidesync::sync_slides(
        transcript.string(), slides.string(), out.string(), slidesync::SlideSyncConfig{},
        extractor, guard,
        std::make_unique<FakeReasoningService>(R"({"timings": []})", &calls));

    bool ok = check(!status.ok, "malformed response fails the run");
    ok &= check(status.error == ErrorKind::MalformedResponse, "error kind MalformedResponse");
    ok &= check(calls == 1, "no retry and no second attempt");
    ok &= check(status.report_path.empty(), "no report path");
    ok &= check(!std::filesystem::exists(out / "logs"), "no report directory written");
    ok &= check(!std::filesystem::exists(out / "display_plan.json"), "no display plan written");
    std::filesystem::remove_all(root);
    return ok;
}

bool test_service_selection() {
    slidesync::SlideSyncConfig cfg{};
    slidesync::Diagnostics diags;
    bool ok = check(!slidesync::make_reasoning_service(cfg, diags), "no command: no service");
    ok &= check(diags.size() == 1 && diags[0].kind == ErrorKind::Configuration,
                "missing command recorded as Configuration");

    cfg.reasoning.command = "reasoning-client";
    cfg.reasoning.api_key = slidesync::kPlaceholderApiKey;
    diags.clear();
    ok &= check(!slidesync::make_reasoning_service(cfg, diags), "placeholder key: no service");
    ok &= check(diags.size() == 1 && diags[0].message.find("placeholder") != std::string::npos,
                "placeholder key named in the diagnostic");

    cfg.reasoning.api_key = "sk-test";
    diags.clear();
    ok &= check(slidesync::make_reasoning_service(cfg, diags) != nullptr,
                "configured service created");
    ok &= check(diags.empty(), "no diagnostic when configured");

    slidesync::Pipeline fallback(cfg, nullptr);
    ok &= check(fallback.strategy() == AlignmentStrategy::Fallback, "no service selects fallback");
    return ok;
}

bool test_fallback_sync_end_to_end() {
    const auto root = make_temp_dir("pipeline_e2e");
    const auto slides = make_slides_dir(root, 3);
    const auto transcript = root / "transcript.json";
    write_text_file(transcript, kTranscriptJson);
    const auto out = root / "out";

    slidesync::SlideSyncConfig cfg{};
    auto status = slidesync::sync_slides(transcript.string(), slides.string(), out.string(), cfg);
    bool ok = check(status.ok, "unconfigured run succeeds via fallback: " + status.message);
    ok &= check(slidesync::count_kind(status.diagnostics, ErrorKind::Configuration) == 1,
                "fallback selection reported");
    ok &= check(std::filesystem::exists(status.report_path), "report exists");
    ok &= check(std::filesystem::path(status.report_path).parent_path() == out / "logs",
                "relative report dir resolved under the output folder");
    ok &= check(std::filesystem::exists(status.display_plan_path), "display plan exists");
    ok &= check(std::filesystem::exists(status.concat_path), "concat script exists");
    ok &= check(!std::filesystem::exists(out / "corpus_checkpoint.json"),
                "checkpoint removed after a complete corpus");

    // Starts 0, 6 -> slide 0; 12, 19 -> slide 1; 25 -> slide 2 of 3 over 30s.
    ok &= check(status.timeline_entries == 3, "fallback timeline merged to one entry per slide");
    auto report = read_matching_report(status.report_path);
    ok &= check(report.has_value(), "report readable");
    if (report && report->timeline.size() == 3) {
        ok &= check(report->matches.size() == 5, "one candidate per segment");
        ok &= check(report->timeline[0].speech_text ==
                        "Welcome everyone. Today we cover the agenda.",
                    "segment text trimmed and joined");
        ok &= check(report->timeline[0].slide_name == "slide01.png", "slides in name order");
        ok &= check(near(report->timeline[2].confidence, kFallbackConfidence),
                    "fallback confidence");
    }

    auto plan = nlohmann::json::parse(read_text_file(status.display_plan_path));
    ok &= check(plan.is_array() && plan.size() == 3, "one clip per timeline entry");

    status = slidesync::sync_slides((root / "missing.json").string(), slides.string(),
                                    out.string(), cfg);
    ok &= check(!status.ok && status.error == ErrorKind::Io, "missing transcript is an Io error");
    status = slidesync::sync_slides(transcript.string(), (root / "nope").string(), out.string(),
                                    cfg);
    ok &= check(!status.ok && status.error == ErrorKind::Io, "missing slide folder is an Io error");

    std::filesystem::remove_all(root);
    return ok;
}

bool test_extraction_failure_is_recovered() {
    const auto root = make_temp_dir("pipeline_extract");
    const auto slides = make_slides_dir(root, 2);
    std::filesystem::remove(slides / "slide02.txt");
    const auto transcript = root / "transcript.json";
    write_text_file(transcript, kTranscriptJson);

    auto status = slidesync::sync_slides(transcript.string(), slides.string(),
                                         (root / "out").string(), slidesync::SlideSyncConfig{});
    bool ok = check(status.ok, "run survives a slide without text");
    ok &= check(slidesync::count_kind(status.diagnostics, ErrorKind::ItemProcessing) == 1,
                "missing text recorded as ItemProcessing");
    std::filesystem::remove_all(root);
    return ok;
}

}  // namespace

int main() {
    slidesync::set_log_verbosity(slidesync::LogVerbosity::Error);
    bool ok = true;
    ok &= test_guided_pipeline();
    ok &= test_malformed_response_aborts_run();
    ok &= test_service_selection();
    ok &= test_fallback_sync_end_to_end();
    ok &= test_extraction_failure_is_recovered();
    if (ok) {
        std::cout << "pipeline_unit OK\n";
    }
    return ok ? 0 : 1;
}
