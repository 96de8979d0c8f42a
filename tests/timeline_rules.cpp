// Timeline building: out-of-range and invalid candidates are dropped, order is preserved, and
// fallback/guided timelines stay inside the audio.
#include <iostream>
#include <string>
#include <vector>

#include "content_aligner.hpp"
#include "logging.hpp"
#include "segment_merger.hpp"
#include "sync_errors.hpp"
#include "test_utils.hpp"
#include "timeline_builder.hpp"

using namespace test_utils;
using slidesync::ErrorKind;

namespace {

MatchCandidate candidate(int64_t slide, double start, double end, const std::string &text) {
    MatchCandidate m{};
    m.slide_index = slide;
    m.start_time = start;
    m.end_time = end;
    m.confidence = kGuidedConfidence;
    m.reason = "test";
    m.segment_text = text;
    return m;
}

bool timeline_is_well_formed(const Timeline &timeline, double duration, size_t slide_count,
                             const std::string &what) {
    bool ok = true;
    for (size_t i = 0; i < timeline.size(); ++i) {
        const auto &e = timeline[i];
        ok &= check(e.end_time > e.start_time, what + ": entry has a positive range");
        ok &= check(e.end_time <= duration, what + ": entry ends inside the audio");
        ok &= check(e.slide_index < slide_count, what + ": entry references a real slide");
        ok &= check(near(e.duration, e.end_time - e.start_time), what + ": duration matches");
        if (i > 0) {
            ok &= check(e.start_time >= timeline[i - 1].start_time,
                        what + ": start times are non-decreasing");
        }
    }
    return ok;
}

bool test_out_of_range_dropped() {
    auto corpus = make_corpus(3);
    std::vector<MatchCandidate> candidates = {
        candidate(0, 0.0, 10.0, "a"),
        candidate(5, 10.0, 20.0, "b"),
        candidate(2, 20.0, 30.0, "c"),
    };
    slidesync::Diagnostics diagnostics;
    auto timeline = build_timeline(candidates, corpus, diagnostics);
    bool ok = check(timeline.size() == 2, "slide 5 of 3 dropped");
    ok &= check(slidesync::count_kind(diagnostics, ErrorKind::Validation) == 1,
                "drop recorded as a validation diagnostic");
    ok &= check(!diagnostics.empty() && diagnostics[0].item && *diagnostics[0].item == 1,
                "diagnostic names the candidate position");
    if (timeline.size() == 2) {
        ok &= check(timeline[0].slide_name == "slide1.png" && timeline[1].slide_index == 2,
                    "remaining entries keep their order and slide reference");
        ok &= check(timeline[1].slide_path == "/slides/slide3.png", "slide path carried");
        ok &= check(timeline[1].speech_text == "c", "speech text carried");
        ok &= check(near(timeline[1].confidence, kGuidedConfidence), "confidence carried");
    }
    return ok;
}

bool test_invalid_ranges_dropped() {
    auto corpus = make_corpus(4);
    std::vector<MatchCandidate> candidates = {
        candidate(-1, 0.0, 5.0, "negative index"),
        candidate(0, 0.0, 5.0, "ok"),
        candidate(1, 8.0, 8.0, "empty after clamping"),
        candidate(1, 9.0, 7.0, "inverted"),
        candidate(2, -3.0, 2.0, "before the audio"),
        candidate(2, 6.0, 12.0, "ok"),
        candidate(3, 4.0, 12.0, "starts before previous entry"),
        candidate(3, 12.0, 20.0, "ok"),
    };
    slidesync::Diagnostics diagnostics;
    auto timeline = build_timeline(candidates, corpus, diagnostics);
    bool ok = check(timeline.size() == 3, "three valid candidates survive");
    ok &= check(slidesync::count_kind(diagnostics, ErrorKind::Validation) == 5,
                "five drops recorded");
    ok &= timeline_is_well_formed(timeline, 20.0, corpus.size(), "filtered");
    return ok;
}

bool test_fallback_timeline_properties() {
    auto transcript = make_transcript_of({{0.0, 3.0, "a"},
                                          {3.5, 8.0, "b"},
                                          {8.0, 8.4, "c"},
                                          {10.0, 19.0, "d"},
                                          {19.0, 30.0, "e"},
                                          {31.0, 42.0, "f"}},
                                         45.0);
    auto corpus = make_corpus(4);
    slidesync::Diagnostics diagnostics;
    auto matches = align_fallback(transcript, corpus);
    auto timeline = build_timeline(matches, corpus, diagnostics);
    bool ok = check(diagnostics.empty(), "fallback candidates are always valid");
    ok &= check(timeline.size() == matches.size(), "entries map 1:1 to candidates");
    ok &= timeline_is_well_formed(timeline, transcript.duration, corpus.size(), "fallback");
    ok &= timeline_is_well_formed(merge_consecutive_slides(timeline), transcript.duration,
                                  corpus.size(), "fallback merged");
    return ok;
}

bool test_guided_timeline_properties() {
    auto transcript = make_transcript_of({{0.0, 10.0, "a"}, {10.0, 20.0, "b"}}, 20.0);
    auto corpus = make_corpus(2);
    std::vector<GuidedTiming> timings = {{0, 0.0, 10.0, "x"}, {1, 10.0, 60.0, "past the end"},
                                         {1, 25.0, 40.0, "after the end"}};
    auto matches = candidates_from_timings(timings, transcript);
    slidesync::Diagnostics diagnostics;
    auto timeline = build_timeline(matches, corpus, diagnostics);
    bool ok = check(timeline.size() == 2, "timing after the audio dropped once clamped");
    ok &= check(diagnostics.size() == 1, "clamp violation recorded");
    ok &= timeline_is_well_formed(timeline, transcript.duration, corpus.size(), "guided");
    return ok;
}

}  // namespace

int main() {
    slidesync::set_log_verbosity(slidesync::LogVerbosity::Error);
    bool ok = true;
    ok &= test_out_of_range_dropped();
    ok &= test_invalid_ranges_dropped();
    ok &= test_fallback_timeline_properties();
    ok &= test_guided_timeline_properties();
    if (ok) {
        std::cout << "timeline_rules OK\n";
    }
    return ok ? 0 : 1;
}
