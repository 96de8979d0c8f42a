// Transcript ingestion: Whisper-style JSON, invalid segments and duration handling.
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>

#include "logging.hpp"
#include "test_utils.hpp"
#include "transcript_loader.hpp"

using namespace test_utils;
using slidesync::ErrorKind;

namespace {

bool test_parse_whisper_json() {
    const std::string text = R"({
      "text": "full text is ignored",
      "language": "en",
      "duration": 42.5,
      "segments": [
        {"id": 0, "start": 0.0, "end": 3.2, "text": "  Hello and welcome. "},
        {"id": 1, "start": 3.2, "end": 9.0, "text": " Let's begin."},
        {"id": 2, "start": 9.0, "end": 12.0}
      ]
    })";
    slidesync::Diagnostics diags;
    auto t = parse_transcript_json(text, diags);
    bool ok = check(t.has_value(), "transcript parsed");
    if (!t) {
        return false;
    }
    ok &= check(t->segments.size() == 3, "all segments kept");
    ok &= check(near(t->duration, 42.5), "duration taken from the document");
    ok &= check(t->segments[0].text == "Hello and welcome.", "text trimmed");
    ok &= check(t->segments[2].text.empty(), "missing text is empty");
    ok &= check(diags.empty(), "no diagnostics");
    return ok;
}

bool test_invalid_segments_dropped() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    slidesync::Diagnostics diags;
    auto t = make_transcript({{0.0, 4.0, "ok one"},
                              {5.0, 5.0, "empty range"},
                              {7.0, 6.0, "inverted"},
                              {-1.0, 2.0, "negative"},
                              {nan, 8.0, "nan"},
                              {3.0, 8.0, "overlaps"},
                              {4.0, 8.0, "ok two"}},
                             20.0, diags);
    bool ok = check(t.segments.size() == 2, "two valid segments remain");
    ok &= check(slidesync::count_kind(diags, ErrorKind::Validation) == 5,
                "each dropped segment reported");
    ok &= check(diags.size() == 5 && diags[0].item == 1u && diags[4].item == 5u,
                "diagnostics carry the segment position");
    if (t.segments.size() == 2) {
        ok &= check(t.segments[1].text == "ok two", "order preserved");
    }
    return ok;
}

bool test_duration_rules() {
    slidesync::Diagnostics diags;
    auto t = make_transcript({{0.0, 4.0, "a"}, {4.0, 12.0, "b"}}, 10.0, diags);
    bool ok = check(near(t.duration, 12.0), "short duration extended to the last end");

    t = make_transcript({{0.0, 4.0, "a"}}, 0.0, diags);
    ok &= check(near(t.duration, 4.0), "missing duration derived from segments");

    t = make_transcript({}, 0.0, diags);
    ok &= check(t.segments.empty() && near(t.duration, 0.0), "empty transcript");

    auto parsed = parse_transcript_json(R"({"segments": [{"start": 1, "end": 2.5}]})", diags);
    ok &= check(parsed && near(parsed->duration, 2.5), "document without duration");
    ok &= check(diags.empty(), "duration handling is not a validation problem");
    return ok;
}

bool test_rejected_documents() {
    slidesync::Diagnostics diags;
    bool ok = check(!parse_transcript_json("not json", diags), "non-JSON rejected");
    ok &= check(!parse_transcript_json(R"({"text": "no segments"})", diags),
                "document without segments rejected");
    ok &= check(!parse_transcript_json(R"({"segments": {}})", diags),
                "segments must be an array");

    auto t = parse_transcript_json(R"({"segments": [{"start": "0", "end": 1}, 7,
                                                    {"start": 1, "end": 2, "text": "kept"}]})",
                                   diags);
    ok &= check(t && t->segments.size() == 1, "malformed segment entries skipped");
    ok &= check(slidesync::count_kind(diags, ErrorKind::Validation) == 2,
                "malformed entries reported");

    slidesync::Diagnostics file_diags;
    const auto dir = make_temp_dir("transcript");
    ok &= check(!load_transcript((dir / "missing.json").string(), file_diags),
                "missing file rejected");
    ok &= check(write_text_file(dir / "t.json", R"({"segments": []})"), "fixture written");
    auto loaded = load_transcript((dir / "t.json").string(), file_diags);
    ok &= check(loaded && loaded->segments.empty(), "empty segment list is a valid transcript");
    std::filesystem::remove_all(dir);
    return ok;
}

}  // namespace

int main() {
    slidesync::set_log_verbosity(slidesync::LogVerbosity::Error);
    bool ok = true;
    ok &= test_parse_whisper_json();
    ok &= test_invalid_segments_dropped();
    ok &= test_duration_rules();
    ok &= test_rejected_documents();
    if (ok) {
        std::cout << "transcript_loader_unit OK\n";
    }
    return ok ? 0 : 1;
}
