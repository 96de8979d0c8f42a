//
//  slide_corpus.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "slide_corpus.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "corpus_checkpoint.hpp"
#include "logging.hpp"
#include "text_utils.hpp"

using slidesync::ErrorKind;
using slidesync::Stage;

namespace slidesync {

std::string SidecarTextExtractor::extract(const std::filesystem::path &image) {
    auto sidecar = image;
    sidecar.replace_extension(".txt");
    std::ifstream f(sidecar);
    if (!f.is_open()) {
        throw std::runtime_error("no extracted text at " + sidecar.string());
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    return buf.str();
}

}  // namespace slidesync

namespace {

bool is_slide_image(const std::filesystem::path &p) {
    auto ext = p.extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(c));
    }
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

// Checkpointed units usable for this slide list: a prefix whose index and name line up.
std::vector<SlideDescriptor> usable_prefix(const CorpusCheckpoint &cp,
                                           const std::vector<std::filesystem::path> &slides) {
    std::vector<SlideDescriptor> out;
    if (cp.processed.size() > slides.size()) {
        SS_LOG("warn", "checkpoint lists " << cp.processed.size() << " units but only "
                                           << slides.size() << " slides exist; ignoring it");
        return out;
    }
    for (size_t i = 0; i < cp.processed.size(); ++i) {
        const auto &d = cp.processed[i];
        if (d.index != i || d.name != slides[i].filename().string()) {
            SS_LOG("warn", "checkpoint unit " << i << " (" << d.name
                                              << ") does not match the slide list; ignoring it");
            return {};
        }
        out.push_back(d);
    }
    return out;
}

}  // namespace

std::vector<std::filesystem::path> list_slide_images(const std::filesystem::path &dir) {
    std::vector<std::filesystem::path> out;
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && is_slide_image(entry.path())) {
            out.push_back(entry.path());
        }
    }
    if (ec) {
        SS_LOG("error", "cannot list slides in " << dir.string() << ": " << ec.message());
        return {};
    }
    std::sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
        return a.filename().string() < b.filename().string();
    });
    return out;
}

CorpusBuildResult build_slide_corpus(const std::vector<std::filesystem::path> &slides,
                                     slidesync::TextExtractor &extractor,
                                     slidesync::ResourceGuard &guard,
                                     const std::string &checkpoint_path,
                                     slidesync::ProgressSink *progress) {
    CorpusBuildResult result;
    const bool checkpointing = !checkpoint_path.empty();

    if (checkpointing) {
        if (auto cp = read_checkpoint(checkpoint_path)) {
            result.corpus = usable_prefix(*cp, slides);
            result.resumed = result.corpus.size();
            // Failures from the interrupted pass are still failures of this corpus.
            for (const auto &d : result.corpus) {
                if (d.extraction_failed) {
                    slidesync::record(result.diagnostics, ErrorKind::ItemProcessing,
                                      "text extraction failed for " + d.name +
                                          " (from checkpoint)",
                                      d.index);
                }
            }
            if (result.resumed > 0) {
                slidesync::notify(progress, Stage::Corpus,
                                  "resuming after " + std::to_string(result.resumed) +
                                      " checkpointed slides",
                                  result.resumed, slides.size());
            }
        }
    }

    result.corpus.reserve(slides.size());
    for (size_t i = result.corpus.size(); i < slides.size(); ++i) {
        const auto &path = slides[i];
        const std::string name = path.filename().string();
        guard.check(name);

        SlideDescriptor d{};
        d.index = i;
        d.name = name;
        d.path = path.string();
        try {
            d.extracted_text = trim_copy(extractor.extract(path));
        } catch (const std::exception &e) {
            slidesync::record(result.diagnostics, ErrorKind::ItemProcessing,
                              "text extraction failed for " + name + ": " + e.what(), i);
            d.extracted_text.clear();
            d.extraction_failed = true;
        }
        d.word_count = count_words(d.extracted_text);
        slidesync::notify(progress, Stage::Corpus,
                          name + (d.extracted_text.empty()
                                      ? std::string(": no text")
                                      : ": " + slidesync::text_preview(d.extracted_text)),
                          i + 1, slides.size());
        result.corpus.push_back(std::move(d));

        if (checkpointing && !write_checkpoint(checkpoint_path, result.corpus)) {
            SS_LOG("warn", "checkpoint not updated after " << name
                                                           << "; an interrupted run restarts "
                                                              "from the last good checkpoint");
        }
    }

    if (checkpointing && !remove_checkpoint(checkpoint_path)) {
        SS_LOG("warn", "completed corpus but could not remove checkpoint " << checkpoint_path
                                                                          << "; the next run "
                                                                             "will reuse it");
    }
    SS_LOG("debug", "corpus built: slides=" << result.corpus.size() << " resumed="
                                            << result.resumed << " failures="
                                            << slidesync::count_kind(result.diagnostics,
                                                                     ErrorKind::ItemProcessing));
    return result;
}
