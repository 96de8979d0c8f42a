//
//  slide_corpus.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "progress_sink.hpp"
#include "resource_guard.hpp"
#include "slide_descriptor.hpp"
#include "sync_errors.hpp"

namespace slidesync {

/**
 * @brief Text extraction engine for one slide image (OCR, PDF text layer, ...).
 *
 * extract() throws on failure; the corpus builder turns that into an empty placeholder.
 */
class TextExtractor {
  public:
    virtual ~TextExtractor() = default;
    virtual std::string extract(const std::filesystem::path &image) = 0;
};

/// Reads text produced ahead of time by an external OCR pass: `slide03.png` -> `slide03.txt`.
class SidecarTextExtractor : public TextExtractor {
  public:
    std::string extract(const std::filesystem::path &image) override;
};

}  // namespace slidesync

struct CorpusBuildResult {
    SlideCorpus corpus;
    slidesync::Diagnostics diagnostics;
    size_t resumed = 0;  ///< Units taken from the checkpoint instead of re-extracted
};

// Slide images (.jpg/.jpeg/.png, any case) directly inside dir, ordered by file name.
std::vector<std::filesystem::path> list_slide_images(const std::filesystem::path &dir);

// Build the corpus one unit at a time. The guard runs before each unit; when checkpoint_path is
// non-empty the checkpoint is rewritten after each unit and removed after the last one. Throws
// ResourceExhaustionError from the guard with the checkpoint left in place.
CorpusBuildResult build_slide_corpus(const std::vector<std::filesystem::path> &slides,
                                     slidesync::TextExtractor &extractor,
                                     slidesync::ResourceGuard &guard,
                                     const std::string &checkpoint_path,
                                     slidesync::ProgressSink *progress = nullptr);
