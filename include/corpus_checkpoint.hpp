//
//  corpus_checkpoint.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "slide_descriptor.hpp"

/**
 * @brief Persisted partial progress of a corpus-building pass.
 *
 * On disk:
 * `{"timestamp": "...", "processed_count": N, "processed": [{index, name, path,
 *   extracted_text, word_count, extraction_failed}, ...]}`
 */
struct CorpusCheckpoint {
    std::string timestamp;
    std::vector<SlideDescriptor> processed;  ///< In corpus order, indices 0..N-1
};

// Returns nullopt when no checkpoint exists or it cannot be parsed (logged, then ignored).
std::optional<CorpusCheckpoint> read_checkpoint(const std::string &path);

// Write atomically (temp file + rename) so an interruption never leaves a torn checkpoint.
bool write_checkpoint(const std::string &path, const std::vector<SlideDescriptor> &processed);

// Delete the checkpoint; missing files count as removed.
bool remove_checkpoint(const std::string &path);
