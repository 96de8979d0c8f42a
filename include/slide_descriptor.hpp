//
//  slide_descriptor.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

/// @ingroup api
/// One ordered presentation unit (slide image or rendered page) with its extracted text.
struct SlideDescriptor {
    size_t index = 0;            ///< 0-based position in the corpus
    std::string name;            ///< File name, used in reports
    std::string path;            ///< Source image path handed to the compositor
    std::string extracted_text;  ///< May be empty (no text, or extraction failed)
    size_t word_count = 0;       ///< Whitespace-separated tokens in extracted_text
    bool extraction_failed = false;  ///< Text extractor threw; extracted_text is a placeholder
};

/// Ordered slides; element i carries index i.
using SlideCorpus = std::vector<SlideDescriptor>;
