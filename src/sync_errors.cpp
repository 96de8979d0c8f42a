//
//  sync_errors.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "sync_errors.hpp"

#include <algorithm>
#include <utility>

#include "logging.hpp"

namespace slidesync {

const char *to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Configuration:
        return "configuration";
    case ErrorKind::MalformedResponse:
        return "malformed_response";
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::ResourceExhaustion:
        return "resource_exhaustion";
    case ErrorKind::ItemProcessing:
        return "item_processing";
    case ErrorKind::Io:
        return "io";
    }
    return "unknown";
}

void record(Diagnostics &diagnostics, ErrorKind kind, std::string message,
            std::optional<size_t> item) {
    if (item) {
        SS_LOG("warn", to_string(kind) << " [" << *item << "]: " << message);
    } else {
        SS_LOG("warn", to_string(kind) << ": " << message);
    }
    diagnostics.push_back(Diagnostic{kind, std::move(message), item});
}

size_t count_kind(const Diagnostics &diagnostics, ErrorKind kind) {
    return static_cast<size_t>(
        std::count_if(diagnostics.begin(), diagnostics.end(),
                      [kind](const Diagnostic &d) { return d.kind == kind; }));
}

}  // namespace slidesync
