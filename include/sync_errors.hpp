//
//  sync_errors.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace slidesync {

/// @ingroup api
/// Error taxonomy shared by fatal exceptions and recorded diagnostics.
enum class ErrorKind {
    None = 0,
    Configuration,      ///< Reasoning service not usable; fallback selected (non-fatal)
    MalformedResponse,  ///< Guided response unusable (fatal)
    Validation,         ///< Single candidate/segment rejected (non-fatal)
    ResourceExhaustion, ///< Resource guard tripped during corpus building (fatal)
    ItemProcessing,     ///< Single slide failed extraction; empty placeholder used (non-fatal)
    Io,                 ///< Input unreadable or output unwritable (fatal)
};

const char *to_string(ErrorKind kind);

/// A recovered, non-fatal problem. `item` is the slide/segment/candidate position when known.
struct Diagnostic {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::optional<size_t> item;
};

using Diagnostics = std::vector<Diagnostic>;

/// Base for fatal errors that abort a run.
class SlideSyncError : public std::runtime_error {
  public:
    SlideSyncError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

  private:
    ErrorKind kind_;
};

class MalformedResponseError : public SlideSyncError {
  public:
    explicit MalformedResponseError(const std::string &message)
        : SlideSyncError(ErrorKind::MalformedResponse, message) {}
};

class ResourceExhaustionError : public SlideSyncError {
  public:
    explicit ResourceExhaustionError(const std::string &message)
        : SlideSyncError(ErrorKind::ResourceExhaustion, message) {}
};

class IoError : public SlideSyncError {
  public:
    explicit IoError(const std::string &message) : SlideSyncError(ErrorKind::Io, message) {}
};

// Log and append a recovered problem.
void record(Diagnostics &diagnostics, ErrorKind kind, std::string message,
            std::optional<size_t> item = std::nullopt);

size_t count_kind(const Diagnostics &diagnostics, ErrorKind kind);

}  // namespace slidesync
