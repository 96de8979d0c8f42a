//
//  sync_config.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace slidesync {

/// Settings for the external reasoning service used by guided alignment.
struct ReasoningConfig {
    std::string command;  ///< Executable invoked with the request file; empty = not configured
    std::string api_key;  ///< Exported to the command as ANTHROPIC_API_KEY
    std::string model = "claude-sonnet-4-20250514";
    int max_tokens = 10000;
    double temperature = 0.3;
};

/**
 * @brief Run configuration passed into the pipeline.
 *
 * Everything that used to come from process environment lives here; the CLI fills it once from
 * a JSON file, flags, and the API key variable.
 */
struct SlideSyncConfig {
    ReasoningConfig reasoning;
    size_t slide_text_chars = 200;     ///< Slide text budget per slide in the guided request
    double merge_gap_seconds = 1.0;    ///< Max gap for coalescing same-slide entries
    double min_display_seconds = 1.0;  ///< Floor applied at the compositor handoff
    uint64_t memory_limit_mb = 0;      ///< 0 disables the memory guard
    std::string report_dir = "logs";
    std::string checkpoint_path;       ///< Empty = <output_dir>/corpus_checkpoint.json
};

/// Environment variable carrying the credential to the reasoning command (and read by the CLI).
inline constexpr const char *kApiKeyEnvVar = "ANTHROPIC_API_KEY";

/// Key value that ships in sample env files and never authenticates.
inline constexpr const char *kPlaceholderApiKey = "your-api-key-here";

// Load configuration from JSON; missing keys keep their defaults. Returns nullopt when the file
// cannot be opened or parsed.
std::optional<SlideSyncConfig> load_config_json(const std::string &path);

// Parse a memory limit in MB: decimal digits only, so "-5" or "12MB" is rejected rather than
// wrapped or truncated. Returns nullopt on bad input or overflow.
std::optional<uint64_t> parse_memory_limit_mb(std::string_view text);

// True when guided alignment has what it needs (command plus a non-placeholder key).
bool reasoning_configured(const ReasoningConfig &cfg, std::string *why = nullptr);

}  // namespace slidesync
