//
//  sync_config.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "sync_config.hpp"

#include <cerrno>
#include <charconv>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

#include "logging.hpp"

using json = nlohmann::json;

namespace slidesync {

std::optional<SlideSyncConfig> load_config_json(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        SS_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return std::nullopt;
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception &e) {
        SS_LOG("error", "config parse error in " << path << ": " << e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        SS_LOG("error", "config root must be an object: " << path);
        return std::nullopt;
    }

    SlideSyncConfig cfg{};
    try {
        if (j.contains("reasoning") && j["reasoning"].is_object()) {
            const auto &r = j["reasoning"];
            cfg.reasoning.command = r.value("command", cfg.reasoning.command);
            cfg.reasoning.api_key = r.value("api_key", cfg.reasoning.api_key);
            cfg.reasoning.model = r.value("model", cfg.reasoning.model);
            cfg.reasoning.max_tokens = r.value("max_tokens", cfg.reasoning.max_tokens);
            cfg.reasoning.temperature = r.value("temperature", cfg.reasoning.temperature);
        }
        cfg.slide_text_chars = j.value("slide_text_chars", cfg.slide_text_chars);
        cfg.merge_gap_seconds = j.value("merge_gap_seconds", cfg.merge_gap_seconds);
        cfg.min_display_seconds = j.value("min_display_seconds", cfg.min_display_seconds);
        cfg.memory_limit_mb = j.value("memory_limit_mb", cfg.memory_limit_mb);
        cfg.report_dir = j.value("report_dir", cfg.report_dir);
        cfg.checkpoint_path = j.value("checkpoint_path", cfg.checkpoint_path);
    } catch (const json::exception &e) {
        // value() throws type_error when a key holds the wrong type.
        SS_LOG("error", "config value has wrong type in " << path << ": " << e.what());
        return std::nullopt;
    }
    SS_LOG("debug", "config loaded from " << path << " reasoning.command='"
                                          << cfg.reasoning.command << "' model="
                                          << cfg.reasoning.model);
    return cfg;
}

std::optional<uint64_t> parse_memory_limit_mb(std::string_view text) {
    uint64_t value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    // from_chars on an unsigned type refuses a sign, unlike stoull.
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

bool reasoning_configured(const ReasoningConfig &cfg, std::string *why) {
    if (cfg.command.empty()) {
        if (why) *why = "no reasoning command configured";
        return false;
    }
    if (cfg.api_key.empty()) {
        if (why) *why = "no reasoning API key configured";
        return false;
    }
    if (cfg.api_key == kPlaceholderApiKey) {
        if (why) *why = "reasoning API key is the placeholder value";
        return false;
    }
    return true;
}

}  // namespace slidesync
