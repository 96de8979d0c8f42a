//
//  main.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "matching_report.hpp"
#include "slidesync.hpp"
#include "slidesync_version.hpp"
#include "sync_config.hpp"
#include <nlohmann/json.hpp>

namespace {

// Reading mode: print the timeline of an existing report.
bool emit_timeline_json(const MatchingReport &report) {
    nlohmann::json j;
    j["generation_time"] = report.generation_time;
    nlohmann::json slides = nlohmann::json::array();
    for (const auto &e : report.timeline) {
        slides.push_back({{"start_time", e.start_time},
                          {"end_time", e.end_time},
                          {"slide_index", e.slide_index},
                          {"slide_name", e.slide_name},
                          {"confidence", e.confidence}});
    }
    j["timeline"] = slides;
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return std::cout.good();
}

void print_diagnostics(const slidesync::Diagnostics &diagnostics) {
    for (const auto &d : diagnostics) {
        std::cerr << "  " << slidesync::to_string(d.kind);
        if (d.item) {
            std::cerr << " [" << *d.item << "]";
        }
        std::cerr << ": " << d.message << "\n";
    }
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "SlideSync " << SLIDESYNC_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    std::string config_path;
    std::string reasoning_cmd;
    std::string checkpoint_path;
    std::string memory_limit;
    bool verbose_diagnostics = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            slidesync::set_log_verbosity(slidesync::parse_log_verbosity(argv[++i]));
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--reasoning-cmd" && i + 1 < argc) {
            reasoning_cmd = argv[++i];
        } else if (arg == "--checkpoint" && i + 1 < argc) {
            checkpoint_path = argv[++i];
        } else if (arg == "--memory-limit-mb" && i + 1 < argc) {
            memory_limit = argv[++i];
        } else if (arg == "--diagnostics") {
            verbose_diagnostics = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        std::cerr << "SlideSync " << SLIDESYNC_VERSION_DISPLAY << "\n"
                  << "Copyright (c) 2025 The SlideSync Authors\n\n"
                  << "usage for reading:\n"
                  << "  slidesync <matching_report.json> [--log-level warn|info|debug]\n"
                  << "usage for timing:\n"
                  << "  slidesync <transcript.json> <slides_dir> <output_dir> [--config FILE]\n"
                  << "            [--reasoning-cmd CMD] [--checkpoint FILE] "
                  << "[--memory-limit-mb N]\n"
                  << "            [--diagnostics] [--log-level warn|info|debug]\n"
                  << "Options:\n"
                  << "  --config FILE        JSON run configuration.\n"
                  << "  --reasoning-cmd CMD  Command answering guided alignment requests; the\n"
                  << "                       request file path is appended. Needs an API key\n"
                  << "                       (config or ANTHROPIC_API_KEY), else the proportional\n"
                  << "                       fallback is used.\n"
                  << "  --checkpoint FILE    Corpus checkpoint (default: <output_dir>/"
                  << "corpus_checkpoint.json).\n"
                  << "  --memory-limit-mb N  Stop corpus building once resident memory reaches N MB.\n"
                  << "  --diagnostics        List recovered per-item problems after the run.\n"
                  << "  --log-level LEVEL    Set logging verbosity (default: info).\n";
        return 2;
    }

    // Reading mode: one positional argument (report).
    if (positional.size() == 1) {
        auto report = read_matching_report(positional[0]);
        if (!report) {
            SS_LOG("error", "slidesync: failed to read report: " << positional[0]);
            return 1;
        }
        if (!emit_timeline_json(*report)) {
            SS_LOG("error", "slidesync: failed to emit JSON");
            return 1;
        }
        return 0;
    }

    if (positional.size() != 3) {
        std::cerr << "Invalid arguments. Run without arguments for usage.\n";
        return 2;
    }

    slidesync::SlideSyncConfig config{};
    if (!config_path.empty()) {
        auto loaded = slidesync::load_config_json(config_path);
        if (!loaded) {
            SS_LOG("error", "slidesync: failed to load config " << config_path);
            return 2;
        }
        config = *loaded;
    }
    if (!reasoning_cmd.empty()) {
        config.reasoning.command = reasoning_cmd;
    }
    if (!checkpoint_path.empty()) {
        config.checkpoint_path = checkpoint_path;
    }
    if (!memory_limit.empty()) {
        auto limit = slidesync::parse_memory_limit_mb(memory_limit);
        if (!limit) {
            std::cerr << "Invalid --memory-limit-mb value: " << memory_limit << "\n";
            return 2;
        }
        config.memory_limit_mb = *limit;
    }
    // The only environment read: the credential, at the process boundary.
    if (config.reasoning.api_key.empty()) {
        if (const char *key = std::getenv(slidesync::kApiKeyEnvVar)) {
            config.reasoning.api_key = key;
        }
    }

    const auto status =
        slidesync::sync_slides(positional[0], positional[1], positional[2], config);
    if (verbose_diagnostics && !status.diagnostics.empty()) {
        std::cerr << status.diagnostics.size() << " recovered problem(s):\n";
        print_diagnostics(status.diagnostics);
    }
    if (!status.ok) {
        SS_LOG("error", "slidesync: " << slidesync::to_string(status.error) << " error: "
                                      << status.message);
        return 1;
    }

    std::cout << "Wrote: " << status.report_path << "\n"
              << "Wrote: " << status.display_plan_path << "\n"
              << "Wrote: " << status.concat_path << "\n";
    return 0;
}
