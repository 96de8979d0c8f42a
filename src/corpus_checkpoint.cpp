//
//  corpus_checkpoint.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "corpus_checkpoint.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

#include "logging.hpp"
#include "timestamp_utils.hpp"

using json = nlohmann::json;

std::optional<CorpusCheckpoint> read_checkpoint(const std::string &path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        SS_LOG("warn", "checkpoint exists but cannot be opened: " << path);
        return std::nullopt;
    }
    CorpusCheckpoint cp;
    try {
        json j;
        f >> j;
        cp.timestamp = j.value("timestamp", "");
        const size_t count = j.value("processed_count", static_cast<size_t>(0));
        if (j.contains("processed") && j["processed"].is_array()) {
            for (const auto &p : j["processed"]) {
                if (cp.processed.size() == count) {
                    break;
                }
                SlideDescriptor d{};
                d.index = p.at("index").get<size_t>();
                d.name = p.value("name", "");
                d.path = p.value("path", "");
                d.extracted_text = p.value("extracted_text", "");
                d.word_count = p.value("word_count", static_cast<size_t>(0));
                d.extraction_failed = p.value("extraction_failed", false);
                cp.processed.push_back(std::move(d));
            }
        }
        if (cp.processed.size() != count) {
            SS_LOG("warn", "checkpoint " << path << " claims " << count << " units but lists "
                                         << cp.processed.size());
        }
    } catch (const json::exception &e) {
        SS_LOG("warn", "ignoring unreadable checkpoint " << path << ": " << e.what());
        return std::nullopt;
    }
    SS_LOG("debug", "checkpoint " << path << " from " << cp.timestamp << " has "
                                  << cp.processed.size() << " units");
    return cp;
}

bool write_checkpoint(const std::string &path, const std::vector<SlideDescriptor> &processed) {
    json j;
    j["timestamp"] = iso_timestamp(std::chrono::system_clock::now());
    j["processed_count"] = processed.size();
    json units = json::array();
    for (const auto &d : processed) {
        units.push_back({{"index", d.index},
                         {"name", d.name},
                         {"path", d.path},
                         {"extracted_text", d.extracted_text},
                         {"word_count", d.word_count},
                         {"extraction_failed", d.extraction_failed}});
    }
    j["processed"] = units;

    const std::filesystem::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }
    const std::filesystem::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            SS_LOG("error", "cannot write checkpoint " << tmp.string());
            return false;
        }
        out << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        if (!out.good()) {
            SS_LOG("error", "short write on checkpoint " << tmp.string());
            return false;
        }
    }
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        SS_LOG("error", "cannot move checkpoint into place at " << path << ": " << ec.message());
        return false;
    }
    return true;
}

bool remove_checkpoint(const std::string &path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        SS_LOG("debug", "remove " << path << ": " << ec.message());
        return false;
    }
    return true;
}
