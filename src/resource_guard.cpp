//
//  resource_guard.cpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#include "resource_guard.hpp"

#include <cstdio>
#include <cstring>
#include <utility>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/resource.h>
#endif

#include "logging.hpp"
#include "sync_errors.hpp"

namespace slidesync {

uint64_t current_resident_mb() {
#if defined(__linux__)
    // VmRSS is the current figure; ru_maxrss below is only the peak.
    if (FILE *fp = std::fopen("/proc/self/status", "r")) {
        char line[256];
        long rss_kb = -1;
        while (std::fgets(line, sizeof(line), fp)) {
            if (std::strncmp(line, "VmRSS:", 6) == 0) {
                std::sscanf(line, "VmRSS: %ld kB", &rss_kb);
                break;
            }
        }
        std::fclose(fp);
        if (rss_kb >= 0) {
            return static_cast<uint64_t>(rss_kb) / 1024;
        }
    }
#endif
#if defined(__unix__) || defined(__APPLE__)
    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
#if defined(__APPLE__)
        return static_cast<uint64_t>(usage.ru_maxrss) / (1024 * 1024);  // bytes
#else
        return static_cast<uint64_t>(usage.ru_maxrss) / 1024;  // kB
#endif
    }
#endif
    return 0;
}

MemoryResourceGuard::MemoryResourceGuard(uint64_t limit_mb, Probe probe)
    : limit_mb_(limit_mb), probe_(probe ? std::move(probe) : Probe(current_resident_mb)) {}

void MemoryResourceGuard::check(const std::string &next_unit) {
    const uint64_t used = probe_();
    SS_LOG("debug", "memory guard: resident=" << used << "MB limit=" << limit_mb_
                                              << "MB before " << next_unit);
    if (limit_mb_ > 0 && used >= limit_mb_) {
        throw ResourceExhaustionError("resident memory " + std::to_string(used) +
                                      "MB reached the limit of " + std::to_string(limit_mb_) +
                                      "MB before processing " + next_unit);
    }
}

std::unique_ptr<ResourceGuard> make_resource_guard(const SlideSyncConfig &cfg) {
    if (cfg.memory_limit_mb == 0) {
        return std::make_unique<NullResourceGuard>();
    }
    return std::make_unique<MemoryResourceGuard>(cfg.memory_limit_mb);
}

}  // namespace slidesync
