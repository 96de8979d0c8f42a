//
//  resource_guard.hpp
//  SlideSync
//
//  Created by the SlideSync authors on 12/9/25.
//  Copyright © 2025 The SlideSync Authors. All rights reserved.
//

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "sync_config.hpp"

namespace slidesync {

/**
 * @brief Capability invoked between corpus units to stop before the host runs out of memory.
 *
 * check() throws ResourceExhaustionError when the unit about to start must not run.
 */
class ResourceGuard {
  public:
    virtual ~ResourceGuard() = default;
    virtual void check(const std::string &next_unit) = 0;
};

/// Never trips.
class NullResourceGuard : public ResourceGuard {
  public:
    void check(const std::string &) override {}
};

/// Trips once the probed resident set size reaches the limit.
class MemoryResourceGuard : public ResourceGuard {
  public:
    using Probe = std::function<uint64_t()>;  ///< Returns resident memory in MB

    explicit MemoryResourceGuard(uint64_t limit_mb, Probe probe = {});

    void check(const std::string &next_unit) override;

  private:
    uint64_t limit_mb_;
    Probe probe_;
};

// Resident set size of this process in MB; 0 when the platform offers no probe.
uint64_t current_resident_mb();

// NullResourceGuard when memory_limit_mb is 0, MemoryResourceGuard otherwise.
std::unique_ptr<ResourceGuard> make_resource_guard(const SlideSyncConfig &cfg);

}  // namespace slidesync
