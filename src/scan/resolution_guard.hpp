#pragma once

#include <atomic>
#include <future>
#include <string>

#include "scan/scan_types.hpp"

namespace scanbound::scan {

// First-signal-wins arbiter for one job. Every signal source (work result,
// work failure, worker exit, deadline timer) funnels through Resolve(); only
// the first call reaches the caller's future, the rest are dropped.
class ResolutionGuard {
public:
    explicit ResolutionGuard(std::string scan_id);
    ~ResolutionGuard();

    ResolutionGuard(const ResolutionGuard&) = delete;
    ResolutionGuard& operator=(const ResolutionGuard&) = delete;

    std::future<ScanOutcome> GetFuture();
    bool Resolve(ScanOutcome outcome);
    bool IsResolved() const { return resolved_.load(); }
    const std::string& ScanId() const { return scan_id_; }

private:
    std::string scan_id_;
    std::atomic<bool> resolved_{false};
    std::promise<ScanOutcome> promise_;
};

}  // namespace scanbound::scan
