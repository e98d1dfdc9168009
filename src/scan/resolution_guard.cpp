#include "scan/resolution_guard.hpp"

#include <utility>

namespace scanbound::scan {

ResolutionGuard::ResolutionGuard(std::string scan_id)
    : scan_id_(std::move(scan_id)) {}

ResolutionGuard::~ResolutionGuard() {
    // Every signal source let go without deciding; the caller still gets an outcome.
    Resolve(ScanOutcome::Faulted(scan_id_, "Scan abandoned before producing an outcome"));
}

std::future<ScanOutcome> ResolutionGuard::GetFuture() {
    return promise_.get_future();
}

bool ResolutionGuard::Resolve(ScanOutcome outcome) {
    if (resolved_.exchange(true)) {
        return false;
    }
    promise_.set_value(std::move(outcome));
    return true;
}

}  // namespace scanbound::scan
