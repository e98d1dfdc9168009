#include "scan/scan_service.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <system_error>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "scan/deadline_policy.hpp"
#include "scan/scan_id.hpp"

namespace scanbound::scan {
namespace {

std::string TimeoutMessage(long long timeout_ms) {
    return "Scan exceeded maximum execution time of " + std::to_string(timeout_ms) + "ms";
}

void LogResolution(const ScanOutcome& outcome, const std::string& scan_id) {
    switch (outcome.kind) {
        case OutcomeKind::Completed:
            std::cerr << "[scan] Scan " << scan_id << " completed successfully" << std::endl;
            break;
        case OutcomeKind::TimedOut:
            std::cerr << "[scan] Scan " << scan_id << " reported its own timeout: "
                      << outcome.error.message << std::endl;
            break;
        case OutcomeKind::Faulted:
            std::cerr << "[scan] Scan " << scan_id << " failed with error: "
                      << outcome.error.message << std::endl;
            break;
    }
}

}  // namespace

ScanService::ScanService(scanbound::config::ScanConfig config, Analyzer analyzer)
    : max_execution_time_ms_(ResolveTimeoutMs(std::nullopt, config.max_execution_time_ms))
    , analyzer_(std::move(analyzer))
    , io_(std::make_shared<boost::asio::io_context>())
    , work_(boost::asio::make_work_guard(*io_)) {
    io_thread_ = std::thread([io = io_]() { io->run(); });
    std::cerr << "[scan] Scan service initialized with max execution time: "
              << max_execution_time_ms_ << "ms" << std::endl;
}

ScanService::~ScanService() {
    work_.reset();
    io_->stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    std::vector<std::weak_ptr<ResolutionGuard>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (const auto& weak_guard : pending) {
        if (auto guard = weak_guard.lock()) {
            guard->Resolve(ScanOutcome::Faulted(
                guard->ScanId(), "Scan service stopped before the scan finished"));
        }
    }
}

std::future<ScanOutcome> ScanService::ExecuteScan(const std::string& contract_code,
                                                  const ScanOptions& options) {
    const auto timeout_ms = ResolveTimeoutMs(options.timeout_ms, max_execution_time_ms_);
    const auto scan_id = options.scan_id.empty() ? GenerateScanId("scan") : options.scan_id;

    auto guard = std::make_shared<ResolutionGuard>(scan_id);
    auto future = guard->GetFuture();
    Track(guard);

    std::cerr << "[scan] Starting scan " << scan_id << " with timeout: " << timeout_ms << "ms" << std::endl;

    try {
        auto timer = std::make_shared<boost::asio::steady_timer>(
            *io_, std::chrono::milliseconds(timeout_ms));
        timer->async_wait([guard, timer, scan_id, timeout_ms](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (guard->Resolve(ScanOutcome::TimedOut(scan_id, timeout_ms, TimeoutMessage(timeout_ms)))) {
                std::cerr << "[scan] Scan " << scan_id << " timed out after " << timeout_ms << "ms" << std::endl;
            }
        });
        std::weak_ptr<boost::asio::steady_timer> weak_timer = timer;

        std::thread([guard, analyzer = analyzer_, contract_code, scan_id, io = io_, weak_timer]() {
            auto outcome = RunAnalyzer(analyzer, contract_code, scan_id);
            const bool won = guard->Resolve(outcome);
            if (!won) {
                std::cerr << "[scan] Scan " << scan_id
                          << " finished after it was resolved; discarding late result" << std::endl;
                return;
            }
            LogResolution(outcome, scan_id);
            boost::asio::post(*io, [weak_timer]() {
                if (auto pending_timer = weak_timer.lock()) {
                    pending_timer->cancel();
                }
            });
        }).detach();
    } catch (const std::system_error& ex) {
        std::cerr << "[scan] Scan " << scan_id << " could not be started: " << ex.what() << std::endl;
        guard->Resolve(ScanOutcome::Faulted(scan_id, "Internal scan error"));
    }
    return future;
}

void ScanService::Track(const std::shared_ptr<ResolutionGuard>& guard) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(), [](const auto& weak_guard) {
        auto live = weak_guard.lock();
        return !live || live->IsResolved();
    }), pending_.end());
    pending_.push_back(guard);
}

}  // namespace scanbound::scan
