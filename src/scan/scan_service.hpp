#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "config/config_schema.hpp"
#include "scan/analyzer.hpp"
#include "scan/resolution_guard.hpp"
#include "scan/scan_types.hpp"

namespace scanbound::scan {

// Races the analyzer against a deadline inside this process. The analyzer runs
// on its own thread and cannot be stopped: after a timeout it keeps running and
// whatever it produces is discarded. Use WorkerScanService when a runaway scan
// must actually be killed.
class ScanService {
public:
    ScanService(scanbound::config::ScanConfig config, Analyzer analyzer);
    ~ScanService();

    ScanService(const ScanService&) = delete;
    ScanService& operator=(const ScanService&) = delete;

    std::future<ScanOutcome> ExecuteScan(const std::string& contract_code,
                                         const ScanOptions& options = {});
    long long GetMaxExecutionTime() const { return max_execution_time_ms_; }

private:
    void Track(const std::shared_ptr<ResolutionGuard>& guard);

    long long max_execution_time_ms_;
    Analyzer analyzer_;
    // Shared with detached analyzer threads so their timer cancellation always
    // has a live io_context to post to.
    std::shared_ptr<boost::asio::io_context> io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread io_thread_;
    std::mutex pending_mutex_;
    std::vector<std::weak_ptr<ResolutionGuard>> pending_;
};

}  // namespace scanbound::scan
