#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "config/config_schema.hpp"
#include "scan/resolution_guard.hpp"
#include "scan/scan_types.hpp"

namespace scanbound::scan {

// Runs each scan in its own worker process and kills it when the deadline
// passes. The worker (config.worker_path + worker_args + "--scan-id <id>")
// reads the contract code on stdin and answers with one JSON line on stdout.
//
// Per job, four signals race on the service's I/O thread: a result message,
// an error message, an abnormal exit and the deadline. The first one decides
// the outcome; the worker is always killed or reaped before the job is
// dropped.
class WorkerScanService {
public:
    explicit WorkerScanService(scanbound::config::ScanConfig config);
    ~WorkerScanService();

    WorkerScanService(const WorkerScanService&) = delete;
    WorkerScanService& operator=(const WorkerScanService&) = delete;

    std::future<ScanOutcome> ExecuteScanInWorker(const std::string& contract_code,
                                                 const ScanOptions& options = {});
    long long GetMaxExecutionTime() const { return max_execution_time_ms_; }

private:
    struct WorkerJob;

    void Launch(const std::shared_ptr<ResolutionGuard>& guard,
                const std::string& contract_code,
                long long timeout_ms);
    void ReadNext(const std::shared_ptr<WorkerJob>& job);
    void HandleLine(const std::shared_ptr<WorkerJob>& job, const std::string& line);
    void SchedulePoll(const std::shared_ptr<WorkerJob>& job);
    void HandleDeadline(const std::shared_ptr<WorkerJob>& job);
    void Settle(const std::shared_ptr<WorkerJob>& job, ScanOutcome outcome);
    void MaybeFinish(const std::shared_ptr<WorkerJob>& job);
    void Finish(const std::shared_ptr<WorkerJob>& job);
    void Shutdown();
    std::chrono::milliseconds GracePeriod() const;

    scanbound::config::ScanConfig config_;
    long long max_execution_time_ms_;
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    // Touched only from the I/O thread.
    std::unordered_map<std::uint64_t, std::shared_ptr<WorkerJob>> jobs_;
    std::uint64_t next_job_key_ = 0;
    std::thread io_thread_;
};

}  // namespace scanbound::scan
