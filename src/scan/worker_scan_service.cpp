#include "scan/worker_scan_service.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <istream>
#include <optional>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>

#include "sandbox/worker_process.hpp"
#include "scan/deadline_policy.hpp"
#include "scan/scan_id.hpp"
#include "scan/scan_json.hpp"

namespace scanbound::scan {
namespace {

std::string TimeoutMessage(long long timeout_ms) {
    return "Worker scan exceeded maximum execution time of " + std::to_string(timeout_ms) + "ms";
}

}  // namespace

struct WorkerScanService::WorkerJob {
    WorkerJob(boost::asio::io_context& io,
              std::shared_ptr<ResolutionGuard> job_guard,
              long long job_timeout_ms,
              std::size_t max_message_bytes)
        : guard(std::move(job_guard))
        , scan_id(guard->ScanId())
        , timeout_ms(job_timeout_ms)
        , process(io)
        , deadline(io)
        , poll(io)
        , buffer(max_message_bytes) {}

    std::uint64_t key = 0;
    std::shared_ptr<ResolutionGuard> guard;
    std::string scan_id;
    long long timeout_ms;
    scanbound::sandbox::WorkerProcess process;
    boost::asio::steady_timer deadline;
    boost::asio::steady_timer poll;
    boost::asio::streambuf buffer;
    bool output_closed = false;
    bool finished = false;
    // Set once the outcome is known while the worker is still alive.
    std::optional<std::chrono::steady_clock::time_point> kill_after;
    bool kill_sent = false;
    std::optional<std::chrono::steady_clock::time_point> exited_at;
};

WorkerScanService::WorkerScanService(scanbound::config::ScanConfig config)
    : config_(std::move(config))
    , max_execution_time_ms_(ResolveTimeoutMs(std::nullopt, config_.max_execution_time_ms))
    , work_(boost::asio::make_work_guard(io_)) {
    io_thread_ = std::thread([this]() {
        for (;;) {
            try {
                io_.run();
                break;
            } catch (const std::exception& ex) {
                std::cerr << "[worker-scan] internal error: " << ex.what() << std::endl;
            }
        }
    });
    std::cerr << "[worker-scan] Worker scan service initialized with max execution time: "
              << max_execution_time_ms_ << "ms" << std::endl;
}

WorkerScanService::~WorkerScanService() {
    boost::asio::post(io_, [this]() { Shutdown(); });
    work_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

std::future<ScanOutcome> WorkerScanService::ExecuteScanInWorker(const std::string& contract_code,
                                                                const ScanOptions& options) {
    const auto timeout_ms = ResolveTimeoutMs(options.timeout_ms, max_execution_time_ms_);
    const auto scan_id = options.scan_id.empty() ? GenerateScanId("worker_scan") : options.scan_id;

    auto guard = std::make_shared<ResolutionGuard>(scan_id);
    auto future = guard->GetFuture();

    std::cerr << "[worker-scan] Starting worker scan " << scan_id
              << " with timeout: " << timeout_ms << "ms" << std::endl;

    boost::asio::post(io_, [this, guard, contract_code, timeout_ms]() {
        Launch(guard, contract_code, timeout_ms);
    });
    return future;
}

void WorkerScanService::Launch(const std::shared_ptr<ResolutionGuard>& guard,
                               const std::string& contract_code,
                               long long timeout_ms) {
    auto job = std::make_shared<WorkerJob>(
        io_, guard, timeout_ms,
        config_.max_message_bytes > 0 ? config_.max_message_bytes : scanbound::config::kDefaultMaxMessageBytes);

    auto args = config_.worker_args;
    args.push_back("--scan-id");
    args.push_back(job->scan_id);

    std::string error;
    if (!job->process.Start(config_.worker_path, args, contract_code, error)) {
        std::cerr << "[worker-scan] Worker scan " << job->scan_id << " could not start: " << error << std::endl;
        guard->Resolve(ScanOutcome::Faulted(job->scan_id, error));
        return;
    }

    job->key = next_job_key_++;
    jobs_[job->key] = job;

    job->deadline.expires_after(std::chrono::milliseconds(timeout_ms));
    job->deadline.async_wait([this, job](const boost::system::error_code& ec) {
        if (ec || job->finished) {
            return;
        }
        HandleDeadline(job);
    });
    ReadNext(job);
    SchedulePoll(job);
}

void WorkerScanService::ReadNext(const std::shared_ptr<WorkerJob>& job) {
    boost::asio::async_read_until(
        job->process.Output(),
        job->buffer,
        '\n',
        [this, job](const boost::system::error_code& ec, std::size_t) {
            if (job->finished) {
                return;
            }
            if (ec == boost::asio::error::not_found) {
                Settle(job, ScanOutcome::Faulted(job->scan_id, "Worker message exceeded size limit"));
                job->process.Kill();
                job->process.CloseOutput();
                job->output_closed = true;
                MaybeFinish(job);
                return;
            }
            std::istream stream(&job->buffer);
            std::string line;
            if (!ec) {
                std::getline(stream, line);
                HandleLine(job, line);
                if (!job->finished) {
                    ReadNext(job);
                }
                return;
            }
            // EOF (or the pipe was closed under us); a final unterminated line still counts.
            if (job->buffer.size() > 0) {
                std::getline(stream, line);
                HandleLine(job, line);
            }
            job->output_closed = true;
            MaybeFinish(job);
        });
}

void WorkerScanService::HandleLine(const std::shared_ptr<WorkerJob>& job, const std::string& line) {
    if (line.empty()) {
        return;
    }
    const auto message = DecodeWorkerMessage(line);
    if (!message.has_value()) {
        std::cerr << "[worker-scan] Worker scan " << job->scan_id << " ignoring malformed message" << std::endl;
        return;
    }
    if (message->type == WorkerMessageType::Result) {
        auto result = message->result;
        if (result.scan_id.empty()) {
            result.scan_id = job->scan_id;
        }
        Settle(job, ScanOutcome::Completed(std::move(result)));
        return;
    }
    auto error = message->error;
    if (error.scan_id.empty()) {
        error.scan_id = job->scan_id;
    }
    // The analyzer classified this as its own timeout; keep it as one.
    if (error.code == ScanErrorCode::Timeout) {
        Settle(job, ScanOutcome::TimedOut(std::move(error)));
        return;
    }
    Settle(job, ScanOutcome::Faulted(job->scan_id, error.message));
}

void WorkerScanService::SchedulePoll(const std::shared_ptr<WorkerJob>& job) {
    job->poll.expires_after(std::chrono::milliseconds(config_.poll_interval_ms > 0 ? config_.poll_interval_ms : 50));
    job->poll.async_wait([this, job](const boost::system::error_code& ec) {
        if (ec || job->finished) {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        if (job->process.PollExit().has_value()) {
            if (!job->exited_at.has_value()) {
                job->exited_at = now;
            }
            MaybeFinish(job);
            if (job->finished) {
                return;
            }
            if (now - *job->exited_at >= GracePeriod()) {
                // Something the worker left behind still holds its stdout.
                std::cerr << "[worker-scan] Worker for scan " << job->scan_id
                          << " exited but its output never closed; killing its process group" << std::endl;
                job->process.Kill();
                job->process.CloseOutput();
                job->output_closed = true;
                MaybeFinish(job);
                return;
            }
            SchedulePoll(job);
            return;
        }
        if (job->kill_after.has_value() && !job->kill_sent &&
            now >= *job->kill_after) {
            std::cerr << "[worker-scan] Worker for scan " << job->scan_id
                      << " still running after grace period; killing" << std::endl;
            job->process.Kill();
            job->kill_sent = true;
        }
        SchedulePoll(job);
    });
}

void WorkerScanService::HandleDeadline(const std::shared_ptr<WorkerJob>& job) {
    if (!job->guard->Resolve(ScanOutcome::TimedOut(job->scan_id, job->timeout_ms, TimeoutMessage(job->timeout_ms)))) {
        return;
    }
    std::cerr << "[worker-scan] Worker scan " << job->scan_id << " timed out after "
              << job->timeout_ms << "ms" << std::endl;
    job->process.Kill();
    job->kill_sent = true;
    // Anything the worker still writes is irrelevant now.
    job->process.CloseOutput();
    MaybeFinish(job);
}

void WorkerScanService::Settle(const std::shared_ptr<WorkerJob>& job, ScanOutcome outcome) {
    const auto kind = outcome.kind;
    const auto message = outcome.error.message;
    if (!job->guard->Resolve(std::move(outcome))) {
        return;
    }
    job->deadline.cancel();
    if (kind == OutcomeKind::Completed) {
        std::cerr << "[worker-scan] Worker scan " << job->scan_id << " completed successfully" << std::endl;
    } else {
        std::cerr << "[worker-scan] Worker scan " << job->scan_id << " failed: " << message << std::endl;
    }
    if (job->process.Running()) {
        job->kill_after = std::chrono::steady_clock::now() + GracePeriod();
    }
}

void WorkerScanService::MaybeFinish(const std::shared_ptr<WorkerJob>& job) {
    const auto exit_code = job->process.ExitCode();
    if (!exit_code.has_value()) {
        return;
    }
    if (!job->guard->IsResolved()) {
        // Give trailing messages a chance before blaming the exit.
        if (!job->output_closed) {
            return;
        }
        if (*exit_code != 0) {
            std::cerr << "[worker-scan] Worker scan " << job->scan_id
                      << " exited with code " << *exit_code << std::endl;
            Settle(job, ScanOutcome::Faulted(
                job->scan_id, "Worker exited unexpectedly with code " + std::to_string(*exit_code)));
        } else {
            Settle(job, ScanOutcome::Faulted(job->scan_id, "Worker exited without reporting a result"));
        }
    }
    Finish(job);
}

void WorkerScanService::Finish(const std::shared_ptr<WorkerJob>& job) {
    if (job->finished) {
        return;
    }
    job->finished = true;
    job->deadline.cancel();
    job->poll.cancel();
    // Descendants of the worker do not outlive the job.
    job->process.Kill();
    job->process.CloseOutput();
    jobs_.erase(job->key);
}

std::chrono::milliseconds WorkerScanService::GracePeriod() const {
    return std::chrono::milliseconds(config_.grace_period_ms > 0 ? config_.grace_period_ms : 0);
}

void WorkerScanService::Shutdown() {
    std::vector<std::shared_ptr<WorkerJob>> live;
    live.reserve(jobs_.size());
    for (const auto& entry : jobs_) {
        live.push_back(entry.second);
    }
    for (const auto& job : live) {
        job->guard->Resolve(ScanOutcome::Faulted(job->scan_id, "Worker scan service stopped"));
        job->process.Kill();
        Finish(job);
    }
    jobs_.clear();
}

}  // namespace scanbound::scan
