#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <signal.h>
#include <string>
#include <thread>
#include <sys/types.h>
#include <unistd.h>

#include "config/config_schema.hpp"
#include "scan/worker_scan_service.hpp"

#ifndef SCANBOUND_WORKER_BINARY
#define SCANBOUND_WORKER_BINARY "scanbound-worker"
#endif

namespace {

#define CHECK(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "CHECK failed: " #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

using namespace scanbound::scan;
using std::chrono::milliseconds;

scanbound::config::ScanConfig ShellWorker(const std::string& script) {
  scanbound::config::ScanConfig config{};
  config.max_execution_time_ms = 2000;
  config.worker_path = "/bin/sh";
  config.worker_args = {"-c", script};
  config.poll_interval_ms = 20;
  config.grace_period_ms = 200;
  return config;
}

scanbound::config::ScanConfig RealWorker() {
  scanbound::config::ScanConfig config{};
  config.max_execution_time_ms = 5000;
  config.worker_path = SCANBOUND_WORKER_BINARY;
  config.poll_interval_ms = 20;
  config.grace_period_ms = 200;
  return config;
}

std::filesystem::path PidFile(const std::string& name) {
  return std::filesystem::temp_directory_path() /
         ("scanbound_" + name + "_" + std::to_string(::getpid()) + ".pid");
}

pid_t ReadPid(const std::filesystem::path& path) {
  for (int attempt = 0; attempt < 50; ++attempt) {
    std::ifstream input(path);
    pid_t pid = 0;
    if (input >> pid && pid > 0) {
      return pid;
    }
    std::this_thread::sleep_for(milliseconds(20));
  }
  return 0;
}

bool WaitUntilGone(pid_t pid, milliseconds limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (::kill(pid, 0) != 0 && errno == ESRCH) {
      return true;
    }
    std::this_thread::sleep_for(milliseconds(20));
  }
  return false;
}

bool test_worker_binary_completes_scan() {
  ::unsetenv("SCANBOUND_SCAN__SIMULATED_DELAY_MS");
  WorkerScanService service(RealWorker());
  ScanOptions options{};
  options.scan_id = "worker_scan_ok";
  const auto outcome = service.ExecuteScanInWorker("contract Vault {}", options).get();
  CHECK(outcome.kind == OutcomeKind::Completed);
  CHECK(outcome.result.scan_id == "worker_scan_ok");
  CHECK(outcome.result.status == ScanStatus::Completed);
  CHECK(outcome.result.metadata.has_value());
  CHECK(outcome.result.metadata->contract_size == std::size_t{17});
  return true;
}

bool test_worker_binary_times_out() {
  ::setenv("SCANBOUND_SCAN__SIMULATED_DELAY_MS", "3000", 1);
  WorkerScanService service(RealWorker());
  ScanOptions options{};
  options.timeout_ms = 200;
  const auto started = std::chrono::steady_clock::now();
  const auto outcome = service.ExecuteScanInWorker("contract Slow {}", options).get();
  const auto elapsed = std::chrono::steady_clock::now() - started;
  ::unsetenv("SCANBOUND_SCAN__SIMULATED_DELAY_MS");
  CHECK(outcome.kind == OutcomeKind::TimedOut);
  CHECK(outcome.error.code == ScanErrorCode::Timeout);
  CHECK(outcome.error.timeout_ms == 200);
  CHECK(outcome.error.message == "Worker scan exceeded maximum execution time of 200ms");
  CHECK(outcome.error.scan_id.rfind("worker_scan_", 0) == 0);
  CHECK(elapsed < milliseconds(1500));
  return true;
}

bool test_timeout_kills_the_worker() {
  const auto pid_file = PidFile("timeout");
  std::error_code ec;
  std::filesystem::remove(pid_file, ec);
  WorkerScanService service(ShellWorker("echo $$ > " + pid_file.string() + "; exec sleep 30"));
  ScanOptions options{};
  options.timeout_ms = 150;
  const auto outcome = service.ExecuteScanInWorker("contract Loop {}", options).get();
  CHECK(outcome.kind == OutcomeKind::TimedOut);
  const auto pid = ReadPid(pid_file);
  CHECK(pid > 0);
  CHECK(WaitUntilGone(pid, milliseconds(1000)));
  std::filesystem::remove(pid_file, ec);
  return true;
}

bool test_abnormal_exit_is_faulted() {
  WorkerScanService service(ShellWorker("exit 3"));
  const auto started = std::chrono::steady_clock::now();
  const auto outcome = service.ExecuteScanInWorker("contract Crash {}").get();
  CHECK(outcome.kind == OutcomeKind::Faulted);
  CHECK(outcome.error.code == ScanErrorCode::Error);
  CHECK(outcome.error.message == "Worker exited unexpectedly with code 3");
  CHECK(std::chrono::steady_clock::now() - started < milliseconds(1500));
  return true;
}

bool test_death_by_signal_is_faulted() {
  WorkerScanService service(ShellWorker("kill -9 $$"));
  const auto outcome = service.ExecuteScanInWorker("contract Killed {}").get();
  CHECK(outcome.kind == OutcomeKind::Faulted);
  CHECK(outcome.error.message == "Worker exited unexpectedly with code 137");
  return true;
}

bool test_error_message_wins_over_exit_code() {
  WorkerScanService service(ShellWorker(R"(echo '{"type":"error","message":"rule set failed to load"}'; exit 1)"));
  ScanOptions options{};
  options.scan_id = "worker_scan_err";
  const auto outcome = service.ExecuteScanInWorker("contract Err {}", options).get();
  CHECK(outcome.kind == OutcomeKind::Faulted);
  CHECK(outcome.error.message == "rule set failed to load");
  CHECK(outcome.error.scan_id == "worker_scan_err");
  return true;
}

bool test_clean_exit_without_result_is_faulted() {
  WorkerScanService service(ShellWorker("exit 0"));
  const auto outcome = service.ExecuteScanInWorker("contract Silent {}").get();
  CHECK(outcome.kind == OutcomeKind::Faulted);
  CHECK(outcome.error.message == "Worker exited without reporting a result");
  return true;
}

bool test_lingering_worker_is_killed_after_result() {
  const auto pid_file = PidFile("linger");
  std::error_code ec;
  std::filesystem::remove(pid_file, ec);
  WorkerScanService service(ShellWorker(
      "echo $$ > " + pid_file.string() +
      R"(; echo '{"type":"result","result":{"scanId":"","status":"completed","findings":[],"executionTime":1}}'; exec sleep 30)"));
  ScanOptions options{};
  options.scan_id = "worker_scan_linger";
  const auto outcome = service.ExecuteScanInWorker("contract Linger {}", options).get();
  CHECK(outcome.kind == OutcomeKind::Completed);
  CHECK(outcome.result.scan_id == "worker_scan_linger");
  const auto pid = ReadPid(pid_file);
  CHECK(pid > 0);
  CHECK(WaitUntilGone(pid, milliseconds(1500)));
  std::filesystem::remove(pid_file, ec);
  return true;
}

bool test_missing_worker_executable_is_faulted() {
  auto config = RealWorker();
  config.worker_path = "/nonexistent/scanbound-worker";
  WorkerScanService service(config);
  const auto outcome = service.ExecuteScanInWorker("contract Nowhere {}").get();
  CHECK(outcome.kind == OutcomeKind::Faulted);
  CHECK(!outcome.error.message.empty());
  return true;
}

bool test_worker_receives_its_own_copy_of_input() {
  // The worker echoes the length of what it read back as contractSize.
  WorkerScanService service(ShellWorker(
      R"(n=$(wc -c | tr -d ' '); printf '{"type":"result","result":{"status":"completed","findings":[],"executionTime":1,"metadata":{"contractSize":%s}}}\n' "$n")"));
  const std::string code = "contract Copy { uint x; }";
  const auto outcome = service.ExecuteScanInWorker(code).get();
  CHECK(outcome.kind == OutcomeKind::Completed);
  CHECK(outcome.result.metadata.has_value());
  CHECK(outcome.result.metadata->contract_size == code.size());
  CHECK(outcome.result.scan_id.rfind("worker_scan_", 0) == 0);
  return true;
}

bool test_parallel_jobs_do_not_interfere() {
  WorkerScanService service(ShellWorker(
      R"(sleep 0.1; printf '{"type":"result","result":{"status":"completed","findings":[],"executionTime":1}}\n')"));
  ScanOptions slow{};
  slow.timeout_ms = 50;
  auto first = service.ExecuteScanInWorker("contract One {}");
  auto second = service.ExecuteScanInWorker("contract Two {}", slow);
  auto third = service.ExecuteScanInWorker("contract Three {}");
  CHECK(first.get().kind == OutcomeKind::Completed);
  CHECK(second.get().kind == OutcomeKind::TimedOut);
  CHECK(third.get().kind == OutcomeKind::Completed);
  return true;
}

bool test_shutdown_faults_running_jobs_and_kills_workers() {
  const auto pid_file = PidFile("shutdown");
  std::error_code ec;
  std::filesystem::remove(pid_file, ec);
  std::future<ScanOutcome> future;
  pid_t pid = 0;
  {
    WorkerScanService service(ShellWorker("echo $$ > " + pid_file.string() + "; exec sleep 30"));
    ScanOptions options{};
    options.timeout_ms = 10000;
    future = service.ExecuteScanInWorker("contract Stop {}", options);
    pid = ReadPid(pid_file);
  }
  CHECK(pid > 0);
  CHECK(future.wait_for(milliseconds(100)) == std::future_status::ready);
  CHECK(future.get().kind == OutcomeKind::Faulted);
  CHECK(WaitUntilGone(pid, milliseconds(1000)));
  std::filesystem::remove(pid_file, ec);
  return true;
}

bool test_exit_is_reported_while_a_descendant_holds_output() {
  const auto pid_file = PidFile("descendant");
  std::error_code ec;
  std::filesystem::remove(pid_file, ec);
  WorkerScanService service(ShellWorker("sleep 20 & echo $! > " + pid_file.string() + "; exit 3"));
  ScanOptions options{};
  options.timeout_ms = 3000;
  const auto started = std::chrono::steady_clock::now();
  const auto outcome = service.ExecuteScanInWorker("contract Fork {}", options).get();
  const auto elapsed = std::chrono::steady_clock::now() - started;
  CHECK(outcome.kind == OutcomeKind::Faulted);
  CHECK(outcome.error.message == "Worker exited unexpectedly with code 3");
  CHECK(elapsed < milliseconds(1500));
  const auto pid = ReadPid(pid_file);
  CHECK(pid > 0);
  CHECK(WaitUntilGone(pid, milliseconds(1000)));
  std::filesystem::remove(pid_file, ec);
  return true;
}

bool test_worker_reported_timeout_stays_a_timeout() {
  WorkerScanService service(ShellWorker(
      R"(echo '{"type":"error","code":"SCAN_TIMEOUT","message":"engine budget exhausted","timeoutMs":250}')"));
  ScanOptions options{};
  options.scan_id = "worker_scan_engine";
  const auto outcome = service.ExecuteScanInWorker("contract Budget {}", options).get();
  CHECK(outcome.kind == OutcomeKind::TimedOut);
  CHECK(outcome.error.code == ScanErrorCode::Timeout);
  CHECK(outcome.error.message == "engine budget exhausted");
  CHECK(outcome.error.timeout_ms == 250);
  CHECK(outcome.error.scan_id == "worker_scan_engine");
  return true;
}

bool test_oversized_message_faults_and_kills_worker() {
  const auto pid_file = PidFile("oversized");
  std::error_code ec;
  std::filesystem::remove(pid_file, ec);
  auto config = ShellWorker("echo $$ > " + pid_file.string() +
                            "; head -c 200 /dev/zero | tr '\\0' a; exec sleep 30");
  config.max_message_bytes = 64;
  WorkerScanService service(config);
  const auto outcome = service.ExecuteScanInWorker("contract Flood {}").get();
  CHECK(outcome.kind == OutcomeKind::Faulted);
  CHECK(outcome.error.message == "Worker message exceeded size limit");
  const auto pid = ReadPid(pid_file);
  CHECK(pid > 0);
  CHECK(WaitUntilGone(pid, milliseconds(1000)));
  std::filesystem::remove(pid_file, ec);
  return true;
}

} // namespace

int main() {
  bool ok = true;

  ok &= test_worker_binary_completes_scan();
  ok &= test_worker_binary_times_out();
  ok &= test_timeout_kills_the_worker();
  ok &= test_abnormal_exit_is_faulted();
  ok &= test_death_by_signal_is_faulted();
  ok &= test_error_message_wins_over_exit_code();
  ok &= test_clean_exit_without_result_is_faulted();
  ok &= test_lingering_worker_is_killed_after_result();
  ok &= test_missing_worker_executable_is_faulted();
  ok &= test_worker_receives_its_own_copy_of_input();
  ok &= test_parallel_jobs_do_not_interfere();
  ok &= test_shutdown_faults_running_jobs_and_kills_workers();
  ok &= test_exit_is_reported_while_a_descendant_holds_output();
  ok &= test_worker_reported_timeout_stays_a_timeout();
  ok &= test_oversized_message_faults_and_kills_worker();

  if (!ok) return 1;

  std::cout << "isolated_scan tests passed\n";
  return 0;
}
