#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include <boost/asio/io_context.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>

namespace scanbound::sandbox {

// One spawned worker process. The input is handed over through a private
// temporary file bound to the child's stdin; stdout stays readable through
// Output(). The worker leads its own process group so that anything it forks
// is killed along with it. The process is owned exclusively: nothing but
// PollExit() reaps it, and the destructor kills and reaps whatever is still
// running.
class WorkerProcess {
public:
    explicit WorkerProcess(boost::asio::io_context& io);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    bool Start(const std::string& executable,
               const std::vector<std::string>& args,
               const std::string& input,
               std::string& error);

    // Only valid after a successful Start().
    boost::process::async_pipe& Output() { return *output_; }
    void CloseOutput();

    // SIGKILL to the worker's process group, fire-and-forget. Still reaches
    // descendants after the worker itself has been reaped.
    void Kill();

    // Non-blocking waitpid. Returns the exit code once the process is gone;
    // death by signal is reported as 128 + signal.
    std::optional<int> PollExit();

    bool Started() const { return pid_ > 0; }
    bool Running() const { return pid_ > 0 && !exit_code_.has_value(); }
    std::optional<int> ExitCode() const { return exit_code_; }
    pid_t Pid() const { return pid_; }

private:
    bool OpenOutput(std::string& error);

    boost::asio::io_context& io_;
    std::unique_ptr<boost::process::async_pipe> output_;
    std::unique_ptr<boost::process::child> child_;
    pid_t pid_ = -1;
    std::optional<int> exit_code_;
};

}  // namespace scanbound::sandbox
