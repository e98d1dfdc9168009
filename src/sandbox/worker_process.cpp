#include "sandbox/worker_process.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>

#include <boost/filesystem/path.hpp>
#include <boost/system/system_error.hpp>
#include <boost/process/args.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/extend.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <boost/process/search_path.hpp>

namespace scanbound::sandbox {
namespace bp = boost::process;
namespace {

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::filesystem::path MakeInputPath() {
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return std::filesystem::temp_directory_path() /
           ("scanbound_input_" + std::to_string(::getpid()) + "_" + stamp + "_" +
            std::to_string(counter.fetch_add(1)) + ".txt");
}

}  // namespace

WorkerProcess::WorkerProcess(boost::asio::io_context& io)
    : io_(io) {}

WorkerProcess::~WorkerProcess() {
    Kill();
    if (Running()) {
        int status = 0;
        ::waitpid(pid_, &status, 0);
    }
    CloseOutput();
}

// Both ends are close-on-exec from birth: a process forked concurrently by
// another thread must never hold the write end, or EOF would not arrive while
// it lives. The child's stdout is a dup2() copy and loses the flag.
bool WorkerProcess::OpenOutput(std::string& error) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        error = std::string("Failed to create worker output pipe: ") + std::strerror(errno);
        return false;
    }
    bp::pipe adopted(fds[0], fds[1]);
    try {
        output_ = std::make_unique<bp::async_pipe>(io_, adopted);
    } catch (const boost::system::system_error& ex) {
        error = std::string("Failed to register worker output pipe: ") + ex.what();
        return false;
    }
    // The async pipe owns the descriptors now.
    adopted.assign_source(-1);
    adopted.assign_sink(-1);
    return true;
}

bool WorkerProcess::Start(const std::string& executable,
                          const std::vector<std::string>& args,
                          const std::string& input,
                          std::string& error) {
    boost::filesystem::path exe(executable);
    if (!exe.has_parent_path()) {
        exe = bp::search_path(executable);
    }
    if (exe.empty()) {
        error = "Worker executable not found: " + executable;
        return false;
    }

    std::filesystem::path input_path;
    try {
        input_path = MakeInputPath();
        std::ofstream stream(input_path, std::ios::binary | std::ios::trunc);
        if (!stream.is_open()) {
            error = "Failed to create worker input file";
            return false;
        }
        std::filesystem::permissions(input_path,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
        stream << input;
        if (!stream) {
            error = "Failed to write worker input file";
            std::error_code ec;
            std::filesystem::remove(input_path, ec);
            return false;
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        error = std::string("Failed to prepare worker input: ") + ex.what();
        return false;
    }

    if (!OpenOutput(error)) {
        std::error_code ec;
        std::filesystem::remove(input_path, ec);
        return false;
    }

    bool started = false;
    try {
        child_ = std::make_unique<bp::child>(
            bp::exe = exe.string(),
            bp::args = args,
            bp::std_in < input_path.string(),
            bp::std_out > *output_,
            bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });
        pid_ = child_->id();
        // Reaping is ours alone; the handle must never waitpid a recycled pid.
        child_->detach();
        started = true;
    } catch (const bp::process_error& ex) {
        error = std::string("Error: exec failed: ") + ex.what();
    }

    // The child already holds the file open; the name is no longer needed.
    std::error_code ec;
    std::filesystem::remove(input_path, ec);
    return started;
}

void WorkerProcess::CloseOutput() {
    if (!output_) {
        return;
    }
    boost::system::error_code ec;
    output_->close(ec);
}

void WorkerProcess::Kill() {
    if (pid_ <= 0) {
        return;
    }
    ::kill(-pid_, SIGKILL);
    if (Running()) {
        ::kill(pid_, SIGKILL);
    }
}

std::optional<int> WorkerProcess::PollExit() {
    if (!Running()) {
        return exit_code_;
    }
    int status = 0;
    const auto waited = ::waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        exit_code_ = DecodeStatus(status);
    } else if (waited < 0 && errno != EINTR) {
        exit_code_ = -1;
    }
    return exit_code_;
}

}  // namespace scanbound::sandbox
