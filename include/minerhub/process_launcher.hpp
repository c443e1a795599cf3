#pragma once

#include "minerhub/log_sink.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace minerhub {

struct ExitStatus {
    int code = 0;       // valid when signal == 0
    int signal = 0;     // terminating signal, 0 for a normal exit

    bool signaled() const { return signal != 0; }
    bool success() const { return signal == 0 && code == 0; }

    // "exit code 3" / "killed by signal 9 (Killed)"
    std::string describe() const;
};

struct CommandLine {
    std::string executable;
    std::vector<std::string> args;
    std::string working_dir;
    std::set<size_t> secret_args;    // indices into args masked in display()

    // Shell-quoted command for logs, secrets replaced by ***
    std::string display() const;
};

// Running OS process. Destroying a live handle kills the process.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual int pid() const = 0;
    virtual bool is_alive() const = 0;

    // Graceful stop request (SIGTERM to the process group)
    virtual bool request_stop() = 0;

    // SIGKILL to the process group
    virtual bool force_kill() = 0;

    // Blocks up to `timeout`; empty when the process is still alive
    virtual std::optional<ExitStatus> wait_for_exit(std::chrono::milliseconds timeout) = 0;
};

// Called from the capture thread for every complete output line
using OutputCallback = std::function<void(LogStream stream, const std::string& line)>;

// Called once from the wait thread after the process has been reaped and
// its output drained
using ExitCallback = std::function<void(const ExitStatus& status)>;

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Returns nullptr with error_msg set when the process could not be started
    virtual std::unique_ptr<ProcessHandle> launch(const CommandLine& command,
                                                  OutputCallback on_output,
                                                  ExitCallback on_exit,
                                                  std::string& error_msg) = 0;
};

// Factory function
std::unique_ptr<ProcessLauncher> create_process_launcher();

} // namespace minerhub
