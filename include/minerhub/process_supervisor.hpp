#pragma once

#include "minerhub/config_manager.hpp"
#include "minerhub/log_sink.hpp"
#include "minerhub/process_launcher.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace minerhub {

struct LaunchResult {
    bool ok = false;
    int pid = -1;
    uint64_t generation = 0;
    std::string command;     // display form, secrets masked
    std::string error;
};

enum class TerminateOutcome {
    Confirmed,     // exited after SIGTERM
    Escalated,     // exited after SIGKILL
    NotRunning,    // nothing to stop
    Failed         // still alive after SIGKILL
};

const char* to_string(TerminateOutcome outcome);

struct TerminateResult {
    TerminateOutcome outcome = TerminateOutcome::NotRunning;
    std::optional<ExitStatus> exit;
    std::string error;

    bool confirmed() const { return outcome != TerminateOutcome::Failed; }
};

// Owns the OS processes of all slots. Executes launch/terminate requests,
// streams output into the log sink and reports exits nobody asked for.
class ProcessSupervisor {
public:
    // Called from a process wait thread; must not block
    using ExitHandler = std::function<void(const std::string& slot_id, uint64_t generation,
                                           const ExitStatus& status)>;

    ProcessSupervisor(ProcessLauncher& launcher, std::shared_ptr<LogSink> log,
                      const SupervisorConfig& config);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    void set_exit_handler(ExitHandler handler);

    // Fails without creating a handle when the command cannot be built,
    // the executable is unusable or the spawn fails
    LaunchResult launch(const std::string& slot_id, const MinerConfig& miner);

    // SIGTERM, wait grace_timeout_ms, SIGKILL, wait kill_timeout_ms
    TerminateResult terminate(const std::string& slot_id);

    bool is_running(const std::string& slot_id) const;
    std::optional<int> pid(const std::string& slot_id) const;
    std::vector<std::string> running_slots() const;

    void update_config(const SupervisorConfig& config);

    // Number of launch requests received so far
    uint64_t launch_attempts() const { return launch_attempts_; }

    // Waits until captured output has reached the sink
    void flush_logs();

private:
    // Shared with the exit callback, which must never own the handle
    struct ExitState {
        std::atomic<bool> stop_requested{false};
        std::atomic<bool> exited{false};
    };

    struct Entry {
        std::unique_ptr<ProcessHandle> handle;
        uint64_t generation = 0;
        std::shared_ptr<ExitState> state = std::make_shared<ExitState>();
    };

    void on_output(const std::string& slot_id, LogStream stream, const std::string& line);
    void on_exit(const std::string& slot_id, ExitState& state,
                 uint64_t generation, const ExitStatus& status);
    void log(const std::string& slot_id, LogLevel level, const std::string& text);

    ProcessLauncher& launcher_;
    std::shared_ptr<AsyncLogSink> log_;

    mutable std::mutex mutex_;
    SupervisorConfig config_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    ExitHandler exit_handler_;
    uint64_t next_generation_ = 0;
    std::atomic<uint64_t> launch_attempts_{0};
};

} // namespace minerhub
