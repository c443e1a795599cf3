#include "minerhub/process_supervisor.hpp"
#include "minerhub/command_builder.hpp"

namespace minerhub {

const char* to_string(TerminateOutcome outcome) {
    switch (outcome) {
        case TerminateOutcome::Confirmed:  return "confirmed";
        case TerminateOutcome::Escalated:  return "escalated";
        case TerminateOutcome::NotRunning: return "not running";
        case TerminateOutcome::Failed:     return "failed";
    }
    return "unknown";
}

ProcessSupervisor::ProcessSupervisor(ProcessLauncher& launcher, std::shared_ptr<LogSink> log,
                                     const SupervisorConfig& config)
    : launcher_(launcher)
    , log_(std::make_shared<AsyncLogSink>(std::move(log), static_cast<size_t>(config.log_buffer_lines)))
    , config_(config)
{
}

ProcessSupervisor::~ProcessSupervisor() {
    std::map<std::string, std::shared_ptr<Entry>> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftovers.swap(entries_);
        exit_handler_ = nullptr;
    }

    for (auto& [slot_id, entry] : leftovers) {
        if (entry->handle && entry->handle->is_alive()) {
            entry->state->stop_requested = true;
            log(slot_id, LogLevel::Warning,
                "Killing pid " + std::to_string(entry->handle->pid()) + " on shutdown");
            entry->handle->force_kill();
        }
        // Joins the wait thread
        entry->handle.reset();
    }

    log_->stop();
}

void ProcessSupervisor::set_exit_handler(ExitHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    exit_handler_ = std::move(handler);
}

void ProcessSupervisor::update_config(const SupervisorConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

void ProcessSupervisor::flush_logs() {
    log_->flush();
}

void ProcessSupervisor::log(const std::string& slot_id, LogLevel level, const std::string& text) {
    log_->write(make_log_line(slot_id, level, text));
}

LaunchResult ProcessSupervisor::launch(const std::string& slot_id, const MinerConfig& miner) {
    ++launch_attempts_;
    LaunchResult result;

    std::shared_ptr<Entry> retired;
    bool strip_ansi = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        strip_ansi = config_.strip_ansi;
        auto it = entries_.find(slot_id);
        if (it != entries_.end()) {
            const auto& existing = it->second;
            if (!existing->state->exited && (!existing->handle || existing->handle->is_alive())) {
                result.error = "already running";
                if (existing->handle) {
                    result.error += " (pid " + std::to_string(existing->handle->pid()) + ")";
                }
                return result;
            }
            retired = std::move(it->second);
            entries_.erase(it);
        }
    }
    // Release the previous handle outside the lock: its destructor joins the wait thread
    retired.reset();

    std::string error;
    auto command = build_command(miner, error);
    if (!command) {
        result.error = error;
        log(slot_id, LogLevel::Error, "Cannot build command: " + error);
        return result;
    }
    result.command = command->display();

    if (!check_executable(command->executable, error)) {
        result.error = error;
        log(slot_id, LogLevel::Error, "Launch refused: " + error);
        return result;
    }

    // Registered before the spawn so an immediate exit finds its entry
    auto entry = std::make_shared<Entry>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry->generation = ++next_generation_;
        entries_[slot_id] = entry;
    }
    const uint64_t generation = entry->generation;
    std::shared_ptr<ExitState> state = entry->state;

    auto output_cb = [this, slot_id, strip_ansi](LogStream stream, const std::string& line) {
        on_output(slot_id, stream, strip_ansi ? strip_ansi_codes(line) : line);
    };
    auto exit_cb = [this, slot_id, state, generation](const ExitStatus& status) {
        on_exit(slot_id, *state, generation, status);
    };

    auto handle = launcher_.launch(*command, output_cb, exit_cb, error);
    if (!handle) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(slot_id);
            if (it != entries_.end() && it->second == entry) {
                entries_.erase(it);
            }
        }
        result.error = error;
        log(slot_id, LogLevel::Error, "Launch failed: " + error);
        return result;
    }

    result.ok = true;
    result.pid = handle->pid();
    result.generation = generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry->handle = std::move(handle);
    }

    log(slot_id, LogLevel::Info,
        "Started (pid " + std::to_string(result.pid) + "): " + result.command);
    return result;
}

TerminateResult ProcessSupervisor::terminate(const std::string& slot_id) {
    TerminateResult result;

    std::shared_ptr<Entry> entry;
    SupervisorConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
        auto it = entries_.find(slot_id);
        if (it != entries_.end()) {
            entry = it->second;
        }
    }

    if (!entry || !entry->handle) {
        result.outcome = TerminateOutcome::NotRunning;
        return result;
    }

    entry->state->stop_requested = true;
    ProcessHandle& handle = *entry->handle;
    const std::string pid_text = std::to_string(handle.pid());

    if (!handle.is_alive()) {
        result.outcome = TerminateOutcome::NotRunning;
        result.exit = handle.wait_for_exit(std::chrono::milliseconds(0));
    } else {
        log(slot_id, LogLevel::Info, "Stopping pid " + pid_text);
        handle.request_stop();
        result.exit = handle.wait_for_exit(std::chrono::milliseconds(config.grace_timeout_ms));

        if (result.exit) {
            result.outcome = TerminateOutcome::Confirmed;
        } else {
            log(slot_id, LogLevel::Warning,
                "pid " + pid_text + " ignored SIGTERM for " +
                std::to_string(config.grace_timeout_ms) + " ms, sending SIGKILL");
            handle.force_kill();
            result.exit = handle.wait_for_exit(std::chrono::milliseconds(config.kill_timeout_ms));
            if (result.exit) {
                result.outcome = TerminateOutcome::Escalated;
            } else {
                result.outcome = TerminateOutcome::Failed;
                result.error = "pid " + pid_text + " still alive after SIGKILL";
                log(slot_id, LogLevel::Error, result.error + ", manual intervention required");
                // Entry stays so a later terminate can retry
                return result;
            }
        }
    }

    if (result.exit) {
        log(slot_id, LogLevel::Info, "Stopped (" + result.exit->describe() + ")");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(slot_id);
        if (it != entries_.end() && it->second == entry) {
            entries_.erase(it);
        }
    }
    // The last reference goes here, outside the lock
    entry.reset();
    return result;
}

bool ProcessSupervisor::is_running(const std::string& slot_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(slot_id);
    return it != entries_.end() && it->second->handle && it->second->handle->is_alive();
}

std::optional<int> ProcessSupervisor::pid(const std::string& slot_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(slot_id);
    if (it == entries_.end() || !it->second->handle || !it->second->handle->is_alive()) {
        return std::nullopt;
    }
    return it->second->handle->pid();
}

std::vector<std::string> ProcessSupervisor::running_slots() const {
    std::vector<std::string> slots;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [slot_id, entry] : entries_) {
        if (entry->handle && entry->handle->is_alive()) {
            slots.push_back(slot_id);
        }
    }
    return slots;
}

void ProcessSupervisor::on_output(const std::string& slot_id, LogStream stream,
                                  const std::string& line) {
    if (line.empty()) {
        return;
    }
    log_->write(make_log_line(slot_id, LogLevel::Info, line, stream));
}

void ProcessSupervisor::on_exit(const std::string& slot_id, ExitState& state,
                                uint64_t generation, const ExitStatus& status) {
    state.exited = true;
    if (state.stop_requested) {
        return;
    }

    log(slot_id, status.success() ? LogLevel::Warning : LogLevel::Error,
        "Exited unexpectedly (" + status.describe() + ")");

    ExitHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = exit_handler_;
    }
    if (handler) {
        handler(slot_id, generation, status);
    }
}

} // namespace minerhub
