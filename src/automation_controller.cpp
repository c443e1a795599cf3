#include "minerhub/automation_controller.hpp"

namespace minerhub {

AutomationController::AutomationController(ProcessSupervisor& supervisor, PriceCache& cache,
                                           const AutomationConfig& config,
                                           std::shared_ptr<LogSink> log, NowFn now)
    : supervisor_(supervisor)
    , cache_(cache)
    , log_(std::move(log))
    , now_(std::move(now))
    , config_(config)
    , engine_(config)
{
    supervisor_.set_exit_handler(
        [this](const std::string& slot_id, uint64_t generation, const ExitStatus& status) {
            SlotCommand command;
            command.type = SlotCommand::Type::ProcessExited;
            command.generation = generation;
            command.exit = status;
            submit(slot_id, std::move(command));
        });
}

AutomationController::~AutomationController() {
    bool needs_shutdown = false;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        needs_shutdown = !shut_down_;
    }
    if (needs_shutdown) {
        shutdown(std::chrono::minutes(1));
    }

    join_workers();
    supervisor_.set_exit_handler(nullptr);
}

// Joined outside workers_mutex_: a worker may be waiting on a process whose
// exit callback needs that mutex to submit
void AutomationController::join_workers() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto& [slot_id, worker] : workers_) {
            if (worker->thread.joinable()) {
                threads.push_back(std::move(worker->thread));
            }
        }
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

void AutomationController::log(const std::string& slot_id, LogLevel level, const std::string& text) {
    log_->write(make_log_line(slot_id, level, text));
}

DecisionEngine AutomationController::engine() const {
    std::lock_guard<std::mutex> lock(policy_mutex_);
    return engine_;
}

AutomationConfig AutomationController::policy() const {
    std::lock_guard<std::mutex> lock(policy_mutex_);
    return config_;
}

void AutomationController::update_policy(const AutomationConfig& config) {
    {
        std::lock_guard<std::mutex> lock(policy_mutex_);
        config_ = config;
        engine_.update_config(config);
    }
    ticker_cv_.notify_all();
}

void AutomationController::set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_listener_ = std::move(listener);
}

void AutomationController::apply_config(MinerSlot& slot, const MinerConfig& config,
                                        const std::string& config_error) {
    slot.config = config;
    std::string error = config_error;
    if (error.empty()) {
        config.validate(error);
    }

    if (!error.empty()) {
        slot.disabled = true;
        slot.last_error = error;
        log(config.id, LogLevel::Error, "Invalid configuration, slot disabled: " + error);
    } else if (!config.enabled) {
        slot.disabled = true;
        log(config.id, LogLevel::Info, "Disabled in configuration");
    } else {
        slot.disabled = false;
    }
}

bool AutomationController::add_slot(const MinerConfig& config, const std::string& config_error) {
    auto worker = std::make_unique<SlotWorker>();
    apply_config(worker->slot, config, config_error);

    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (shut_down_ || workers_.count(config.id) > 0) {
        log(config.id, LogLevel::Error, "Slot not added: duplicate id or controller shut down");
        return false;
    }

    publish(worker->slot);
    SlotWorker* raw = worker.get();
    workers_[config.id] = std::move(worker);
    if (started_) {
        raw->thread = std::thread(&AutomationController::worker_loop, this, raw);
    }
    return true;
}

bool AutomationController::remove_slot(const std::string& slot_id) {
    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        auto it = workers_.find(slot_id);
        if (it == workers_.end() || !it->second->accepting) {
            return false;
        }
        SlotWorker& worker = *it->second;
        worker.accepting = false;
        if (started_) {
            {
                std::lock_guard<std::mutex> idle_lock(idle_mutex_);
                ++pending_;
            }
            SlotCommand command;
            command.type = SlotCommand::Type::Shutdown;
            worker.queue.push(std::move(command));
            thread = std::move(worker.thread);
        }
    }

    if (thread.joinable()) {
        thread.join();
    }

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.erase(slot_id);
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        published_.erase(slot_id);
    }
    log(slot_id, LogLevel::Info, "Slot removed");
    return true;
}

void AutomationController::start() {
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (started_ || shut_down_) {
            return;
        }
        started_ = true;
        for (auto& [slot_id, worker] : workers_) {
            worker->thread = std::thread(&AutomationController::worker_loop, this, worker.get());
        }
    }

    if (policy().tick_interval_ms > 0) {
        ticker_ = std::thread(&AutomationController::ticker_loop, this);
    }
}

bool AutomationController::shutdown(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(ticker_mutex_);
        ticker_stop_ = true;
    }
    ticker_cv_.notify_all();
    if (ticker_.joinable()) {
        ticker_.join();
    }

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        shut_down_ = true;
        if (!started_) {
            // Nothing was ever launched
            for (auto& [slot_id, worker] : workers_) {
                worker->accepting = false;
            }
            return supervisor_.running_slots().empty();
        }
        for (auto& [slot_id, worker] : workers_) {
            if (!worker->accepting) {
                continue;
            }
            worker->accepting = false;
            {
                std::lock_guard<std::mutex> idle_lock(idle_mutex_);
                ++pending_;
            }
            SlotCommand command;
            command.type = SlotCommand::Type::Shutdown;
            worker->queue.push(std::move(command));
        }
    }

    log("", LogLevel::Info, "Shutting down all slots");
    const bool finished = wait_idle(timeout);

    if (finished) {
        join_workers();
    } else {
        log("", LogLevel::Error, "Shutdown did not finish within " +
            std::to_string(timeout.count()) + " ms");
    }

    bool all_stopped = finished && supervisor_.running_slots().empty();
    for (const auto& slot : slots()) {
        if (slot.is_active()) {
            all_stopped = false;
        }
    }
    log("", all_stopped ? LogLevel::Info : LogLevel::Error,
        all_stopped ? "Shutdown complete" : "Shutdown incomplete: miner processes may still be running");
    return all_stopped;
}

bool AutomationController::submit(const std::string& slot_id, SlotCommand command) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.find(slot_id);
    if (it == workers_.end() || !it->second->accepting) {
        return false;
    }
    {
        std::lock_guard<std::mutex> idle_lock(idle_mutex_);
        ++pending_;
    }
    it->second->queue.push(std::move(command));
    return true;
}

bool AutomationController::request_start(const std::string& slot_id) {
    SlotCommand command;
    command.type = SlotCommand::Type::Start;
    return submit(slot_id, std::move(command));
}

bool AutomationController::request_stop(const std::string& slot_id) {
    SlotCommand command;
    command.type = SlotCommand::Type::Stop;
    return submit(slot_id, std::move(command));
}

bool AutomationController::set_mode(const std::string& slot_id, SlotMode mode) {
    SlotCommand command;
    command.type = SlotCommand::Type::SetMode;
    command.mode = mode;
    return submit(slot_id, std::move(command));
}

bool AutomationController::update_config(const std::string& slot_id, const MinerConfig& config,
                                         const std::string& config_error) {
    SlotCommand command;
    command.type = SlotCommand::Type::UpdateConfig;
    command.config = config;
    command.config_error = config_error;
    return submit(slot_id, std::move(command));
}

void AutomationController::notify_price(const std::string& zone) {
    std::vector<std::string> targets;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [slot_id, slot] : published_) {
            if (slot.config.zone == zone) {
                targets.push_back(slot_id);
            }
        }
    }
    for (const auto& slot_id : targets) {
        SlotCommand command;
        command.type = SlotCommand::Type::PriceUpdated;
        submit(slot_id, std::move(command));
    }
}

void AutomationController::tick() {
    std::vector<std::string> targets;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (const auto& [slot_id, worker] : workers_) {
            targets.push_back(slot_id);
        }
    }
    for (const auto& slot_id : targets) {
        SlotCommand command;
        command.type = SlotCommand::Type::Tick;
        submit(slot_id, std::move(command));
    }
}

bool AutomationController::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}

std::optional<MinerSlot> AutomationController::slot(const std::string& slot_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = published_.find(slot_id);
    if (it == published_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MinerSlot> AutomationController::slots() const {
    std::vector<MinerSlot> result;
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto& [slot_id, slot] : published_) {
        result.push_back(slot);
    }
    return result;
}

void AutomationController::publish(const MinerSlot& slot) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    published_[slot.id()] = slot;
}

void AutomationController::finish_command() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        --pending_;
    }
    idle_cv_.notify_all();
}

void AutomationController::ticker_loop() {
    std::unique_lock<std::mutex> lock(ticker_mutex_);
    while (!ticker_stop_) {
        const int interval_ms = policy().tick_interval_ms;
        const auto interval = std::chrono::milliseconds(interval_ms > 0 ? interval_ms : 1000);
        if (ticker_cv_.wait_for(lock, interval, [this] { return ticker_stop_; })) {
            break;
        }
        lock.unlock();
        tick();
        lock.lock();
    }
}

void AutomationController::worker_loop(SlotWorker* worker) {
    DebugLogger::log("controller: worker started for ", worker->slot.id());
    while (true) {
        SlotCommand command = worker->queue.wait_and_pop();
        const bool last = command.type == SlotCommand::Type::Shutdown;

        if (last) {
            handle_shutdown(worker->slot);
        } else {
            handle(worker->slot, command);
        }
        publish(worker->slot);
        finish_command();

        if (last) {
            break;
        }
    }
    DebugLogger::log("controller: worker stopped for ", worker->slot.id());
}

bool AutomationController::transition(MinerSlot& slot, LifecycleState to) {
    if (!can_transition(slot.lifecycle, to)) {
        log(slot.id(), LogLevel::Error, std::string("Rejected transition ") +
            to_string(slot.lifecycle) + " -> " + to_string(to));
        return false;
    }
    DebugLogger::log("controller: ", slot.id(), " ", to_string(slot.lifecycle), " -> ", to_string(to));
    slot.lifecycle = to;

    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        listener = state_listener_;
    }
    if (listener) {
        listener(slot);
    }
    return true;
}

void AutomationController::promote_if_confirmed(MinerSlot& slot, Clock::time_point now) {
    if (slot.lifecycle != LifecycleState::Starting) {
        return;
    }
    const auto grace = std::chrono::seconds(policy().startup_grace_seconds);
    if (now - slot.started_at < grace) {
        return;
    }
    // A dead process is left to its pending ProcessExited command
    if (!supervisor_.is_running(slot.id())) {
        return;
    }
    if (transition(slot, LifecycleState::Running)) {
        log(slot.id(), LogLevel::Info, "Running");
    }

    if (slot.lifecycle != LifecycleState::Running) {
        return;
    }
    // A stop or disable arrived while the start was still being confirmed
    if (slot.disabled) {
        execute_stop(slot, Intent::stop("slot disabled", false), now);
    } else if (slot.mode == SlotMode::ManualOff) {
        execute_stop(slot, Intent::stop("manual stop", false), now);
    }
}

void AutomationController::evaluate_and_execute(MinerSlot& slot, Clock::time_point now) {
    if (slot.mode != SlotMode::Automatic || slot.disabled) {
        return;
    }
    const Intent intent = engine().evaluate(slot, cache_.get(slot.config.zone), now);
    execute(slot, intent, now);
}

void AutomationController::execute(MinerSlot& slot, const Intent& intent, Clock::time_point now) {
    switch (intent.kind) {
        case IntentKind::Start:
            execute_start(slot, intent, now);
            break;
        case IntentKind::Stop:
            execute_stop(slot, intent, now);
            break;
        case IntentKind::None:
            break;
    }
}

void AutomationController::execute_start(MinerSlot& slot, const Intent& intent, Clock::time_point now) {
    if (!transition(slot, LifecycleState::Starting)) {
        return;
    }
    slot.last_decision_at = now;
    log(slot.id(), LogLevel::Info, "Starting: " + intent.reason);

    const AutomationConfig config = policy();
    LaunchResult result = supervisor_.launch(slot.id(), slot.config);
    if (!result.ok) {
        transition(slot, LifecycleState::Failed);
        slot.last_error = result.error;
        slot.cool_down_until = now + std::chrono::seconds(config.cool_down_seconds);
        log(slot.id(), LogLevel::Error, "Start failed: " + result.error +
            "; no automatic retry for " + std::to_string(config.cool_down_seconds) + "s");
        return;
    }

    slot.generation = result.generation;
    slot.started_at = now;
    slot.stop_latched = false;
    slot.fatal = false;
    slot.last_error.clear();
    slot.last_exit.reset();

    if (config.startup_grace_seconds == 0 && transition(slot, LifecycleState::Running)) {
        log(slot.id(), LogLevel::Info, "Running");
    }
}

void AutomationController::execute_stop(MinerSlot& slot, const Intent& intent, Clock::time_point now) {
    if (!transition(slot, LifecycleState::Stopping)) {
        return;
    }
    slot.last_decision_at = now;
    log(slot.id(), LogLevel::Info, "Stopping: " + intent.reason);

    TerminateResult result = supervisor_.terminate(slot.id());
    if (!result.confirmed()) {
        transition(slot, LifecycleState::Failed);
        slot.fatal = true;
        slot.last_error = result.error;
        log(slot.id(), LogLevel::Error, "Stop failed: " + result.error);
        return;
    }

    transition(slot, LifecycleState::Idle);
    slot.stop_latched = intent.from_price;
    slot.last_exit = result.exit;
    log(slot.id(), LogLevel::Info, std::string("Stopped (") + to_string(result.outcome) + ")");
}

void AutomationController::handle(MinerSlot& slot, const SlotCommand& command) {
    const auto now = now_();
    promote_if_confirmed(slot, now);

    switch (command.type) {
        case SlotCommand::Type::PriceUpdated:
        case SlotCommand::Type::Tick:
            evaluate_and_execute(slot, now);
            break;

        case SlotCommand::Type::Start: {
            slot.mode = SlotMode::ManualOn;
            if (slot.disabled) {
                log(slot.id(), LogLevel::Warning, "Cannot start a disabled slot");
            } else if (slot.lifecycle == LifecycleState::Failed && slot.fatal) {
                log(slot.id(), LogLevel::Warning, "Previous process is still alive, stop it first");
            } else if (slot.lifecycle == LifecycleState::Idle || slot.lifecycle == LifecycleState::Failed) {
                execute_start(slot, Intent::start("operator start", false), now);
            } else {
                log(slot.id(), LogLevel::Info, std::string("Already ") + to_string(slot.lifecycle));
            }
            break;
        }

        case SlotCommand::Type::Stop: {
            slot.mode = SlotMode::ManualOff;
            if (slot.lifecycle == LifecycleState::Running) {
                execute_stop(slot, Intent::stop("operator stop", false), now);
            } else if (slot.lifecycle == LifecycleState::Failed && slot.fatal) {
                TerminateResult result = supervisor_.terminate(slot.id());
                if (result.confirmed()) {
                    slot.fatal = false;
                    log(slot.id(), LogLevel::Info, "Stuck process finally stopped");
                } else {
                    log(slot.id(), LogLevel::Error, "Stop failed again: " + result.error);
                }
            } else if (slot.lifecycle == LifecycleState::Starting) {
                log(slot.id(), LogLevel::Info, "Stop deferred until the start is confirmed");
            }
            break;
        }

        case SlotCommand::Type::SetMode: {
            const SlotMode previous = slot.mode;
            slot.mode = command.mode;
            if (previous != slot.mode) {
                log(slot.id(), LogLevel::Info, std::string("Mode ") + to_string(previous) +
                    " -> " + to_string(slot.mode));
            }
            const Intent intent = engine().on_mode_change(slot, previous, cache_.get(slot.config.zone), now);
            execute(slot, intent, now);
            break;
        }

        case SlotCommand::Type::UpdateConfig: {
            if (!command.config) {
                break;
            }
            const std::string zone = slot.config.zone;
            MinerConfig config = *command.config;
            if (slot.is_active() && config.zone != zone) {
                // Zone is fixed for the life of the slot
                log(slot.id(), LogLevel::Warning, "Zone change to " + config.zone +
                    " ignored while running");
                config.zone = zone;
            }
            apply_config(slot, config, command.config_error);
            log(slot.id(), LogLevel::Info, "Configuration updated");

            if (slot.disabled && slot.lifecycle == LifecycleState::Running) {
                execute_stop(slot, Intent::stop("slot disabled", false), now);
            } else if (slot.disabled && slot.lifecycle == LifecycleState::Starting) {
                log(slot.id(), LogLevel::Info, "Stop deferred until the start is confirmed");
            } else {
                evaluate_and_execute(slot, now);
            }
            break;
        }

        case SlotCommand::Type::ProcessExited: {
            if (command.generation != slot.generation || !slot.is_active() || !command.exit) {
                DebugLogger::log("controller: ignoring exit of generation ", command.generation,
                                 " for ", slot.id());
                break;
            }
            const bool during_startup = slot.lifecycle == LifecycleState::Starting;
            const AutomationConfig config = policy();
            if (transition(slot, LifecycleState::Failed)) {
                slot.last_exit = command.exit;
                slot.last_error = (during_startup ? "failed during startup: " : "exited unexpectedly: ") +
                                  command.exit->describe();
                slot.cool_down_until = now + std::chrono::seconds(config.cool_down_seconds);
                log(slot.id(), LogLevel::Error, slot.last_error);
            }
            evaluate_and_execute(slot, now);
            break;
        }

        case SlotCommand::Type::Shutdown:
            handle_shutdown(slot);
            break;
    }
}

void AutomationController::handle_shutdown(MinerSlot& slot) {
    const auto now = now_();

    // A miner still inside its startup window is alive and gets stopped too
    if (slot.lifecycle == LifecycleState::Starting && supervisor_.is_running(slot.id())) {
        transition(slot, LifecycleState::Running);
    }

    if (slot.lifecycle == LifecycleState::Running) {
        execute_stop(slot, Intent::stop("shutdown", false), now);
    } else if (slot.lifecycle == LifecycleState::Failed && slot.fatal) {
        TerminateResult result = supervisor_.terminate(slot.id());
        if (result.confirmed()) {
            slot.fatal = false;
        }
    } else if (slot.lifecycle == LifecycleState::Starting) {
        // Process already gone; its exit notification will not be handled any more
        transition(slot, LifecycleState::Failed);
        slot.last_error = "exited during startup";
    }
}

} // namespace minerhub
