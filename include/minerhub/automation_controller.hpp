#pragma once

#include "minerhub/config_manager.hpp"
#include "minerhub/decision_engine.hpp"
#include "minerhub/log_sink.hpp"
#include "minerhub/miner_slot.hpp"
#include "minerhub/price_cache.hpp"
#include "minerhub/process_supervisor.hpp"
#include "minerhub/thread_safe_queue.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace minerhub {

struct SlotCommand {
    enum class Type {
        PriceUpdated,
        Start,            // operator start: switches to ManualOn
        Stop,             // operator stop: switches to ManualOff
        SetMode,
        UpdateConfig,
        ProcessExited,
        Tick,
        Shutdown
    };

    Type type = Type::Tick;
    SlotMode mode = SlotMode::Automatic;     // SetMode
    std::optional<MinerConfig> config;       // UpdateConfig
    std::string config_error;                // UpdateConfig, problem found while loading
    uint64_t generation = 0;                 // ProcessExited
    std::optional<ExitStatus> exit;          // ProcessExited
};

// Drives every slot from price updates, operator commands, process exits
// and ticks. Each slot has its own worker thread consuming a command queue,
// so commands for one slot are handled strictly in order and only that
// worker ever changes the slot's lifecycle.
class AutomationController {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    // Called from the slot's worker after every lifecycle transition
    using StateListener = std::function<void(const MinerSlot& slot)>;

    AutomationController(ProcessSupervisor& supervisor, PriceCache& cache,
                         const AutomationConfig& config, std::shared_ptr<LogSink> log,
                         NowFn now = &Clock::now);
    ~AutomationController();

    AutomationController(const AutomationController&) = delete;
    AutomationController& operator=(const AutomationController&) = delete;

    // A config that fails validation still gets a slot, created disabled.
    // `config_error` carries a problem found while loading the file.
    // Returns false for a duplicate id or after shutdown.
    bool add_slot(const MinerConfig& config, const std::string& config_error = {});

    // Stops the slot's miner if needed and forgets the slot
    bool remove_slot(const std::string& slot_id);

    void start();

    // Stops every miner and ends every worker. Returns true when all slots
    // finished in time and no miner process is left running.
    bool shutdown(std::chrono::milliseconds timeout);

    // Commands; false when the slot is unknown or no longer accepting
    bool submit(const std::string& slot_id, SlotCommand command);
    bool request_start(const std::string& slot_id);
    bool request_stop(const std::string& slot_id);
    bool set_mode(const std::string& slot_id, SlotMode mode);
    bool update_config(const std::string& slot_id, const MinerConfig& config,
                       const std::string& config_error = {});

    // PriceUpdated for every slot watching `zone`
    void notify_price(const std::string& zone);

    // Tick for every slot; the internal ticker calls this
    void tick();

    void update_policy(const AutomationConfig& config);

    // Blocks until every submitted command has been handled
    bool wait_idle(std::chrono::milliseconds timeout);

    std::optional<MinerSlot> slot(const std::string& slot_id) const;
    std::vector<MinerSlot> slots() const;

    void set_state_listener(StateListener listener);

private:
    struct SlotWorker {
        MinerSlot slot;                  // owned by the worker thread
        ThreadSafeQueue<SlotCommand> queue;
        std::thread thread;
        bool accepting = true;
    };

    void worker_loop(SlotWorker* worker);
    void handle(MinerSlot& slot, const SlotCommand& command);
    void handle_shutdown(MinerSlot& slot);

    void promote_if_confirmed(MinerSlot& slot, Clock::time_point now);
    void evaluate_and_execute(MinerSlot& slot, Clock::time_point now);
    void execute(MinerSlot& slot, const Intent& intent, Clock::time_point now);
    void execute_start(MinerSlot& slot, const Intent& intent, Clock::time_point now);
    void execute_stop(MinerSlot& slot, const Intent& intent, Clock::time_point now);
    bool transition(MinerSlot& slot, LifecycleState to);

    void apply_config(MinerSlot& slot, const MinerConfig& config, const std::string& config_error);
    void publish(const MinerSlot& slot);
    void finish_command();
    void join_workers();
    void ticker_loop();

    DecisionEngine engine() const;
    AutomationConfig policy() const;
    void log(const std::string& slot_id, LogLevel level, const std::string& text);

    ProcessSupervisor& supervisor_;
    PriceCache& cache_;
    std::shared_ptr<LogSink> log_;
    NowFn now_;

    mutable std::mutex policy_mutex_;
    AutomationConfig config_;
    DecisionEngine engine_;

    std::mutex workers_mutex_;
    std::map<std::string, std::unique_ptr<SlotWorker>> workers_;
    bool started_ = false;
    bool shut_down_ = false;

    mutable std::mutex state_mutex_;
    std::map<std::string, MinerSlot> published_;
    StateListener state_listener_;

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    size_t pending_ = 0;

    std::mutex ticker_mutex_;
    std::condition_variable ticker_cv_;
    bool ticker_stop_ = false;
    std::thread ticker_;
};

} // namespace minerhub
