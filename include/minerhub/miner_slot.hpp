#pragma once

#include "minerhub/config_manager.hpp"
#include "minerhub/process_launcher.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace minerhub {

enum class SlotMode {
    Automatic,
    ManualOn,
    ManualOff
};

enum class LifecycleState {
    Idle,
    Starting,
    Running,
    Stopping,
    Failed
};

const char* to_string(SlotMode mode);
const char* to_string(LifecycleState state);

// "auto" / "automatic", "on", "off"
std::optional<SlotMode> parse_mode(const std::string& text);

// Idle/Failed -> Starting -> Running -> Stopping -> Idle, plus the failure
// edges Starting/Running/Stopping -> Failed
bool can_transition(LifecycleState from, LifecycleState to);

struct MinerSlot {
    using Clock = std::chrono::steady_clock;

    MinerConfig config;
    SlotMode mode = SlotMode::Automatic;
    LifecycleState lifecycle = LifecycleState::Idle;

    Clock::time_point last_decision_at{};
    Clock::time_point started_at{};
    Clock::time_point cool_down_until{};

    bool disabled = false;         // invalid or disabled config, never evaluated
    bool stop_latched = false;     // last stop was price-driven
    bool fatal = false;            // process survived SIGKILL
    std::string last_error;
    std::optional<ExitStatus> last_exit;
    uint64_t generation = 0;       // launch generation of the current process

    const std::string& id() const { return config.id; }
    bool is_active() const {
        return lifecycle == LifecycleState::Starting || lifecycle == LifecycleState::Running;
    }
    bool in_transition() const {
        return lifecycle == LifecycleState::Starting || lifecycle == LifecycleState::Stopping;
    }
};

} // namespace minerhub
