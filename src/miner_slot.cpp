#include "minerhub/miner_slot.hpp"
#include <algorithm>
#include <cctype>

namespace minerhub {

const char* to_string(SlotMode mode) {
    switch (mode) {
        case SlotMode::Automatic: return "auto";
        case SlotMode::ManualOn:  return "on";
        case SlotMode::ManualOff: return "off";
    }
    return "unknown";
}

const char* to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::Idle:     return "Idle";
        case LifecycleState::Starting: return "Starting";
        case LifecycleState::Running:  return "Running";
        case LifecycleState::Stopping: return "Stopping";
        case LifecycleState::Failed:   return "Failed";
    }
    return "Unknown";
}

std::optional<SlotMode> parse_mode(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "auto" || lower == "automatic") return SlotMode::Automatic;
    if (lower == "on" || lower == "manual_on") return SlotMode::ManualOn;
    if (lower == "off" || lower == "manual_off") return SlotMode::ManualOff;
    return std::nullopt;
}

bool can_transition(LifecycleState from, LifecycleState to) {
    switch (from) {
        case LifecycleState::Idle:
            return to == LifecycleState::Starting;
        case LifecycleState::Failed:
            return to == LifecycleState::Starting;
        case LifecycleState::Starting:
            return to == LifecycleState::Running || to == LifecycleState::Failed;
        case LifecycleState::Running:
            return to == LifecycleState::Stopping || to == LifecycleState::Failed;
        case LifecycleState::Stopping:
            return to == LifecycleState::Idle || to == LifecycleState::Failed;
    }
    return false;
}

} // namespace minerhub
