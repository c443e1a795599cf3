#pragma once

#include "minerhub/config_manager.hpp"
#include "minerhub/miner_slot.hpp"
#include "minerhub/price_cache.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace minerhub {

enum class IntentKind {
    None,
    Start,
    Stop
};

struct Intent {
    IntentKind kind = IntentKind::None;
    std::string reason;         // "price 0.953 < threshold 1.000"
    bool from_price = false;    // decided by the price rule, not by an operator

    bool is_none() const { return kind == IntentKind::None; }

    static Intent none(const std::string& reason = {});
    static Intent start(const std::string& reason, bool from_price);
    static Intent stop(const std::string& reason, bool from_price);
};

const char* to_string(IntentKind kind);

enum class StalePolicy {
    Hold,    // keep a running miner running on stale data
    Stop     // stop a running miner when its price goes stale
};

std::optional<StalePolicy> parse_stale_policy(const std::string& text);

// Pure decision function: slot state + cached price -> intent.
// Holds no state of its own besides the policy settings.
class DecisionEngine {
public:
    using Clock = std::chrono::steady_clock;

    explicit DecisionEngine(const AutomationConfig& config);

    // Automatic-mode evaluation. Returns None for manual modes, disabled
    // slots and slots with a transition in flight.
    Intent evaluate(const MinerSlot& slot, const std::optional<PriceSample>& sample,
                    Clock::time_point now) const;

    // Intent for a mode change, emitted once per transition. `slot.mode`
    // holds the new mode.
    Intent on_mode_change(const MinerSlot& slot, SlotMode previous,
                          const std::optional<PriceSample>& sample,
                          Clock::time_point now) const;

    void update_config(const AutomationConfig& config);
    StalePolicy stale_policy() const { return stale_policy_; }

private:
    StalePolicy stale_policy_;
};

} // namespace minerhub
