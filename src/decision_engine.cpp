#include "minerhub/decision_engine.hpp"
#include <iomanip>
#include <sstream>

namespace minerhub {

namespace {

std::string describe(const char* label, double price, const char* op, double bound) {
    std::ostringstream oss;
    oss << label << " " << std::fixed << std::setprecision(3) << price
        << " " << op << " " << bound;
    return oss.str();
}

} // namespace

Intent Intent::none(const std::string& reason) {
    Intent intent;
    intent.reason = reason;
    return intent;
}

Intent Intent::start(const std::string& reason, bool from_price) {
    Intent intent;
    intent.kind = IntentKind::Start;
    intent.reason = reason;
    intent.from_price = from_price;
    return intent;
}

Intent Intent::stop(const std::string& reason, bool from_price) {
    Intent intent;
    intent.kind = IntentKind::Stop;
    intent.reason = reason;
    intent.from_price = from_price;
    return intent;
}

const char* to_string(IntentKind kind) {
    switch (kind) {
        case IntentKind::None:  return "none";
        case IntentKind::Start: return "start";
        case IntentKind::Stop:  return "stop";
    }
    return "unknown";
}

std::optional<StalePolicy> parse_stale_policy(const std::string& text) {
    if (text == "hold") return StalePolicy::Hold;
    if (text == "stop") return StalePolicy::Stop;
    return std::nullopt;
}

DecisionEngine::DecisionEngine(const AutomationConfig& config)
    : stale_policy_(parse_stale_policy(config.stale_policy).value_or(StalePolicy::Hold))
{
}

void DecisionEngine::update_config(const AutomationConfig& config) {
    stale_policy_ = parse_stale_policy(config.stale_policy).value_or(StalePolicy::Hold);
}

Intent DecisionEngine::evaluate(const MinerSlot& slot, const std::optional<PriceSample>& sample,
                                Clock::time_point now) const {
    if (slot.disabled || slot.mode != SlotMode::Automatic) {
        return Intent::none();
    }
    if (slot.in_transition()) {
        return Intent::none("transition in flight");
    }
    if (slot.lifecycle == LifecycleState::Failed && slot.fatal) {
        return Intent::none("manual intervention required");
    }
    if (!sample) {
        return Intent::none("no price yet");
    }

    const double price = sample->value;
    const double threshold = slot.config.price_threshold;
    const double band = slot.config.hysteresis_band;

    if (sample->stale) {
        if (slot.lifecycle == LifecycleState::Running && stale_policy_ == StalePolicy::Stop) {
            return Intent::stop("price for " + sample->zone + " is stale", true);
        }
        return Intent::none("price is stale");
    }

    if (slot.lifecycle == LifecycleState::Running) {
        if (price > threshold + band) {
            return Intent::stop(describe("price", price, ">", threshold + band), true);
        }
        return Intent::none();
    }

    // Idle or Failed
    if (slot.lifecycle == LifecycleState::Failed && now < slot.cool_down_until) {
        return Intent::none("cooling down after failure");
    }

    const double start_below = slot.stop_latched ? threshold - band : threshold;
    if (price < start_below) {
        return Intent::start(describe("price", price, "<", start_below), true);
    }
    return Intent::none();
}

Intent DecisionEngine::on_mode_change(const MinerSlot& slot, SlotMode previous,
                                      const std::optional<PriceSample>& sample,
                                      Clock::time_point now) const {
    if (slot.mode == previous || slot.disabled) {
        return Intent::none();
    }

    switch (slot.mode) {
        case SlotMode::ManualOn:
            if (slot.lifecycle == LifecycleState::Idle ||
                (slot.lifecycle == LifecycleState::Failed && !slot.fatal)) {
                return Intent::start("manual start", false);
            }
            return Intent::none();

        case SlotMode::ManualOff:
            if (slot.lifecycle == LifecycleState::Running) {
                return Intent::stop("manual stop", false);
            }
            return Intent::none();

        case SlotMode::Automatic:
            return evaluate(slot, sample, now);
    }
    return Intent::none();
}

} // namespace minerhub
