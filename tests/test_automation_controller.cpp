#include <catch2/catch_test_macros.hpp>
#include "minerhub/automation_controller.hpp"
#include "fakes/fake_clock.hpp"
#include "fakes/fake_process_launcher.hpp"
#include "fakes/memory_log_sink.hpp"
#include <random>

using namespace minerhub;
using minerhub::testing::FakeClock;
using minerhub::testing::FakeProcessLauncher;
using minerhub::testing::MemoryLogSink;
using namespace std::chrono_literals;

namespace {

MinerConfig make_miner(const std::string& id, double threshold, double band) {
    MinerConfig miner;
    miner.id = id;
    miner.kind = "custom";
    miner.executable = "/bin/sh";
    miner.zone = "SE3";
    miner.price_threshold = threshold;
    miner.hysteresis_band = band;
    return miner;
}

AutomationConfig make_policy(int startup_grace_seconds = 0) {
    AutomationConfig config;
    config.stale_policy = "hold";
    config.cool_down_seconds = 300;
    config.startup_grace_seconds = startup_grace_seconds;
    config.tick_interval_ms = 0;
    return config;
}

struct ControllerRig {
    explicit ControllerRig(const AutomationConfig& policy = make_policy()) {
        SupervisorConfig supervisor_config;
        supervisor_config.grace_timeout_ms = 50;
        supervisor_config.kill_timeout_ms = 50;
        supervisor = std::make_unique<ProcessSupervisor>(launcher, log, supervisor_config);
        controller = std::make_unique<AutomationController>(
            *supervisor, cache, policy, log, [this] { return clock.now(); });
        controller->set_state_listener([this](const MinerSlot& slot) {
            std::lock_guard<std::mutex> lock(transitions_mutex);
            transitions.push_back(slot.lifecycle);
        });
        cache.set_listener([this](const PriceSample& sample) {
            controller->notify_price(sample.zone);
        });
    }

    ~ControllerRig() {
        cache.set_listener(nullptr);
        controller.reset();
    }

    void price(double value, const std::string& zone = "SE3") {
        PriceSample sample;
        sample.value = value;
        sample.observed_at = base_time + std::chrono::seconds(++samples);
        cache.put(zone, sample);
        settle();
    }

    void settle() {
        REQUIRE(controller->wait_idle(5s));
    }

    LifecycleState state(const std::string& id = "rig") const {
        auto slot = controller->slot(id);
        REQUIRE(slot.has_value());
        return slot->lifecycle;
    }

    std::vector<LifecycleState> recorded() {
        std::lock_guard<std::mutex> lock(transitions_mutex);
        return transitions;
    }

    FakeClock clock;
    FakeProcessLauncher launcher;
    std::shared_ptr<MemoryLogSink> log = std::make_shared<MemoryLogSink>();
    PriceCache cache;
    std::unique_ptr<ProcessSupervisor> supervisor;
    std::unique_ptr<AutomationController> controller;

    std::mutex transitions_mutex;
    std::vector<LifecycleState> transitions;

    std::chrono::system_clock::time_point base_time = std::chrono::system_clock::now();
    int samples = 0;
};

} // namespace

TEST_CASE("SE3 price trace with hysteresis and startup confirmation", "[controller][regression]") {
    ControllerRig rig(make_policy(10));
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.05)));
    rig.controller->start();

    rig.price(1.20);
    REQUIRE(rig.state() == LifecycleState::Idle);

    rig.clock.advance(5s);
    rig.price(1.05);
    REQUIRE(rig.state() == LifecycleState::Idle);
    REQUIRE(rig.launcher.launch_count() == 0);

    rig.clock.advance(5s);
    rig.price(0.95);
    REQUIRE(rig.state() == LifecycleState::Starting);
    REQUIRE(rig.launcher.launch_count() == 1);

    // Start still being confirmed: nothing may be issued
    rig.clock.advance(5s);
    rig.price(1.10);
    REQUIRE(rig.state() == LifecycleState::Starting);
    REQUIRE(rig.launcher.process(0)->term_signals() == 0);

    rig.clock.advance(5s);
    rig.price(1.30);
    REQUIRE(rig.state() == LifecycleState::Idle);
    REQUIRE(rig.launcher.launch_count() == 1);
    REQUIRE(rig.launcher.process(0)->term_signals() == 1);
    REQUIRE_FALSE(rig.launcher.process(0)->is_alive());

    const std::vector<LifecycleState> expected{
        LifecycleState::Starting, LifecycleState::Running,
        LifecycleState::Stopping, LifecycleState::Idle};
    REQUIRE(rig.recorded() == expected);

    SECTION("restart after a price stop needs the lower bound") {
        rig.clock.advance(5s);
        rig.price(0.97);
        REQUIRE(rig.state() == LifecycleState::Idle);

        rig.clock.advance(5s);
        rig.price(0.94);
        REQUIRE(rig.state() == LifecycleState::Starting);
        REQUIRE(rig.launcher.launch_count() == 2);
    }
}

TEST_CASE("Launch failure leaves the slot Failed and respects the cool-down", "[controller][failure]") {
    ControllerRig rig;
    auto miner = make_miner("rig", 1.00, 0.05);
    miner.executable = "/nonexistent/bin/gminer";
    REQUIRE(rig.controller->add_slot(miner));
    rig.controller->start();

    rig.price(0.50);
    auto slot = rig.controller->slot("rig");
    REQUIRE(slot->lifecycle == LifecycleState::Failed);
    REQUIRE(slot->last_error.find("not found") != std::string::npos);
    REQUIRE(rig.supervisor->launch_attempts() == 1);
    REQUIRE(rig.launcher.launch_count() == 0);
    REQUIRE(rig.supervisor->running_slots().empty());

    for (int cycle = 0; cycle < 3; ++cycle) {
        rig.clock.advance(10s);
        rig.controller->tick();
        rig.settle();
        rig.price(0.40);
    }
    REQUIRE(rig.state() == LifecycleState::Failed);
    REQUIRE(rig.supervisor->launch_attempts() == 1);

    SECTION("automatic retry once the cool-down has passed") {
        rig.clock.advance(301s);
        rig.controller->tick();
        rig.settle();
        REQUIRE(rig.supervisor->launch_attempts() == 2);
        REQUIRE(rig.state() == LifecycleState::Failed);
    }

    SECTION("operator start bypasses the cool-down") {
        REQUIRE(rig.controller->request_start("rig"));
        rig.settle();
        REQUIRE(rig.supervisor->launch_attempts() == 2);
    }
}

TEST_CASE("Spawn error from the launcher is a failed start", "[controller][failure]") {
    ControllerRig rig;
    rig.launcher.fail_with = "cannot execute /bin/sh: Exec format error";
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();

    rig.price(0.50);
    auto slot = rig.controller->slot("rig");
    REQUIRE(slot->lifecycle == LifecycleState::Failed);
    REQUIRE(slot->last_error == "cannot execute /bin/sh: Exec format error");
    REQUIRE(rig.launcher.alive_count() == 0);
}

TEST_CASE("Unexpected exit marks the slot Failed with its exit status", "[controller][failure]") {
    ControllerRig rig;
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();

    rig.price(0.50);
    REQUIRE(rig.state() == LifecycleState::Running);

    rig.launcher.process(0)->exit_with_code(3);
    rig.settle();

    auto slot = rig.controller->slot("rig");
    REQUIRE(slot->lifecycle == LifecycleState::Failed);
    REQUIRE(slot->last_exit.has_value());
    REQUIRE(slot->last_exit->code == 3);
    REQUIRE(slot->last_error.find("exit code 3") != std::string::npos);

    // Price still favourable but the cool-down holds
    rig.clock.advance(60s);
    rig.controller->tick();
    rig.settle();
    REQUIRE(rig.launcher.launch_count() == 1);

    rig.clock.advance(241s);
    rig.controller->tick();
    rig.settle();
    REQUIRE(rig.launcher.launch_count() == 2);
    REQUIRE(rig.state() == LifecycleState::Running);
}

TEST_CASE("Exit during the startup window is a failed start", "[controller][failure]") {
    ControllerRig rig(make_policy(10));
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();

    rig.price(0.50);
    REQUIRE(rig.state() == LifecycleState::Starting);

    rig.launcher.process(0)->exit_with_code(1);
    rig.settle();

    auto slot = rig.controller->slot("rig");
    REQUIRE(slot->lifecycle == LifecycleState::Failed);
    REQUIRE(slot->last_error.find("during startup") != std::string::npos);
}

TEST_CASE("Exit notifications from an older launch are ignored", "[controller]") {
    ControllerRig rig;
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();

    rig.price(0.50);
    const uint64_t generation = rig.controller->slot("rig")->generation;

    SlotCommand stale_exit;
    stale_exit.type = SlotCommand::Type::ProcessExited;
    stale_exit.generation = generation - 1;
    stale_exit.exit = ExitStatus{};
    REQUIRE(rig.controller->submit("rig", stale_exit));
    rig.settle();

    REQUIRE(rig.state() == LifecycleState::Running);
}

TEST_CASE("ManualOn starts exactly once and overrides the price", "[controller][manual]") {
    ControllerRig rig;
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.05)));
    rig.controller->start();

    rig.price(2.00);
    REQUIRE(rig.state() == LifecycleState::Idle);

    REQUIRE(rig.controller->set_mode("rig", SlotMode::ManualOn));
    rig.settle();
    REQUIRE(rig.state() == LifecycleState::Running);
    REQUIRE(rig.launcher.launch_count() == 1);

    rig.price(3.00);
    rig.price(5.00);
    rig.controller->tick();
    rig.settle();
    REQUIRE(rig.state() == LifecycleState::Running);

    REQUIRE(rig.controller->set_mode("rig", SlotMode::ManualOn));
    rig.settle();
    REQUIRE(rig.launcher.launch_count() == 1);

    SECTION("ManualOff stops and suppresses automatic starts") {
        REQUIRE(rig.controller->request_stop("rig"));
        rig.settle();
        REQUIRE(rig.state() == LifecycleState::Idle);
        REQUIRE(rig.controller->slot("rig")->mode == SlotMode::ManualOff);

        rig.price(0.10);
        REQUIRE(rig.state() == LifecycleState::Idle);
        REQUIRE(rig.launcher.launch_count() == 1);

        REQUIRE(rig.controller->set_mode("rig", SlotMode::Automatic));
        rig.settle();
        REQUIRE(rig.state() == LifecycleState::Running);
        REQUIRE(rig.launcher.launch_count() == 2);
    }

    SECTION("back to automatic applies the price immediately") {
        REQUIRE(rig.controller->set_mode("rig", SlotMode::Automatic));
        rig.settle();
        REQUIRE(rig.state() == LifecycleState::Idle);
    }
}

TEST_CASE("Operator stop during the startup window waits for confirmation", "[controller][manual]") {
    ControllerRig rig(make_policy(10));
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();

    rig.price(0.50);
    REQUIRE(rig.state() == LifecycleState::Starting);

    REQUIRE(rig.controller->request_stop("rig"));
    rig.settle();
    REQUIRE(rig.state() == LifecycleState::Starting);

    rig.clock.advance(10s);
    rig.controller->tick();
    rig.settle();
    REQUIRE(rig.state() == LifecycleState::Idle);
    REQUIRE_FALSE(rig.launcher.process(0)->is_alive());
}

TEST_CASE("Stale prices never start and hold a running miner by default", "[controller][stale]") {
    SECTION("hold policy") {
        ControllerRig rig;
        REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
        REQUIRE(rig.controller->add_slot(make_miner("idle", 0.10, 0.0)));
        rig.controller->start();

        rig.price(0.50);
        REQUIRE(rig.state("rig") == LifecycleState::Running);
        REQUIRE(rig.state("idle") == LifecycleState::Idle);

        REQUIRE(rig.cache.mark_stale("SE3"));
        rig.settle();
        REQUIRE(rig.state("rig") == LifecycleState::Running);

        // Stale value below the second slot's threshold must not start it
        rig.controller->update_config("idle", make_miner("idle", 0.90, 0.0));
        rig.controller->tick();
        rig.settle();
        REQUIRE(rig.state("idle") == LifecycleState::Idle);
        REQUIRE(rig.launcher.launch_count() == 1);
    }

    SECTION("stop policy") {
        auto policy = make_policy();
        policy.stale_policy = "stop";
        ControllerRig rig(policy);
        REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
        rig.controller->start();

        rig.price(0.50);
        REQUIRE(rig.state() == LifecycleState::Running);

        REQUIRE(rig.cache.mark_stale("SE3"));
        rig.settle();
        REQUIRE(rig.state() == LifecycleState::Idle);
    }
}

TEST_CASE("No price sample means no action", "[controller]") {
    ControllerRig rig;
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();

    rig.controller->tick();
    rig.settle();
    REQUIRE(rig.state() == LifecycleState::Idle);
    REQUIRE(rig.supervisor->launch_attempts() == 0);
}

TEST_CASE("Invalid configuration creates a disabled slot", "[controller][config]") {
    ControllerRig rig;
    auto miner = make_miner("rig", 1.00, 0.0);
    miner.zone = "DK1";
    REQUIRE(rig.controller->add_slot(miner));
    REQUIRE_FALSE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();

    auto slot = rig.controller->slot("rig");
    REQUIRE(slot->disabled);
    REQUIRE(slot->last_error.find("DK1") != std::string::npos);

    rig.price(0.10, "DK1");
    REQUIRE(rig.controller->request_start("rig"));
    rig.settle();
    REQUIRE(rig.state() == LifecycleState::Idle);
    REQUIRE(rig.supervisor->launch_attempts() == 0);
}

TEST_CASE("Disabling a running slot stops its miner", "[controller][config]") {
    ControllerRig rig;
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();

    rig.price(0.50);
    REQUIRE(rig.state() == LifecycleState::Running);

    auto miner = make_miner("rig", 1.00, 0.0);
    miner.enabled = false;
    REQUIRE(rig.controller->update_config("rig", miner));
    rig.settle();
    REQUIRE(rig.state() == LifecycleState::Idle);
    REQUIRE(rig.controller->slot("rig")->disabled);

    rig.price(0.20);
    REQUIRE(rig.launcher.launch_count() == 1);
}

TEST_CASE("Disabling a slot during its startup window stops it at confirmation", "[controller][config]") {
    ControllerRig rig(make_policy(10));
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();

    rig.price(0.50);
    REQUIRE(rig.state() == LifecycleState::Starting);

    auto miner = make_miner("rig", 1.00, 0.0);
    miner.enabled = false;
    REQUIRE(rig.controller->update_config("rig", miner));
    rig.settle();
    REQUIRE(rig.state() == LifecycleState::Starting);
    REQUIRE(rig.controller->slot("rig")->disabled);

    rig.clock.advance(11s);
    rig.controller->tick();
    rig.settle();
    REQUIRE(rig.state() == LifecycleState::Idle);
    REQUIRE_FALSE(rig.launcher.process(0)->is_alive());
    REQUIRE(rig.supervisor->running_slots().empty());

    rig.clock.advance(60s);
    rig.controller->tick();
    rig.price(0.20);
    REQUIRE(rig.state() == LifecycleState::Idle);
    REQUIRE(rig.launcher.launch_count() == 1);
}

TEST_CASE("A miner surviving SIGKILL leaves the slot fatally Failed", "[controller][failure]") {
    ControllerRig rig;
    rig.launcher.ignore_term = true;
    rig.launcher.survive_kill = true;
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();

    rig.price(0.50);
    rig.price(1.50);

    auto slot = rig.controller->slot("rig");
    REQUIRE(slot->lifecycle == LifecycleState::Failed);
    REQUIRE(slot->fatal);
    REQUIRE(rig.launcher.process(0)->kill_signals() == 1);

    // Never restarted on its own, whatever the price
    rig.clock.advance(1h);
    rig.price(0.10);
    REQUIRE(rig.launcher.launch_count() == 1);

    rig.launcher.process(0)->survive_kill = false;
}

TEST_CASE("Shutdown stops every miner", "[controller][shutdown]") {
    ControllerRig rig;
    REQUIRE(rig.controller->add_slot(make_miner("a", 1.00, 0.0)));
    rig.controller->start();
    rig.price(0.50);

    // Second miner ignores SIGTERM and needs the escalation
    rig.launcher.ignore_term = true;
    REQUIRE(rig.controller->add_slot(make_miner("b", 1.00, 0.0)));
    rig.controller->tick();
    rig.settle();
    REQUIRE(rig.state("a") == LifecycleState::Running);
    REQUIRE(rig.state("b") == LifecycleState::Running);
    REQUIRE(rig.launcher.alive_count() == 2);

    REQUIRE(rig.controller->shutdown(5s));
    REQUIRE(rig.launcher.alive_count() == 0);
    for (const auto& slot : rig.controller->slots()) {
        REQUIRE(slot.lifecycle == LifecycleState::Idle);
    }
    REQUIRE(rig.launcher.process(1)->kill_signals() == 1);

    // Nothing is accepted afterwards
    REQUIRE_FALSE(rig.controller->request_start("a"));
}

TEST_CASE("Shutdown reports a miner that cannot be killed", "[controller][shutdown]") {
    ControllerRig rig;
    rig.launcher.ignore_term = true;
    rig.launcher.survive_kill = true;
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();
    rig.price(0.50);

    REQUIRE_FALSE(rig.controller->shutdown(5s));
    REQUIRE(rig.controller->slot("rig")->fatal);
}

TEST_CASE("Removing a slot stops its miner", "[controller]") {
    ControllerRig rig;
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.0)));
    rig.controller->start();
    rig.price(0.50);
    REQUIRE(rig.launcher.alive_count() == 1);

    REQUIRE(rig.controller->remove_slot("rig"));
    REQUIRE(rig.launcher.alive_count() == 0);
    REQUIRE_FALSE(rig.controller->slot("rig").has_value());
    REQUIRE_FALSE(rig.controller->remove_slot("rig"));
}

TEST_CASE("Random event sequences never start a running slot twice", "[controller][property]") {
    ControllerRig rig;
    REQUIRE(rig.controller->add_slot(make_miner("rig", 1.00, 0.05)));
    rig.controller->start();

    std::mt19937 rng(20240501);
    std::uniform_real_distribution<double> price(0.5, 1.5);
    std::uniform_int_distribution<int> action(0, 9);

    for (int step = 0; step < 300; ++step) {
        switch (action(rng)) {
            case 0: rig.controller->request_start("rig"); break;
            case 1: rig.controller->request_stop("rig"); break;
            case 2: rig.controller->set_mode("rig", SlotMode::Automatic); break;
            case 3: {
                auto process = rig.launcher.last_process();
                if (process) process->exit_with_code(1);
                break;
            }
            case 4: rig.clock.advance(400s); rig.controller->tick(); break;
            default: rig.price(price(rng)); break;
        }
        rig.settle();
        REQUIRE(rig.launcher.alive_count() <= 1);
    }

    // Between two Starting transitions there is always a way out of the previous run
    bool in_run = false;
    for (auto state : rig.recorded()) {
        if (state == LifecycleState::Starting) {
            REQUIRE_FALSE(in_run);
            in_run = true;
        } else if (state == LifecycleState::Idle || state == LifecycleState::Failed) {
            in_run = false;
        }
    }
}
