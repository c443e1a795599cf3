#pragma once

#include "minerhub/automation_controller.hpp"
#include "minerhub/config_manager.hpp"
#include "minerhub/log_sink.hpp"
#include "minerhub/price_cache.hpp"
#include "minerhub/price_feed.hpp"
#include "minerhub/price_poller.hpp"
#include "minerhub/process_launcher.hpp"
#include "minerhub/process_supervisor.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>

namespace minerhub {

struct OperatorCommand {
    enum class Type {
        Start,        // start <id>
        Stop,         // stop <id>
        Auto,         // auto <id>
        Mode,         // mode <id> auto|on|off
        Threshold,    // threshold <id> <SEK/kWh>
        Status,
        Reload,
        Save,
        Help,
        Quit
    };

    Type type = Type::Help;
    std::string slot_id;
    SlotMode mode = SlotMode::Automatic;
    double value = 0.0;
};

// One console line -> command. Empty optional with error_msg set for input
// that is not a command; a blank line yields no command and no error.
std::optional<OperatorCommand> parse_operator_command(const std::string& line, std::string& error_msg);

const char* operator_help();

class MinerHub {
public:
    explicit MinerHub(const std::string& config_path);
    ~MinerHub();

    // Load configuration and wire all components
    bool initialize();

    // Main loop: hot-reload plus operator console, until stop() or quit
    void run();

    // Safe to call from a signal handler
    void stop();

    // Poller first, then every slot. Returns true when no miner is left running.
    bool shutdown();

    // Executes one operator command, writing replies to `out`
    bool dispatch(const OperatorCommand& command, std::ostream& out);

    std::string status_report() const;

private:
    void apply_reload();
    void read_console(std::string& pending, bool& console_open);
    std::set<std::string> active_zones() const;

    std::string config_path_;
    ConfigManager config_manager_;
    std::shared_ptr<FanoutLogSink> log_;
    PriceCache cache_;

    std::unique_ptr<PriceFeed> feed_;
    std::unique_ptr<ProcessLauncher> launcher_;
    std::unique_ptr<ProcessSupervisor> supervisor_;
    std::unique_ptr<PricePoller> poller_;
    std::unique_ptr<AutomationController> controller_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

} // namespace minerhub
