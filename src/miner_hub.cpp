#include "minerhub/miner_hub.hpp"
#include <cerrno>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <poll.h>
#include <unistd.h>

namespace minerhub {

namespace {

std::vector<std::string> split_words(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

const char* operator_help() {
    return "Commands:\n"
           "  start <id>              start a miner and keep it on (manual)\n"
           "  stop <id>               stop a miner and keep it off (manual)\n"
           "  auto <id>               return a miner to price automation\n"
           "  mode <id> auto|on|off   set the mode explicitly\n"
           "  threshold <id> <price>  change the price threshold (SEK/kWh)\n"
           "  status                  show all slots\n"
           "  reload                  re-read the configuration file\n"
           "  save                    write the configuration file\n"
           "  help                    show this list\n"
           "  quit                    stop all miners and exit\n";
}

std::optional<OperatorCommand> parse_operator_command(const std::string& line, std::string& error_msg) {
    const auto words = split_words(line);
    if (words.empty()) {
        return std::nullopt;
    }

    OperatorCommand command;
    const std::string& verb = words[0];

    auto expect_args = [&](size_t count, const char* usage) {
        if (words.size() != count + 1) {
            error_msg = std::string("usage: ") + usage;
            return false;
        }
        return true;
    };

    if (verb == "start" || verb == "stop" || verb == "auto") {
        if (!expect_args(1, (verb + " <id>").c_str())) return std::nullopt;
        command.type = verb == "start" ? OperatorCommand::Type::Start
                     : verb == "stop"  ? OperatorCommand::Type::Stop
                                       : OperatorCommand::Type::Auto;
        command.slot_id = words[1];
    }
    else if (verb == "mode") {
        if (!expect_args(2, "mode <id> auto|on|off")) return std::nullopt;
        auto mode = parse_mode(words[2]);
        if (!mode) {
            error_msg = "unknown mode '" + words[2] + "' (expected auto, on or off)";
            return std::nullopt;
        }
        command.type = OperatorCommand::Type::Mode;
        command.slot_id = words[1];
        command.mode = *mode;
    }
    else if (verb == "threshold") {
        if (!expect_args(2, "threshold <id> <price>")) return std::nullopt;
        try {
            size_t pos = 0;
            command.value = std::stod(words[2], &pos);
            if (pos != words[2].size()) {
                throw std::invalid_argument("trailing characters");
            }
        } catch (const std::exception&) {
            error_msg = "invalid price '" + words[2] + "'";
            return std::nullopt;
        }
        command.type = OperatorCommand::Type::Threshold;
        command.slot_id = words[1];
    }
    else if (verb == "status") command.type = OperatorCommand::Type::Status;
    else if (verb == "reload") command.type = OperatorCommand::Type::Reload;
    else if (verb == "save")   command.type = OperatorCommand::Type::Save;
    else if (verb == "help" || verb == "?") command.type = OperatorCommand::Type::Help;
    else if (verb == "quit" || verb == "exit") command.type = OperatorCommand::Type::Quit;
    else {
        error_msg = "unknown command '" + verb + "' (type 'help')";
        return std::nullopt;
    }
    return command;
}

MinerHub::MinerHub(const std::string& config_path)
    : config_path_(config_path)
    , config_manager_(config_path)
    , log_(std::make_shared<FanoutLogSink>())
{
}

MinerHub::~MinerHub() {
    if (controller_ && !shut_down_) {
        shutdown();
    }
}

bool MinerHub::initialize() {
    // Load configuration
    if (!config_manager_.load()) {
        std::cerr << "Failed to load configuration from " << config_path_ << "\n";
        return false;
    }

    // Validate configuration
    std::string validation_error;
    if (!config_manager_.validate_config(validation_error)) {
        std::cerr << "Configuration validation failed: " << validation_error << "\n";
        return false;
    }

    const auto& config = config_manager_.get_config();

    DebugLogger::set_enabled(config.logging.debug);
    if (config.logging.echo_to_console) {
        log_->add(std::make_shared<ConsoleLogSink>());
    }
    if (config.logging.log_to_file) {
        auto file_sink = std::make_shared<FileLogSink>(config.logging.log_path);
        if (file_sink->is_open()) {
            log_->add(file_sink);
        }
    }

    // Initialize components
    ElprisFeedOptions feed_options;
    feed_options.timeout = std::chrono::seconds(config.polling.request_timeout_seconds);
    feed_ = std::make_unique<ElprisPriceFeed>(feed_options);
    launcher_ = create_process_launcher();
    supervisor_ = std::make_unique<ProcessSupervisor>(*launcher_, log_, config.supervisor);
    poller_ = std::make_unique<PricePoller>(*feed_, cache_, config.polling, log_);
    controller_ = std::make_unique<AutomationController>(*supervisor_, cache_, config.automation, log_);

    const auto& miner_errors = config_manager_.miner_errors();
    for (const auto& [id, miner] : config_manager_.miners()) {
        auto error = miner_errors.find(id);
        controller_->add_slot(miner, error == miner_errors.end() ? std::string() : error->second);
    }

    poller_->set_zones(active_zones());
    cache_.set_listener([this](const PriceSample& sample) {
        controller_->notify_price(sample.zone);
    });

    return true;
}

std::set<std::string> MinerHub::active_zones() const {
    std::set<std::string> zones;
    const auto& errors = config_manager_.miner_errors();
    for (const auto& miner : config_manager_.get_config().miners) {
        if (miner.enabled && errors.count(miner.id) == 0) {
            zones.insert(miner.zone);
        }
    }
    return zones;
}

void MinerHub::run() {
    if (!controller_ || !poller_) {
        std::cerr << "MinerHub not initialized. Call initialize() first.\n";
        return;
    }

    running_ = true;
    controller_->start();
    poller_->start();

    std::ostringstream zones;
    for (const auto& zone : active_zones()) {
        zones << " " << zone;
    }
    log_->write(make_log_line("", LogLevel::Info,
        "Started with " + std::to_string(controller_->slots().size()) + " miner(s), price zones:" +
        (zones.str().empty() ? std::string(" none") : zones.str())));
    std::cout << "Type 'help' for commands. Press Ctrl+C to exit.\n";

    std::string pending;
    bool console_open = true;
    while (running_) {
        // Hot-reload configuration if changed
        if (config_manager_.check_and_reload()) {
            apply_reload();
        }

        if (console_open) {
            read_console(pending, console_open);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
    }
}

void MinerHub::read_console(std::string& pending, bool& console_open) {
    pollfd fd{STDIN_FILENO, POLLIN, 0};
    int ready = ::poll(&fd, 1, 500);
    if (ready <= 0) {
        return;
    }

    char buffer[1024];
    ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) {
        return;
    }
    if (n <= 0) {
        // stdin closed: keep running until a signal arrives
        console_open = false;
        return;
    }
    pending.append(buffer, static_cast<size_t>(n));

    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, newline);
        pending.erase(0, newline + 1);

        std::string error;
        auto command = parse_operator_command(line, error);
        if (command) {
            dispatch(*command, std::cout);
        } else if (!error.empty()) {
            std::cout << error << "\n";
        }
    }
}

void MinerHub::stop() {
    running_ = false;
}

bool MinerHub::dispatch(const OperatorCommand& command, std::ostream& out) {
    auto unknown_slot = [&]() {
        out << "No miner with id '" << command.slot_id << "'\n";
        return false;
    };

    switch (command.type) {
        case OperatorCommand::Type::Start:
            if (!controller_->request_start(command.slot_id)) return unknown_slot();
            return true;

        case OperatorCommand::Type::Stop:
            if (!controller_->request_stop(command.slot_id)) return unknown_slot();
            return true;

        case OperatorCommand::Type::Auto:
            if (!controller_->set_mode(command.slot_id, SlotMode::Automatic)) return unknown_slot();
            return true;

        case OperatorCommand::Type::Mode:
            if (!controller_->set_mode(command.slot_id, command.mode)) return unknown_slot();
            return true;

        case OperatorCommand::Type::Threshold: {
            auto miners = config_manager_.miners();
            auto it = miners.find(command.slot_id);
            if (it == miners.end()) return unknown_slot();
            MinerConfig miner = it->second;
            miner.price_threshold = command.value;
            config_manager_.set_miner(miner);
            controller_->update_config(miner.id, miner);
            out << "Threshold for " << miner.id << " set to " << command.value
                << " SEK/kWh (use 'save' to keep it)\n";
            return true;
        }

        case OperatorCommand::Type::Status:
            out << status_report();
            return true;

        case OperatorCommand::Type::Reload:
            if (!config_manager_.load()) {
                out << "Reload failed, keeping the current configuration\n";
                return false;
            }
            apply_reload();
            out << "Configuration reloaded\n";
            return true;

        case OperatorCommand::Type::Save:
            if (!config_manager_.save()) {
                out << "Failed to save " << config_manager_.path() << "\n";
                return false;
            }
            out << "Saved " << config_manager_.path() << "\n";
            return true;

        case OperatorCommand::Type::Help:
            out << operator_help();
            return true;

        case OperatorCommand::Type::Quit:
            stop();
            return true;
    }
    return false;
}

void MinerHub::apply_reload() {
    const auto& config = config_manager_.get_config();

    std::string validation_error;
    if (!config_manager_.validate_config(validation_error)) {
        log_->write(make_log_line("", LogLevel::Error,
            "Reloaded configuration is invalid, global settings unchanged: " + validation_error));
    } else {
        DebugLogger::set_enabled(config.logging.debug);
        poller_->update_config(config.polling);
        supervisor_->update_config(config.supervisor);
        controller_->update_policy(config.automation);
    }

    const auto miners = config_manager_.miners();
    const auto& miner_errors = config_manager_.miner_errors();
    auto error_for = [&](const std::string& id) {
        auto it = miner_errors.find(id);
        return it == miner_errors.end() ? std::string() : it->second;
    };

    std::set<std::string> existing;
    for (const auto& slot : controller_->slots()) {
        existing.insert(slot.id());
        if (miners.count(slot.id()) == 0) {
            controller_->remove_slot(slot.id());
        }
    }
    for (const auto& [id, miner] : miners) {
        if (existing.count(id) > 0) {
            controller_->update_config(id, miner, error_for(id));
        } else {
            controller_->add_slot(miner, error_for(id));
        }
    }

    poller_->set_zones(active_zones());
    log_->write(make_log_line("", LogLevel::Info, "Configuration reloaded from " + config_path_));
}

std::string MinerHub::status_report() const {
    std::ostringstream oss;
    oss << std::left << std::setw(14) << "MINER" << std::setw(6) << "MODE"
        << std::setw(10) << "STATE" << std::setw(6) << "ZONE"
        << std::setw(18) << "PRICE" << std::setw(16) << "THRESHOLD" << std::setw(8) << "PID"
        << "NOTE\n";

    for (const auto& slot : controller_->slots()) {
        std::ostringstream price;
        auto sample = cache_.get(slot.config.zone);
        if (sample) {
            price << std::fixed << std::setprecision(3) << sample->value << (sample->stale ? " (stale)" : "");
        } else {
            price << "-";
        }

        std::ostringstream threshold;
        threshold << std::fixed << std::setprecision(3) << slot.config.price_threshold;
        if (slot.config.hysteresis_band > 0.0) {
            threshold << " +/-" << std::setprecision(2) << slot.config.hysteresis_band;
        }

        auto pid = supervisor_->pid(slot.id());
        std::string note = slot.disabled ? "disabled" : "";
        if (slot.fatal) note = "manual intervention required";
        if (!slot.last_error.empty()) note += (note.empty() ? "" : ": ") + slot.last_error;

        oss << std::left << std::setw(14) << slot.id() << std::setw(6) << to_string(slot.mode)
            << std::setw(10) << to_string(slot.lifecycle) << std::setw(6) << slot.config.zone
            << std::setw(18) << price.str() << std::setw(16) << threshold.str()
            << std::setw(8) << (pid ? std::to_string(*pid) : std::string("-"))
            << note << "\n";
    }
    return oss.str();
}

bool MinerHub::shutdown() {
    if (shut_down_ || !controller_) {
        return true;
    }
    shut_down_ = true;
    running_ = false;

    poller_->stop();
    cache_.set_listener(nullptr);

    // Every slot may need the full SIGTERM + SIGKILL wait
    const auto& supervisor_config = config_manager_.get_config().supervisor;
    const auto per_slot = std::chrono::milliseconds(supervisor_config.grace_timeout_ms +
                                                    supervisor_config.kill_timeout_ms);
    const auto timeout = per_slot * static_cast<long>(controller_->slots().size() + 1) +
                         std::chrono::seconds(5);

    const bool complete = controller_->shutdown(timeout);
    supervisor_->flush_logs();
    return complete;
}

} // namespace minerhub
