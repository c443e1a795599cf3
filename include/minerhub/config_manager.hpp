#pragma once

#include <typiconf/typiconf.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <chrono>

namespace minerhub {

struct PollingConfig {
    int interval_seconds = 60;
    int max_consecutive_failures = 3;
    int backoff_initial_seconds = 5;
    int backoff_max_seconds = 300;
    int request_timeout_seconds = 10;

    bool validate() const {
        return interval_seconds > 0 &&
               max_consecutive_failures > 0 &&
               backoff_initial_seconds > 0 &&
               backoff_max_seconds >= backoff_initial_seconds &&
               request_timeout_seconds > 0;
    }

    TYPICONF_DEFINE_FIELDS(PollingConfig,
        TYPICONF_FIELD(interval_seconds),
        TYPICONF_FIELD(max_consecutive_failures),
        TYPICONF_FIELD(backoff_initial_seconds),
        TYPICONF_FIELD(backoff_max_seconds),
        TYPICONF_FIELD(request_timeout_seconds)
    )
};

struct AutomationConfig {
    std::string stale_policy = "hold";    // "hold" or "stop"
    int cool_down_seconds = 300;
    int startup_grace_seconds = 10;
    int tick_interval_ms = 1000;          // 0 disables the internal ticker

    bool validate() const {
        return (stale_policy == "hold" || stale_policy == "stop") &&
               cool_down_seconds >= 0 &&
               startup_grace_seconds >= 0 &&
               tick_interval_ms >= 0;
    }

    TYPICONF_DEFINE_FIELDS(AutomationConfig,
        TYPICONF_FIELD(stale_policy),
        TYPICONF_FIELD(cool_down_seconds),
        TYPICONF_FIELD(startup_grace_seconds),
        TYPICONF_FIELD(tick_interval_ms)
    )
};

struct SupervisorConfig {
    int grace_timeout_ms = 5000;
    int kill_timeout_ms = 2000;
    int log_buffer_lines = 1000;
    bool strip_ansi = true;

    bool validate() const {
        return grace_timeout_ms >= 0 && kill_timeout_ms > 0 && log_buffer_lines > 0;
    }

    TYPICONF_DEFINE_FIELDS(SupervisorConfig,
        TYPICONF_FIELD(grace_timeout_ms),
        TYPICONF_FIELD(kill_timeout_ms),
        TYPICONF_FIELD(log_buffer_lines),
        TYPICONF_FIELD(strip_ansi)
    )
};

struct LoggingConfig {
    bool log_to_file = true;
    std::string log_path = "./minerhub.log";
    bool echo_to_console = true;
    bool debug = false;

    TYPICONF_DEFINE_FIELDS(LoggingConfig,
        TYPICONF_FIELD(log_to_file),
        TYPICONF_FIELD(log_path),
        TYPICONF_FIELD(echo_to_console),
        TYPICONF_FIELD(debug)
    )
};

struct MinerConfig {
    std::string id;                 // slot identifier, e.g. "gminer"
    std::string kind = "custom";    // gminer, lolminer, trex, xmrig, custom
    std::string executable;
    std::string algorithm;
    std::string pool;
    std::string user;
    std::string password;
    std::string worker;
    std::string extra_args;         // shell-style quoting allowed
    std::string config_file;        // miner's own config file, replaces pool flags
    std::string working_dir;
    std::string zone = "SE3";
    double price_threshold = 0.10;  // SEK/kWh
    double hysteresis_band = 0.0;
    bool enabled = true;

    // Fills error_msg with the first problem found
    bool validate(std::string& error_msg) const;

    TYPICONF_DEFINE_FIELDS(MinerConfig,
        TYPICONF_FIELD(id),
        TYPICONF_FIELD(kind),
        TYPICONF_FIELD(executable),
        TYPICONF_FIELD(algorithm),
        TYPICONF_FIELD(pool),
        TYPICONF_FIELD(user),
        TYPICONF_FIELD(password),
        TYPICONF_FIELD(worker),
        TYPICONF_FIELD(extra_args),
        TYPICONF_FIELD(config_file),
        TYPICONF_FIELD(working_dir),
        TYPICONF_FIELD(zone),
        TYPICONF_FIELD(price_threshold),
        TYPICONF_FIELD(hysteresis_band),
        TYPICONF_FIELD(enabled)
    )
};

struct MinerHubConfig {
    std::string version = "1.0";
    PollingConfig polling;
    AutomationConfig automation;
    SupervisorConfig supervisor;
    LoggingConfig logging;
    std::vector<MinerConfig> miners;

    bool validate() const;

    TYPICONF_DEFINE_FIELDS(MinerHubConfig,
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(polling),
        TYPICONF_FIELD(automation),
        TYPICONF_FIELD(supervisor),
        TYPICONF_FIELD(logging),
        TYPICONF_FIELD(miners)
    )
};

// Price regions served by the price feed
const std::vector<std::string>& known_zones();
bool is_valid_zone(const std::string& zone);

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path);

    // Load configuration
    bool load();

    // Reload if file changed (hot-reload)
    bool check_and_reload();

    // Write the current configuration back (temp file + rename)
    bool save() const;
    bool save(const std::string& path) const;

    // Restore built-in defaults without touching the file
    void reset();

    // Access configuration
    const MinerHubConfig& get_config() const { return config_; }
    const std::string& path() const { return config_path_; }

    // Key-value view over the miners section, keyed by miner id
    std::map<std::string, MinerConfig> miners() const;
    void set_miner(const MinerConfig& miner);

    // Validation
    bool validate_config(std::string& error_msg) const;

    // Per-miner problems found during the last load, keyed by miner id
    const std::map<std::string, std::string>& miner_errors() const { return miner_errors_; }

private:
    std::string config_path_;
    MinerHubConfig config_;
    std::map<std::string, std::string> miner_errors_;
    std::filesystem::file_time_type last_modified_;
};

} // namespace minerhub
