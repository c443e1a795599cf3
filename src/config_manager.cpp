#include "minerhub/config_manager.hpp"
#include "minerhub/log_sink.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <set>

// Minimal YAML subset parser: top-level sections, "key: value" pairs and
// the "miners:" list of mappings. Field layout follows the typiconf structs.
namespace minerhub {

namespace {

using RawFields = std::vector<std::pair<std::string, std::string>>;

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

// Drops a trailing "# comment" that is not inside quotes
std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote != 0) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.length() - 2);
    }
    return value;
}

std::optional<double> parse_double(const std::string& value) {
    try {
        size_t used = 0;
        double result = std::stod(value, &used);
        if (used != value.size() || !std::isfinite(result)) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<int> parse_int(const std::string& value) {
    try {
        size_t used = 0;
        int result = std::stoi(value, &used);
        if (used != value.size()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower = value;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true" || lower == "yes" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "0") return false;
    return std::nullopt;
}

void assign_int(int& target, const std::string& key, const std::string& value,
                std::vector<std::string>& errors) {
    if (auto parsed = parse_int(value)) {
        target = *parsed;
    } else {
        errors.push_back(key + ": expected an integer, got '" + value + "'");
    }
}

void assign_bool(bool& target, const std::string& key, const std::string& value,
                 std::vector<std::string>& errors) {
    if (auto parsed = parse_bool(value)) {
        target = *parsed;
    } else {
        errors.push_back(key + ": expected a boolean, got '" + value + "'");
    }
}

// Builds a MinerConfig from raw fields; returns false with error_msg set when
// a field cannot be converted
bool build_miner(const RawFields& fields, MinerConfig& miner, std::string& error_msg) {
    for (const auto& [key, value] : fields) {
        if (key == "id") miner.id = value;
        else if (key == "kind") miner.kind = value;
        else if (key == "executable") miner.executable = value;
        else if (key == "algorithm") miner.algorithm = value;
        else if (key == "pool") miner.pool = value;
        else if (key == "user") miner.user = value;
        else if (key == "password") miner.password = value;
        else if (key == "worker") miner.worker = value;
        else if (key == "extra_args") miner.extra_args = value;
        else if (key == "config_file") miner.config_file = value;
        else if (key == "working_dir") miner.working_dir = value;
        else if (key == "zone") miner.zone = value;
        else if (key == "price_threshold" || key == "hysteresis_band") {
            auto parsed = parse_double(value);
            if (!parsed) {
                error_msg = key + " is not a number: '" + value + "'";
                return false;
            }
            (key == "price_threshold" ? miner.price_threshold : miner.hysteresis_band) = *parsed;
        }
        else if (key == "enabled") {
            auto parsed = parse_bool(value);
            if (!parsed) {
                error_msg = "enabled is not a boolean: '" + value + "'";
                return false;
            }
            miner.enabled = *parsed;
        }
        else {
            DebugLogger::log("config: ignoring unknown miner key '", key, "'");
        }
    }
    return true;
}

std::string quoted(const std::string& value) {
    return "\"" + value + "\"";
}

} // namespace

const std::vector<std::string>& known_zones() {
    static const std::vector<std::string> zones{"SE1", "SE2", "SE3", "SE4"};
    return zones;
}

bool is_valid_zone(const std::string& zone) {
    for (const auto& known : known_zones()) {
        if (known == zone) return true;
    }
    return false;
}

bool MinerConfig::validate(std::string& error_msg) const {
    static const std::set<std::string> kinds{"gminer", "lolminer", "trex", "xmrig", "custom"};

    if (id.empty()) {
        error_msg = "missing required field 'id'";
        return false;
    }
    if (kinds.count(kind) == 0) {
        error_msg = "unknown miner kind '" + kind + "'";
        return false;
    }
    if (executable.empty()) {
        error_msg = "missing required field 'executable'";
        return false;
    }
    if (!is_valid_zone(zone)) {
        error_msg = "unknown price zone '" + zone + "'";
        return false;
    }
    if (!std::isfinite(price_threshold)) {
        error_msg = "price_threshold must be a finite number";
        return false;
    }
    if (!std::isfinite(hysteresis_band) || hysteresis_band < 0.0) {
        error_msg = "hysteresis_band must be zero or positive";
        return false;
    }
    return true;
}

bool MinerHubConfig::validate() const {
    return polling.validate() && automation.validate() && supervisor.validate();
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
    , last_modified_{}
{
}

void ConfigManager::reset() {
    config_ = MinerHubConfig{};
    miner_errors_.clear();
}

bool ConfigManager::load() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << config_path_ << "\n";
        return false;
    }

    // Store file modification time
    try {
        last_modified_ = std::filesystem::last_write_time(config_path_);
    } catch (const std::exception& e) {
        std::cerr << "Failed to get file modification time: " << e.what() << "\n";
        return false;
    }

    // Parse into a fresh config; the current one stays in place if this fails
    MinerHubConfig parsed;
    std::map<std::string, std::string> parsed_errors;
    std::vector<std::string> errors;
    std::vector<RawFields> raw_miners;
    std::string line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        size_t indent = line.find_first_not_of(' ');
        std::string content = trim(strip_comment(line));

        // Skip comments and empty lines
        if (content.empty()) {
            continue;
        }

        // Section headers (no indent)
        if (indent == 0 && content.back() == ':' && content.find(' ') == std::string::npos) {
            current_section = content.substr(0, content.length() - 1);
            continue;
        }

        bool list_item = false;
        if (content.size() >= 2 && content[0] == '-' && content[1] == ' ') {
            list_item = true;
            content = trim(content.substr(2));
        }

        size_t colon_pos = content.find(':');
        if (colon_pos == std::string::npos) {
            errors.push_back("line " + std::to_string(line_number) + ": expected 'key: value'");
            continue;
        }
        std::string key = trim(content.substr(0, colon_pos));
        std::string value = unquote(trim(content.substr(colon_pos + 1)));

        if (indent == 0) {
            current_section.clear();
            if (key == "version") parsed.version = value;
            else DebugLogger::log("config: ignoring unknown key '", key, "'");
            continue;
        }

        if (current_section == "miners") {
            if (list_item) {
                raw_miners.emplace_back();
            }
            if (raw_miners.empty()) {
                errors.push_back("line " + std::to_string(line_number) + ": miner field outside a list item");
                continue;
            }
            raw_miners.back().emplace_back(key, value);
        }
        else if (current_section == "polling") {
            auto& polling = parsed.polling;
            if (key == "interval_seconds") assign_int(polling.interval_seconds, key, value, errors);
            else if (key == "max_consecutive_failures") assign_int(polling.max_consecutive_failures, key, value, errors);
            else if (key == "backoff_initial_seconds") assign_int(polling.backoff_initial_seconds, key, value, errors);
            else if (key == "backoff_max_seconds") assign_int(polling.backoff_max_seconds, key, value, errors);
            else if (key == "request_timeout_seconds") assign_int(polling.request_timeout_seconds, key, value, errors);
        }
        else if (current_section == "automation") {
            auto& automation = parsed.automation;
            if (key == "stale_policy") automation.stale_policy = value;
            else if (key == "cool_down_seconds") assign_int(automation.cool_down_seconds, key, value, errors);
            else if (key == "startup_grace_seconds") assign_int(automation.startup_grace_seconds, key, value, errors);
            else if (key == "tick_interval_ms") assign_int(automation.tick_interval_ms, key, value, errors);
        }
        else if (current_section == "supervisor") {
            auto& supervisor = parsed.supervisor;
            if (key == "grace_timeout_ms") assign_int(supervisor.grace_timeout_ms, key, value, errors);
            else if (key == "kill_timeout_ms") assign_int(supervisor.kill_timeout_ms, key, value, errors);
            else if (key == "log_buffer_lines") assign_int(supervisor.log_buffer_lines, key, value, errors);
            else if (key == "strip_ansi") assign_bool(supervisor.strip_ansi, key, value, errors);
        }
        else if (current_section == "logging") {
            auto& logging = parsed.logging;
            if (key == "log_to_file") assign_bool(logging.log_to_file, key, value, errors);
            else if (key == "log_path") logging.log_path = value;
            else if (key == "echo_to_console") assign_bool(logging.echo_to_console, key, value, errors);
            else if (key == "debug") assign_bool(logging.debug, key, value, errors);
        }
        else {
            DebugLogger::log("config: ignoring key '", key, "' in section '", current_section, "'");
        }
    }

    // Convert miners; a broken entry is kept (disabled) so its slot can report the problem
    std::set<std::string> seen_ids;
    for (size_t i = 0; i < raw_miners.size(); ++i) {
        MinerConfig miner;
        std::string error;
        bool ok = build_miner(raw_miners[i], miner, error);
        if (miner.id.empty()) {
            miner.id = "miner" + std::to_string(i + 1);
            if (ok) {
                ok = false;
                error = "missing required field 'id'";
            }
        }
        if (ok && !miner.validate(error)) {
            ok = false;
        }
        if (seen_ids.count(miner.id) > 0) {
            errors.push_back("duplicate miner id '" + miner.id + "'");
            continue;
        }
        seen_ids.insert(miner.id);
        if (!ok) {
            parsed_errors[miner.id] = error;
        }
        parsed.miners.push_back(miner);
    }

    if (!errors.empty()) {
        for (const auto& error : errors) {
            std::cerr << "Config error in " << config_path_ << ": " << error << "\n";
        }
        return false;
    }

    config_ = std::move(parsed);
    miner_errors_ = std::move(parsed_errors);
    return true;
}

bool ConfigManager::check_and_reload() {
    try {
        auto current_time = std::filesystem::last_write_time(config_path_);
        if (current_time != last_modified_) {
            return load();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error checking file modification: " << e.what() << "\n";
    }
    return false;
}

bool ConfigManager::save() const {
    return save(config_path_);
}

bool ConfigManager::save(const std::string& path) const {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "Failed to open " << tmp_path << " for writing\n";
            return false;
        }

        out << std::boolalpha << std::setprecision(6);
        out << "version: " << quoted(config_.version) << "\n\n";

        out << "polling:\n"
            << "  interval_seconds: " << config_.polling.interval_seconds << "\n"
            << "  max_consecutive_failures: " << config_.polling.max_consecutive_failures << "\n"
            << "  backoff_initial_seconds: " << config_.polling.backoff_initial_seconds << "\n"
            << "  backoff_max_seconds: " << config_.polling.backoff_max_seconds << "\n"
            << "  request_timeout_seconds: " << config_.polling.request_timeout_seconds << "\n\n";

        out << "automation:\n"
            << "  stale_policy: " << quoted(config_.automation.stale_policy) << "\n"
            << "  cool_down_seconds: " << config_.automation.cool_down_seconds << "\n"
            << "  startup_grace_seconds: " << config_.automation.startup_grace_seconds << "\n"
            << "  tick_interval_ms: " << config_.automation.tick_interval_ms << "\n\n";

        out << "supervisor:\n"
            << "  grace_timeout_ms: " << config_.supervisor.grace_timeout_ms << "\n"
            << "  kill_timeout_ms: " << config_.supervisor.kill_timeout_ms << "\n"
            << "  log_buffer_lines: " << config_.supervisor.log_buffer_lines << "\n"
            << "  strip_ansi: " << config_.supervisor.strip_ansi << "\n\n";

        out << "logging:\n"
            << "  log_to_file: " << config_.logging.log_to_file << "\n"
            << "  log_path: " << quoted(config_.logging.log_path) << "\n"
            << "  echo_to_console: " << config_.logging.echo_to_console << "\n"
            << "  debug: " << config_.logging.debug << "\n\n";

        out << "miners:\n";
        for (const auto& miner : config_.miners) {
            out << "  - id: " << quoted(miner.id) << "\n"
                << "    kind: " << quoted(miner.kind) << "\n"
                << "    executable: " << quoted(miner.executable) << "\n"
                << "    algorithm: " << quoted(miner.algorithm) << "\n"
                << "    pool: " << quoted(miner.pool) << "\n"
                << "    user: " << quoted(miner.user) << "\n"
                << "    password: " << quoted(miner.password) << "\n"
                << "    worker: " << quoted(miner.worker) << "\n"
                << "    extra_args: " << quoted(miner.extra_args) << "\n"
                << "    config_file: " << quoted(miner.config_file) << "\n"
                << "    working_dir: " << quoted(miner.working_dir) << "\n"
                << "    zone: " << quoted(miner.zone) << "\n"
                << "    price_threshold: " << miner.price_threshold << "\n"
                << "    hysteresis_band: " << miner.hysteresis_band << "\n"
                << "    enabled: " << miner.enabled << "\n";
        }

        out.flush();
        if (!out) {
            std::cerr << "Failed to write " << tmp_path << "\n";
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::cerr << "Failed to replace " << path << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

std::map<std::string, MinerConfig> ConfigManager::miners() const {
    std::map<std::string, MinerConfig> result;
    for (const auto& miner : config_.miners) {
        result[miner.id] = miner;
    }
    return result;
}

void ConfigManager::set_miner(const MinerConfig& miner) {
    std::string error;
    if (miner.validate(error)) {
        miner_errors_.erase(miner.id);
    } else {
        miner_errors_[miner.id] = error;
    }
    for (auto& existing : config_.miners) {
        if (existing.id == miner.id) {
            existing = miner;
            return;
        }
    }
    config_.miners.push_back(miner);
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    if (!config_.polling.validate()) {
        error_msg = "Polling settings invalid: intervals and limits must be positive, backoff_max >= backoff_initial";
        return false;
    }

    if (!config_.automation.validate()) {
        error_msg = "Automation settings invalid: stale_policy must be 'hold' or 'stop', durations non-negative";
        return false;
    }

    if (!config_.supervisor.validate()) {
        error_msg = "Supervisor settings invalid: timeouts and buffer size out of range";
        return false;
    }

    if (config_.miners.empty()) {
        error_msg = "No miners configured";
        return false;
    }

    return true;
}

} // namespace minerhub
