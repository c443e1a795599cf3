#include "minerhub/command_builder.hpp"
#include <cstdlib>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace minerhub {

namespace {

struct FlagSet {
    const char* config_file;
    const char* algorithm;
    const char* pool;
    const char* user;
    const char* password;
    const char* worker;
};

const FlagSet* flags_for(const std::string& kind) {
    static const FlagSet gminer{"--config", "-a", "-s", "-u", "-p", "--worker"};
    static const FlagSet lolminer{"--config", "--algo", "--pool", "--user", "--pass", "--worker"};
    static const FlagSet trex{"-c", "-a", "-o", "-u", "-p", "-w"};
    static const FlagSet xmrig{"-c", "-a", "-o", "-u", "-p", "--rig-id"};

    if (kind == "gminer") return &gminer;
    if (kind == "lolminer") return &lolminer;
    if (kind == "trex") return &trex;
    if (kind == "xmrig") return &xmrig;
    return nullptr;
}

bool is_executable_file(const std::string& path) {
    struct stat info{};
    if (::stat(path.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

} // namespace

std::optional<std::vector<std::string>> split_arguments(const std::string& text,
                                                        std::string& error_msg) {
    std::vector<std::string> args;
    std::string current;
    bool in_token = false;
    char quote = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (quote == '\'') {
            if (c == '\'') {
                quote = 0;
            } else {
                current += c;
            }
            continue;
        }

        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < text.size() &&
                       (text[i + 1] == '"' || text[i + 1] == '\\' || text[i + 1] == '$' || text[i + 1] == '`')) {
                current += text[++i];
            } else {
                current += c;
            }
            continue;
        }

        if (c == ' ' || c == '\t' || c == '\n') {
            if (in_token) {
                args.push_back(current);
                current.clear();
                in_token = false;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_token = true;
        } else if (c == '\\') {
            if (i + 1 < text.size()) {
                current += text[++i];
            }
            in_token = true;
        } else {
            current += c;
            in_token = true;
        }
    }

    if (quote != 0) {
        error_msg = std::string("unterminated ") + (quote == '"' ? "double" : "single") +
                    " quote in extra_args";
        return std::nullopt;
    }
    if (in_token) {
        args.push_back(current);
    }
    return args;
}

std::string strip_ansi_codes(const std::string& line) {
    std::string result;
    result.reserve(line.size());

    size_t i = 0;
    while (i < line.size()) {
        if (line[i] != '\x1B') {
            result += line[i++];
            continue;
        }
        if (i + 1 >= line.size()) {
            break;
        }

        char next = line[i + 1];
        if (next == '[') {
            // CSI: parameters 0x30-0x3F, intermediates 0x20-0x2F, final 0x40-0x7E
            size_t j = i + 2;
            while (j < line.size() && line[j] >= 0x30 && line[j] <= 0x3F) ++j;
            while (j < line.size() && line[j] >= 0x20 && line[j] <= 0x2F) ++j;
            if (j < line.size() && line[j] >= 0x40 && line[j] <= 0x7E) {
                i = j + 1;
            } else {
                // Truncated sequence: drop the rest
                i = line.size();
            }
        } else if ((next >= '@' && next <= 'Z') || next == '\\' || next == '-' || next == '_') {
            i += 2;
        } else {
            result += line[i++];
        }
    }
    return result;
}

bool check_executable(const std::string& executable, std::string& error_msg) {
    if (executable.empty()) {
        error_msg = "no executable configured";
        return false;
    }

    if (executable.find('/') != std::string::npos) {
        struct stat info{};
        if (::stat(executable.c_str(), &info) != 0) {
            error_msg = "executable not found: " + executable;
            return false;
        }
        if (!S_ISREG(info.st_mode)) {
            error_msg = "not a regular file: " + executable;
            return false;
        }
        if (::access(executable.c_str(), X_OK) != 0) {
            error_msg = "permission denied: " + executable;
            return false;
        }
        return true;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env != nullptr) {
        std::istringstream dirs(path_env);
        std::string dir;
        while (std::getline(dirs, dir, ':')) {
            if (dir.empty()) {
                dir = ".";
            }
            if (is_executable_file(dir + "/" + executable)) {
                return true;
            }
        }
    }

    error_msg = "executable '" + executable + "' not found in PATH";
    return false;
}

std::optional<CommandLine> build_command(const MinerConfig& miner, std::string& error_msg) {
    CommandLine cmd;
    cmd.executable = miner.executable;
    cmd.working_dir = miner.working_dir;

    if (miner.executable.empty()) {
        error_msg = "no executable configured";
        return std::nullopt;
    }

    const FlagSet* flags = flags_for(miner.kind);
    if (flags == nullptr && miner.kind != "custom") {
        error_msg = "unknown miner kind '" + miner.kind + "'";
        return std::nullopt;
    }

    if (flags != nullptr) {
        auto add = [&cmd](const char* flag, const std::string& value) {
            if (!value.empty()) {
                cmd.args.push_back(flag);
                cmd.args.push_back(value);
            }
        };

        if (!miner.config_file.empty()) {
            add(flags->config_file, miner.config_file);
        } else {
            if (miner.pool.empty()) {
                error_msg = "miner '" + miner.id + "' needs a pool or a config_file";
                return std::nullopt;
            }
            add(flags->algorithm, miner.algorithm);
            add(flags->pool, miner.pool);
            add(flags->user, miner.user);
            if (!miner.password.empty()) {
                cmd.args.push_back(flags->password);
                cmd.secret_args.insert(cmd.args.size());
                cmd.args.push_back(miner.password);
            }
            add(flags->worker, miner.worker);
        }
    }

    auto extra = split_arguments(miner.extra_args, error_msg);
    if (!extra) {
        return std::nullopt;
    }
    cmd.args.insert(cmd.args.end(), extra->begin(), extra->end());

    return cmd;
}

} // namespace minerhub
