#include "minerhub/process_launcher.hpp"
#include <cstring>
#include <sstream>

namespace minerhub {

namespace {

std::string shell_quote(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n'\"\\$`!*?&;|<>(){}[]#~") == std::string::npos) {
        return arg;
    }
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace

std::string ExitStatus::describe() const {
    std::ostringstream oss;
    if (signaled()) {
        oss << "killed by signal " << signal;
        const char* name = strsignal(signal);
        if (name != nullptr) {
            oss << " (" << name << ")";
        }
    } else {
        oss << "exit code " << code;
    }
    return oss.str();
}

std::string CommandLine::display() const {
    std::string result = shell_quote(executable);
    for (size_t i = 0; i < args.size(); ++i) {
        result += ' ';
        result += secret_args.count(i) > 0 ? "***" : shell_quote(args[i]);
    }
    return result;
}

// Platform-specific implementations are in platform/ subdirectory

#if defined(__linux__) || defined(__APPLE__)
    std::unique_ptr<ProcessLauncher> create_process_launcher() {
        extern std::unique_ptr<ProcessLauncher> create_posix_process_launcher();
        return create_posix_process_launcher();
    }
#else
    #error "Unsupported platform"
#endif

} // namespace minerhub
