#pragma once

#include "minerhub/config_manager.hpp"
#include "minerhub/process_launcher.hpp"
#include <optional>
#include <string>
#include <vector>

namespace minerhub {

// Command line for one miner, using the flag spelling of its kind.
// A miner config file replaces pool and credential flags.
std::optional<CommandLine> build_command(const MinerConfig& miner, std::string& error_msg);

// Splits free-form arguments the way a POSIX shell would (quotes and
// backslash escapes, no expansion). Fails on an unterminated quote.
std::optional<std::vector<std::string>> split_arguments(const std::string& text,
                                                        std::string& error_msg);

// Removes terminal escape sequences (colours, cursor movement) from a line
std::string strip_ansi_codes(const std::string& line);

// An absolute or relative path must name an executable regular file;
// a bare name is looked up in PATH.
bool check_executable(const std::string& executable, std::string& error_msg);

} // namespace minerhub
