#include "minerhub/miner_hub.hpp"
#include <iostream>
#include <csignal>
#include <memory>

// Global pointer for signal handler
minerhub::MinerHub* g_hub = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_hub) {
            g_hub->stop();
        }
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config_file]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  config_file    Path to YAML configuration file (default: config/default_config.yaml)\n";
    std::cout << "  -h, --help     Show this help message\n";
    std::cout << "\n";
    std::cout << "Starts and stops the configured miners according to the electricity\n";
    std::cout << "price of their zone. Type 'help' at the prompt for operator commands.\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "\n";
    std::cout << "  " << program_name << " /etc/minerhub/rig.yaml\n";
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    // Parse command-line arguments
    std::string config_path = "config/default_config.yaml";

    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        config_path = arg;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // A miner closing its pipes must not kill the controller
    std::signal(SIGPIPE, SIG_IGN);

    auto hub = std::make_unique<minerhub::MinerHub>(config_path);
    g_hub = hub.get();

    if (!hub->initialize()) {
        std::cerr << "Failed to initialize minerhub\n";
        return 1;
    }

    hub->run();

    std::cout << "\nStopping all miners...\n";
    const bool clean = hub->shutdown();
    g_hub = nullptr;

    if (!clean) {
        std::cerr << "Shutdown incomplete: some miner processes may still be running\n";
        return 2;
    }
    std::cout << "MinerHub stopped.\n";
    return 0;
}
