#include "termdash/dashboard.hpp"
#include <iostream>
#include <csignal>
#include <memory>
#include <string>

// Global pointer for signal handler
termdash::Dashboard* g_dashboard = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_dashboard) {
            g_dashboard->stop();
        }
    }
}

void print_usage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [-c config_file]\n";
    out << "\n";
    out << "Options:\n";
    out << "  -c, --config FILE  Read settings from a YAML file (default: built-in settings)\n";
    out << "  -h, --help         Show this help message\n";
    out << "\n";
    out << "Keys:\n";
    out << "  q / Esc            Quit\n";
    out << "  Up/Down, k/j       Move the selection\n";
    out << "  /                  Filter processes by name (Enter keeps, Esc clears)\n";
    out << "  x / Delete         Kill the selected process\n";
    out << "  Enter              Show details of the selected process\n";
    out << "  t                  Next color theme\n";
    out << "\n";
}

int main(int argc, char* argv[]) {
    // Parse command-line arguments
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(std::cout, argv[0]);
            return 0;
        }
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        std::cerr << "termdash: unexpected argument '" << arg << "'\n";
        print_usage(std::cerr, argv[0]);
        return 2;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    termdash::install_crash_handlers();

    // Create and initialize dashboard
    auto dashboard = std::make_unique<termdash::Dashboard>(config_path);
    g_dashboard = dashboard.get();

    if (!dashboard->initialize()) {
        std::cerr << "Failed to initialize termdash\n";
        return 1;
    }

    // Run event loop
    try {
        dashboard->run();
    } catch (const std::exception& e) {
        termdash::DebugLogger::log("fatal: ", e.what());
        g_dashboard = nullptr;
        std::cerr << "termdash: " << e.what() << "\n";
        return 1;
    }

    g_dashboard = nullptr;
    return 0;
}
