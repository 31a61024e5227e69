#include "core/config.hpp"
#include "engine/alert_service.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>

namespace {

std::unique_ptr<moverwatch::AlertService> g_service;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_service) {
            g_service->request_shutdown();
        }
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>     Load configuration from JSON file\n"
              << "  -l, --log-level <level> trace, debug, info, warn, error\n"
              << "      --check-config      Validate configuration and exit\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  MBOUM_API_KEY           Data source API key (required)\n"
              << "  TELEGRAM_BOT_TOKEN      Telegram bot token (required)\n"
              << "  TELEGRAM_CHAT_ID        Telegram chat to alert (required)\n"
              << "  MOVERWATCH_TIMEZONE     POSIX TZ rule for market hours\n"
              << "  MOVERWATCH_OPEN_HOUR    First local hour in session\n"
              << "  MOVERWATCH_CLOSE_HOUR   First local hour out of session\n"
              << "  MOVERWATCH_COOLDOWN_SECONDS  Minimum re-alert interval\n"
              << "  MOVERWATCH_LOG_LEVEL    Log level\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "moverwatch v1.0.0\n"
              << "Top movers alerting for Mboum and Telegram\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    bool check_config = false;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--check-config") {
            args.check_config = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            args.log_level = argv[++i];
        } else {
            std::cerr << "Warning: ignoring unknown argument '" << arg << "'" << std::endl;
        }
    }

    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto config = moverwatch::Config::load(args.config_path);

    if (args.log_level) {
        config.logging.level = *args.log_level;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        std::cerr << "Configuration error:\n";
        for (const auto& problem : problems) {
            std::cerr << "  - " << problem << "\n";
        }
        std::cerr << std::endl;
        return 2;
    }

    std::cout << "Configuration:\n"
              << "  Data source: " << config.network.data_host << ":" << config.network.data_port << "\n"
              << "  Notifier: " << config.network.notify_host << " chat " << config.credentials.telegram_chat_id << "\n"
              << "  Market hours: " << config.market.open_hour << "-" << config.market.close_hour
              << " (" << config.market.timezone << ")\n"
              << "  Primary scan: every " << config.schedule.primary_scan.count() << "s\n"
              << std::endl;

    if (args.check_config) {
        std::cout << "Configuration OK" << std::endl;
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        g_service = std::make_unique<moverwatch::AlertService>(config);
        g_service->run();
        g_service.reset();

        std::cout << "Goodbye!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
