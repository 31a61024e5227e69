#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace moverwatch {

/// Immutable configuration for moverwatch
struct Config {
    /// Secrets, normally supplied through the environment
    struct Credentials {
        std::string mboum_api_key;
        std::string telegram_bot_token;
        std::string telegram_chat_id;
    };

    /// Remote endpoints for the data source and the messaging sink
    struct Network {
        std::string data_host = "api.mboum.com";
        std::string data_port = "443";
        std::string notify_host = "api.telegram.org";
        std::string notify_port = "443";

        // Upper bound for one HTTPS call (resolve through response)
        std::chrono::milliseconds request_timeout{10000};
    };

    /// Trading session definition
    struct Market {
        // POSIX TZ rule, US Eastern with DST
        std::string timezone = "EST5EDT,M3.2.0,M11.1.0";
        int open_hour = 6;    // inclusive
        int close_hour = 18;  // exclusive
    };

    /// Alert thresholds
    struct Rules {
        Percent min_percent_move = 5.0;

        Price exact_bid_price = 199999.0;
        Shares exact_bid_size = 100;

        Price high_value_bid_price = 2000.0;
        Shares high_value_bid_size = 20;

        // Shared by the unusual-insider rule and the large-sale follow-up
        Shares insider_share_floor = 10000;

        double options_volume_oi_ratio = 5.0;
        Shares options_volume_floor = 5000;
    };

    /// In-memory state sizing
    struct Tracking {
        std::size_t volume_window = 30;
        std::size_t volume_min_samples = 5;
        std::chrono::seconds cooldown{300};
        std::chrono::minutes watchlist_ttl{480};
        std::size_t top_movers_limit = 25;
        std::size_t summary_size = 5;
    };

    /// Task intervals
    struct Schedule {
        std::chrono::seconds primary_scan{30};
        std::chrono::seconds options_scan{180};
        std::chrono::seconds summary{300};
        std::chrono::seconds watchlist_sweep{30};
        std::chrono::seconds market_check{60};
        std::chrono::seconds housekeeping{600};
        std::chrono::seconds heartbeat{300};
    };

    struct Logging {
        std::string level = "info";
        std::string file;  // empty disables the file sink
        std::size_t max_file_size = 5 * 1024 * 1024;
        std::size_t max_files = 3;
    };

    Credentials credentials;
    Network network;
    Market market;
    Rules rules;
    Tracking tracking;
    Schedule schedule;
    Logging logging;

    /// Create default configuration (no credentials)
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);

    /// List every problem that must prevent startup (missing credentials,
    /// inconsistent values). Empty when the configuration is usable.
    [[nodiscard]] std::vector<std::string> validate() const;
};

}  // namespace moverwatch
