#include "core/config.hpp"
#include "market/market_clock.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace moverwatch {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set or empty
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<long long> get_env_int(const char* name,
                                     long long min_val = std::numeric_limits<long long>::min(),
                                     long long max_val = std::numeric_limits<long long>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        long long result = std::stoll(*value);
        if (result < min_val || result > max_val) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid integer value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Get environment variable as a strictly positive double
std::optional<double> get_env_positive(const char* name) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        double result = std::stod(*value);
        if (result <= 0.0) {
            std::cerr << "Warning: " << name << " must be positive, ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid numeric value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Seconds override: 1 second to 1 day
std::optional<std::chrono::seconds> get_env_seconds(const char* name) {
    if (auto v = get_env_int(name, 1, 86400)) {
        return std::chrono::seconds(*v);
    }
    return std::nullopt;
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Credentials keep their conventional names
    if (auto v = get_env("MBOUM_API_KEY")) {
        config.credentials.mboum_api_key = *v;
    }
    if (auto v = get_env("TELEGRAM_BOT_TOKEN")) {
        config.credentials.telegram_bot_token = *v;
    }
    if (auto v = get_env("TELEGRAM_CHAT_ID")) {
        config.credentials.telegram_chat_id = *v;
    }

    // Network
    if (auto v = get_env("MOVERWATCH_DATA_HOST")) {
        config.network.data_host = *v;
    }
    if (auto v = get_env("MOVERWATCH_NOTIFY_HOST")) {
        config.network.notify_host = *v;
    }
    // Request timeout: 1 to 60 seconds
    if (auto v = get_env_int("MOVERWATCH_REQUEST_TIMEOUT_MS", 1000, 60000)) {
        config.network.request_timeout = std::chrono::milliseconds(*v);
    }

    // Market
    if (auto v = get_env("MOVERWATCH_TIMEZONE")) {
        config.market.timezone = *v;
    }
    if (auto v = get_env_int("MOVERWATCH_OPEN_HOUR", 0, 23)) {
        config.market.open_hour = static_cast<int>(*v);
    }
    if (auto v = get_env_int("MOVERWATCH_CLOSE_HOUR", 1, 24)) {
        config.market.close_hour = static_cast<int>(*v);
    }

    // Rules
    if (auto v = get_env_positive("MOVERWATCH_MIN_PERCENT_MOVE")) {
        config.rules.min_percent_move = *v;
    }
    if (auto v = get_env_positive("MOVERWATCH_EXACT_BID_PRICE")) {
        config.rules.exact_bid_price = *v;
    }
    if (auto v = get_env_int("MOVERWATCH_EXACT_BID_SIZE", 1)) {
        config.rules.exact_bid_size = *v;
    }
    if (auto v = get_env_positive("MOVERWATCH_HIGH_VALUE_BID_PRICE")) {
        config.rules.high_value_bid_price = *v;
    }
    if (auto v = get_env_int("MOVERWATCH_HIGH_VALUE_BID_SIZE", 1)) {
        config.rules.high_value_bid_size = *v;
    }
    if (auto v = get_env_int("MOVERWATCH_INSIDER_SHARE_FLOOR", 1)) {
        config.rules.insider_share_floor = *v;
    }
    if (auto v = get_env_positive("MOVERWATCH_OPTIONS_VOLUME_OI_RATIO")) {
        config.rules.options_volume_oi_ratio = *v;
    }
    if (auto v = get_env_int("MOVERWATCH_OPTIONS_VOLUME_FLOOR", 1)) {
        config.rules.options_volume_floor = *v;
    }

    // Tracking
    if (auto v = get_env_int("MOVERWATCH_VOLUME_WINDOW", 1, 10000)) {
        config.tracking.volume_window = static_cast<std::size_t>(*v);
    }
    if (auto v = get_env_int("MOVERWATCH_VOLUME_MIN_SAMPLES", 1, 10000)) {
        config.tracking.volume_min_samples = static_cast<std::size_t>(*v);
    }
    if (auto v = get_env_seconds("MOVERWATCH_COOLDOWN_SECONDS")) {
        config.tracking.cooldown = *v;
    }
    if (auto v = get_env_int("MOVERWATCH_WATCHLIST_TTL_MINUTES", 1, 7 * 24 * 60)) {
        config.tracking.watchlist_ttl = std::chrono::minutes(*v);
    }
    if (auto v = get_env_int("MOVERWATCH_TOP_MOVERS_LIMIT", 1, 250)) {
        config.tracking.top_movers_limit = static_cast<std::size_t>(*v);
    }
    if (auto v = get_env_int("MOVERWATCH_SUMMARY_SIZE", 1, 50)) {
        config.tracking.summary_size = static_cast<std::size_t>(*v);
    }

    // Schedule
    if (auto v = get_env_seconds("MOVERWATCH_PRIMARY_SCAN_SECONDS")) {
        config.schedule.primary_scan = *v;
    }
    if (auto v = get_env_seconds("MOVERWATCH_OPTIONS_SCAN_SECONDS")) {
        config.schedule.options_scan = *v;
    }
    if (auto v = get_env_seconds("MOVERWATCH_SUMMARY_SECONDS")) {
        config.schedule.summary = *v;
    }
    if (auto v = get_env_seconds("MOVERWATCH_WATCHLIST_SWEEP_SECONDS")) {
        config.schedule.watchlist_sweep = *v;
    }
    if (auto v = get_env_seconds("MOVERWATCH_MARKET_CHECK_SECONDS")) {
        config.schedule.market_check = *v;
    }
    if (auto v = get_env_seconds("MOVERWATCH_HOUSEKEEPING_SECONDS")) {
        config.schedule.housekeeping = *v;
    }
    if (auto v = get_env_seconds("MOVERWATCH_HEARTBEAT_SECONDS")) {
        config.schedule.heartbeat = *v;
    }

    // Logging
    if (auto v = get_env("MOVERWATCH_LOG_LEVEL")) {
        config.logging.level = *v;
    }
    if (auto v = get_env("MOVERWATCH_LOG_FILE")) {
        config.logging.file = *v;
    }
}

/// Copy obj[key] into out when present
template <typename T>
void read_field(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) {
        out = obj[key].get<T>();
    }
}

/// Copy obj[key] (a count of Duration ticks) into out when present
template <typename Duration>
void read_duration(const json& obj, const char* key, Duration& out) {
    if (obj.contains(key)) {
        out = Duration(obj[key].get<typename Duration::rep>());
    }
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        // Credentials may live in the file for local runs
        if (j.contains("credentials")) {
            const auto& cred = j["credentials"];
            read_field(cred, "mboum_api_key", config.credentials.mboum_api_key);
            read_field(cred, "telegram_bot_token", config.credentials.telegram_bot_token);
            read_field(cred, "telegram_chat_id", config.credentials.telegram_chat_id);
        }

        if (j.contains("network")) {
            const auto& net = j["network"];
            read_field(net, "data_host", config.network.data_host);
            read_field(net, "data_port", config.network.data_port);
            read_field(net, "notify_host", config.network.notify_host);
            read_field(net, "notify_port", config.network.notify_port);
            read_duration(net, "request_timeout_ms", config.network.request_timeout);
        }

        if (j.contains("market")) {
            const auto& mkt = j["market"];
            read_field(mkt, "timezone", config.market.timezone);
            read_field(mkt, "open_hour", config.market.open_hour);
            read_field(mkt, "close_hour", config.market.close_hour);
        }

        if (j.contains("rules")) {
            const auto& rules = j["rules"];
            read_field(rules, "min_percent_move", config.rules.min_percent_move);
            read_field(rules, "exact_bid_price", config.rules.exact_bid_price);
            read_field(rules, "exact_bid_size", config.rules.exact_bid_size);
            read_field(rules, "high_value_bid_price", config.rules.high_value_bid_price);
            read_field(rules, "high_value_bid_size", config.rules.high_value_bid_size);
            read_field(rules, "insider_share_floor", config.rules.insider_share_floor);
            read_field(rules, "options_volume_oi_ratio", config.rules.options_volume_oi_ratio);
            read_field(rules, "options_volume_floor", config.rules.options_volume_floor);
        }

        if (j.contains("tracking")) {
            const auto& trk = j["tracking"];
            read_field(trk, "volume_window", config.tracking.volume_window);
            read_field(trk, "volume_min_samples", config.tracking.volume_min_samples);
            read_duration(trk, "cooldown_seconds", config.tracking.cooldown);
            read_duration(trk, "watchlist_ttl_minutes", config.tracking.watchlist_ttl);
            read_field(trk, "top_movers_limit", config.tracking.top_movers_limit);
            read_field(trk, "summary_size", config.tracking.summary_size);
        }

        if (j.contains("schedule")) {
            const auto& sch = j["schedule"];
            read_duration(sch, "primary_scan_seconds", config.schedule.primary_scan);
            read_duration(sch, "options_scan_seconds", config.schedule.options_scan);
            read_duration(sch, "summary_seconds", config.schedule.summary);
            read_duration(sch, "watchlist_sweep_seconds", config.schedule.watchlist_sweep);
            read_duration(sch, "market_check_seconds", config.schedule.market_check);
            read_duration(sch, "housekeeping_seconds", config.schedule.housekeeping);
            read_duration(sch, "heartbeat_seconds", config.schedule.heartbeat);
        }

        if (j.contains("logging")) {
            const auto& log = j["logging"];
            read_field(log, "level", config.logging.level);
            read_field(log, "file", config.logging.file);
            read_field(log, "max_file_size", config.logging.max_file_size);
            read_field(log, "max_files", config.logging.max_files);
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    // Environment wins over the file
    apply_env_overrides(config);

    return config;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;

    if (credentials.mboum_api_key.empty()) {
        problems.emplace_back("MBOUM_API_KEY is not set");
    }
    if (credentials.telegram_bot_token.empty()) {
        problems.emplace_back("TELEGRAM_BOT_TOKEN is not set");
    }
    if (credentials.telegram_chat_id.empty()) {
        problems.emplace_back("TELEGRAM_CHAT_ID is not set");
    }

    if (market.open_hour < 0 || market.close_hour > 24 ||
        market.open_hour >= market.close_hour) {
        problems.emplace_back("market hours must satisfy 0 <= open_hour < close_hour <= 24");
    }
    if (market.timezone.empty()) {
        problems.emplace_back("market timezone is empty");
    } else if (auto zone = MarketClock::parse_timezone(market.timezone); zone.is_err()) {
        problems.push_back(zone.error());
    }

    const auto levels = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
    bool known_level = false;
    for (const char* level : levels) {
        known_level = known_level || logging.level == level;
    }
    if (!known_level) {
        problems.emplace_back("unknown log level '" + logging.level + "'");
    }

    if (tracking.volume_window == 0) {
        problems.emplace_back("volume_window must be at least 1");
    }
    if (tracking.volume_min_samples == 0 ||
        tracking.volume_min_samples > tracking.volume_window) {
        problems.emplace_back("volume_min_samples must be in [1, volume_window]");
    }
    if (tracking.summary_size == 0 || tracking.top_movers_limit == 0) {
        problems.emplace_back("summary_size and top_movers_limit must be at least 1");
    }

    const auto intervals = {
        schedule.primary_scan, schedule.options_scan, schedule.summary,
        schedule.watchlist_sweep, schedule.market_check, schedule.housekeeping,
        schedule.heartbeat
    };
    for (auto interval : intervals) {
        if (interval.count() <= 0) {
            problems.emplace_back("scan intervals must be positive");
            break;
        }
    }

    return problems;
}

}  // namespace moverwatch
