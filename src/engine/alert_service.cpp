#include "engine/alert_service.hpp"
#include "market/market_clock.hpp"
#include "mboum/mboum_client.hpp"
#include "network/ssl_context.hpp"
#include "telegram/telegram_notifier.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace moverwatch {

namespace {

MarketClock make_clock(const Config::Market& market) {
    auto clock = MarketClock::from_config(market);
    if (clock.is_err()) {
        throw std::runtime_error(clock.error());
    }
    return std::move(clock).value();
}

WallTime wall_now() {
    return std::chrono::system_clock::now();
}

}  // namespace

AlertService::AlertService(const Config& config)
    : config_(config)
{
    setup_logging(config.logging);

    auto ssl_ctx = network::create_ssl_context();
    source_ = std::make_unique<mboum::MboumClient>(config, ssl_ctx);
    notifier_ = std::make_unique<telegram::TelegramNotifier>(config, ssl_ctx);
    engine_ = std::make_unique<AlertEngine>(config, make_clock(config.market), *source_, *notifier_);

    scheduler_ = std::make_unique<TaskScheduler>(
        [this]() { return engine_->market_open(); },
        [this](const std::string& task, const std::string& reason) {
            engine_->report_task_failure(task, reason);
        }
    );

    register_tasks();
}

AlertService::~AlertService() {
    request_shutdown();
    spdlog::shutdown();
}

void AlertService::setup_logging(const Config::Logging& logging) {
    // Initialize async logging to avoid blocking the scheduler
    spdlog::init_thread_pool(8192, 1);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!logging.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logging.file, logging.max_file_size, logging.max_files));
    }

    auto logger = std::make_shared<spdlog::async_logger>(
        "moverwatch",
        sinks.begin(),
        sinks.end(),
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(logging.level));
    spdlog::flush_on(spdlog::level::warn);
}

void AlertService::register_tasks() {
    const auto& schedule = config_.schedule;
    const auto start = TaskScheduler::Clock::now();

    // Market check first: later tasks in a tick are gated on its result
    scheduler_->add_task("market-check", schedule.market_check, TaskGate::Always,
        [this]() { engine_->check_market_state(wall_now()); }, start);

    scheduler_->add_task("primary-scan", schedule.primary_scan, TaskGate::MarketOpen,
        [this]() { (void)engine_->scan_top_movers(wall_now()); }, start);

    scheduler_->add_task("watchlist-sweep", schedule.watchlist_sweep, TaskGate::MarketOpen,
        [this]() { (void)engine_->sweep_watchlist(wall_now()); }, start + schedule.watchlist_sweep);

    scheduler_->add_task("options-scan", schedule.options_scan, TaskGate::MarketOpen,
        [this]() { (void)engine_->scan_unusual_options(wall_now()); }, start);

    scheduler_->add_task("summary", schedule.summary, TaskGate::MarketOpen,
        [this]() { (void)engine_->send_summary(wall_now()); }, start);

    scheduler_->add_task("housekeeping", schedule.housekeeping, TaskGate::Always,
        [this]() { engine_->housekeeping(wall_now()); }, start + schedule.housekeeping);

    scheduler_->add_task("heartbeat", schedule.heartbeat, TaskGate::MarketClosed,
        [this]() { engine_->send_heartbeat(wall_now()); }, start + schedule.heartbeat);
}

void AlertService::run() {
    spdlog::info("Starting moverwatch alert service");
    spdlog::info("Market hours {:02d}:00-{:02d}:00 ({}), cooldown {}s",
                 config_.market.open_hour, config_.market.close_hour,
                 config_.market.timezone, config_.tracking.cooldown.count());

    engine_->announce_startup(wall_now());

    scheduler_->run(shutdown_requested_);

    engine_->announce_shutdown();
    spdlog::info("Alert service shutdown complete after {} scans", engine_->scan_count());
}

void AlertService::request_shutdown() noexcept {
    shutdown_requested_.store(true);
}

}  // namespace moverwatch
