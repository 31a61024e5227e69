#pragma once

#include "core/config.hpp"
#include "engine/alert_engine.hpp"
#include "engine/task_scheduler.hpp"
#include "market/data_source.hpp"
#include "output/notifier.hpp"
#include <atomic>
#include <memory>

namespace moverwatch {

/// Process-level wiring: logging, HTTPS collaborators, the alert engine
/// and its task table. run() blocks until request_shutdown().
class AlertService {
public:
    /// Create the service with the production Mboum and Telegram adapters
    /// @param config Validated application configuration
    /// @throws std::runtime_error if the market timezone cannot be parsed
    explicit AlertService(const Config& config);

    ~AlertService();

    // Non-copyable, non-movable
    AlertService(const AlertService&) = delete;
    AlertService& operator=(const AlertService&) = delete;

    /// Start the scheduler loop (blocks until shutdown)
    void run();

    /// Request graceful shutdown (safe from a signal handler)
    void request_shutdown() noexcept;

    /// Configure the default spdlog logger from the logging section
    static void setup_logging(const Config::Logging& logging);

private:
    void register_tasks();

    const Config& config_;

    std::unique_ptr<DataSource> source_;
    std::unique_ptr<output::Notifier> notifier_;
    std::unique_ptr<AlertEngine> engine_;
    std::unique_ptr<TaskScheduler> scheduler_;

    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace moverwatch
