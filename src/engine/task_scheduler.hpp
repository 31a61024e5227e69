#pragma once

#include "core/types.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moverwatch {

/// Market condition a task needs before its body runs
enum class TaskGate {
    Always,
    MarketOpen,
    MarketClosed
};

[[nodiscard]] constexpr std::string_view to_string(TaskGate gate) noexcept {
    switch (gate) {
        case TaskGate::Always:       return "always";
        case TaskGate::MarketOpen:   return "market-open";
        case TaskGate::MarketClosed: return "market-closed";
    }
    return "unknown";
}

/// Per-task counters
struct TaskStats {
    std::uint64_t runs{0};
    std::uint64_t failures{0};
    std::uint64_t gated{0};  // due but skipped by the market gate
};

/// Explicit task table advanced by a single loop.
///
/// Each task has its own interval and next-due time. Due tasks run in
/// registration order, so a market check registered first sets the state
/// every later task in the same tick is gated on. A task that throws is
/// logged and reported through the failure handler; the other due tasks
/// still run.
class TaskScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TaskFn = std::function<void()>;
    using MarketOpenFn = std::function<bool()>;
    using FailureHandler = std::function<void(const std::string& task, const std::string& reason)>;

    /// Create a scheduler
    /// @param market_open Current market state, read at each gated run
    /// @param on_failure Called after a task throws
    TaskScheduler(MarketOpenFn market_open, FailureHandler on_failure);

    /// Register a task
    /// @param name Identifier for logs and failure reports
    /// @param interval Time between runs
    /// @param gate Market condition required to run the body
    /// @param fn Task body
    /// @param first_due When the task first becomes due
    void add_task(std::string name,
                  std::chrono::seconds interval,
                  TaskGate gate,
                  TaskFn fn,
                  Timestamp first_due);

    /// Run every task due at `now`
    /// @return Number of task bodies executed (including failed ones)
    std::size_t run_due(Timestamp now);

    /// Earliest next-due time, nullopt when no task is registered
    [[nodiscard]] std::optional<Timestamp> next_due() const;

    /// Loop until `stop` is set, sleeping to the next deadline but never
    /// longer than `max_sleep`
    void run(const std::atomic<bool>& stop,
             std::chrono::milliseconds max_sleep = std::chrono::milliseconds{1000});

    [[nodiscard]] std::size_t task_count() const noexcept { return tasks_.size(); }

    [[nodiscard]] std::optional<TaskStats> stats(std::string_view name) const;

private:
    struct Task {
        std::string name;
        std::chrono::seconds interval;
        TaskGate gate;
        TaskFn fn;
        Timestamp next_due;
        TaskStats stats;
    };

    [[nodiscard]] bool gate_open(TaskGate gate) const;
    void execute(Task& task);
    void report_failure(Task& task, const std::string& reason);

    MarketOpenFn market_open_;
    FailureHandler on_failure_;
    std::vector<Task> tasks_;
};

}  // namespace moverwatch
