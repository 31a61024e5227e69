#include "engine/task_scheduler.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <thread>

namespace moverwatch {

TaskScheduler::TaskScheduler(MarketOpenFn market_open, FailureHandler on_failure)
    : market_open_(std::move(market_open))
    , on_failure_(std::move(on_failure))
{}

void TaskScheduler::add_task(std::string name,
                             std::chrono::seconds interval,
                             TaskGate gate,
                             TaskFn fn,
                             Timestamp first_due) {
    spdlog::debug("Task {} every {}s ({})", name, interval.count(), to_string(gate));

    tasks_.push_back(Task{
        .name = std::move(name),
        .interval = interval,
        .gate = gate,
        .fn = std::move(fn),
        .next_due = first_due,
        .stats = {}
    });
}

bool TaskScheduler::gate_open(TaskGate gate) const {
    switch (gate) {
        case TaskGate::Always:       return true;
        case TaskGate::MarketOpen:   return market_open_();
        case TaskGate::MarketClosed: return !market_open_();
    }
    return false;
}

std::size_t TaskScheduler::run_due(Timestamp now) {
    std::size_t executed = 0;

    for (auto& task : tasks_) {
        if (now < task.next_due) {
            continue;
        }

        // Missed beats are dropped rather than replayed
        task.next_due += task.interval;
        if (task.next_due <= now) {
            task.next_due = now + task.interval;
        }

        if (!gate_open(task.gate)) {
            ++task.stats.gated;
            continue;
        }

        execute(task);
        ++executed;
    }

    return executed;
}

void TaskScheduler::execute(Task& task) {
    ++task.stats.runs;

    try {
        task.fn();
    } catch (const std::exception& e) {
        report_failure(task, e.what());
    } catch (...) {
        report_failure(task, "unknown exception");
    }
}

void TaskScheduler::report_failure(Task& task, const std::string& reason) {
    ++task.stats.failures;
    spdlog::error("Task {} failed: {}", task.name, reason);

    if (!on_failure_) {
        return;
    }
    try {
        on_failure_(task.name, reason);
    } catch (const std::exception& e) {
        spdlog::error("Failure report for {} failed: {}", task.name, e.what());
    } catch (...) {
        spdlog::error("Failure report for {} failed: unknown exception", task.name);
    }
}

std::optional<Timestamp> TaskScheduler::next_due() const {
    if (tasks_.empty()) {
        return std::nullopt;
    }
    auto earliest = std::min_element(tasks_.begin(), tasks_.end(),
        [](const Task& a, const Task& b) { return a.next_due < b.next_due; });
    return earliest->next_due;
}

void TaskScheduler::run(const std::atomic<bool>& stop, std::chrono::milliseconds max_sleep) {
    spdlog::debug("Scheduler loop started with {} tasks", tasks_.size());

    while (!stop.load()) {
        auto now = Clock::now();
        run_due(now);

        auto wake = now + max_sleep;
        if (auto due = next_due(); due && *due < wake) {
            wake = *due;
        }
        if (!stop.load()) {
            std::this_thread::sleep_until(wake);
        }
    }

    spdlog::debug("Scheduler loop stopped");
}

std::optional<TaskStats> TaskScheduler::stats(std::string_view name) const {
    for (const auto& task : tasks_) {
        if (task.name == name) {
            return task.stats;
        }
    }
    return std::nullopt;
}

}  // namespace moverwatch
