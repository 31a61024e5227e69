#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace moverwatch {

// Quote prices in USD
using Price = double;

// Share counts and traded volume. Provider volumes can exceed 2^31.
using Shares = std::int64_t;

// Percent values as quoted by the provider (6.0 means +6%)
using Percent = double;

// Ticker symbol, uppercase (e.g. "AAPL")
using Symbol = std::string;

// Monotonic time for scheduler deadlines
using Timestamp = std::chrono::steady_clock::time_point;

// Wall clock time for market hours, cooldowns and message text
using WallTime = std::chrono::system_clock::time_point;

}  // namespace moverwatch
