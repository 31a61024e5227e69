#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace moverwatch {

/// Rolling window of volume samples for one symbol
class VolumeBaseline {
public:
    /// Create a baseline
    /// @param window_size Maximum number of retained samples (FIFO eviction)
    /// @param min_samples Samples required before average() is defined
    VolumeBaseline(std::size_t window_size, std::size_t min_samples);

    /// Append a sample, evicting the oldest one when over capacity
    void add(Shares volume);

    /// Mean of retained samples, nullopt below min_samples
    [[nodiscard]] std::optional<double> average() const noexcept;

    [[nodiscard]] std::size_t sample_count() const noexcept;

private:
    std::deque<Shares> samples_;
    std::size_t window_size_;
    std::size_t min_samples_;

    // Exact integer running sum keeps averages reproducible
    Shares sum_{0};
};

/// Per-symbol volume baselines, created lazily on first sighting.
/// Guarded by one coarse lock.
class VolumeBaselineTracker {
public:
    VolumeBaselineTracker(std::size_t window_size, std::size_t min_samples);

    /// Record a volume sample for symbol
    /// @return Average including this sample, nullopt below min_samples
    std::optional<double> observe(const Symbol& symbol, Shares volume);

    /// Current average without recording anything
    [[nodiscard]] std::optional<double> average(const Symbol& symbol) const;

    [[nodiscard]] std::size_t sample_count(const Symbol& symbol) const;

    /// Number of symbols with a baseline
    [[nodiscard]] std::size_t symbol_count() const;

private:
    std::size_t window_size_;
    std::size_t min_samples_;

    mutable std::mutex mutex_;
    std::unordered_map<Symbol, VolumeBaseline> baselines_;
};

}  // namespace moverwatch
