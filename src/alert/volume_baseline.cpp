#include "alert/volume_baseline.hpp"

namespace moverwatch {

VolumeBaseline::VolumeBaseline(std::size_t window_size, std::size_t min_samples)
    : window_size_(window_size)
    , min_samples_(min_samples)
{}

void VolumeBaseline::add(Shares volume) {
    samples_.push_back(volume);
    sum_ += volume;

    // Remove oldest sample if window is full
    if (samples_.size() > window_size_) {
        sum_ -= samples_.front();
        samples_.pop_front();
    }
}

std::optional<double> VolumeBaseline::average() const noexcept {
    if (samples_.empty() || samples_.size() < min_samples_) {
        return std::nullopt;
    }
    return static_cast<double>(sum_) / static_cast<double>(samples_.size());
}

std::size_t VolumeBaseline::sample_count() const noexcept {
    return samples_.size();
}

VolumeBaselineTracker::VolumeBaselineTracker(std::size_t window_size, std::size_t min_samples)
    : window_size_(window_size)
    , min_samples_(min_samples)
{}

std::optional<double> VolumeBaselineTracker::observe(const Symbol& symbol, Shares volume) {
    std::lock_guard lock(mutex_);

    auto it = baselines_.find(symbol);
    if (it == baselines_.end()) {
        it = baselines_.emplace(symbol, VolumeBaseline(window_size_, min_samples_)).first;
    }

    it->second.add(volume);
    return it->second.average();
}

std::optional<double> VolumeBaselineTracker::average(const Symbol& symbol) const {
    std::lock_guard lock(mutex_);

    auto it = baselines_.find(symbol);
    if (it == baselines_.end()) {
        return std::nullopt;
    }
    return it->second.average();
}

std::size_t VolumeBaselineTracker::sample_count(const Symbol& symbol) const {
    std::lock_guard lock(mutex_);

    auto it = baselines_.find(symbol);
    return it == baselines_.end() ? 0 : it->second.sample_count();
}

std::size_t VolumeBaselineTracker::symbol_count() const {
    std::lock_guard lock(mutex_);
    return baselines_.size();
}

}  // namespace moverwatch
