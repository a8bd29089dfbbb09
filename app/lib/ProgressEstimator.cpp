#include "ProgressEstimator.hpp"
#include <algorithm>
#include <numeric>

ProgressEstimator::ProgressEstimator(int window_size)
    : window_size_(std::max(1, window_size)) {
}

void ProgressEstimator::start() {
    reset();
    timer_.start();
}

void ProgressEstimator::reset() {
    samples_.clear();
    timer_.invalidate();
    last_done_ = 0;
    last_ms_ = 0;
    fraction_ = 0.0;
    seconds_remaining_ = 0.0;
}

void ProgressEstimator::observe(qint64 done, qint64 total) {
    if (!timer_.isValid()) timer_.start();
    observe(done, total, timer_.elapsed());
}

void ProgressEstimator::observe(qint64 done, qint64 total, qint64 elapsed_ms) {
    if (total > 0) {
        double current = static_cast<double>(std::min(done, total)) / static_cast<double>(total);
        fraction_ = std::max(fraction_, current);
    }

    // Same-millisecond observations fold into the next sample
    qint64 delta_ms = elapsed_ms - last_ms_;
    qint64 delta_done = done - last_done_;
    if (delta_ms > 0 && delta_done >= 0) {
        samples_.push_back(static_cast<double>(delta_done) * 1000.0 / static_cast<double>(delta_ms));
        while (static_cast<int>(samples_.size()) > window_size_) {
            samples_.pop_front();
        }
        last_ms_ = elapsed_ms;
        last_done_ = done;
    }

    qint64 remaining = total - done;
    if (remaining <= 0 || samples_.empty()) {
        seconds_remaining_ = 0.0;
        return;
    }

    double mean_rate = std::accumulate(samples_.begin(), samples_.end(), 0.0)
                       / static_cast<double>(samples_.size());
    if (mean_rate <= 0.0) {
        // Stalled window; keep the previous figure rather than divide by zero
        return;
    }
    seconds_remaining_ = static_cast<double>(remaining) / mean_rate;
}

void ProgressEstimator::finish() {
    fraction_ = 1.0;
    seconds_remaining_ = 0.0;
}
