#ifndef PROGRESS_ESTIMATOR_HPP
#define PROGRESS_ESTIMATOR_HPP

#include <QElapsedTimer>
#include <deque>

// Smoothed time-remaining estimate. Each observation contributes the
// throughput since the previous one; the estimate uses the mean of the
// last window_size samples so one slow file does not swing the ETA.
// Advisory only.
class ProgressEstimator {
public:
    explicit ProgressEstimator(int window_size = kDefaultWindow);

    void start();
    void reset();

    // Uses the internal clock started by start().
    void observe(qint64 done, qint64 total);
    // Explicit clock, milliseconds since start.
    void observe(qint64 done, qint64 total, qint64 elapsed_ms);

    // 0.0 - 1.0, never decreases between start() calls.
    double fraction() const { return fraction_; }
    // >= 0; 0 when nothing remains or no rate is known yet.
    double seconds_remaining() const { return seconds_remaining_; }
    bool has_estimate() const { return !samples_.empty(); }
    int sample_count() const { return static_cast<int>(samples_.size()); }

    void finish();

    static constexpr int kDefaultWindow = 10;

private:
    int window_size_;
    std::deque<double> samples_;     // items per second
    QElapsedTimer timer_;
    qint64 last_done_ = 0;
    qint64 last_ms_ = 0;
    double fraction_ = 0.0;
    double seconds_remaining_ = 0.0;
};

#endif // PROGRESS_ESTIMATOR_HPP
