#include "ScanProgressTracker.hpp"

void ScanProgressTracker::reset() {
    QMutexLocker locker(&mutex_);
    progress_ = ScanProgress();
    errors_.clear();
}

void ScanProgressTracker::publish(const ScanProgress& progress) {
    QMutexLocker locker(&mutex_);
    progress_ = progress;
    progress_.error_count = static_cast<int>(errors_.size());
}

void ScanProgressTracker::append_errors(const std::vector<ScanError>& errors) {
    if (errors.empty()) return;
    QMutexLocker locker(&mutex_);
    errors_.insert(errors_.end(), errors.begin(), errors.end());
    progress_.error_count = static_cast<int>(errors_.size());
}

ScanProgress ScanProgressTracker::snapshot() const {
    QMutexLocker locker(&mutex_);
    return progress_;
}

std::vector<ScanError> ScanProgressTracker::errors() const {
    QMutexLocker locker(&mutex_);
    return errors_;
}

int ScanProgressTracker::error_count() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(errors_.size());
}
