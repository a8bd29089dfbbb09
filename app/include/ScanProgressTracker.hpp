#ifndef SCAN_PROGRESS_TRACKER_HPP
#define SCAN_PROGRESS_TRACKER_HPP

#include "ScanTypes.hpp"

#include <QMutex>
#include <vector>

// Progress and error records shared between the scan thread (single
// writer) and any number of readers. Readers always get a whole copy
// taken under the lock, so fraction and ETA never come from different
// updates.
class ScanProgressTracker {
public:
    void reset();

    void publish(const ScanProgress& progress);
    void append_errors(const std::vector<ScanError>& errors);

    ScanProgress snapshot() const;
    std::vector<ScanError> errors() const;
    int error_count() const;

private:
    mutable QMutex mutex_;
    ScanProgress progress_;
    std::vector<ScanError> errors_;
};

#endif // SCAN_PROGRESS_TRACKER_HPP
