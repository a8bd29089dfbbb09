#ifndef DUPLICATE_SCANNER_HPP
#define DUPLICATE_SCANNER_HPP

#include "ScanTypes.hpp"
#include "ScanSettings.hpp"
#include "ScanProgressTracker.hpp"
#include "ProgressEstimator.hpp"
#include "FileAttributeProvider.hpp"

#include <QElapsedTimer>
#include <atomic>
#include <functional>

// Hooks into the scan pipeline. Called on the scanning thread.
class ScanObserver {
public:
    virtual ~ScanObserver() = default;

    virtual void on_enumeration_finished(qint64 accepted_files, qint64 candidate_files) {
        Q_UNUSED(accepted_files);
        Q_UNUSED(candidate_files);
    }
    virtual void on_bucket_resolved(const std::vector<DuplicateGroup>& groups) {
        Q_UNUSED(groups);
    }
};

// Runs one complete scan on the calling thread:
// enumerate -> filter -> bucket by size -> hash and regroup by digest.
//
// cancel() may be called from any thread. It is honoured between files,
// never in the middle of hashing one file, and only groups from fully
// resolved buckets survive a cancellation. One instance serves one scan.
class DuplicateScanner {
public:
    using ProgressCallback = std::function<void(const ScanProgress& progress)>;

    explicit DuplicateScanner(ScanProgressTracker& tracker,
                              const FileAttributeProvider& attributes = NativeFileAttributeProvider::shared());

    void set_observer(ScanObserver* observer) { observer_ = observer; }
    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    ScanResult run(const ScanRequest& request);

    void cancel() { cancel_requested_.store(true); }
    bool cancel_requested() const { return cancel_requested_.load(); }

    static constexpr int kProgressBatchFiles = 50;
    static constexpr qint64 kProgressIntervalMs = 250;
    static constexpr int kCollectLogInterval = 100;

private:
    void record_errors(ScanResult& result, const std::vector<ScanError>& errors);
    void publish(const ScanProgress& progress, bool force);
    ScanResult finish(ScanResult& result, ScanStatus status, ScanProgress& progress);

    ScanProgressTracker& tracker_;
    const FileAttributeProvider& attributes_;
    ScanObserver* observer_ = nullptr;
    ProgressCallback progress_callback_;
    ProgressEstimator estimator_;
    QElapsedTimer elapsed_;
    QElapsedTimer publish_timer_;
    qint64 unpublished_files_ = 0;
    std::atomic<bool> cancel_requested_{false};
};

#endif // DUPLICATE_SCANNER_HPP
