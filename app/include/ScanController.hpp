#ifndef SCAN_CONTROLLER_HPP
#define SCAN_CONTROLLER_HPP

#include "DuplicateScanner.hpp"
#include "ScanProgressTracker.hpp"
#include "ScanSettings.hpp"
#include "ScanTypes.hpp"

#include <QMutex>
#include <QThread>
#include <memory>

enum class ControllerState {
    Idle,
    Scanning,
    Completed,
    Cancelled,
    Failed
};

enum class StartStatus {
    Started,
    InvalidConfiguration,
    Busy
};

// Runs scans on a background thread, one at a time.
//
// The owning thread starts a scan, polls progress() or receives batched
// progress through the callback (invoked on the scan thread), may cancel,
// and finally takes the result, which returns the controller to Idle.
// start(), cancel(), state() and the progress accessors may be called from
// any thread; wait() and the setters belong to the owning thread.
class ScanController {
public:
    explicit ScanController(const FileAttributeProvider& attributes = NativeFileAttributeProvider::shared());
    ~ScanController();

    ScanController(const ScanController&) = delete;
    ScanController& operator=(const ScanController&) = delete;

    StartStatus start(const ScanRequest& request, QString* error = nullptr);
    void cancel();

    ControllerState state() const;
    bool is_running() const { return state() == ControllerState::Scanning; }

    ScanProgress progress() const { return tracker_.snapshot(); }
    std::vector<ScanError> errors_so_far() const { return tracker_.errors(); }

    // True once the scan thread has finished (or none was started).
    // Negative timeout waits forever.
    bool wait(int timeout_ms = -1);

    // Hands over a finished scan's result and returns to Idle.
    bool take_result(ScanResult& result);

    // Apply to the next start().
    void set_progress_callback(DuplicateScanner::ProgressCallback callback);
    void set_observer(ScanObserver* observer);

    static QString state_name(ControllerState state);

private:
    void join_worker();

    const FileAttributeProvider& attributes_;
    ScanProgressTracker tracker_;
    std::unique_ptr<DuplicateScanner> scanner_;
    std::unique_ptr<QThread> worker_;
    DuplicateScanner::ProgressCallback progress_callback_;
    ScanObserver* observer_ = nullptr;

    mutable QMutex mutex_;
    ControllerState state_ = ControllerState::Idle;
    ScanResult result_;
    bool has_result_ = false;
};

#endif // SCAN_CONTROLLER_HPP
