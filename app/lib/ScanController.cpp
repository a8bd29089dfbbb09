#include "ScanController.hpp"
#include "AppLogger.hpp"
#include <QDeadlineTimer>

namespace {

ControllerState state_for(ScanStatus status) {
    switch (status) {
        case ScanStatus::Completed: return ControllerState::Completed;
        case ScanStatus::Cancelled: return ControllerState::Cancelled;
        case ScanStatus::Failed:    return ControllerState::Failed;
    }
    return ControllerState::Failed;
}

}

ScanController::ScanController(const FileAttributeProvider& attributes)
    : attributes_(attributes) {
}

ScanController::~ScanController() {
    if (scanner_) scanner_->cancel();
    join_worker();
}

QString ScanController::state_name(ControllerState state) {
    switch (state) {
        case ControllerState::Idle:      return "idle";
        case ControllerState::Scanning:  return "scanning";
        case ControllerState::Completed: return "completed";
        case ControllerState::Cancelled: return "cancelled";
        case ControllerState::Failed:    return "failed";
    }
    return "unknown";
}

void ScanController::join_worker() {
    if (worker_) {
        worker_->wait();
        worker_.reset();
    }
}

StartStatus ScanController::start(const ScanRequest& request, QString* error) {
    // Held for the whole start so the busy check and the claim are one step
    // and cancel() never sees a half-built scanner. Joining under the lock is
    // safe: a worker that is no longer Scanning has left its locked section.
    QMutexLocker locker(&mutex_);
    if (state_ == ControllerState::Scanning) {
        if (error) *error = "A scan is already in progress";
        LOG_WARN("Controller", "Scan request rejected: busy");
        return StartStatus::Busy;
    }

    QString reason;
    if (!request.validate(&reason)) {
        if (error) *error = reason;
        LOG_ERROR("Controller", QString("Invalid scan request: %1").arg(reason));
        return StartStatus::InvalidConfiguration;
    }

    // Previous scan finished; drop its thread and any unclaimed result
    join_worker();
    tracker_.reset();
    scanner_ = std::make_unique<DuplicateScanner>(tracker_, attributes_);
    scanner_->set_progress_callback(progress_callback_);
    scanner_->set_observer(observer_);

    state_ = ControllerState::Scanning;
    result_ = ScanResult();
    has_result_ = false;

    DuplicateScanner* scanner = scanner_.get();
    worker_.reset(QThread::create([this, scanner, request]() {
        ScanResult scan_result = scanner->run(request);
        QMutexLocker worker_locker(&mutex_);
        state_ = state_for(scan_result.status);
        result_ = std::move(scan_result);
        has_result_ = true;
    }));
    worker_->setObjectName("DuplicateScan");
    worker_->start();
    return StartStatus::Started;
}

void ScanController::cancel() {
    QMutexLocker locker(&mutex_);
    if (state_ != ControllerState::Scanning || !scanner_) return;
    LOG_INFO("Controller", "Stop requested...");
    scanner_->cancel();
}

ControllerState ScanController::state() const {
    QMutexLocker locker(&mutex_);
    return state_;
}

bool ScanController::wait(int timeout_ms) {
    if (!worker_) return true;
    QDeadlineTimer deadline = timeout_ms < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                             : QDeadlineTimer(timeout_ms);
    return worker_->wait(deadline);
}

bool ScanController::take_result(ScanResult& result) {
    QMutexLocker locker(&mutex_);
    if (!has_result_) return false;
    result = std::move(result_);
    result_ = ScanResult();
    has_result_ = false;
    state_ = ControllerState::Idle;
    return true;
}

void ScanController::set_progress_callback(DuplicateScanner::ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void ScanController::set_observer(ScanObserver* observer) {
    observer_ = observer;
}
