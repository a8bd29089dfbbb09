#include "DuplicateScanner.hpp"
#include "DirectoryEnumerator.hpp"
#include "DuplicateResolver.hpp"
#include "FileFilter.hpp"
#include "SizeGrouper.hpp"
#include "AppLogger.hpp"

DuplicateScanner::DuplicateScanner(ScanProgressTracker& tracker,
                                   const FileAttributeProvider& attributes)
    : tracker_(tracker)
    , attributes_(attributes) {
}

void DuplicateScanner::record_errors(ScanResult& result, const std::vector<ScanError>& errors) {
    if (errors.empty()) return;
    for (const auto& error : errors) {
        LOG_WARN("Scanner", QString("%1: %2 (%3)")
                 .arg(error_kind_name(error.kind), error.path, error.reason));
    }
    result.errors.insert(result.errors.end(), errors.begin(), errors.end());
    tracker_.append_errors(errors);
}

void DuplicateScanner::publish(const ScanProgress& progress, bool force) {
    ++unpublished_files_;
    if (!force && unpublished_files_ < kProgressBatchFiles
        && publish_timer_.elapsed() < kProgressIntervalMs) {
        return;
    }
    unpublished_files_ = 0;
    publish_timer_.restart();

    tracker_.publish(progress);
    if (progress_callback_) {
        progress_callback_(tracker_.snapshot());
    }
}

ScanResult DuplicateScanner::finish(ScanResult& result, ScanStatus status, ScanProgress& progress) {
    result.status = status;
    result.elapsed_ms = elapsed_.elapsed();

    if (status == ScanStatus::Completed) {
        estimator_.finish();
        progress.fraction = estimator_.fraction();
        progress.seconds_remaining = 0.0;
    }
    progress.phase = ScanPhase::Finished;
    publish(progress, true);

    const double seconds = static_cast<double>(result.elapsed_ms) / 1000.0;
    switch (status) {
        case ScanStatus::Completed:
            LOG_INFO("Scanner", QString("Scan completed in %1").arg(format_duration(seconds)));
            LOG_INFO("Scanner", QString("Found %1 groups of duplicate files (%2 duplicates, %3 wasted)")
                     .arg(result.groups.size())
                     .arg(result.duplicate_file_count())
                     .arg(format_size(result.wasted_bytes())));
            break;
        case ScanStatus::Cancelled:
            LOG_INFO("Scanner", QString("Scan cancelled after %1, %2 groups resolved")
                     .arg(format_duration(seconds)).arg(result.groups.size()));
            break;
        case ScanStatus::Failed:
            LOG_ERROR("Scanner", QString("Scan failed after %1 with %2 error(s)")
                      .arg(format_duration(seconds)).arg(result.error_count()));
            break;
    }
    return std::move(result);
}

ScanResult DuplicateScanner::run(const ScanRequest& request) {
    elapsed_.start();
    publish_timer_.start();
    unpublished_files_ = 0;
    tracker_.reset();
    estimator_.start();

    ScanResult result;
    ScanProgress progress;
    progress.phase = ScanPhase::Collecting;

    QString config_error;
    if (!request.filter.validate(&config_error)) {
        LOG_ERROR("Scanner", QString("Invalid filter configuration: %1").arg(config_error));
        return finish(result, ScanStatus::Failed, progress);
    }

    LOG_INFO("Scanner", QString("Starting scan of: %1").arg(request.root));
    LOG_INFO("Scanner", QString("Hash algorithm: %1, keep %2%3")
             .arg(algorithm_name(request.algorithm).toUpper(),
                  keep_policy_name(request.keep_policy),
                  request.verify_contents ? QString(", byte verification on") : QString()));

    // Phase 1: collect and bucket by size
    LOG_INFO("Scanner", "Phase 1: Collecting files...");
    FileFilter filter(request.filter);
    DirectoryEnumerator enumerator(request.root, attributes_);
    if (!enumerator.open()) {
        record_errors(result, enumerator.take_errors());
        return finish(result, ScanStatus::Failed, progress);
    }
    publish(progress, true);

    SizeGrouper grouper;
    FileRecord record;
    bool cancelled = false;
    while (true) {
        if (cancel_requested()) {
            cancelled = true;
            break;
        }
        bool has_next = enumerator.next(record);
        record_errors(result, enumerator.take_errors());
        if (!has_next) break;

        if (filter.accepts(record)) {
            grouper.add(record);
            if (grouper.file_count() % kCollectLogInterval == 0) {
                LOG_DEBUG("Scanner", QString("Collected %1 files (%2)...")
                          .arg(grouper.file_count()).arg(format_size(grouper.total_bytes())));
            }
        }

        progress.files_examined = enumerator.entries_examined();
        progress.files_total = grouper.file_count();
        publish(progress, false);
    }

    result.files_examined = enumerator.entries_examined();
    result.files_accepted = grouper.file_count();
    progress.files_examined = result.files_examined;

    if (enumerator.root_failed()) {
        return finish(result, ScanStatus::Failed, progress);
    }
    if (cancelled) {
        return finish(result, ScanStatus::Cancelled, progress);
    }

    LOG_INFO("Scanner", QString("Collected %1 of %2 files (%3) in %4 size groups")
             .arg(grouper.file_count()).arg(enumerator.entries_examined())
             .arg(format_size(grouper.total_bytes())).arg(grouper.bucket_count()));

    const std::vector<SizeBucket> buckets = grouper.candidate_buckets();
    result.candidate_files = grouper.candidate_file_count();
    grouper.clear();

    if (observer_) observer_->on_enumeration_finished(result.files_accepted, result.candidate_files);

    // Phase 2: hash same-size files and regroup by digest
    LOG_INFO("Scanner", QString("Phase 2: Comparing file contents (%1 candidates in %2 buckets)...")
             .arg(result.candidate_files).arg(buckets.size()));
    progress.phase = ScanPhase::Hashing;
    progress.files_total = result.candidate_files;
    progress.files_processed = 0;
    publish(progress, true);

    DuplicateResolver resolver(request.algorithm, request.keep_policy,
                               request.verify_contents, attributes_);
    int next_group_id = 1;

    auto on_file_hashed = [&](const FileRecord&, qint64 bytes, bool) {
        ++progress.files_processed;
        progress.bytes_hashed += bytes;
        estimator_.observe(progress.files_processed, progress.files_total);
        progress.fraction = estimator_.fraction();
        progress.seconds_remaining = estimator_.seconds_remaining();
        publish(progress, false);
    };
    auto should_stop = [this]() { return cancel_requested(); };

    for (const SizeBucket& bucket : buckets) {
        if (cancel_requested()) {
            cancelled = true;
            break;
        }

        BucketResolution resolution = resolver.resolve(bucket, next_group_id, should_stop, on_file_hashed);
        result.bytes_hashed += resolution.bytes_hashed;
        record_errors(result, resolution.errors);

        if (resolution.interrupted) {
            cancelled = true;
            break;
        }

        for (auto& group : resolution.groups) {
            result.groups.push_back(group);
        }
        if (observer_) observer_->on_bucket_resolved(resolution.groups);
    }

    return finish(result, cancelled ? ScanStatus::Cancelled : ScanStatus::Completed, progress);
}
