#include "DirectoryEnumerator.hpp"
#include "AppLogger.hpp"
#include <QDir>
#include <QFileInfo>

DirectoryEnumerator::DirectoryEnumerator(const QString& root, const FileAttributeProvider& attributes)
    : root_(QDir::cleanPath(QFileInfo(root).absoluteFilePath()))
    , attributes_(attributes) {
}

bool DirectoryEnumerator::open() {
    QFileInfo info(root_);
    QString reason;
    if (!info.exists()) {
        reason = "Directory does not exist";
    } else if (!info.isDir()) {
        reason = "Not a directory";
    } else if (!info.isReadable() || !info.isExecutable()) {
        reason = "Permission denied";
    }

    if (!reason.isEmpty()) {
        errors_.push_back({root_, ScanErrorKind::RootUnavailable, reason});
        root_failed_ = true;
        return false;
    }

    pending_dirs_.clear();
    pending_dirs_.push_back(root_);
    opened_ = true;
    return true;
}

void DirectoryEnumerator::record_unreadable(const QString& path, const QString& reason) {
    // Losing the root after open() invalidates the whole walk
    const bool is_root = (path == root_);
    if (is_root) root_failed_ = true;
    errors_.push_back({path, is_root ? ScanErrorKind::RootUnavailable
                                     : ScanErrorKind::DirectoryUnreadable, reason});
}

bool DirectoryEnumerator::load_directory(const QString& path) {
    QFileInfo dir_info(path);
    QString reason;
    if (!dir_info.exists()) {
        reason = "Directory no longer exists";
    } else if (!dir_info.isReadable() || !dir_info.isExecutable()) {
        reason = "Permission denied";
    }
    if (!reason.isEmpty()) {
        record_unreadable(path, reason);
        return false;
    }

    QDir dir(path);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
        QDir::Name);
    // An empty listing is indistinguishable from a failed one unless the
    // directory is gone by now
    if (entries.isEmpty() && !QFileInfo::exists(path)) {
        record_unreadable(path, "Directory removed while listing");
        return false;
    }
    ++directories_visited_;

    current_files_.clear();
    current_index_ = 0;

    std::vector<QString> subdirs;
    for (const QFileInfo& entry : entries) {
        if (entry.isSymLink()) continue;
        if (entry.isDir()) {
            subdirs.push_back(entry.absoluteFilePath());
        } else if (entry.isFile()) {
            current_files_.append(entry);
        }
    }

    // Reverse so the stack pops subdirectories in name order
    for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
        pending_dirs_.push_back(*it);
    }
    return true;
}

bool DirectoryEnumerator::next(FileRecord& record) {
    if (!opened_) return false;

    while (true) {
        if (current_index_ < current_files_.size()) {
            const QFileInfo& info = current_files_.at(current_index_++);
            ++entries_examined_;

            record.path = QDir::cleanPath(info.absoluteFilePath());
            record.size = info.size();
            record.modified = info.lastModified();
            record.hidden = attributes_.is_hidden(record.path);
            record.system = attributes_.is_system(record.path);
            return true;
        }

        if (pending_dirs_.empty()) {
            current_files_.clear();
            return false;
        }

        QString dir_path = pending_dirs_.back();
        pending_dirs_.pop_back();
        if (!load_directory(dir_path)) {
            LOG_DEBUG("Enumerator", QString("Skipping unreadable directory: %1").arg(dir_path));
        }
    }
}

std::vector<ScanError> DirectoryEnumerator::take_errors() {
    std::vector<ScanError> taken;
    taken.swap(errors_);
    return taken;
}
