#include "ScanTypes.hpp"

std::vector<FileRecord> DuplicateGroup::disposable_members() const {
    std::vector<FileRecord> result;
    for (int i = 0; i < static_cast<int>(members.size()); ++i) {
        if (i != keep_index) result.push_back(members[i]);
    }
    return result;
}

qint64 DuplicateGroup::wasted_bytes() const {
    if (members.empty()) return 0;
    return key.size * static_cast<qint64>(members.size() - 1);
}

int ScanResult::duplicate_file_count() const {
    int count = 0;
    for (const auto& group : groups) {
        count += static_cast<int>(group.members.size()) - 1;
    }
    return count;
}

qint64 ScanResult::wasted_bytes() const {
    qint64 total = 0;
    for (const auto& group : groups) {
        total += group.wasted_bytes();
    }
    return total;
}

QString algorithm_name(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Md5:    return "md5";
        case HashAlgorithm::Sha1:   return "sha1";
        case HashAlgorithm::Sha256: return "sha256";
    }
    return "md5";
}

bool parse_algorithm(const QString& text, HashAlgorithm& algorithm) {
    QString name = text.trimmed().toLower();
    name.remove('-');
    if (name == "md5") {
        algorithm = HashAlgorithm::Md5;
    } else if (name == "sha1") {
        algorithm = HashAlgorithm::Sha1;
    } else if (name == "sha256") {
        algorithm = HashAlgorithm::Sha256;
    } else {
        return false;
    }
    return true;
}

QString keep_policy_name(KeepPolicy policy) {
    return policy == KeepPolicy::Oldest ? "oldest" : "newest";
}

bool parse_keep_policy(const QString& text, KeepPolicy& policy) {
    QString name = text.trimmed().toLower();
    if (name == "oldest") {
        policy = KeepPolicy::Oldest;
    } else if (name == "newest") {
        policy = KeepPolicy::Newest;
    } else {
        return false;
    }
    return true;
}

QString status_name(ScanStatus status) {
    switch (status) {
        case ScanStatus::Completed: return "completed";
        case ScanStatus::Cancelled: return "cancelled";
        case ScanStatus::Failed:    return "failed";
    }
    return "failed";
}

QString error_kind_name(ScanErrorKind kind) {
    switch (kind) {
        case ScanErrorKind::DirectoryUnreadable: return "directory-unreadable";
        case ScanErrorKind::RootUnavailable:     return "root-unavailable";
        case ScanErrorKind::OpenFailed:          return "open-failed";
        case ScanErrorKind::ReadFailed:          return "read-failed";
        case ScanErrorKind::SizeChanged:         return "size-changed";
        case ScanErrorKind::FileVanished:        return "file-vanished";
    }
    return "unknown";
}

QString format_size(qint64 size_bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(size_bytes);
    for (const char* unit : units) {
        if (size < 1024.0) {
            return QString("%1 %2").arg(size, 0, 'f', 2).arg(QLatin1String(unit));
        }
        size /= 1024.0;
    }
    return QString("%1 PB").arg(size, 0, 'f', 2);
}

QString format_duration(double seconds) {
    if (seconds < 60) {
        return QString("%1s").arg(static_cast<int>(seconds));
    }
    if (seconds < 3600) {
        int minutes = static_cast<int>(seconds) / 60;
        int secs = static_cast<int>(seconds) % 60;
        return QString("%1m %2s").arg(minutes).arg(secs);
    }
    int hours = static_cast<int>(seconds) / 3600;
    int minutes = (static_cast<int>(seconds) % 3600) / 60;
    return QString("%1h %2m").arg(hours).arg(minutes);
}
