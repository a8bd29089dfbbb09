#include "FileFilter.hpp"
#include "AppLogger.hpp"
#include <QFileInfo>

FileFilter::FileFilter(const FilterConfig& config)
    : config_(config) {
    config_.extensions = normalize_extensions(config.extensions);

    for (const QString& pattern : config_.excluded_patterns) {
        // '*' must cross '/' so that "*/build/*" style patterns see full paths
        QString re = QRegularExpression::wildcardToRegularExpression(
            pattern.trimmed(), QRegularExpression::NonPathWildcardConversion);
        QRegularExpression regex(re, QRegularExpression::CaseInsensitiveOption);
        if (!regex.isValid()) {
            LOG_WARN("Filter", QString("Ignoring invalid exclusion pattern: %1").arg(pattern));
            continue;
        }
        exclusions_.push_back(regex);
    }
}

bool FileFilter::accepts(const FileRecord& record) const {
    return accepts_name(record) && accepts_size(record.size);
}

bool FileFilter::accepts_name(const FileRecord& record) const {
    if (config_.skip_hidden && record.hidden) return false;
    if (config_.skip_system && record.system) return false;

    if (matches_exclusion(record.path)) return false;

    if (!config_.extensions.isEmpty()) {
        const QString suffix = QFileInfo(record.path).suffix().toLower();
        if (suffix.isEmpty()) return false;
        if (!config_.extensions.contains("." + suffix)) return false;
    }
    return true;
}

bool FileFilter::accepts_size(qint64 size) const {
    if (size < config_.min_size) return false;
    if (config_.max_size > 0 && size > config_.max_size) return false;
    return true;
}

bool FileFilter::matches_exclusion(const QString& path) const {
    if (exclusions_.empty()) return false;
    const QString file_name = QFileInfo(path).fileName();
    for (const auto& regex : exclusions_) {
        if (regex.match(file_name).hasMatch() || regex.match(path).hasMatch()) {
            return true;
        }
    }
    return false;
}
