#include "ScanSettings.hpp"
#include <QSettings>
#include <QFileInfo>
#include <QDir>

namespace {
const char* kOrganization = "DupeScout";
const char* kApplication = "DupeScout";
}

bool FilterConfig::validate(QString* error) const {
    if (min_size < 0 || max_size < 0) {
        if (error) *error = "Size values must be non-negative";
        return false;
    }
    if (max_size > 0 && min_size > max_size) {
        if (error) {
            *error = QString("Min size (%1) cannot be greater than max size (%2)")
                     .arg(min_size).arg(max_size);
        }
        return false;
    }
    for (const QString& pattern : excluded_patterns) {
        if (pattern.trimmed().isEmpty()) {
            if (error) *error = "Exclusion patterns must not be empty";
            return false;
        }
    }
    return true;
}

bool ScanRequest::validate(QString* error) const {
    if (root.trimmed().isEmpty()) {
        if (error) *error = "No directory selected to scan";
        return false;
    }
    QFileInfo info(root);
    if (!info.exists()) {
        if (error) *error = QString("Directory does not exist: %1").arg(root);
        return false;
    }
    if (!info.isDir()) {
        if (error) *error = QString("Not a directory: %1").arg(root);
        return false;
    }
    return filter.validate(error);
}

QStringList normalize_extensions(const QStringList& raw) {
    QStringList result;
    for (const QString& entry : raw) {
        QString ext = entry.trimmed().toLower();
        if (ext.startsWith('*')) ext.remove(0, 1);
        if (ext.isEmpty() || ext == ".") continue;
        if (!ext.startsWith('.')) ext.prepend('.');
        if (!result.contains(ext)) result.append(ext);
    }
    return result;
}

ScanSettings::ScanSettings() = default;

ScanSettings::ScanSettings(const QString& ini_path)
    : ini_path_(ini_path) {
}

std::unique_ptr<QSettings> ScanSettings::open() const {
    if (ini_path_.isEmpty()) {
        return std::make_unique<QSettings>(kOrganization, kApplication);
    }
    return std::make_unique<QSettings>(ini_path_, QSettings::IniFormat);
}

ScanRequest ScanSettings::load_request() const {
    auto settings = open();
    ScanRequest request;

    HashAlgorithm algorithm;
    if (parse_algorithm(settings->value("hash_algorithm", "md5").toString(), algorithm)) {
        request.algorithm = algorithm;
    }

    bool ok = false;
    qint64 min_size = settings->value("min_size", 0).toLongLong(&ok);
    if (ok && min_size >= 0) request.filter.min_size = min_size;
    qint64 max_size = settings->value("max_size", 0).toLongLong(&ok);
    if (ok && max_size >= 0) request.filter.max_size = max_size;

    request.filter.extensions =
        normalize_extensions(settings->value("included_extensions").toStringList());

    QStringList patterns;
    for (const QString& pattern : settings->value("excluded_patterns").toStringList()) {
        if (!pattern.trimmed().isEmpty()) patterns.append(pattern.trimmed());
    }
    request.filter.excluded_patterns = patterns;

    request.filter.skip_hidden = settings->value("skip_hidden_files", false).toBool();
    request.filter.skip_system = settings->value("skip_system_files", true).toBool();
    request.keep_policy = settings->value("keep_oldest", true).toBool()
                          ? KeepPolicy::Oldest : KeepPolicy::Newest;
    request.verify_contents = settings->value("verify_contents", false).toBool();
    request.root = settings->value("last_directory").toString();

    if (!request.filter.validate()) {
        LOG_WARN("Settings", "Stored size bounds are inconsistent, using defaults");
        request.filter.min_size = 0;
        request.filter.max_size = 0;
    }
    return request;
}

void ScanSettings::save_request(const ScanRequest& request) {
    auto settings = open();
    settings->setValue("hash_algorithm", algorithm_name(request.algorithm));
    settings->setValue("min_size", request.filter.min_size);
    settings->setValue("max_size", request.filter.max_size);
    settings->setValue("included_extensions", request.filter.extensions);
    settings->setValue("excluded_patterns", request.filter.excluded_patterns);
    settings->setValue("skip_hidden_files", request.filter.skip_hidden);
    settings->setValue("skip_system_files", request.filter.skip_system);
    settings->setValue("keep_oldest", request.keep_policy == KeepPolicy::Oldest);
    settings->setValue("verify_contents", request.verify_contents);
    if (!request.root.isEmpty()) {
        settings->setValue("last_directory", QDir::cleanPath(request.root));
    }
}

QString ScanSettings::last_directory() const {
    return open()->value("last_directory").toString();
}

void ScanSettings::set_last_directory(const QString& path) {
    open()->setValue("last_directory", QDir::cleanPath(path));
}

LogSeverity ScanSettings::log_level() const {
    return AppLogger::parse_severity(open()->value("log_level", "info").toString(),
                                     LogSeverity::Info);
}

void ScanSettings::set_log_level(LogSeverity sev) {
    open()->setValue("log_level", AppLogger::severity_label(sev).toLower());
}

QString ScanSettings::file_name() const {
    return open()->fileName();
}
