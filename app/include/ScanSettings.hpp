#ifndef SCAN_SETTINGS_HPP
#define SCAN_SETTINGS_HPP

#include "ScanTypes.hpp"
#include "AppLogger.hpp"

#include <QString>
#include <QStringList>
#include <memory>

class QSettings;

struct FilterConfig {
    QStringList extensions;          // normalised ".ext", lowercase; empty = all
    qint64 min_size = 0;             // inclusive
    qint64 max_size = 0;             // inclusive, 0 = unbounded
    QStringList excluded_patterns;   // shell-style, case-insensitive
    bool skip_hidden = false;
    bool skip_system = true;

    bool validate(QString* error = nullptr) const;
};

struct ScanRequest {
    QString root;
    FilterConfig filter;
    HashAlgorithm algorithm = HashAlgorithm::Md5;
    KeepPolicy keep_policy = KeepPolicy::Oldest;
    bool verify_contents = false;    // byte-compare members after digest match

    // Checks the root and the filter. Does not touch the tree below the root.
    bool validate(QString* error = nullptr) const;
};

// Accepts "jpg", ".JPG" and "*.jpg" alike; drops blanks and duplicates.
QStringList normalize_extensions(const QStringList& raw);

// Persistent defaults for scan requests, stored through QSettings.
class ScanSettings {
public:
    ScanSettings();                                  // user scope "DupeScout"
    explicit ScanSettings(const QString& ini_path);  // explicit INI file

    ScanRequest load_request() const;
    void save_request(const ScanRequest& request);

    QString last_directory() const;
    void set_last_directory(const QString& path);

    LogSeverity log_level() const;
    void set_log_level(LogSeverity sev);

    QString file_name() const;

private:
    std::unique_ptr<QSettings> open() const;

    QString ini_path_;
};

#endif // SCAN_SETTINGS_HPP
