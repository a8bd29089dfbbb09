#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "AppLogger.hpp"
#include "FileAttributeProvider.hpp"
#include "ScanTypes.hpp"

#include <QByteArray>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QString>
#include <QtTest>

namespace test_util {

// Creates parent directories as needed; optional modification time.
inline QString write_file(const QDir& root, const QString& relative, const QByteArray& content,
                          const QDateTime& modified = QDateTime()) {
    const QString path = root.filePath(relative);
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qFatal("cannot create %s", qPrintable(path));
    }
    file.write(content);
    file.flush();
    if (modified.isValid()) {
        file.setFileTime(modified, QFileDevice::FileModificationTime);
    }
    file.close();
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

inline void quiet_logger() {
    AppLogger::instance().set_console_output(false);
    AppLogger::instance().set_log_file(QString());
}

inline QSet<QString> member_paths(const DuplicateGroup& group) {
    QSet<QString> paths;
    for (const auto& member : group.members) paths.insert(member.path);
    return paths;
}

inline FileRecord make_record(const QString& path, qint64 size,
                              const QDateTime& modified = QDateTime()) {
    FileRecord record;
    record.path = path;
    record.size = size;
    record.modified = modified;
    return record;
}

// Attribute provider with a fixed hidden/system answer per path.
class FakeAttributeProvider : public FileAttributeProvider {
public:
    QSet<QString> hidden;
    QSet<QString> system;

    bool is_hidden(const QString& path) const override { return hidden.contains(path); }
    bool is_system(const QString& path) const override { return system.contains(path); }
    QString normalize_long_path(const QString& path) const override { return path; }
};

}

#endif // TEST_HELPERS_HPP
