#include "FileAttributeProvider.hpp"
#include <QFileInfo>
#include <QDir>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

const NativeFileAttributeProvider& NativeFileAttributeProvider::shared() {
    static NativeFileAttributeProvider provider;
    return provider;
}

bool NativeFileAttributeProvider::is_hidden(const QString& path) const {
    QFileInfo info(path);
    if (info.fileName().startsWith('.')) return true;
    return info.isHidden();
}

bool NativeFileAttributeProvider::is_system(const QString& path) const {
#ifdef Q_OS_WIN
    QString native_path = normalize_long_path(path);
    DWORD attrs = GetFileAttributesW(reinterpret_cast<LPCWSTR>(native_path.utf16()));
    return attrs != INVALID_FILE_ATTRIBUTES && (attrs & FILE_ATTRIBUTE_SYSTEM);
#else
    Q_UNUSED(path);
    return false;
#endif
}

QString NativeFileAttributeProvider::normalize_long_path(const QString& path) const {
#ifdef Q_OS_WIN
    QString native_path = QDir::toNativeSeparators(QDir::cleanPath(QFileInfo(path).absoluteFilePath()));
    if (native_path.length() <= kLongPathThreshold || native_path.startsWith("\\\\?\\")) {
        return native_path;
    }
    if (native_path.startsWith("\\\\")) {
        return "\\\\?\\UNC\\" + native_path.mid(2);
    }
    return "\\\\?\\" + native_path;
#else
    return QDir::cleanPath(path);
#endif
}
