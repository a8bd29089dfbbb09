#ifndef FILE_ATTRIBUTE_PROVIDER_HPP
#define FILE_ATTRIBUTE_PROVIDER_HPP

#include <QString>

// Platform capabilities the filter and enumerator need. Nothing else in
// the engine talks to platform file APIs.
class FileAttributeProvider {
public:
    virtual ~FileAttributeProvider() = default;

    virtual bool is_hidden(const QString& path) const = 0;
    virtual bool is_system(const QString& path) const = 0;
    virtual QString normalize_long_path(const QString& path) const = 0;
};

class NativeFileAttributeProvider : public FileAttributeProvider {
public:
    bool is_hidden(const QString& path) const override;
    bool is_system(const QString& path) const override;
    QString normalize_long_path(const QString& path) const override;

    static const NativeFileAttributeProvider& shared();

    static constexpr int kLongPathThreshold = 240;
};

#endif // FILE_ATTRIBUTE_PROVIDER_HPP
