#ifndef FILE_HASHER_HPP
#define FILE_HASHER_HPP

#include "ScanTypes.hpp"

#include <QByteArray>
#include <QCryptographicHash>
#include <QString>

struct HashOutcome {
    bool ok = false;
    QString digest;                  // lowercase hex when ok
    qint64 bytes_read = 0;
    ScanErrorKind error_kind = ScanErrorKind::ReadFailed;
    QString reason;
};

// Streams a file through QCryptographicHash in fixed-size chunks, so memory
// use does not grow with the file.
class FileHasher {
public:
    explicit FileHasher(HashAlgorithm algorithm);

    // expected_size >= 0 turns a length mismatch into SizeChanged.
    HashOutcome hash_file(const QString& path, qint64 expected_size = -1) const;

    // Byte-for-byte comparison. False with error filled when either file
    // cannot be read to the end.
    static bool compare_files(const QString& left, const QString& right,
                              bool& equal, ScanError& error);

    static QString hash_bytes(const QByteArray& data, HashAlgorithm algorithm);
    static QCryptographicHash::Algorithm qt_algorithm(HashAlgorithm algorithm);

    HashAlgorithm algorithm() const { return algorithm_; }

    static constexpr qint64 kChunkSize = 64 * 1024;

private:
    HashAlgorithm algorithm_;
};

#endif // FILE_HASHER_HPP
