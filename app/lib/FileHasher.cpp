#include "FileHasher.hpp"
#include <QFile>
#include <QFileInfo>
#include <cstring>

namespace {

// Distinguishes a file that disappeared from one we may not open.
ScanErrorKind open_failure_kind(const QFile& file) {
    if (!QFileInfo::exists(file.fileName())) return ScanErrorKind::FileVanished;
    return ScanErrorKind::OpenFailed;
}

// Fills the buffer unless end of file comes first; -1 on read error.
qint64 read_chunk(QFile& file, char* data, qint64 capacity) {
    qint64 total = 0;
    while (total < capacity) {
        qint64 n = file.read(data + total, capacity - total);
        if (n < 0) return -1;
        if (n == 0) break;
        total += n;
    }
    return total;
}

}

FileHasher::FileHasher(HashAlgorithm algorithm)
    : algorithm_(algorithm) {
}

QCryptographicHash::Algorithm FileHasher::qt_algorithm(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Md5:    return QCryptographicHash::Md5;
        case HashAlgorithm::Sha1:   return QCryptographicHash::Sha1;
        case HashAlgorithm::Sha256: return QCryptographicHash::Sha256;
    }
    return QCryptographicHash::Md5;
}

QString FileHasher::hash_bytes(const QByteArray& data, HashAlgorithm algorithm) {
    return QString::fromLatin1(QCryptographicHash::hash(data, qt_algorithm(algorithm)).toHex());
}

HashOutcome FileHasher::hash_file(const QString& path, qint64 expected_size) const {
    HashOutcome outcome;

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        outcome.error_kind = open_failure_kind(file);
        outcome.reason = file.errorString();
        return outcome;
    }

    QCryptographicHash hasher(qt_algorithm(algorithm_));
    QByteArray buffer(kChunkSize, Qt::Uninitialized);

    while (true) {
        qint64 n = file.read(buffer.data(), kChunkSize);
        if (n < 0) {
            outcome.error_kind = ScanErrorKind::ReadFailed;
            outcome.reason = file.errorString();
            return outcome;
        }
        if (n == 0) break;
        hasher.addData(QByteArrayView(buffer.constData(), n));
        outcome.bytes_read += n;
    }

    if (expected_size >= 0 && outcome.bytes_read != expected_size) {
        outcome.error_kind = ScanErrorKind::SizeChanged;
        outcome.reason = QString("Expected %1 bytes, read %2")
                         .arg(expected_size).arg(outcome.bytes_read);
        return outcome;
    }

    outcome.ok = true;
    outcome.digest = QString::fromLatin1(hasher.result().toHex());
    return outcome;
}

bool FileHasher::compare_files(const QString& left, const QString& right,
                               bool& equal, ScanError& error) {
    equal = false;

    QFile a(left);
    QFile b(right);
    if (!a.open(QIODevice::ReadOnly)) {
        error = {left, open_failure_kind(a), a.errorString()};
        return false;
    }
    if (!b.open(QIODevice::ReadOnly)) {
        error = {right, open_failure_kind(b), b.errorString()};
        return false;
    }

    QByteArray buf_a(kChunkSize, Qt::Uninitialized);
    QByteArray buf_b(kChunkSize, Qt::Uninitialized);

    while (true) {
        qint64 na = read_chunk(a, buf_a.data(), kChunkSize);
        if (na < 0) {
            error = {left, ScanErrorKind::ReadFailed, a.errorString()};
            return false;
        }
        qint64 nb = read_chunk(b, buf_b.data(), kChunkSize);
        if (nb < 0) {
            error = {right, ScanErrorKind::ReadFailed, b.errorString()};
            return false;
        }
        if (na != nb) return true;
        if (na == 0) break;
        if (std::memcmp(buf_a.constData(), buf_b.constData(), static_cast<size_t>(na)) != 0) {
            return true;
        }
    }

    equal = true;
    return true;
}
