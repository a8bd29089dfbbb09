#ifndef SCAN_TYPES_HPP
#define SCAN_TYPES_HPP

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <vector>

enum class HashAlgorithm {
    Md5,     // weak, fast
    Sha1,
    Sha256   // strong, slow
};

enum class KeepPolicy {
    Oldest,
    Newest
};

enum class ScanStatus {
    Completed,
    Cancelled,
    Failed
};

enum class ScanPhase {
    Idle,
    Collecting,
    Hashing,
    Finished
};

enum class ScanErrorKind {
    DirectoryUnreadable,
    RootUnavailable,
    OpenFailed,
    ReadFailed,
    SizeChanged,
    FileVanished
};

// One filesystem entry considered by a scan. Immutable once enumerated.
struct FileRecord {
    QString path;            // absolute, unique within a scan
    qint64 size = 0;
    QDateTime modified;
    bool hidden = false;
    bool system = false;
};

struct ScanError {
    QString path;
    ScanErrorKind kind = ScanErrorKind::ReadFailed;
    QString reason;
};

struct DigestKey {
    qint64 size = 0;
    HashAlgorithm algorithm = HashAlgorithm::Md5;
    QString digest;          // lowercase hex

    bool operator==(const DigestKey& other) const {
        return size == other.size && algorithm == other.algorithm && digest == other.digest;
    }
    bool operator!=(const DigestKey& other) const { return !(*this == other); }
};

struct DuplicateGroup {
    int id = 0;
    DigestKey key;
    std::vector<FileRecord> members;  // enumeration order
    int keep_index = 0;

    const FileRecord& keep_member() const { return members[keep_index]; }
    std::vector<FileRecord> disposable_members() const;
    qint64 wasted_bytes() const;
};

// Frozen outcome of one scan, handed to the caller once.
struct ScanResult {
    ScanStatus status = ScanStatus::Completed;
    std::vector<DuplicateGroup> groups;
    std::vector<ScanError> errors;
    qint64 files_examined = 0;
    qint64 files_accepted = 0;
    qint64 candidate_files = 0;
    qint64 bytes_hashed = 0;
    qint64 elapsed_ms = 0;

    int error_count() const { return static_cast<int>(errors.size()); }
    int duplicate_file_count() const;
    qint64 wasted_bytes() const;
};

// Point-in-time view of an in-flight scan.
struct ScanProgress {
    ScanPhase phase = ScanPhase::Idle;
    qint64 files_examined = 0;
    qint64 files_processed = 0;
    qint64 files_total = 0;
    qint64 bytes_hashed = 0;
    double fraction = 0.0;
    double seconds_remaining = 0.0;
    int error_count = 0;
};

QString algorithm_name(HashAlgorithm algorithm);
bool parse_algorithm(const QString& text, HashAlgorithm& algorithm);
QString keep_policy_name(KeepPolicy policy);
bool parse_keep_policy(const QString& text, KeepPolicy& policy);
QString status_name(ScanStatus status);
QString error_kind_name(ScanErrorKind kind);

QString format_size(qint64 size_bytes);
QString format_duration(double seconds);

#endif // SCAN_TYPES_HPP
