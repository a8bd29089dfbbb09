#ifndef SIZE_GROUPER_HPP
#define SIZE_GROUPER_HPP

#include "ScanTypes.hpp"

#include <QMap>
#include <vector>

struct SizeBucket {
    qint64 size = 0;
    std::vector<FileRecord> members;  // enumeration order
};

// Buckets accepted files by exact byte size. Files with a unique size can
// have no content duplicate and are never hashed.
class SizeGrouper {
public:
    void add(const FileRecord& record);

    // Buckets with two or more members, smallest size first.
    std::vector<SizeBucket> candidate_buckets() const;

    qint64 file_count() const { return file_count_; }
    qint64 total_bytes() const { return total_bytes_; }
    int bucket_count() const { return static_cast<int>(buckets_.size()); }
    qint64 candidate_file_count() const;

    void clear();

private:
    QMap<qint64, std::vector<FileRecord>> buckets_;
    qint64 file_count_ = 0;
    qint64 total_bytes_ = 0;
};

#endif // SIZE_GROUPER_HPP
