#include "SizeGrouper.hpp"

void SizeGrouper::add(const FileRecord& record) {
    buckets_[record.size].push_back(record);
    ++file_count_;
    total_bytes_ += record.size;
}

std::vector<SizeBucket> SizeGrouper::candidate_buckets() const {
    std::vector<SizeBucket> result;
    for (auto it = buckets_.cbegin(); it != buckets_.cend(); ++it) {
        if (it.value().size() < 2) continue;
        result.push_back({it.key(), it.value()});
    }
    return result;
}

qint64 SizeGrouper::candidate_file_count() const {
    qint64 count = 0;
    for (auto it = buckets_.cbegin(); it != buckets_.cend(); ++it) {
        if (it.value().size() >= 2) count += static_cast<qint64>(it.value().size());
    }
    return count;
}

void SizeGrouper::clear() {
    buckets_.clear();
    file_count_ = 0;
    total_bytes_ = 0;
}
