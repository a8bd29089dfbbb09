#ifndef DUPLICATE_RESOLVER_HPP
#define DUPLICATE_RESOLVER_HPP

#include "ScanTypes.hpp"
#include "SizeGrouper.hpp"
#include "FileHasher.hpp"
#include "FileAttributeProvider.hpp"

#include <functional>
#include <vector>

struct BucketResolution {
    std::vector<DuplicateGroup> groups;
    std::vector<ScanError> errors;
    qint64 bytes_hashed = 0;
    int files_hashed = 0;
    bool interrupted = false;   // stopped before every member was hashed
};

// Turns a size bucket into duplicate groups by hashing every member and
// regrouping by digest. Members keep their enumeration order; digest
// groups are ordered by their first member.
class DuplicateResolver {
public:
    using StopPredicate = std::function<bool()>;
    using FileHashedCallback = std::function<void(const FileRecord& record, qint64 bytes, bool ok)>;

    DuplicateResolver(HashAlgorithm algorithm, KeepPolicy keep_policy, bool verify_contents,
                      const FileAttributeProvider& attributes);

    // Group ids are taken from next_group_id only when the bucket resolves
    // completely. An interrupted bucket contributes no groups, but the
    // errors met before the stop are still reported.
    BucketResolution resolve(const SizeBucket& bucket, int& next_group_id,
                             const StopPredicate& should_stop = nullptr,
                             const FileHashedCallback& on_file_hashed = nullptr) const;

    // Oldest or newest modification time; ties go to the smallest path.
    static int select_keep(const std::vector<FileRecord>& members, KeepPolicy policy);

private:
    std::vector<std::vector<FileRecord>> verify_partitions(const std::vector<FileRecord>& members,
                                                           std::vector<ScanError>& errors) const;

    FileHasher hasher_;
    KeepPolicy keep_policy_;
    bool verify_contents_;
    const FileAttributeProvider& attributes_;
};

#endif // DUPLICATE_RESOLVER_HPP
