#include "DuplicateResolver.hpp"
#include <QHash>
#include <QSet>

DuplicateResolver::DuplicateResolver(HashAlgorithm algorithm, KeepPolicy keep_policy,
                                     bool verify_contents,
                                     const FileAttributeProvider& attributes)
    : hasher_(algorithm)
    , keep_policy_(keep_policy)
    , verify_contents_(verify_contents)
    , attributes_(attributes) {
}

int DuplicateResolver::select_keep(const std::vector<FileRecord>& members, KeepPolicy policy) {
    int best = 0;
    for (int i = 1; i < static_cast<int>(members.size()); ++i) {
        const FileRecord& candidate = members[i];
        const FileRecord& current = members[best];
        if (candidate.modified == current.modified) {
            if (candidate.path < current.path) best = i;
            continue;
        }
        bool better = (policy == KeepPolicy::Oldest)
                      ? candidate.modified < current.modified
                      : candidate.modified > current.modified;
        if (better) best = i;
    }
    return best;
}

BucketResolution DuplicateResolver::resolve(const SizeBucket& bucket, int& next_group_id,
                                            const StopPredicate& should_stop,
                                            const FileHashedCallback& on_file_hashed) const {
    BucketResolution resolution;

    QHash<QString, std::vector<FileRecord>> by_digest;
    QStringList digest_order;

    for (const FileRecord& record : bucket.members) {
        if (should_stop && should_stop()) {
            resolution.interrupted = true;
            return resolution;
        }

        HashOutcome outcome = hasher_.hash_file(attributes_.normalize_long_path(record.path),
                                                bucket.size);
        ++resolution.files_hashed;
        resolution.bytes_hashed += outcome.bytes_read;

        if (outcome.ok) {
            auto it = by_digest.find(outcome.digest);
            if (it == by_digest.end()) {
                digest_order.append(outcome.digest);
                by_digest.insert(outcome.digest, {record});
            } else {
                it.value().push_back(record);
            }
        } else {
            resolution.errors.push_back({record.path, outcome.error_kind, outcome.reason});
        }

        if (on_file_hashed) on_file_hashed(record, outcome.bytes_read, outcome.ok);
    }

    std::vector<DuplicateGroup> pending;
    for (const QString& digest : digest_order) {
        const std::vector<FileRecord>& members = by_digest.value(digest);
        if (members.size() < 2) continue;

        std::vector<std::vector<FileRecord>> partitions;
        if (verify_contents_) {
            partitions = verify_partitions(members, resolution.errors);
        } else {
            partitions.push_back(members);
        }

        for (auto& partition : partitions) {
            if (partition.size() < 2) continue;
            DuplicateGroup group;
            group.key = {bucket.size, hasher_.algorithm(), digest};
            group.members = std::move(partition);
            group.keep_index = select_keep(group.members, keep_policy_);
            pending.push_back(std::move(group));
        }
    }

    for (auto& group : pending) {
        group.id = next_group_id++;
        resolution.groups.push_back(std::move(group));
    }
    return resolution;
}

std::vector<std::vector<FileRecord>> DuplicateResolver::verify_partitions(
        const std::vector<FileRecord>& members, std::vector<ScanError>& errors) const {
    std::vector<std::vector<FileRecord>> partitions;
    QSet<QString> failed;

    for (const FileRecord& member : members) {
        if (failed.contains(member.path)) continue;

        bool placed = false;
        bool dropped = false;
        size_t p = 0;
        while (p < partitions.size() && !placed && !dropped) {
            auto& partition = partitions[p];
            const FileRecord& representative = partition.front();

            bool equal = false;
            ScanError error;
            if (!FileHasher::compare_files(attributes_.normalize_long_path(representative.path),
                                           attributes_.normalize_long_path(member.path),
                                           equal, error)) {
                if (error.path == attributes_.normalize_long_path(member.path)) {
                    errors.push_back({member.path, error.kind, error.reason});
                    failed.insert(member.path);
                    dropped = true;
                } else {
                    // Representative went bad; retry against the next one
                    errors.push_back({representative.path, error.kind, error.reason});
                    failed.insert(representative.path);
                    partition.erase(partition.begin());
                    if (partition.empty()) {
                        partitions.erase(partitions.begin() + static_cast<std::ptrdiff_t>(p));
                    }
                }
                continue;
            }

            if (equal) {
                partition.push_back(member);
                placed = true;
            } else {
                ++p;
            }
        }

        if (!placed && !dropped) {
            partitions.push_back({member});
        }
    }
    return partitions;
}
