#ifndef REMOVAL_PLAN_HPP
#define REMOVAL_PLAN_HPP

#include "ScanTypes.hpp"

#include <QStringList>

// Files a deletion collaborator may remove: every group member except the
// one kept by policy. Building a plan never touches the filesystem.
struct RemovalPlan {
    QStringList paths;
    qint64 reclaimable_bytes = 0;
    int group_count = 0;

    bool empty() const { return paths.isEmpty(); }
};

RemovalPlan build_removal_plan(const ScanResult& result);
RemovalPlan build_removal_plan(const std::vector<DuplicateGroup>& groups);

#endif // REMOVAL_PLAN_HPP
