#include "RemovalPlan.hpp"

RemovalPlan build_removal_plan(const std::vector<DuplicateGroup>& groups) {
    RemovalPlan plan;
    for (const auto& group : groups) {
        if (group.members.size() < 2) continue;
        for (const auto& member : group.disposable_members()) {
            plan.paths.append(member.path);
            plan.reclaimable_bytes += member.size;
        }
        ++plan.group_count;
    }
    return plan;
}

RemovalPlan build_removal_plan(const ScanResult& result) {
    return build_removal_plan(result.groups);
}
